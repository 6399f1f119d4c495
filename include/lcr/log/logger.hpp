#pragma once

#include <mutex>
#include <atomic>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>
#include <thread>
#include <iomanip>

namespace lcr {
namespace log {

// ---------------------------------------------------------
// Log level
// ---------------------------------------------------------
enum class Level : uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal,
    Off
};

// Maps a command line spelling ("trace", "debug", ...) to a Level.
// Unknown strings resolve to Info.
[[nodiscard]]
inline Level parse_level(std::string_view name) noexcept {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "warn")  return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "fatal") return Level::Fatal;
    if (name == "off")   return Level::Off;
    return Level::Info;
}

// ---------------------------------------------------------
// Thread-safe global logger
// ---------------------------------------------------------
// Every connection runs a reader and a watchdog thread, so the level is an
// atomic and the sink is only touched under the mutex.
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept { level_.store(lvl, std::memory_order_relaxed); }

    Level level() const noexcept { return level_.load(std::memory_order_relaxed); }

    [[nodiscard]]
    bool enabled(Level lvl) const noexcept { return lvl >= level() && lvl != Level::Off; }

    // Enable or disable colored output
    void enable_color(bool on) noexcept { color_enabled_.store(on, std::memory_order_relaxed); }

    // Prefix every line with the id of the emitting thread
    void enable_thread_id(bool on) noexcept { thread_id_enabled_.store(on, std::memory_order_relaxed); }

    // Thread-safe sink setter (stdout by default)
    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os;
    }

    // ---------------------------------------------------------
    // Core logging function (thread-safe)
    // ---------------------------------------------------------
    void log(Level lvl, const std::string& msg) {
        if (!enabled(lvl)) return;
        const bool color = color_enabled_.load(std::memory_order_relaxed);
        const bool tid = thread_id_enabled_.load(std::memory_order_relaxed);
        std::lock_guard<std::mutex> lock(mutex_);
        auto& os = *out_;
        if (color) os << color_code(lvl);
        os << timestamp() << " [" << level_name(lvl) << "] ";
        if (tid) os << "(" << std::this_thread::get_id() << ") ";
        os << msg;
        if (color) os << "\033[0m";
        os << std::endl;
    }

private:
    Logger()
        : out_(&std::cout)
        , level_(Level::Info)
        , color_enabled_(false)
        , thread_id_enabled_(false)
    {}

    static const char* level_name(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "TRACE";
            case Level::Debug: return "DEBUG";
            case Level::Info:  return "INFO";
            case Level::Warn:  return "WARN";
            case Level::Error: return "ERROR";
            case Level::Fatal: return "FATAL";
            default:           break;
        }
        return "?????";
    }

    // ANSI color mappings
    static constexpr const char* color_code(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "\033[37m";     // light gray
            case Level::Debug: return "\033[36m";     // cyan
            case Level::Info:  return "\033[32m";     // green
            case Level::Warn:  return "\033[33m";     // yellow
            case Level::Error: return "\033[31m";     // red
            case Level::Fatal: return "\033[1;31m";   // bold bright red
            default:           break;
        }
        return "\033[0m";
    }

    // Millisecond resolution: reconnect and keepalive traces are read by timing
    static std::string timestamp() {
        using namespace std::chrono;
        auto now = system_clock::now();
        auto t = system_clock::to_time_t(now);
        auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
        std::tm tm{};
        localtime_r(&t, &tm);
        char buf[64];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        std::ostringstream os;
        os << buf << '.' << std::setw(3) << std::setfill('0') << ms.count();
        return os.str();
    }

private:
    std::ostream* out_;
    std::atomic<Level> level_;
    std::atomic<bool> color_enabled_;
    std::atomic<bool> thread_id_enabled_;
    std::mutex mutex_;
};

// ---------------------------------------------------------
// Streaming log wrapper (collects << into a string)
// ---------------------------------------------------------
class LogStream {
public:
    explicit LogStream(Level lvl) : lvl_(lvl) {}

    template<typename T>
    LogStream& operator<<(const T& v) {
        ss_ << v;
        return *this;
    }

    ~LogStream() {
        Logger::instance().log(lvl_, ss_.str());
    }

private:
    Level lvl_;
    std::ostringstream ss_;
};

} // namespace log
} // namespace lcr


// ---------------------------------------------------------
// Macros for easy logging
// ---------------------------------------------------------
// The level check happens before the message is formatted.
#define EW_LOG_LEVEL(lvl, msg)                                        \
    do {                                                              \
        if (::lcr::log::Logger::instance().enabled((lvl))) {          \
            ::lcr::log::LogStream((lvl)) << msg;                      \
        }                                                             \
    } while (0)

#define EW_TRACE(msg)  EW_LOG_LEVEL(::lcr::log::Level::Trace, msg)
#define EW_DEBUG(msg)  EW_LOG_LEVEL(::lcr::log::Level::Debug, msg)
#define EW_INFO(msg)   EW_LOG_LEVEL(::lcr::log::Level::Info,  msg)
#define EW_WARN(msg)   EW_LOG_LEVEL(::lcr::log::Level::Warn,  msg)
#define EW_ERROR(msg)  EW_LOG_LEVEL(::lcr::log::Level::Error, msg)
#define EW_FATAL(msg)  EW_LOG_LEVEL(::lcr::log::Level::Fatal, msg)
