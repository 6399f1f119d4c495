#pragma once

#include <chrono>
#include <iostream>
#include <string>
#include <string_view>
#include <ostream>
#include <cstdlib>

#include <CLI/CLI.hpp>

#include "enginewire.hpp"
#include "common/cli/validators.hpp"
#include "common/logger.hpp"

namespace enginewire::examples::cli {

struct Params {
    std::string host         = "localhost:3000";
    std::string path         = "/engine.io/";
    bool insecure            = false;
    int count                = 5;
    int attempts             = 3;
    int timeout_ms           = 10000;
    int runtime_s            = 15;
    std::string log_level    = "info";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  Host      : " << host << "\n"
           << "  Path      : " << path << "\n"
           << "  TLS       : " << (insecure ? "off" : "on") << "\n"
           << "  Count     : " << count << "\n"
           << "  Attempts  : " << attempts << "\n"
           << "  Timeout   : " << timeout_ms << " ms\n"
           << "  Runtime   : " << runtime_s << " s\n"
           << "  Log Level : " << log_level << "\n";
    }

    [[nodiscard]]
    inline Options options() const {
        Options opts;
        opts.host = host;
        opts.path = path;
        opts.secure = !insecure;
        opts.dial_timeout = std::chrono::milliseconds(timeout_ms);
        return opts;
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("--host", params.host, "Engine.IO server ([scheme://]host[:port])")->check(host_validator)->default_val(params.host);
    app.add_option("--path", params.path, "Engine.IO endpoint path")->check(path_validator)->default_val(params.path);
    app.add_flag("--insecure", params.insecure, "Use ws:// instead of wss://");
    app.add_option("-n,--count", params.count, "Number of messages to emit")->check(CLI::Range(0, 1000000))->default_val(params.count);
    app.add_option("-a,--attempts", params.attempts, "Failed reconnection attempts tolerated before giving up")->check(CLI::PositiveNumber)->default_val(params.attempts);
    app.add_option("--timeout-ms", params.timeout_ms, "Dial timeout in milliseconds")->check(CLI::PositiveNumber)->default_val(params.timeout_ms);
    app.add_option("-r,--runtime", params.runtime_s, "Observation window in seconds")->check(CLI::PositiveNumber)->default_val(params.runtime_s);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->default_val(params.log_level);

    app.footer(
        "This example drives an Engine.IO v4 server over WebSocket.\n"
        "Behavior is observable via logs, listeners and telemetry."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        app.exit(e, std::cout, std::cerr);
        std::exit(EXIT_FAILURE);
    }

    set_log_level(params.log_level);
    return params;
}

} // namespace enginewire::examples::cli
