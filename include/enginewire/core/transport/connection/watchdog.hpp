#pragma once

#include <atomic>
#include <chrono>
#include <memory>

#include "enginewire/core/context.hpp"


namespace enginewire::core::transport::connection {

// -----------------------------------------------------------------------------
// Ping watchdog
// -----------------------------------------------------------------------------
//
// One per physical attempt. The watchdog thread blocks in wait() which
// returns:
//
//   false  the attempt context was cancelled (attempt retired, no action)
//   true   no frame re-armed the deadline in time (caller closes with
//          Error::PingTimeout)
//
// wait() first blocks until start() opens the gate (handshake received), so
// frames seen while Opening only move the deadline. arm() may be called from
// any thread.
//
// seal() fixes a final deadline after a local close(): later arm() and
// start() calls no longer move it, so a peer that keeps sending frames
// cannot hold a closing attempt open.
class Watchdog {
public:
    explicit Watchdog(Context::Ptr ctx) noexcept
        : ctx_(std::move(ctx))
    {}

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    // Push the deadline to now + window
    inline void arm(std::chrono::milliseconds window) {
        if (sealed_.load(std::memory_order_acquire)) {
            return;
        }
        const auto deadline = std::chrono::steady_clock::now() + window;
        deadline_.store(deadline.time_since_epoch().count(), std::memory_order_release);
        ctx_->notify();
    }

    // Arm and open the gate (once per attempt)
    inline void start(std::chrono::milliseconds window) {
        if (!sealed_.load(std::memory_order_acquire)) {
            const auto deadline = std::chrono::steady_clock::now() + window;
            deadline_.store(deadline.time_since_epoch().count(), std::memory_order_release);
        }
        started_.store(true, std::memory_order_release);
        ctx_->notify();
    }

    // Final deadline (first call wins), opens the gate
    inline void seal(std::chrono::milliseconds window) {
        if (sealed_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        const auto deadline = std::chrono::steady_clock::now() + window;
        deadline_.store(deadline.time_since_epoch().count(), std::memory_order_release);
        started_.store(true, std::memory_order_release);
        ctx_->notify();
    }

    [[nodiscard]]
    inline bool sealed() const noexcept {
        return sealed_.load(std::memory_order_acquire);
    }

    [[nodiscard]]
    inline bool started() const noexcept {
        return started_.load(std::memory_order_acquire);
    }

    [[nodiscard]]
    bool wait() {
        ctx_->wait([this] { return started_.load(std::memory_order_acquire); });
        while (!ctx_->done()) {
            const auto rep = deadline_.load(std::memory_order_acquire);
            const std::chrono::steady_clock::time_point deadline{std::chrono::steady_clock::duration(rep)};
            const bool woken = ctx_->wait_until(deadline, [&] {
                return deadline_.load(std::memory_order_acquire) != rep;
            });
            if (!woken) {
                return true;
            }
            // re-armed (loop) or cancelled (exit)
        }
        return false;
    }

private:
    Context::Ptr ctx_;
    std::atomic<std::chrono::steady_clock::rep> deadline_{0};
    std::atomic<bool> started_{false};
    std::atomic<bool> sealed_{false};
};

} // namespace enginewire::core::transport::connection
