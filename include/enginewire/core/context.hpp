/*
===============================================================================
 enginewire::core::Context
===============================================================================

Cancellation scope shared between the Connection and the threads it spawns.

A Context is created either as a root (make) or derived from a parent
(derive). Cancelling a parent cancels every live descendant with the same
cause; deriving from an already cancelled parent yields a cancelled child.

Two scopes are used by the Connection:

  lineage   The parent supplied to dial() (or a root owned by the
            Connection). Governs the whole reconnection chain: once it is
            done no further redial is attempted.

  attempt   Derived from the lineage for one physical connection. Cancelled
            with the closing Error when the attempt is torn down, which stops
            its watchdog.

Waiting
-------
All blocking waits of the reader, watchdog and scheduler go through the
context they belong to (wait / wait_until). A waiter is woken by cancellation
or by notify(), which callers use after changing state a wait predicate
reads. Predicates are evaluated under the context mutex and must only read
atomics.

No user callbacks are attached to a Context.
===============================================================================
*/
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>
#include <algorithm>

#include "enginewire/core/transport/error.hpp"


namespace enginewire::core {

class Context : public std::enable_shared_from_this<Context> {
    struct Token {};

public:
    using Ptr = std::shared_ptr<Context>;

    explicit Context(Token) noexcept {}

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    // Root scope, cancelled only explicitly
    [[nodiscard]]
    static Ptr make() {
        return std::make_shared<Context>(Token{});
    }

    // Child scope, cancelled explicitly or together with this context
    [[nodiscard]]
    Ptr derive() {
        auto child = make();
        transport::Error inherited = transport::Error::None;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!done_.load(std::memory_order_acquire)) {
                // drop children that are already gone
                children_.erase(
                    std::remove_if(children_.begin(), children_.end(),
                                   [](const std::weak_ptr<Context>& w) { return w.expired(); }),
                    children_.end());
                children_.push_back(child);
                return child;
            }
            inherited = cause_;
        }
        child->cancel(inherited);
        return child;
    }

    // Returns false if the context was already cancelled (cause is kept)
    bool cancel(transport::Error cause = transport::Error::Cancelled) {
        std::vector<std::weak_ptr<Context>> children;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (done_.load(std::memory_order_relaxed)) {
                return false;
            }
            cause_ = cause;
            done_.store(true, std::memory_order_release);
            children.swap(children_);
        }
        cv_.notify_all();
        for (auto& weak : children) {
            if (auto child = weak.lock()) {
                child->cancel(cause);
            }
        }
        return true;
    }

    [[nodiscard]]
    inline bool done() const noexcept {
        return done_.load(std::memory_order_acquire);
    }

    // Cancellation cause, Error::None while not done
    [[nodiscard]]
    transport::Error cause() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cause_;
    }

    // Wake every waiter so it re-evaluates its predicate
    void notify() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
        }
        cv_.notify_all();
    }

    // Blocks until the context is done or pred() holds
    template<typename Pred>
    void wait(Pred pred) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] { return done_.load(std::memory_order_relaxed) || pred(); });
    }

    // Blocks until the context is done, pred() holds or the deadline passes.
    // Returns false only on deadline expiry.
    template<typename Clock, typename Duration, typename Pred>
    [[nodiscard]]
    bool wait_until(const std::chrono::time_point<Clock, Duration>& deadline, Pred pred) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_until(lock, deadline, [&] { return done_.load(std::memory_order_relaxed) || pred(); });
    }

    // Sleeps up to `timeout`, returns done()
    template<typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return done_.load(std::memory_order_relaxed); });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> done_{false};
    transport::Error cause_{transport::Error::None};
    std::vector<std::weak_ptr<Context>> children_;
};

} // namespace enginewire::core
