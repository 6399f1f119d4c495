#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

#include "enginewire/core/context.hpp"
#include "lcr/format.hpp"
#include "lcr/log/logger.hpp"


namespace enginewire::core::transport::connection {

/*
===============================================================================
 ReconnectScheduler
===============================================================================

Single-slot delayed task runner owned by a Connection. A background worker
thread lives as long as the scheduler.

  schedule(delay, lineage, task)
      Arms the slot. Any pending request is replaced (its generation no longer
      matches, so it is dropped when the worker wakes up).

  cancel()
      Drops the pending request, if any.

The worker waits on the lineage context, so a cancelled lineage wakes it
immediately and the request is dropped without running. The task runs on the
worker thread without any scheduler lock held and may call schedule() again
(the usual "retry failed, try later" chain).
===============================================================================
*/

class ReconnectScheduler {
public:
    using Task = std::function<void()>;

    ReconnectScheduler()
        : worker_(&ReconnectScheduler::run_loop_, this)
    {}

    ~ReconnectScheduler() {
        stop();
    }

    ReconnectScheduler(const ReconnectScheduler&) = delete;
    ReconnectScheduler& operator=(const ReconnectScheduler&) = delete;

    // ---------------------------------------------------------------------
    // Public API
    // ---------------------------------------------------------------------

    void schedule(std::chrono::milliseconds delay, Context::Ptr lineage, Task task) {
        Context::Ptr waiting;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (stopping_.load(std::memory_order_relaxed)) {
                return;
            }
            request_.deadline = std::chrono::steady_clock::now() + delay;
            request_.lineage  = std::move(lineage);
            request_.task     = std::move(task);
            has_request_ = true;
            generation_.fetch_add(1, std::memory_order_acq_rel);
            waiting = waiting_on_;
        }
        EW_DEBUG("[RETRY] Reconnection scheduled in " << lcr::format_delay(delay));
        cv_.notify_one();
        if (waiting) {
            waiting->notify();
        }
    }

    void cancel() {
        Context::Ptr waiting;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (!has_request_) {
                return;
            }
            has_request_ = false;
            request_ = Request{};
            generation_.fetch_add(1, std::memory_order_acq_rel);
            waiting = waiting_on_;
        }
        EW_DEBUG("[RETRY] Pending reconnection cancelled");
        if (waiting) {
            waiting->notify();
        }
    }

    [[nodiscard]]
    bool pending() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return has_request_;
    }

    /// Drop any pending request and join the worker thread.
    /// A task that is currently running is allowed to finish.
    void stop() {
        Context::Ptr waiting;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            stopping_.store(true, std::memory_order_release);
            has_request_ = false;
            request_ = Request{};
            waiting = waiting_on_;
        }
        cv_.notify_all();
        if (waiting) {
            waiting->notify();
        }
        if (worker_.joinable()) {
            if (worker_.get_id() == std::this_thread::get_id()) {
                worker_.detach(); // stopped from inside a task
            } else {
                worker_.join();
            }
        }
    }

private:
    struct Request {
        std::chrono::steady_clock::time_point deadline{};
        Context::Ptr lineage;
        Task task;
    };

    // ---------------------------------------------------------------------
    // Worker thread main loop
    // ---------------------------------------------------------------------
    void run_loop_() {
        while (true) {
            Request req;
            std::uint64_t gen = 0;
            {
                std::unique_lock<std::mutex> lk(mtx_);
                cv_.wait(lk, [&] {
                    return stopping_.load(std::memory_order_relaxed) || has_request_;
                });
                if (stopping_.load(std::memory_order_relaxed)) {
                    return;
                }
                req = request_;
                gen = generation_.load(std::memory_order_acquire);
                waiting_on_ = req.lineage;
            }

            (void)req.lineage->wait_until(req.deadline, [&] {
                return stopping_.load(std::memory_order_acquire) ||
                       generation_.load(std::memory_order_acquire) != gen;
            });

            {
                std::lock_guard<std::mutex> lk(mtx_);
                waiting_on_.reset();
                if (stopping_.load(std::memory_order_relaxed)) {
                    return;
                }
                if (generation_.load(std::memory_order_acquire) != gen) {
                    continue; // replaced or cancelled while waiting
                }
                has_request_ = false;
                request_ = Request{};
            }

            if (req.lineage->done()) {
                EW_DEBUG("[RETRY] Lineage context cancelled, dropping reconnection");
                continue;
            }
            req.task();
        }
    }

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;

    Request request_;
    bool has_request_{false};
    Context::Ptr waiting_on_;

    std::atomic<std::uint64_t> generation_{0};
    std::atomic<bool> stopping_{false};

    std::thread worker_;   // last member: started once everything else is initialized
};

} // namespace enginewire::core::transport::connection
