#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>


namespace enginewire::core::event {

/*
===============================================================================
 HandlerList<Args...>
===============================================================================

Thread-safe listener list for one event category.

  on(h)    persistent listener
  once(h)  one-shot listener, removed the first time the event fires

call(args...) snapshots the list under the lock, removes the one-shot
entries, then invokes every handler outside the lock in registration order.
Handlers may therefore register further listeners (or fire other events)
without deadlocking; listeners added during a dispatch only see later events.

Arguments are passed by reference to every handler in turn, so a handler may
observe changes made by a previous one (DialErrorContext relies on it).
===============================================================================
*/

template<typename... Args>
class HandlerList {
public:
    using Handler = std::function<void(Args...)>;

    void on(Handler h) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(Entry{std::move(h), false});
    }

    void once(Handler h) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(Entry{std::move(h), true});
    }

    template<typename... CallArgs>
    void call(CallArgs&&... args) {
        std::vector<Entry> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (entries_.empty()) {
                return;
            }
            snapshot = entries_;
            std::erase_if(entries_, [](const Entry& e) { return e.once; });
        }
        for (auto& entry : snapshot) {
            if (entry.handler) {
                entry.handler(args...);
            }
        }
    }

    [[nodiscard]]
    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    [[nodiscard]]
    bool empty() const {
        return size() == 0;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

private:
    struct Entry {
        Handler handler;
        bool once;
    };

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

} // namespace enginewire::core::event
