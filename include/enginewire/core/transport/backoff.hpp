#pragma once

#include <algorithm>
#include <chrono>


namespace enginewire::core::transport {

// -----------------------------------------------------------------------------
// Exponential reconnection backoff
// -----------------------------------------------------------------------------
//
// next() hands out the current delay and doubles it for the following call,
// never exceeding max:
//
//   base = 1 s, max = 300 s  ->  1, 2, 4, 8, ... 256, 300, 300, ...
//
// reset() is called on every successful dial.
//
// Not synchronized: the Connection only touches it under its state lock.
class Backoff {
public:
    Backoff(std::chrono::milliseconds base, std::chrono::milliseconds max) noexcept
        : base_(std::max(base, std::chrono::milliseconds(1)))
        , max_(std::max(max, base_))
        , current_(base_)
    {}

    inline void reset() noexcept {
        current_ = base_;
    }

    [[nodiscard]]
    inline std::chrono::milliseconds next() noexcept {
        const auto delay = current_;
        current_ = (current_ >= max_ / 2) ? max_ : current_ * 2;
        return delay;
    }

    [[nodiscard]]
    inline std::chrono::milliseconds current() const noexcept {
        return current_;
    }

    [[nodiscard]]
    inline std::chrono::milliseconds base() const noexcept {
        return base_;
    }

    [[nodiscard]]
    inline std::chrono::milliseconds max() const noexcept {
        return max_;
    }

private:
    std::chrono::milliseconds base_;
    std::chrono::milliseconds max_;
    std::chrono::milliseconds current_;
};

} // namespace enginewire::core::transport
