#pragma once

#include "enginewire/core/transport/error.hpp"


namespace enginewire::core::transport::connection {

// Passed by reference to dial-error listeners.
//
// count() is -1 for the caller's own dial() and 1, 2, ... for automatic
// retries of one reconnection chain. A listener calling cancel_reconnect()
// stops that chain: no further retry is scheduled after this failure.
class DialErrorContext {
public:
    DialErrorContext(int count, Error error) noexcept
        : count_(count)
        , error_(error)
    {}

    [[nodiscard]]
    inline int count() const noexcept { return count_; }

    [[nodiscard]]
    inline Error error() const noexcept { return error_; }

    inline void cancel_reconnect() noexcept { cancelled_ = true; }

    [[nodiscard]]
    inline bool reconnect_cancelled() const noexcept { return cancelled_; }

private:
    int count_;
    Error error_;
    bool cancelled_{false};
};

} // namespace enginewire::core::transport::connection
