#pragma once

#include "enginewire/core.hpp"


namespace enginewire {

using Client    = core::transport::ConnectionT;
using Options   = core::transport::Options;
using Error     = core::transport::Error;
using Status    = core::transport::Status;
using Context   = core::Context;
using DialErrorContext = core::transport::connection::DialErrorContext;

} // namespace enginewire
