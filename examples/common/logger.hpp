#pragma once

#include <string>

#include "lcr/log/logger.hpp"


namespace enginewire::examples {

    inline void set_log_level(const std::string& log_level) {
        using namespace lcr::log;
        Logger::instance().set_level(parse_level(log_level));
    }

} // namespace enginewire::examples
