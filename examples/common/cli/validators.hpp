#pragma once

#include <string>

#include <CLI/CLI.hpp>


namespace enginewire::examples::cli {

// -------------------------------------------------------------
// Engine.IO host validator ([scheme://]host[:port])
// -------------------------------------------------------------
inline auto host_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        std::string rest = value;
        if (auto i = rest.find("://"); i != std::string::npos) {
            const std::string scheme = rest.substr(0, i);
            if (scheme != "ws" && scheme != "wss" && scheme != "http" && scheme != "https") {
                return "Scheme must be one of: ws, wss, http, https";
            }
            rest = rest.substr(i + 3);
        }
        if (rest.empty() || rest.front() == ':' || rest.find('/') != std::string::npos) {
            return "Host must be in format host[:port] (e.g. localhost:3000)";
        }
        return {};
    },
    "Engine.IO host validator"
);


// -------------------------------------------------------------
// Endpoint path validator
// -------------------------------------------------------------
inline auto path_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (!value.empty() && value.front() == '/') {
            return {};
        }
        return "Path must start with '/' (e.g. /engine.io/)";
    },
    "Engine.IO path validator"
);

} // namespace enginewire::examples::cli
