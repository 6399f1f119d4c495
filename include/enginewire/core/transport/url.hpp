#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <cstdlib>
#include <cstddef>

#include "enginewire/core/transport/error.hpp"
#include "enginewire/core/transport/options.hpp"


namespace enginewire::core::transport {

    // Contains parsed URL components
    struct ParsedUrl {
        bool secure;          // true = wss, false = ws
        std::string host;     // without IPv6 brackets
        std::string port;
        std::string target;   // path + query, always starts with '/'
    };


    // ---------------------------------------------------------------------
    // Query component escaping (application/x-www-form-urlencoded flavour):
    // unreserved characters are kept, space becomes '+', everything else is
    // percent-encoded with upper case hex digits.
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline std::string query_escape(std::string_view in) {
        constexpr char hex[] = "0123456789ABCDEF";
        std::string out;
        out.reserve(in.size());
        for (unsigned char c : in) {
            const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                                    (c >= '0' && c <= '9') ||
                                    c == '-' || c == '_' || c == '.' || c == '~';
            if (unreserved) {
                out.push_back(static_cast<char>(c));
            } else if (c == ' ') {
                out.push_back('+');
            } else {
                out.push_back('%');
                out.push_back(hex[c >> 4]);
                out.push_back(hex[c & 0x0F]);
            }
        }
        return out;
    }


    // ---------------------------------------------------------------------
    // Builds the Engine.IO WebSocket URL from the connection options.
    //
    //   { host = "localhost:3000", secure = false }
    //     -> ws://localhost:3000/engine.io/?EIO=4&transport=websocket
    //
    // Keys are emitted in sorted order, a key given several times keeps all
    // of its values in insertion order.
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline std::string build_url(const Options& options) {
        std::string host = options.host;
        bool secure = options.secure;
        if (auto i = host.find("://"); i != std::string::npos && i > 0) {
            const std::string scheme = host.substr(0, i);
            host = host.substr(i + 3);
            secure = !(scheme == "ws" || scheme == "http");
        }
        std::string path = options.path;
        if (path.empty() || path.front() != '/') {
            path.insert(path.begin(), '/');
        }

        std::map<std::string, std::vector<std::string>> query;
        for (const auto& [key, value] : options.extra_query) {
            query[key].push_back(value);
        }
        query["EIO"] = { std::to_string(PROTOCOL_VERSION) };
        query["transport"] = { "websocket" };

        std::string url = secure ? "wss://" : "ws://";
        url += host;
        url += path;
        char sep = '?';
        for (const auto& [key, values] : query) {
            for (const auto& value : values) {
                url.push_back(sep);
                url += query_escape(key);
                url.push_back('=');
                url += query_escape(value);
                sep = '&';
            }
        }
        return url;
    }


    // ---------------------------------------------------------------------
    // NOTE: Minimal URL parser supporting ws:// and wss://
    // This is a minimal, invariant-validated WebSocket URL parser. It accepts
    // the URLs produced by build_url() (and hand-written equivalents) and
    // rejects malformed inputs without attempting full RFC compliance.
    //
    // Example inputs:
    //   wss://example.com/engine.io/?EIO=4&transport=websocket
    //   ws://[::1]:3000/engine.io/
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error parse_url(const std::string& url, ParsedUrl& out) noexcept {
        out = ParsedUrl{};
        // 1) Extract scheme
        constexpr std::string_view ws  = "ws://";
        constexpr std::string_view wss = "wss://";
        size_t pos = 0;
        if (url.compare(0, ws.size(), ws) == 0) {
            out.secure = false;
            pos = ws.size();
        }
        else if (url.compare(0, wss.size(), wss) == 0) {
            out.secure = true;
            pos = wss.size();
        }
        else {
            return Error::InvalidUrl;
        }
        // 2) Extract host[:port], the authority ends at the first '/' or '?'
        size_t end = url.find_first_of("/?", pos);
        std::string hostport = (end == std::string::npos) ? url.substr(pos) : url.substr(pos, end - pos);
        if (hostport.empty()) {
            return Error::InvalidUrl;
        }
        // 3) Split host and port (bracketed IPv6 literals keep their colons)
        size_t colon = std::string::npos;
        if (hostport.front() == '[') {
            size_t close = hostport.find(']');
            if (close == std::string::npos) {
                return Error::InvalidUrl;
            }
            out.host = hostport.substr(1, close - 1);
            if (close + 1 < hostport.size()) {
                if (hostport[close + 1] != ':') {
                    return Error::InvalidUrl;
                }
                colon = close + 1;
            }
        }
        else {
            colon = hostport.find(':');
            out.host = hostport.substr(0, colon);
        }
        if (colon != std::string::npos) {
            out.port = hostport.substr(colon + 1);
        } else {
            out.port = (out.secure) ? "443" : "80";
        }
        // 4) Request target (default "/" if missing)
        if (end == std::string::npos) {
            out.target = "/";
        } else if (url[end] == '?') {
            out.target = "/" + url.substr(end);
        } else {
            out.target = url.substr(end);
        }

        // Invariants check --------------------------------

        if (out.host.empty() || out.port.empty()) {
            return Error::InvalidUrl;
        }
        for (char c : out.port) {
            if (c < '0' || c > '9') {
                return Error::InvalidUrl;
            }
        }
        const unsigned long p = std::strtoul(out.port.c_str(), nullptr, 10);
        if (p == 0 || p > 65535) {
            return Error::InvalidUrl;
        }
        if (out.target.empty() || out.target[0] != '/') {
            return Error::InvalidUrl;
        }
        // ---------------------------------------------------

        return Error::None;
    }

} // namespace enginewire::core::transport
