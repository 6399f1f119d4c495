#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "enginewire/core/protocol/parser/helpers.hpp"
#include "enginewire/core/protocol/parser/result.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace enginewire::core::protocol {

// ============================================================================
// OPEN packet body
//
//   {"sid":"lv_VI97HAXpY6yYWAAAC","upgrades":["websocket"],
//    "pingInterval":25000,"pingTimeout":20000,"maxPayload":1000000}
//
// sid, pingInterval and pingTimeout are required. upgrades and maxPayload are
// optional (upgrades is recorded but unused by this client).
// ============================================================================
struct Handshake {
    std::string sid;
    std::vector<std::string> upgrades;
    std::chrono::milliseconds ping_interval{0};
    std::chrono::milliseconds ping_timeout{0};
    std::int64_t max_payload{0};
};


// Upper bound accepted for pingInterval and pingTimeout (one day). Larger
// values would overflow the watchdog deadline arithmetic.
inline constexpr std::uint64_t MAX_PING_MS = 24ull * 60 * 60 * 1000;


// Decodes the JSON body of an OPEN packet.
//
// One simdjson parser per calling thread.
[[nodiscard]]
inline parser::Result parse_handshake(std::string_view body, Handshake& out) {
    using namespace parser;

    thread_local simdjson::dom::parser json;

    simdjson::padded_string padded(body);
    simdjson::dom::element root;
    if (auto err = json.parse(padded).get(root); err) {
        EW_DEBUG("[CODEC] Handshake is not valid JSON: " << simdjson::error_message(err));
        return Result::InvalidJson;
    }
    if (auto r = helper::require_object(root); r != Result::Ok) {
        return r;
    }

    Handshake hs;

    // sid (required, non-empty)
    std::string_view sid;
    if (auto r = helper::parse_string_required(root, "sid", sid); r != Result::Ok) {
        EW_DEBUG("[CODEC] Handshake without 'sid'");
        return r;
    }
    if (sid.empty()) {
        return Result::InvalidValue;
    }
    hs.sid.assign(sid);

    // pingInterval / pingTimeout (required, milliseconds)
    std::uint64_t interval = 0;
    if (auto r = helper::parse_uint64_required(root, "pingInterval", interval); r != Result::Ok) {
        EW_DEBUG("[CODEC] Handshake without a valid 'pingInterval'");
        return r;
    }
    std::uint64_t timeout = 0;
    if (auto r = helper::parse_uint64_required(root, "pingTimeout", timeout); r != Result::Ok) {
        EW_DEBUG("[CODEC] Handshake without a valid 'pingTimeout'");
        return r;
    }
    if (interval > MAX_PING_MS || timeout > MAX_PING_MS) {
        EW_DEBUG("[CODEC] Handshake timing out of range (" << interval << "/" << timeout << " ms)");
        return Result::InvalidValue;
    }
    hs.ping_interval = std::chrono::milliseconds(static_cast<std::int64_t>(interval));
    hs.ping_timeout  = std::chrono::milliseconds(static_cast<std::int64_t>(timeout));

    // maxPayload (optional)
    std::uint64_t max_payload = 0;
    bool present = false;
    if (auto r = helper::parse_uint64_optional(root, "maxPayload", max_payload, present); r != Result::Ok) {
        return r;
    }
    hs.max_payload = present ? static_cast<std::int64_t>(max_payload) : 0;

    // upgrades (optional)
    if (auto r = helper::parse_string_list_optional(root, "upgrades", hs.upgrades, present); r != Result::Ok) {
        return r;
    }

    out = std::move(hs);
    return Result::Ok;
}

} // namespace enginewire::core::protocol
