#pragma once

#include <string>
#include <string_view>

#include "enginewire/core/protocol/packet.hpp"
#include "enginewire/core/protocol/base64.hpp"
#include "enginewire/core/protocol/parser/result.hpp"


namespace enginewire::core::protocol {

/*
================================================================================
Engine.IO packet codec (single packet per text frame)
================================================================================

  "4hello"   -> { Message, "hello" }
  "2probe"   -> { Ping,    "probe" }
  "3"        -> { Pong,    ""      }
  "bAQID"    -> { Binary,  "\x01\x02\x03" }

Multi-packet payloads (record separator framing) are not handled: one frame
carries exactly one packet.
================================================================================
*/

[[nodiscard]]
inline parser::Result decode(std::string_view frame, Packet& out) {
    if (frame.empty()) {
        return parser::Result::InvalidSchema;
    }
    const char tag = frame.front();
    const std::string_view body = frame.substr(1);

    if (tag == 'b') {
        std::string bytes;
        if (!base64::decode(body, bytes)) {
            return parser::Result::InvalidValue;
        }
        out.type = PacketType::Binary;
        out.body = std::move(bytes);
        return parser::Result::Ok;
    }
    if (tag < '0' || tag > '6') {
        return parser::Result::InvalidValue;
    }
    out.type = static_cast<PacketType>(tag - '0');
    out.body.assign(body);
    return parser::Result::Ok;
}

[[nodiscard]]
inline std::string encode(const Packet& pkt) {
    if (pkt.type == PacketType::Binary) {
        return "b" + base64::encode(pkt.body);
    }
    std::string out;
    out.reserve(pkt.body.size() + 1);
    out.push_back(static_cast<char>('0' + static_cast<int>(pkt.type)));
    out += pkt.body;
    return out;
}

} // namespace enginewire::core::protocol
