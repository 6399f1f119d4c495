#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "enginewire/core/protocol/parser/result.hpp"

#include "simdjson.h"

/*
================================================================================
JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Low-level helpers used by the handshake decoder to extract primitive JSON
values from simdjson DOM elements.

Responsibilities:
  • Enforce basic JSON structural rules (object presence, type correctness)
  • Parse primitive field types (integer, string, string array)
  • Provide strict optional-field handling semantics

IMPORTANT:
  - Helpers MUST NOT interpret values semantically
  - Helpers MUST NOT emit logs
  - Helpers MUST NOT throw exceptions

================================================================================
*/


namespace enginewire::core::protocol::parser::helper {

// ============================================================================
// ROOT TYPE
// ============================================================================

[[nodiscard]]
inline parser::Result require_object(const simdjson::dom::element& root) noexcept {
    return (root.type() == simdjson::dom::element_type::OBJECT) ? parser::Result::Ok : parser::Result::InvalidSchema;
}

// ============================================================================
// REQUIRED FIELD PARSERS
// ============================================================================

[[nodiscard]]
inline parser::Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string_view& out) noexcept {
    // Parent must be an object
    if (require_object(obj) != parser::Result::Ok) {
        return parser::Result::InvalidSchema;
    }
    // Lookup field
    auto field = obj[key];
    if (field.error()) {
        return parser::Result::InvalidSchema;
    }
    // Extract string
    if (field.get(out)) {
        return parser::Result::InvalidSchema;
    }
    return parser::Result::Ok;
}

[[nodiscard]]
inline parser::Result parse_uint64_required(const simdjson::dom::element& obj, const char* key, std::uint64_t& out) noexcept {
    // Parent must be an object
    if (require_object(obj) != parser::Result::Ok) {
        return parser::Result::InvalidSchema;
    }
    // Lookup field
    auto field = obj[key];
    if (field.error()) {
        return parser::Result::InvalidSchema;
    }
    // Extract unsigned integer (negative numbers and floats are rejected)
    if (field.get(out)) {
        return parser::Result::InvalidValue;
    }
    return parser::Result::Ok;
}

// ============================================================================
// OPTIONAL FIELD PARSERS
// ============================================================================

[[nodiscard]]
inline parser::Result parse_uint64_optional(const simdjson::dom::element& obj, const char* key, std::uint64_t& out, bool& present) noexcept {
    present = false;
    // Parent must be an object
    if (require_object(obj) != parser::Result::Ok) {
        return parser::Result::InvalidSchema;
    }
    // Lookup field
    auto field = obj[key];
    if (field.error()) {
        return parser::Result::Ok; // optional, not present
    }
    if (field.get(out)) {
        return parser::Result::InvalidValue;
    }
    present = true;
    return parser::Result::Ok;
}

// ------------------------------------------------------------
// OPTIONAL ARRAY OF STRINGS
// ------------------------------------------------------------
[[nodiscard]]
inline parser::Result parse_string_list_optional(const simdjson::dom::element& obj, const char* key, std::vector<std::string>& out, bool& present) {
    present = false;
    out.clear();
    // Parent must be object
    if (require_object(obj) != parser::Result::Ok) {
        return parser::Result::InvalidSchema;
    }
    // Lookup field
    auto field = obj[key];
    if (field.error()) {
        return parser::Result::Ok; // optional, not present
    }
    // Extract array
    simdjson::dom::array arr;
    if (field.get(arr)) {
        return parser::Result::InvalidSchema;
    }
    for (auto item : arr) {
        std::string_view sv;
        if (item.get(sv)) {
            out.clear();
            return parser::Result::InvalidSchema;
        }
        out.emplace_back(sv);
    }
    present = true;
    return parser::Result::Ok;
}

} // namespace enginewire::core::protocol::parser::helper
