#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "agentlink/core/protocol/parser/result.hpp"
#include "lcr/optional.hpp"

#include "simdjson.h"

/*
================================================================================
JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Low-level helpers used by message parsers to extract primitive values from
simdjson DOM elements.

  • Enforce basic JSON structural rules (object presence, type correctness)
  • Parse primitive field types (bool, integer, string)
  • Strict optional-field handling: absent is fine, present with the wrong
    type is InvalidSchema

IMPORTANT:
  - Helpers MUST NOT interpret values semantically
  - Helpers MUST NOT emit logs
  - Helpers MUST NOT throw exceptions
================================================================================
*/


namespace agentlink::core::protocol::parser::helper {

[[nodiscard]]
inline Result require_object(const simdjson::dom::element& root) noexcept {
    return (root.type() == simdjson::dom::element_type::OBJECT) ? Result::Parsed : Result::InvalidSchema;
}

// ------------------------------------------------------------
// REQUIRED STRING FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string_view& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string& out) noexcept {
    std::string_view sv;
    auto r = parse_string_required(obj, key, sv);
    if (r == Result::Parsed) {
        out.assign(sv.data(), sv.size());
    }
    return r;
}

// ------------------------------------------------------------
// OPTIONAL STRING FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_string_optional(const simdjson::dom::element& obj, const char* key, lcr::optional<std::string>& out) noexcept {
    out.reset();
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::Parsed; // optional, not present
    }
    std::string_view sv;
    if (field.get(sv)) {
        return Result::InvalidSchema;
    }
    out = std::string(sv);
    return Result::Parsed;
}

// ------------------------------------------------------------
// REQUIRED BOOL FIELD
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_bool_required(const simdjson::dom::element& obj, const char* key, bool& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

// ------------------------------------------------------------
// REQUIRED UNSIGNED INTEGER FIELD
// ------------------------------------------------------------
// JSON numbers produced by JavaScript peers may arrive as doubles
// (e.g. 1.7e12); integral doubles are accepted.
[[nodiscard]]
inline Result parse_uint64_required(const simdjson::dom::element& obj, const char* key, std::uint64_t& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (!field.get(out)) {
        return Result::Parsed;
    }
    double d;
    if (field.get(d) || d < 0.0 || d != static_cast<double>(static_cast<std::uint64_t>(d))) {
        return Result::InvalidSchema;
    }
    out = static_cast<std::uint64_t>(d);
    return Result::Parsed;
}

} // namespace agentlink::core::protocol::parser::helper
