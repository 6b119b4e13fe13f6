#pragma once

#include <cstdint>
#include <string_view>

#include "rallycode/charting/parser/result.hpp"

#include "simdjson.h"

/*
================================================================================
Charting JSON Helpers (Low-Level Primitives)
================================================================================

Allocation-free helpers that extract primitive fields from simdjson DOM
elements for the row parsers.

  • Enforce structural rules (object presence, type correctness)
  • Distinguish required from optional fields
  • Never perform domain validation (empty names are the parser's concern)
  • Never log, never throw
================================================================================
*/


namespace rallycode::charting::parser::helper {

[[nodiscard]]
inline Result require_object(const simdjson::dom::element& root) noexcept {
    return (root.type() == simdjson::dom::element_type::OBJECT) ? Result::Parsed : Result::InvalidSchema;
}

// ============================================================================
// REQUIRED FIELD PARSERS
// ============================================================================

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

// ============================================================================
// OPTIONAL FIELD PARSERS
// ============================================================================
// A JSON null counts as absent.

[[nodiscard]]
inline Result parse_string_optional(const simdjson::dom::element& obj, const char* key, std::string_view& out, bool& presence) noexcept {
    presence = false;
    out = std::string_view{};
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error() || field.is_null()) {
        return Result::Parsed;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    presence = true;
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_uint64_optional(const simdjson::dom::element& obj, const char* key, std::uint64_t& out, bool& presence) noexcept {
    presence = false;
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error() || field.is_null()) {
        return Result::Parsed;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    presence = true;
    return Result::Parsed;
}

} // namespace rallycode::charting::parser::helper
