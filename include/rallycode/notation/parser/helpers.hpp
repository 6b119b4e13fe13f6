#pragma once

#include <string_view>


/*
================================================================================
Notation Parsing Helpers
================================================================================

Character-level primitives shared by the notation parsers. They never log,
never allocate and never interpret characters; vocabulary lookups live in the
enum headers.
================================================================================
*/


namespace rallycode::notation::parser::helper {

[[nodiscard]]
inline constexpr bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

// Strips leading and trailing whitespace
[[nodiscard]]
inline constexpr std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

// Tail of `s` starting at `pos` (empty when pos is past the end)
[[nodiscard]]
inline constexpr std::string_view tail(std::string_view s, std::size_t pos) noexcept {
    return pos < s.size() ? s.substr(pos) : std::string_view{};
}

} // namespace rallycode::notation::parser::helper
