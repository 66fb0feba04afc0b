#pragma once

// token_t: one wire-level primitive event.
//
// Scalars carry their payload. Arrays and maps are headers only: after an
// array_header of length n the stream holds exactly n complete values, after
// a map_header exactly 2n (alternating key and value). Readers and writers
// never check this; the code driving them must.

#include <cstdint>
#include <string>
#include <variant>

#include "value.hpp"

namespace tagpack {

struct array_header {
    std::uint32_t len = 0;
    auto operator==(const array_header&) const -> bool = default;
};

struct map_header {
    std::uint32_t len = 0;
    auto operator==(const map_header&) const -> bool = default;
};

using token_t = std::variant<
    nil_t, bool, integer_t, float, double, str_t, bin_t, array_header, map_header, ext_t>;

// Number of complete values that must follow this token.
inline auto child_count(const token_t& token) -> std::uint64_t {
    if (const auto* a = std::get_if<array_header>(&token)) {
        return a->len;
    }
    if (const auto* m = std::get_if<map_header>(&token)) {
        return std::uint64_t{2} * m->len;
    }
    return 0;
}

inline auto token_name(const token_t& token) -> std::string {
    switch (token.index()) {
        case 0: return "nil";
        case 1: return "bool";
        case 2: return "int";
        case 3: return "f32";
        case 4: return "f64";
        case 5: return "str";
        case 6: return "bin";
        case 7: return "array(" + std::to_string(std::get<array_header>(token).len) + ")";
        case 8: return "map(" + std::to_string(std::get<map_header>(token).len) + ")";
        case 9: return "ext";
    }
    return "unknown";
}

} // namespace tagpack
