#pragma once

// Sink and Source concepts for the token protocol.
//
// A Sink accepts one token per call; a Source produces one per call. Neither
// tracks nesting: the caller emits or consumes exactly the number of child
// values each array or map header declares.

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>

#include "token.hpp"

namespace tagpack {

template <typename S>
concept Sink = requires(S& s, integer_t i, std::span<const std::uint8_t> bytes) {
    s.write_nil();
    s.write_bool(true);
    s.write_int(i);
    s.write_f32(0.0f);
    s.write_f64(0.0);
    s.write_str(bytes);
    s.write_bin(bytes);
    s.write_array(std::uint32_t{0});
    s.write_map(std::uint32_t{0});
    s.write_ext(std::int8_t{0}, bytes);
};

// mark() returns an opaque cursor position; reset() restores it, undoing
// every read_token() since the mark.
template <typename S>
concept Source = requires(S& s, std::size_t pos) {
    { s.read_token() } -> std::same_as<token_t>;
    { s.mark() } -> std::convertible_to<std::size_t>;
    s.reset(pos);
};

} // namespace tagpack
