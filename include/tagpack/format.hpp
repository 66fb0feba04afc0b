#pragma once

// MessagePack marker table.
//
// Every encoded object starts with one marker byte. Fix* markers carry a
// small value or length in their low bits; the others are followed by a
// big-endian length or payload.

#include <cstdint>

namespace tagpack {

namespace binary_format {

constexpr uint8_t POSITIVE_FIXINT = 0x00;  // 0x00 - 0x7f
constexpr uint8_t FIXMAP          = 0x80;  // 0x80 - 0x8f
constexpr uint8_t FIXARRAY        = 0x90;  // 0x90 - 0x9f
constexpr uint8_t FIXSTR          = 0xa0;  // 0xa0 - 0xbf
constexpr uint8_t NIL             = 0xc0;
constexpr uint8_t RESERVED        = 0xc1;  // never used
constexpr uint8_t BOOL_FALSE      = 0xc2;
constexpr uint8_t BOOL_TRUE       = 0xc3;
constexpr uint8_t BIN8            = 0xc4;
constexpr uint8_t BIN16           = 0xc5;
constexpr uint8_t BIN32           = 0xc6;
constexpr uint8_t EXT8            = 0xc7;
constexpr uint8_t EXT16           = 0xc8;
constexpr uint8_t EXT32           = 0xc9;
constexpr uint8_t FLOAT32         = 0xca;
constexpr uint8_t FLOAT64         = 0xcb;
constexpr uint8_t UINT8           = 0xcc;
constexpr uint8_t UINT16          = 0xcd;
constexpr uint8_t UINT32          = 0xce;
constexpr uint8_t UINT64          = 0xcf;
constexpr uint8_t INT8            = 0xd0;
constexpr uint8_t INT16           = 0xd1;
constexpr uint8_t INT32           = 0xd2;
constexpr uint8_t INT64           = 0xd3;
constexpr uint8_t FIXEXT1         = 0xd4;
constexpr uint8_t FIXEXT2         = 0xd5;
constexpr uint8_t FIXEXT4         = 0xd6;
constexpr uint8_t FIXEXT8         = 0xd7;
constexpr uint8_t FIXEXT16        = 0xd8;
constexpr uint8_t STR8            = 0xd9;
constexpr uint8_t STR16           = 0xda;
constexpr uint8_t STR32           = 0xdb;
constexpr uint8_t ARRAY16         = 0xdc;
constexpr uint8_t ARRAY32         = 0xdd;
constexpr uint8_t MAP16           = 0xde;
constexpr uint8_t MAP32           = 0xdf;
constexpr uint8_t NEGATIVE_FIXINT = 0xe0;  // 0xe0 - 0xff

// Largest lengths representable by the fix* markers.
constexpr uint32_t FIXSTR_MAX   = 31;
constexpr uint32_t FIXARRAY_MAX = 15;
constexpr uint32_t FIXMAP_MAX   = 15;

constexpr auto is_positive_fixint(uint8_t m) -> bool { return m <= 0x7f; }
constexpr auto is_fixmap(uint8_t m) -> bool { return (m & 0xf0) == FIXMAP; }
constexpr auto is_fixarray(uint8_t m) -> bool { return (m & 0xf0) == FIXARRAY; }
constexpr auto is_fixstr(uint8_t m) -> bool { return (m & 0xe0) == FIXSTR; }
constexpr auto is_negative_fixint(uint8_t m) -> bool { return m >= NEGATIVE_FIXINT; }

} // namespace binary_format

} // namespace tagpack
