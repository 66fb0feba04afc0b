#pragma once

// Source implementations for the token protocol.
// Provides binary_source and value_source classes.

#include <bit>
#include <cstdint>
#include <span>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "error.hpp"
#include "format.hpp"
#include "token.hpp"

namespace tagpack {

// ============================================================================
// binary_source - MessagePack decoder over a byte buffer
// ============================================================================

class binary_source {
public:
    explicit binary_source(std::span<const uint8_t> bytes) : data(bytes) {}

    auto read_token() -> token_t {
        if (pos >= data.size()) {
            throw invalid_input_error("unexpected end of input: no marker byte at offset " +
                                      std::to_string(pos));
        }
        auto offset = pos;
        auto m = data[pos++];

        if (binary_format::is_positive_fixint(m)) {
            return integer_t(m);
        }
        if (binary_format::is_negative_fixint(m)) {
            return integer_t(static_cast<int8_t>(m));
        }
        if (binary_format::is_fixmap(m)) {
            return map_header{static_cast<uint32_t>(m & 0x0f)};
        }
        if (binary_format::is_fixarray(m)) {
            return array_header{static_cast<uint32_t>(m & 0x0f)};
        }
        if (binary_format::is_fixstr(m)) {
            return str_t(read_bytes(m & 0x1f));
        }

        switch (m) {
            case binary_format::NIL:        return nil;
            case binary_format::BOOL_FALSE: return token_t(std::in_place_type<bool>, false);
            case binary_format::BOOL_TRUE:  return token_t(std::in_place_type<bool>, true);

            case binary_format::BIN8:  return bin_t{read_bytes(read_be<uint8_t>())};
            case binary_format::BIN16: return bin_t{read_bytes(read_be<uint16_t>())};
            case binary_format::BIN32: return bin_t{read_bytes(read_be<uint32_t>())};

            case binary_format::EXT8:  return read_ext(read_be<uint8_t>());
            case binary_format::EXT16: return read_ext(read_be<uint16_t>());
            case binary_format::EXT32: return read_ext(read_be<uint32_t>());

            case binary_format::FLOAT32: return std::bit_cast<float>(read_be<uint32_t>());
            case binary_format::FLOAT64: return std::bit_cast<double>(read_be<uint64_t>());

            case binary_format::UINT8:  return integer_t(read_be<uint8_t>());
            case binary_format::UINT16: return integer_t(read_be<uint16_t>());
            case binary_format::UINT32: return integer_t(read_be<uint32_t>());
            case binary_format::UINT64: return integer_t(read_be<uint64_t>());

            case binary_format::INT8:  return integer_t(static_cast<int8_t>(read_be<uint8_t>()));
            case binary_format::INT16: return integer_t(static_cast<int16_t>(read_be<uint16_t>()));
            case binary_format::INT32: return integer_t(static_cast<int32_t>(read_be<uint32_t>()));
            case binary_format::INT64: return integer_t(static_cast<int64_t>(read_be<uint64_t>()));

            case binary_format::FIXEXT1:  return read_ext(1);
            case binary_format::FIXEXT2:  return read_ext(2);
            case binary_format::FIXEXT4:  return read_ext(4);
            case binary_format::FIXEXT8:  return read_ext(8);
            case binary_format::FIXEXT16: return read_ext(16);

            case binary_format::STR8:  return str_t(read_bytes(read_be<uint8_t>()));
            case binary_format::STR16: return str_t(read_bytes(read_be<uint16_t>()));
            case binary_format::STR32: return str_t(read_bytes(read_be<uint32_t>()));

            case binary_format::ARRAY16: return array_header{read_be<uint16_t>()};
            case binary_format::ARRAY32: return array_header{read_be<uint32_t>()};
            case binary_format::MAP16:   return map_header{read_be<uint16_t>()};
            case binary_format::MAP32:   return map_header{read_be<uint32_t>()};

            default:
                break;
        }
        throw invalid_input_error("reserved marker byte 0x" + hex_byte(m) + " at offset " +
                                  std::to_string(offset));
    }

    // --- Cursor ---

    auto mark() const -> std::size_t { return pos; }
    void reset(std::size_t p) { pos = p; }

    auto position() const -> std::size_t { return pos; }
    auto remaining() const -> std::size_t { return data.size() - pos; }
    auto at_end() const -> bool { return pos >= data.size(); }

private:
    std::span<const uint8_t> data;
    std::size_t pos = 0;

    void require(std::size_t n) {
        if (n > data.size() - pos) {
            throw invalid_input_error("unexpected end of input: need " + std::to_string(n) +
                                      " byte(s) at offset " + std::to_string(pos) + ", " +
                                      std::to_string(data.size() - pos) + " available");
        }
    }

    template <typename T>
    auto read_be() -> T {
        require(sizeof(T));
        T value = 0;
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            value = static_cast<T>((static_cast<uint64_t>(value) << 8) | data[pos + i]);
        }
        pos += sizeof(T);
        return value;
    }

    auto read_bytes(std::size_t n) -> std::vector<uint8_t> {
        require(n);
        auto first = data.begin() + static_cast<std::ptrdiff_t>(pos);
        std::vector<uint8_t> out(first, first + static_cast<std::ptrdiff_t>(n));
        pos += n;
        return out;
    }

    auto read_ext(std::size_t n) -> ext_t {
        auto type = static_cast<int8_t>(read_be<uint8_t>());
        return ext_t{type, read_bytes(n)};
    }

    static auto hex_byte(uint8_t b) -> std::string {
        static const char digits[] = "0123456789abcdef";
        return {digits[b >> 4], digits[b & 0x0f]};
    }
};

// ============================================================================
// value_source - presents a value_t as a pre-order token stream
// ============================================================================

class value_source {
public:
    explicit value_source(const value_t& root) {
        std::vector<const value_t*> stack{&root};
        while (!stack.empty()) {
            const auto* v = stack.back();
            stack.pop_back();
            tokens.push_back(header_of(*v));
            if (const auto* array = v->as_array()) {
                for (auto it = array->rbegin(); it != array->rend(); ++it) {
                    stack.push_back(&*it);
                }
            } else if (const auto* map = v->as_map()) {
                for (auto it = map->rbegin(); it != map->rend(); ++it) {
                    stack.push_back(&it->second);
                    stack.push_back(&it->first);
                }
            }
        }
    }

    auto read_token() -> token_t {
        if (pos >= tokens.size()) {
            throw invalid_input_error("unexpected end of value: token stream exhausted after " +
                                      std::to_string(tokens.size()) + " token(s)");
        }
        return tokens[pos++];
    }

    auto mark() const -> std::size_t { return pos; }
    void reset(std::size_t p) { pos = p; }
    auto at_end() const -> bool { return pos >= tokens.size(); }

private:
    std::vector<token_t> tokens;
    std::size_t pos = 0;

    static auto header_of(const value_t& v) -> token_t {
        return std::visit([](const auto& x) -> token_t {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, value_t::array_type>) {
                return array_header{static_cast<uint32_t>(x.size())};
            } else if constexpr (std::is_same_v<T, value_t::map_type>) {
                return map_header{static_cast<uint32_t>(x.size())};
            } else {
                return token_t(std::in_place_type<T>, x);
            }
        }, v.storage());
    }
};

} // namespace tagpack
