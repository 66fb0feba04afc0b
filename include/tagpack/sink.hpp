#pragma once

// Sink implementations for the token protocol.
// Provides binary_sink, value_sink and ascii_sink classes.

#include <algorithm>
#include <bit>
#include <cstdint>
#include <iomanip>
#include <ios>
#include <limits>
#include <optional>
#include <ostream>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "format.hpp"
#include "token.hpp"

namespace tagpack {

// ============================================================================
// binary_sink - MessagePack encoder, narrowest marker for every token
// ============================================================================

class binary_sink {
public:
    explicit binary_sink(std::ostream& stream) : os(stream) {}

    // --- Scalars ---

    void write_nil() {
        write_marker(binary_format::NIL);
    }

    void write_bool(bool value) {
        write_marker(value ? binary_format::BOOL_TRUE : binary_format::BOOL_FALSE);
    }

    void write_int(integer_t value) {
        if (!value.is_negative()) {
            auto v = value.bits();
            if (v <= 0x7f) {
                write_marker(static_cast<uint8_t>(v));
            } else if (v <= std::numeric_limits<uint8_t>::max()) {
                write_marker(binary_format::UINT8);
                write_be(static_cast<uint8_t>(v));
            } else if (v <= std::numeric_limits<uint16_t>::max()) {
                write_marker(binary_format::UINT16);
                write_be(static_cast<uint16_t>(v));
            } else if (v <= std::numeric_limits<uint32_t>::max()) {
                write_marker(binary_format::UINT32);
                write_be(static_cast<uint32_t>(v));
            } else {
                write_marker(binary_format::UINT64);
                write_be(v);
            }
        } else {
            auto v = static_cast<int64_t>(value.bits());
            if (v >= -32) {
                write_marker(static_cast<uint8_t>(v));
            } else if (v >= std::numeric_limits<int8_t>::min()) {
                write_marker(binary_format::INT8);
                write_be(static_cast<uint8_t>(static_cast<int8_t>(v)));
            } else if (v >= std::numeric_limits<int16_t>::min()) {
                write_marker(binary_format::INT16);
                write_be(static_cast<uint16_t>(static_cast<int16_t>(v)));
            } else if (v >= std::numeric_limits<int32_t>::min()) {
                write_marker(binary_format::INT32);
                write_be(static_cast<uint32_t>(static_cast<int32_t>(v)));
            } else {
                write_marker(binary_format::INT64);
                write_be(value.bits());
            }
        }
    }

    void write_f32(float value) {
        write_marker(binary_format::FLOAT32);
        write_be(std::bit_cast<uint32_t>(value));
    }

    void write_f64(double value) {
        write_marker(binary_format::FLOAT64);
        write_be(std::bit_cast<uint64_t>(value));
    }

    void write_str(std::span<const uint8_t> data) {
        auto len = checked_length(data.size(), "str");
        if (len <= binary_format::FIXSTR_MAX) {
            write_marker(static_cast<uint8_t>(binary_format::FIXSTR | len));
        } else {
            write_length(len, binary_format::STR8, binary_format::STR16, binary_format::STR32);
        }
        write_bytes(data);
    }

    void write_bin(std::span<const uint8_t> data) {
        auto len = checked_length(data.size(), "bin");
        write_length(len, binary_format::BIN8, binary_format::BIN16, binary_format::BIN32);
        write_bytes(data);
    }

    // --- Composite headers ---

    void write_array(uint32_t len) {
        if (len <= binary_format::FIXARRAY_MAX) {
            write_marker(static_cast<uint8_t>(binary_format::FIXARRAY | len));
        } else if (len <= std::numeric_limits<uint16_t>::max()) {
            write_marker(binary_format::ARRAY16);
            write_be(static_cast<uint16_t>(len));
        } else {
            write_marker(binary_format::ARRAY32);
            write_be(len);
        }
    }

    void write_map(uint32_t len) {
        if (len <= binary_format::FIXMAP_MAX) {
            write_marker(static_cast<uint8_t>(binary_format::FIXMAP | len));
        } else if (len <= std::numeric_limits<uint16_t>::max()) {
            write_marker(binary_format::MAP16);
            write_be(static_cast<uint16_t>(len));
        } else {
            write_marker(binary_format::MAP32);
            write_be(len);
        }
    }

    // --- Extension ---

    void write_ext(int8_t type, std::span<const uint8_t> data) {
        auto len = checked_length(data.size(), "ext");
        switch (len) {
            case 1:  write_marker(binary_format::FIXEXT1); break;
            case 2:  write_marker(binary_format::FIXEXT2); break;
            case 4:  write_marker(binary_format::FIXEXT4); break;
            case 8:  write_marker(binary_format::FIXEXT8); break;
            case 16: write_marker(binary_format::FIXEXT16); break;
            default:
                write_length(len, binary_format::EXT8, binary_format::EXT16, binary_format::EXT32);
                break;
        }
        write_be(static_cast<uint8_t>(type));
        write_bytes(data);
    }

private:
    std::ostream& os;

    static auto checked_length(std::size_t size, const char* what) -> uint32_t {
        if (size > std::numeric_limits<uint32_t>::max()) {
            throw std::length_error(std::string(what) + " of " + std::to_string(size) +
                                    " bytes exceeds the 32-bit length limit");
        }
        return static_cast<uint32_t>(size);
    }

    void write_length(uint32_t len, uint8_t m8, uint8_t m16, uint8_t m32) {
        if (len <= std::numeric_limits<uint8_t>::max()) {
            write_marker(m8);
            write_be(static_cast<uint8_t>(len));
        } else if (len <= std::numeric_limits<uint16_t>::max()) {
            write_marker(m16);
            write_be(static_cast<uint16_t>(len));
        } else {
            write_marker(m32);
            write_be(len);
        }
    }

    void write_marker(uint8_t marker) {
        write_be(marker);
    }

    template <typename T>
    void write_be(T value) {
        char buf[sizeof(T)];
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            buf[i] = static_cast<char>(static_cast<uint8_t>(value >> (8 * (sizeof(T) - 1 - i))));
        }
        os.write(buf, sizeof(T));
        check();
    }

    void write_bytes(std::span<const uint8_t> data) {
        if (!data.empty()) {
            os.write(reinterpret_cast<const char*>(data.data()),
                     static_cast<std::streamsize>(data.size()));
            check();
        }
    }

    void check() {
        if (!os) {
            throw std::ios_base::failure("binary_sink: write to output stream failed");
        }
    }
};

// ============================================================================
// value_sink - builds a value_t tree from a token stream
// ============================================================================

class value_sink {
public:
    value_sink() = default;

    void write_nil() { push(value_t(nil)); }
    void write_bool(bool value) { push(value_t(value)); }
    void write_int(integer_t value) { push(value_t(value)); }
    void write_f32(float value) { push(value_t(value)); }
    void write_f64(double value) { push(value_t(value)); }

    void write_str(std::span<const uint8_t> data) {
        push(value_t(str_t(std::vector<uint8_t>(data.begin(), data.end()))));
    }

    void write_bin(std::span<const uint8_t> data) {
        push(value_t(bin_t{std::vector<uint8_t>(data.begin(), data.end())}));
    }

    void write_ext(int8_t type, std::span<const uint8_t> data) {
        push(value_t(ext_t{type, std::vector<uint8_t>(data.begin(), data.end())}));
    }

    void write_array(uint32_t len) {
        if (len == 0) {
            push(value_t(value_t::array_type{}));
            return;
        }
        check_open();
        frames.push_back({false, uint64_t{len}, {}});
        reserve_children();
    }

    void write_map(uint32_t len) {
        if (len == 0) {
            push(value_t(value_t::map_type{}));
            return;
        }
        check_open();
        frames.push_back({true, uint64_t{2} * len, {}});
        reserve_children();
    }

    // Completed value. Throws std::logic_error unless exactly one complete
    // value was written.
    auto finish() -> value_t {
        if (!frames.empty()) {
            throw std::logic_error(
                "value_sink: " + std::to_string(frames.size()) + " container(s) left incomplete");
        }
        if (!result) {
            throw std::logic_error("value_sink: no value was written");
        }
        auto out = std::move(*result);
        result.reset();
        return out;
    }

private:
    struct frame {
        bool is_map;
        uint64_t expected;
        std::vector<value_t> children;
    };

    std::vector<frame> frames;
    std::optional<value_t> result;

    // Header lengths are untrusted; reserve at most this many children.
    static constexpr uint64_t max_reserve = 4096;

    void reserve_children() {
        auto& top = frames.back();
        top.children.reserve(static_cast<std::size_t>(std::min(top.expected, max_reserve)));
    }

    void check_open() {
        if (frames.empty() && result) {
            throw std::logic_error("value_sink: more than one top-level value written");
        }
    }

    // Attach a finished value to the innermost open container, closing every
    // container it completes.
    void push(value_t value) {
        check_open();
        while (!frames.empty()) {
            auto& top = frames.back();
            top.children.push_back(std::move(value));
            if (top.children.size() < top.expected) {
                return;
            }
            value = close(std::move(top));
            frames.pop_back();
        }
        result = std::move(value);
    }

    static auto close(frame&& f) -> value_t {
        if (!f.is_map) {
            return value_t(std::move(f.children));
        }
        value_t::map_type map;
        map.reserve(f.children.size() / 2);
        for (std::size_t i = 0; i < f.children.size(); i += 2) {
            map.emplace_back(std::move(f.children[i]), std::move(f.children[i + 1]));
        }
        return value_t(std::move(map));
    }
};

// ============================================================================
// ascii_sink - human-readable indented rendering of a token stream
// ============================================================================

class ascii_sink {
public:
    explicit ascii_sink(std::ostream& stream, int indent = 4)
        : os(stream), indent_size(indent) {}

    // --- Scalars ---

    void write_nil() { write_scalar("nil"); }
    void write_bool(bool value) { write_scalar(value ? "true" : "false"); }
    void write_int(integer_t value) { write_scalar(value.to_string()); }
    void write_f32(float value) { write_scalar(format_float(value) + "f"); }
    void write_f64(double value) { write_scalar(format_float(value)); }

    void write_str(std::span<const uint8_t> data) {
        write_scalar("\"" + escape(data) + "\"");
    }

    void write_bin(std::span<const uint8_t> data) {
        write_scalar("bin(" + hex(data) + ")");
    }

    void write_ext(int8_t type, std::span<const uint8_t> data) {
        write_scalar("ext(" + std::to_string(type) + ", " + hex(data) + ")");
    }

    // --- Composites ---

    void write_array(uint32_t len) { open('[', ']', false, len); }
    void write_map(uint32_t len) { open('{', '}', true, uint64_t{2} * len); }

private:
    struct frame {
        bool is_map;
        uint64_t remaining;
        char close;
        bool is_key;
    };

    std::ostream& os;
    int indent_size;
    int indent_level = 0;
    std::vector<frame> frames;

    auto at_key() const -> bool {
        return !frames.empty() && frames.back().is_map && frames.back().remaining % 2 == 0;
    }

    auto at_map_value() const -> bool {
        return !frames.empty() && frames.back().is_map && frames.back().remaining % 2 == 1;
    }

    void write_scalar(const std::string& text) {
        if (at_key()) {
            write_indent();
            os << text << ": ";
        } else if (at_map_value()) {
            os << text << "\n";
        } else {
            write_indent();
            os << text << "\n";
        }
        complete_one();
    }

    void open(char open_char, char close_char, bool is_map, uint64_t children) {
        if (children == 0) {
            write_scalar(std::string{open_char, close_char});
            return;
        }
        bool is_key = at_key();
        if (!at_map_value()) {
            write_indent();
        }
        os << open_char << "\n";
        frames.push_back({is_map, children, close_char, is_key});
        indent_level++;
    }

    void complete_one() {
        while (!frames.empty()) {
            auto& top = frames.back();
            if (--top.remaining > 0) {
                return;
            }
            auto closed = top;
            frames.pop_back();
            indent_level--;
            write_indent();
            os << closed.close << (closed.is_key ? ": " : "\n");
        }
    }

    void write_indent() {
        for (int i = 0; i < indent_level * indent_size; ++i) {
            os << ' ';
        }
    }

    template <typename T>
    static auto format_float(T value) -> std::string {
        std::ostringstream oss;
        oss << std::setprecision(15) << value;
        auto s = oss.str();
        if (s.find_first_of(".eni") == std::string::npos) {
            s += ".0";
        }
        return s;
    }

    static auto hex(std::span<const uint8_t> data) -> std::string {
        static const char digits[] = "0123456789abcdef";
        std::string result;
        result.reserve(data.size() * 2);
        for (auto b : data) {
            result += digits[b >> 4];
            result += digits[b & 0x0f];
        }
        return result;
    }

    static auto escape(std::span<const uint8_t> data) -> std::string {
        std::vector<uint8_t> bytes(data.begin(), data.end());
        std::string result;
        result.reserve(bytes.size());
        for (std::size_t pos = 0; pos < bytes.size();) {
            auto n = detail::utf8_sequence_length(bytes, pos);
            if (n == 0) {
                result += "\\x" + hex(data.subspan(pos, 1));
                pos += 1;
                continue;
            }
            if (n > 1) {
                result.append(reinterpret_cast<const char*>(bytes.data() + pos), n);
                pos += n;
                continue;
            }
            char c = static_cast<char>(bytes[pos]);
            switch (c) {
                case '\\': result += "\\\\"; break;
                case '"':  result += "\\\""; break;
                case '\n': result += "\\n"; break;
                case '\t': result += "\\t"; break;
                case '\r': result += "\\r"; break;
                default:
                    if (bytes[pos] < 0x20 || bytes[pos] == 0x7f) {
                        result += "\\x" + hex(data.subspan(pos, 1));
                    } else {
                        result += c;
                    }
                    break;
            }
            pos += 1;
        }
        return result;
    }
};

} // namespace tagpack
