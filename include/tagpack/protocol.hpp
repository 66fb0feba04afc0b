#pragma once

// Read and write functions for the token protocol.
// Provides write/read free functions for primitive and standard types, the
// peek-and-restore helper try_read, and the top-level byte and value codecs.

#include <algorithm>
#include <array>
#include <concepts>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <ostream>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "concepts.hpp"
#include "error.hpp"
#include "sink.hpp"
#include "source.hpp"

namespace tagpack {

// Discards one complete value of any shape when read.
struct any_t {};

// ============================================================================
// Token helpers
// ============================================================================

namespace detail {

[[noreturn]] inline void throw_invalid_type(const char* expected, const token_t& found) {
    throw validation_error(errc::invalid_type,
        std::string("expected ") + expected + ", found " + token_name(found));
}

template <typename T>
auto expect(token_t&& token, const char* expected) -> T {
    if (auto* p = std::get_if<T>(&token)) {
        return std::move(*p);
    }
    throw_invalid_type(expected, token);
}

inline auto bytes_of(const std::string& s) -> std::span<const uint8_t> {
    return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

inline auto checked_size(std::size_t size, const char* what) -> uint32_t {
    if (size > std::numeric_limits<uint32_t>::max()) {
        throw std::length_error(std::string(what) + " of " + std::to_string(size) +
                                " elements exceeds the 32-bit length limit");
    }
    return static_cast<uint32_t>(size);
}

} // namespace detail

// Forward one token to a sink.
template <Sink S>
void write_token(S& sink, const token_t& token) {
    std::visit([&sink](const auto& t) {
        using T = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<T, nil_t>) {
            sink.write_nil();
        } else if constexpr (std::is_same_v<T, bool>) {
            sink.write_bool(t);
        } else if constexpr (std::is_same_v<T, integer_t>) {
            sink.write_int(t);
        } else if constexpr (std::is_same_v<T, float>) {
            sink.write_f32(t);
        } else if constexpr (std::is_same_v<T, double>) {
            sink.write_f64(t);
        } else if constexpr (std::is_same_v<T, str_t>) {
            sink.write_str(t.data);
        } else if constexpr (std::is_same_v<T, bin_t>) {
            sink.write_bin(t.data);
        } else if constexpr (std::is_same_v<T, array_header>) {
            sink.write_array(t.len);
        } else if constexpr (std::is_same_v<T, map_header>) {
            sink.write_map(t.len);
        } else {
            sink.write_ext(t.type, t.data);
        }
    }, token);
}

// ============================================================================
// Write declarations
// ============================================================================

template <Sink S, std::same_as<bool> T>
void write(S& sink, const T& value);

template <Sink S, Integer T>
void write(S& sink, const T& value);

template <Sink S, std::floating_point T>
void write(S& sink, const T& value);

template <Sink S>
void write(S& sink, const std::string& value);

template <Sink S>
void write(S& sink, const nil_t& value);

template <Sink S>
void write(S& sink, const integer_t& value);

template <Sink S>
void write(S& sink, const str_t& value);

template <Sink S>
void write(S& sink, const bin_t& value);

template <Sink S>
void write(S& sink, const ext_t& value);

template <Sink S, std::same_as<value_t> T>
void write(S& sink, const T& value);

template <Sink S, typename T>
void write(S& sink, const std::optional<T>& value);

template <Sink S, typename T>
void write(S& sink, const std::vector<T>& value);

template <Sink S, typename T, std::size_t N>
void write(S& sink, const std::array<T, N>& value);

template <Sink S, typename T>
void write(S& sink, const std::unique_ptr<T>& value);

template <Sink S, typename T>
void write(S& sink, const std::shared_ptr<T>& value);

// ============================================================================
// Read declarations
// ============================================================================

template <Source S, std::same_as<bool> T>
void read(S& source, T& value);

template <Source S, Integer T>
void read(S& source, T& value);

template <Source S, std::floating_point T>
void read(S& source, T& value);

template <Source S>
void read(S& source, std::string& value);

template <Source S>
void read(S& source, nil_t& value);

template <Source S>
void read(S& source, integer_t& value);

template <Source S>
void read(S& source, str_t& value);

template <Source S>
void read(S& source, bin_t& value);

template <Source S>
void read(S& source, ext_t& value);

template <Source S>
void read(S& source, any_t& value);

template <Source S, std::same_as<value_t> T>
void read(S& source, T& value);

template <Source S, typename T>
void read(S& source, std::optional<T>& value);

template <Source S, typename T>
void read(S& source, std::vector<T>& value);

template <Source S, typename T, std::size_t N>
void read(S& source, std::array<T, N>& value);

template <Source S, typename T>
void read(S& source, std::unique_ptr<T>& value);

template <Source S, typename T>
void read(S& source, std::shared_ptr<T>& value);

// ============================================================================
// try_read - peek-and-restore
// ============================================================================

// Attempt to decode one value. On a validation failure the source is
// restored to where it was and false is returned; invalid input propagates.
template <Source S, typename T>
auto try_read(S& source, T& value) -> bool {
    auto saved = source.mark();
    T temp{};
    try {
        read(source, temp);
    } catch (const validation_error&) {
        source.reset(saved);
        return false;
    }
    value = std::move(temp);
    return true;
}

namespace detail {

// True (and the nil consumed) if the next token is nil; otherwise the source
// is left untouched.
template <Source S>
auto next_is_nil(S& source) -> bool {
    auto saved = source.mark();
    if (std::holds_alternative<nil_t>(source.read_token())) {
        return true;
    }
    source.reset(saved);
    return false;
}

// Decode the pointee of an owning pointer. A nil is offered to T first and
// means a null pointer only when T rejects it. Returns false for null.
template <Source S, typename T>
auto read_pointee(S& source, T& pointee) -> bool {
    auto saved = source.mark();
    auto is_nil = std::holds_alternative<nil_t>(source.read_token());
    source.reset(saved);
    if (!is_nil) {
        read(source, pointee);
        return true;
    }
    if (try_read(source, pointee)) {
        return true;
    }
    (void)source.read_token();
    return false;
}

} // namespace detail

// ============================================================================
// Write implementations
// ============================================================================

// --- Scalars ---

template <Sink S, std::same_as<bool> T>
void write(S& sink, const T& value) {
    sink.write_bool(value);
}

template <Sink S, Integer T>
void write(S& sink, const T& value) {
    sink.write_int(integer_t(value));
}

template <Sink S, std::floating_point T>
void write(S& sink, const T& value) {
    if constexpr (std::is_same_v<T, float>) {
        sink.write_f32(value);
    } else {
        sink.write_f64(static_cast<double>(value));
    }
}

template <Sink S>
void write(S& sink, const std::string& value) {
    sink.write_str(detail::bytes_of(value));
}

// --- Value model ---

template <Sink S>
void write(S& sink, const nil_t&) {
    sink.write_nil();
}

template <Sink S>
void write(S& sink, const integer_t& value) {
    sink.write_int(value);
}

template <Sink S>
void write(S& sink, const str_t& value) {
    sink.write_str(value.data);
}

template <Sink S>
void write(S& sink, const bin_t& value) {
    sink.write_bin(value.data);
}

template <Sink S>
void write(S& sink, const ext_t& value) {
    sink.write_ext(value.type, value.data);
}

// Walks the tree with an explicit stack, so nesting depth is not limited by
// the call stack.
template <Sink S, std::same_as<value_t> T>
void write(S& sink, const T& value) {
    std::vector<const value_t*> stack{&value};
    while (!stack.empty()) {
        const auto* v = stack.back();
        stack.pop_back();
        if (const auto* array = v->as_array()) {
            sink.write_array(detail::checked_size(array->size(), "array"));
            for (auto it = array->rbegin(); it != array->rend(); ++it) {
                stack.push_back(&*it);
            }
        } else if (const auto* map = v->as_map()) {
            sink.write_map(detail::checked_size(map->size(), "map"));
            for (auto it = map->rbegin(); it != map->rend(); ++it) {
                stack.push_back(&it->second);
                stack.push_back(&it->first);
            }
        } else {
            std::visit([&sink](const auto& x) {
                using X = std::decay_t<decltype(x)>;
                if constexpr (!std::is_same_v<X, value_t::array_type> &&
                              !std::is_same_v<X, value_t::map_type>) {
                    write_token(sink, token_t(std::in_place_type<X>, x));
                }
            }, v->storage());
        }
    }
}

// --- Containers ---

// std::optional<T> - nil when empty, otherwise T's own encoding
template <Sink S, typename T>
void write(S& sink, const std::optional<T>& value) {
    if (value) {
        write(sink, *value);
    } else {
        sink.write_nil();
    }
}

template <Sink S, typename T>
void write(S& sink, const std::vector<T>& value) {
    sink.write_array(detail::checked_size(value.size(), "vector"));
    for (const auto& elem : value) {
        write(sink, elem);
    }
}

template <Sink S, typename T, std::size_t N>
void write(S& sink, const std::array<T, N>& value) {
    sink.write_array(detail::checked_size(N, "array"));
    for (const auto& elem : value) {
        write(sink, elem);
    }
}

// --- Owning pointers ---

template <Sink S, typename T>
void write(S& sink, const std::unique_ptr<T>& value) {
    if (value) {
        write(sink, *value);
    } else {
        sink.write_nil();
    }
}

template <Sink S, typename T>
void write(S& sink, const std::shared_ptr<T>& value) {
    if (value) {
        write(sink, *value);
    } else {
        sink.write_nil();
    }
}

// ============================================================================
// Read implementations
// ============================================================================

// --- Scalars ---

template <Source S, std::same_as<bool> T>
void read(S& source, T& value) {
    value = detail::expect<bool>(source.read_token(), "bool");
}

template <Source S, Integer T>
void read(S& source, T& value) {
    value = detail::expect<integer_t>(source.read_token(), "int").template as<T>();
}

template <Source S, std::floating_point T>
void read(S& source, T& value) {
    if constexpr (std::is_same_v<T, float>) {
        value = detail::expect<float>(source.read_token(), "f32");
    } else {
        value = static_cast<T>(detail::expect<double>(source.read_token(), "f64"));
    }
}

template <Source S>
void read(S& source, std::string& value) {
    str_t s;
    read(source, s);
    if (!s.is_utf8()) {
        throw validation_error(errc::invalid_utf8,
            "string of " + std::to_string(s.data.size()) + " bytes is not valid UTF-8");
    }
    value.assign(s.data.begin(), s.data.end());
}

// --- Value model ---

template <Source S>
void read(S& source, nil_t&) {
    detail::expect<nil_t>(source.read_token(), "nil");
}

template <Source S>
void read(S& source, integer_t& value) {
    value = detail::expect<integer_t>(source.read_token(), "int");
}

template <Source S>
void read(S& source, str_t& value) {
    value = detail::expect<str_t>(source.read_token(), "str");
}

template <Source S>
void read(S& source, bin_t& value) {
    value = detail::expect<bin_t>(source.read_token(), "bin");
}

template <Source S>
void read(S& source, ext_t& value) {
    value = detail::expect<ext_t>(source.read_token(), "ext");
}

// Skip one complete value. The pending count starts at one; each token
// settles one value and announces its children.
template <Source S>
void read(S& source, any_t&) {
    uint64_t pending = 1;
    while (pending > 0) {
        pending += child_count(source.read_token());
        pending -= 1;
    }
}

// Same pending-count walk as any_t, feeding every token into a value_sink.
template <Source S, std::same_as<value_t> T>
void read(S& source, T& value) {
    value_sink builder;
    uint64_t pending = 1;
    while (pending > 0) {
        auto token = source.read_token();
        pending += child_count(token);
        pending -= 1;
        write_token(builder, token);
    }
    value = builder.finish();
}

// --- Containers ---

// std::optional<T> - nil decodes to empty, anything else to T
template <Source S, typename T>
void read(S& source, std::optional<T>& value) {
    if (detail::next_is_nil(source)) {
        value.reset();
        return;
    }
    T temp{};
    read(source, temp);
    value = std::move(temp);
}

template <Source S, typename T>
void read(S& source, std::vector<T>& value) {
    auto len = detail::expect<array_header>(source.read_token(), "array").len;
    std::vector<T> out;
    out.reserve(std::min<std::size_t>(len, 4096));
    for (uint32_t i = 0; i < len; ++i) {
        T elem{};
        read(source, elem);
        out.push_back(std::move(elem));
    }
    value = std::move(out);
}

template <Source S, typename T, std::size_t N>
void read(S& source, std::array<T, N>& value) {
    auto len = detail::expect<array_header>(source.read_token(), "array").len;
    if (len != N) {
        throw validation_error(errc::invalid_length,
            "expected array of " + std::to_string(N) + ", found array(" + std::to_string(len) + ")");
    }
    std::array<T, N> out{};
    for (std::size_t i = 0; i < N; ++i) {
        read(source, out[i]);
    }
    value = std::move(out);
}

// --- Owning pointers ---

template <Source S, typename T>
void read(S& source, std::unique_ptr<T>& value) {
    auto temp = std::make_unique<T>();
    if (detail::read_pointee(source, *temp)) {
        value = std::move(temp);
    } else {
        value.reset();
    }
}

template <Source S, typename T>
void read(S& source, std::shared_ptr<T>& value) {
    auto temp = std::make_shared<T>();
    if (detail::read_pointee(source, *temp)) {
        value = std::move(temp);
    } else {
        value.reset();
    }
}

// ============================================================================
// Top-level codecs
// ============================================================================

enum class trailing_policy { ignore, reject };

struct decode_options {
    trailing_policy trailing_bytes = trailing_policy::ignore;
};

template <typename T>
void write_bytes(std::ostream& os, const T& value) {
    binary_sink sink(os);
    write(sink, value);
}

template <typename T>
auto to_bytes(const T& value) -> std::vector<uint8_t> {
    std::ostringstream oss;
    write_bytes(oss, value);
    auto s = oss.str();
    return std::vector<uint8_t>(s.begin(), s.end());
}

template <typename T>
auto from_bytes(std::span<const uint8_t> bytes, decode_options options = {}) -> T {
    binary_source source(bytes);
    T value{};
    read(source, value);
    if (options.trailing_bytes == trailing_policy::reject && !source.at_end()) {
        throw invalid_input_error(std::to_string(source.remaining()) +
                                  " trailing byte(s) after offset " +
                                  std::to_string(source.position()));
    }
    return value;
}

template <typename T>
auto to_value(const T& value) -> value_t {
    value_sink sink;
    write(sink, value);
    return sink.finish();
}

template <typename T>
auto from_value(const value_t& v) -> T {
    value_source source(v);
    T value{};
    read(source, value);
    return value;
}

} // namespace tagpack
