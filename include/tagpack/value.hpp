#pragma once

// The MessagePack data model.
//
// value_t is a recursive tagged union over the ten object kinds. Maps are an
// ordered list of key/value pairs, not a dictionary: duplicate keys are kept
// as separate entries in their wire order. Only the convenience lookups
// (operator[] and find with a string key) resolve duplicates, and they do it
// last-wins.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "int.hpp"

namespace tagpack {

namespace detail {

// Length of the well-formed UTF-8 sequence starting at data[pos], or 0 if the
// bytes there are not one (overlong forms and surrogates included).
inline auto utf8_sequence_length(const std::vector<std::uint8_t>& data, std::size_t pos) -> std::size_t {
    auto n = data.size() - pos;
    auto b0 = data[pos];
    auto cont = [&](std::size_t i, std::uint8_t lo = 0x80, std::uint8_t hi = 0xbf) {
        return i < n && data[pos + i] >= lo && data[pos + i] <= hi;
    };
    if (b0 < 0x80) return 1;
    if (b0 >= 0xc2 && b0 <= 0xdf) return cont(1) ? 2 : 0;
    if (b0 == 0xe0) return cont(1, 0xa0) && cont(2) ? 3 : 0;
    if (b0 == 0xed) return cont(1, 0x80, 0x9f) && cont(2) ? 3 : 0;
    if (b0 >= 0xe1 && b0 <= 0xef) return cont(1) && cont(2) ? 3 : 0;
    if (b0 == 0xf0) return cont(1, 0x90) && cont(2) && cont(3) ? 4 : 0;
    if (b0 >= 0xf1 && b0 <= 0xf3) return cont(1) && cont(2) && cont(3) ? 4 : 0;
    if (b0 == 0xf4) return cont(1, 0x80, 0x8f) && cont(2) && cont(3) ? 4 : 0;
    return 0;
}

} // namespace detail

struct nil_t {
    constexpr auto operator==(const nil_t&) const -> bool = default;
};

inline constexpr nil_t nil{};

// A string object. The wire format allows arbitrary bytes here; UTF-8 is only
// checked when decoding into std::string.
struct str_t {
    std::vector<std::uint8_t> data;

    str_t() = default;
    explicit str_t(std::vector<std::uint8_t> bytes) : data(std::move(bytes)) {}
    str_t(std::string_view s) : data(s.begin(), s.end()) {}
    str_t(const char* s) : str_t(std::string_view(s)) {}

    auto view() const -> std::string_view {
        return {reinterpret_cast<const char*>(data.data()), data.size()};
    }

    auto is_utf8() const -> bool {
        for (std::size_t pos = 0; pos < data.size();) {
            auto n = detail::utf8_sequence_length(data, pos);
            if (n == 0) return false;
            pos += n;
        }
        return true;
    }

    auto operator==(const str_t&) const -> bool = default;
};

struct bin_t {
    std::vector<std::uint8_t> data;

    auto operator==(const bin_t&) const -> bool = default;
};

struct ext_t {
    std::int8_t type = 0;
    std::vector<std::uint8_t> data;

    auto operator==(const ext_t&) const -> bool = default;
};

class value_t {
public:
    using array_type = std::vector<value_t>;
    using map_type = std::vector<std::pair<value_t, value_t>>;

    // Alternative order matches the kind enumeration below.
    using storage_type = std::variant<
        nil_t, bool, integer_t, float, double, str_t, bin_t, array_type, map_type, ext_t>;

    enum class kind : std::uint8_t { nil, boolean, integer, f32, f64, str, bin, array, map, ext };

    value_t() = default;
    value_t(nil_t) {}
    value_t(bool v) : data_(v) {}
    value_t(integer_t v) : data_(v) {}
    template <Integer T>
    value_t(T v) : data_(integer_t(v)) {}
    value_t(float v) : data_(v) {}
    value_t(double v) : data_(v) {}
    value_t(str_t v) : data_(std::move(v)) {}
    value_t(const char* v) : data_(str_t(v)) {}
    value_t(const std::string& v) : data_(str_t(std::string_view(v))) {}
    value_t(bin_t v) : data_(std::move(v)) {}
    value_t(ext_t v) : data_(std::move(v)) {}
    value_t(array_type v) : data_(std::move(v)) {}
    value_t(map_type v) : data_(std::move(v)) {}

    auto get_kind() const -> kind { return static_cast<kind>(data_.index()); }
    auto storage() const -> const storage_type& { return data_; }

    // --- Kind predicates ---

    auto is_nil() const -> bool { return get_kind() == kind::nil; }
    auto is_bool() const -> bool { return get_kind() == kind::boolean; }
    auto is_int() const -> bool { return get_kind() == kind::integer; }
    auto is_f32() const -> bool { return get_kind() == kind::f32; }
    auto is_f64() const -> bool { return get_kind() == kind::f64; }
    auto is_str() const -> bool { return get_kind() == kind::str; }
    auto is_bin() const -> bool { return get_kind() == kind::bin; }
    auto is_array() const -> bool { return get_kind() == kind::array; }
    auto is_map() const -> bool { return get_kind() == kind::map; }
    auto is_ext() const -> bool { return get_kind() == kind::ext; }

    // --- Checked accessors ---

    auto as_bool() const -> std::optional<bool> { return get_opt<bool>(); }
    auto as_int() const -> std::optional<integer_t> { return get_opt<integer_t>(); }
    auto as_f32() const -> std::optional<float> { return get_opt<float>(); }
    auto as_f64() const -> std::optional<double> { return get_opt<double>(); }

    auto as_str() const -> const str_t* { return std::get_if<str_t>(&data_); }
    auto as_str() -> str_t* { return std::get_if<str_t>(&data_); }
    auto as_bin() const -> const bin_t* { return std::get_if<bin_t>(&data_); }
    auto as_bin() -> bin_t* { return std::get_if<bin_t>(&data_); }
    auto as_array() const -> const array_type* { return std::get_if<array_type>(&data_); }
    auto as_array() -> array_type* { return std::get_if<array_type>(&data_); }
    auto as_map() const -> const map_type* { return std::get_if<map_type>(&data_); }
    auto as_map() -> map_type* { return std::get_if<map_type>(&data_); }
    auto as_ext() const -> const ext_t* { return std::get_if<ext_t>(&data_); }
    auto as_ext() -> ext_t* { return std::get_if<ext_t>(&data_); }

    // --- Convenience lookup ---

    // Map lookup by string key. When the key occurs more than once the last
    // entry wins. Returns nullptr if this is not a map or the key is absent.
    auto find(std::string_view key) const -> const value_t* {
        const auto* map = as_map();
        if (!map) return nullptr;
        for (auto it = map->rbegin(); it != map->rend(); ++it) {
            const auto* k = it->first.as_str();
            if (k && k->view() == key) {
                return &it->second;
            }
        }
        return nullptr;
    }

    auto operator[](std::string_view key) const -> const value_t& {
        if (!is_map()) {
            throw std::out_of_range("value is not indexable by string");
        }
        const auto* v = find(key);
        if (!v) {
            throw std::out_of_range("key not found: " + std::string(key));
        }
        return *v;
    }

    auto operator[](std::size_t index) const -> const value_t& {
        const auto* array = as_array();
        if (!array) {
            throw std::out_of_range("value is not indexable by position");
        }
        if (index >= array->size()) {
            throw std::out_of_range(
                "index " + std::to_string(index) + " out of range for array of " +
                std::to_string(array->size()));
        }
        return (*array)[index];
    }

    friend auto operator==(const value_t& a, const value_t& b) -> bool {
        return a.data_ == b.data_;
    }

private:
    storage_type data_;

    template <typename T>
    auto get_opt() const -> std::optional<T> {
        if (const auto* p = std::get_if<T>(&data_)) return *p;
        return std::nullopt;
    }
};

inline const char* to_string(value_t::kind k) {
    switch (k) {
        case value_t::kind::nil: return "nil";
        case value_t::kind::boolean: return "bool";
        case value_t::kind::integer: return "int";
        case value_t::kind::f32: return "f32";
        case value_t::kind::f64: return "f64";
        case value_t::kind::str: return "str";
        case value_t::kind::bin: return "bin";
        case value_t::kind::array: return "array";
        case value_t::kind::map: return "map";
        case value_t::kind::ext: return "ext";
    }
    return "unknown";
}

} // namespace tagpack
