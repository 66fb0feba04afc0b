#pragma once

// integer_t: an integer ranging from -(2^63) to (2^64)-1.
//
// MessagePack has seven integer encodings (fixint, uint8..64, int8..64).
// integer_t is the single lossless carrier for all of them. It stores a sign
// flag and 64 raw bits:
//
//   sign == false   value is non-negative, read the bits as uint64_t
//   sign == true    value is negative, read the bits as int64_t
//
// Invariant: when sign is set, bit 63 of the raw value is set.

#include <concepts>
#include <cstdint>
#include <limits>
#include <ostream>
#include <string>
#include <type_traits>

#include "error.hpp"

namespace tagpack {

template <typename T>
concept Integer = std::integral<T> && !std::same_as<std::remove_cv_t<T>, bool>;

class integer_t {
public:
    constexpr integer_t() = default;

    template <Integer T>
    constexpr integer_t(T v) {
        if constexpr (std::is_signed_v<T>) {
            auto wide = static_cast<std::int64_t>(v);
            sign_ = wide < 0;
            value_ = static_cast<std::uint64_t>(wide);
        } else {
            sign_ = false;
            value_ = static_cast<std::uint64_t>(v);
        }
    }

    constexpr auto is_negative() const -> bool { return sign_; }

    // Raw 64 bits; two's complement when negative.
    constexpr auto bits() const -> std::uint64_t { return value_; }

    // Range-checked narrowing. Returns false and leaves `out` untouched when
    // the value does not fit in T.
    template <Integer T>
    constexpr auto try_into(T& out) const -> bool {
        if constexpr (std::is_signed_v<T>) {
            if (!sign_ && value_ > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return false;
            }
            auto wide = static_cast<std::int64_t>(value_);
            if (wide < static_cast<std::int64_t>(std::numeric_limits<T>::min()) ||
                wide > static_cast<std::int64_t>(std::numeric_limits<T>::max())) {
                return false;
            }
            out = static_cast<T>(wide);
            return true;
        } else {
            if (sign_) {
                return false;
            }
            if (value_ > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
                return false;
            }
            out = static_cast<T>(value_);
            return true;
        }
    }

    // Throwing narrowing; raises validation_error(integer_out_of_range).
    template <Integer T>
    auto as() const -> T {
        T out{};
        if (!try_into(out)) {
            throw validation_error(errc::integer_out_of_range,
                to_string() + " does not fit in a " + std::to_string(sizeof(T) * 8) + "-bit " +
                (std::is_signed_v<T> ? "signed" : "unsigned") + " integer");
        }
        return out;
    }

    auto to_string() const -> std::string {
        if (sign_) {
            return std::to_string(static_cast<std::int64_t>(value_));
        }
        return std::to_string(value_);
    }

    constexpr auto operator==(const integer_t&) const -> bool = default;

private:
    bool sign_ = false;
    std::uint64_t value_ = 0;
};

inline auto operator<<(std::ostream& os, const integer_t& v) -> std::ostream& {
    return os << v.to_string();
}

} // namespace tagpack
