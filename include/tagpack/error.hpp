#pragma once

// Error taxonomy for the tagpack codec.
//
// Two tiers:
//   invalid_input_error  - malformed or truncated bytes; always fatal
//   validation_error     - well-formed input of the wrong shape; recoverable
//                          only inside untagged enum trial decoding
//
// schema_error is raised when a type declaration itself is inconsistent.

#include <cstdint>
#include <stdexcept>
#include <string>

namespace tagpack {

enum class errc : std::uint8_t {
    invalid_input,
    invalid_type,
    invalid_length,
    duplicated_field,
    missing_field,
    unknown_variant,
    integer_out_of_range,
    invalid_utf8,
};

inline const char* to_string(errc code) {
    switch (code) {
        case errc::invalid_input: return "invalid input";
        case errc::invalid_type: return "invalid type";
        case errc::invalid_length: return "invalid length";
        case errc::duplicated_field: return "duplicated field";
        case errc::missing_field: return "missing field";
        case errc::unknown_variant: return "unknown variant";
        case errc::integer_out_of_range: return "integer out of range";
        case errc::invalid_utf8: return "invalid utf-8";
    }
    return "unknown";
}

class error : public std::runtime_error {
public:
    error(errc code, const std::string& what)
        : std::runtime_error(std::string(to_string(code)) + ": " + what), code_(code) {}

    auto code() const noexcept -> errc { return code_; }

private:
    errc code_;
};

class invalid_input_error : public error {
public:
    explicit invalid_input_error(const std::string& what)
        : error(errc::invalid_input, what) {}
};

class validation_error : public error {
public:
    validation_error(errc code, const std::string& what)
        : error(code, what) {}
};

class schema_error : public std::logic_error {
public:
    explicit schema_error(const std::string& what)
        : std::logic_error("invalid schema: " + what) {}
};

} // namespace tagpack
