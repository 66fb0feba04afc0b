#pragma once

// Schema declarations and the structural shapes built on them.
//
// A type opts into a shape by providing one ADL function:
//
//   fields(T&)           tagged struct: map of tag -> value
//   untagged_fields(T&)  untagged struct: array in declaration order
//   elements(T&)         tuple struct: array, positional
//   inner(T&)            newtype struct: transparent
//   case_of(Alt&)        alternative of a std::variant enum
//   enum_values(std::type_identity<E>)  unit-only C++ enum
//
// Any of them may also provide type_name(std::type_identity<T>) to name the
// type in error messages.
//
// Every typed declaration is lowered to a plain type_decl record and checked
// by validate() the first time the type is encoded or decoded.

#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

#include "protocol.hpp"

namespace tagpack {

// ============================================================================
// Declaration records
// ============================================================================

struct attributes {
    std::optional<uint32_t> tag;
    bool optional = false;
    bool flatten = false;
    bool untagged = false;
};

struct member_decl {
    std::string name;
    attributes attrs;
    std::vector<uint32_t> spliced_tags;  // flatten only: tags the inner type contributes
};

struct variant_decl {
    std::string name;
    attributes attrs;
    std::vector<member_decl> fields;
};

enum class type_kind { named_struct, tuple_struct, unit_struct, enumeration };

enum class shape {
    tagged_struct,
    untagged_struct,
    newtype_struct,
    tuple_struct,
    tagged_enum,
    untagged_enum,
};

struct type_decl {
    std::string name;
    type_kind kind = type_kind::named_struct;
    attributes attrs;
    std::vector<member_decl> members;
    std::vector<variant_decl> variants;
};

// ============================================================================
// Validation
// ============================================================================

namespace detail {

inline void disallow_tag(const attributes& a, const std::string& where) {
    if (a.tag) throw schema_error("tag is not allowed on " + where);
}

inline void disallow_optional(const attributes& a, const std::string& where) {
    if (a.optional) throw schema_error("optional is not allowed on " + where);
}

inline void disallow_flatten(const attributes& a, const std::string& where) {
    if (a.flatten) throw schema_error("flatten is not allowed on " + where);
}

inline void disallow_untagged(const attributes& a, const std::string& where) {
    if (a.untagged) throw schema_error("untagged is not allowed on " + where);
}

inline void disallow_all(const attributes& a, const std::string& where) {
    disallow_tag(a, where);
    disallow_optional(a, where);
    disallow_untagged(a, where);
    disallow_flatten(a, where);
}

inline void require_tag(const attributes& a, const std::string& where) {
    if (!a.tag) throw schema_error("tag is required on " + where);
}

inline void check_tag_uniqueness(uint32_t tag, std::vector<uint32_t>& seen, const std::string& where) {
    for (auto t : seen) {
        if (t == tag) {
            throw schema_error("tag " + std::to_string(tag) + " is used more than once (" + where + ")");
        }
    }
    seen.push_back(tag);
}

inline void validate_tagged_struct(const type_decl& decl) {
    std::vector<uint32_t> seen;
    for (const auto& m : decl.members) {
        auto where = "field '" + m.name + "' of " + decl.name;
        disallow_untagged(m.attrs, where);
        if (m.attrs.flatten) {
            disallow_tag(m.attrs, where);
            disallow_optional(m.attrs, where);
            for (auto t : m.spliced_tags) {
                check_tag_uniqueness(t, seen, where);
            }
        } else {
            require_tag(m.attrs, where);
            check_tag_uniqueness(*m.attrs.tag, seen, where);
        }
    }
}

inline void validate_enum(const type_decl& decl) {
    std::vector<uint32_t> seen;
    for (const auto& v : decl.variants) {
        auto where = "variant '" + v.name + "' of " + decl.name;
        disallow_optional(v.attrs, where);
        disallow_untagged(v.attrs, where);
        disallow_flatten(v.attrs, where);
        if (decl.attrs.untagged) {
            disallow_tag(v.attrs, where);
            if (v.fields.size() != 1) {
                throw schema_error(where + " must have exactly one field, found " +
                                   std::to_string(v.fields.size()));
            }
        } else {
            require_tag(v.attrs, where);
            check_tag_uniqueness(*v.attrs.tag, seen, where);
            if (v.fields.size() > 1) {
                throw schema_error(where + " has " + std::to_string(v.fields.size()) +
                                   " fields; at most one is supported");
            }
        }
        for (const auto& f : v.fields) {
            disallow_all(f.attrs, "payload of " + where);
        }
    }
}

} // namespace detail

// Throws schema_error describing the first rule the declaration breaks.
inline void validate(const type_decl& decl) {
    auto where = "type " + decl.name;
    detail::disallow_tag(decl.attrs, where);
    detail::disallow_optional(decl.attrs, where);
    detail::disallow_flatten(decl.attrs, where);

    switch (decl.kind) {
        case type_kind::named_struct:
            if (decl.attrs.untagged) {
                for (const auto& m : decl.members) {
                    detail::disallow_all(m.attrs, "field '" + m.name + "' of untagged " + decl.name);
                }
            } else {
                detail::validate_tagged_struct(decl);
            }
            break;
        case type_kind::tuple_struct:
            detail::disallow_untagged(decl.attrs, where);
            if (decl.members.empty()) {
                throw schema_error("empty tuple structs are not supported (" + decl.name + ")");
            }
            for (const auto& m : decl.members) {
                detail::disallow_all(m.attrs, "element " + m.name + " of " + decl.name);
            }
            break;
        case type_kind::unit_struct:
            detail::disallow_untagged(decl.attrs, where);
            throw schema_error("unit structs are not supported (" + decl.name + ")");
        case type_kind::enumeration:
            detail::validate_enum(decl);
            break;
    }
}

inline auto shape_of(const type_decl& decl) -> shape {
    switch (decl.kind) {
        case type_kind::named_struct:
            return decl.attrs.untagged ? shape::untagged_struct : shape::tagged_struct;
        case type_kind::tuple_struct:
            return decl.members.size() == 1 ? shape::newtype_struct : shape::tuple_struct;
        case type_kind::enumeration:
            return decl.attrs.untagged ? shape::untagged_enum : shape::tagged_enum;
        case type_kind::unit_struct:
            break;
    }
    throw schema_error("unit structs are not supported (" + decl.name + ")");
}

// Every map key a tagged struct may emit, flatten members included.
inline auto tags_of(const type_decl& decl) -> std::vector<uint32_t> {
    std::vector<uint32_t> tags;
    for (const auto& m : decl.members) {
        if (m.attrs.tag) {
            tags.push_back(*m.attrs.tag);
        }
        tags.insert(tags.end(), m.spliced_tags.begin(), m.spliced_tags.end());
    }
    return tags;
}

// ============================================================================
// Typed declaration helpers
// ============================================================================

template <typename T>
struct field_ref {
    const char* name;
    uint32_t tag;
    T& value;
};

template <typename T>
struct optional_field_ref {
    const char* name;
    uint32_t tag;
    T& value;
};

template <typename T>
struct flatten_ref {
    const char* name;
    T& value;
};

template <typename T>
struct element_ref {
    const char* name;
    T& value;
};

template <typename T>
struct tagged_case_ref {
    const char* name;
    uint32_t tag;
    T& value;
};

struct unit_case_ref {
    const char* name;
    uint32_t tag;
};

template <typename T>
struct untagged_case_ref {
    const char* name;
    T& value;
};

template <typename T>
constexpr auto field(const char* name, uint32_t tag, T& value) {
    return field_ref<T>{name, tag, value};
}

// An optional field is omitted from the map when empty. T is std::optional
// or an owning pointer.
template <typename T>
constexpr auto optional_field(const char* name, uint32_t tag, T& value) {
    return optional_field_ref<T>{name, tag, value};
}

template <typename T>
constexpr auto flatten(const char* name, T& value) {
    return flatten_ref<T>{name, value};
}

template <typename T>
constexpr auto element(T& value) {
    return element_ref<T>{"", value};
}

template <typename T>
constexpr auto element(const char* name, T& value) {
    return element_ref<T>{name, value};
}

template <typename T>
constexpr auto tagged_case(const char* name, uint32_t tag, T& value) {
    return tagged_case_ref<T>{name, tag, value};
}

constexpr auto unit_case(const char* name, uint32_t tag) {
    return unit_case_ref{name, tag};
}

template <typename T>
constexpr auto untagged_case(const char* name, T& value) {
    return untagged_case_ref<T>{name, value};
}

// ============================================================================
// Shape concepts - require ADL free functions
// ============================================================================

template <typename T>
concept HasFields = requires(T& t) {
    { fields(t) };
};

template <typename T>
concept HasUntaggedFields = requires(T& t) {
    { untagged_fields(t) };
};

template <typename T>
concept HasElements = requires(T& t) {
    { elements(t) };
};

template <typename T>
concept HasInner = requires(T& t) {
    { inner(t) };
};

template <typename T>
concept HasCase = requires(T& t) {
    { case_of(t) };
};

template <typename E>
concept HasEnumValues = std::is_enum_v<E> && requires {
    { enum_values(std::type_identity<E>{}) };
};

template <typename T>
concept HasTypeName = requires {
    { type_name(std::type_identity<T>{}) } -> std::convertible_to<std::string>;
};

template <typename T>
struct is_schema_variant : std::false_type {};

template <typename... Ts>
    requires (HasCase<Ts> && ...)
struct is_schema_variant<std::variant<Ts...>> : std::true_type {};

template <typename T>
concept SchemaVariant = is_schema_variant<T>::value;

template <typename T>
concept Schema = HasFields<T> || HasUntaggedFields<T> || HasElements<T> || HasInner<T> ||
                 SchemaVariant<T> || HasEnumValues<T>;

// ============================================================================
// Lowering typed declarations to records
// ============================================================================

template <Schema T>
auto schema_of() -> const type_decl&;

namespace detail {

template <typename T>
auto lower_member(const field_ref<T>& f) -> member_decl {
    return {f.name, attributes{f.tag}, {}};
}

template <typename T>
auto lower_member(const optional_field_ref<T>& f) -> member_decl {
    return {f.name, attributes{f.tag, true}, {}};
}

template <typename T>
auto lower_member(const flatten_ref<T>& f) -> member_decl {
    static_assert(HasFields<std::remove_cv_t<T>>, "flatten requires a tagged struct");
    return {f.name, attributes{std::nullopt, false, true},
            tags_of(schema_of<std::remove_cv_t<T>>())};
}

template <typename T>
auto lower_member(const element_ref<T>& e) -> member_decl {
    return {e.name, attributes{}, {}};
}

template <typename Tuple>
void lower_members(type_decl& decl, const Tuple& members) {
    std::apply([&decl](const auto&... m) {
        (decl.members.push_back(lower_member(m)), ...);
    }, members);
    for (std::size_t i = 0; i < decl.members.size(); ++i) {
        if (decl.members[i].name.empty()) {
            decl.members[i].name = std::to_string(i);
        }
    }
}

template <typename T>
void lower_case(type_decl& decl, const tagged_case_ref<T>& c) {
    decl.variants.push_back({c.name, attributes{c.tag}, {member_decl{"0", {}, {}}}});
}

inline void lower_case(type_decl& decl, const unit_case_ref& c) {
    decl.variants.push_back({c.name, attributes{c.tag}, {}});
}

template <typename T>
void lower_case(type_decl& decl, const untagged_case_ref<T>& c) {
    decl.attrs.untagged = true;
    decl.variants.push_back({c.name, attributes{}, {member_decl{"0", {}, {}}}});
}

template <typename Alt>
void lower_alternative(type_decl& decl) {
    Alt alt{};
    lower_case(decl, case_of(alt));
}

template <typename... Ts>
void lower_cases(type_decl& decl, std::type_identity<std::variant<Ts...>>) {
    (lower_alternative<Ts>(decl), ...);
}

template <typename E>
void lower_enum_values(type_decl& decl) {
    using U = std::underlying_type_t<E>;
    for (auto e : enum_values(std::type_identity<E>{})) {
        auto raw = integer_t(static_cast<U>(e));
        uint32_t tag = 0;
        if (!raw.try_into(tag)) {
            throw schema_error("enum value " + raw.to_string() + " of " + decl.name +
                               " is not a valid tag");
        }
        decl.variants.push_back({"value " + raw.to_string(), attributes{tag}, {}});
    }
}

template <typename T>
auto lower() -> type_decl {
    type_decl decl;
    if constexpr (HasTypeName<T>) {
        decl.name = type_name(std::type_identity<T>{});
    } else {
        decl.name = typeid(T).name();
    }

    if constexpr (SchemaVariant<T>) {
        decl.kind = type_kind::enumeration;
        lower_cases(decl, std::type_identity<T>{});
    } else if constexpr (HasEnumValues<T>) {
        decl.kind = type_kind::enumeration;
        lower_enum_values<T>(decl);
    } else {
        T probe{};
        if constexpr (HasFields<T>) {
            decl.kind = type_kind::named_struct;
            lower_members(decl, fields(probe));
        } else if constexpr (HasUntaggedFields<T>) {
            decl.kind = type_kind::named_struct;
            decl.attrs.untagged = true;
            lower_members(decl, untagged_fields(probe));
        } else if constexpr (HasElements<T>) {
            decl.kind = type_kind::tuple_struct;
            lower_members(decl, elements(probe));
        } else {
            decl.kind = type_kind::tuple_struct;
            lower_members(decl, std::make_tuple(inner(probe)));
        }
    }
    return decl;
}

} // namespace detail

// Lowered and validated declaration of T. Validation runs on first use and
// is retried (and fails again) on every later use of an invalid type.
template <Schema T>
auto schema_of() -> const type_decl& {
    static const type_decl decl = [] {
        auto d = detail::lower<T>();
        validate(d);
        return d;
    }();
    return decl;
}

// ============================================================================
// Shape declarations
// ============================================================================

template <Sink S, typename T>
    requires HasFields<T>
void write(S& sink, const T& value);

template <Sink S, typename T>
    requires HasUntaggedFields<T>
void write(S& sink, const T& value);

template <Sink S, typename T>
    requires HasElements<T>
void write(S& sink, const T& value);

template <Sink S, typename T>
    requires HasInner<T>
void write(S& sink, const T& value);

template <Sink S, typename T>
    requires SchemaVariant<T>
void write(S& sink, const T& value);

template <Sink S, typename E>
    requires HasEnumValues<E>
void write(S& sink, const E& value);

template <Source S, typename T>
    requires HasFields<T>
void read(S& source, T& value);

template <Source S, typename T>
    requires HasUntaggedFields<T>
void read(S& source, T& value);

template <Source S, typename T>
    requires HasElements<T>
void read(S& source, T& value);

template <Source S, typename T>
    requires HasInner<T>
void read(S& source, T& value);

template <Source S, typename T>
    requires SchemaVariant<T>
void read(S& source, T& value);

template <Source S, typename E>
    requires HasEnumValues<E>
void read(S& source, E& value);

// ============================================================================
// Tagged struct
// ============================================================================

namespace detail {

template <typename T>
auto count_entries(const T& value) -> uint32_t;

template <typename T>
auto entry_count(const field_ref<T>&) -> uint32_t { return 1; }

template <typename T>
auto entry_count(const optional_field_ref<T>& f) -> uint32_t { return f.value ? 1 : 0; }

template <typename T>
auto entry_count(const flatten_ref<T>& f) -> uint32_t { return count_entries(f.value); }

// Map length: required fields plus present optional ones, flatten members
// contributing their own count.
template <typename T>
auto count_entries(const T& value) -> uint32_t {
    return std::apply([](const auto&... f) {
        return (uint32_t{0} + ... + entry_count(f));
    }, fields(value));
}

template <Sink S, typename T>
void write_entries(S& sink, const T& value);

template <Sink S, typename T>
void write_entry(S& sink, const field_ref<T>& f) {
    sink.write_int(integer_t(f.tag));
    write(sink, f.value);
}

template <Sink S, typename T>
void write_entry(S& sink, const optional_field_ref<T>& f) {
    if (f.value) {
        sink.write_int(integer_t(f.tag));
        write(sink, *f.value);
    }
}

template <Sink S, typename T>
void write_entry(S& sink, const flatten_ref<T>& f) {
    write_entries(sink, f.value);
}

template <Sink S, typename T>
void write_entries(S& sink, const T& value) {
    std::apply([&sink](const auto&... f) {
        (write_entry(sink, f), ...);
    }, fields(value));
}

// --- Decoding ---
//
// Every tagged slot, flatten members included, gets an index in declaration
// order. `filled` records which slots have been decoded.

template <typename T>
auto slot_count(T& value) -> std::size_t;

template <typename T>
auto slots_of(const field_ref<T>&) -> std::size_t { return 1; }

template <typename T>
auto slots_of(const optional_field_ref<T>&) -> std::size_t { return 1; }

template <typename T>
auto slots_of(const flatten_ref<T>& f) -> std::size_t { return slot_count(f.value); }

template <typename T>
auto slot_count(T& value) -> std::size_t {
    return std::apply([](const auto&... f) {
        return (std::size_t{0} + ... + slots_of(f));
    }, fields(value));
}

template <Source S, typename T>
auto read_entry(S& source, T& value, uint32_t tag, std::vector<bool>& filled,
                std::size_t& index, const std::string& type) -> bool;

template <Source S, typename F>
auto read_slot(S& source, F& f, uint32_t tag, std::vector<bool>& filled,
               std::size_t& index, const std::string& type) -> bool {
    auto slot = index++;
    if (f.tag != tag) {
        return false;
    }
    if (filled[slot]) {
        throw validation_error(errc::duplicated_field,
            type + ": field '" + f.name + "' (tag " + std::to_string(tag) + ") appears more than once");
    }
    read(source, f.value);
    filled[slot] = true;
    return true;
}

template <Source S, typename T>
auto match_entry(S& source, const field_ref<T>& f, uint32_t tag, std::vector<bool>& filled,
                 std::size_t& index, const std::string& type) -> bool {
    return read_slot(source, f, tag, filled, index, type);
}

template <Source S, typename T>
auto match_entry(S& source, const optional_field_ref<T>& f, uint32_t tag, std::vector<bool>& filled,
                 std::size_t& index, const std::string& type) -> bool {
    return read_slot(source, f, tag, filled, index, type);
}

template <Source S, typename T>
auto match_entry(S& source, const flatten_ref<T>& f, uint32_t tag, std::vector<bool>& filled,
                 std::size_t& index, const std::string& type) -> bool {
    return read_entry(source, f.value, tag, filled, index, type);
}

// Decode the value for `tag` into the slot declaring it. Returns false when
// no slot declares the tag.
template <Source S, typename T>
auto read_entry(S& source, T& value, uint32_t tag, std::vector<bool>& filled,
                std::size_t& index, const std::string& type) -> bool {
    bool matched = false;
    std::apply([&](const auto&... f) {
        ((matched = matched || match_entry(source, f, tag, filled, index, type)), ...);
    }, fields(value));
    return matched;
}

template <typename T>
void finish_entries(T& value, const std::vector<bool>& filled, std::size_t& index,
                    const std::string& type);

template <typename T>
void finish_entry(const field_ref<T>& f, const std::vector<bool>& filled, std::size_t& index,
                  const std::string& type) {
    if (!filled[index++]) {
        throw validation_error(errc::missing_field,
            type + ": required field '" + f.name + "' (tag " + std::to_string(f.tag) + ") is missing");
    }
}

template <typename T>
void finish_entry(const optional_field_ref<T>& f, const std::vector<bool>& filled, std::size_t& index,
                  const std::string&) {
    if (!filled[index++]) {
        f.value.reset();
    }
}

template <typename T>
void finish_entry(const flatten_ref<T>& f, const std::vector<bool>& filled, std::size_t& index,
                  const std::string& type) {
    finish_entries(f.value, filled, index, type);
}

template <typename T>
void finish_entries(T& value, const std::vector<bool>& filled, std::size_t& index,
                    const std::string& type) {
    std::apply([&](const auto&... f) {
        (finish_entry(f, filled, index, type), ...);
    }, fields(value));
}

} // namespace detail

template <Sink S, typename T>
    requires HasFields<T>
void write(S& sink, const T& value) {
    schema_of<T>();
    sink.write_map(detail::count_entries(value));
    detail::write_entries(sink, value);
}

// Unknown tags are skipped. A tag seen twice is an error even when the first
// occurrence was accepted.
template <Source S, typename T>
    requires HasFields<T>
void read(S& source, T& value) {
    const auto& decl = schema_of<T>();
    auto len = detail::expect<map_header>(source.read_token(), "map").len;
    T temp{};
    std::vector<bool> filled(detail::slot_count(temp), false);

    for (uint32_t i = 0; i < len; ++i) {
        uint32_t tag = 0;
        read(source, tag);
        std::size_t index = 0;
        if (!detail::read_entry(source, temp, tag, filled, index, decl.name)) {
            any_t skipped;
            read(source, skipped);
        }
    }
    std::size_t index = 0;
    detail::finish_entries(temp, filled, index, decl.name);
    value = std::move(temp);
}

// ============================================================================
// Untagged struct and tuple struct - positional arrays
// ============================================================================

namespace detail {

template <Sink S, typename Tuple>
void write_positional(S& sink, const Tuple& members) {
    sink.write_array(static_cast<uint32_t>(std::tuple_size_v<Tuple>));
    std::apply([&sink](const auto&... e) {
        (write(sink, e.value), ...);
    }, members);
}

template <Source S, typename Tuple>
void read_positional(S& source, const Tuple& members, const std::string& type) {
    constexpr auto count = std::tuple_size_v<Tuple>;
    auto len = expect<array_header>(source.read_token(), "array").len;
    if (len != count) {
        throw validation_error(errc::invalid_length,
            type + ": expected array(" + std::to_string(count) + "), found array(" +
            std::to_string(len) + ")");
    }
    std::apply([&source](const auto&... e) {
        (read(source, e.value), ...);
    }, members);
}

} // namespace detail

template <Sink S, typename T>
    requires HasUntaggedFields<T>
void write(S& sink, const T& value) {
    schema_of<T>();
    detail::write_positional(sink, untagged_fields(value));
}

template <Source S, typename T>
    requires HasUntaggedFields<T>
void read(S& source, T& value) {
    const auto& decl = schema_of<T>();
    T temp{};
    detail::read_positional(source, untagged_fields(temp), decl.name);
    value = std::move(temp);
}

// A single element is a newtype and encodes transparently.
template <Sink S, typename T>
    requires HasElements<T>
void write(S& sink, const T& value) {
    schema_of<T>();
    auto members = elements(value);
    if constexpr (std::tuple_size_v<decltype(members)> == 1) {
        write(sink, std::get<0>(members).value);
    } else {
        detail::write_positional(sink, members);
    }
}

template <Source S, typename T>
    requires HasElements<T>
void read(S& source, T& value) {
    const auto& decl = schema_of<T>();
    T temp{};
    auto members = elements(temp);
    if constexpr (std::tuple_size_v<decltype(members)> == 1) {
        read(source, std::get<0>(members).value);
    } else {
        detail::read_positional(source, members, decl.name);
    }
    value = std::move(temp);
}

// ============================================================================
// Newtype struct
// ============================================================================

template <Sink S, typename T>
    requires HasInner<T>
void write(S& sink, const T& value) {
    schema_of<T>();
    write(sink, inner(value).value);
}

template <Source S, typename T>
    requires HasInner<T>
void read(S& source, T& value) {
    schema_of<T>();
    T temp{};
    read(source, inner(temp).value);
    value = std::move(temp);
}

// ============================================================================
// Enums - std::variant alternatives with case_of()
// ============================================================================

namespace detail {

template <Sink S, typename T>
void write_case(S& sink, const tagged_case_ref<T>& c) {
    sink.write_array(2);
    sink.write_int(integer_t(c.tag));
    write(sink, c.value);
}

template <Sink S>
void write_case(S& sink, const unit_case_ref& c) {
    sink.write_int(integer_t(c.tag));
}

template <Sink S, typename T>
void write_case(S& sink, const untagged_case_ref<T>& c) {
    write(sink, c.value);
}

template <Source S, typename T>
void read_case(S& source, const tagged_case_ref<T>& c) {
    read(source, c.value);
}

template <Source S>
void read_case(S&, const unit_case_ref&) {}

template <Source S, typename T>
void read_case(S& source, const untagged_case_ref<T>& c) {
    read(source, c.value);
}

// Index of the variant declaring `tag`.
inline auto find_variant(const type_decl& decl, const integer_t& tag) -> std::size_t {
    uint32_t t = 0;
    if (tag.try_into(t)) {
        for (std::size_t i = 0; i < decl.variants.size(); ++i) {
            if (decl.variants[i].attrs.tag == t) {
                return i;
            }
        }
    }
    throw validation_error(errc::unknown_variant,
        decl.name + ": no variant has tag " + tag.to_string());
}

template <std::size_t I, Source S, typename V>
void read_alternative(S& source, V& value) {
    std::variant_alternative_t<I, V> alt{};
    read_case(source, case_of(alt));
    value.template emplace<I>(std::move(alt));
}

template <Source S, typename V, std::size_t... Is>
void read_alternative_by_index(S& source, V& value, std::size_t index, std::index_sequence<Is...>) {
    ((Is == index ? (read_alternative<Is>(source, value), true) : false) || ...);
}

template <std::size_t I, Source S, typename V>
auto try_alternative(S& source, V& value) -> bool {
    auto saved = source.mark();
    std::variant_alternative_t<I, V> alt{};
    try {
        read_case(source, case_of(alt));
    } catch (const validation_error&) {
        source.reset(saved);
        return false;
    }
    value.template emplace<I>(std::move(alt));
    return true;
}

template <Source S, typename V, std::size_t... Is>
auto try_alternatives(S& source, V& value, std::index_sequence<Is...>) -> bool {
    return (try_alternative<Is>(source, value) || ...);
}

// Unit variant: bare int. Payload variant: array(2) of [tag, payload].
template <Source S, typename V>
void read_tagged_enum(S& source, V& value, const type_decl& decl) {
    constexpr auto indices = std::make_index_sequence<std::variant_size_v<V>>{};
    auto token = source.read_token();

    if (const auto* tag = std::get_if<integer_t>(&token)) {
        auto index = find_variant(decl, *tag);
        if (!decl.variants[index].fields.empty()) {
            throw validation_error(errc::invalid_type,
                decl.name + ": variant '" + decl.variants[index].name +
                "' carries a payload, expected array(2)");
        }
        read_alternative_by_index(source, value, index, indices);
        return;
    }
    if (const auto* array = std::get_if<array_header>(&token)) {
        if (array->len != 2) {
            throw validation_error(errc::invalid_type,
                decl.name + ": expected array(2), found array(" + std::to_string(array->len) + ")");
        }
        auto tag = expect<integer_t>(source.read_token(), "int");
        auto index = find_variant(decl, tag);
        if (decl.variants[index].fields.empty()) {
            throw validation_error(errc::invalid_type,
                decl.name + ": unit variant '" + decl.variants[index].name +
                "' cannot carry a payload");
        }
        read_alternative_by_index(source, value, index, indices);
        return;
    }
    throw_invalid_type("int or array(2)", token);
}

// Alternatives are tried in declaration order; the first that decodes wins.
template <Source S, typename V>
void read_untagged_enum(S& source, V& value, const type_decl& decl) {
    constexpr auto indices = std::make_index_sequence<std::variant_size_v<V>>{};
    if (!try_alternatives(source, value, indices)) {
        throw validation_error(errc::unknown_variant,
            decl.name + ": input matches none of " + std::to_string(decl.variants.size()) +
            " untagged variants");
    }
}

} // namespace detail

template <Sink S, typename T>
    requires SchemaVariant<T>
void write(S& sink, const T& value) {
    schema_of<T>();
    std::visit([&sink](const auto& alt) {
        detail::write_case(sink, case_of(alt));
    }, value);
}

template <Source S, typename T>
    requires SchemaVariant<T>
void read(S& source, T& value) {
    const auto& decl = schema_of<T>();
    if (decl.attrs.untagged) {
        detail::read_untagged_enum(source, value, decl);
    } else {
        detail::read_tagged_enum(source, value, decl);
    }
}

// ============================================================================
// Unit-only C++ enums
// ============================================================================

template <Sink S, typename E>
    requires HasEnumValues<E>
void write(S& sink, const E& value) {
    schema_of<E>();
    sink.write_int(integer_t(static_cast<std::underlying_type_t<E>>(value)));
}

template <Source S, typename E>
    requires HasEnumValues<E>
void read(S& source, E& value) {
    const auto& decl = schema_of<E>();
    auto tag = detail::expect<integer_t>(source.read_token(), "int");
    auto index = detail::find_variant(decl, tag);
    value = static_cast<E>(static_cast<std::underlying_type_t<E>>(*decl.variants[index].attrs.tag));
}

} // namespace tagpack
