#include <cassert>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include "tagpack/tagpack.hpp"

using namespace tagpack;

// =============================================================================
// Helpers
// =============================================================================

auto make_map(value_t::map_type entries) -> value_t {
    return value_t(std::move(entries));
}

auto make_array(value_t::array_type items) -> value_t {
    return value_t(std::move(items));
}

auto render(const value_t& v, int indent = 4) -> std::string {
    std::ostringstream oss;
    ascii_sink sink(oss, indent);
    write(sink, v);
    return oss.str();
}

// =============================================================================
// Tests
// =============================================================================

void test_kinds() {
    std::cout << "Testing kind predicates and accessors... ";

    assert(value_t().is_nil());
    assert(value_t(nil).get_kind() == value_t::kind::nil);
    assert(value_t(true).is_bool() && *value_t(true).as_bool());
    assert(value_t(5).is_int() && value_t(5).as_int()->as<int>() == 5);
    assert(value_t(1.5f).is_f32() && *value_t(1.5f).as_f32() == 1.5f);
    assert(value_t(2.5).is_f64() && *value_t(2.5).as_f64() == 2.5);
    assert(value_t("abc").is_str() && value_t("abc").as_str()->view() == "abc");
    assert(value_t(std::string("xyz")).as_str()->view() == "xyz");
    assert(value_t(bin_t{{1, 2}}).is_bin());
    assert(value_t(ext_t{3, {9}}).as_ext()->type == 3);
    assert(make_array({1, 2}).is_array());
    assert(make_map({}).is_map());

    // Wrong-kind accessors are empty
    assert(!value_t(5).as_bool());
    assert(value_t(5).as_str() == nullptr);
    assert(value_t(1.5f).as_f64() == std::nullopt);
    assert(value_t("5").as_int() == std::nullopt);

    assert(std::string(to_string(value_t::kind::map)) == "map");

    std::cout << "PASSED\n";
}

void test_indexing() {
    std::cout << "Testing indexing and lookup... ";

    auto arr = make_array({10, "x", nil});
    assert(arr[std::size_t{0}] == value_t(10));
    assert(arr[std::size_t{1}].as_str()->view() == "x");

    bool threw = false;
    try {
        (void)arr[std::size_t{3}];
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    auto map = make_map({{"a", 1}, {"b", 2}, {0, "int key"}});
    assert(map["a"] == value_t(1));
    assert(map["b"] == value_t(2));
    assert(map.find("c") == nullptr);
    assert(arr.find("a") == nullptr);

    threw = false;
    try {
        (void)map["c"];
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        (void)arr["a"];
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        (void)map[std::size_t{0}];
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_duplicate_keys() {
    std::cout << "Testing duplicate key preservation... ";

    auto map = make_map({{"k", 1}, {"other", true}, {"k", 2}});

    // Lookup resolves last-wins
    assert(map["k"] == value_t(2));

    // The entries themselves survive encode and decode in order
    auto decoded = from_bytes<value_t>(to_bytes(map));
    assert(decoded == map);
    assert(decoded.as_map()->size() == 3);
    assert((*decoded.as_map())[0].second == value_t(1));
    assert(decoded["k"] == value_t(2));

    // Wire: fixmap(3) a1 'k' 01 a5 'other' c3 a1 'k' 02
    auto bytes = to_bytes(map);
    assert(bytes.size() == 14);
    assert(bytes[0] == 0x83);
    assert(bytes[3] == 0x01);
    assert(bytes[10] == 0xc3);
    assert(bytes[13] == 0x02);

    std::cout << "PASSED\n";
}

void test_equality() {
    std::cout << "Testing structural equality... ";

    assert(value_t(1) == value_t(uint64_t{1}));
    assert(!(value_t(1) == value_t(1.0)));
    assert(!(value_t(1.0f) == value_t(1.0)));
    assert(!(value_t("a") == value_t(bin_t{{'a'}})));
    assert(make_map({{1, 2}, {3, 4}}) == make_map({{1, 2}, {3, 4}}));
    assert(!(make_map({{1, 2}, {3, 4}}) == make_map({{3, 4}, {1, 2}})));
    assert(!(make_array({1}) == make_array({1, 1})));

    std::cout << "PASSED\n";
}

void test_value_sink() {
    std::cout << "Testing value_sink construction... ";

    value_sink sink;
    sink.write_map(2);
    sink.write_int(0);
    sink.write_array(2);
    sink.write_nil();
    sink.write_array(0);
    sink.write_str(str_t("key").data);
    sink.write_bool(false);
    auto v = sink.finish();

    auto expected = make_map({
        {0, make_array({nil, make_array({})})},
        {"key", false},
    });
    assert(v == expected);

    // Incomplete stream
    value_sink partial;
    partial.write_array(2);
    partial.write_nil();
    bool threw = false;
    try {
        (void)partial.finish();
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    // Two top-level values
    value_sink twice;
    twice.write_nil();
    threw = false;
    try {
        twice.write_nil();
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    // Nothing written
    value_sink empty;
    threw = false;
    try {
        (void)empty.finish();
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_value_source() {
    std::cout << "Testing value_source traversal... ";

    auto v = make_map({{1, make_array({2, 3})}, {"x", nil}});
    value_source source(v);

    assert(std::get<map_header>(source.read_token()).len == 2);
    assert(std::get<integer_t>(source.read_token()) == integer_t(1));
    auto saved = source.mark();
    assert(std::get<array_header>(source.read_token()).len == 2);
    assert(std::get<integer_t>(source.read_token()) == integer_t(2));
    source.reset(saved);
    assert(std::get<array_header>(source.read_token()).len == 2);
    assert(std::get<integer_t>(source.read_token()) == integer_t(2));
    assert(std::get<integer_t>(source.read_token()) == integer_t(3));
    assert(std::get<str_t>(source.read_token()).view() == "x");
    assert(std::holds_alternative<nil_t>(source.read_token()));
    assert(source.at_end());

    bool threw = false;
    try {
        (void)source.read_token();
    } catch (const invalid_input_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_to_from_value() {
    std::cout << "Testing to_value / from_value... ";

    auto v = to_value(std::vector<int>{1, -2, 3});
    assert(v == make_array({1, -2, 3}));
    assert(from_value<std::vector<int>>(v) == (std::vector<int>{1, -2, 3}));

    auto opt = to_value(std::optional<std::string>{});
    assert(opt.is_nil());
    assert(!from_value<std::optional<std::string>>(opt));

    try {
        (void)from_value<std::string>(value_t(7));
        assert(false);
    } catch (const validation_error& e) {
        assert(e.code() == errc::invalid_type);
    }

    std::cout << "PASSED\n";
}

void test_deep_nesting() {
    std::cout << "Testing deeply nested arrays... ";

    // 5000 nested fixarray(1) headers around a nil
    std::vector<uint8_t> bytes(5000, 0x91);
    bytes.push_back(0xc0);

    auto v = from_bytes<value_t>(bytes);
    auto encoded = to_bytes(v);
    assert(encoded == bytes);

    any_t skipped;
    binary_source source(bytes);
    read(source, skipped);
    assert(source.at_end());

    std::cout << "PASSED\n";
}

void test_ascii_sink() {
    std::cout << "Testing ascii_sink rendering... ";

    assert(render(value_t(nil)) == "nil\n");
    assert(render(value_t(-7)) == "-7\n");
    assert(render(value_t(1.5)) == "1.5\n");
    assert(render(value_t(2.0)) == "2.0\n");
    assert(render(value_t(0.5f)) == "0.5f\n");
    assert(render(value_t("a\"b\n")) == "\"a\\\"b\\n\"\n");
    assert(render(value_t(str_t(std::vector<uint8_t>{'a', 0xff}))) == "\"a\\xff\"\n");
    assert(render(value_t(str_t("\xc3\xa9"))) == "\"\xc3\xa9\"\n");
    assert(render(value_t(bin_t{{0xde, 0xad}})) == "bin(dead)\n");
    assert(render(value_t(ext_t{-1, {0x01}})) == "ext(-1, 01)\n");
    assert(render(make_array({})) == "[]\n");

    auto v = make_map({
        {0, 42},
        {1, make_array({true, nil})},
        {"empty", make_map({})},
    });
    auto expected =
        "{\n"
        "  0: 42\n"
        "  1: [\n"
        "    true\n"
        "    nil\n"
        "  ]\n"
        "  \"empty\": {}\n"
        "}\n";
    assert(render(v, 2) == expected);

    std::cout << "PASSED\n";
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== Value Model ===\n\n";

    test_kinds();
    test_indexing();
    test_duplicate_keys();
    test_equality();

    std::cout << "\n=== Value Codec ===\n\n";

    test_value_sink();
    test_value_source();
    test_to_from_value();
    test_deep_nesting();

    std::cout << "\n=== ASCII Rendering ===\n\n";

    test_ascii_sink();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
