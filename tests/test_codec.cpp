#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>
#include "tagpack/tagpack.hpp"

using namespace tagpack;

using bytes_t = std::vector<uint8_t>;

// =============================================================================
// Helpers
// =============================================================================

template <typename Emit>
auto encode(Emit emit) -> bytes_t {
    std::ostringstream oss;
    binary_sink sink(oss);
    emit(sink);
    auto s = oss.str();
    return bytes_t(s.begin(), s.end());
}

auto encode_int(integer_t v) -> bytes_t {
    return encode([&](binary_sink& s) { s.write_int(v); });
}

auto repeat(uint8_t byte, std::size_t n) -> bytes_t {
    return bytes_t(n, byte);
}

auto prefix(const bytes_t& bytes, std::size_t n) -> bytes_t {
    return bytes_t(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(n));
}

auto decode_one(const bytes_t& bytes) -> token_t {
    binary_source source(bytes);
    return source.read_token();
}

auto rejects_input(const bytes_t& bytes) -> bool {
    try {
        binary_source source(bytes);
        (void)source.read_token();
    } catch (const invalid_input_error& e) {
        return e.code() == errc::invalid_input;
    }
    return false;
}

// =============================================================================
// Writer: narrowest marker
// =============================================================================

void test_write_scalars() {
    std::cout << "Testing nil and bool markers... ";

    assert(encode([](binary_sink& s) { s.write_nil(); }) == bytes_t{0xc0});
    assert(encode([](binary_sink& s) { s.write_bool(false); }) == bytes_t{0xc2});
    assert(encode([](binary_sink& s) { s.write_bool(true); }) == bytes_t{0xc3});

    std::cout << "PASSED\n";
}

void test_write_ints() {
    std::cout << "Testing integer marker selection... ";

    assert(encode_int(0) == bytes_t{0x00});
    assert(encode_int(127) == bytes_t{0x7f});
    assert(encode_int(128) == (bytes_t{0xcc, 0x80}));
    assert(encode_int(255) == (bytes_t{0xcc, 0xff}));
    assert(encode_int(256) == (bytes_t{0xcd, 0x01, 0x00}));
    assert(encode_int(65535) == (bytes_t{0xcd, 0xff, 0xff}));
    assert(encode_int(65536) == (bytes_t{0xce, 0x00, 0x01, 0x00, 0x00}));
    assert(encode_int(uint64_t{0xffffffff}) == (bytes_t{0xce, 0xff, 0xff, 0xff, 0xff}));
    assert(encode_int(uint64_t{0x100000000}) ==
           (bytes_t{0xcf, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00}));
    assert(encode_int(std::numeric_limits<uint64_t>::max()) ==
           (bytes_t{0xcf, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff}));

    assert(encode_int(-1) == bytes_t{0xff});
    assert(encode_int(-32) == bytes_t{0xe0});
    assert(encode_int(-33) == (bytes_t{0xd0, 0xdf}));
    assert(encode_int(-128) == (bytes_t{0xd0, 0x80}));
    assert(encode_int(-129) == (bytes_t{0xd1, 0xff, 0x7f}));
    assert(encode_int(-32768) == (bytes_t{0xd1, 0x80, 0x00}));
    assert(encode_int(-32769) == (bytes_t{0xd2, 0xff, 0xff, 0x7f, 0xff}));
    assert(encode_int(std::numeric_limits<int32_t>::min()) == (bytes_t{0xd2, 0x80, 0x00, 0x00, 0x00}));
    assert(encode_int(int64_t{std::numeric_limits<int32_t>::min()} - 1) ==
           (bytes_t{0xd3, 0xff, 0xff, 0xff, 0xff, 0x7f, 0xff, 0xff, 0xff}));
    assert(encode_int(std::numeric_limits<int64_t>::min()) ==
           (bytes_t{0xd3, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}));

    // Marker depends on the value, not the native width
    assert(encode_int(int64_t{5}) == bytes_t{0x05});
    assert(encode_int(uint64_t{5}) == bytes_t{0x05});

    std::cout << "PASSED\n";
}

void test_write_floats() {
    std::cout << "Testing float encodings... ";

    assert(encode([](binary_sink& s) { s.write_f32(1.0f); }) == (bytes_t{0xca, 0x3f, 0x80, 0x00, 0x00}));
    assert(encode([](binary_sink& s) { s.write_f64(1.0); }) ==
           (bytes_t{0xcb, 0x3f, 0xf0, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}));
    assert(encode([](binary_sink& s) { s.write_f64(-2.5); }) ==
           (bytes_t{0xcb, 0xc0, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00}));

    std::cout << "PASSED\n";
}

void test_write_str_bin() {
    std::cout << "Testing str and bin length markers... ";

    auto str = [](std::size_t n) {
        auto data = repeat('a', n);
        return encode([&](binary_sink& s) { s.write_str(data); });
    };
    auto bin = [](std::size_t n) {
        auto data = repeat(0x00, n);
        return encode([&](binary_sink& s) { s.write_bin(data); });
    };

    assert(str(0) == bytes_t{0xa0});
    assert(prefix(str(31), 1) == bytes_t{0xbf});
    assert(prefix(str(32), 2) == (bytes_t{0xd9, 0x20}));
    assert(prefix(str(255), 2) == (bytes_t{0xd9, 0xff}));
    assert(prefix(str(256), 3) == (bytes_t{0xda, 0x01, 0x00}));
    assert(prefix(str(65536), 5) == (bytes_t{0xdb, 0x00, 0x01, 0x00, 0x00}));
    assert(str(65536).size() == 65541);

    assert(bin(0) == (bytes_t{0xc4, 0x00}));
    assert(prefix(bin(255), 2) == (bytes_t{0xc4, 0xff}));
    assert(prefix(bin(256), 3) == (bytes_t{0xc5, 0x01, 0x00}));
    assert(prefix(bin(65536), 5) == (bytes_t{0xc6, 0x00, 0x01, 0x00, 0x00}));

    auto hello = str_t("hello");
    assert(encode([&](binary_sink& s) { s.write_str(hello.data); }) ==
           (bytes_t{0xa5, 0x68, 0x65, 0x6c, 0x6c, 0x6f}));

    std::cout << "PASSED\n";
}

void test_write_headers() {
    std::cout << "Testing array and map headers... ";

    assert(encode([](binary_sink& s) { s.write_array(0); }) == bytes_t{0x90});
    assert(encode([](binary_sink& s) { s.write_array(15); }) == bytes_t{0x9f});
    assert(encode([](binary_sink& s) { s.write_array(16); }) == (bytes_t{0xdc, 0x00, 0x10}));
    assert(encode([](binary_sink& s) { s.write_array(65535); }) == (bytes_t{0xdc, 0xff, 0xff}));
    assert(encode([](binary_sink& s) { s.write_array(65536); }) == (bytes_t{0xdd, 0x00, 0x01, 0x00, 0x00}));

    assert(encode([](binary_sink& s) { s.write_map(0); }) == bytes_t{0x80});
    assert(encode([](binary_sink& s) { s.write_map(15); }) == bytes_t{0x8f});
    assert(encode([](binary_sink& s) { s.write_map(16); }) == (bytes_t{0xde, 0x00, 0x10}));
    assert(encode([](binary_sink& s) { s.write_map(70000); }) == (bytes_t{0xdf, 0x00, 0x01, 0x11, 0x70}));

    std::cout << "PASSED\n";
}

void test_write_ext() {
    std::cout << "Testing ext markers... ";

    auto ext = [](int8_t type, std::size_t n) {
        auto data = repeat(0xab, n);
        return encode([&](binary_sink& s) { s.write_ext(type, data); });
    };

    assert(ext(5, 1) == (bytes_t{0xd4, 0x05, 0xab}));
    assert(prefix(ext(5, 2), 2) == (bytes_t{0xd5, 0x05}));
    assert(prefix(ext(5, 4), 2) == (bytes_t{0xd6, 0x05}));
    assert(prefix(ext(5, 8), 2) == (bytes_t{0xd7, 0x05}));
    assert(prefix(ext(-1, 16), 2) == (bytes_t{0xd8, 0xff}));
    assert(ext(5, 0) == (bytes_t{0xc7, 0x00, 0x05}));
    assert(prefix(ext(5, 3), 3) == (bytes_t{0xc7, 0x03, 0x05}));
    assert(prefix(ext(5, 17), 3) == (bytes_t{0xc7, 0x11, 0x05}));
    assert(prefix(ext(5, 256), 4) == (bytes_t{0xc8, 0x01, 0x00, 0x05}));
    assert(prefix(ext(5, 65536), 6) == (bytes_t{0xc9, 0x00, 0x01, 0x00, 0x00, 0x05}));

    std::cout << "PASSED\n";
}

void test_write_failure() {
    std::cout << "Testing sink I/O failure... ";

    std::ostringstream oss;
    oss.setstate(std::ios::badbit);
    binary_sink sink(oss);
    bool threw = false;
    try {
        sink.write_nil();
    } catch (const std::ios_base::failure&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

// =============================================================================
// Reader
// =============================================================================

void test_read_every_marker() {
    std::cout << "Testing reader over every marker family... ";

    assert(std::holds_alternative<nil_t>(decode_one({0xc0})));
    assert(std::get<bool>(decode_one({0xc2})) == false);
    assert(std::get<bool>(decode_one({0xc3})) == true);
    assert(std::get<integer_t>(decode_one({0x7f})) == integer_t(127));
    assert(std::get<integer_t>(decode_one({0xe0})) == integer_t(-32));
    assert(std::get<integer_t>(decode_one({0xcc, 0xff})) == integer_t(255));
    assert(std::get<integer_t>(decode_one({0xcd, 0x12, 0x34})) == integer_t(0x1234));
    assert(std::get<integer_t>(decode_one({0xce, 0x12, 0x34, 0x56, 0x78})) == integer_t(0x12345678));
    assert(std::get<integer_t>(decode_one({0xcf, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff})) ==
           integer_t(std::numeric_limits<uint64_t>::max()));
    assert(std::get<integer_t>(decode_one({0xd0, 0x80})) == integer_t(-128));
    assert(std::get<integer_t>(decode_one({0xd1, 0xff, 0xfe})) == integer_t(-2));
    assert(std::get<integer_t>(decode_one({0xd2, 0xff, 0xff, 0xff, 0xfd})) == integer_t(-3));
    assert(std::get<integer_t>(decode_one({0xd3, 0x80, 0, 0, 0, 0, 0, 0, 0})) ==
           integer_t(std::numeric_limits<int64_t>::min()));

    // Non-canonical widths are accepted
    assert(std::get<integer_t>(decode_one({0xd3, 0, 0, 0, 0, 0, 0, 0, 0x01})) == integer_t(1));
    assert(std::get<integer_t>(decode_one({0xcc, 0x01})) == integer_t(1));

    assert(std::get<float>(decode_one({0xca, 0x3f, 0x80, 0x00, 0x00})) == 1.0f);
    assert(std::get<double>(decode_one({0xcb, 0x3f, 0xf0, 0, 0, 0, 0, 0, 0})) == 1.0);

    assert(std::get<str_t>(decode_one({0xa3, 'a', 'b', 'c'})).view() == "abc");
    assert(std::get<str_t>(decode_one({0xd9, 0x01, 'z'})).view() == "z");
    assert(std::get<str_t>(decode_one({0xda, 0x00, 0x01, 'z'})).view() == "z");
    assert(std::get<str_t>(decode_one({0xdb, 0x00, 0x00, 0x00, 0x00})).data.empty());
    assert(std::get<bin_t>(decode_one({0xc4, 0x02, 0x01, 0x02})).data == (bytes_t{1, 2}));
    assert(std::get<bin_t>(decode_one({0xc5, 0x00, 0x00})).data.empty());
    assert(std::get<bin_t>(decode_one({0xc6, 0x00, 0x00, 0x00, 0x01, 0x09})).data == bytes_t{9});

    assert(std::get<array_header>(decode_one({0x93})).len == 3);
    assert(std::get<array_header>(decode_one({0xdc, 0x01, 0x00})).len == 256);
    assert(std::get<array_header>(decode_one({0xdd, 0x00, 0x01, 0x00, 0x00})).len == 65536);
    assert(std::get<map_header>(decode_one({0x82})).len == 2);
    assert(std::get<map_header>(decode_one({0xde, 0x00, 0x20})).len == 32);
    assert(std::get<map_header>(decode_one({0xdf, 0x00, 0x00, 0x00, 0x00})).len == 0);

    auto e = std::get<ext_t>(decode_one({0xd4, 0x07, 0xaa}));
    assert(e.type == 7 && e.data == bytes_t{0xaa});
    assert(std::get<ext_t>(decode_one({0xd5, 0xfe, 1, 2})).type == -2);
    assert(std::get<ext_t>(decode_one({0xd6, 0x01, 1, 2, 3, 4})).data.size() == 4);
    assert(std::get<ext_t>(decode_one({0xd7, 0x01, 1, 2, 3, 4, 5, 6, 7, 8})).data.size() == 8);
    auto e16 = bytes_t{0xd8, 0x01};
    e16.resize(18, 0x55);
    assert(std::get<ext_t>(decode_one(e16)).data.size() == 16);
    assert(std::get<ext_t>(decode_one({0xc7, 0x01, 0x02, 0x03})).data == bytes_t{3});
    assert(std::get<ext_t>(decode_one({0xc8, 0x00, 0x00, 0x02})).type == 2);
    assert(std::get<ext_t>(decode_one({0xc9, 0x00, 0x00, 0x00, 0x00, 0x02})).data.empty());

    std::cout << "PASSED\n";
}

void test_read_invalid_input() {
    std::cout << "Testing invalid input detection... ";

    assert(rejects_input({}));
    assert(rejects_input({0xc1}));
    assert(rejects_input({0xcc}));
    assert(rejects_input({0xcd, 0x01}));
    assert(rejects_input({0xcb, 0, 0, 0}));
    assert(rejects_input({0xa5, 'h', 'e'}));
    assert(rejects_input({0xd9}));
    assert(rejects_input({0xda, 0x00, 0x05, 'x'}));
    assert(rejects_input({0xc6, 0xff, 0xff, 0xff, 0xff, 0x00}));
    assert(rejects_input({0xdc, 0x00}));
    assert(rejects_input({0xd4, 0x01}));
    assert(rejects_input({0xd8, 0x01, 0x00}));
    assert(rejects_input({0xc7, 0x02}));

    // A header alone is a complete token; its children are the caller's job
    assert(!rejects_input({0x95}));

    // Truncated composite fails when the caller asks for the missing child
    try {
        (void)from_bytes<value_t>(bytes_t{0x92, 0x01});
        assert(false);
    } catch (const invalid_input_error&) {
    }

    std::cout << "PASSED\n";
}

void test_reader_is_stateless() {
    std::cout << "Testing reader cursor and mark/reset... ";

    auto bytes = bytes_t{0x92, 0x01, 0xa1, 'x', 0xc0};
    binary_source source(bytes);
    assert(std::get<array_header>(source.read_token()).len == 2);
    auto saved = source.mark();
    assert(std::get<integer_t>(source.read_token()) == integer_t(1));
    assert(source.position() == 2);
    source.reset(saved);
    assert(source.position() == 1);
    assert(std::get<integer_t>(source.read_token()) == integer_t(1));
    assert(std::get<str_t>(source.read_token()).view() == "x");
    assert(source.remaining() == 1);
    assert(std::holds_alternative<nil_t>(source.read_token()));
    assert(source.at_end());

    std::cout << "PASSED\n";
}

void test_trailing_bytes() {
    std::cout << "Testing trailing byte policy... ";

    auto bytes = bytes_t{0x01, 0x02};
    assert(from_bytes<int>(bytes) == 1);

    try {
        (void)from_bytes<int>(bytes, decode_options{trailing_policy::reject});
        assert(false);
    } catch (const invalid_input_error& e) {
        assert(e.code() == errc::invalid_input);
    }
    assert(from_bytes<int>(bytes_t{0x01}, decode_options{trailing_policy::reject}) == 1);

    std::cout << "PASSED\n";
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== Binary Writer ===\n\n";

    test_write_scalars();
    test_write_ints();
    test_write_floats();
    test_write_str_bin();
    test_write_headers();
    test_write_ext();
    test_write_failure();

    std::cout << "\n=== Binary Reader ===\n\n";

    test_read_every_marker();
    test_read_invalid_input();
    test_reader_is_stateless();
    test_trailing_bytes();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
