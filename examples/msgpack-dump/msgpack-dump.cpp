#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>
#include "tagpack/tagpack.hpp"

using namespace tagpack;

// =============================================================================
// Command line
// =============================================================================

struct options_t {
    int indent = 4;
    bool strict = false;
    std::string path;
};

void print_usage(std::ostream& os, const char* program) {
    os << "Usage: " << program << " [--indent N] [--strict] [file]\n"
       << "\n"
       << "Decode MessagePack values from a file (or standard input) and print\n"
       << "them as indented text.\n"
       << "\n"
       << "  --indent N   spaces per nesting level (default 4)\n"
       << "  --strict     the input must hold exactly one value\n";
}

auto parse_indent(const std::string& s) -> int {
    std::size_t end = 0;
    auto n = std::stoi(s, &end);
    if (end != s.size() || n < 0) {
        throw std::invalid_argument("invalid indent: " + s);
    }
    return n;
}

auto parse_args(int argc, char* argv[], options_t& opts) -> bool {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string(argv[i]);
        if (arg == "--indent") {
            if (i + 1 == argc) {
                return false;
            }
            try {
                opts.indent = parse_indent(argv[++i]);
            } catch (const std::logic_error&) {
                return false;
            }
        } else if (arg == "--strict") {
            opts.strict = true;
        } else if (!arg.empty() && arg[0] == '-') {
            return false;
        } else if (opts.path.empty()) {
            opts.path = arg;
        } else {
            return false;
        }
    }
    return true;
}

// =============================================================================
// Dump
// =============================================================================

auto read_all(std::istream& is) -> std::vector<uint8_t> {
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
}

void dump(const value_t& v, int indent) {
    ascii_sink sink(std::cout, indent);
    write(sink, v);
}

int main(int argc, char* argv[]) {
    if (argc == 2 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
        print_usage(std::cout, argv[0]);
        return 0;
    }

    options_t opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage(std::cerr, argv[0]);
        return 2;
    }

    std::vector<uint8_t> bytes;
    if (opts.path.empty()) {
        bytes = read_all(std::cin);
    } else {
        std::ifstream file(opts.path, std::ios::binary);
        if (!file) {
            std::cerr << "Error: cannot open file '" << opts.path << "'\n";
            return 1;
        }
        bytes = read_all(file);
    }

    try {
        if (opts.strict) {
            dump(from_bytes<value_t>(bytes, {trailing_policy::reject}), opts.indent);
        } else {
            binary_source source(bytes);
            while (!source.at_end()) {
                value_t v;
                read(source, v);
                dump(v, opts.indent);
            }
        }
    } catch (const error& e) {
        std::cerr << "Error decoding input: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
