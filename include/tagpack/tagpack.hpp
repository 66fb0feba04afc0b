#pragma once

// ============================================================================
// tagpack - C++20 MessagePack codec with integer-tagged schemas
// ============================================================================
//
// A concept-based MessagePack library with:
// - Byte-exact encoding, always choosing the narrowest marker
// - Integer tags instead of string keys for struct fields
// - Optional, flatten and untagged layouts
// - A lossless in-memory value_t model with a 65-bit integer
// - Human-readable rendering via ascii_sink
//
// Basic usage:
//
//   #include "tagpack/tagpack.hpp"
//
//   struct person {
//       uint32_t age = 0;
//       std::optional<std::string> name;
//   };
//
//   // ADL free functions (const for writing, mutable for reading)
//   auto fields(const person& p) {
//       return std::make_tuple(
//           tagpack::field("age", 0, p.age),
//           tagpack::optional_field("name", 1, p.name)
//       );
//   }
//   auto fields(person& p) {
//       return std::make_tuple(
//           tagpack::field("age", 0, p.age),
//           tagpack::optional_field("name", 1, p.name)
//       );
//   }
//
//   // Encode: map {0: 42, 1: "hello"} -> 82 00 2a 01 a5 68 65 6c 6c 6f
//   auto bytes = tagpack::to_bytes(person{42, "hello"});
//
//   // Decode
//   auto p = tagpack::from_bytes<person>(bytes);
//
//   // Inspect any input without a schema
//   auto v = tagpack::from_bytes<tagpack::value_t>(bytes);
//   tagpack::ascii_sink text(std::cout);
//   tagpack::write(text, v);
//
// Errors:
//   invalid_input_error   malformed or truncated bytes
//   validation_error      well-formed input of the wrong shape (errc code)
//   schema_error          inconsistent type declaration
//
// ============================================================================

#include "concepts.hpp"
#include "error.hpp"
#include "format.hpp"
#include "int.hpp"
#include "protocol.hpp"
#include "schema.hpp"
#include "sink.hpp"
#include "source.hpp"
#include "token.hpp"
#include "value.hpp"
