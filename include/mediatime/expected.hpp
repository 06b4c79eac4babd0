#pragma once

// MEDIATIME Expected Type
//
// Exposes tl::expected in the mediatime namespace for typed conversion failures.
// The API matches std::expected (C++23); the TartanLlama implementation keeps
// the library on C++20.
//
// Usage:
//   mediatime::expected<uint32_t, ConversionError> field = span.to_u32();
//   if (field.has_value()) {
//       write_u32(*field);
//   } else {
//       report(field.error().message());
//   }

#include <tl/expected.hpp>

namespace mediatime {

using tl::expected;
using tl::make_unexpected;
using tl::unexpect;
using tl::unexpect_t;
using tl::unexpected;

} // namespace mediatime
