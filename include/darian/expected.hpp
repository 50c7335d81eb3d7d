#pragma once

// DARIAN Expected Type
//
// Exposes tl::expected in the darian namespace. Every fallible calendar
// operation returns expected<T, CalendarError>; the TartanLlama implementation
// gives the std::expected API (C++23) on a C++20 toolchain.
//
// Usage:
//   darian::expected<darian::Date, darian::CalendarError> d =
//       darian::Date::from_ymd(219, 13, 27);
//   if (d) {
//       use(d->to_ordinal());
//   } else {
//       report(darian::calendar_error_string(d.error()));
//   }
//
// Chaining:
//   Duration::from_hours(3).and_then([&](Duration h) { return dt + h; });

#include <tl/expected.hpp>

namespace darian {

using tl::expected;
using tl::make_unexpected;
using tl::unexpect;
using tl::unexpect_t;
using tl::unexpected;

} // namespace darian
