#pragma once
// Core bindings: Duration, Date, calendar constants, state codec

#include <nanobind/nanobind.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>

#include <darian/date.hpp>
#include <darian/duration.hpp>
#include <darian/format.hpp>
#include <darian/state_codec.hpp>

#include "py_types.hpp"

#include <array>
#include <span>
#include <sstream>

namespace nb = nanobind;
using namespace nb::literals;

namespace darian_python {

namespace detail {

inline std::span<const uint8_t> as_span(const nb::bytes& data) {
    return {reinterpret_cast<const uint8_t*>(data.c_str()), data.size()};
}

template <std::size_t N>
nb::bytes to_bytes(const std::array<uint8_t, N>& state) {
    return nb::bytes(reinterpret_cast<const char*>(state.data()), state.size());
}

} // namespace detail

inline void bind_core(nb::module_& m) {
    using darian::Date;
    using darian::Duration;

    // Constants
    m.attr("MIN_YEAR") = darian::MIN_YEAR;
    m.attr("MAX_YEAR") = darian::MAX_YEAR;
    m.attr("MAX_ORDINAL") = darian::MAX_ORDINAL;
    m.attr("MAX_DURATION_SOLS") = darian::MAX_DURATION_SOLS;

    // =========================================================================
    // Duration
    // =========================================================================

    nb::class_<Duration>(m, "Duration",
                         "Martian time interval, normalized to (sols, seconds, microseconds)")
        .def(
            "__init__",
            [](Duration* self, nb::handle sols, nb::handle seconds, nb::handle microseconds,
               nb::handle milliseconds, nb::handle minutes, nb::handle hours,
               nb::handle weeks) {
                darian::DurationParts parts;
                parts.sols = to_quantity(sols);
                parts.seconds = to_quantity(seconds);
                parts.microseconds = to_quantity(microseconds);
                parts.milliseconds = to_quantity(milliseconds);
                parts.minutes = to_quantity(minutes);
                parts.hours = to_quantity(hours);
                parts.weeks = to_quantity(weeks);
                new (self) Duration(unwrap(Duration::from_parts(parts)));
            },
            "Build from any mix of units. Raises CalendarOverflowError if |sols| > 999999999.",
            "sols"_a = 0, "seconds"_a = 0, "microseconds"_a = 0, "milliseconds"_a = 0,
            "minutes"_a = 0, "hours"_a = 0, "weeks"_a = 0)
        .def_prop_ro_static("min", [](nb::handle) { return Duration::min(); })
        .def_prop_ro_static("max", [](nb::handle) { return Duration::max(); })
        .def_prop_ro_static("resolution", [](nb::handle) { return Duration::resolution(); })
        .def_prop_ro("sols", &Duration::sols, "Whole sols (carries the sign)")
        .def_prop_ro("seconds", &Duration::seconds, "Seconds in [0, 86400)")
        .def_prop_ro("microseconds", &Duration::microseconds, "Microseconds in [0, 1000000)")
        .def("total_seconds", &Duration::total_seconds, "Total length in seconds")
        // Arithmetic
        .def("__add__", [](const Duration& a, const Duration& b) { return unwrap(a + b); })
        .def("__sub__", [](const Duration& a, const Duration& b) { return unwrap(a - b); })
        .def("__neg__", [](const Duration& d) { return unwrap(-d); })
        .def("__pos__", [](const Duration& d) { return d; })
        .def("__abs__", [](const Duration& d) { return unwrap(d.abs()); })
        .def("__mul__", [](const Duration& d, int64_t k) { return unwrap(d * k); })
        .def("__mul__", [](const Duration& d, double k) { return unwrap(d * k); })
        .def("__rmul__", [](const Duration& d, int64_t k) { return unwrap(k * d); })
        .def("__rmul__", [](const Duration& d, double k) { return unwrap(k * d); })
        .def("__truediv__",
             [](const Duration& a, const Duration& b) { return unwrap(a / b); })
        .def("__truediv__", [](const Duration& d, int64_t k) { return unwrap(d / k); })
        .def("__truediv__", [](const Duration& d, double k) { return unwrap(d / k); })
        .def("__floordiv__",
             [](const Duration& a, const Duration& b) { return unwrap(a.floor_div(b)); })
        .def("__floordiv__", [](const Duration& d, int64_t k) { return unwrap(d.floor_div(k)); })
        .def("__mod__", [](const Duration& a, const Duration& b) { return unwrap(a % b); })
        .def("__divmod__",
             [](const Duration& a, const Duration& b) { return unwrap(a.divmod(b)); })
        // Comparison
        .def("__eq__", [](const Duration& a, const Duration& b) { return a == b; })
        .def("__lt__", [](const Duration& a, const Duration& b) { return a < b; })
        .def("__le__", [](const Duration& a, const Duration& b) { return a <= b; })
        .def("__gt__", [](const Duration& a, const Duration& b) { return a > b; })
        .def("__ge__", [](const Duration& a, const Duration& b) { return a >= b; })
        .def("__hash__", [](const Duration& d) { return d.hash(); })
        .def("__bool__", [](const Duration& d) { return !d.is_zero(); })
        .def("__str__", [](const Duration& d) { return darian::to_string(d); })
        // Pickle support through the compact state encoding
        .def("__getstate__",
             [](const Duration& d) { return detail::to_bytes(darian::encode_state(d)); })
        .def("__setstate__",
             [](Duration& d, const nb::bytes& state) {
                 new (&d) Duration(
                     unwrap(darian::decode_duration_state(detail::as_span(state))));
             })
        .def("__repr__", [](const Duration& d) {
            std::ostringstream oss;
            oss << "Duration(sols=" << d.sols() << ", seconds=" << d.seconds()
                << ", microseconds=" << d.microseconds() << ")";
            return oss.str();
        });

    // =========================================================================
    // Date
    // =========================================================================

    nb::class_<Date>(m, "Date", "Darian calendar date (year 0..9999, month 1..24)")
        .def(
            "__init__",
            [](Date* self, int64_t year, int64_t month, int64_t sol) {
                new (self) Date(unwrap(Date::from_ymd(year, month, sol)));
            },
            "Raises CalendarRangeError for invalid fields", "year"_a, "month"_a, "sol"_a)
        .def_static(
            "from_ordinal",
            [](int64_t ordinal) { return unwrap(Date::from_ordinal(ordinal)); },
            "Date of an ordinal (1 is 0000-01-01)", "ordinal"_a)
        .def_prop_ro_static("min", [](nb::handle) { return Date::min(); })
        .def_prop_ro_static("max", [](nb::handle) { return Date::max(); })
        .def_prop_ro_static("resolution", [](nb::handle) { return Date::resolution(); })
        .def_prop_ro("year", &Date::year)
        .def_prop_ro("month", &Date::month)
        .def_prop_ro("sol", &Date::sol)
        .def("to_ordinal", &Date::to_ordinal)
        .def("weekday", &Date::weekday, "Sol of the week in [0, 7)")
        .def("day_of_year", &Date::day_of_year, "1-based sol of the year")
        .def(
            "replace",
            [](const Date& d, std::optional<int64_t> year, std::optional<int64_t> month,
               std::optional<int64_t> sol) { return unwrap(d.replace(year, month, sol)); },
            "year"_a = nb::none(), "month"_a = nb::none(), "sol"_a = nb::none())
        .def("__add__",
             [](const Date& d, const Duration& delta) { return unwrap(d + delta); })
        .def("__radd__",
             [](const Date& d, const Duration& delta) { return unwrap(delta + d); })
        .def("__sub__",
             [](const Date& d, const Duration& delta) { return unwrap(d - delta); })
        .def("__sub__", [](const Date& a, const Date& b) { return a - b; })
        .def("__eq__", [](const Date& a, const Date& b) { return a == b; })
        .def("__lt__", [](const Date& a, const Date& b) { return a < b; })
        .def("__le__", [](const Date& a, const Date& b) { return a <= b; })
        .def("__gt__", [](const Date& a, const Date& b) { return a > b; })
        .def("__ge__", [](const Date& a, const Date& b) { return a >= b; })
        .def("__hash__", [](const Date& d) { return d.hash(); })
        .def("__str__", [](const Date& d) { return darian::to_string(d); })
        .def("__repr__", [](const Date& d) {
            std::ostringstream oss;
            oss << "Date(" << d.year() << ", " << d.month() << ", " << d.sol() << ")";
            return oss.str();
        })
        // Pickle support through the compact state encoding
        .def("__getstate__",
             [](const Date& d) { return detail::to_bytes(darian::encode_state(d)); })
        .def("__setstate__", [](Date& d, const nb::bytes& state) {
            new (&d) Date(unwrap(darian::decode_date_state(detail::as_span(state))));
        });
}

} // namespace darian_python
