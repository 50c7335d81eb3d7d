#pragma once
// Date-time bindings: OffsetProvider, FixedOffset, DateTime, Earth/Mars conversion

#include <nanobind/nanobind.h>
#include <nanobind/stl/chrono.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/shared_ptr.h>
#include <nanobind/stl/string.h>
#include <nanobind/trampoline.h>

#include <darian/convert.hpp>
#include <darian/datetime.hpp>
#include <darian/format.hpp>
#include <darian/state_codec.hpp>
#include <darian/timezone.hpp>

#include "core_bindings.hpp"
#include "py_types.hpp"

#include <chrono>
#include <compare>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

namespace nb = nanobind;
using namespace nb::literals;

namespace darian_python {

/**
 * @brief Forwards OffsetProvider queries to a Python subclass
 *
 * Subclasses answer mtc_offset, dst and name; from_mtc always runs the
 * default two-step localization on top of those answers.
 */
struct PyOffsetProvider : darian::OffsetProvider {
    NB_TRAMPOLINE(darian::OffsetProvider, 3);

    std::optional<darian::Duration> mtc_offset(const darian::DateTime* dt) const override {
        NB_OVERRIDE_PURE(mtc_offset, dt);
    }

    std::optional<darian::Duration> dst(const darian::DateTime* dt) const override {
        NB_OVERRIDE_PURE(dst, dt);
    }

    std::optional<std::string> name(const darian::DateTime* dt) const override {
        NB_OVERRIDE_PURE(name, dt);
    }
};

inline void bind_datetime(nb::module_& m) {
    using darian::Date;
    using darian::DateTime;
    using darian::Duration;
    using darian::FixedOffset;
    using darian::OffsetProvider;

    // =========================================================================
    // OffsetProvider (abstract) and FixedOffset
    // =========================================================================

    nb::class_<OffsetProvider, PyOffsetProvider>(
        m, "OffsetProvider",
        "Source of offsets from MTC; subclass and define mtc_offset, dst and name")
        .def(nb::init<>())
        .def(
            "mtc_offset",
            [](const OffsetProvider& p, const DateTime* dt) { return p.mtc_offset(dt); },
            "dt"_a = nb::none())
        .def(
            "dst", [](const OffsetProvider& p, const DateTime* dt) { return p.dst(dt); },
            "dt"_a = nb::none())
        .def(
            "name", [](const OffsetProvider& p, const DateTime* dt) { return p.name(dt); },
            "dt"_a = nb::none())
        .def(
            "from_mtc",
            [](const OffsetProvider& p, const DateTime& dt) { return unwrap(p.from_mtc(dt)); },
            "Localize an MTC date-time that carries this provider", "dt"_a);

    nb::class_<FixedOffset, OffsetProvider>(m, "FixedOffset",
                                            "Provider with a constant offset from MTC")
        .def(nb::new_([](const Duration& offset, std::optional<std::string> name) {
                 return std::const_pointer_cast<FixedOffset>(
                     unwrap(FixedOffset::create(offset, std::move(name))));
             }),
             "Raises CalendarRangeError unless -24h < offset < 24h", "offset"_a,
             "name"_a = nb::none())
        .def_prop_ro_static("mtc",
                            [](nb::handle) {
                                return std::const_pointer_cast<FixedOffset>(FixedOffset::mtc());
                            })
        .def_prop_ro_static("min",
                            [](nb::handle) {
                                return std::const_pointer_cast<FixedOffset>(FixedOffset::min());
                            })
        .def_prop_ro_static("max",
                            [](nb::handle) {
                                return std::const_pointer_cast<FixedOffset>(FixedOffset::max());
                            })
        .def_prop_ro("offset", &FixedOffset::offset)
        .def("__eq__", [](const FixedOffset& a, const FixedOffset& b) { return a == b; })
        .def("__hash__", [](const FixedOffset& tz) { return tz.hash(); })
        .def("__str__", &FixedOffset::display_name)
        .def("__repr__", [](const FixedOffset& tz) {
            std::ostringstream oss;
            oss << "FixedOffset(" << darian::detail::format_offset(tz.offset()) << ", '"
                << tz.display_name() << "')";
            return oss.str();
        });

    // =========================================================================
    // DateTime
    // =========================================================================

    nb::class_<DateTime>(m, "DateTime", "Darian date plus wall clock, naive or offset-aware")
        .def(
            "__init__",
            [](DateTime* self, int64_t year, int64_t month, int64_t sol, int64_t hour,
               int64_t minute, int64_t second, int64_t microsecond, PyProvider tzinfo,
               int64_t fold) {
                new (self) DateTime(unwrap(DateTime::from_fields(
                    year, month, sol, hour, minute, second, microsecond, std::move(tzinfo),
                    fold)));
            },
            "Raises CalendarRangeError for invalid fields", "year"_a, "month"_a, "sol"_a,
            "hour"_a = 0, "minute"_a = 0, "second"_a = 0, "microsecond"_a = 0,
            "tzinfo"_a = nb::none(), "fold"_a = 0)
        .def_static(
            "combine",
            [](const Date& date, int64_t hour, int64_t minute, int64_t second,
               int64_t microsecond, PyProvider tzinfo) {
                return unwrap(DateTime::from_fields(date.year(), date.month(), date.sol(), hour,
                                                    minute, second, microsecond,
                                                    std::move(tzinfo)));
            },
            "date"_a, "hour"_a = 0, "minute"_a = 0, "second"_a = 0, "microsecond"_a = 0,
            "tzinfo"_a = nb::none())
        .def_prop_ro_static("min", [](nb::handle) { return DateTime::min(); })
        .def_prop_ro_static("max", [](nb::handle) { return DateTime::max(); })
        .def_prop_ro_static("resolution", [](nb::handle) { return DateTime::resolution(); })
        .def_prop_ro("year", &DateTime::year)
        .def_prop_ro("month", &DateTime::month)
        .def_prop_ro("sol", &DateTime::sol)
        .def_prop_ro("hour", &DateTime::hour)
        .def_prop_ro("minute", &DateTime::minute)
        .def_prop_ro("second", &DateTime::second)
        .def_prop_ro("microsecond", &DateTime::microsecond)
        .def_prop_ro("fold", &DateTime::fold)
        .def_prop_ro("tzinfo", [](const DateTime& dt) { return to_py(dt.provider()); })
        .def("date", &DateTime::date)
        .def("to_ordinal", &DateTime::to_ordinal)
        .def("weekday", &DateTime::weekday)
        .def("day_of_year", &DateTime::day_of_year)
        .def(
            "replace_tzinfo",
            [](const DateTime& dt, PyProvider tzinfo) {
                return dt.with_provider(std::move(tzinfo));
            },
            "Same fields, different provider (no conversion)", "tzinfo"_a = nb::none())
        .def(
            "replace_fold", [](const DateTime& dt, bool fold) { return dt.with_fold(fold); },
            "fold"_a)
        .def("mtc_offset", [](const DateTime& dt) { return unwrap(dt.mtc_offset()); })
        .def("dst", [](const DateTime& dt) { return unwrap(dt.dst()); })
        .def("tzname", &DateTime::zone_name)
        .def(
            "astimezone",
            [](const DateTime& dt, PyProvider tz) {
                if (!tz) {
                    return unwrap(dt.astimezone());
                }
                return unwrap(dt.astimezone(tz));
            },
            "Same instant in another provider (MTC by default)", "tz"_a = nb::none())
        // Arithmetic
        .def("__add__",
             [](const DateTime& dt, const Duration& delta) { return unwrap(dt + delta); })
        .def("__radd__",
             [](const DateTime& dt, const Duration& delta) { return unwrap(delta + dt); })
        .def("__sub__",
             [](const DateTime& dt, const Duration& delta) { return unwrap(dt - delta); })
        .def("__sub__", [](const DateTime& a, const DateTime& b) { return unwrap(a - b); })
        // Comparison; equality never raises for naive/aware mixes
        .def("__eq__", [](const DateTime& a, const DateTime& b) { return unwrap(a.equals(b)); })
        .def("__lt__",
             [](const DateTime& a, const DateTime& b) { return unwrap(a.compare(b)) < 0; })
        .def("__le__",
             [](const DateTime& a, const DateTime& b) { return unwrap(a.compare(b)) <= 0; })
        .def("__gt__",
             [](const DateTime& a, const DateTime& b) { return unwrap(a.compare(b)) > 0; })
        .def("__ge__",
             [](const DateTime& a, const DateTime& b) { return unwrap(a.compare(b)) >= 0; })
        .def("__hash__", [](const DateTime& dt) { return unwrap(dt.hash()); })
        .def("__str__", [](const DateTime& dt) { return unwrap(darian::to_string(dt)); })
        .def("__repr__",
             [](const DateTime& dt) {
                 std::ostringstream oss;
                 oss << "DateTime(" << dt.year() << ", " << dt.month() << ", " << dt.sol()
                     << ", " << dt.hour() << ", " << dt.minute() << ", " << dt.second() << ", "
                     << dt.microsecond();
                 if (auto name = dt.zone_name()) {
                     oss << ", tzinfo=" << *name;
                 }
                 if (dt.fold() != 0) {
                     oss << ", fold=1";
                 }
                 oss << ")";
                 return oss.str();
             })
        // Pickle keeps the fields; the provider is re-attached only for FixedOffset::mtc
        .def("__getstate__",
             [](const DateTime& dt) {
                 bool is_mtc = dt.provider() == darian::OffsetProviderPtr(FixedOffset::mtc());
                 return nb::make_tuple(detail::to_bytes(darian::encode_state(dt)), is_mtc);
             })
        .def("__setstate__", [](DateTime& dt, const nb::tuple& state) {
            auto bytes = nb::cast<nb::bytes>(state[0]);
            darian::OffsetProviderPtr provider;
            if (nb::cast<bool>(state[1])) {
                provider = FixedOffset::mtc();
            }
            new (&dt) DateTime(
                unwrap(darian::decode_datetime_state(detail::as_span(bytes), provider)));
        });

    // =========================================================================
    // Earth/Mars conversion
    // =========================================================================

    m.def(
        "datetime_from_posix",
        [](double timestamp, PyProvider tz) {
            return unwrap(darian::datetime_from_posix(timestamp, tz));
        },
        "Martian date-time of a POSIX timestamp (None for a naive MTC value)", "timestamp"_a,
        "tz"_a = std::const_pointer_cast<FixedOffset>(FixedOffset::mtc()));
    m.def(
        "date_from_posix",
        [](double timestamp) { return unwrap(darian::date_from_posix(timestamp)); },
        "MTC date of a POSIX timestamp", "timestamp"_a);
    m.def(
        "to_posix", [](const DateTime& dt) { return unwrap(darian::to_posix(dt)); },
        "POSIX timestamp of an offset-aware date-time", "dt"_a);
    m.def(
        "earth_to_mars",
        [](std::chrono::microseconds interval) {
            return unwrap(darian::earth_to_mars(interval));
        },
        "Martian Duration of a datetime.timedelta", "interval"_a);
    m.def(
        "mars_to_earth",
        [](const Duration& interval) { return unwrap(darian::mars_to_earth(interval)); },
        "datetime.timedelta of a Martian Duration", "interval"_a);
}

} // namespace darian_python
