#pragma once
// Error bindings: ErrorCategory, CalendarError and the exception hierarchy

#include <nanobind/nanobind.h>

#include <darian/error.hpp>

#include "py_types.hpp"

#include <stdexcept>
#include <string>

namespace nb = nanobind;
using namespace nb::literals;

namespace darian_python {

inline void bind_errors(nb::module_& m) {
    // =========================================================================
    // ErrorCategory enum
    // =========================================================================

    nb::enum_<darian::ErrorCategory>(m, "ErrorCategory", "Kinds of calendar failures")
        .value("range", darian::ErrorCategory::range,
               "A field lies outside its statically valid domain")
        .value("overflow", darian::ErrorCategory::overflow,
               "A derived ordinal or sol count left the supported range")
        .value("type_mismatch", darian::ErrorCategory::type_mismatch,
               "Naive and offset-aware values were mixed")
        .value("consistency", darian::ErrorCategory::consistency,
               "An offset provider returned contradictory or absent data");

    // =========================================================================
    // CalendarError enum
    // =========================================================================

    using darian::CalendarError;
    nb::enum_<CalendarError>(m, "CalendarError", "Specific calendar error codes")
        .value("year_out_of_range", CalendarError::year_out_of_range)
        .value("month_out_of_range", CalendarError::month_out_of_range)
        .value("sol_out_of_range", CalendarError::sol_out_of_range)
        .value("hour_out_of_range", CalendarError::hour_out_of_range)
        .value("minute_out_of_range", CalendarError::minute_out_of_range)
        .value("second_out_of_range", CalendarError::second_out_of_range)
        .value("microsecond_out_of_range", CalendarError::microsecond_out_of_range)
        .value("fold_out_of_range", CalendarError::fold_out_of_range)
        .value("offset_out_of_range", CalendarError::offset_out_of_range)
        .value("non_finite_value", CalendarError::non_finite_value)
        .value("division_by_zero", CalendarError::division_by_zero)
        .value("duration_overflow", CalendarError::duration_overflow)
        .value("ordinal_out_of_range", CalendarError::ordinal_out_of_range)
        .value("date_overflow", CalendarError::date_overflow)
        .value("naive_aware_mismatch", CalendarError::naive_aware_mismatch)
        .value("naive_conversion", CalendarError::naive_conversion)
        .value("missing_provider", CalendarError::missing_provider)
        .value("missing_offset", CalendarError::missing_offset)
        .value("missing_dst", CalendarError::missing_dst)
        .value("inconsistent_dst", CalendarError::inconsistent_dst)
        .value("provider_mismatch", CalendarError::provider_mismatch)
        .value("state_size_mismatch", CalendarError::state_size_mismatch)
        .value("state_version_mismatch", CalendarError::state_version_mismatch)
        .def("__str__",
             [](CalendarError e) { return std::string(darian::calendar_error_string(e)); })
        .def_prop_ro("category", [](CalendarError e) { return darian::error_category(e); },
                     "ErrorCategory of this code");

    // =========================================================================
    // Custom Exceptions
    // =========================================================================

    // Range errors are ValueErrors, as for the builtin datetime module
    auto range_error = nb::exception<std::runtime_error>(m, "CalendarRangeError",
                                                         PyExc_ValueError);
    range_error_type = range_error.ptr();

    auto overflow_error = nb::exception<std::overflow_error>(m, "CalendarOverflowError",
                                                             PyExc_OverflowError);
    overflow_error_type = overflow_error.ptr();

    auto type_mismatch_error = nb::exception<std::invalid_argument>(m, "NaiveAwareError",
                                                                    PyExc_TypeError);
    type_mismatch_error_type = type_mismatch_error.ptr();

    auto consistency_error = nb::exception<std::logic_error>(m, "ProviderConsistencyError",
                                                             PyExc_ValueError);
    consistency_error_type = consistency_error.ptr();
}

} // namespace darian_python
