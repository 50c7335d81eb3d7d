#pragma once
// Shared helpers for the DARIAN bindings: exception types, Result unwrapping

#include <nanobind/nanobind.h>

#include <darian/duration.hpp>
#include <darian/error.hpp>
#include <darian/timezone.hpp>

#include <memory>
#include <utility>

#include <cstdint>

namespace nb = nanobind;

namespace darian_python {

// Exception type pointers (set during module init), one per ErrorCategory
extern PyObject* range_error_type;
extern PyObject* overflow_error_type;
extern PyObject* type_mismatch_error_type;
extern PyObject* consistency_error_type;

/**
 * @brief Raise the Python exception matching the category of e
 */
[[noreturn]] inline void raise_calendar_error(darian::CalendarError e) {
    PyObject* type = range_error_type;
    switch (darian::error_category(e)) {
        case darian::ErrorCategory::range:
            type = range_error_type;
            break;
        case darian::ErrorCategory::overflow:
            type = overflow_error_type;
            break;
        case darian::ErrorCategory::type_mismatch:
            type = type_mismatch_error_type;
            break;
        case darian::ErrorCategory::consistency:
            type = consistency_error_type;
            break;
    }
    PyErr_SetString(type, darian::calendar_error_string(e));
    throw nb::python_error();
}

/**
 * @brief Value of a Result, or the matching Python exception
 */
template <typename T>
T unwrap(darian::Result<T>&& r) {
    if (!r.has_value()) {
        raise_calendar_error(r.error());
    }
    return std::move(*r);
}

/**
 * @brief Python int -> exact Quantity, Python float -> floating Quantity
 */
inline darian::Quantity to_quantity(nb::handle h) {
    if (nb::isinstance<nb::int_>(h)) {
        return darian::Quantity(nb::cast<int64_t>(h));
    }
    return darian::Quantity(nb::cast<double>(h));
}

/// Providers cross the boundary as non-const handles; the library only reads them
using PyProvider = std::shared_ptr<darian::OffsetProvider>;

inline PyProvider to_py(const darian::OffsetProviderPtr& p) {
    return std::const_pointer_cast<darian::OffsetProvider>(p);
}

} // namespace darian_python
