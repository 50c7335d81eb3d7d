// DARIAN Python Bindings
// Main module entry point - includes component bindings

#include <nanobind/nanobind.h>

// Binding components
#include "core_bindings.hpp"
#include "datetime_bindings.hpp"
#include "error_bindings.hpp"

namespace nb = nanobind;

// Define the exception type pointers (declared extern in py_types.hpp)
namespace darian_python {
PyObject* range_error_type = nullptr;
PyObject* overflow_error_type = nullptr;
PyObject* type_mismatch_error_type = nullptr;
PyObject* consistency_error_type = nullptr;
} // namespace darian_python

NB_MODULE(_darian, m) {
    m.doc() = "DARIAN - Darian Martian calendar engine";

    // Bind components in dependency order:
    // 1. Error types (sets the exception pointers) - no dependencies
    darian_python::bind_errors(m);

    // 2. Duration, Date, constants - need the exception pointers
    darian_python::bind_core(m);

    // 3. Providers, DateTime, conversion - need Duration and Date
    darian_python::bind_datetime(m);
}
