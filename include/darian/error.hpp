#pragma once

#include "darian/expected.hpp"

#include <cstdint>

namespace darian {

/**
 * @brief The four failure conditions of the calendar engine
 *
 * Every CalendarError belongs to exactly one category. Callers that only need
 * to know "what kind of mistake" switch on the category; callers that report
 * to a user print calendar_error_string() of the specific code.
 */
enum class ErrorCategory : uint8_t {
    range,         ///< A field lies outside its statically valid domain
    overflow,      ///< A derived ordinal or sol count left the supported range
    type_mismatch, ///< Naive and offset-aware values were mixed
    consistency    ///< An offset provider returned contradictory or absent data
};

/**
 * @brief Specific error codes returned through expected<T, CalendarError>
 */
enum class CalendarError : uint8_t {
    year_out_of_range,        ///< Year outside 0..9999
    month_out_of_range,       ///< Month outside 1..24
    sol_out_of_range,         ///< Sol outside 1..sols_in_month(year, month)
    hour_out_of_range,        ///< Hour outside 0..23
    minute_out_of_range,      ///< Minute outside 0..59
    second_out_of_range,      ///< Second outside 0..59
    microsecond_out_of_range, ///< Microsecond outside 0..999999
    fold_out_of_range,        ///< Fold other than 0 or 1
    offset_out_of_range,      ///< Offset not strictly inside +/-24 hours
    non_finite_value,         ///< NaN or infinite floating input
    division_by_zero,         ///< Zero divisor in Duration division
    duration_overflow,        ///< |sols| would exceed 999,999,999
    ordinal_out_of_range,     ///< Ordinal outside 1..MAX_ORDINAL
    date_overflow,            ///< Date arithmetic left the supported range
    naive_aware_mismatch,     ///< Ordering or subtraction of naive vs aware values
    naive_conversion,         ///< Conversion needs an offset but the value is naive
    missing_provider,         ///< An offset provider is required but none was given
    missing_offset,           ///< Provider returned no offset where one is required
    missing_dst,              ///< Provider returned no dst() where one is required
    inconsistent_dst,         ///< dst() became absent after the local shift
    provider_mismatch,        ///< from_mtc() called with a value in another provider
    state_size_mismatch,      ///< Encoded state has the wrong length
    state_version_mismatch    ///< Encoded state carries an unknown format version
};

/**
 * @brief Map a specific error code to its category
 */
[[nodiscard]] constexpr ErrorCategory error_category(CalendarError e) noexcept {
    switch (e) {
        case CalendarError::duration_overflow:
        case CalendarError::ordinal_out_of_range:
        case CalendarError::date_overflow:
            return ErrorCategory::overflow;
        case CalendarError::naive_aware_mismatch:
        case CalendarError::naive_conversion:
        case CalendarError::missing_provider:
            return ErrorCategory::type_mismatch;
        case CalendarError::missing_offset:
        case CalendarError::missing_dst:
        case CalendarError::inconsistent_dst:
        case CalendarError::provider_mismatch:
            return ErrorCategory::consistency;
        default:
            return ErrorCategory::range;
    }
}

/**
 * @brief Get a human-readable error message
 * @return Static string describing the error
 */
[[nodiscard]] constexpr const char* calendar_error_string(CalendarError e) noexcept {
    switch (e) {
        case CalendarError::year_out_of_range:
            return "year must be in 0..9999";
        case CalendarError::month_out_of_range:
            return "month must be in 1..24";
        case CalendarError::sol_out_of_range:
            return "sol is out of range for the month";
        case CalendarError::hour_out_of_range:
            return "hour must be in 0..23";
        case CalendarError::minute_out_of_range:
            return "minute must be in 0..59";
        case CalendarError::second_out_of_range:
            return "second must be in 0..59";
        case CalendarError::microsecond_out_of_range:
            return "microsecond must be in 0..999999";
        case CalendarError::fold_out_of_range:
            return "fold must be either 0 or 1";
        case CalendarError::offset_out_of_range:
            return "offset must be strictly between -24 hours and 24 hours";
        case CalendarError::non_finite_value:
            return "duration component is not finite";
        case CalendarError::division_by_zero:
            return "division by zero";
        case CalendarError::duration_overflow:
            return "duration number of sols is too large";
        case CalendarError::ordinal_out_of_range:
            return "ordinal must be in 1..6685945";
        case CalendarError::date_overflow:
            return "date result out of range";
        case CalendarError::naive_aware_mismatch:
            return "cannot mix naive and offset-aware date-times";
        case CalendarError::naive_conversion:
            return "offset provider must be specified for conversion";
        case CalendarError::missing_provider:
            return "offset provider argument is required";
        case CalendarError::missing_offset:
            return "from_mtc() requires a non-empty mtc_offset() result";
        case CalendarError::missing_dst:
            return "from_mtc() requires a non-empty dst() result";
        case CalendarError::inconsistent_dst:
            return "from_mtc(): dst() gave inconsistent results";
        case CalendarError::provider_mismatch:
            return "date-time provider is not the converting provider";
        case CalendarError::state_size_mismatch:
            return "encoded state has the wrong size";
        case CalendarError::state_version_mismatch:
            return "encoded state has an unsupported version";
    }
    return "unknown calendar error";
}

/**
 * @brief Result type for calendar operations
 *
 * @tparam T The type produced on success
 */
template <typename T>
using Result = expected<T, CalendarError>;

} // namespace darian
