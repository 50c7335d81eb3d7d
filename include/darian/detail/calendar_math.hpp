// include/darian/detail/calendar_math.hpp
#pragma once

#include "darian/detail/sol_math.hpp"

#include <cstdint>

namespace darian {

/// Earliest supported year (about AD 1609/1610)
inline constexpr int32_t MIN_YEAR = 0;

/// Latest supported year
inline constexpr int32_t MAX_YEAR = 9999;

/// Months per Darian year
inline constexpr int32_t MONTHS_PER_YEAR = 24;

/// Ordinal of 9999-24-28, the last supported sol
inline constexpr int64_t MAX_ORDINAL = 6'685'945;

} // namespace darian

namespace darian::detail {

/**
 * Proleptic Darian calendar arithmetic.
 *
 * Sagittarius (month 1) 1 of year 0 is ordinal 1. Months have 28 sols except
 * months 6, 12 and 18 (27 sols) and month 24, which has 27 sols in a common
 * year and 28 in a leap year. The leap rule changes at the year bands
 * 2000 / 4800 / 6800 / 8400; rules above year 9999 are undefined.
 */

/// Year -> true if leap year
constexpr bool is_leap(int64_t year) noexcept {
    if (year <= 2000) {
        if (year % 1000 == 0) {
            return true;
        }
        if (year % 100 == 0) {
            return false;
        }
    } else if (year <= 4800) {
        if (year % 150 == 0) {
            return false;
        }
    } else if (year <= 6800) {
        if (year % 200 == 0) {
            return false;
        }
    } else if (year <= 8400) {
        if (year % 300 == 0) {
            return false;
        }
    } else if (year % 600 == 0) {
        return false;
    }

    if (year % 10 == 0) {
        return true;
    }
    return year % 2 == 1;
}

/// Year -> number of sols before month 1, sol 1 of that year
constexpr int64_t sols_before_year(int64_t year) noexcept {
    // Corrections use floor division; year 0 gives x = -1
    const int64_t x = year - 1;
    const int64_t base = year * 669 - floor_div(x, 2) + floor_div(x, 10);
    if (year <= 2000) {
        return base - floor_div(x, 100) + floor_div(x, 1000);
    }
    if (year <= 4800) {
        return base - floor_div(x, 150) - 5;
    }
    if (year <= 6800) {
        return base - floor_div(x, 200) - 13;
    }
    if (year <= 8400) {
        return base - floor_div(x, 300) - 25;
    }
    return base - floor_div(x, 600) - 39;
}

/// Month (1..24) -> number of sols in the year preceding its first sol
constexpr int64_t sols_before_month(int64_t month) noexcept {
    // Only month 24 carries the leap sol, so no table lookup is needed
    return (month - 1) * 28 - (month - 1) / 6;
}

/// Year, month (1..24) -> number of sols in that month
constexpr int32_t sols_in_month(int64_t year, int64_t month) noexcept {
    if (month == 6 || month == 12 || month == 18) {
        return 27;
    }
    if (month == 24 && !is_leap(year)) {
        return 27;
    }
    return 28;
}

/// Year -> number of sols in that year (668 or 669)
constexpr int32_t sols_in_year(int64_t year) noexcept {
    return is_leap(year) ? 669 : 668;
}

/// Year, month, sol -> day of year (1-based)
constexpr int64_t day_of_year(int64_t month, int64_t sol) noexcept {
    return sols_before_month(month) + sol;
}

/**
 * Year, month, sol -> ordinal.
 *
 * Fields must already be valid (see Date::from_ymd for the checked path).
 */
constexpr int64_t ymd_to_ordinal(int64_t year, int64_t month, int64_t sol) noexcept {
    return sols_before_year(year) + sols_before_month(month) + sol;
}

/// Result of ordinal_to_ymd()
struct YearMonthSol {
    int32_t year{0};
    int32_t month{1};
    int32_t sol{1};

    constexpr bool operator==(const YearMonthSol&) const noexcept = default;
};

/**
 * Ordinal -> (year, month, sol).
 *
 * Estimates the year from the mean year length and corrects it by at most one
 * in either direction, then does the same for the month.
 *
 * @param ordinal Ordinal in [1, MAX_ORDINAL]
 */
constexpr YearMonthSol ordinal_to_ymd(int64_t ordinal) noexcept {
    // Mean year length is 668.59 sols; integer form avoids a float round trip
    int64_t year = (ordinal * 100) / 66859;
    if (ordinal <= sols_before_year(year)) {
        // the estimate is too large
        --year;
    } else if (ordinal > sols_before_year(year + 1)) {
        // the estimate is too small
        ++year;
    }
    int64_t n = ordinal - sols_before_year(year);

    int64_t month = n / 28 + 1;
    if (n <= sols_before_month(month)) {
        --month;
    } else if (month < MONTHS_PER_YEAR && n > sols_before_month(month + 1)) {
        ++month;
    }
    n -= sols_before_month(month);

    return YearMonthSol{static_cast<int32_t>(year), static_cast<int32_t>(month),
                        static_cast<int32_t>(n)};
}

/// Sol of the month -> weekday index in [0, 7)
constexpr int32_t weekday(int32_t sol) noexcept {
    return (sol + 5) % 7;
}

} // namespace darian::detail
