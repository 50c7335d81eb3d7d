#pragma once

#include "darian/detail/calendar_math.hpp"
#include "darian/detail/hash.hpp"
#include "darian/duration.hpp"
#include "darian/error.hpp"

#include <compare>
#include <functional>
#include <optional>

#include <cstddef>
#include <cstdint>

namespace darian {

/**
 * Broken-down fields handed to an external formatter.
 *
 * dst_flag is -1 when unknown (naive value or provider without DST data),
 * 0 when no daylight portion applies and 1 when it does.
 */
struct TimeTuple {
    int32_t year{0};
    int32_t month{1};
    int32_t sol{1};
    int32_t hour{0};
    int32_t minute{0};
    double second{0.0};
    int32_t weekday{0};
    std::optional<int32_t> day_of_year;
    int32_t dst_flag{-1};
};

/**
 * Darian calendar date (year, month, sol).
 *
 * Years run 0..9999 and months 1..24. Ordering is lexicographic on
 * (year, month, sol), which is the same as ordering by ordinal.
 *
 * Example:
 * @code
 * auto d = Date::from_ymd(219, 13, 27);
 * if (d) {
 *     int64_t n = d->to_ordinal();  // 146782
 * }
 * @endcode
 */
class Date {
public:
    // Named constants
    static Date min() noexcept { return Date(MIN_YEAR, 1, 1); }
    static Date max() noexcept { return Date(MAX_YEAR, MONTHS_PER_YEAR, 28); }
    static Duration resolution() noexcept { return whole_sols(1); }

    // Default construction - Date::min()
    Date() noexcept = default;

    /**
     * Validate and build a date.
     *
     * Fields are checked in order year, month, sol; the first bad field
     * decides the error.
     */
    static Result<Date> from_ymd(int64_t year, int64_t month, int64_t sol) noexcept {
        if (year < MIN_YEAR || year > MAX_YEAR) {
            return make_unexpected(CalendarError::year_out_of_range);
        }
        if (month < 1 || month > MONTHS_PER_YEAR) {
            return make_unexpected(CalendarError::month_out_of_range);
        }
        if (sol < 1 || sol > detail::sols_in_month(year, month)) {
            return make_unexpected(CalendarError::sol_out_of_range);
        }
        return Date(static_cast<int32_t>(year), static_cast<int32_t>(month),
                    static_cast<int32_t>(sol));
    }

    /// Inverse of to_ordinal(); ordinal 1 is 0000-01-01
    static Result<Date> from_ordinal(int64_t ordinal) noexcept {
        if (ordinal < 1 || ordinal > MAX_ORDINAL) {
            return make_unexpected(CalendarError::ordinal_out_of_range);
        }
        auto ymd = detail::ordinal_to_ymd(ordinal);
        return Date(ymd.year, ymd.month, ymd.sol);
    }

    // Accessors
    int32_t year() const noexcept { return year_; }
    int32_t month() const noexcept { return month_; }
    int32_t sol() const noexcept { return sol_; }

    int64_t to_ordinal() const noexcept { return detail::ymd_to_ordinal(year_, month_, sol_); }

    /// Sol of the week in [0, 7)
    int32_t weekday() const noexcept { return detail::weekday(sol_); }

    /// 1-based sol of the year
    int32_t day_of_year() const noexcept {
        return static_cast<int32_t>(detail::day_of_year(month_, sol_));
    }

    /// Copy with the given fields replaced, re-validated
    Result<Date> replace(std::optional<int64_t> year = std::nullopt,
                         std::optional<int64_t> month = std::nullopt,
                         std::optional<int64_t> sol = std::nullopt) const noexcept {
        return from_ymd(year.value_or(year_), month.value_or(month_), sol.value_or(sol_));
    }

    TimeTuple time_tuple() const noexcept {
        TimeTuple t;
        t.year = year_;
        t.month = month_;
        t.sol = sol_;
        t.weekday = weekday();
        t.day_of_year = day_of_year();
        return t;
    }

    // Arithmetic - only the sols of a duration take part
    friend Result<Date> operator+(const Date& date, const Duration& delta) noexcept {
        return from_ordinal(date.to_ordinal() + delta.sols()).map_error([](CalendarError) {
            return CalendarError::date_overflow;
        });
    }

    friend Result<Date> operator+(const Duration& delta, const Date& date) noexcept {
        return date + delta;
    }

    friend Result<Date> operator-(const Date& date, const Duration& delta) noexcept {
        return from_ordinal(date.to_ordinal() - delta.sols()).map_error([](CalendarError) {
            return CalendarError::date_overflow;
        });
    }

    /// Whole-sol difference; sub-sol fields of the result are zero
    friend Duration operator-(const Date& lhs, const Date& rhs) noexcept {
        return whole_sols(lhs.to_ordinal() - rhs.to_ordinal());
    }

    // Comparison
    std::strong_ordering operator<=>(const Date& other) const noexcept {
        if (year_ != other.year_) {
            return year_ <=> other.year_;
        }
        if (month_ != other.month_) {
            return month_ <=> other.month_;
        }
        return sol_ <=> other.sol_;
    }

    bool operator==(const Date& other) const noexcept {
        return year_ == other.year_ && month_ == other.month_ && sol_ == other.sol_;
    }

    std::size_t hash() const noexcept {
        return hash_cache_.get_or_compute([this]() noexcept {
            std::size_t seed = 0;
            detail::hash_combine(seed, year_);
            detail::hash_combine(seed, month_);
            detail::hash_combine(seed, sol_);
            return seed;
        });
    }

private:
    friend class DateTime;

    Date(int32_t year, int32_t month, int32_t sol) noexcept
        : year_(year),
          month_(month),
          sol_(sol) {}

    // |sols| never exceeds MAX_ORDINAL here
    static Duration whole_sols(int64_t sols) noexcept {
        return Duration(static_cast<int32_t>(sols), 0, 0);
    }

    int32_t year_ = MIN_YEAR;
    int32_t month_ = 1;
    int32_t sol_ = 1;
    detail::HashCache hash_cache_;
};

} // namespace darian

template <>
struct std::hash<darian::Date> {
    std::size_t operator()(const darian::Date& d) const noexcept { return d.hash(); }
};
