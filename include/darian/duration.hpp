#pragma once

#include "darian/detail/hash.hpp"
#include "darian/detail/sol_math.hpp"
#include "darian/error.hpp"

#include <compare>
#include <concepts>
#include <functional>
#include <utility>

#include <cmath>
#include <cstddef>
#include <cstdint>

namespace darian {

// Forward declarations
class Date;
class DateTime;

/// Largest |sols| of a Duration
inline constexpr int64_t MAX_DURATION_SOLS = detail::MAX_DURATION_SOLS;

/**
 * Amount of one time unit passed to Duration::from_parts().
 *
 * Holds either an exact integer or a double. Integer amounts never lose
 * precision; floating amounts follow the fraction carry rules of
 * Duration::from_parts().
 */
class Quantity {
public:
    constexpr Quantity() noexcept = default;

    template <std::integral T>
    constexpr Quantity(T value) noexcept : whole_(static_cast<__int128_t>(value)) {}

    template <std::floating_point T>
    constexpr Quantity(T value) noexcept : real_(static_cast<double>(value)),
                                           floating_(true) {}

    constexpr bool is_floating() const noexcept { return floating_; }
    constexpr __int128_t whole() const noexcept { return whole_; }
    constexpr double real() const noexcept { return real_; }

    constexpr double as_double() const noexcept {
        return floating_ ? real_ : static_cast<double>(whole_);
    }

    /// this * factor, exact for integer amounts
    constexpr Quantity scaled(int64_t factor) const noexcept {
        if (floating_) {
            return Quantity(real_ * static_cast<double>(factor));
        }
        return exact(whole_ * factor);
    }

    /// this + other; floating if either side is floating
    constexpr Quantity plus(Quantity other) const noexcept {
        if (!floating_ && !other.floating_) {
            return exact(whole_ + other.whole_);
        }
        return Quantity(as_double() + other.as_double());
    }

private:
    static constexpr Quantity exact(__int128_t value) noexcept {
        Quantity q;
        q.whole_ = value;
        return q;
    }

    __int128_t whole_{0};
    double real_{0.0};
    bool floating_{false};
};

/**
 * Mixed-unit input to Duration::from_parts().
 *
 * Fields are in the order accepted by designated initializers:
 * @code
 * auto d = Duration::from_parts({.sols = 1.5, .hours = -3.25});
 * @endcode
 */
struct DurationParts {
    Quantity sols;
    Quantity seconds;
    Quantity microseconds;
    Quantity milliseconds;
    Quantity minutes;
    Quantity hours;
    Quantity weeks;
};

/**
 * Signed Martian time interval with microsecond precision.
 *
 * ## Storage
 * Normalized triple (sols, seconds, microseconds) with
 * seconds in [0, 86400) and microseconds in [0, 10^6).
 *
 * ## Negative Value Representation (Floor Semantics)
 * The sign lives entirely in sols:
 * - `-1 microsecond` = `{sols: -1, seconds: 86399, microseconds: 999999}`
 * - `-1.25 sols`     = `{sols: -2, seconds: 64800, microseconds: 0}`
 *
 * ## Range
 * min() is -999,999,999 sols, max() is 999,999,999 sols 23:59:59.999999.
 *
 * ## Overflow Policy
 * Every operation that can leave the range returns
 * `Result<Duration>` carrying CalendarError::duration_overflow.
 * Nothing saturates.
 *
 * A "sol" here is a unit of 24 Martian hours of 3600 Martian seconds each.
 */
class Duration {
public:
    static constexpr int64_t SECONDS_PER_SOL = detail::SECONDS_PER_SOL;
    static constexpr int64_t MICROSECONDS_PER_SECOND = detail::MICROS_PER_SECOND;

    // Named constants
    static Duration zero() noexcept { return Duration(); }

    static Duration min() noexcept {
        return Duration(static_cast<int32_t>(-MAX_DURATION_SOLS), 0, 0);
    }

    static Duration max() noexcept {
        return Duration(static_cast<int32_t>(MAX_DURATION_SOLS),
                        static_cast<int32_t>(SECONDS_PER_SOL - 1),
                        static_cast<int32_t>(MICROSECONDS_PER_SECOND - 1));
    }

    static Duration resolution() noexcept { return Duration(0, 0, 1); }

    // Default construction - zero duration
    Duration() noexcept = default;

    /**
     * Build a Duration from any mix of the seven units.
     *
     * Larger units fold into sols, seconds and microseconds first. Fractions
     * of sols carry into seconds, fractions of seconds carry into
     * microseconds, and the microsecond total is rounded half to even once at
     * the end. The same net interval gives the same triple however it is
     * split across units (up to double rounding at the microsecond).
     *
     * @return duration_overflow if |sols| ends up above 999,999,999,
     *         non_finite_value for NaN or infinite floating amounts
     */
    static Result<Duration> from_parts(const DurationParts& parts) noexcept;

    // Single-unit factories
    static Result<Duration> from_sols(Quantity n) noexcept { return from_parts({.sols = n}); }
    static Result<Duration> from_weeks(Quantity n) noexcept { return from_parts({.weeks = n}); }
    static Result<Duration> from_hours(Quantity n) noexcept { return from_parts({.hours = n}); }
    static Result<Duration> from_minutes(Quantity n) noexcept {
        return from_parts({.minutes = n});
    }
    static Result<Duration> from_seconds(Quantity n) noexcept {
        return from_parts({.seconds = n});
    }
    static Result<Duration> from_milliseconds(Quantity n) noexcept {
        return from_parts({.milliseconds = n});
    }
    static Result<Duration> from_microseconds(Quantity n) noexcept {
        return from_parts({.microseconds = n});
    }

    /// Exact factory from a total microsecond count
    static Result<Duration> from_total_microseconds(__int128_t micros) noexcept {
        if (!detail::fits_duration(micros)) {
            return make_unexpected(CalendarError::duration_overflow);
        }
        return from_normalized(detail::normalize(micros));
    }

    // Primary accessors - normalized components
    int32_t sols() const noexcept { return sols_; }
    int32_t seconds() const noexcept { return seconds_; }
    int32_t microseconds() const noexcept { return microseconds_; }

    /// Exact total microsecond count
    __int128_t total_microseconds() const noexcept {
        return detail::to_total_micros(sols_, seconds_, microseconds_);
    }

    /// Total length in seconds
    double total_seconds() const noexcept {
        return static_cast<double>(total_microseconds()) /
               static_cast<double>(MICROSECONDS_PER_SECOND);
    }

    // Predicates
    bool is_zero() const noexcept { return sols_ == 0 && seconds_ == 0 && microseconds_ == 0; }
    bool is_negative() const noexcept { return sols_ < 0; }
    explicit operator bool() const noexcept { return !is_zero(); }

    // Negation fails only for max(), whose mirror lies one microsecond below min()
    Result<Duration> operator-() const noexcept {
        return from_total_microseconds(-total_microseconds());
    }

    Result<Duration> abs() const noexcept {
        if (is_negative()) {
            return -(*this);
        }
        return *this;
    }

    // Arithmetic operators (fail with duration_overflow)
    friend Result<Duration> operator+(const Duration& lhs, const Duration& rhs) noexcept {
        return from_total_microseconds(lhs.total_microseconds() + rhs.total_microseconds());
    }

    friend Result<Duration> operator-(const Duration& lhs, const Duration& rhs) noexcept {
        return from_total_microseconds(lhs.total_microseconds() - rhs.total_microseconds());
    }

    template <std::integral T>
    friend Result<Duration> operator*(const Duration& d, T factor) noexcept {
        return d.scaled_exact(static_cast<__int128_t>(factor));
    }

    template <std::integral T>
    friend Result<Duration> operator*(T factor, const Duration& d) noexcept {
        return d.scaled_exact(static_cast<__int128_t>(factor));
    }

    /// Scale by the exact binary value of factor, rounding half to even
    template <std::floating_point T>
    friend Result<Duration> operator*(const Duration& d, T factor) noexcept {
        return d.scaled_real(static_cast<double>(factor));
    }

    template <std::floating_point T>
    friend Result<Duration> operator*(T factor, const Duration& d) noexcept {
        return d.scaled_real(static_cast<double>(factor));
    }

    /// Divide, rounding the microsecond result half to even
    template <std::integral T>
    friend Result<Duration> operator/(const Duration& d, T divisor) noexcept {
        if (divisor == 0) {
            return make_unexpected(CalendarError::division_by_zero);
        }
        return from_total_microseconds(
            detail::divide_and_round(d.total_microseconds(), static_cast<__int128_t>(divisor)));
    }

    template <std::floating_point T>
    friend Result<Duration> operator/(const Duration& d, T divisor) noexcept {
        auto value = static_cast<double>(divisor);
        if (!std::isfinite(value)) {
            return make_unexpected(CalendarError::non_finite_value);
        }
        if (value == 0.0) {
            return make_unexpected(CalendarError::division_by_zero);
        }
        auto micros = detail::divide_micros(d.total_microseconds(), value);
        if (!micros) {
            return make_unexpected(CalendarError::duration_overflow);
        }
        return from_total_microseconds(*micros);
    }

    /// Ratio of two durations
    friend Result<double> operator/(const Duration& lhs, const Duration& rhs) noexcept {
        if (rhs.is_zero()) {
            return make_unexpected(CalendarError::division_by_zero);
        }
        return static_cast<double>(lhs.total_microseconds()) /
               static_cast<double>(rhs.total_microseconds());
    }

    /// Floor division by an integer (rounds toward negative infinity)
    template <std::integral T>
    Result<Duration> floor_div(T divisor) const noexcept {
        if (divisor == 0) {
            return make_unexpected(CalendarError::division_by_zero);
        }
        return from_total_microseconds(
            detail::floor_divmod(total_microseconds(), static_cast<__int128_t>(divisor)).first);
    }

    /**
     * Floor quotient of two durations.
     *
     * @return duration_overflow if the quotient does not fit int64_t
     *         (only possible for divisors below ~10 microseconds)
     */
    Result<int64_t> floor_div(const Duration& divisor) const noexcept {
        return divmod(divisor).map([](const std::pair<int64_t, Duration>& qr) { return qr.first; });
    }

    /// Floor remainder; takes the sign of the divisor
    friend Result<Duration> operator%(const Duration& lhs, const Duration& rhs) noexcept {
        if (rhs.is_zero()) {
            return make_unexpected(CalendarError::division_by_zero);
        }
        return from_total_microseconds(
            detail::floor_divmod(lhs.total_microseconds(), rhs.total_microseconds()).second);
    }

    /// (floor quotient, remainder) with lhs == q * rhs + r
    Result<std::pair<int64_t, Duration>> divmod(const Duration& divisor) const noexcept {
        if (divisor.is_zero()) {
            return make_unexpected(CalendarError::division_by_zero);
        }
        auto [q, r] = detail::floor_divmod(total_microseconds(), divisor.total_microseconds());
        if (q > INT64_MAX || q < INT64_MIN) {
            return make_unexpected(CalendarError::duration_overflow);
        }
        return std::pair<int64_t, Duration>{static_cast<int64_t>(q),
                                            from_normalized(detail::normalize(r))};
    }

    // Comparison (lexicographic on the normalized triple)
    std::strong_ordering operator<=>(const Duration& other) const noexcept {
        if (sols_ != other.sols_) {
            return sols_ <=> other.sols_;
        }
        if (seconds_ != other.seconds_) {
            return seconds_ <=> other.seconds_;
        }
        return microseconds_ <=> other.microseconds_;
    }

    bool operator==(const Duration& other) const noexcept {
        return sols_ == other.sols_ && seconds_ == other.seconds_ &&
               microseconds_ == other.microseconds_;
    }

    /// Hash of the normalized triple, memoized on first use
    std::size_t hash() const noexcept {
        return hash_cache_.get_or_compute([this]() noexcept {
            std::size_t seed = 0;
            detail::hash_combine(seed, sols_);
            detail::hash_combine(seed, seconds_);
            detail::hash_combine(seed, microseconds_);
            return seed;
        });
    }

private:
    friend class Date;
    friend class DateTime;

    // Private constructor - fields must already be normalized and in range
    Duration(int32_t sols, int32_t seconds, int32_t microseconds) noexcept
        : sols_(sols),
          seconds_(seconds),
          microseconds_(microseconds) {}

    static Duration from_normalized(const detail::SolTime& t) noexcept {
        return Duration(static_cast<int32_t>(t.sols), static_cast<int32_t>(t.seconds),
                        static_cast<int32_t>(t.micros));
    }

    Result<Duration> scaled_exact(__int128_t factor) const noexcept {
        __int128_t micros = total_microseconds();
        if (micros == 0 || factor == 0) {
            return zero();
        }
        __int128_t magnitude = micros < 0 ? -micros : micros;
        __int128_t factor_magnitude = factor < 0 ? -factor : factor;
        if (factor_magnitude > detail::MICROS_GUARD / magnitude) {
            return make_unexpected(CalendarError::duration_overflow);
        }
        return from_total_microseconds(micros * factor);
    }

    Result<Duration> scaled_real(double factor) const noexcept {
        if (!std::isfinite(factor)) {
            return make_unexpected(CalendarError::non_finite_value);
        }
        auto micros = detail::scale_micros(total_microseconds(), factor);
        if (!micros) {
            return make_unexpected(CalendarError::duration_overflow);
        }
        return from_total_microseconds(*micros);
    }

    int32_t sols_ = 0;
    int32_t seconds_ = 0;
    int32_t microseconds_ = 0;
    detail::HashCache hash_cache_;
};

namespace detail {

// Whole parts beyond this magnitude are rejected before the integer conversion;
// the smallest such value already exceeds the Duration range many times over
inline constexpr double MAX_WHOLE_MICROS = 1e36;

/// True if `whole` units of `unit_micros` microseconds can be converted to __int128_t
inline bool whole_fits(double whole, double unit_micros) noexcept {
    return std::fabs(whole) * unit_micros <= MAX_WHOLE_MICROS;
}

} // namespace detail

inline Result<Duration> Duration::from_parts(const DurationParts& parts) noexcept {
    // Normalize everything to sols, seconds, microseconds
    Quantity sols = parts.sols.plus(parts.weeks.scaled(7));
    Quantity seconds = parts.seconds.plus(parts.minutes.scaled(60).plus(parts.hours.scaled(3600)));
    Quantity micros = parts.microseconds.plus(parts.milliseconds.scaled(1000));

    __int128_t whole_sols = 0;
    __int128_t whole_seconds = 0;
    double sol_seconds_frac = 0.0;
    if (sols.is_floating()) {
        if (!std::isfinite(sols.real())) {
            return make_unexpected(CalendarError::non_finite_value);
        }
        double sols_whole = 0.0;
        double sol_frac = std::modf(sols.real(), &sols_whole);
        double sol_seconds_whole = 0.0;
        sol_seconds_frac =
            std::modf(sol_frac * static_cast<double>(SECONDS_PER_SOL), &sol_seconds_whole);
        if (!detail::whole_fits(sols_whole, static_cast<double>(detail::MICROS_PER_SOL))) {
            return make_unexpected(CalendarError::duration_overflow);
        }
        whole_sols = static_cast<__int128_t>(sols_whole);
        whole_seconds = static_cast<__int128_t>(sol_seconds_whole);
    } else {
        whole_sols = sols.whole();
    }

    double seconds_frac = sol_seconds_frac;
    if (seconds.is_floating()) {
        if (!std::isfinite(seconds.real())) {
            return make_unexpected(CalendarError::non_finite_value);
        }
        double seconds_whole = 0.0;
        seconds_frac = std::modf(seconds.real(), &seconds_whole) + sol_seconds_frac;
        if (!detail::whole_fits(seconds_whole, static_cast<double>(MICROSECONDS_PER_SECOND))) {
            return make_unexpected(CalendarError::duration_overflow);
        }
        whole_seconds += static_cast<__int128_t>(seconds_whole);
    } else {
        whole_seconds += seconds.whole();
    }

    // |seconds_frac| <= 2, so this stays well inside double precision
    double us_double = seconds_frac * 1e6;

    __int128_t whole_micros = 0;
    if (micros.is_floating()) {
        if (!std::isfinite(micros.real())) {
            return make_unexpected(CalendarError::non_finite_value);
        }
        double rounded = detail::round_half_even(micros.real() + us_double);
        if (!detail::whole_fits(rounded, 1.0)) {
            return make_unexpected(CalendarError::duration_overflow);
        }
        whole_micros = static_cast<__int128_t>(rounded);
    } else {
        // Carry whole seconds out first so the rounding sees a sub-second value
        auto [carry, rest] = detail::floor_divmod(micros.whole(), MICROSECONDS_PER_SECOND);
        whole_seconds += carry;
        whole_micros = static_cast<__int128_t>(
            detail::round_half_even(static_cast<double>(rest) + us_double));
    }

    return from_total_microseconds(
        detail::to_total_micros(whole_sols, whole_seconds, whole_micros));
}

} // namespace darian

template <>
struct std::hash<darian::Duration> {
    std::size_t operator()(const darian::Duration& d) const noexcept { return d.hash(); }
};
