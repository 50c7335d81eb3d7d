#pragma once

#include "darian/date.hpp"
#include "darian/datetime.hpp"
#include "darian/detail/calendar_math.hpp"
#include "darian/detail/sol_math.hpp"
#include "darian/duration.hpp"
#include "darian/error.hpp"
#include "darian/timezone.hpp"

#include <chrono>

#include <cmath>
#include <cstdint>

namespace darian {

/**
 * @brief Physical constants of the Earth/Mars conversion
 *
 * The TAI-UTC correction changes whenever a leap second is announced and
 * cannot be predicted, so results drift from reality far from the present.
 * Pass an updated config instead of rebuilding.
 *
 * Example usage:
 * @code
 *   auto cfg = ConversionConfig::standard();
 *   cfg.tai_minus_utc = 38.0;                       // next leap second
 *   auto dt = datetime_from_posix(1.7e9, FixedOffset::mtc(), cfg);
 * @endcode
 */
struct ConversionConfig {
    /// Length of a sol in terrestrial (SI) seconds
    double sol_seconds{88775.244147};

    /// TAI - UTC in seconds (37 since 2017-01-01)
    double tai_minus_utc{37.0};

    /// Fractional ordinal of the POSIX epoch in TAI
    double epoch_ordinal{128257.2954262};

    /// Defaults: 88775.244147 s, 37 s, 128257.2954262
    static constexpr ConversionConfig standard() noexcept { return ConversionConfig{}; }

    /// Terrestrial days per sol
    constexpr double mars_to_earth_ratio() const noexcept { return sol_seconds / 86400.0; }

    /// Sols per terrestrial day
    constexpr double earth_to_mars_ratio() const noexcept { return 86400.0 / sol_seconds; }
};

/**
 * MTC calendar fields of a terrestrial instant.
 *
 * `second` carries the fraction, rounded to the microsecond.
 */
struct MarsFields {
    int32_t year{0};
    int32_t month{1};
    int32_t sol{1};
    int32_t hour{0};
    int32_t minute{0};
    double second{0.0};
};

namespace detail {

/// (ordinal, seconds of sol, microseconds) of a POSIX instant in MTC
inline Result<SolTime> mtc_from_posix(double posix_seconds,
                                      const ConversionConfig& config) noexcept {
    if (!std::isfinite(posix_seconds)) {
        return make_unexpected(CalendarError::non_finite_value);
    }
    double ord_f = (posix_seconds + config.tai_minus_utc) / config.sol_seconds +
                   config.epoch_ordinal;
    double ordinal = std::floor(ord_f);
    if (ordinal < 1.0 || ordinal > static_cast<double>(MAX_ORDINAL)) {
        return make_unexpected(CalendarError::ordinal_out_of_range);
    }

    // Peel hours and minutes off the fraction, then round the seconds
    double t = (ord_f - ordinal) * 24.0;
    double hours = std::floor(t);
    t = (t - hours) * 60.0;
    double minutes = std::floor(t);
    t = (t - minutes) * 60.0;
    auto micros = static_cast<int64_t>(std::llround(t * 1e6));

    // A rounding carry may spill into the next minute, hour or sol
    auto normalized = normalize(to_total_micros(
        static_cast<int64_t>(ordinal),
        static_cast<int64_t>(hours) * 3600 + static_cast<int64_t>(minutes) * 60, micros));
    if (normalized.sols > MAX_ORDINAL) {
        return make_unexpected(CalendarError::ordinal_out_of_range);
    }
    return normalized;
}

} // namespace detail

/**
 * @brief Martian calendar fields (MTC) of a POSIX timestamp
 *
 * @return non_finite_value for NaN/inf, ordinal_out_of_range outside
 *         0000-01-01 .. 9999-24-28
 */
[[nodiscard]] inline Result<MarsFields>
mars_fields_from_posix(double posix_seconds,
                       const ConversionConfig& config = ConversionConfig::standard()) noexcept {
    auto t = detail::mtc_from_posix(posix_seconds, config);
    if (!t) {
        return make_unexpected(t.error());
    }
    auto ymd = detail::ordinal_to_ymd(static_cast<int64_t>(t->sols));
    MarsFields f;
    f.year = ymd.year;
    f.month = ymd.month;
    f.sol = ymd.sol;
    f.hour = static_cast<int32_t>(t->seconds / 3600);
    f.minute = static_cast<int32_t>((t->seconds % 3600) / 60);
    f.second = static_cast<double>(t->seconds % 60) + static_cast<double>(t->micros) / 1e6;
    return f;
}

/// MTC date of a POSIX timestamp
[[nodiscard]] inline Result<Date>
date_from_posix(double posix_seconds,
                const ConversionConfig& config = ConversionConfig::standard()) noexcept {
    auto t = detail::mtc_from_posix(posix_seconds, config);
    if (!t) {
        return make_unexpected(t.error());
    }
    return Date::from_ordinal(static_cast<int64_t>(t->sols));
}

/**
 * @brief Martian date-time of a POSIX timestamp
 *
 * The instant is computed in MTC and then localized with
 * provider->from_mtc(). A null provider gives a naive value holding the MTC
 * fields.
 */
[[nodiscard]] inline Result<DateTime>
datetime_from_posix(double posix_seconds, const OffsetProviderPtr& provider = FixedOffset::mtc(),
                    const ConversionConfig& config = ConversionConfig::standard()) {
    auto t = detail::mtc_from_posix(posix_seconds, config);
    if (!t) {
        return make_unexpected(t.error());
    }
    auto date = Date::from_ordinal(static_cast<int64_t>(t->sols));
    if (!date) {
        return make_unexpected(date.error());
    }
    WallClock clock{static_cast<int32_t>(t->seconds / 3600),
                    static_cast<int32_t>((t->seconds % 3600) / 60),
                    static_cast<int32_t>(t->seconds % 60), static_cast<int32_t>(t->micros)};
    auto mtc = DateTime::combine(*date, clock, provider);
    if (!mtc || !provider) {
        return mtc;
    }
    return provider->from_mtc(*mtc);
}

/**
 * @brief POSIX timestamp of an offset-aware Martian date-time
 *
 * @return naive_conversion if dt has no offset
 */
[[nodiscard]] inline Result<double>
to_posix(const DateTime& dt, const ConversionConfig& config = ConversionConfig::standard()) {
    auto offset = dt.mtc_offset();
    if (!offset) {
        return make_unexpected(offset.error());
    }
    if (!*offset) {
        return make_unexpected(CalendarError::naive_conversion);
    }
    auto mtc = dt - **offset;
    if (!mtc) {
        return make_unexpected(mtc.error());
    }
    double sol_fraction =
        (static_cast<double>(mtc->hour()) * 3600.0 + static_cast<double>(mtc->minute()) * 60.0 +
         static_cast<double>(mtc->second()) + static_cast<double>(mtc->microsecond()) / 1e6) /
        86400.0;
    double ord_f = static_cast<double>(mtc->to_ordinal()) - config.epoch_ordinal + sol_fraction;
    return ord_f * config.sol_seconds - config.tai_minus_utc;
}

// ============================================================================
// std::chrono boundary
// ============================================================================

/// Martian date-time of a system_clock instant
[[nodiscard]] inline Result<DateTime>
earth_to_mars(std::chrono::system_clock::time_point tp,
              const OffsetProviderPtr& provider = FixedOffset::mtc(),
              const ConversionConfig& config = ConversionConfig::standard()) {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch());
    return datetime_from_posix(static_cast<double>(us.count()) / 1e6, provider, config);
}

/// system_clock instant of an offset-aware Martian date-time (microsecond precision)
[[nodiscard]] inline Result<std::chrono::system_clock::time_point>
mars_to_earth(const DateTime& dt, const ConversionConfig& config = ConversionConfig::standard()) {
    auto posix = to_posix(dt, config);
    if (!posix) {
        return make_unexpected(posix.error());
    }
    std::chrono::microseconds us(std::llround(*posix * 1e6));
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(us));
}

/**
 * @brief Martian duration of a terrestrial interval
 *
 * Scales by sols-per-day at the ratio's exact binary value, rounding half to
 * even at the microsecond.
 */
[[nodiscard]] inline Result<Duration>
earth_to_mars(std::chrono::microseconds interval,
              const ConversionConfig& config = ConversionConfig::standard()) noexcept {
    auto micros = detail::scale_micros(interval.count(), config.earth_to_mars_ratio());
    if (!micros) {
        return make_unexpected(CalendarError::duration_overflow);
    }
    return Duration::from_total_microseconds(*micros);
}

/// Terrestrial interval of a Martian duration
[[nodiscard]] inline Result<std::chrono::microseconds>
mars_to_earth(const Duration& interval,
              const ConversionConfig& config = ConversionConfig::standard()) noexcept {
    auto micros = detail::scale_micros(interval.total_microseconds(), config.mars_to_earth_ratio());
    if (!micros || *micros > INT64_MAX || *micros < INT64_MIN) {
        return make_unexpected(CalendarError::duration_overflow);
    }
    return std::chrono::microseconds(static_cast<int64_t>(*micros));
}

} // namespace darian
