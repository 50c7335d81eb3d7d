#pragma once

#include "darian/date.hpp"
#include "darian/detail/calendar_math.hpp"
#include "darian/detail/hash.hpp"
#include "darian/detail/sol_math.hpp"
#include "darian/duration.hpp"
#include "darian/error.hpp"
#include "darian/timezone.hpp"

#include <compare>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include <cstddef>
#include <cstdint>

namespace darian {

/// Wall-clock fields of a sol
struct WallClock {
    int32_t hour{0};
    int32_t minute{0};
    int32_t second{0};
    int32_t microsecond{0};

    bool operator==(const WallClock&) const noexcept = default;
};

/**
 * Darian date plus wall-clock time, optionally tied to an OffsetProvider.
 *
 * A value without a provider (or whose provider reports no offset) is
 * "naive": it has no defined relation to MTC. `fold` selects the later of two
 * instants when a provider maps one wall-clock reading to two MTC instants;
 * only the provider looks at it.
 *
 * ## Comparison
 * Values sharing one provider instance compare field by field. Otherwise both
 * offsets are resolved and the MTC instants are compared.
 * - compare() fails with naive_aware_mismatch when exactly one side is naive
 * - operator== never fails: mixed naive/aware values, and values whose offset
 *   depends on fold (ambiguous or skipped local times) under different
 *   provider instances, are simply unequal. Provider errors also count as
 *   unequal; use equals() to see them.
 *
 * ## Arithmetic
 * Adding a Duration carries through the wall clock into the date and keeps
 * the provider (fold resets to 0). Results outside 0000-01-01 ..
 * 9999-24-28 fail with date_overflow.
 */
class DateTime {
public:
    // Named constants
    static DateTime min() noexcept { return DateTime(Date::min(), 0, 0, 0, 0, nullptr, 0); }

    static DateTime max() noexcept {
        return DateTime(Date::max(), 23, 59, 59,
                        static_cast<int32_t>(detail::MICROS_PER_SECOND - 1), nullptr, 0);
    }

    static Duration resolution() noexcept { return Duration::resolution(); }

    // Default construction - naive DateTime::min()
    DateTime() noexcept = default;

    /**
     * Validate and build a date-time.
     *
     * Date fields are checked first (year, month, sol), then hour, minute,
     * second, microsecond and fold.
     */
    static Result<DateTime> from_fields(int64_t year, int64_t month, int64_t sol,
                                        int64_t hour = 0, int64_t minute = 0,
                                        int64_t second = 0, int64_t microsecond = 0,
                                        OffsetProviderPtr provider = nullptr,
                                        int64_t fold = 0) noexcept {
        auto date = Date::from_ymd(year, month, sol);
        if (!date) {
            return make_unexpected(date.error());
        }
        if (hour < 0 || hour > 23) {
            return make_unexpected(CalendarError::hour_out_of_range);
        }
        if (minute < 0 || minute > 59) {
            return make_unexpected(CalendarError::minute_out_of_range);
        }
        if (second < 0 || second > 59) {
            return make_unexpected(CalendarError::second_out_of_range);
        }
        if (microsecond < 0 || microsecond >= detail::MICROS_PER_SECOND) {
            return make_unexpected(CalendarError::microsecond_out_of_range);
        }
        if (fold != 0 && fold != 1) {
            return make_unexpected(CalendarError::fold_out_of_range);
        }
        return DateTime(*date, static_cast<int32_t>(hour), static_cast<int32_t>(minute),
                        static_cast<int32_t>(second), static_cast<int32_t>(microsecond),
                        std::move(provider), static_cast<uint8_t>(fold));
    }

    static Result<DateTime> combine(const Date& date, const WallClock& clock,
                                    OffsetProviderPtr provider = nullptr,
                                    int64_t fold = 0) noexcept {
        return from_fields(date.year(), date.month(), date.sol(), clock.hour, clock.minute,
                           clock.second, clock.microsecond, std::move(provider), fold);
    }

    // Accessors
    int32_t year() const noexcept { return date_.year(); }
    int32_t month() const noexcept { return date_.month(); }
    int32_t sol() const noexcept { return date_.sol(); }
    int32_t hour() const noexcept { return hour_; }
    int32_t minute() const noexcept { return minute_; }
    int32_t second() const noexcept { return second_; }
    int32_t microsecond() const noexcept { return microsecond_; }
    int32_t fold() const noexcept { return fold_; }
    const OffsetProviderPtr& provider() const noexcept { return provider_; }

    const Date& date() const noexcept { return date_; }
    WallClock wall_clock() const noexcept {
        return WallClock{hour_, minute_, second_, microsecond_};
    }

    int64_t to_ordinal() const noexcept { return date_.to_ordinal(); }
    int32_t weekday() const noexcept { return date_.weekday(); }
    int32_t day_of_year() const noexcept { return date_.day_of_year(); }

    /// Same fields, different provider (no conversion)
    DateTime with_provider(OffsetProviderPtr provider) const noexcept {
        return DateTime(date_, hour_, minute_, second_, microsecond_, std::move(provider), fold_);
    }

    DateTime with_fold(bool fold) const noexcept {
        return DateTime(date_, hour_, minute_, second_, microsecond_, provider_,
                        static_cast<uint8_t>(fold ? 1 : 0));
    }

    /**
     * Offset from MTC reported by the provider.
     *
     * @return nullopt for naive values,
     *         offset_out_of_range if the provider reports 24 hours or more
     */
    Result<std::optional<Duration>> mtc_offset() const {
        if (!provider_) {
            return std::optional<Duration>{};
        }
        return checked(provider_->mtc_offset(this));
    }

    /// Daylight portion of mtc_offset(), range-checked the same way
    Result<std::optional<Duration>> dst() const {
        if (!provider_) {
            return std::optional<Duration>{};
        }
        return checked(provider_->dst(this));
    }

    std::optional<std::string> zone_name() const {
        if (!provider_) {
            return std::nullopt;
        }
        return provider_->name(this);
    }

    /// Three-way comparison of the instants (see class comment)
    Result<std::strong_ordering> compare(const DateTime& other) const {
        auto c = cmp(other, false);
        if (!c) {
            return make_unexpected(c.error());
        }
        return *c <=> 0;
    }

    /// Equality with provider errors reported
    Result<bool> equals(const DateTime& other) const {
        return cmp(other, true).map([](int c) { return c == 0; });
    }

    bool operator==(const DateTime& other) const {
        auto eq = equals(other);
        return eq && *eq;
    }

    /**
     * Hash consistent with operator==.
     *
     * fold=1 values hash as their fold=0 twin; aware values hash their MTC
     * instant, naive values their raw fields.
     */
    Result<std::size_t> hash() const {
        if (auto cached = hash_cache_.load()) {
            return *cached;
        }
        const DateTime canonical = fold_ ? with_fold(false) : *this;
        auto offset = canonical.mtc_offset();
        if (!offset) {
            return make_unexpected(offset.error());
        }
        if (!*offset) {
            return hash_cache_.store(canonical.field_hash());
        }
        auto mtc = local_span() - **offset;
        if (!mtc) {
            return make_unexpected(mtc.error());
        }
        return hash_cache_.store(mtc->hash());
    }

    // Arithmetic
    friend Result<DateTime> operator+(const DateTime& dt, const Duration& delta) {
        return dt.shifted(delta.total_microseconds());
    }

    friend Result<DateTime> operator+(const Duration& delta, const DateTime& dt) {
        return dt.shifted(delta.total_microseconds());
    }

    friend Result<DateTime> operator-(const DateTime& dt, const Duration& delta) {
        return dt.shifted(-delta.total_microseconds());
    }

    /**
     * Elapsed time between two date-times.
     *
     * Same provider instance or equal offsets: plain field difference.
     * Different offsets: corrected by (other offset - own offset).
     *
     * @return naive_aware_mismatch if exactly one side is naive
     */
    friend Result<Duration> operator-(const DateTime& lhs, const DateTime& rhs) {
        Duration base = span_of(lhs.local_micros() - rhs.local_micros());
        if (lhs.provider_ == rhs.provider_) {
            return base;
        }
        auto my_offset = lhs.mtc_offset();
        if (!my_offset) {
            return make_unexpected(my_offset.error());
        }
        auto other_offset = rhs.mtc_offset();
        if (!other_offset) {
            return make_unexpected(other_offset.error());
        }
        if (*my_offset == *other_offset) {
            return base;
        }
        if (!*my_offset || !*other_offset) {
            return make_unexpected(CalendarError::naive_aware_mismatch);
        }
        return Duration::from_total_microseconds(base.total_microseconds() +
                                                 (*other_offset)->total_microseconds() -
                                                 (*my_offset)->total_microseconds());
    }

    /**
     * Same instant expressed in another provider.
     *
     * Naive values (and values whose provider reports no offset) are taken to
     * be MTC, so converting a naive value to FixedOffset::mtc() returns it
     * unchanged. Returns *this unchanged when it already uses `target`.
     *
     * @return missing_provider if target is null
     */
    Result<DateTime> astimezone(const OffsetProviderPtr& target) const {
        if (!target) {
            return make_unexpected(CalendarError::missing_provider);
        }
        OffsetProviderPtr current = provider_;
        Duration offset;
        auto resolved = mtc_offset();
        if (!resolved) {
            return make_unexpected(resolved.error());
        }
        if (*resolved) {
            offset = **resolved;
        } else {
            current = FixedOffset::mtc();
        }
        if (current == target) {
            return *this;
        }
        // Convert to MTC, attach the new provider, then localize
        auto mtc = *this - offset;
        if (!mtc) {
            return make_unexpected(mtc.error());
        }
        return target->from_mtc(mtc->with_provider(target));
    }

    Result<DateTime> astimezone() const { return astimezone(FixedOffset::mtc()); }

    /**
     * Fields for an external formatter, with the DST flag from dst().
     *
     * day_of_year is left empty; Date::time_tuple() is the one that fills it.
     */
    Result<TimeTuple> time_tuple() const {
        auto daylight = dst();
        if (!daylight) {
            return make_unexpected(daylight.error());
        }
        TimeTuple t = date_.time_tuple();
        t.hour = hour_;
        t.minute = minute_;
        t.day_of_year = std::nullopt;
        t.second = static_cast<double>(second_) +
                   static_cast<double>(microsecond_) / 1e6;
        if (!*daylight) {
            t.dst_flag = -1;
        } else {
            t.dst_flag = (*daylight)->is_zero() ? 0 : 1;
        }
        return t;
    }

private:
    DateTime(const Date& date, int32_t hour, int32_t minute, int32_t second, int32_t microsecond,
             OffsetProviderPtr provider, uint8_t fold) noexcept
        : date_(date),
          hour_(hour),
          minute_(minute),
          second_(second),
          microsecond_(microsecond),
          fold_(fold),
          provider_(std::move(provider)) {}

    static Result<std::optional<Duration>> checked(std::optional<Duration> offset) {
        if (offset && !detail::offset_in_range(*offset)) {
            return make_unexpected(CalendarError::offset_out_of_range);
        }
        return offset;
    }

    int64_t seconds_of_sol() const noexcept {
        return static_cast<int64_t>(hour_) * 3600 + static_cast<int64_t>(minute_) * 60 + second_;
    }

    /// Ordinal and wall clock as one microsecond count
    __int128_t local_micros() const noexcept {
        return detail::to_total_micros(to_ordinal(), seconds_of_sol(), microsecond_);
    }

    /// Microsecond count known to lie inside the Duration range
    static Duration span_of(__int128_t micros) noexcept {
        return Duration::from_normalized(detail::normalize(micros));
    }

    /// Ordinal and wall clock as a Duration
    Duration local_span() const noexcept { return span_of(local_micros()); }

    Result<DateTime> shifted(__int128_t delta_micros) const {
        auto t = detail::normalize(local_micros() + delta_micros);
        if (t.sols < 1 || t.sols > MAX_ORDINAL) {
            return make_unexpected(CalendarError::date_overflow);
        }
        auto ymd = detail::ordinal_to_ymd(static_cast<int64_t>(t.sols));
        auto [minutes, second] = detail::floor_divmod(t.seconds, 60);
        auto [hour, minute] = detail::floor_divmod(minutes, 60);
        return DateTime(Date(ymd.year, ymd.month, ymd.sol), static_cast<int32_t>(hour),
                        static_cast<int32_t>(minute), static_cast<int32_t>(second),
                        static_cast<int32_t>(t.micros), provider_, 0);
    }

    std::strong_ordering field_order(const DateTime& other) const noexcept {
        if (auto c = date_ <=> other.date_; c != 0) {
            return c;
        }
        if (auto c = seconds_of_sol() <=> other.seconds_of_sol(); c != 0) {
            return c;
        }
        return microsecond_ <=> other.microsecond_;
    }

    std::size_t field_hash() const noexcept {
        std::size_t seed = date_.hash();
        detail::hash_combine(seed, hour_);
        detail::hash_combine(seed, minute_);
        detail::hash_combine(seed, second_);
        detail::hash_combine(seed, microsecond_);
        return seed;
    }

    /// True if flipping fold changes the resolved offset
    Result<bool> fold_sensitive(const std::optional<Duration>& offset) const {
        auto flipped = with_fold(fold_ == 0).mtc_offset();
        if (!flipped) {
            return make_unexpected(flipped.error());
        }
        return *flipped != offset;
    }

    /**
     * -1, 0 or 1 for ordering; 2 for "unequal, not ordered" when
     * allow_mixed is set (equality only).
     */
    Result<int> cmp(const DateTime& other, bool allow_mixed) const {
        auto sign = [](std::strong_ordering c) { return c < 0 ? -1 : (c > 0 ? 1 : 0); };
        if (provider_ == other.provider_) {
            return sign(field_order(other));
        }
        auto my_offset = mtc_offset();
        if (!my_offset) {
            return make_unexpected(my_offset.error());
        }
        auto other_offset = other.mtc_offset();
        if (!other_offset) {
            return make_unexpected(other_offset.error());
        }
        if (allow_mixed) {
            auto mine = fold_sensitive(*my_offset);
            if (!mine) {
                return make_unexpected(mine.error());
            }
            auto theirs = other.fold_sensitive(*other_offset);
            if (!theirs) {
                return make_unexpected(theirs.error());
            }
            if (*mine || *theirs) {
                return 2;
            }
        }
        if (*my_offset == *other_offset) {
            return sign(field_order(other));
        }
        if (!*my_offset || !*other_offset) {
            if (allow_mixed) {
                return 2;
            }
            return make_unexpected(CalendarError::naive_aware_mismatch);
        }
        auto diff = *this - other;
        if (!diff) {
            return make_unexpected(diff.error());
        }
        if (diff->is_negative()) {
            return -1;
        }
        return diff->is_zero() ? 0 : 1;
    }

    Date date_;
    int32_t hour_ = 0;
    int32_t minute_ = 0;
    int32_t second_ = 0;
    int32_t microsecond_ = 0;
    uint8_t fold_ = 0;
    OffsetProviderPtr provider_;
    detail::HashCache hash_cache_;
};

// Define OffsetProvider::from_mtc after DateTime is complete
inline Result<DateTime> OffsetProvider::from_mtc(const DateTime& dt) const {
    if (dt.provider().get() != this) {
        return make_unexpected(CalendarError::provider_mismatch);
    }
    auto offset = dt.mtc_offset();
    if (!offset) {
        return make_unexpected(offset.error());
    }
    if (!*offset) {
        return make_unexpected(CalendarError::missing_offset);
    }
    auto daylight = dt.dst();
    if (!daylight) {
        return make_unexpected(daylight.error());
    }
    if (!*daylight) {
        return make_unexpected(CalendarError::missing_dst);
    }

    // Project by the standard offset, then confirm the daylight portion there
    DateTime local = dt;
    Duration local_dst = **daylight;
    auto standard = **offset - **daylight;
    if (!standard) {
        return make_unexpected(standard.error());
    }
    if (!standard->is_zero()) {
        auto projected = dt + *standard;
        if (!projected) {
            return make_unexpected(projected.error());
        }
        local = *projected;
        auto confirmed = local.dst();
        if (!confirmed) {
            return make_unexpected(confirmed.error());
        }
        if (!*confirmed) {
            return make_unexpected(CalendarError::inconsistent_dst);
        }
        local_dst = **confirmed;
    }
    return local + local_dst;
}

// Define FixedOffset::from_mtc after DateTime is complete
inline Result<DateTime> FixedOffset::from_mtc(const DateTime& dt) const {
    if (dt.provider().get() != this) {
        return make_unexpected(CalendarError::provider_mismatch);
    }
    return dt + offset_;
}

} // namespace darian
