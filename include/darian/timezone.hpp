#pragma once

#include "darian/duration.hpp"
#include "darian/error.hpp"

#include <iomanip>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include <cstddef>
#include <cstdint>

namespace darian {

class DateTime;

/**
 * Source of offsets from Coordinated Mars Time (MTC) for date-time values.
 *
 * Implementations answer three questions for a given local date-time (or for
 * no particular instant when passed nullptr):
 * - mtc_offset(): local time minus MTC, strictly inside +/-24 hours, or
 *   nullopt if unknown. It already includes any daylight portion.
 * - dst(): the daylight portion of that offset, or nullopt if unknown
 * - name(): free-form display name, or nullopt
 *
 * Offsets are range-checked by DateTime at the call site, not here.
 * Implementations must be pure functions of their argument; one instance is
 * shared by every DateTime that refers to it.
 *
 * from_mtc() and FixedOffset::from_mtc() are defined in datetime.hpp once
 * DateTime is complete, so include that header (or darian.hpp).
 */
class OffsetProvider {
public:
    virtual ~OffsetProvider() = default;

    virtual std::optional<Duration> mtc_offset(const DateTime* dt) const = 0;
    virtual std::optional<Duration> dst(const DateTime* dt) const = 0;
    virtual std::optional<std::string> name(const DateTime* dt) const = 0;

    /**
     * Convert an MTC date-time carrying this provider to local time.
     *
     * The default projects by (offset - dst), re-reads dst() at the projected
     * local time once and adds it. Providers with a fixed rule may override.
     *
     * @return provider_mismatch if dt does not carry this provider,
     *         missing_offset / missing_dst / inconsistent_dst if the provider
     *         cannot give a definite answer
     */
    virtual Result<DateTime> from_mtc(const DateTime& dt) const;

protected:
    OffsetProvider() = default;
    OffsetProvider(const OffsetProvider&) = default;
    OffsetProvider& operator=(const OffsetProvider&) = default;
};

/// Shared handle to a provider; DateTime never owns one exclusively
using OffsetProviderPtr = std::shared_ptr<const OffsetProvider>;

namespace detail {

/// Largest |offset| a provider may report: 24 hours minus one microsecond
inline constexpr __int128_t MAX_OFFSET_MICROS = MICROS_PER_SOL - 1;

inline bool offset_in_range(const Duration& offset) noexcept {
    __int128_t micros = offset.total_microseconds();
    return micros >= -MAX_OFFSET_MICROS && micros <= MAX_OFFSET_MICROS;
}

/// "+HH:MM", extended with ":SS" and ".ffffff" only when they are non-zero
inline std::string format_offset(const Duration& offset) {
    __int128_t micros = offset.total_microseconds();
    char sign = '+';
    if (micros < 0) {
        sign = '-';
        micros = -micros;
    }
    auto [whole_seconds, us] = floor_divmod(micros, MICROS_PER_SECOND);
    auto [whole_minutes, ss] = floor_divmod(whole_seconds, 60);
    auto [hh, mm] = floor_divmod(whole_minutes, 60);

    std::ostringstream oss;
    oss << sign << std::setfill('0') << std::setw(2) << static_cast<int64_t>(hh) << ':'
        << std::setw(2) << static_cast<int64_t>(mm);
    if (ss != 0 || us != 0) {
        oss << ':' << std::setw(2) << static_cast<int64_t>(ss);
        if (us != 0) {
            oss << '.' << std::setw(6) << static_cast<int64_t>(us);
        }
    }
    return oss.str();
}

} // namespace detail

/**
 * Provider with one constant offset and no daylight rule.
 *
 * A zero offset created without a name is always the shared mtc() instance,
 * so identity checks see a single reference provider.
 *
 * Example:
 * @code
 * auto tz = FixedOffset::create(*Duration::from_hours(-5));
 * if (tz) {
 *     auto dt = DateTime::from_fields(219, 13, 27, 12, 0, 0, 0, *tz);
 * }
 * @endcode
 */
class FixedOffset final : public OffsetProvider {
    // Construction goes through create(), mtc(), min() and max()
    struct Key {
        explicit Key() = default;
    };

public:
    FixedOffset(Key, const Duration& offset, std::optional<std::string> name)
        : offset_(offset),
          name_(std::move(name)) {}

    /**
     * @param offset Offset strictly inside +/-24 hours
     * @param name Display name; generated from the offset when omitted
     * @return offset_out_of_range for offsets of 24 hours or more
     */
    static Result<std::shared_ptr<const FixedOffset>>
    create(const Duration& offset, std::optional<std::string> name = std::nullopt) {
        if (!name && offset.is_zero()) {
            return mtc();
        }
        if (!detail::offset_in_range(offset)) {
            return make_unexpected(CalendarError::offset_out_of_range);
        }
        return std::make_shared<const FixedOffset>(Key{}, offset, std::move(name));
    }

    /// The MTC reference provider (zero offset, named "MTC")
    static const std::shared_ptr<const FixedOffset>& mtc() {
        static const auto instance =
            std::make_shared<const FixedOffset>(Key{}, Duration::zero(), std::nullopt);
        return instance;
    }

    /// -23:59
    static const std::shared_ptr<const FixedOffset>& min() {
        static const auto instance = std::make_shared<const FixedOffset>(
            Key{}, *Duration::from_minutes(-(23 * 60 + 59)), std::nullopt);
        return instance;
    }

    /// +23:59
    static const std::shared_ptr<const FixedOffset>& max() {
        static const auto instance = std::make_shared<const FixedOffset>(
            Key{}, *Duration::from_minutes(23 * 60 + 59), std::nullopt);
        return instance;
    }

    const Duration& offset() const noexcept { return offset_; }

    /// Name used when none was given: "MTC" or "MTC+HH:MM[:SS[.ffffff]]"
    static std::string name_from_offset(const Duration& offset) {
        if (offset.is_zero()) {
            return "MTC";
        }
        return "MTC" + detail::format_offset(offset);
    }

    /// Display name, independent of any instant
    std::string display_name() const {
        if (name_) {
            return *name_;
        }
        return name_from_offset(offset_);
    }

    std::optional<Duration> mtc_offset(const DateTime*) const override { return offset_; }
    std::optional<Duration> dst(const DateTime*) const override { return std::nullopt; }
    std::optional<std::string> name(const DateTime*) const override { return display_name(); }

    Result<DateTime> from_mtc(const DateTime& dt) const override;

    // Equality and hash follow the offset only
    bool operator==(const FixedOffset& other) const noexcept { return offset_ == other.offset_; }

    std::size_t hash() const noexcept { return offset_.hash(); }

private:
    Duration offset_;
    std::optional<std::string> name_;
};

} // namespace darian

template <>
struct std::hash<darian::FixedOffset> {
    std::size_t operator()(const darian::FixedOffset& tz) const noexcept { return tz.hash(); }
};
