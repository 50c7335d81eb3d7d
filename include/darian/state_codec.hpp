#pragma once

#include "darian/date.hpp"
#include "darian/datetime.hpp"
#include "darian/detail/byte_io.hpp"
#include "darian/detail/sol_math.hpp"
#include "darian/duration.hpp"
#include "darian/error.hpp"
#include "darian/timezone.hpp"

#include <array>
#include <span>
#include <utility>

#include <cstddef>
#include <cstdint>

namespace darian {

/**
 * Compact versioned byte encoding of the value types.
 *
 * Every encoding starts with the format version byte.
 *
 * | type     | size | layout after the version byte                         |
 * |----------|------|-------------------------------------------------------|
 * | Date     | 5    | year hi, year lo, month, sol                          |
 * | DateTime | 11   | year hi, year lo, month (bit 7 = fold), sol,          |
 * |          |      | hour, minute, second, µs hi, µs mid, µs lo            |
 * | Duration | 13   | sols, seconds, microseconds (int32 big-endian each)   |
 *
 * Decoding re-validates every field; the offset provider of a DateTime is
 * not part of the encoding and is supplied by the caller.
 */

inline constexpr uint8_t STATE_VERSION = 1;

inline constexpr std::size_t DATE_STATE_SIZE = 5;
inline constexpr std::size_t DATETIME_STATE_SIZE = 11;
inline constexpr std::size_t DURATION_STATE_SIZE = 13;

namespace detail {

inline constexpr uint8_t FOLD_BIT = 0x80;
inline constexpr uint8_t MONTH_MASK = 0x7F;

inline Result<void> check_state_header(std::span<const uint8_t> bytes,
                                       std::size_t expected_size) noexcept {
    if (bytes.size() != expected_size) {
        return make_unexpected(CalendarError::state_size_mismatch);
    }
    if (bytes[0] != STATE_VERSION) {
        return make_unexpected(CalendarError::state_version_mismatch);
    }
    return {};
}

} // namespace detail

inline std::array<uint8_t, DATE_STATE_SIZE> encode_state(const Date& d) noexcept {
    return {STATE_VERSION, static_cast<uint8_t>(d.year() >> 8),
            static_cast<uint8_t>(d.year() & 0xFF), static_cast<uint8_t>(d.month()),
            static_cast<uint8_t>(d.sol())};
}

inline std::array<uint8_t, DATETIME_STATE_SIZE> encode_state(const DateTime& dt) noexcept {
    auto month = static_cast<uint8_t>(dt.month());
    if (dt.fold() != 0) {
        month |= detail::FOLD_BIT;
    }
    auto us = static_cast<uint32_t>(dt.microsecond());
    return {STATE_VERSION,
            static_cast<uint8_t>(dt.year() >> 8),
            static_cast<uint8_t>(dt.year() & 0xFF),
            month,
            static_cast<uint8_t>(dt.sol()),
            static_cast<uint8_t>(dt.hour()),
            static_cast<uint8_t>(dt.minute()),
            static_cast<uint8_t>(dt.second()),
            static_cast<uint8_t>(us >> 16),
            static_cast<uint8_t>((us >> 8) & 0xFF),
            static_cast<uint8_t>(us & 0xFF)};
}

inline std::array<uint8_t, DURATION_STATE_SIZE> encode_state(const Duration& d) noexcept {
    std::array<uint8_t, DURATION_STATE_SIZE> out{};
    out[0] = STATE_VERSION;
    auto body = std::span<uint8_t>(out).subspan(1);
    detail::write_i32(body.subspan(0, 4), d.sols());
    detail::write_i32(body.subspan(4, 4), d.seconds());
    detail::write_i32(body.subspan(8, 4), d.microseconds());
    return out;
}

inline Result<Date> decode_date_state(std::span<const uint8_t> bytes) noexcept {
    if (auto header = detail::check_state_header(bytes, DATE_STATE_SIZE); !header) {
        return make_unexpected(header.error());
    }
    return Date::from_ymd((bytes[1] << 8) | bytes[2], bytes[3], bytes[4]);
}

/// Decode a DateTime and attach `provider` (nullptr for a naive value)
inline Result<DateTime> decode_datetime_state(std::span<const uint8_t> bytes,
                                              OffsetProviderPtr provider = nullptr) noexcept {
    if (auto header = detail::check_state_header(bytes, DATETIME_STATE_SIZE); !header) {
        return make_unexpected(header.error());
    }
    int64_t fold = (bytes[3] & detail::FOLD_BIT) != 0 ? 1 : 0;
    int64_t month = bytes[3] & detail::MONTH_MASK;
    int64_t microsecond = (static_cast<int64_t>(bytes[8]) << 16) |
                          (static_cast<int64_t>(bytes[9]) << 8) | bytes[10];
    return DateTime::from_fields((bytes[1] << 8) | bytes[2], month, bytes[4], bytes[5], bytes[6],
                                 bytes[7], microsecond, std::move(provider), fold);
}

inline Result<Duration> decode_duration_state(std::span<const uint8_t> bytes) noexcept {
    if (auto header = detail::check_state_header(bytes, DURATION_STATE_SIZE); !header) {
        return make_unexpected(header.error());
    }
    auto body = bytes.subspan(1);
    int32_t sols = detail::read_i32(body.subspan(0, 4));
    int32_t seconds = detail::read_i32(body.subspan(4, 4));
    int32_t micros = detail::read_i32(body.subspan(8, 4));
    if (sols < -MAX_DURATION_SOLS || sols > MAX_DURATION_SOLS) {
        return make_unexpected(CalendarError::duration_overflow);
    }
    if (seconds < 0 || seconds >= detail::SECONDS_PER_SOL) {
        return make_unexpected(CalendarError::second_out_of_range);
    }
    if (micros < 0 || micros >= detail::MICROS_PER_SECOND) {
        return make_unexpected(CalendarError::microsecond_out_of_range);
    }
    return Duration::from_total_microseconds(detail::to_total_micros(sols, seconds, micros));
}

} // namespace darian
