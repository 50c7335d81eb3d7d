// include/darian/detail/sol_math.hpp
#pragma once

#include <optional>
#include <utility>

#include <cmath>
#include <cstdint>

namespace darian::detail {

/**
 * Centralized sol arithmetic for Duration and DateTime.
 *
 * Design rationale:
 * - Single source of truth for carry/borrow logic (Duration, Date and DateTime
 *   all normalize through here)
 * - All intermediate work is done on a 128-bit total-microsecond count; the
 *   largest representable duration needs 67 bits
 * - Range checking happens once, when the caller turns the normalized triple
 *   back into a value type
 *
 * Overflow policy:
 * - Helpers here never saturate; they report "does not fit" via std::optional
 *   or leave the final range check to the caller
 */

/// Seconds per sol (a Martian sol is divided into 24 "Martian hours")
inline constexpr int64_t SECONDS_PER_SOL = 24 * 3600;

/// Microseconds per second (10^6)
inline constexpr int64_t MICROS_PER_SECOND = 1'000'000;

/// Microseconds per sol
inline constexpr int64_t MICROS_PER_SOL = SECONDS_PER_SOL * MICROS_PER_SECOND;

/// Largest |sols| a Duration may hold
inline constexpr int64_t MAX_DURATION_SOLS = 999'999'999;

/// Largest total microsecond count of a Duration (Duration::max())
inline constexpr __int128_t MAX_TOTAL_MICROS =
    static_cast<__int128_t>(MAX_DURATION_SOLS + 1) * MICROS_PER_SOL - 1;

/// Smallest total microsecond count of a Duration (Duration::min())
inline constexpr __int128_t MIN_TOTAL_MICROS =
    -static_cast<__int128_t>(MAX_DURATION_SOLS) * MICROS_PER_SOL;

/// Scaling results beyond this magnitude are reported as overflow early
inline constexpr __int128_t MICROS_GUARD = static_cast<__int128_t>(1) << 68;

/**
 * Normalized (sols, seconds, microseconds) triple.
 *
 * seconds is always in [0, 86400) and microseconds in [0, 10^6); the sign
 * lives entirely in sols.
 */
struct SolTime {
    __int128_t sols{0};
    int64_t seconds{0};
    int64_t micros{0};
};

/**
 * Floor division with remainder (Python-style divmod).
 *
 * The remainder takes the sign of the divisor, so -1 divmod 7 is (-1, 6).
 *
 * @param a Dividend
 * @param b Divisor (must not be zero)
 * @return Pair of (quotient, remainder)
 */
constexpr auto floor_divmod(__int128_t a,
                            __int128_t b) noexcept -> std::pair<__int128_t, __int128_t> {
    __int128_t q = a / b;
    __int128_t r = a % b;
    if (r != 0 && ((r < 0) != (b < 0))) {
        --q;
        r += b;
    }
    return {q, r};
}

/// Floor division of 64-bit values
constexpr int64_t floor_div(int64_t a, int64_t b) noexcept {
    return static_cast<int64_t>(floor_divmod(a, b).first);
}

/// Floor modulo of 64-bit values (result has the sign of b)
constexpr int64_t floor_mod(int64_t a, int64_t b) noexcept {
    return static_cast<int64_t>(floor_divmod(a, b).second);
}

/**
 * Combine a (sols, seconds, microseconds) triple into a total microsecond count.
 *
 * Components may be out of range or negative; no normalization is implied.
 */
constexpr __int128_t to_total_micros(__int128_t sols, __int128_t seconds,
                                     __int128_t micros) noexcept {
    return (sols * SECONDS_PER_SOL + seconds) * MICROS_PER_SECOND + micros;
}

/**
 * Normalize a total microsecond count to a SolTime with floor semantics.
 *
 * -1 microsecond becomes {sols: -1, seconds: 86399, micros: 999999}.
 */
constexpr SolTime normalize(__int128_t total_micros) noexcept {
    auto [secs, us] = floor_divmod(total_micros, MICROS_PER_SECOND);
    auto [sols, s] = floor_divmod(secs, SECONDS_PER_SOL);
    return SolTime{sols, static_cast<int64_t>(s), static_cast<int64_t>(us)};
}

/// True if the total microsecond count is representable as a Duration
constexpr bool fits_duration(__int128_t total_micros) noexcept {
    return total_micros >= MIN_TOTAL_MICROS && total_micros <= MAX_TOTAL_MICROS;
}

/**
 * Divide a by b and round the result to the nearest integer.
 *
 * When the ratio is exactly half-way between two integers, the even integer
 * is returned.
 *
 * @param a Dividend
 * @param b Divisor (must not be zero)
 */
constexpr __int128_t divide_and_round(__int128_t a, __int128_t b) noexcept {
    auto [q, r] = floor_divmod(a, b);
    // round up if r / b > 0.5, or r / b == 0.5 and q is odd
    __int128_t twice_r = r * 2;
    bool greater_than_half = b > 0 ? twice_r > b : twice_r < b;
    if (greater_than_half || (twice_r == b && (q % 2) != 0)) {
        ++q;
    }
    return q;
}

/**
 * Round a double to the nearest integer, ties to even.
 *
 * Relies on the default floating-point environment (FE_TONEAREST).
 */
inline double round_half_even(double x) noexcept {
    return std::nearbyint(x);
}

/**
 * Exact binary decomposition of a finite double: value == mantissa * 2^exponent.
 *
 * The mantissa is odd (trailing zero bits are folded into the exponent) unless
 * the value is zero.
 */
struct BinaryRatio {
    int64_t mantissa{0};
    int exponent{0};
};

inline BinaryRatio as_binary_ratio(double x) noexcept {
    if (x == 0.0) {
        return {};
    }
    int exp = 0;
    double frac = std::frexp(x, &exp); // 0.5 <= |frac| < 1
    auto mant = static_cast<int64_t>(std::ldexp(frac, 53));
    exp -= 53;
    while ((mant & 1) == 0) {
        mant /= 2;
        ++exp;
    }
    return BinaryRatio{mant, exp};
}

/**
 * Multiply a microsecond count by a finite double, rounding half to even.
 *
 * The factor is used at its exact binary value, so 0.1 means
 * 3602879701896397 / 2^55 rather than a decimal approximation.
 *
 * @param micros Microsecond count with |micros| <= MAX_TOTAL_MICROS
 * @param factor Finite multiplier
 * @return Rounded product, or nullopt if it cannot fit a Duration
 */
inline std::optional<__int128_t> scale_micros(__int128_t micros, double factor) noexcept {
    if (micros == 0 || factor == 0.0) {
        return __int128_t{0};
    }
    auto [mant, exp] = as_binary_ratio(factor);
    __int128_t product = micros * mant; // < 2^67 * 2^53

    if (exp >= 0) {
        if (exp > 70) {
            return std::nullopt;
        }
        __int128_t scale = static_cast<__int128_t>(1) << exp;
        __int128_t magnitude = product < 0 ? -product : product;
        if (magnitude > MICROS_GUARD / scale) {
            return std::nullopt;
        }
        return product * scale;
    }

    int shift = -exp;
    if (shift >= 126) {
        // |product| < 2^120, so the quotient rounds to zero
        return __int128_t{0};
    }
    return divide_and_round(product, static_cast<__int128_t>(1) << shift);
}

/**
 * Divide a microsecond count by a finite, non-zero double, rounding half to even.
 *
 * @param micros Microsecond count with |micros| <= MAX_TOTAL_MICROS
 * @param divisor Finite, non-zero divisor
 * @return Rounded quotient, or nullopt if it cannot fit a Duration
 */
inline std::optional<__int128_t> divide_micros(__int128_t micros, double divisor) noexcept {
    if (micros == 0) {
        return __int128_t{0};
    }
    auto [mant, exp] = as_binary_ratio(divisor);
    // Move the sign into the dividend so the divisor is positive
    if (mant < 0) {
        mant = -mant;
        micros = -micros;
    }

    if (exp >= 0) {
        if (exp > 70) {
            // |divisor| >= 2^70 > 8 * |micros|
            return __int128_t{0};
        }
        return divide_and_round(micros, static_cast<__int128_t>(mant) << exp);
    }

    // micros * 2^k / mant, evaluated as q0 * 2^s + round(r0 * 2^s / mant)
    int k = -exp;
    if (k > 120) {
        // |micros| * 2^k / 2^53 >= 2^67
        return std::nullopt;
    }
    int base = k < 56 ? k : 56;
    int s = k - base;
    __int128_t shifted = micros * (static_cast<__int128_t>(1) << base); // < 2^123
    if (s == 0) {
        return divide_and_round(shifted, mant);
    }
    auto [q0, r0] = floor_divmod(shifted, mant);
    __int128_t scale = static_cast<__int128_t>(1) << s;
    __int128_t magnitude = q0 < 0 ? -q0 : q0;
    if (magnitude > MICROS_GUARD / scale) {
        return std::nullopt;
    }
    // q0 * 2^s is even, so rounding the remainder term alone keeps ties-to-even
    return q0 * scale + divide_and_round(r0 * scale, mant);
}

} // namespace darian::detail
