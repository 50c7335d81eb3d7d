#pragma once

#include "darian/date.hpp"
#include "darian/datetime.hpp"
#include "darian/duration.hpp"
#include "darian/error.hpp"
#include "darian/timezone.hpp"

#include <iomanip>
#include <sstream>
#include <string>

#include <cstdint>
#include <cstdlib>

namespace darian {

namespace detail {

/// "HH:MM:SS", plus ".ffffff" when microseconds are non-zero
inline void write_clock(std::ostringstream& oss, int64_t hour, int64_t minute, int64_t second,
                        int64_t microsecond, int hour_width) {
    oss << std::setfill('0') << std::setw(hour_width) << hour << ':' << std::setw(2) << minute
        << ':' << std::setw(2) << second;
    if (microsecond != 0) {
        oss << '.' << std::setw(6) << microsecond;
    }
}

} // namespace detail

/**
 * Text form of a duration: "[-]N sol[s], H:MM:SS[.ffffff]".
 *
 * The sol part is omitted when zero. Only sols carry a sign, so -1 µs prints
 * as "-1 sol, 23:59:59.999999".
 */
inline std::string to_string(const Duration& d) {
    std::ostringstream oss;
    if (d.sols() != 0) {
        oss << d.sols() << " sol" << (std::abs(d.sols()) != 1 ? "s" : "") << ", ";
    }
    int64_t ss = d.seconds();
    detail::write_clock(oss, ss / 3600, (ss % 3600) / 60, ss % 60, d.microseconds(), 1);
    return oss.str();
}

/// "YYYY-MM-DD"
inline std::string to_string(const Date& d) {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << d.year() << '-' << std::setw(2) << d.month()
        << '-' << std::setw(2) << d.sol();
    return oss.str();
}

/**
 * "YYYY-MM-DD HH:MM:SS[.ffffff][+HH:MM[:SS[.ffffff]]]"
 *
 * The offset suffix appears for aware values only.
 *
 * @return offset_out_of_range if the provider reports an invalid offset
 */
inline Result<std::string> to_string(const DateTime& dt) {
    auto offset = dt.mtc_offset();
    if (!offset) {
        return make_unexpected(offset.error());
    }
    std::ostringstream oss;
    oss << to_string(dt.date()) << ' ';
    detail::write_clock(oss, dt.hour(), dt.minute(), dt.second(), dt.microsecond(), 2);
    if (*offset) {
        oss << detail::format_offset(**offset);
    }
    return oss.str();
}

} // namespace darian
