#pragma once

/**
 * @file darian.hpp
 * @brief Convenience header for the Darian Martian calendar engine
 *
 * Primary types:
 * - Duration: normalized (sols, seconds, microseconds) interval
 * - Date: Darian calendar date, years 0..9999
 * - DateTime: date plus wall clock, optionally tied to an OffsetProvider
 * - OffsetProvider / FixedOffset: offsets from Coordinated Mars Time (MTC)
 *
 * Functions:
 * - datetime_from_posix(), to_posix(), earth_to_mars(), mars_to_earth():
 *   Earth/Mars conversion (convert.hpp)
 * - to_string(): text forms (format.hpp)
 * - encode_state(), decode_*_state(): compact byte encoding (state_codec.hpp)
 *
 * Fallible operations return darian::Result<T> (expected<T, CalendarError>).
 */

#include "darian/convert.hpp"
#include "darian/date.hpp"
#include "darian/datetime.hpp"
#include "darian/duration.hpp"
#include "darian/error.hpp"
#include "darian/expected.hpp"
#include "darian/format.hpp"
#include "darian/state_codec.hpp"
#include "darian/timezone.hpp"
