#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace vclock {

// -----------------------------------------------------------------------------
// CalendarInstant
// -----------------------------------------------------------------------------
// Type alias for a human-readable point in calendar time. Virtual timestamps
// are mapped onto this type only for display and export; the clock itself
// works in integer virtual seconds.
//
// Calendar values are treated as naive UTC: no timezone or DST adjustment is
// ever applied, and formatting never consults the process locale.
//
// Whole-second resolution in an int64 count, so every virtual timestamp a
// clock can issue (up to about 2.9e11 years) has a calendar instant.
// system_clock::time_point (nanoseconds) would overflow past year 2262.
// -----------------------------------------------------------------------------
using CalendarInstant =
    std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

// -----------------------------------------------------------------------------
// makeCalendarInstant
// -----------------------------------------------------------------------------
// @brief  Builds a CalendarInstant from civil date/time fields.
//
// @param  year, month, day        Proleptic Gregorian date (month 1..12).
// @param  hour, minute, second    Time of day (0..23, 0..59, 0..59).
//
// @details
// Uses the days-from-civil algorithm so the result never depends on
// timegm()/mktime() and the TZ environment variable.
// -------------------------------------------------------------------------
CalendarInstant makeCalendarInstant(int year, unsigned month, unsigned day,
                                    unsigned hour = 0, unsigned minute = 0,
                                    unsigned second = 0);

// Default epoch: 2024-01-01 00:00:00.
CalendarInstant defaultEpoch();

// -------------------------------------------------------------------------
// formatIso
// -------------------------------------------------------------------------
// @brief  Formats an instant as "YYYY-MM-DD HH:MM:SS".
//
// @details
// Years past 9999 print with more digits; instants before 1970 print as
// ordinary proleptic Gregorian dates.
// -------------------------------------------------------------------------
std::string formatIso(CalendarInstant instant);

// -------------------------------------------------------------------------
// parseIso
// -------------------------------------------------------------------------
// @brief  Parses "YYYY-MM-DD HH:MM:SS", "YYYY-MM-DDTHH:MM:SS" or
//         "YYYY-MM-DD".
//
// Every date and time field must be exactly its width in ASCII digits; no
// signs, spaces or short fields.
//
// @throws std::invalid_argument on any other shape or out-of-range field.
// -------------------------------------------------------------------------
CalendarInstant parseIso(const std::string& text);

// -------------------------------------------------------------------------
// floorToSecond
// -------------------------------------------------------------------------
// Converts a finer-grained system_clock instant (e.g. system_clock::now())
// to a CalendarInstant, rounding toward negative infinity.
// -------------------------------------------------------------------------
inline CalendarInstant floorToSecond(std::chrono::system_clock::time_point t) {
  return std::chrono::floor<std::chrono::seconds>(t);
}

// -------------------------------------------------------------------------
// addSecondsSaturating
// -------------------------------------------------------------------------
// instant + seconds, clamped to CalendarInstant::min()/max() instead of
// overflowing the int64 count.
// -------------------------------------------------------------------------
CalendarInstant addSecondsSaturating(CalendarInstant instant,
                                     std::int64_t seconds);

}  // namespace vclock
