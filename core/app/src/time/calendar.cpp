#include "vclock/time/calendar.hpp"

#include <cstddef>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace vclock {

namespace {

constexpr std::int64_t kSecondsPerDay = 86400;

// -----------------------------------------------------------------------------
// daysFromCivil / civilFromDays
// -----------------------------------------------------------------------------
// Howard Hinnant's civil calendar algorithms. Eras are 400-year blocks, the
// year is shifted so it starts in March (leap day is the last day of the
// shifted year). Valid for the whole int64 day range we can represent.
// -----------------------------------------------------------------------------
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const auto yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

struct CivilDate {
  std::int64_t year;
  unsigned month;
  unsigned day;
};

CivilDate civilFromDays(std::int64_t z) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const auto doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  return CivilDate{m <= 2 ? y + 1 : y, m, d};
}

bool isLeapYear(std::int64_t y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned daysInMonth(std::int64_t y, unsigned m) {
  static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30,
                                       31, 31, 30, 31, 30, 31};
  if (m == 2 && isLeapYear(y)) {
    return 29;
  }
  return kDays[m - 1];
}

// Reads text[pos, pos + width) as an unsigned decimal. Every character must
// be an ASCII digit.
bool readDigits(const std::string& text, std::size_t pos, std::size_t width,
                unsigned& out) {
  out = 0;
  for (std::size_t i = pos; i < pos + width; ++i) {
    const char c = text[i];
    if (c < '0' || c > '9') {
      return false;
    }
    out = out * 10 + static_cast<unsigned>(c - '0');
  }
  return true;
}

}  // namespace

// -----------------------------------------------------------------------------
// makeCalendarInstant()
// -----------------------------------------------------------------------------
CalendarInstant makeCalendarInstant(int year, unsigned month, unsigned day,
                                    unsigned hour, unsigned minute,
                                    unsigned second) {
  const std::int64_t days = daysFromCivil(year, month, day);
  const std::int64_t secs = days * kSecondsPerDay + hour * 3600 +
                            minute * 60 + static_cast<std::int64_t>(second);
  return CalendarInstant{std::chrono::seconds{secs}};
}

CalendarInstant defaultEpoch() { return makeCalendarInstant(2024, 1, 1); }

// -----------------------------------------------------------------------------
// formatIso()
// -----------------------------------------------------------------------------
std::string formatIso(CalendarInstant instant) {
  const std::int64_t total = instant.time_since_epoch().count();

  // Floor division so negative instants map to the preceding day.
  std::int64_t days = total / kSecondsPerDay;
  std::int64_t rem = total % kSecondsPerDay;
  if (rem < 0) {
    rem += kSecondsPerDay;
    --days;
  }

  const CivilDate date = civilFromDays(days);

  std::ostringstream out;
  out << std::setfill('0') << std::setw(4) << date.year << '-'
      << std::setw(2) << date.month << '-' << std::setw(2) << date.day << ' '
      << std::setw(2) << rem / 3600 << ':' << std::setw(2) << (rem / 60) % 60
      << ':' << std::setw(2) << rem % 60;
  return out.str();
}

// -----------------------------------------------------------------------------
// parseIso()
// -----------------------------------------------------------------------------
// Fixed layout: YYYY-MM-DD, optionally followed by ' ' or 'T' and HH:MM:SS.
// -----------------------------------------------------------------------------
CalendarInstant parseIso(const std::string& text) {
  const bool date_only = text.size() == 10;
  if (!date_only && text.size() != 19) {
    throw std::invalid_argument("parseIso: malformed date-time '" + text +
                                "'");
  }

  unsigned year = 0;
  unsigned month = 0;
  unsigned day = 0;
  unsigned hour = 0;
  unsigned minute = 0;
  unsigned second = 0;

  bool ok = readDigits(text, 0, 4, year) && text[4] == '-' &&
            readDigits(text, 5, 2, month) && text[7] == '-' &&
            readDigits(text, 8, 2, day);
  if (ok && !date_only) {
    ok = (text[10] == ' ' || text[10] == 'T') &&
         readDigits(text, 11, 2, hour) && text[13] == ':' &&
         readDigits(text, 14, 2, minute) && text[16] == ':' &&
         readDigits(text, 17, 2, second);
  }
  if (!ok) {
    throw std::invalid_argument("parseIso: malformed date-time '" + text +
                                "'");
  }

  if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month) ||
      hour > 23 || minute > 59 || second > 59) {
    throw std::invalid_argument("parseIso: field out of range in '" + text +
                                "'");
  }

  return makeCalendarInstant(static_cast<int>(year), month, day, hour, minute,
                             second);
}

// -----------------------------------------------------------------------------
// addSecondsSaturating()
// -----------------------------------------------------------------------------
CalendarInstant addSecondsSaturating(CalendarInstant instant,
                                     std::int64_t seconds) {
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  constexpr auto kMin = std::numeric_limits<std::int64_t>::min();

  const std::int64_t base = instant.time_since_epoch().count();
  if (seconds > 0 && base > kMax - seconds) {
    return CalendarInstant::max();
  }
  if (seconds < 0 && base < kMin - seconds) {
    return CalendarInstant::min();
  }
  return CalendarInstant{std::chrono::seconds{base + seconds}};
}

}  // namespace vclock
