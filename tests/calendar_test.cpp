// =============================================================================
// calendar_test.cpp
// =============================================================================
// Unit tests for the calendar helpers in vclock/time/calendar.hpp.
//
// Validates:
//   - formatIso on the default epoch, leap days and pre-1970 instants
//   - parseIso accepted shapes and rejected inputs, including fields that
//     are not all digits
//   - floorToSecond rounding toward negative infinity
//   - addSecondsSaturating at and beyond the int64 limits
// =============================================================================

#include "vclock/time/calendar.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

// -----------------------------------------------------------------------------
// 1. The default epoch formats as midnight, 2024-01-01.
// -----------------------------------------------------------------------------
TEST(CalendarTest, DefaultEpochFormats) {
  EXPECT_EQ(vclock::formatIso(vclock::defaultEpoch()), "2024-01-01 00:00:00");
  EXPECT_EQ(vclock::formatIso(vclock::CalendarInstant{}),
            "1970-01-01 00:00:00");
}

// -----------------------------------------------------------------------------
// 2. Field construction handles leap days and century rules.
// -----------------------------------------------------------------------------
TEST(CalendarTest, MakeInstantLeapYears) {
  EXPECT_EQ(vclock::formatIso(vclock::makeCalendarInstant(2024, 2, 29, 12)),
            "2024-02-29 12:00:00");
  EXPECT_EQ(vclock::formatIso(vclock::makeCalendarInstant(2000, 2, 29)),
            "2000-02-29 00:00:00");

  // One second before the millennium.
  EXPECT_EQ(
      vclock::formatIso(vclock::makeCalendarInstant(1999, 12, 31, 23, 59, 59)),
      "1999-12-31 23:59:59");
}

// -----------------------------------------------------------------------------
// 3. Instants before 1970 floor to the containing second.
// -----------------------------------------------------------------------------
TEST(CalendarTest, FormatsBeforeUnixEpoch) {
  const vclock::CalendarInstant just_before = vclock::floorToSecond(
      std::chrono::system_clock::time_point{} - std::chrono::milliseconds(1));
  EXPECT_EQ(vclock::formatIso(just_before), "1969-12-31 23:59:59");

  EXPECT_EQ(vclock::formatIso(vclock::makeCalendarInstant(1900, 3, 1)),
            "1900-03-01 00:00:00");
}

// -----------------------------------------------------------------------------
// 4. parseIso accepts the space form, the 'T' form and a bare date.
// -----------------------------------------------------------------------------
TEST(CalendarTest, ParseAcceptedShapes) {
  const auto expected = vclock::makeCalendarInstant(2024, 3, 15, 8, 30, 5);
  EXPECT_EQ(vclock::parseIso("2024-03-15 08:30:05"), expected);
  EXPECT_EQ(vclock::parseIso("2024-03-15T08:30:05"), expected);
  EXPECT_EQ(vclock::parseIso("2024-03-15"),
            vclock::makeCalendarInstant(2024, 3, 15));
}

// -----------------------------------------------------------------------------
// 5. parseIso rejects malformed and out-of-range input.
// -----------------------------------------------------------------------------
TEST(CalendarTest, ParseRejectsBadInput) {
  EXPECT_THROW(vclock::parseIso(""), std::invalid_argument);
  EXPECT_THROW(vclock::parseIso("yesterday"), std::invalid_argument);
  EXPECT_THROW(vclock::parseIso("2024-13-01"), std::invalid_argument);
  EXPECT_THROW(vclock::parseIso("2023-02-29"), std::invalid_argument);
  EXPECT_THROW(vclock::parseIso("2024-01-01 24:00:00"), std::invalid_argument);
  EXPECT_THROW(vclock::parseIso("2024-01-01X10:00:00"), std::invalid_argument);
  EXPECT_THROW(vclock::parseIso("2024-01-01 10:00:00Z"),
               std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 6. Every field must be all digits: no blanks, signs or short fields.
// -----------------------------------------------------------------------------
TEST(CalendarTest, ParseRejectsNonDigitFields) {
  EXPECT_THROW(vclock::parseIso("2024- 1-01"), std::invalid_argument);
  EXPECT_THROW(vclock::parseIso("2024-+1-01"), std::invalid_argument);
  EXPECT_THROW(vclock::parseIso("+024-01-01"), std::invalid_argument);
  EXPECT_THROW(vclock::parseIso(" 2024-01-01"), std::invalid_argument);
  EXPECT_THROW(vclock::parseIso("2024-01-01  1:00:00"), std::invalid_argument);
  EXPECT_THROW(vclock::parseIso("2024-01-01 10:-1:00"), std::invalid_argument);
  EXPECT_THROW(vclock::parseIso("2024-1-1 10:00:00"), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 7. formatIso output parses back to the same instant.
// -----------------------------------------------------------------------------
TEST(CalendarTest, FormatThenParse) {
  const auto instant = vclock::makeCalendarInstant(2031, 7, 4, 17, 45, 59);
  EXPECT_EQ(vclock::parseIso(vclock::formatIso(instant)), instant);
}

// -----------------------------------------------------------------------------
// 8. floorToSecond rounds toward negative infinity.
// -----------------------------------------------------------------------------
TEST(CalendarTest, FloorToSecond) {
  using std::chrono::milliseconds;
  using std::chrono::system_clock;
  const auto at = [](long long ms) {
    return vclock::floorToSecond(system_clock::time_point{} +
                                 milliseconds(ms))
        .time_since_epoch()
        .count();
  };
  EXPECT_EQ(at(1500), 1);
  EXPECT_EQ(at(-1), -1);
  EXPECT_EQ(at(-1000), -1);
  EXPECT_EQ(at(-86400000), -86400);
}

// -----------------------------------------------------------------------------
// 9. Dates far past year 2262 are representable and format normally.
// -----------------------------------------------------------------------------
TEST(CalendarTest, FarFutureDates) {
  const auto y9999 = vclock::makeCalendarInstant(9999, 12, 31, 23, 59, 59);
  EXPECT_EQ(vclock::formatIso(y9999), "9999-12-31 23:59:59");
  EXPECT_EQ(vclock::parseIso("9999-12-31 23:59:59"), y9999);
  EXPECT_EQ(vclock::formatIso(vclock::makeCalendarInstant(2500, 6, 15)),
            "2500-06-15 00:00:00");
}

// -----------------------------------------------------------------------------
// 10. addSecondsSaturating clamps instead of overflowing.
// -----------------------------------------------------------------------------
TEST(CalendarTest, AddSecondsSaturates) {
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
  const auto epoch = vclock::defaultEpoch();

  EXPECT_EQ(vclock::addSecondsSaturating(epoch, 86400),
            vclock::makeCalendarInstant(2024, 1, 2));
  EXPECT_EQ(vclock::addSecondsSaturating(epoch, -86400),
            vclock::makeCalendarInstant(2023, 12, 31));
  EXPECT_EQ(vclock::addSecondsSaturating(epoch, kMax),
            vclock::CalendarInstant::max());
  EXPECT_EQ(vclock::addSecondsSaturating(
                vclock::makeCalendarInstant(1900, 1, 1), kMin),
            vclock::CalendarInstant::min());

  // Formatting the extremes must not overflow either.
  EXPECT_FALSE(vclock::formatIso(vclock::CalendarInstant::max()).empty());
  EXPECT_FALSE(vclock::formatIso(vclock::CalendarInstant::min()).empty());
}
