#include <gtest/gtest.h>

#include "smartpark/clock.h"
#include "testSupport.h"

using namespace std;
using namespace smartpark;

TEST(Clock, IsoTimeRoundTripsMilliseconds) {
  EXPECT_EQ(formatIsoTime(at("2026-10-17T08:05:03.120Z")), "2026-10-17T08:05:03.120Z");
  EXPECT_EQ(formatIsoTime(at("2026-10-17T08:05:03Z")), "2026-10-17T08:05:03.000Z");
  EXPECT_EQ(formatIsoTime(at("2026-10-17T08:05:03.5Z")), "2026-10-17T08:05:03.500Z");
}

TEST(Clock, ParseRejectsMalformedText) {
  EXPECT_FALSE(parseIsoTime("yesterday"));
  EXPECT_FALSE(parseIsoTime("2026-10-17T08:05:03"));
  EXPECT_FALSE(parseIsoTime("2026-10-17T08:05:03.Z"));
  EXPECT_FALSE(parseIsoTime("2026-10-17T08:05:03+02:00"));
}

TEST(Clock, CalendarHelpersApplyTheOffset) {
  TimePoint t = at("2026-10-17T23:30:00.000Z");
  EXPECT_EQ(formatDay(dayNumber(t, chrono::minutes(0))), "2026-10-17");
  EXPECT_EQ(formatDay(dayNumber(t, chrono::minutes(120))), "2026-10-18");
  EXPECT_EQ(hourOfDay(t, chrono::minutes(0)), 23);
  EXPECT_EQ(hourOfDay(t, chrono::minutes(120)), 1);
  EXPECT_EQ(formatDateTime(t, chrono::minutes(120)), "2026-10-18 01:30:00");
}

TEST(Clock, ManualClockOnlyMovesWhenTold) {
  ManualClock clock(at("2026-10-17T08:00:00.000Z"));
  EXPECT_EQ(clock.now(), at("2026-10-17T08:00:00.000Z"));
  clock.advance(chrono::minutes(90));
  EXPECT_EQ(clock.now(), at("2026-10-17T09:30:00.000Z"));
  clock.set(at("2026-10-18T00:00:00.000Z"));
  EXPECT_EQ(formatIsoTime(clock.now()), "2026-10-18T00:00:00.000Z");
}

TEST(Clock, SystemClockHasMillisecondPrecision) {
  SystemClock clock;
  TimePoint now = clock.now();
  EXPECT_TRUE(parseIsoTime(formatIsoTime(now)) == now);
}
