#include "durationstring.hpp"

#include <gtest/gtest.h>

#include <chrono>

#include "fxt_invalid_argument_exception.hpp"
#include "timedef.hpp"

namespace fxt {

TEST(ParseDuration, EmptyDurationNotAllowed) { EXPECT_THROW(ParseDuration(""), invalid_argument); }

TEST(ParseDuration, DurationDays) { EXPECT_EQ(ParseDuration("1d"), std::chrono::days(1)); }

TEST(ParseDuration, DurationHours) { EXPECT_EQ(ParseDuration("24h"), std::chrono::hours(24)); }

TEST(ParseDuration, DurationMinutes) { EXPECT_EQ(ParseDuration("5min"), std::chrono::minutes(5)); }

TEST(ParseDuration, DurationMinutesSpaces) {
  EXPECT_EQ(ParseDuration("1 h 45      min "), std::chrono::hours(1) + std::chrono::minutes(45));
}

TEST(ParseDuration, DurationMilliseconds) { EXPECT_EQ(ParseDuration("1500 ms"), milliseconds(1500)); }

TEST(ParseDuration, DurationLongTime) {
  EXPECT_EQ(ParseDuration("1w2d3s"), std::chrono::weeks(1) + std::chrono::days(2) + seconds(3));
}

TEST(ParseDuration, DurationThrowInvalidTimeUnit) { EXPECT_THROW(ParseDuration("13z"), invalid_argument); }

TEST(ParseDuration, DurationThrowMissingUnit) { EXPECT_THROW(ParseDuration("42"), invalid_argument); }

TEST(ParseDuration, DurationThrowOnlyIntegral) { EXPECT_THROW(ParseDuration("2.5min"), invalid_argument); }

TEST(DurationString, DurationToStringUndefined) { EXPECT_EQ(DurationToString(kUndefinedDuration), "<undef>"); }

TEST(DurationString, DurationToStringZero) { EXPECT_EQ(DurationToString(Duration{}), "0s"); }

TEST(DurationString, DurationToStringHours) { EXPECT_EQ(DurationToString(std::chrono::hours(24)), "1d"); }

TEST(DurationString, DurationToStringTwoUnits) {
  EXPECT_EQ(DurationToString(std::chrono::hours(1) + std::chrono::minutes(30)), "1h30min");
}

TEST(DurationString, DurationToStringSignificantUnits) {
  EXPECT_EQ(DurationToString(std::chrono::hours(1) + std::chrono::minutes(30) + seconds(10), 1), "1h");
}

}  // namespace fxt
