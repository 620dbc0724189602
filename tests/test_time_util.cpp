#include "io/TimeUtil.hpp"
#include "models/Errors.hpp"
#include <gtest/gtest.h>

TEST(TimeUtil, DaysFromCivil) {
  EXPECT_EQ(days_from_civil(1970, 1, 1), 0);
  EXPECT_EQ(days_from_civil(1969, 12, 31), -1);
  EXPECT_EQ(days_from_civil(2000, 3, 1), 11017);
}

TEST(TimeUtil, ParseUtc) {
  EXPECT_DOUBLE_EQ(parse_iso8601("2019-06-01T07:30:00Z"), 1559374200.0);
  EXPECT_DOUBLE_EQ(parse_iso8601("2000-02-29T12:00:05Z"), 951825605.0);
  // no zone is read as UTC
  EXPECT_DOUBLE_EQ(parse_iso8601("2019-06-01T07:30:00"), 1559374200.0);
}

TEST(TimeUtil, ParseFractionAndOffset) {
  EXPECT_DOUBLE_EQ(parse_iso8601("2019-06-01T07:30:00.250Z"), 1559374200.25);
  EXPECT_DOUBLE_EQ(parse_iso8601("2019-06-01T09:30:00+02:00"), 1559374200.0);
  EXPECT_DOUBLE_EQ(parse_iso8601("2019-06-01T02:30:00-05:00"), 1559374200.0);
}

TEST(TimeUtil, MalformedThrows) {
  EXPECT_THROW(parse_iso8601(""), DecodeError);
  EXPECT_THROW(parse_iso8601("yesterday"), DecodeError);
  EXPECT_THROW(parse_iso8601("2019-13-01T00:00:00Z"), DecodeError);
  EXPECT_THROW(parse_iso8601("2019-06-01T07:30:00 UTC"), DecodeError);
}

TEST(TimeUtil, FormatRoundTrip) {
  EXPECT_EQ(format_iso8601(0), "1970-01-01T00:00:00Z");
  EXPECT_EQ(format_iso8601(1559374200.75), "2019-06-01T07:30:00Z");
  EXPECT_EQ(format_iso8601(951825605), "2000-02-29T12:00:05Z");
  EXPECT_EQ(format_iso8601(-1), "1969-12-31T23:59:59Z");
}

TEST(TimeUtil, FitEpoch) {
  EXPECT_EQ(format_iso8601(kFitEpochOffset), "1989-12-31T00:00:00Z");
}
