#include <gtest/gtest.h>

#include <random>

#include "../include/errors.hpp"
#include "../include/rotation_interval.hpp"

TEST(RotationIntervalTest, ParsesFixedValue) {
  auto interval = RotationInterval::parse("60");
  EXPECT_EQ(interval.lo(), 60u);
  EXPECT_EQ(interval.hi(), 60u);
  EXPECT_FALSE(interval.isRange());

  std::mt19937 rng(1);
  EXPECT_EQ(interval.sample(rng), 60u);
  EXPECT_EQ(interval.toString(), "60s");
}

TEST(RotationIntervalTest, ParsesRangeWithSpaces) {
  auto interval = RotationInterval::parse(" 30 - 120 ");
  EXPECT_EQ(interval.lo(), 30u);
  EXPECT_EQ(interval.hi(), 120u);
  EXPECT_TRUE(interval.isRange());
  EXPECT_EQ(interval.toString(), "30-120s");
}

TEST(RotationIntervalTest, RangeSamplesStayWithinBounds) {
  auto interval = RotationInterval::parse("30-120");
  std::mt19937 rng(42);
  bool sawLow = false;
  bool sawHigh = false;
  for (int i = 0; i < 10000; ++i) {
    const auto value = interval.sample(rng);
    ASSERT_GE(value, 30u);
    ASSERT_LE(value, 120u);
    sawLow = sawLow || value == 30u;
    sawHigh = sawHigh || value == 120u;
  }
  EXPECT_TRUE(sawLow);
  EXPECT_TRUE(sawHigh);
}

TEST(RotationIntervalTest, DegenerateRangeIsFixed) {
  auto interval = RotationInterval::parse("45-45");
  EXPECT_FALSE(interval.isRange());
}

TEST(RotationIntervalTest, RejectsMalformedInput) {
  for (const char* bad :
       {"abc", "", "   ", "-5", "5-", "10-5", "1-2-3", "60s", "6 0", "1.5",
        "99999999999999999999"}) {
    EXPECT_THROW(RotationInterval::parse(bad), IntervalFormatError) << bad;
  }
}

TEST(RotationIntervalTest, FormatErrorCarriesExitCode) {
  try {
    RotationInterval::parse("abc");
    FAIL() << "expected IntervalFormatError";
  } catch (const FatalError& e) {
    EXPECT_EQ(e.code(), ExitCode::MalformedInterval);
    EXPECT_EQ(toInt(e.code()), 8);
  }
}

TEST(RotationIntervalTest, DefaultRotationConfig) {
  RotationConfig config;
  EXPECT_EQ(config.interval.lo(), 60u);
  EXPECT_EQ(config.count, 10u);
}
