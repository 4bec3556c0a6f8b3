#include <gtest/gtest.h>

#include "tornet/ilogger.hpp"

class TimeFormatterTest : public ::testing::Test {
 protected:
  void TearDown() override {
    tornet::TimeFormatter::setGlobalFormat("%Y-%m-%d %T");
  }
};

TEST_F(TimeFormatterTest, DefaultFormatHasDateAndTime) {
  const std::string formatted =
      tornet::TimeFormatter::format(std::chrono::system_clock::now());
  // YYYY-MM-DD HH:MM:SS
  ASSERT_EQ(formatted.size(), 19u);
  EXPECT_EQ(formatted[4], '-');
  EXPECT_EQ(formatted[10], ' ');
  EXPECT_EQ(formatted[13], ':');
}

TEST_F(TimeFormatterTest, CustomFormatApplies) {
  ASSERT_TRUE(tornet::TimeFormatter::setGlobalFormat("%H:%M"));
  EXPECT_EQ(tornet::TimeFormatter::format(std::chrono::system_clock::now())
                .size(),
            5u);
}

TEST_F(TimeFormatterTest, EmptyFormatRejected) {
  EXPECT_FALSE(tornet::TimeFormatter::setGlobalFormat(""));
  EXPECT_EQ(tornet::TimeFormatter::format(std::chrono::system_clock::now())
                .size(),
            19u);
}
