#include <gtest/gtest.h>

#include "../include/exit_policy.hpp"

TEST(ExitPolicyTest, RendersExitNodesValue) {
  ExitPolicy policy{{"ru", "de"}, true};
  EXPECT_EQ(policy.exitNodesValue(), "{ru},{de}");
  EXPECT_EQ(policy.describe(), "ExitNodes {ru},{de}, StrictNodes 1");
}

TEST(ExitPolicyTest, AnyIsUnconstrainedAndNotStrict) {
  const auto any = ExitPolicy::any();
  EXPECT_TRUE(any.isUnconstrained());
  EXPECT_FALSE(any.strict);
  EXPECT_EQ(any.exitNodesValue(), "");
  EXPECT_EQ(any.describe(), "any exit, StrictNodes 0");
}

TEST(ExitPolicyTest, StrictCountryNormalizes) {
  const auto policy = ExitPolicy::strictCountry(" RU ");
  EXPECT_EQ(policy, (ExitPolicy{{"ru"}, true}));
}

TEST(FallbackSpecTest, AnyAndEmptyMeanUnconstrained) {
  EXPECT_TRUE(FallbackSpec::parse("any").isAny());
  EXPECT_TRUE(FallbackSpec::parse(" ANY ").isAny());
  EXPECT_TRUE(FallbackSpec::parse("").isAny());
  EXPECT_TRUE(FallbackSpec::parse(" , ,").isAny());
}

TEST(FallbackSpecTest, ParsesOrderedCountryList) {
  const auto spec = FallbackSpec::parse("de, NL,,fr ");
  EXPECT_EQ(spec.countries, (std::vector<std::string>{"de", "nl", "fr"}));

  const auto policy = spec.toPolicy();
  EXPECT_FALSE(policy.strict);
  EXPECT_EQ(policy.exitNodesValue(), "{de},{nl},{fr}");
}
