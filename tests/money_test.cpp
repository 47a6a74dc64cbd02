// =============================================================================
// money_test.cpp
// =============================================================================
// Unit tests for agrovest::domain::Money and applyReturnRate().
// =============================================================================

#include "agrovest/domain/money.hpp"
#include "agrovest/errors/engine_error.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

using agrovest::EngineError;
using agrovest::ErrorCode;
using agrovest::domain::Money;

TEST(MoneyTest, ParsesWholeAndDecimalAmounts) {
  EXPECT_EQ(Money::parse("185").minor(), 18500);
  EXPECT_EQ(Money::parse("185.5").minor(), 18550);
  EXPECT_EQ(Money::parse("185.05").minor(), 18505);
  EXPECT_EQ(Money::parse("-35.00").minor(), -3500);
  EXPECT_EQ(Money::parse("0").minor(), 0);
}

TEST(MoneyTest, RejectsAmbiguousText) {
  for (const char* bad : {"", "-", ".5", "12.", "1,000", "1e3", "10.001",
                          " 10", "10 ", "abc"}) {
    try {
      Money::parse(bad);
      FAIL() << "accepted '" << bad << "'";
    } catch (const EngineError& e) {
      EXPECT_EQ(e.code(), ErrorCode::Validation) << bad;
    }
  }
}

TEST(MoneyTest, FormatsWithTwoDecimals) {
  EXPECT_EQ(Money::fromUnits(185).toString(), "185.00");
  EXPECT_EQ(Money::fromMinor(5).toString(), "0.05");
  EXPECT_EQ(Money::fromMinor(-50).toString(), "-0.50");
  EXPECT_EQ(Money::fromMinor(std::numeric_limits<std::int64_t>::min())
                .toString()
                .front(),
            '-');
}

TEST(MoneyTest, ArithmeticAndComparison) {
  Money a = Money::fromUnits(130) + Money::fromUnits(55);
  EXPECT_EQ(a, Money::fromUnits(185));
  EXPECT_EQ(a - Money::fromUnits(150), Money::fromUnits(35));
  EXPECT_TRUE(Money::fromUnits(1) < Money::fromUnits(2));
  EXPECT_TRUE((Money::fromUnits(1) - Money::fromUnits(2)).isNegative());
  EXPECT_TRUE(Money().isZero());
}

TEST(MoneyTest, AdditionOverflowThrows) {
  Money big = Money::fromMinor(std::numeric_limits<std::int64_t>::max());
  EXPECT_THROW(big += Money::fromMinor(1), EngineError);
}

TEST(MoneyTest, ParseRejectsAmountsPastTheMinorUnitRange) {
  // The whole part fits on its own; adding the cents would wrap.
  for (const char* big : {"92233720368547758.99", "-92233720368547758.99",
                          "92233720368547758.08", "100000000000000000"}) {
    try {
      Money::parse(big);
      FAIL() << "accepted '" << big << "'";
    } catch (const EngineError& e) {
      EXPECT_EQ(e.code(), ErrorCode::Validation) << big;
    }
  }
  EXPECT_EQ(Money::parse("92233720368547758.07").minor(),
            std::numeric_limits<std::int64_t>::max());
}

TEST(MoneyTest, ApplyReturnRate) {
  // 30% on 100 -> 130; 10% on 50 -> 55.
  EXPECT_EQ(agrovest::domain::applyReturnRate(Money::fromUnits(100), 3000),
            Money::fromUnits(130));
  EXPECT_EQ(agrovest::domain::applyReturnRate(Money::fromUnits(50), 1000),
            Money::fromUnits(55));
  EXPECT_EQ(agrovest::domain::applyReturnRate(Money::fromUnits(200), 0),
            Money::fromUnits(200));
}

TEST(MoneyTest, ApplyReturnRateRoundsHalfAwayFromZero) {
  // 0.01 * 1.5 = 0.015 -> 0.02
  EXPECT_EQ(agrovest::domain::applyReturnRate(Money::fromMinor(1), 5000)
                .minor(),
            2);
  // 0.01 * 1.25 = 0.0125 -> 0.01
  EXPECT_EQ(agrovest::domain::applyReturnRate(Money::fromMinor(1), 2500)
                .minor(),
            1);
}
