#include <gtest/gtest.h>
#include "common/decimal.hpp"
#include <limits>
#include <stdexcept>

using namespace thisthat;

// ============================================================================
// Parsing and Formatting
// ============================================================================

TEST(DecimalTest, ParsesWholeAndFractional) {
    EXPECT_EQ(Decimal::parse("950").micros(), 950'000'000);
    EXPECT_EQ(Decimal::parse("0.5").micros(), 500'000);
    EXPECT_EQ(Decimal::parse("-12.25").micros(), -12'250'000);
    EXPECT_EQ(Decimal::parse("0.000001").micros(), 1);
}

TEST(DecimalTest, RejectsMalformedText) {
    EXPECT_THROW(Decimal::parse(""), std::invalid_argument);
    EXPECT_THROW(Decimal::parse("abc"), std::invalid_argument);
    EXPECT_THROW(Decimal::parse("1.2.3"), std::invalid_argument);
    EXPECT_THROW(Decimal::parse("0.0000001"), std::invalid_argument);
}

TEST(DecimalTest, FormatsWithAtLeastTwoDigits) {
    EXPECT_EQ(Decimal::from_whole(950).to_string(), "950.00");
    EXPECT_EQ(Decimal::parse("95.5").to_string(), "95.50");
    EXPECT_EQ(Decimal::parse("95.123456").to_string(), "95.123456");
    EXPECT_EQ(Decimal::parse("-0.5").to_string(), "-0.50");
}

// ============================================================================
// Arithmetic
// ============================================================================

TEST(DecimalTest, AdditionAndSubtractionAreExact) {
    Decimal a = Decimal::parse("0.1");
    Decimal b = Decimal::parse("0.2");
    EXPECT_EQ(a + b, Decimal::parse("0.3"));
    EXPECT_EQ(Decimal::from_whole(1000) - Decimal::from_whole(50), Decimal::from_whole(950));
}

TEST(DecimalTest, SharesForStakeAtPrice) {
    Decimal shares = Decimal::from_whole(50) / Decimal::parse("0.5");
    EXPECT_EQ(shares, Decimal::from_whole(100));

    Decimal value = Decimal::from_whole(100) * Decimal::parse("0.65");
    EXPECT_EQ(value, Decimal::from_whole(65));
}

TEST(DecimalTest, DivisionRoundsHalfAwayFromZero) {
    // 1/3 = 0.333333...
    EXPECT_EQ((Decimal::from_whole(1) / Decimal::from_whole(3)).micros(), 333'333);
    // 2/3 = 0.666666... rounds up
    EXPECT_EQ((Decimal::from_whole(2) / Decimal::from_whole(3)).micros(), 666'667);
    EXPECT_EQ((Decimal::from_whole(-2) / Decimal::from_whole(3)).micros(), -666'667);
}

TEST(DecimalTest, DivisionByZeroThrows) {
    EXPECT_THROW(Decimal::from_whole(1) / Decimal(), std::domain_error);
}

TEST(DecimalTest, OverflowThrows) {
    Decimal big = Decimal::from_micros(std::numeric_limits<int64_t>::max());
    EXPECT_THROW(big + Decimal::from_micros(1), std::overflow_error);
    EXPECT_THROW(big * Decimal::from_whole(2), std::overflow_error);
}

TEST(DecimalTest, ComparisonAndHelpers) {
    Decimal a = Decimal::from_whole(5);
    Decimal b = Decimal::from_whole(10);
    EXPECT_LT(a, b);
    EXPECT_EQ(max(a, b), b);
    EXPECT_EQ(min(a, b), a);
    EXPECT_TRUE((-a).is_negative());
    EXPECT_TRUE(Decimal().is_zero());
}
