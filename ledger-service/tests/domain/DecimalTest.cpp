/**
 * @file DecimalTest.cpp
 * @brief Unit tests for Decimal fixed-point arithmetic
 */

#include <gtest/gtest.h>
#include "domain/Decimal.hpp"

using namespace ledger::domain;

// ============================================================================
// PARSING / FORMATTING TESTS
// ============================================================================

TEST(DecimalTest, FromString_Integer) {
    auto value = Decimal::fromString("100000");

    EXPECT_EQ(value, Decimal(100000));
    EXPECT_EQ(value.toString(), "100000");
}

TEST(DecimalTest, FromString_Fraction_TrailingZerosTrimmed) {
    EXPECT_EQ(Decimal::fromString("10000.50").toString(), "10000.5");
    EXPECT_EQ(Decimal::fromString("0.00015").toString(), "0.00015");
    EXPECT_EQ(Decimal::fromString("-12.345").toString(), "-12.345");
}

TEST(DecimalTest, FromString_ExtraDigitsRoundedHalfUp) {
    EXPECT_EQ(Decimal::fromString("0.123456785").toString(), "0.12345679");
    EXPECT_EQ(Decimal::fromString("0.123456784").toString(), "0.12345678");
}

TEST(DecimalTest, FromString_Invalid_Throws) {
    EXPECT_THROW(Decimal::fromString(""), std::invalid_argument);
    EXPECT_THROW(Decimal::fromString("abc"), std::invalid_argument);
    EXPECT_THROW(Decimal::fromString("1.2.3"), std::invalid_argument);
    EXPECT_THROW(Decimal::fromString("-"), std::invalid_argument);
}

TEST(DecimalTest, FromDouble_RoundsToScale) {
    EXPECT_EQ(Decimal::fromDouble(280.5), Decimal::fromString("280.5"));
    EXPECT_EQ(Decimal::fromDouble(0.1), Decimal::fromString("0.1"));
}

// ============================================================================
// ARITHMETIC TESTS
// ============================================================================

TEST(DecimalTest, Multiply_NoBinaryDrift) {
    auto notional = Decimal(10) * Decimal::fromString("0.1") * Decimal(3);

    EXPECT_EQ(notional, Decimal(3));
}

TEST(DecimalTest, Divide_RoundsHalfUp) {
    auto third = Decimal(1) / Decimal(3);
    auto twoThirds = Decimal(2) / Decimal(3);

    EXPECT_EQ(third.toString(), "0.33333333");
    EXPECT_EQ(twoThirds.toString(), "0.66666667");
}

TEST(DecimalTest, Divide_ByZero_Throws) {
    EXPECT_THROW(Decimal(1) / Decimal(), std::domain_error);
}

TEST(DecimalTest, Overflow_Throws) {
    EXPECT_THROW(Decimal(90000000000LL) * Decimal(90000000000LL), std::overflow_error);
    EXPECT_THROW(Decimal(std::numeric_limits<int64_t>::max()), std::out_of_range);
}

TEST(DecimalTest, Round_HalfAwayFromZero) {
    EXPECT_EQ(Decimal::fromString("15.5").round(0), Decimal(16));
    EXPECT_EQ(Decimal::fromString("15.49").round(0), Decimal(15));
    EXPECT_EQ(Decimal::fromString("-15.5").round(0), Decimal(-16));
    EXPECT_EQ(Decimal::fromString("33.335").round(2), Decimal::fromString("33.34"));
}

TEST(DecimalTest, SignHelpers) {
    EXPECT_TRUE(Decimal().isZero());
    EXPECT_TRUE(Decimal(-1).isNegative());
    EXPECT_TRUE(Decimal(1).isPositive());
    EXPECT_EQ(Decimal(-5).abs(), Decimal(5));
    EXPECT_EQ(-Decimal(5), Decimal(-5));
}
