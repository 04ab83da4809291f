// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "decimath/math/power.hpp"

#include <cmath>

using namespace decimath;

// ===========================================================================
// pow_fraction
// ===========================================================================

TEST(PowFractionTest, SpecialCases) {
    auto zero_exp = pow_fraction(1.05_dec, 0);
    ASSERT_TRUE(zero_exp.has_value());
    EXPECT_EQ(*zero_exp, Decimal{1});

    auto unit_exp = pow_fraction(1.05_dec, 1);
    ASSERT_TRUE(unit_exp.has_value());
    EXPECT_TRUE(unit_exp->identical(1.05_dec));

    auto unit_base = pow_fraction(1, 0.37_dec);
    ASSERT_TRUE(unit_base.has_value());
    EXPECT_EQ(*unit_base, Decimal{1});
}

TEST(PowFractionTest, SquareRootOfNearOneBase) {
    auto r = pow_fraction(1.21_dec, 0.5_dec);
    ASSERT_TRUE(r.has_value());
    EXPECT_NEAR(r->to_double(), 1.1, 1e-9);
}

TEST(PowFractionTest, MatchesDouble) {
    for (const Decimal base : {0.8_dec, 0.95_dec, 1.02_dec, 1.3_dec}) {
        for (const Decimal f : {0.1_dec, 0.25_dec, 0.75_dec}) {
            auto r = pow_fraction(base, f);
            ASSERT_TRUE(r.has_value());
            EXPECT_NEAR(r->to_double(), std::pow(base.to_double(), f.to_double()), 1e-6)
                << base << "^" << f;
        }
    }
}

TEST(PowFractionTest, FractionOutsideUnitIntervalIsDomainError) {
    auto above = pow_fraction(1.1_dec, 1.5_dec);
    ASSERT_FALSE(above.has_value());
    EXPECT_EQ(above.error().code, KernelErrorCode::DomainError);

    auto below = pow_fraction(1.1_dec, -0.5_dec);
    ASSERT_FALSE(below.has_value());
    EXPECT_EQ(below.error().code, KernelErrorCode::DomainError);
}

TEST(PowFractionTest, BaseFarFromOneIsDomainError) {
    auto r = pow_fraction(2.5_dec, 0.5_dec);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, KernelErrorCode::DomainError);
    EXPECT_EQ(r.error().residual, 2.5_dec);
}

// ===========================================================================
// pow_integer and pow
// ===========================================================================

TEST(PowIntegerTest, ExactPowers) {
    auto r = pow_integer(1.1_dec, 3);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 1.331_dec);

    auto zero = pow_integer(7, 0);
    ASSERT_TRUE(zero.has_value());
    EXPECT_EQ(*zero, Decimal{1});
}

TEST(PowIntegerTest, NegativeExponentUsesReciprocal) {
    auto r = pow_integer(2, -3);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 0.125_dec);
}

TEST(PowIntegerTest, ZeroBaseNegativeExponent) {
    auto r = pow_integer(0, -2);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, KernelErrorCode::DivisionByZero);
}

TEST(PowIntegerTest, OverflowIsReported) {
    auto r = pow_integer(10, 30);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, KernelErrorCode::Overflow);
}

TEST(PowTest, IntegralExponentIsExact) {
    auto r = decimath::pow(1.05_dec, 2.0_dec);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 1.1025_dec);
}

TEST(PowTest, GeneralExponent) {
    auto r = decimath::pow(2, 0.5_dec);
    ASSERT_TRUE(r.has_value());
    EXPECT_NEAR(r->to_double(), std::sqrt(2.0), 1e-12);

    auto s = decimath::pow(1.08_dec, 7.5_dec);
    ASSERT_TRUE(s.has_value());
    EXPECT_NEAR(s->to_double(), std::pow(1.08, 7.5), 1e-10);
}

TEST(PowTest, NegativeBaseNonIntegralExponent) {
    auto r = decimath::pow(-2, 0.5_dec);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, KernelErrorCode::DomainError);
}
