// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "decimath/math/transcendental.hpp"

#include <cmath>

using namespace decimath;

// ===========================================================================
// Square root
// ===========================================================================

TEST(SqrtTest, ExactSpecialValues) {
    auto zero = decimath::sqrt(0);
    ASSERT_TRUE(zero.has_value());
    EXPECT_TRUE(zero->is_zero());

    auto one = decimath::sqrt(1);
    ASSERT_TRUE(one.has_value());
    EXPECT_EQ(*one, Decimal{1});
}

TEST(SqrtTest, PerfectSquare) {
    auto r = decimath::sqrt(144);
    ASSERT_TRUE(r.has_value());
    EXPECT_LT((*r - 12).abs(), 0.00000000000000000001_dec);
}

TEST(SqrtTest, SquareRecoversArgument) {
    for (const Decimal x : {0.0004_dec, 0.5_dec, 2.0_dec, 37.25_dec, 98765.4321_dec, 12345678901.5_dec}) {
        auto r = decimath::sqrt(x);
        ASSERT_TRUE(r.has_value()) << x;
        const Decimal relative = ((*r * *r - x) / x).abs();
        EXPECT_LT(relative, 0.0000001_dec) << x;
    }
}

TEST(SqrtTest, NegativeIsDomainError) {
    auto r = decimath::sqrt(-4);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, KernelErrorCode::DomainError);
    EXPECT_EQ(r.error().residual, Decimal{-4});
}

TEST(SqrtTest, EarlyExitMatchesFixedIterations) {
    const TranscendentalConfig early{.sqrt_early_exit = true};
    auto fixed = decimath::sqrt(2);
    auto quick = decimath::sqrt(2, early);
    ASSERT_TRUE(fixed.has_value());
    ASSERT_TRUE(quick.has_value());
    EXPECT_NEAR(fixed->to_double(), quick->to_double(), 1e-15);
}

// ===========================================================================
// Exponential and logarithm
// ===========================================================================

TEST(ExpTest, ZeroIsOne) {
    auto r = decimath::exp(0);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, Decimal{1});
}

TEST(ExpTest, KnownValues) {
    auto five = decimath::exp(5);
    ASSERT_TRUE(five.has_value());
    EXPECT_NEAR(five->to_double(), 148.413, 0.1);

    auto minus_five = decimath::exp(-5);
    ASSERT_TRUE(minus_five.has_value());
    EXPECT_NEAR(minus_five->to_double(), 0.00674, 0.001);

    auto one = decimath::exp(1);
    ASSERT_TRUE(one.has_value());
    EXPECT_NEAR(one->to_double(), std::exp(1.0), 1e-14);
}

TEST(ExpTest, PositiveOverRange) {
    for (int x = -60; x <= 60; x += 7) {
        auto r = decimath::exp(x);
        ASSERT_TRUE(r.has_value()) << x;
        EXPECT_GT(*r, Decimal{}) << x;
    }
}

TEST(ExpTest, OverflowIsReported) {
    auto r = decimath::exp(100);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, KernelErrorCode::Overflow);
}

TEST(ExpTest, DeepUnderflowIsZero) {
    auto r = decimath::exp(-100);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->is_zero());
}

TEST(LnTest, OneIsZero) {
    auto r = decimath::ln(1);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->is_zero());
}

TEST(LnTest, InvertsExp) {
    for (const Decimal x : {-3.5_dec, -1.0_dec, -0.25_dec, 0.001_dec, 0.7_dec, 2.0_dec, 4.75_dec, 10.0_dec}) {
        auto e = decimath::exp(x);
        ASSERT_TRUE(e.has_value());
        auto r = decimath::ln(*e);
        ASSERT_TRUE(r.has_value()) << x;
        EXPECT_NEAR(r->to_double(), x.to_double(), 1e-4) << x;
    }
}

TEST(LnTest, MatchesDouble) {
    for (const Decimal x : {0.01_dec, 0.5_dec, 1.5_dec, 2.0_dec, 1000.0_dec, 123456789.0_dec}) {
        auto r = decimath::ln(x);
        ASSERT_TRUE(r.has_value()) << x;
        EXPECT_NEAR(r->to_double(), std::log(x.to_double()), 1e-12) << x;
    }
}

TEST(LnTest, ExtremesOfTheRange) {
    auto largest = decimath::ln(Decimal::max());
    ASSERT_TRUE(largest.has_value()) << largest.error();
    EXPECT_NEAR(largest->to_double(), 66.54212933375474, 1e-9);

    auto smallest = decimath::ln(Decimal::min_positive());
    ASSERT_TRUE(smallest.has_value()) << smallest.error();
    EXPECT_NEAR(smallest->to_double(), -64.47238260383328, 1e-9);
}

TEST(LnTest, NonPositiveIsDomainError) {
    auto zero = decimath::ln(0);
    ASSERT_FALSE(zero.has_value());
    EXPECT_EQ(zero.error().code, KernelErrorCode::DomainError);

    auto negative = decimath::ln(-2);
    ASSERT_FALSE(negative.has_value());
    EXPECT_EQ(negative.error().code, KernelErrorCode::DomainError);
}

// ===========================================================================
// Trigonometric and hyperbolic
// ===========================================================================

TEST(CosTest, KnownValues) {
    auto zero = decimath::cos(0);
    ASSERT_TRUE(zero.has_value());
    EXPECT_EQ(*zero, Decimal{1});

    auto pi = decimath::cos(kPi);
    ASSERT_TRUE(pi.has_value());
    EXPECT_NEAR(pi->to_double(), -1.0, 1e-12);

    auto half_pi = decimath::cos(kPi / 2);
    ASSERT_TRUE(half_pi.has_value());
    EXPECT_NEAR(half_pi->to_double(), 0.0, 1e-12);
}

TEST(CosTest, RangeReduction) {
    for (const Decimal x : {7.0_dec, -7.0_dec, 25.5_dec, -100.25_dec}) {
        auto r = decimath::cos(x);
        ASSERT_TRUE(r.has_value()) << x;
        EXPECT_NEAR(r->to_double(), std::cos(x.to_double()), 1e-10) << x;
    }
}

TEST(HyperbolicTest, CoshSquaredMinusSinhSquared) {
    for (const Decimal x : {-3.0_dec, -0.5_dec, 0.0_dec, 0.001_dec, 1.0_dec, 4.2_dec}) {
        auto s = decimath::sinh(x);
        auto c = decimath::cosh(x);
        ASSERT_TRUE(s.has_value());
        ASSERT_TRUE(c.has_value());
        const Decimal identity = *c * *c - *s * *s;
        EXPECT_NEAR(identity.to_double(), 1.0, 1e-12) << x;
    }
}

TEST(HyperbolicTest, CoshInvertsAcosh) {
    for (const Decimal x : {1.0_dec, 1.0001_dec, 1.5_dec, 3.0_dec, 50.0_dec}) {
        auto a = decimath::acosh(x);
        ASSERT_TRUE(a.has_value()) << x;
        auto c = decimath::cosh(*a);
        ASSERT_TRUE(c.has_value());
        EXPECT_NEAR(c->to_double(), x.to_double(), 1e-8 * x.to_double()) << x;
    }
}

TEST(HyperbolicTest, AcoshBelowOneIsDomainError) {
    auto r = decimath::acosh(0.99_dec);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, KernelErrorCode::DomainError);
}

TEST(HyperbolicTest, SinhIsOdd) {
    auto pos = decimath::sinh(2);
    auto neg = decimath::sinh(-2);
    ASSERT_TRUE(pos.has_value());
    ASSERT_TRUE(neg.has_value());
    EXPECT_EQ(*pos, -*neg);
}

// ===========================================================================
// Helpers
// ===========================================================================

TEST(DecimalExponentTest, Magnitudes) {
    EXPECT_EQ(decimal_exponent(1), 0);
    EXPECT_EQ(decimal_exponent(999), 2);
    EXPECT_EQ(decimal_exponent(0.05_dec), -2);
    EXPECT_EQ(decimal_exponent(Decimal::min_positive()), -28);
}

TEST(PowerOfTenTest, Values) {
    EXPECT_EQ(power_of_ten(3), Decimal{1000});
    EXPECT_EQ(power_of_ten(-2), 0.01_dec);
    EXPECT_EQ(power_of_ten(0), Decimal{1});
}
