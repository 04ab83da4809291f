// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "decimath/math/root_finding.hpp"

#include <vector>

using namespace decimath;

namespace {

std::vector<CashFlow> periodic(std::initializer_list<Decimal> amounts) {
    std::vector<CashFlow> flows;
    int t = 0;
    for (const auto& amount : amounts) {
        flows.push_back(CashFlow{.time = t++, .amount = amount});
    }
    return flows;
}

}  // namespace

TEST(CashFlowRootConfigTest, DefaultValues) {
    CashFlowRootConfig config;

    EXPECT_EQ(config.max_iter, 50u);
    EXPECT_EQ(config.tolerance, 0.0000001_dec);
    EXPECT_EQ(config.rate_min, -0.99_dec);
    EXPECT_EQ(config.rate_max, Decimal{10});
    EXPECT_EQ(config.max_step_halvings, 30u);
}

// ============================================================================
// Valuation
// ============================================================================

TEST(ValueCashFlowsTest, NpvAndDerivative) {
    const auto flows = periodic({-100, 110});
    auto v = value_cash_flows(flows, 0.1_dec);
    ASSERT_TRUE(v.has_value());
    EXPECT_NEAR(v->npv.to_double(), 0.0, 1e-20);
    // d/dr of 110 / (1 + r) at r = 0.1 is -110 / 1.21
    EXPECT_NEAR(v->derivative.to_double(), -110.0 / 1.21, 1e-12);
}

TEST(ValueCashFlowsTest, ZeroRateIsPlainSum) {
    const auto flows = periodic({-100, 30, 30, 50});
    auto v = value_cash_flows(flows, 0);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->npv, Decimal{10});
}

TEST(ValueCashFlowsTest, StubPeriodDiscount) {
    const std::vector<CashFlow> flows{{.time = 0.5_dec, .amount = 105}};
    auto v = value_cash_flows(flows, 0.1025_dec);
    ASSERT_TRUE(v.has_value());
    // 1.1025^0.5 = 1.05
    EXPECT_NEAR(v->npv.to_double(), 100.0, 1e-7);
}

TEST(ValueCashFlowsTest, RateAtOrBelowMinusOneIsDomainError) {
    const auto flows = periodic({-100, 110});
    auto v = value_cash_flows(flows, -1);
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().code, KernelErrorCode::DomainError);
}

TEST(ValueCashFlowsTest, DecreasingTimeReportsIndex) {
    const std::vector<CashFlow> flows{
        {.time = 1, .amount = -100},
        {.time = 0.5_dec, .amount = 50}};
    auto v = value_cash_flows(flows, 0.05_dec);
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().code, KernelErrorCode::DomainError);
    EXPECT_EQ(v.error().index, 1u);
}

TEST(ValueCashFlowsTest, DiscountFactorOverflow) {
    const std::vector<CashFlow> flows{
        {.time = 0, .amount = -100},
        {.time = 20, .amount = 100}};
    // (1 / 0.01)^20 = 1e40 leaves the Decimal range
    auto v = value_cash_flows(flows, -0.99_dec);
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().code, KernelErrorCode::Overflow);
}

// ============================================================================
// Newton solver
// ============================================================================

TEST(SolveCashFlowRateTest, SinglePeriodTenPercent) {
    const auto flows = periodic({-100, 110});
    auto r = solve_cash_flow_rate(flows, 0.05_dec);
    ASSERT_TRUE(r.has_value());
    EXPECT_NEAR(r->rate.to_double(), 0.10, 0.001);
    EXPECT_LT(r->residual, 0.0000001_dec);
}

TEST(SolveCashFlowRateTest, FiveYearAnnuity) {
    const auto flows = periodic({-1000, 300, 300, 300, 300, 300});
    auto r = solve_cash_flow_rate(flows, 0.1_dec);
    ASSERT_TRUE(r.has_value());
    EXPECT_GT(r->rate, 0.14_dec);
    EXPECT_LT(r->rate, 0.17_dec);
    EXPECT_NEAR(r->rate.to_double(), 0.152382, 1e-5);
}

TEST(SolveCashFlowRateTest, StubPeriodRate) {
    const std::vector<CashFlow> flows{
        {.time = 0, .amount = -100},
        {.time = 0.5_dec, .amount = 105}};
    auto r = solve_cash_flow_rate(flows, 0.05_dec);
    ASSERT_TRUE(r.has_value());
    EXPECT_NEAR(r->rate.to_double(), 0.1025, 1e-8);
}

TEST(SolveCashFlowRateTest, NegativeRate) {
    const auto flows = periodic({-100, 60, 30});
    auto r = solve_cash_flow_rate(flows, 0.1_dec);
    ASSERT_TRUE(r.has_value());
    EXPECT_LT(r->rate, Decimal{});
    auto check = value_cash_flows(flows, r->rate);
    ASSERT_TRUE(check.has_value());
    EXPECT_LT(check->npv.abs(), 0.0000001_dec);
}

TEST(SolveCashFlowRateTest, TooFewFlowsIsInsufficientData) {
    const auto flows = periodic({-100});
    auto r = solve_cash_flow_rate(flows, 0.1_dec);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, KernelErrorCode::InsufficientData);
    EXPECT_EQ(r.error().index, 1u);
}

TEST(SolveCashFlowRateTest, InvalidConfiguration) {
    const auto flows = periodic({-100, 110});

    auto zero_iter = solve_cash_flow_rate(flows, 0.1_dec, {.max_iter = 0});
    ASSERT_FALSE(zero_iter.has_value());
    EXPECT_EQ(zero_iter.error().code, KernelErrorCode::InvalidConfiguration);

    auto bad_floor = solve_cash_flow_rate(flows, 0.1_dec, {.rate_min = -1});
    ASSERT_FALSE(bad_floor.has_value());
    EXPECT_EQ(bad_floor.error().code, KernelErrorCode::InvalidConfiguration);

    auto empty_band = solve_cash_flow_rate(flows, 0.1_dec, {.rate_min = 0.5_dec, .rate_max = 0.5_dec});
    ASSERT_FALSE(empty_band.has_value());
    EXPECT_EQ(empty_band.error().code, KernelErrorCode::InvalidConfiguration);
}

TEST(SolveCashFlowRateTest, ZeroDerivativeIsConvergenceFailure) {
    // Every flow at t = 0: NPV does not depend on the rate
    const std::vector<CashFlow> flows{
        {.time = 0, .amount = -100},
        {.time = 0, .amount = 50}};
    auto r = solve_cash_flow_rate(flows, 0.1_dec);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, KernelErrorCode::ConvergenceFailure);
    EXPECT_EQ(r.error().iterations, 0u);
    EXPECT_EQ(r.error().residual, Decimal{50});
}

TEST(SolveCashFlowRateTest, NoSignChangeExhaustsCeiling) {
    const auto flows = periodic({-100, -50});
    const CashFlowRootConfig config{.max_iter = 30};
    auto r = solve_cash_flow_rate(flows, 0.1_dec, config);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, KernelErrorCode::ConvergenceFailure);
    EXPECT_EQ(r.error().iterations, 30u);
    EXPECT_GT(r.error().residual, Decimal{100});
}

TEST(SolveCashFlowRateTest, OverflowingGuessIsDampedTowardZero) {
    // 30 coupons: at r = -0.9 the discount factor 10^30 leaves the Decimal range
    std::vector<CashFlow> flows{{.time = 0, .amount = -1000}};
    for (int t = 1; t <= 30; ++t) {
        flows.push_back(CashFlow{.time = t, .amount = 20});
    }

    auto from_low = solve_cash_flow_rate(flows, -0.9_dec);
    ASSERT_TRUE(from_low.has_value()) << from_low.error();
    EXPECT_NEAR(from_low->rate.to_double(), -0.0302290671723897, 1e-9);

    auto from_high = solve_cash_flow_rate(flows, 0.1_dec);
    ASSERT_TRUE(from_high.has_value());
    EXPECT_LT((from_low->rate - from_high->rate).abs(), 0.000000001_dec);
}

TEST(SolveCashFlowRateTest, OverflowWithoutHalvingsIsConvergenceFailure) {
    std::vector<CashFlow> flows{{.time = 0, .amount = -1000}};
    for (int t = 1; t <= 30; ++t) {
        flows.push_back(CashFlow{.time = t, .amount = 20});
    }

    const CashFlowRootConfig config{.max_step_halvings = 0};
    auto r = solve_cash_flow_rate(flows, -0.9_dec, config);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, KernelErrorCode::ConvergenceFailure);
    EXPECT_EQ(r.error().iterations, 0u);
}

TEST(SolveCashFlowRateTest, GuessOutsideBandIsClamped) {
    const auto flows = periodic({-100, 110});
    auto r = solve_cash_flow_rate(flows, 50);
    ASSERT_TRUE(r.has_value());
    EXPECT_NEAR(r->rate.to_double(), 0.10, 0.001);
}

TEST(SolveCashFlowRateTest, Deterministic) {
    const auto flows = periodic({-1000, 300, 300, 300, 300, 300});
    auto a = solve_cash_flow_rate(flows, 0.1_dec);
    auto b = solve_cash_flow_rate(flows, 0.1_dec);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_TRUE(a->rate.identical(b->rate));
    EXPECT_EQ(a->iterations, b->iterations);
}

// ============================================================================
// Batch solver
// ============================================================================

TEST(SolveCashFlowRateBatchTest, MatchesSequentialSolves) {
    std::vector<CashFlowProblem> problems;
    problems.push_back({.flows = periodic({-100, 110}), .guess = 0.05_dec});
    problems.push_back({.flows = periodic({-1000, 300, 300, 300, 300, 300}), .guess = 0.1_dec});
    problems.push_back({.flows = periodic({-500, 100, 200, 300}), .guess = 0.1_dec});
    problems.push_back({.flows = periodic({-100, 60, 30}), .guess = 0.1_dec});

    auto batch = solve_cash_flow_rate_batch(problems);
    ASSERT_EQ(batch.results.size(), problems.size());
    EXPECT_TRUE(batch.all_succeeded());

    for (size_t i = 0; i < problems.size(); ++i) {
        auto sequential = solve_cash_flow_rate(problems[i].flows, problems[i].guess);
        ASSERT_TRUE(sequential.has_value());
        ASSERT_TRUE(batch.results[i].has_value()) << i;
        EXPECT_TRUE(batch.results[i]->rate.identical(sequential->rate)) << i;
    }
}

TEST(SolveCashFlowRateBatchTest, CountsFailures) {
    std::vector<CashFlowProblem> problems;
    problems.push_back({.flows = periodic({-100, 110}), .guess = 0.05_dec});
    problems.push_back({.flows = periodic({-100}), .guess = 0.05_dec});
    problems.push_back({.flows = periodic({-100, -50}), .guess = 0.05_dec});

    auto batch = solve_cash_flow_rate_batch(problems);
    EXPECT_FALSE(batch.all_succeeded());
    EXPECT_EQ(batch.failed_count, 2u);
    ASSERT_TRUE(batch.results[0].has_value());
    EXPECT_EQ(batch.results[1].error().code, KernelErrorCode::InsufficientData);
    EXPECT_EQ(batch.results[2].error().code, KernelErrorCode::ConvergenceFailure);
}

TEST(SolveCashFlowRateBatchTest, EmptyBatch) {
    auto batch = solve_cash_flow_rate_batch({});
    EXPECT_TRUE(batch.results.empty());
    EXPECT_TRUE(batch.all_succeeded());
}
