// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "decimath/finance/optimal_execution.hpp"

#include <string>
#include <variant>

using namespace decimath;

namespace {

ExecutionInput base_input(ExecutionStrategy strategy = ExecutionStrategy::TWAP) {
    ExecutionInput input;
    input.order_size = 100000;
    input.strategy = strategy;
    input.market = MarketParameters{
        .price = 50,
        .daily_volume = 2000000,
        .daily_volatility = 0.5_dec,
        .bid_ask_spread = 0.02_dec,
        .temporary_impact = 0.000001_dec,
        .permanent_impact = 0.0000001_dec};
    input.time_horizon = 1;
    input.slices = 10;
    return input;
}

AlmgrenChrissParams urgent_params(const Decimal& urgency) {
    return AlmgrenChrissParams{
        .quantity = 1000,
        .slices = 10,
        .slice_duration = 0.1_dec,
        .volatility = 0.5_dec,
        .temporary_impact = 0.000001_dec,
        .urgency = urgency};
}

double total(const std::vector<ExecutionSlice>& schedule) {
    double sum = 0.0;
    for (const auto& slice : schedule) {
        sum += slice.quantity.to_double();
    }
    return sum;
}

ValidationErrorCode validation_code(const CalcError& error) {
    return std::get<ValidationError>(error).code;
}

}  // namespace

// ============================================================================
// Almgren-Chriss trajectory
// ============================================================================

TEST(AlmgrenChrissTest, TrajectoryEndpoints) {
    auto holdings = almgren_chriss_trajectory(urgent_params(1));
    ASSERT_TRUE(holdings.has_value());
    ASSERT_EQ(holdings->size(), 11u);
    EXPECT_NEAR(holdings->front().to_double(), 1000.0, 1e-12);
    EXPECT_TRUE(holdings->back().is_zero());
    for (size_t j = 1; j < holdings->size(); ++j) {
        EXPECT_LT((*holdings)[j], (*holdings)[j - 1]) << j;
    }
}

TEST(AlmgrenChrissTest, ZeroUrgencyIsLinear) {
    auto holdings = almgren_chriss_trajectory(urgent_params(0));
    ASSERT_TRUE(holdings.has_value());
    for (size_t j = 0; j < holdings->size(); ++j) {
        EXPECT_EQ((*holdings)[j], Decimal{100 * (10 - static_cast<int>(j))}) << j;
    }
}

TEST(AlmgrenChrissTest, UrgencyFrontLoads) {
    auto slices = almgren_chriss_slices(urgent_params(1));
    ASSERT_TRUE(slices.has_value());
    ASSERT_EQ(slices->size(), 10u);
    EXPECT_GT(slices->front(), Decimal{500});
    EXPECT_LT(slices->back(), slices->front());

    double sum = 0.0;
    for (const auto& q : *slices) {
        sum += q.to_double();
    }
    EXPECT_NEAR(sum, 1000.0, 1e-12);
}

TEST(AlmgrenChrissTest, ZeroSlicesIsDomainError) {
    auto params = urgent_params(1);
    params.slices = 0;
    auto r = almgren_chriss_trajectory(params);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, KernelErrorCode::DomainError);
}

// ============================================================================
// Volume profile
// ============================================================================

TEST(VolumeProfileTest, NormalizedAndFrontWeighted) {
    auto profile = default_volume_profile(8);
    ASSERT_TRUE(profile.has_value());
    ASSERT_EQ(profile->size(), 8u);

    double sum = 0.0;
    for (size_t j = 0; j < profile->size(); ++j) {
        sum += (*profile)[j].to_double();
        if (j > 0) {
            EXPECT_LT((*profile)[j], (*profile)[j - 1]) << j;
        }
    }
    EXPECT_NEAR(sum, 1.0, 1e-12);
}

TEST(VolumeProfileTest, ZeroSlicesIsDomainError) {
    auto r = default_volume_profile(0);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, KernelErrorCode::DomainError);
}

// ============================================================================
// Strategies
// ============================================================================

TEST(OptimizeExecutionTest, TwapEqualSlices) {
    auto r = optimize_execution(base_input(ExecutionStrategy::TWAP));
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->schedule.size(), 10u);
    for (const auto& slice : r->schedule) {
        EXPECT_EQ(slice.quantity, Decimal{10000});
        EXPECT_EQ(slice.pct_of_total, Decimal{10});
    }
    EXPECT_EQ(r->schedule.back().cumulative_pct, Decimal{100});
    EXPECT_EQ(r->schedule[3].time_start, 0.3_dec);
    EXPECT_EQ(r->schedule[3].time_end, 0.4_dec);
}

TEST(OptimizeExecutionTest, VwapFollowsProfile) {
    auto profile = default_volume_profile(10);
    ASSERT_TRUE(profile.has_value());

    auto r = optimize_execution(base_input(ExecutionStrategy::VWAP));
    ASSERT_TRUE(r.has_value());
    for (size_t j = 0; j < r->schedule.size(); ++j) {
        EXPECT_NEAR(r->schedule[j].quantity.to_double(), 100000.0 * (*profile)[j].to_double(), 1e-9) << j;
        // Constant participation when trading with the volume
        EXPECT_NEAR(r->schedule[j].participation_rate.to_double(), 0.05, 1e-12) << j;
    }
    EXPECT_NEAR(r->average_participation.to_double(), 0.05, 1e-12);
}

TEST(OptimizeExecutionTest, CustomVolumeProfile) {
    auto input = base_input(ExecutionStrategy::VWAP);
    input.slices = 4;
    input.market.volume_profile = std::vector<Decimal>{0.4_dec, 0.1_dec, 0.1_dec, 0.4_dec};
    auto r = optimize_execution(input);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->schedule[0].quantity, Decimal{40000});
    EXPECT_EQ(r->schedule[1].quantity, Decimal{10000});
}

TEST(OptimizeExecutionTest, ImplementationShortfallFrontLoads) {
    auto input = base_input(ExecutionStrategy::IS);
    input.urgency = 1;
    auto r = optimize_execution(input);
    ASSERT_TRUE(r.has_value());
    EXPECT_GT(r->schedule.front().quantity, Decimal{10000});
    EXPECT_LT(r->schedule.back().quantity, r->schedule.front().quantity);
    EXPECT_NEAR(total(r->schedule), 100000.0, 1e-9);
}

TEST(OptimizeExecutionTest, PovTracksVolume) {
    auto input = base_input(ExecutionStrategy::POV);
    input.urgency = 0.02_dec;
    auto r = optimize_execution(input);
    ASSERT_TRUE(r.has_value());
    EXPECT_NEAR(r->schedule.front().participation_rate.to_double(), 0.02, 1e-12);
    EXPECT_NEAR(total(r->schedule), 100000.0, 1e-9);
}

TEST(OptimizeExecutionTest, SellSideMovesPriceDown) {
    auto input = base_input();
    input.side = OrderSide::Sell;
    auto r = optimize_execution(input);
    ASSERT_TRUE(r.has_value());
    // 50 - 1e-7 * 10000
    EXPECT_EQ(r->schedule.front().expected_price, 49.999_dec);
    EXPECT_LT(r->schedule.back().expected_price, r->schedule.front().expected_price);
}

// ============================================================================
// Constraints
// ============================================================================

TEST(ExecutionConstraintsTest, NoTradePeriodsAreSkipped) {
    auto input = base_input();
    input.constraints.no_trade_periods = {{0, 2}};
    auto r = optimize_execution(input);
    ASSERT_TRUE(r.has_value());
    for (uint32_t j = 0; j <= 2; ++j) {
        EXPECT_TRUE(r->schedule[j].quantity.is_zero()) << j;
    }
    EXPECT_GT(r->schedule[3].quantity, Decimal{10000});
    EXPECT_NEAR(total(r->schedule), 100000.0, 1e-9);
}

TEST(ExecutionConstraintsTest, MaxSliceFlattensFrontLoading) {
    auto unconstrained = base_input(ExecutionStrategy::IS);
    unconstrained.urgency = 1;
    auto capped = unconstrained;
    capped.constraints.max_slice_size = Decimal{20000};

    auto a = optimize_execution(unconstrained);
    auto b = optimize_execution(capped);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_LT(b->schedule.front().quantity, a->schedule.front().quantity);
    EXPECT_NEAR(total(b->schedule), 100000.0, 1e-9);
}

// ============================================================================
// Costs and risk
// ============================================================================

TEST(ExecutionCostTest, TwapCostComponents) {
    const auto input = base_input();
    const std::vector<Decimal> twap(10, Decimal{10000});
    auto r = estimate_execution_cost(input, twap);
    ASSERT_TRUE(r.has_value());
    const auto& [cost, risk] = *r;

    EXPECT_EQ(cost.spread_cost, Decimal{1000});
    // 10 * 1e-6 * 10000^2 / 0.1
    EXPECT_EQ(cost.temporary_impact, Decimal{10000});
    EXPECT_EQ(cost.total_expected_cost,
              cost.spread_cost + cost.temporary_impact + cost.permanent_impact);
    EXPECT_NEAR(cost.opportunity_cost.to_double(), 0.5 * 0.5 * 100000.0, 1e-9);
    EXPECT_GT(risk.var_95, cost.total_expected_cost);
    EXPECT_GE(risk.worst_case_cost, risk.best_case_cost);
    EXPECT_NEAR(risk.std_dev_of_cost.to_double(), cost.timing_risk.to_double(), 1e-9);
}

TEST(ExecutionCostTest, WrongScheduleLength) {
    const std::vector<Decimal> short_schedule(3, Decimal{10000});
    auto r = estimate_execution_cost(base_input(), short_schedule);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(validation_code(r.error()), ValidationErrorCode::DimensionMismatch);
}

TEST(OptimizeExecutionTest, FrontierAndComparison) {
    const ExecutionConfig config;
    auto r = optimize_execution(base_input(ExecutionStrategy::IS), config);
    ASSERT_TRUE(r.has_value());

    ASSERT_EQ(r->efficient_frontier.size(), config.frontier_points);
    EXPECT_EQ(r->efficient_frontier.front().urgency, 0.1_dec);
    EXPECT_EQ(r->efficient_frontier.back().urgency, Decimal{1});
    // More urgency trades risk for impact
    EXPECT_LT(r->efficient_frontier.back().risk, r->efficient_frontier.front().risk);

    ASSERT_EQ(r->comparison.size(), 4u);
    EXPECT_EQ(r->comparison[0].strategy, ExecutionStrategy::TWAP);
    EXPECT_EQ(r->comparison[3].strategy, ExecutionStrategy::POV);
    for (const auto& entry : r->comparison) {
        EXPECT_GT(entry.expected_cost_bps, Decimal{}) << to_string(entry.strategy);
    }
}

TEST(OptimizeExecutionTest, StrategyNames) {
    EXPECT_EQ(std::string(to_string(ExecutionStrategy::TWAP)), "TWAP");
    EXPECT_EQ(std::string(to_string(ExecutionStrategy::IS)), "IS");
}

// ============================================================================
// Validation
// ============================================================================

TEST(ExecutionValidationTest, RejectsBadInputs) {
    auto no_order = base_input();
    no_order.order_size = 0;
    auto a = optimize_execution(no_order);
    ASSERT_FALSE(a.has_value());
    EXPECT_EQ(validation_code(a.error()), ValidationErrorCode::InvalidQuantity);

    auto no_slices = base_input();
    no_slices.slices = 0;
    auto b = optimize_execution(no_slices);
    ASSERT_FALSE(b.has_value());
    EXPECT_EQ(validation_code(b.error()), ValidationErrorCode::InvalidQuantity);

    auto no_horizon = base_input();
    no_horizon.time_horizon = 0;
    auto c = optimize_execution(no_horizon);
    ASSERT_FALSE(c.has_value());
    EXPECT_EQ(validation_code(c.error()), ValidationErrorCode::InvalidHorizon);

    auto too_urgent = base_input();
    too_urgent.urgency = 1.5_dec;
    auto d = optimize_execution(too_urgent);
    ASSERT_FALSE(d.has_value());
    EXPECT_EQ(validation_code(d.error()), ValidationErrorCode::InvalidRate);

    auto no_price = base_input();
    no_price.market.price = 0;
    auto e = optimize_execution(no_price);
    ASSERT_FALSE(e.has_value());
    EXPECT_EQ(validation_code(e.error()), ValidationErrorCode::InvalidPrice);

    auto no_cap = base_input();
    no_cap.constraints.max_participation_rate = 0;
    auto f = optimize_execution(no_cap);
    ASSERT_FALSE(f.has_value());
    EXPECT_EQ(validation_code(f.error()), ValidationErrorCode::InvalidRate);
}

TEST(ExecutionValidationTest, ProfileLengthMustMatchSlices) {
    auto input = base_input(ExecutionStrategy::VWAP);
    input.market.volume_profile = std::vector<Decimal>{0.5_dec, 0.5_dec};
    auto r = optimize_execution(input);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(validation_code(r.error()), ValidationErrorCode::DimensionMismatch);
}
