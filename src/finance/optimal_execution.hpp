// SPDX-License-Identifier: MIT
/**
 * @file optimal_execution.hpp
 * @brief Slicing a large order over a horizon (Almgren-Chriss 2001)
 *
 * Holdings along the Almgren-Chriss optimal trajectory:
 *
 *   n_j   = Q * sinh(kappa * (N - j)) / sinh(kappa * N),  j = 0..N
 *   kappa = acosh(1 + kappa_tilde^2 / 2)
 *   kappa_tilde^2 = lambda * sigma^2 / (eta * (tau / T)^2),  lambda = urgency * 1e-6
 *
 * Costs follow the same linear-impact model: spread 0.5 * s * Q, temporary
 * eta * sum(x_j^2 / tau), permanent gamma * sum(x_j * X_j) / Q with X_j the
 * cumulative quantity, timing risk sigma * sqrt(sum(R_j^2 * tau)) with R_j
 * the quantity still to trade when slice j starts.
 */

#pragma once

#include "decimath/decimal/decimal.hpp"
#include "decimath/math/transcendental.hpp"
#include "decimath/support/error_types.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <utility>
#include <vector>

namespace decimath {

enum class OrderSide { Buy, Sell };

enum class ExecutionStrategy {
    TWAP,  ///< Equal slices
    VWAP,  ///< Slices proportional to the volume profile
    IS,    ///< Implementation shortfall, Almgren-Chriss trajectory
    POV    ///< Fixed participation of expected volume (urgency is the rate)
};

const char* to_string(ExecutionStrategy strategy);

/// Inputs of the Almgren-Chriss trajectory
struct AlmgrenChrissParams {
    Decimal quantity;
    uint32_t slices = 0;
    Decimal slice_duration;        ///< tau
    Decimal volatility;            ///< sigma per unit time
    Decimal temporary_impact;      ///< eta
    Decimal urgency;               ///< In [0, 1]
};

struct MarketParameters {
    Decimal price;
    Decimal daily_volume;
    Decimal daily_volatility;
    Decimal bid_ask_spread;

    /// Per-slice volume weights; default_volume_profile() when empty
    std::optional<std::vector<Decimal>> volume_profile;

    Decimal temporary_impact;      ///< eta
    Decimal permanent_impact;      ///< gamma
};

struct ExecutionConstraints {
    /// Largest fraction of a slice's expected volume the order may take, in (0, 1]
    Decimal max_participation_rate = Decimal{1};

    std::optional<Decimal> min_slice_size;
    std::optional<Decimal> max_slice_size;

    /// Inclusive [first, last] slice ranges with no trading
    std::vector<std::pair<uint32_t, uint32_t>> no_trade_periods;
};

struct ExecutionInput {
    Decimal order_size;
    OrderSide side = OrderSide::Buy;
    ExecutionStrategy strategy = ExecutionStrategy::IS;
    MarketParameters market;
    Decimal time_horizon;          ///< In the units of daily_volatility
    uint32_t slices = 0;
    Decimal urgency = 0.5_dec;
    ExecutionConstraints constraints;
};

struct ExecutionSlice {
    uint32_t index = 0;
    Decimal time_start;
    Decimal time_end;
    Decimal quantity;
    Decimal pct_of_total;
    Decimal cumulative_pct;
    Decimal expected_price;        ///< Price after the permanent impact so far
    Decimal expected_market_volume;
    Decimal participation_rate;
};

struct ExecutionCost {
    Decimal spread_cost;
    Decimal temporary_impact;
    Decimal permanent_impact;
    Decimal timing_risk;
    Decimal total_expected_cost;
    Decimal total_cost_bps;
    Decimal opportunity_cost;      ///< 0.5 * sigma * sqrt(T) * Q
};

struct ExecutionRisk {
    Decimal variance_of_cost;
    Decimal std_dev_of_cost;
    Decimal var_95;                ///< Expected cost + 1.645 std dev
    Decimal best_case_cost;
    Decimal worst_case_cost;
};

struct CostRiskPoint {
    Decimal urgency;
    Decimal expected_cost_bps;
    Decimal risk;
};

struct StrategyComparison {
    ExecutionStrategy strategy;
    Decimal expected_cost_bps;
    Decimal risk_bps;
    Decimal cost_to_risk;          ///< 0 when risk is 0
};

struct ExecutionResult {
    std::vector<ExecutionSlice> schedule;
    ExecutionCost cost;
    ExecutionRisk risk;
    Decimal average_participation;
    std::vector<CostRiskPoint> efficient_frontier;
    std::vector<StrategyComparison> comparison;
};

struct ExecutionConfig {
    /// Urgencies 1/k .. k/k sampled for the efficient frontier
    uint32_t frontier_points = 10;

    /// One-sided 95% normal quantile
    Decimal var_z = 1.645_dec;

    /// Smallest participation rate used by POV
    Decimal pov_floor = 0.01_dec;

    TranscendentalConfig transcendental{};
};

/// Remaining holdings n_0 = Q, ..., n_N = 0 (N + 1 values)
///
/// Falls back to the linear trajectory when kappa * N is 0 (no urgency or
/// no temporary impact).
///
/// @return DomainError for zero slices, Overflow when sinh(kappa * N)
///         leaves the Decimal range
std::expected<std::vector<Decimal>, KernelError>
almgren_chriss_trajectory(const AlmgrenChrissParams& params, const TranscendentalConfig& config = {});

/// Per-slice trade sizes n_{j-1} - n_j, floored at 0
std::expected<std::vector<Decimal>, KernelError>
almgren_chriss_slices(const AlmgrenChrissParams& params, const TranscendentalConfig& config = {});

/// Intraday weights v_j = 1 + 0.5 * cos(pi * (2j + 1) / (2N)), normalized
/// to sum to 1. Heaviest at the open, falling toward the close.
std::expected<std::vector<Decimal>, KernelError>
default_volume_profile(uint32_t slices, const TranscendentalConfig& config = {});

/// Cost and risk of a given slice schedule
std::expected<std::pair<ExecutionCost, ExecutionRisk>, CalcError>
estimate_execution_cost(const ExecutionInput& input, const std::vector<Decimal>& quantities,
                        const ExecutionConfig& config = {});

/// Schedule for `input.strategy` with costs, frontier and strategy comparison
std::expected<ExecutionResult, CalcError>
optimize_execution(const ExecutionInput& input, const ExecutionConfig& config = {});

}  // namespace decimath
