// SPDX-License-Identifier: MIT
#pragma once

#include "decimath/decimal/decimal.hpp"
#include "decimath/math/power.hpp"
#include "decimath/support/error_types.hpp"

#include <cstddef>
#include <expected>
#include <span>
#include <vector>

namespace decimath {

/// One dated amount in a cash-flow series
///
/// `time` is a period count from the valuation date (non-negative,
/// non-decreasing along the series). A fractional part expresses a stub
/// period, e.g. 0.25 for a coupon paid a quarter period from now.
struct CashFlow {
    Decimal time;
    Decimal amount;
};

/// Configuration for the cash-flow rate solver
///
/// Consumers pick their own ceiling and band: bonds and private credit use
/// 50 iterations, real-estate IRR 30 with the default band, time-value IRR
/// 100 with an upper bound of 100.
struct CashFlowRootConfig {
    /// Maximum Newton iterations
    size_t max_iter = 50;

    /// Converged once |NPV(r)| < tolerance
    Decimal tolerance = 0.0000001_dec;

    /// Lower clamp applied to the rate after every update (must exceed -1)
    Decimal rate_min = -0.99_dec;

    /// Upper clamp applied to the rate after every update
    Decimal rate_max = 10;

    /// Times a step whose valuation overflows is halved back toward the
    /// last rate that valued cleanly (0 before the first valuation)
    size_t max_step_halvings = 30;

    /// Series controls for the stub-period discount factor
    PowFractionConfig pow_fraction{};
};

/// Converged rate with diagnostics
struct CashFlowRootResult {
    /// Rate r with |NPV(r)| < tolerance
    Decimal rate;

    /// Newton updates performed before convergence
    size_t iterations = 0;

    /// |NPV(rate)| at convergence
    Decimal residual;
};

/// NPV and its rate derivative at a single rate
struct CashFlowValuation {
    Decimal npv;
    Decimal derivative;
};

/// Value a series at rate r: NPV = sum CF_t / (1 + r)^t and
/// dNPV/dr = sum -t * CF_t / (1 + r)^(t + 1)
///
/// Integer periods are discounted by accumulating v = 1/(1 + r) across
/// consecutive periods; the fractional remainder uses pow_fraction when v is
/// within (0, 2) and exp/ln otherwise.
///
/// @return DomainError for r <= -1 or an invalid time axis (index set),
///         Overflow when a discount factor leaves the Decimal range
std::expected<CashFlowValuation, KernelError>
value_cash_flows(std::span<const CashFlow> flows, const Decimal& rate,
                 const PowFractionConfig& config = {});

/// Find r with NPV(r) = 0 by Newton-Raphson from `guess`
///
/// Each update r <- r - NPV/NPV' is clamped to [rate_min, rate_max]. A rate
/// whose discount factors overflow is halved back toward the last rate that
/// valued cleanly, at most max_step_halvings times per iteration.
///
/// @return InsufficientData for fewer than 2 flows, InvalidConfiguration for
///         a bad config, ConvergenceFailure (iterations and last |NPV|) when
///         the ceiling is reached, NPV' vanishes or step halving runs out
std::expected<CashFlowRootResult, KernelError>
solve_cash_flow_rate(std::span<const CashFlow> flows, const Decimal& guess,
                     const CashFlowRootConfig& config = {});

/// One independent problem for the batch solver
struct CashFlowProblem {
    std::vector<CashFlow> flows;
    Decimal guess;
};

/// Per-problem outcomes from solve_cash_flow_rate_batch, in input order
struct BatchCashFlowRootResult {
    std::vector<std::expected<CashFlowRootResult, KernelError>> results;
    size_t failed_count = 0;  ///< Number of failed solves

    /// Check if all solves succeeded
    bool all_succeeded() const { return failed_count == 0; }
};

/// Solve many series with a shared config
///
/// Problems are independent and run in an OpenMP parallel loop when
/// available. Each result is identical to a sequential
/// solve_cash_flow_rate call on the same problem.
BatchCashFlowRootResult
solve_cash_flow_rate_batch(std::span<const CashFlowProblem> problems,
                           const CashFlowRootConfig& config = {});

}  // namespace decimath
