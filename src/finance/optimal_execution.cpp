// SPDX-License-Identifier: MIT
#include "decimath/finance/optimal_execution.hpp"

#include "decimath/support/decimath_trace.h"

#include <algorithm>
#include <array>

namespace decimath {

namespace {

constexpr std::array<ExecutionStrategy, 4> kAllStrategies = {
    ExecutionStrategy::TWAP, ExecutionStrategy::VWAP, ExecutionStrategy::IS, ExecutionStrategy::POV};

std::expected<void, CalcError> validate(const ExecutionInput& input) {
    auto reject = [](ValidationErrorCode code, const Decimal& value) {
        DECIMATH_TRACE_VALIDATION_ERROR(DECIMATH_MODULE_OPTIMAL_EXECUTION, static_cast<int>(code),
                                        value.to_double());
        return validation_failure(code, value);
    };

    if (input.order_size <= 0) {
        return reject(ValidationErrorCode::InvalidQuantity, input.order_size);
    }
    if (input.slices == 0) {
        return reject(ValidationErrorCode::InvalidQuantity, Decimal{});
    }
    if (input.time_horizon <= 0) {
        return reject(ValidationErrorCode::InvalidHorizon, input.time_horizon);
    }
    if (input.urgency < 0 || input.urgency > 1) {
        return reject(ValidationErrorCode::InvalidRate, input.urgency);
    }
    if (input.market.price <= 0) {
        return reject(ValidationErrorCode::InvalidPrice, input.market.price);
    }
    if (input.market.daily_volume <= 0) {
        return reject(ValidationErrorCode::InvalidQuantity, input.market.daily_volume);
    }
    if (input.market.daily_volatility.is_negative()) {
        return reject(ValidationErrorCode::InvalidRate, input.market.daily_volatility);
    }
    const Decimal& cap = input.constraints.max_participation_rate;
    if (cap <= 0 || cap > 1) {
        return reject(ValidationErrorCode::InvalidRate, cap);
    }
    if (input.market.volume_profile && input.market.volume_profile->size() != input.slices) {
        return reject(ValidationErrorCode::DimensionMismatch,
                      Decimal{input.market.volume_profile->size()});
    }
    return {};
}

AlmgrenChrissParams trajectory_params(const ExecutionInput& input, const Decimal& urgency) {
    return AlmgrenChrissParams{
        .quantity = input.order_size,
        .slices = input.slices,
        .slice_duration = input.time_horizon / input.slices,
        .volatility = input.market.daily_volatility,
        .temporary_impact = input.market.temporary_impact,
        .urgency = urgency};
}

bool in_no_trade_period(const ExecutionConstraints& constraints, uint32_t slice) {
    return std::any_of(constraints.no_trade_periods.begin(), constraints.no_trade_periods.end(),
                       [slice](const auto& period) {
                           return slice >= period.first && slice <= period.second;
                       });
}

/// Fixed participation of expected volume; any shortfall goes to the last slice
std::vector<Decimal> pov_slices(const ExecutionInput& input, const std::vector<Decimal>& expected_volumes,
                                const ExecutionConfig& config) {
    const Decimal rate = std::max(input.urgency, config.pov_floor);
    std::vector<Decimal> quantities(input.slices);
    Decimal remaining = input.order_size;
    for (size_t j = 0; j < quantities.size() && remaining > 0; ++j) {
        const Decimal q = std::min(rate * expected_volumes[j], remaining);
        quantities[j] = q.is_negative() ? Decimal{} : q;
        remaining -= quantities[j];
    }
    if (remaining > 0) {
        quantities.back() += remaining;
    }
    return quantities;
}

std::expected<std::vector<Decimal>, KernelError>
strategy_slices(ExecutionStrategy strategy, const ExecutionInput& input,
                const std::vector<Decimal>& profile, const std::vector<Decimal>& expected_volumes,
                const ExecutionConfig& config) {
    switch (strategy) {
        case ExecutionStrategy::TWAP:
            return std::vector<Decimal>(input.slices, input.order_size / input.slices);
        case ExecutionStrategy::VWAP: {
            std::vector<Decimal> quantities;
            quantities.reserve(profile.size());
            for (const auto& weight : profile) {
                quantities.push_back(input.order_size * weight);
            }
            return quantities;
        }
        case ExecutionStrategy::IS:
            return almgren_chriss_slices(trajectory_params(input, input.urgency), config.transcendental);
        case ExecutionStrategy::POV:
            return pov_slices(input, expected_volumes, config);
    }
    return kernel_failure(KernelErrorCode::InvalidConfiguration);
}

/// No-trade periods, participation cap, slice-size bounds, then rescale to
/// the order size
std::vector<Decimal> apply_constraints(std::vector<Decimal> quantities, const ExecutionInput& input,
                                       const std::vector<Decimal>& expected_volumes) {
    const ExecutionConstraints& constraints = input.constraints;
    for (size_t j = 0; j < quantities.size(); ++j) {
        Decimal& q = quantities[j];
        if (in_no_trade_period(constraints, static_cast<uint32_t>(j))) {
            q = Decimal{};
        }
        const Decimal cap = constraints.max_participation_rate * expected_volumes[j];
        if (cap > 0 && q > cap) {
            q = cap;
        }
        if (constraints.min_slice_size && q > 0 && q < *constraints.min_slice_size) {
            q = *constraints.min_slice_size;
        }
        if (constraints.max_slice_size && q > *constraints.max_slice_size) {
            q = *constraints.max_slice_size;
        }
    }

    Decimal total;
    for (const auto& q : quantities) {
        total += q;
    }
    if (total > 0 && total != input.order_size) {
        const Decimal factor = input.order_size / total;
        for (auto& q : quantities) {
            q *= factor;
        }
    }
    return quantities;
}

std::expected<std::pair<ExecutionCost, ExecutionRisk>, CalcError>
compute_costs(const ExecutionInput& input, const std::vector<Decimal>& quantities,
              const ExecutionConfig& config) {
    const MarketParameters& market = input.market;
    const Decimal& total_qty = input.order_size;
    const Decimal tau = input.time_horizon / input.slices;
    const Decimal& sigma = market.daily_volatility;

    ExecutionCost cost;
    cost.spread_cost = 0.5_dec * market.bid_ask_spread * total_qty;

    Decimal cumulative;
    Decimal remaining = total_qty;
    Decimal holding_variance;  // sum R_j^2 * tau
    for (const auto& q : quantities) {
        cost.temporary_impact += market.temporary_impact * q * q / tau;
        cumulative += q;
        cost.permanent_impact += market.permanent_impact * q * cumulative;
        holding_variance += remaining * remaining * tau;
        remaining -= q;
    }
    cost.permanent_impact /= total_qty;

    cost.total_expected_cost = cost.spread_cost + cost.temporary_impact + cost.permanent_impact;
    cost.total_cost_bps = cost.total_expected_cost / (market.price * total_qty) * 10000;

    DECIMATH_KERNEL_ASSIGN(holding_std, sqrt(holding_variance, config.transcendental));
    cost.timing_risk = sigma * holding_std;

    DECIMATH_KERNEL_ASSIGN(sqrt_horizon, sqrt(input.time_horizon, config.transcendental));
    cost.opportunity_cost = sigma * sqrt_horizon * total_qty * 0.5_dec;

    ExecutionRisk risk;
    risk.variance_of_cost = sigma * sigma * holding_variance;
    DECIMATH_KERNEL_ASSIGN(std_dev, sqrt(risk.variance_of_cost, config.transcendental));
    risk.std_dev_of_cost = std_dev;
    risk.var_95 = cost.total_expected_cost + config.var_z * std_dev;
    risk.best_case_cost = cost.total_expected_cost - config.var_z * std_dev;
    risk.worst_case_cost = risk.var_95;

    return std::pair{cost, risk};
}

std::expected<std::vector<Decimal>, KernelError>
volume_profile(const ExecutionInput& input, const ExecutionConfig& config) {
    if (input.market.volume_profile) {
        return *input.market.volume_profile;
    }
    return default_volume_profile(input.slices, config.transcendental);
}

}  // namespace

const char* to_string(ExecutionStrategy strategy) {
    switch (strategy) {
        case ExecutionStrategy::TWAP: return "TWAP";
        case ExecutionStrategy::VWAP: return "VWAP";
        case ExecutionStrategy::IS: return "IS";
        case ExecutionStrategy::POV: return "POV";
    }
    return "Unknown";
}

std::expected<std::vector<Decimal>, KernelError>
almgren_chriss_trajectory(const AlmgrenChrissParams& params, const TranscendentalConfig& config) {
    if (params.slices == 0) {
        return kernel_failure(KernelErrorCode::DomainError);
    }

    return guard_decimal([&]() -> std::expected<std::vector<Decimal>, KernelError> {
        const Decimal n{params.slices};
        const Decimal lambda = params.urgency * 0.000001_dec;

        const Decimal total_time = n * params.slice_duration;
        const Decimal tau_over_t = total_time > 0 ? params.slice_duration / total_time : Decimal{1};

        Decimal kappa_tilde_sq;
        if (params.temporary_impact > 0 && tau_over_t > 0) {
            kappa_tilde_sq = lambda * params.volatility * params.volatility /
                             (params.temporary_impact * tau_over_t * tau_over_t);
        }

        auto kappa = acosh(Decimal{1} + kappa_tilde_sq / 2, config);
        if (!kappa) {
            return std::unexpected(kappa.error());
        }
        auto sinh_kn = sinh(*kappa * n, config);
        if (!sinh_kn) {
            return std::unexpected(sinh_kn.error());
        }

        std::vector<Decimal> holdings;
        holdings.reserve(params.slices + 1);
        for (uint32_t j = 0; j <= params.slices; ++j) {
            const uint32_t left = params.slices - j;
            if (sinh_kn->is_zero()) {
                holdings.push_back(params.quantity * left / n);
                continue;
            }
            auto sinh_left = sinh(*kappa * left, config);
            if (!sinh_left) {
                return std::unexpected(sinh_left.error());
            }
            holdings.push_back(params.quantity * *sinh_left / *sinh_kn);
        }
        return holdings;
    });
}

std::expected<std::vector<Decimal>, KernelError>
almgren_chriss_slices(const AlmgrenChrissParams& params, const TranscendentalConfig& config) {
    auto holdings = almgren_chriss_trajectory(params, config);
    if (!holdings) {
        return holdings;
    }
    return guard_decimal([&]() -> std::expected<std::vector<Decimal>, KernelError> {
        std::vector<Decimal> quantities;
        quantities.reserve(params.slices);
        for (size_t j = 1; j < holdings->size(); ++j) {
            const Decimal traded = (*holdings)[j - 1] - (*holdings)[j];
            quantities.push_back(traded > 0 ? traded : Decimal{});
        }
        return quantities;
    });
}

std::expected<std::vector<Decimal>, KernelError>
default_volume_profile(uint32_t slices, const TranscendentalConfig& config) {
    if (slices == 0) {
        return kernel_failure(KernelErrorCode::DomainError);
    }
    return guard_decimal([&]() -> std::expected<std::vector<Decimal>, KernelError> {
        std::vector<Decimal> profile;
        profile.reserve(slices);
        Decimal sum;
        for (uint32_t j = 0; j < slices; ++j) {
            const Decimal arg = kPi * (2 * j + 1) / (Decimal{2} * slices);
            auto c = cos(arg, config);
            if (!c) {
                return std::unexpected(c.error());
            }
            profile.push_back(Decimal{1} + 0.5_dec * *c);
            sum += profile.back();
        }
        for (auto& v : profile) {
            v /= sum;
        }
        return profile;
    });
}

std::expected<std::pair<ExecutionCost, ExecutionRisk>, CalcError>
estimate_execution_cost(const ExecutionInput& input, const std::vector<Decimal>& quantities,
                        const ExecutionConfig& config) {
    if (auto ok = validate(input); !ok) {
        return std::unexpected(ok.error());
    }
    if (quantities.size() != input.slices) {
        return validation_failure(ValidationErrorCode::DimensionMismatch, Decimal{quantities.size()});
    }
    return guard_decimal([&]() { return compute_costs(input, quantities, config); });
}

std::expected<ExecutionResult, CalcError>
optimize_execution(const ExecutionInput& input, const ExecutionConfig& config) {
    if (auto ok = validate(input); !ok) {
        return std::unexpected(ok.error());
    }
    DECIMATH_TRACE_ALGO_START(DECIMATH_MODULE_OPTIMAL_EXECUTION, input.slices,
                              input.urgency.to_double());

    return guard_decimal([&]() -> std::expected<ExecutionResult, CalcError> {
        const MarketParameters& market = input.market;
        const Decimal tau = input.time_horizon / input.slices;

        DECIMATH_KERNEL_ASSIGN(profile, volume_profile(input, config));
        std::vector<Decimal> expected_volumes;
        expected_volumes.reserve(profile.size());
        for (const auto& weight : profile) {
            expected_volumes.push_back(market.daily_volume * weight);
        }

        DECIMATH_KERNEL_ASSIGN(raw, strategy_slices(input.strategy, input, profile,
                                                    expected_volumes, config));
        const std::vector<Decimal> quantities = apply_constraints(std::move(raw), input, expected_volumes);

        ExecutionResult result;
        result.schedule.reserve(input.slices);
        const Decimal direction = input.side == OrderSide::Buy ? Decimal{1} : Decimal{-1};
        Decimal cumulative;
        Decimal participation_sum;
        uint32_t active = 0;
        for (uint32_t j = 0; j < input.slices; ++j) {
            const Decimal& qty = quantities[j];
            const Decimal& volume = expected_volumes[j];
            cumulative += qty;

            ExecutionSlice slice{
                .index = j,
                .time_start = tau * j,
                .time_end = tau * (j + 1),
                .quantity = qty,
                .pct_of_total = qty / input.order_size * 100,
                .cumulative_pct = cumulative / input.order_size * 100,
                .expected_price = market.price + direction * market.permanent_impact * cumulative,
                .expected_market_volume = volume,
                .participation_rate = volume > 0 ? qty / volume : Decimal{}};
            if (qty > 0) {
                participation_sum += slice.participation_rate;
                ++active;
            }
            result.schedule.push_back(slice);
        }
        result.average_participation = active > 0 ? participation_sum / active : Decimal{};

        auto costs = compute_costs(input, quantities, config);
        if (!costs) {
            return std::unexpected(costs.error());
        }
        result.cost = costs->first;
        result.risk = costs->second;

        // Cost/risk trade-off of the IS trajectory across urgencies
        result.efficient_frontier.reserve(config.frontier_points);
        for (uint32_t i = 1; i <= config.frontier_points; ++i) {
            const Decimal urgency = Decimal{i} / config.frontier_points;
            DECIMATH_KERNEL_ASSIGN(frontier_raw,
                                   almgren_chriss_slices(trajectory_params(input, urgency),
                                                         config.transcendental));
            const auto constrained = apply_constraints(std::move(frontier_raw), input, expected_volumes);
            auto point = compute_costs(input, constrained, config);
            if (!point) {
                return std::unexpected(point.error());
            }
            result.efficient_frontier.push_back(CostRiskPoint{
                .urgency = urgency,
                .expected_cost_bps = point->first.total_cost_bps,
                .risk = point->second.std_dev_of_cost});
        }

        const Decimal notional = market.price * input.order_size;
        result.comparison.reserve(kAllStrategies.size());
        for (const ExecutionStrategy strategy : kAllStrategies) {
            DECIMATH_KERNEL_ASSIGN(candidate, strategy_slices(strategy, input, profile,
                                                              expected_volumes, config));
            const auto constrained = apply_constraints(std::move(candidate), input, expected_volumes);
            auto outcome = compute_costs(input, constrained, config);
            if (!outcome) {
                return std::unexpected(outcome.error());
            }
            const Decimal cost_bps = outcome->first.total_expected_cost / notional * 10000;
            const Decimal risk_bps = outcome->second.std_dev_of_cost / notional * 10000;
            result.comparison.push_back(StrategyComparison{
                .strategy = strategy,
                .expected_cost_bps = cost_bps,
                .risk_bps = risk_bps,
                .cost_to_risk = risk_bps > 0 ? cost_bps / risk_bps : Decimal{}});
        }

        DECIMATH_TRACE_ALGO_COMPLETE(DECIMATH_MODULE_OPTIMAL_EXECUTION, input.slices,
                                     result.cost.total_cost_bps.to_double());
        return result;
    });
}

}  // namespace decimath
