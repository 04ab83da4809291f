// SPDX-License-Identifier: MIT
#include "decimath/finance/bond_yield.hpp"

#include "decimath/support/decimath_trace.h"

#include <vector>

namespace decimath {

namespace {

std::expected<void, CalcError> validate(const BondSchedule& bond) {
    auto reject = [](ValidationErrorCode code, const Decimal& value) {
        DECIMATH_TRACE_VALIDATION_ERROR(DECIMATH_MODULE_BOND_YIELD, static_cast<int>(code),
                                        value.to_double());
        return validation_failure(code, value);
    };

    if (bond.face_value <= 0) {
        return reject(ValidationErrorCode::InvalidPrice, bond.face_value);
    }
    if (bond.coupon_rate.is_negative()) {
        return reject(ValidationErrorCode::InvalidRate, bond.coupon_rate);
    }
    if (bond.frequency != 1 && bond.frequency != 2 && bond.frequency != 4 && bond.frequency != 12) {
        return reject(ValidationErrorCode::InvalidFrequency, Decimal{bond.frequency});
    }
    if (bond.coupons_remaining == 0) {
        return reject(ValidationErrorCode::InvalidMaturity, Decimal{});
    }
    if (bond.fraction_remaining <= 0 || bond.fraction_remaining > 1) {
        return reject(ValidationErrorCode::InvalidMaturity, bond.fraction_remaining);
    }
    if (bond.redemption && *bond.redemption <= 0) {
        return reject(ValidationErrorCode::InvalidPrice, *bond.redemption);
    }
    return {};
}

Decimal coupon_amount(const BondSchedule& bond) {
    return bond.face_value * bond.coupon_rate / bond.frequency;
}

/// Coupons at fraction_remaining + i periods, redemption with the last one
std::vector<CashFlow> bond_flows(const BondSchedule& bond) {
    const Decimal coupon = coupon_amount(bond);
    const Decimal redemption = bond.redemption.value_or(bond.face_value);

    std::vector<CashFlow> flows;
    flows.reserve(bond.coupons_remaining + 1);
    for (uint32_t i = 0; i < bond.coupons_remaining; ++i) {
        const bool last = i + 1 == bond.coupons_remaining;
        flows.push_back(CashFlow{
            .time = bond.fraction_remaining + i,
            .amount = last ? coupon + redemption : coupon});
    }
    return flows;
}

}  // namespace

std::expected<Decimal, CalcError> bond_accrued_interest(const BondSchedule& bond) {
    if (auto ok = validate(bond); !ok) {
        return std::unexpected(ok.error());
    }
    return guard_decimal([&]() -> std::expected<Decimal, CalcError> {
        return coupon_amount(bond) * (Decimal{1} - bond.fraction_remaining);
    });
}

std::expected<Decimal, CalcError> bond_dirty_price(const BondSchedule& bond, const Decimal& annual_yield,
                                                   const PowFractionConfig& config) {
    if (auto ok = validate(bond); !ok) {
        return std::unexpected(ok.error());
    }
    return guard_decimal([&]() -> std::expected<Decimal, CalcError> {
        const Decimal periodic = annual_yield / bond.frequency;
        if (periodic <= -1) {
            return validation_failure(ValidationErrorCode::InvalidRate, annual_yield);
        }
        const auto flows = bond_flows(bond);
        auto valuation = value_cash_flows(flows, periodic, config);
        if (!valuation) {
            return calc_failure(valuation.error());
        }
        return valuation->npv;
    });
}

std::expected<Decimal, CalcError> bond_clean_price(const BondSchedule& bond, const Decimal& annual_yield,
                                                   const PowFractionConfig& config) {
    auto dirty = bond_dirty_price(bond, annual_yield, config);
    if (!dirty) {
        return dirty;
    }
    auto accrued = bond_accrued_interest(bond);
    if (!accrued) {
        return accrued;
    }
    return *dirty - *accrued;
}

std::expected<BondYieldResult, CalcError> bond_yield(const BondSchedule& bond, const Decimal& clean_price,
                                                     const BondYieldConfig& config) {
    if (clean_price <= 0) {
        return validation_failure(ValidationErrorCode::InvalidPrice, clean_price);
    }
    auto accrued = bond_accrued_interest(bond);
    if (!accrued) {
        return std::unexpected(accrued.error());
    }

    return guard_decimal([&]() -> std::expected<BondYieldResult, CalcError> {
        const Decimal frequency{bond.frequency};

        // Price equation as a cash-flow series: pay the dirty price today
        std::vector<CashFlow> flows;
        flows.push_back(CashFlow{.time = 0, .amount = -(clean_price + *accrued)});
        for (const auto& flow : bond_flows(bond)) {
            flows.push_back(flow);
        }

        const CashFlowRootConfig root_config{
            .max_iter = config.max_iter,
            .tolerance = config.tolerance,
            .rate_min = config.yield_min / frequency,
            .rate_max = config.yield_max / frequency,
            .pow_fraction = config.pow_fraction};

        DECIMATH_TRACE_ALGO_START(DECIMATH_MODULE_BOND_YIELD, bond.coupons_remaining,
                                  config.initial_guess.to_double());

        auto solved = solve_cash_flow_rate(flows, config.initial_guess / frequency, root_config);
        if (solved) {
            DECIMATH_TRACE_ALGO_COMPLETE(DECIMATH_MODULE_BOND_YIELD, solved->iterations,
                                         solved->residual.to_double());
            return BondYieldResult{
                .annual_yield = solved->rate * frequency,
                .iterations = solved->iterations,
                .fallback_reason = std::nullopt};
        }

        const KernelError& error = solved.error();
        if (error.code == KernelErrorCode::ConvergenceFailure && config.fallback_yield) {
            return BondYieldResult{
                .annual_yield = *config.fallback_yield,
                .iterations = error.iterations,
                .fallback_reason = error};
        }
        return calc_failure(error);
    });
}

}  // namespace decimath
