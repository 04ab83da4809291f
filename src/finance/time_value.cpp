// SPDX-License-Identifier: MIT
#include "decimath/finance/time_value.hpp"

#include "decimath/math/power.hpp"
#include "decimath/support/decimath_trace.h"

#include <algorithm>
#include <vector>

namespace decimath {

namespace {

std::vector<CashFlow> periodic_flows(std::span<const Decimal> amounts) {
    std::vector<CashFlow> flows;
    flows.reserve(amounts.size());
    for (size_t t = 0; t < amounts.size(); ++t) {
        flows.push_back(CashFlow{.time = Decimal{t}, .amount = amounts[t]});
    }
    return flows;
}

std::expected<Decimal, CalcError> solve_rate(std::span<const CashFlow> flows, const Decimal& guess,
                                             const CashFlowRootConfig& config) {
    auto result = solve_cash_flow_rate(flows, guess, config);
    if (!result) {
        return calc_failure(result.error());
    }
    return result->rate;
}

/// (1 + rate)^nper
std::expected<Decimal, CalcError> growth_factor(const Decimal& rate, uint32_t nper) {
    if (rate <= -1) {
        DECIMATH_TRACE_VALIDATION_ERROR(DECIMATH_MODULE_TIME_VALUE,
                                        static_cast<int>(ValidationErrorCode::InvalidRate),
                                        rate.to_double());
        return validation_failure(ValidationErrorCode::InvalidRate, rate);
    }
    auto factor = pow_integer(Decimal{1} + rate, nper);
    if (!factor) {
        return calc_failure(factor.error());
    }
    return *factor;
}

}  // namespace

std::expected<Decimal, CalcError> npv(const Decimal& rate, std::span<const Decimal> cash_flows) {
    if (rate <= -1) {
        return validation_failure(ValidationErrorCode::InvalidRate, rate);
    }
    const auto flows = periodic_flows(cash_flows);
    auto valuation = value_cash_flows(flows, rate);
    if (!valuation) {
        return calc_failure(valuation.error());
    }
    return valuation->npv;
}

std::expected<Decimal, CalcError> irr(std::span<const Decimal> cash_flows, const Decimal& guess,
                                      const CashFlowRootConfig& config) {
    const auto flows = periodic_flows(cash_flows);
    return solve_rate(flows, guess, config);
}

std::expected<Decimal, CalcError> xirr(std::span<const DatedCashFlow> cash_flows,
                                       const Decimal& guess, const CashFlowRootConfig& config) {
    if (cash_flows.empty()) {
        return kernel_failure(KernelErrorCode::InsufficientData);
    }

    std::vector<DatedCashFlow> sorted(cash_flows.begin(), cash_flows.end());
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const DatedCashFlow& a, const DatedCashFlow& b) { return a.date < b.date; });

    const auto base = sorted.front().date;
    std::vector<CashFlow> flows;
    flows.reserve(sorted.size());
    for (const auto& flow : sorted) {
        const int64_t days = (flow.date - base).count();
        flows.push_back(CashFlow{.time = Decimal{days} / kXirrDaysPerYear, .amount = flow.amount});
    }
    return solve_rate(flows, guess, config);
}

std::expected<Decimal, CalcError> pv(const Decimal& rate, uint32_t nper,
                                     const Decimal& pmt, const Decimal& fv) {
    return guard_decimal([&]() -> std::expected<Decimal, CalcError> {
        if (rate.is_zero()) {
            return -(pmt * nper + fv);
        }
        auto factor = growth_factor(rate, nper);
        if (!factor) {
            return std::unexpected(factor.error());
        }
        const Decimal annuity = (Decimal{1} - Decimal{1} / *factor) / rate;
        return -(pmt * annuity + fv / *factor);
    });
}

std::expected<Decimal, CalcError> fv(const Decimal& rate, uint32_t nper,
                                     const Decimal& pmt, const Decimal& present_value) {
    return guard_decimal([&]() -> std::expected<Decimal, CalcError> {
        if (rate.is_zero()) {
            return -(present_value + pmt * nper);
        }
        auto factor = growth_factor(rate, nper);
        if (!factor) {
            return std::unexpected(factor.error());
        }
        const Decimal annuity = (*factor - 1) / rate;
        return -(present_value * *factor + pmt * annuity);
    });
}

std::expected<Decimal, CalcError> pmt(const Decimal& rate, uint32_t nper,
                                      const Decimal& present_value, const Decimal& future_value) {
    if (nper == 0) {
        return validation_failure(ValidationErrorCode::InvalidMaturity);
    }
    return guard_decimal([&]() -> std::expected<Decimal, CalcError> {
        if (rate.is_zero()) {
            return -(present_value + future_value) / nper;
        }
        auto factor = growth_factor(rate, nper);
        if (!factor) {
            return std::unexpected(factor.error());
        }
        const Decimal annuity = (*factor - 1) / rate;
        if (annuity.is_zero()) {
            return kernel_failure(KernelErrorCode::DivisionByZero);
        }
        return -(present_value * *factor + future_value) / annuity;
    });
}

}  // namespace decimath
