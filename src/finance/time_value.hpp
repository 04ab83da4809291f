// SPDX-License-Identifier: MIT
/**
 * @file time_value.hpp
 * @brief Time value of money: NPV, IRR, XIRR, PV, FV, PMT
 *
 * Sign convention follows spreadsheet functions: money paid out is negative,
 * money received is positive. PV/FV/PMT return the amount that balances the
 * other arguments, so pv(0.05, 10, -100, 0) is positive.
 */

#pragma once

#include "decimath/decimal/decimal.hpp"
#include "decimath/math/root_finding.hpp"
#include "decimath/support/error_types.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <span>

namespace decimath {

/// IRR/XIRR solver settings: 100 iterations, rate band [-0.99, 100]
inline constexpr CashFlowRootConfig kTimeValueRootConfig{
    .max_iter = 100,
    .rate_max = 100};

/// Calendar-dated amount for XIRR
struct DatedCashFlow {
    std::chrono::sys_days date;
    Decimal amount;
};

/// Day basis for XIRR year fractions
inline constexpr Decimal kXirrDaysPerYear = 365.25_dec;

/// sum CF_t / (1 + rate)^t with t = 0, 1, 2, ...
///
/// @return InvalidRate when rate <= -1
std::expected<Decimal, CalcError> npv(const Decimal& rate, std::span<const Decimal> cash_flows);

/// Periodic internal rate of return
std::expected<Decimal, CalcError> irr(std::span<const Decimal> cash_flows,
                                      const Decimal& guess = 0.1_dec,
                                      const CashFlowRootConfig& config = kTimeValueRootConfig);

/// Annualized IRR for irregular dates (Actual/365.25 year fractions from the
/// earliest date)
std::expected<Decimal, CalcError> xirr(std::span<const DatedCashFlow> cash_flows,
                                       const Decimal& guess = 0.1_dec,
                                       const CashFlowRootConfig& config = kTimeValueRootConfig);

/// Present value of `nper` payments `pmt` plus a terminal `fv`
std::expected<Decimal, CalcError> pv(const Decimal& rate, uint32_t nper,
                                     const Decimal& pmt, const Decimal& fv);

/// Future value of `present_value` plus `nper` payments `pmt`
std::expected<Decimal, CalcError> fv(const Decimal& rate, uint32_t nper,
                                     const Decimal& pmt, const Decimal& present_value);

/// Level payment that amortizes `present_value` to `future_value` over `nper`
std::expected<Decimal, CalcError> pmt(const Decimal& rate, uint32_t nper,
                                      const Decimal& present_value, const Decimal& future_value);

}  // namespace decimath
