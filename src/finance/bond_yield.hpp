// SPDX-License-Identifier: MIT
/**
 * @file bond_yield.hpp
 * @brief Clean price and yield-to-maturity / yield-to-call with a stub first period
 *
 * The coupon schedule is described by period counts, not dates: settlement
 * falls inside a coupon period with `fraction_remaining` of it left, and
 * `coupons_remaining` coupons are paid before (and including) redemption.
 * Coupon i (0-based) is discounted over fraction_remaining + i periods.
 */

#pragma once

#include "decimath/decimal/decimal.hpp"
#include "decimath/math/power.hpp"
#include "decimath/math/root_finding.hpp"
#include "decimath/support/error_types.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>

namespace decimath {

struct BondSchedule {
    /// Principal the coupon rate applies to
    Decimal face_value = 100;

    /// Annual coupon rate (0.05 = 5%)
    Decimal coupon_rate;

    /// Coupons per year: 1, 2, 4 or 12
    uint32_t frequency = 2;

    /// Coupons until redemption, including the one paid at redemption
    uint32_t coupons_remaining = 0;

    /// Part of the current coupon period still to run, in (0, 1]
    Decimal fraction_remaining = 1;

    /// Amount repaid with the last coupon (face value for maturity, the call
    /// price for a call)
    std::optional<Decimal> redemption;
};

struct BondYieldConfig {
    /// Starting annual yield
    Decimal initial_guess = 0.05_dec;

    /// Annual-yield band the Newton iterate is clamped to
    Decimal yield_min = -0.5_dec;
    Decimal yield_max = 1;

    /// Newton iterations and price tolerance
    size_t max_iter = 50;
    Decimal tolerance = 0.0000001_dec;

    /// Annual yield to report when the solve does not converge. Without it,
    /// a convergence failure is returned as an error.
    std::optional<Decimal> fallback_yield;

    PowFractionConfig pow_fraction{};
};

struct BondYieldResult {
    /// Annual yield (periodic yield * frequency), or the fallback
    Decimal annual_yield;

    /// Newton iterations performed
    size_t iterations = 0;

    /// Set when annual_yield is the configured fallback
    std::optional<KernelError> fallback_reason;

    bool used_fallback() const { return fallback_reason.has_value(); }
};

/// Accrued interest, coupon * (1 - fraction_remaining)
std::expected<Decimal, CalcError> bond_accrued_interest(const BondSchedule& bond);

/// Dirty price: sum CF_i / (1 + y/f)^(fraction_remaining + i)
std::expected<Decimal, CalcError> bond_dirty_price(const BondSchedule& bond, const Decimal& annual_yield,
                                                   const PowFractionConfig& config = {});

/// Clean price, dirty price less accrued interest
std::expected<Decimal, CalcError> bond_clean_price(const BondSchedule& bond, const Decimal& annual_yield,
                                                   const PowFractionConfig& config = {});

/// Yield that reprices the bond to `clean_price`
///
/// Solved with the shared cash-flow root finder on periodic yield; a
/// convergence failure yields config.fallback_yield when one is set.
std::expected<BondYieldResult, CalcError> bond_yield(const BondSchedule& bond, const Decimal& clean_price,
                                                     const BondYieldConfig& config = {});

}  // namespace decimath
