// SPDX-License-Identifier: MIT
/**
 * @file black_litterman.hpp
 * @brief Black-Litterman posterior returns and mean-variance weights
 *
 * pi    = lambda * Sigma * w_mkt
 * Omega = diag((1/c_k - 1) * (P tau Sigma P^T)_kk)
 * A     = (tau Sigma)^-1 + P^T Omega^-1 P
 * mu    = A^-1 [(tau Sigma)^-1 pi + P^T Omega^-1 Q]
 * w*    = (lambda Sigma)^-1 mu, normalized to sum to 1
 */

#pragma once

#include "decimath/decimal/decimal.hpp"
#include "decimath/math/linear_algebra.hpp"
#include "decimath/support/error_types.hpp"

#include <cstddef>
#include <expected>
#include <variant>
#include <vector>

namespace decimath {

/// "Asset `asset` will return `expected_return`"
struct AbsoluteView {
    size_t asset;
    Decimal expected_return;
};

/// "Asset `long_asset` will outperform `short_asset` by `expected_return`"
struct RelativeView {
    size_t long_asset;
    size_t short_asset;
    Decimal expected_return;
};

using View = std::variant<AbsoluteView, RelativeView>;

struct BlackLittermanInput {
    /// Market-capitalization equilibrium weights (n)
    Vector market_weights;

    /// Symmetric n x n covariance of returns
    Matrix covariance;

    Decimal risk_free_rate;

    /// Market risk aversion lambda
    Decimal risk_aversion = 2.5_dec;

    /// Uncertainty scale of the equilibrium returns
    Decimal tau = 0.05_dec;

    std::vector<View> views;

    /// Confidence in each view, in (0, 1]
    Vector view_confidences;
};

struct BlackLittermanConfig {
    /// Largest |Sigma(i,j) - Sigma(j,i)| accepted as symmetric
    Decimal symmetry_tolerance = 0.0000001_dec;

    /// Largest |sum(w_mkt) - 1| accepted
    Decimal weight_sum_tolerance = 0.01_dec;

    /// Omega_kk used for a fully confident view (c_k = 1)
    Decimal omega_floor = 0.0000000001_dec;

    LinearAlgebraConfig linear_algebra{};
};

struct BlackLittermanResult {
    Vector implied_returns;        ///< pi
    Vector posterior_returns;      ///< mu
    Matrix posterior_covariance;   ///< A^-1
    Vector optimal_weights;        ///< Normalized w*
    Vector weight_tilts;           ///< w* - w_mkt
    Vector view_uncertainty;       ///< Omega_kk per view
    Vector view_impact;            ///< Posterior minus prior return along each view

    Decimal portfolio_return;      ///< w*^T mu
    Decimal portfolio_risk;        ///< sqrt(w*^T Sigma w*)
    Decimal sharpe_ratio;          ///< (return - rf) / risk, 0 when risk is 0
    Decimal tracking_error;        ///< sqrt((w* - w_mkt)^T Sigma (w* - w_mkt))
    Decimal information_ratio;     ///< Excess return over w_mkt / tracking error
};

std::expected<BlackLittermanResult, CalcError>
black_litterman(const BlackLittermanInput& input, const BlackLittermanConfig& config = {});

}  // namespace decimath
