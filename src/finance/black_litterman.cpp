// SPDX-License-Identifier: MIT
#include "decimath/finance/black_litterman.hpp"

#include "decimath/math/transcendental.hpp"
#include "decimath/support/decimath_trace.h"

#include <utility>

namespace decimath {

namespace {

std::expected<void, CalcError> validate(const BlackLittermanInput& input,
                                        const BlackLittermanConfig& config) {
    const size_t n = input.market_weights.size();
    if (n == 0) {
        return validation_failure(ValidationErrorCode::EmptyInput);
    }
    if (input.covariance.rows() != n || input.covariance.cols() != n) {
        return validation_failure(ValidationErrorCode::DimensionMismatch,
                                  Decimal{input.covariance.rows()});
    }
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            const auto diff = checked_sub(input.covariance(i, j), input.covariance(j, i));
            if (!diff || diff->abs() > config.symmetry_tolerance) {
                return validation_failure(ValidationErrorCode::InvalidCovariance,
                                          input.covariance(i, j), i * n + j);
            }
        }
    }
    Decimal weight_sum;
    for (size_t i = 0; i < n; ++i) {
        const auto next = checked_add(weight_sum, input.market_weights[i]);
        if (!next) {
            return validation_failure(ValidationErrorCode::InvalidWeights, input.market_weights[i], i);
        }
        weight_sum = *next;
    }
    const auto excess = checked_sub(weight_sum, 1);
    if (!excess || excess->abs() > config.weight_sum_tolerance) {
        return validation_failure(ValidationErrorCode::InvalidWeights, weight_sum);
    }
    if (input.views.size() != input.view_confidences.size()) {
        return validation_failure(ValidationErrorCode::DimensionMismatch,
                                  Decimal{input.view_confidences.size()});
    }
    for (size_t k = 0; k < input.view_confidences.size(); ++k) {
        const Decimal& c = input.view_confidences[k];
        if (c <= 0 || c > 1) {
            return validation_failure(ValidationErrorCode::InvalidConfidence, c, k);
        }
    }
    for (size_t k = 0; k < input.views.size(); ++k) {
        const bool valid = std::visit([n](const auto& view) {
            using T = std::decay_t<decltype(view)>;
            if constexpr (std::is_same_v<T, AbsoluteView>) {
                return view.asset < n;
            } else {
                return view.long_asset < n && view.short_asset < n &&
                       view.long_asset != view.short_asset;
            }
        }, input.views[k]);
        if (!valid) {
            return validation_failure(ValidationErrorCode::InvalidWeights, Decimal{}, k);
        }
    }
    if (input.risk_aversion <= 0) {
        return validation_failure(ValidationErrorCode::InvalidRate, input.risk_aversion);
    }
    if (input.tau <= 0) {
        return validation_failure(ValidationErrorCode::InvalidRate, input.tau);
    }
    return {};
}

/// K x N pick matrix P and K-vector Q
std::pair<Matrix, Vector> pick_matrix(const std::vector<View>& views, size_t n) {
    Matrix p(views.size(), n);
    Vector q(views.size());
    for (size_t k = 0; k < views.size(); ++k) {
        if (const auto* absolute = std::get_if<AbsoluteView>(&views[k])) {
            p(k, absolute->asset) = 1;
            q[k] = absolute->expected_return;
        } else {
            const auto& relative = std::get<RelativeView>(views[k]);
            p(k, relative.long_asset) = 1;
            p(k, relative.short_asset) = -1;
            q[k] = relative.expected_return;
        }
    }
    return {std::move(p), std::move(q)};
}

/// sqrt(w^T Sigma w)
std::expected<Decimal, KernelError> portfolio_std(std::span<const Decimal> w, const Matrix& sigma) {
    auto variance = quadratic_form(w, sigma);
    if (!variance) {
        return variance;
    }
    // Rounding can leave a zero-risk portfolio a few ulps below zero
    if (variance->is_negative()) {
        return Decimal{};
    }
    return sqrt(*variance);
}

}  // namespace

std::expected<BlackLittermanResult, CalcError>
black_litterman(const BlackLittermanInput& input, const BlackLittermanConfig& config) {
    if (auto ok = validate(input, config); !ok) {
        DECIMATH_TRACE_VALIDATION_ERROR(DECIMATH_MODULE_BLACK_LITTERMAN, error_code(ok.error()), 0.0);
        return std::unexpected(ok.error());
    }

    const size_t n = input.market_weights.size();
    const Matrix& sigma = input.covariance;
    const Vector& w_mkt = input.market_weights;
    DECIMATH_TRACE_ALGO_START(DECIMATH_MODULE_BLACK_LITTERMAN, n, input.views.size());

    return guard_decimal([&]() -> std::expected<BlackLittermanResult, CalcError> {
        BlackLittermanResult result;

        // Equilibrium returns
        DECIMATH_KERNEL_ASSIGN(sigma_w, multiply(sigma, w_mkt));
        DECIMATH_KERNEL_ASSIGN(pi, scale_vector(sigma_w, input.risk_aversion));

        DECIMATH_KERNEL_ASSIGN(tau_sigma, scale(sigma, input.tau));

        // Without views the posterior is the equilibrium itself
        if (input.views.empty()) {
            DECIMATH_KERNEL_ASSIGN(portfolio_return, dot(w_mkt, pi));
            DECIMATH_KERNEL_ASSIGN(portfolio_risk, portfolio_std(w_mkt, sigma));
            result.sharpe_ratio = portfolio_risk.is_zero()
                ? Decimal{}
                : (portfolio_return - input.risk_free_rate) / portfolio_risk;
            result.posterior_returns = pi;
            result.implied_returns = std::move(pi);
            result.posterior_covariance = std::move(tau_sigma);
            result.optimal_weights = w_mkt;
            result.weight_tilts = Vector(n);
            result.portfolio_return = portfolio_return;
            result.portfolio_risk = portfolio_risk;

            DECIMATH_TRACE_ALGO_COMPLETE(DECIMATH_MODULE_BLACK_LITTERMAN, n,
                                         result.portfolio_return.to_double());
            return result;
        }

        auto [p, q] = pick_matrix(input.views, n);

        // Omega_kk = (1/c_k - 1) * (P tau Sigma P^T)_kk
        DECIMATH_KERNEL_ASSIGN(p_tau_sigma, multiply(p, tau_sigma));
        DECIMATH_KERNEL_ASSIGN(view_variance, multiply_transpose_right(p_tau_sigma, p));

        Vector omega_diag(input.views.size());
        for (size_t k = 0; k < omega_diag.size(); ++k) {
            const Decimal omega = (Decimal{1} / input.view_confidences[k] - 1) * view_variance(k, k);
            if (omega.is_negative()) {
                return validation_failure(ValidationErrorCode::InvalidCovariance, omega, k);
            }
            omega_diag[k] = omega.is_zero() ? config.omega_floor : omega;
        }
        const Matrix omega = Matrix::diagonal(omega_diag);

        // Posterior
        DECIMATH_KERNEL_ASSIGN(tau_sigma_inv, inverse(tau_sigma, config.linear_algebra));
        DECIMATH_KERNEL_ASSIGN(omega_inv, inverse_diagonal(omega));
        const Matrix pt = transpose(p);
        DECIMATH_KERNEL_ASSIGN(pt_omega_inv, multiply(pt, omega_inv));
        DECIMATH_KERNEL_ASSIGN(pt_omega_inv_p, multiply(pt_omega_inv, p));
        DECIMATH_KERNEL_ASSIGN(pt_omega_inv_q, multiply(pt_omega_inv, q));

        DECIMATH_KERNEL_ASSIGN(a, add(tau_sigma_inv, pt_omega_inv_p));
        DECIMATH_KERNEL_ASSIGN(a_inv, inverse(a, config.linear_algebra));

        DECIMATH_KERNEL_ASSIGN(prior_term, multiply(tau_sigma_inv, pi));
        DECIMATH_KERNEL_ASSIGN(b, add_vectors(prior_term, pt_omega_inv_q));
        DECIMATH_KERNEL_ASSIGN(mu, multiply(a_inv, b));

        // Optimal weights
        DECIMATH_KERNEL_ASSIGN(lambda_sigma, scale(sigma, input.risk_aversion));
        DECIMATH_KERNEL_ASSIGN(lambda_sigma_inv, inverse(lambda_sigma, config.linear_algebra));
        DECIMATH_KERNEL_ASSIGN(raw_weights, multiply(lambda_sigma_inv, mu));

        Decimal weight_sum;
        for (const auto& w : raw_weights) {
            weight_sum += w;
        }
        Vector weights(n);
        for (size_t i = 0; i < n; ++i) {
            weights[i] = weight_sum.is_zero() ? Decimal{1} / n : raw_weights[i] / weight_sum;
        }

        // Portfolio metrics
        DECIMATH_KERNEL_ASSIGN(portfolio_return, dot(weights, mu));
        DECIMATH_KERNEL_ASSIGN(portfolio_risk, portfolio_std(weights, sigma));
        DECIMATH_KERNEL_ASSIGN(tilts, subtract_vectors(weights, w_mkt));
        DECIMATH_KERNEL_ASSIGN(tracking_error, portfolio_std(tilts, sigma));
        DECIMATH_KERNEL_ASSIGN(benchmark_return, dot(w_mkt, mu));

        // Per-view impact: P (mu - pi)
        DECIMATH_KERNEL_ASSIGN(return_shift, subtract_vectors(mu, pi));
        DECIMATH_KERNEL_ASSIGN(view_impact, multiply(p, return_shift));

        result.sharpe_ratio = portfolio_risk.is_zero()
            ? Decimal{}
            : (portfolio_return - input.risk_free_rate) / portfolio_risk;
        result.information_ratio = tracking_error.is_zero()
            ? Decimal{}
            : (portfolio_return - benchmark_return) / tracking_error;

        result.implied_returns = std::move(pi);
        result.posterior_returns = std::move(mu);
        result.posterior_covariance = std::move(a_inv);
        result.optimal_weights = std::move(weights);
        result.weight_tilts = std::move(tilts);
        result.view_uncertainty = std::move(omega_diag);
        result.view_impact = std::move(view_impact);
        result.portfolio_return = portfolio_return;
        result.portfolio_risk = portfolio_risk;
        result.tracking_error = tracking_error;

        DECIMATH_TRACE_ALGO_COMPLETE(DECIMATH_MODULE_BLACK_LITTERMAN, n,
                                     result.portfolio_return.to_double());
        return result;
    });
}

}  // namespace decimath
