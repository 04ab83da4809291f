// SPDX-License-Identifier: MIT
/**
 * @file normal_distribution.hpp
 * @brief Standard normal PDF, CDF and inverse CDF on Decimal
 *
 * CDF: Abramowitz & Stegun 26.2.17 (|error| < 7.5e-8).
 * Inverse CDF: Abramowitz & Stegun 26.2.23 (|error| < 4.5e-4), optionally
 * polished with Newton steps against the CDF.
 */

#pragma once

#include "decimath/decimal/decimal.hpp"
#include "decimath/math/transcendental.hpp"
#include "decimath/support/error_types.hpp"

#include <cstddef>
#include <expected>

namespace decimath {

struct NormalConfig {
    /// Newton steps x <- x - (cdf(x) - p) / pdf(x) applied after the
    /// rational approximation (0 reproduces A&S 26.2.23 exactly)
    size_t inverse_refinement_steps = 0;

    /// Probabilities are clamped to [p_clamp, 1 - p_clamp]
    Decimal p_clamp = 0.0000001_dec;

    TranscendentalConfig transcendental{};
};

/// exp(-x^2/2) / sqrt(2*pi); 0 for |x| > 38
std::expected<Decimal, KernelError> norm_pdf(const Decimal& x, const NormalConfig& config = {});

/// Standard normal cumulative distribution
std::expected<Decimal, KernelError> norm_cdf(const Decimal& x, const NormalConfig& config = {});

/// Quantile of the standard normal for probability p
///
/// p outside [p_clamp, 1 - p_clamp] (including p <= 0 and p >= 1) is
/// clamped rather than rejected.
std::expected<Decimal, KernelError> norm_inv(const Decimal& p, const NormalConfig& config = {});

}  // namespace decimath
