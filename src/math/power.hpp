// SPDX-License-Identifier: MIT
/**
 * @file power.hpp
 * @brief Fractional, integer and general powers of Decimal values
 */

#pragma once

#include "decimath/decimal/decimal.hpp"
#include "decimath/math/transcendental.hpp"
#include "decimath/support/error_types.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>

namespace decimath {

struct PowFractionConfig {
    /// Binomial series terms (after the leading 1)
    size_t terms = 15;

    /// Stop once a term's magnitude falls below this
    Decimal early_exit = 0.00000000001_dec;
};

/// base^fraction by the binomial series (1 + x)^f = sum C(f, k) x^k, x = base - 1
///
/// Exact special cases: fraction 0 -> 1, fraction 1 -> base, base 1 -> 1.
///
/// @return DomainError when fraction is outside [0, 1] or |base - 1| >= 1
std::expected<Decimal, KernelError> pow_fraction(const Decimal& base, const Decimal& fraction,
                                                 const PowFractionConfig& config = {});

/// base^n by binary exponentiation (repeated squaring); negative n uses the reciprocal
///
/// @return DivisionByZero for base 0 with n < 0, Overflow past the Decimal range
std::expected<Decimal, KernelError> pow_integer(const Decimal& base, int64_t n);

/// base^exponent = exp(exponent * ln(base))
///
/// Integral exponents are routed to pow_integer. base 0 with a positive
/// exponent is 0.
///
/// @return DomainError for base < 0 with a non-integral exponent, or base 0
///         with a negative non-integral exponent
std::expected<Decimal, KernelError> pow(const Decimal& base, const Decimal& exponent,
                                        const TranscendentalConfig& config = {});

}  // namespace decimath
