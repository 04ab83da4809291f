// SPDX-License-Identifier: MIT
/**
 * @file transcendental.hpp
 * @brief Square root, exponential, logarithm and trigonometric functions on Decimal
 *
 * Every routine runs a fixed number of iterations or series terms, so the
 * result is a pure function of the argument and the config: two calls with
 * the same inputs return bit-identical Decimals on every platform.
 */

#pragma once

#include "decimath/decimal/decimal.hpp"
#include "decimath/support/error_types.hpp"

#include <cstddef>
#include <expected>

namespace decimath {

/// pi to 28 fractional digits
inline constexpr Decimal kPi = 3.1415926535897932384626433833_dec;

/// 2*pi to 28 fractional digits
inline constexpr Decimal kTwoPi = 6.2831853071795864769252867666_dec;

/// Euler's number to 28 fractional digits
inline constexpr Decimal kE = 2.7182818284590452353602874714_dec;

/// sqrt(2*pi) to 28 fractional digits
inline constexpr Decimal kSqrtTwoPi = 2.5066282746310005024157652848_dec;

/// Iteration and series-length controls for the transcendental functions
struct TranscendentalConfig {
    /// Newton updates performed by sqrt
    size_t sqrt_iterations = 20;

    /// Stop sqrt once an update leaves the estimate unchanged
    bool sqrt_early_exit = false;

    /// Taylor terms used by exp on the range-reduced argument
    size_t exp_terms = 40;

    /// Newton updates performed by ln
    size_t ln_iterations = 40;

    /// Taylor terms used by cos on the range-reduced argument
    size_t cos_terms = 20;
};

/// Square root by Newton's method
///
/// Seeds x/2 for x in [0.01, 100] and 10^floor(e/2) otherwise, where e is
/// the decimal exponent of x, then performs `sqrt_iterations` updates
/// y <- (y + x/y) / 2.
///
/// @return DomainError for x < 0
std::expected<Decimal, KernelError> sqrt(const Decimal& x,
                                         const TranscendentalConfig& config = {});

/// Exponential by halving range reduction and Taylor series
///
/// Halves x until |x| <= 2, sums the series, then squares back. Negative
/// arguments are evaluated as 1/exp(-x). Results smaller than 1e-28 are 0.
///
/// @return Overflow when the result exceeds Decimal::max()
std::expected<Decimal, KernelError> exp(const Decimal& x,
                                        const TranscendentalConfig& config = {});

/// Natural logarithm, Newton's method on exp(y) = x
///
/// @return DomainError for x <= 0
std::expected<Decimal, KernelError> ln(const Decimal& x,
                                       const TranscendentalConfig& config = {});

/// Cosine, Taylor series after reduction into [-pi, pi]
std::expected<Decimal, KernelError> cos(const Decimal& x,
                                        const TranscendentalConfig& config = {});

std::expected<Decimal, KernelError> sinh(const Decimal& x,
                                         const TranscendentalConfig& config = {});

std::expected<Decimal, KernelError> cosh(const Decimal& x,
                                         const TranscendentalConfig& config = {});

/// Inverse hyperbolic cosine, ln(x + sqrt(x^2 - 1))
///
/// @return DomainError for x < 1
std::expected<Decimal, KernelError> acosh(const Decimal& x,
                                          const TranscendentalConfig& config = {});

/// Decimal exponent e such that 10^e <= |x| < 10^(e+1); x must be non-zero
int decimal_exponent(const Decimal& x) noexcept;

/// 10^e as a Decimal, e in [-28, 28]
Decimal power_of_ten(int e);

}  // namespace decimath
