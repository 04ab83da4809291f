// SPDX-License-Identifier: MIT
#include "decimath/math/power.hpp"

#include "decimath/support/decimath_trace.h"

#include <limits>

namespace decimath {

std::expected<Decimal, KernelError> pow_fraction(const Decimal& base, const Decimal& fraction,
                                                 const PowFractionConfig& config) {
    if (fraction.is_negative() || fraction > 1) {
        DECIMATH_TRACE_VALIDATION_ERROR(DECIMATH_MODULE_POW_FRACTION,
                                        static_cast<int>(KernelErrorCode::DomainError),
                                        fraction.to_double());
        return kernel_failure(KernelErrorCode::DomainError, 0, fraction);
    }
    if (fraction.is_zero() || base == 1) {
        return Decimal{1};
    }
    if (fraction == 1) {
        return base;
    }

    const Decimal x = base - 1;
    if (x.abs() >= 1) {
        DECIMATH_TRACE_VALIDATION_ERROR(DECIMATH_MODULE_POW_FRACTION,
                                        static_cast<int>(KernelErrorCode::DomainError),
                                        base.to_double());
        return kernel_failure(KernelErrorCode::DomainError, 0, base);
    }

    // |x| < 1 and |f - k + 1| / k <= 1 keep every term below 1 in magnitude
    Decimal term{1};
    Decimal sum{1};
    for (size_t k = 1; k <= config.terms; ++k) {
        term = term * (fraction - Decimal{k - 1}) * x / Decimal{k};
        sum += term;
        if (term.abs() < config.early_exit) {
            break;
        }
    }
    return sum;
}

std::expected<Decimal, KernelError> pow_integer(const Decimal& base, int64_t n) {
    if (n == 0) {
        return Decimal{1};
    }
    if (base.is_zero()) {
        if (n < 0) {
            return kernel_failure(KernelErrorCode::DivisionByZero);
        }
        return Decimal{};
    }

    return guard_decimal([&]() -> std::expected<Decimal, KernelError> {
        uint64_t remaining = n < 0 ? static_cast<uint64_t>(-(n + 1)) + 1 : static_cast<uint64_t>(n);
        Decimal result{1};
        Decimal square = base;
        while (remaining != 0) {
            if ((remaining & 1) != 0) {
                result = result * square;
            }
            remaining >>= 1;
            if (remaining != 0) {
                square = square * square;
            }
        }
        if (n < 0) {
            return Decimal{1} / result;
        }
        return result;
    });
}

std::expected<Decimal, KernelError> pow(const Decimal& base, const Decimal& exponent,
                                        const TranscendentalConfig& config) {
    const Decimal whole = exponent.trunc();
    if (whole == exponent &&
        whole.abs() <= Decimal{std::numeric_limits<int64_t>::max()}) {
        const auto magnitude = static_cast<int64_t>(whole.mantissa());
        return pow_integer(base, whole.is_negative() ? -magnitude : magnitude);
    }

    if (base.is_zero()) {
        if (exponent.is_negative()) {
            return kernel_failure(KernelErrorCode::DomainError, 0, exponent);
        }
        return Decimal{};
    }
    if (base.is_negative()) {
        return kernel_failure(KernelErrorCode::DomainError, 0, base);
    }

    auto log_base = ln(base, config);
    if (!log_base) {
        return std::unexpected(log_base.error());
    }
    return guard_decimal([&]() -> std::expected<Decimal, KernelError> {
        return exp(exponent * *log_base, config);
    });
}

}  // namespace decimath
