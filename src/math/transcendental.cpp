// SPDX-License-Identifier: MIT
#include "decimath/math/transcendental.hpp"

#include "decimath/support/decimath_trace.h"

namespace decimath {

namespace {

// Bodies below throw DecimalOverflowError / DecimalDivisionByZero; the public
// entry points translate them through guard_decimal.

Decimal sqrt_raw(const Decimal& x, const TranscendentalConfig& config) {
    if (x.is_zero()) {
        return Decimal{};
    }
    if (x == 1) {
        return Decimal{1};
    }

    Decimal y;
    if (x >= 0.01_dec && x <= 100) {
        y = x / 2;
    } else {
        const int e = decimal_exponent(x);
        y = power_of_ten(e >= 0 ? e / 2 : -((1 - e) / 2));
    }

    size_t iter = 0;
    for (; iter < config.sqrt_iterations; ++iter) {
        const Decimal next = (y + x / y) / 2;
        if (config.sqrt_early_exit && next == y) {
            break;
        }
        y = next;
    }

    DECIMATH_TRACE_ALGO_COMPLETE(DECIMATH_MODULE_SQRT, iter, y.to_double());
    return y;
}

Decimal exp_raw(const Decimal& x, const TranscendentalConfig& config) {
    if (x.is_zero()) {
        return Decimal{1};
    }
    if (x.is_negative()) {
        Decimal positive;
        try {
            positive = exp_raw(-x, config);
        } catch (const DecimalOverflowError&) {
            // e^x is below the smallest representable step
            return Decimal{};
        }
        return Decimal{1} / positive;
    }

    Decimal reduced = x;
    size_t halvings = 0;
    while (reduced > 2) {
        reduced = reduced / 2;
        ++halvings;
    }

    Decimal term{1};
    Decimal sum{1};
    for (size_t n = 1; n < config.exp_terms; ++n) {
        term = term * reduced / n;
        sum += term;
    }

    for (size_t k = 0; k < halvings; ++k) {
        sum = sum * sum;
    }
    return sum;
}

Decimal ln_raw(const Decimal& x, const TranscendentalConfig& config) {
    if (x == 1) {
        return Decimal{};
    }
    if (x <= 0.5_dec) {
        return -ln_raw(Decimal{1} / x, config);
    }

    if (x >= 2) {
        // ln(x) = k + ln(x / e^k) keeps the Newton iterate inside [ln(2/e), ln 2)
        Decimal reduced = x;
        int steps = 0;
        while (reduced >= 2) {
            reduced = reduced / kE;
            ++steps;
        }
        return Decimal{steps} + ln_raw(reduced, config);
    }

    Decimal y = x - 1;
    for (size_t iter = 0; iter < config.ln_iterations; ++iter) {
        y = y - 1 + x / exp_raw(y, config);
    }
    return y;
}

Decimal cos_raw(const Decimal& x, const TranscendentalConfig& config) {
    Decimal r = x;
    if (r.abs() > kPi) {
        const Decimal turns = (r / kTwoPi).floor();
        r = r - turns * kTwoPi;
        if (r > kPi) {
            r = r - kTwoPi;
        }
    }

    const Decimal r2 = r * r;
    Decimal term{1};
    Decimal sum{1};
    for (size_t k = 1; k < config.cos_terms; ++k) {
        term = -term * r2 / Decimal{(2 * k - 1) * (2 * k)};
        sum += term;
    }
    return sum;
}

std::unexpected<KernelError> domain_failure(int module_id, const Decimal& x) {
    DECIMATH_TRACE_VALIDATION_ERROR(module_id,
                                    static_cast<int>(KernelErrorCode::DomainError),
                                    x.to_double());
    (void)module_id;
    return kernel_failure(KernelErrorCode::DomainError, 0, x);
}

}  // namespace

int decimal_exponent(const Decimal& x) noexcept {
    int digits = 0;
    for (Decimal::uint128_t m = x.mantissa(); m != 0; m /= 10) {
        ++digits;
    }
    return digits - 1 - static_cast<int>(x.scale());
}

Decimal power_of_ten(int e) {
    if (e < 0) {
        return *Decimal::from_parts(1, static_cast<uint32_t>(-e), false);
    }
    Decimal::uint128_t value = 1;
    for (int i = 0; i < e; ++i) {
        value *= 10;
    }
    const auto result = Decimal::from_parts(value, 0, false);
    if (!result) {
        throw DecimalOverflowError("power of ten out of range");
    }
    return *result;
}

std::expected<Decimal, KernelError> sqrt(const Decimal& x, const TranscendentalConfig& config) {
    if (x.is_negative()) {
        return domain_failure(DECIMATH_MODULE_SQRT, x);
    }
    return guard_decimal([&]() -> std::expected<Decimal, KernelError> {
        return sqrt_raw(x, config);
    });
}

std::expected<Decimal, KernelError> exp(const Decimal& x, const TranscendentalConfig& config) {
    return guard_decimal([&]() -> std::expected<Decimal, KernelError> {
        return exp_raw(x, config);
    });
}

std::expected<Decimal, KernelError> ln(const Decimal& x, const TranscendentalConfig& config) {
    if (x.is_negative() || x.is_zero()) {
        return domain_failure(DECIMATH_MODULE_LN, x);
    }
    return guard_decimal([&]() -> std::expected<Decimal, KernelError> {
        return ln_raw(x, config);
    });
}

std::expected<Decimal, KernelError> cos(const Decimal& x, const TranscendentalConfig& config) {
    return guard_decimal([&]() -> std::expected<Decimal, KernelError> {
        return cos_raw(x, config);
    });
}

std::expected<Decimal, KernelError> sinh(const Decimal& x, const TranscendentalConfig& config) {
    return guard_decimal([&]() -> std::expected<Decimal, KernelError> {
        return (exp_raw(x, config) - exp_raw(-x, config)) / 2;
    });
}

std::expected<Decimal, KernelError> cosh(const Decimal& x, const TranscendentalConfig& config) {
    return guard_decimal([&]() -> std::expected<Decimal, KernelError> {
        return (exp_raw(x, config) + exp_raw(-x, config)) / 2;
    });
}

std::expected<Decimal, KernelError> acosh(const Decimal& x, const TranscendentalConfig& config) {
    if (x < 1) {
        return domain_failure(DECIMATH_MODULE_TRIG, x);
    }
    return guard_decimal([&]() -> std::expected<Decimal, KernelError> {
        if (x == 1) {
            return Decimal{};
        }
        return ln_raw(x + sqrt_raw(x * x - 1, config), config);
    });
}

}  // namespace decimath
