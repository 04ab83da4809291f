// SPDX-License-Identifier: MIT
#include "decimath/math/normal_distribution.hpp"

#include "decimath/support/decimath_trace.h"

namespace decimath {

namespace {

// Abramowitz & Stegun 26.2.17
constexpr Decimal kCdfP = 0.2316419_dec;
constexpr Decimal kCdfB1 = 0.319381530_dec;
constexpr Decimal kCdfB2 = -0.356563782_dec;
constexpr Decimal kCdfB3 = 1.781477937_dec;
constexpr Decimal kCdfB4 = -1.821255978_dec;
constexpr Decimal kCdfB5 = 1.330274429_dec;

// Abramowitz & Stegun 26.2.23
constexpr Decimal kInvC0 = 2.515517_dec;
constexpr Decimal kInvC1 = 0.802853_dec;
constexpr Decimal kInvC2 = 0.010328_dec;
constexpr Decimal kInvD1 = 1.432788_dec;
constexpr Decimal kInvD2 = 0.189269_dec;
constexpr Decimal kInvD3 = 0.001308_dec;

// exp(-x^2/2) is below 1e-28 beyond this
constexpr Decimal kPdfCutoff = 38;

}  // namespace

std::expected<Decimal, KernelError> norm_pdf(const Decimal& x, const NormalConfig& config) {
    if (x.abs() > kPdfCutoff) {
        return Decimal{};
    }
    auto e = exp(-(x * x) / 2, config.transcendental);
    if (!e) {
        return std::unexpected(e.error());
    }
    return *e / kSqrtTwoPi;
}

std::expected<Decimal, KernelError> norm_cdf(const Decimal& x, const NormalConfig& config) {
    const Decimal ax = x.abs();
    auto pdf = norm_pdf(ax, config);
    if (!pdf) {
        return std::unexpected(pdf.error());
    }

    return guard_decimal([&]() -> std::expected<Decimal, KernelError> {
        const Decimal t = Decimal{1} / (Decimal{1} + kCdfP * ax);
        const Decimal poly =
            t * (kCdfB1 + t * (kCdfB2 + t * (kCdfB3 + t * (kCdfB4 + t * kCdfB5))));
        const Decimal upper_tail = *pdf * poly;
        return x.is_negative() ? upper_tail : Decimal{1} - upper_tail;
    });
}

std::expected<Decimal, KernelError> norm_inv(const Decimal& p, const NormalConfig& config) {
    Decimal prob = p;
    const Decimal upper = Decimal{1} - config.p_clamp;
    if (prob < config.p_clamp) {
        prob = config.p_clamp;
    } else if (prob > upper) {
        prob = upper;
    }

    const bool lower = prob < 0.5_dec;
    const Decimal tail = lower ? prob : Decimal{1} - prob;

    auto log_tail = ln(tail, config.transcendental);
    if (!log_tail) {
        return std::unexpected(log_tail.error());
    }
    auto t = sqrt(Decimal{-2} * *log_tail, config.transcendental);
    if (!t) {
        return std::unexpected(t.error());
    }

    const Decimal tv = *t;
    return guard_decimal([&]() -> std::expected<Decimal, KernelError> {
        const Decimal numerator = kInvC0 + kInvC1 * tv + kInvC2 * tv * tv;
        const Decimal denominator =
            Decimal{1} + kInvD1 * tv + kInvD2 * tv * tv + kInvD3 * tv * tv * tv;
        Decimal x = tv - numerator / denominator;
        if (lower) {
            x = -x;
        }

        for (size_t step = 0; step < config.inverse_refinement_steps; ++step) {
            auto cdf = norm_cdf(x, config);
            if (!cdf) {
                return std::unexpected(cdf.error());
            }
            auto pdf = norm_pdf(x, config);
            if (!pdf) {
                return std::unexpected(pdf.error());
            }
            if (pdf->is_zero()) {
                break;
            }
            const Decimal miss = *cdf - prob;
            DECIMATH_TRACE_CONVERGENCE_ITER(DECIMATH_MODULE_NORMAL_DIST, step,
                                            miss.to_double(), 0.0);
            x = x - miss / *pdf;
        }
        return x;
    });
}

}  // namespace decimath
