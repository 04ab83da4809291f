// SPDX-License-Identifier: MIT
#include "decimath/math/root_finding.hpp"

#include "decimath/math/transcendental.hpp"
#include "decimath/support/decimath_trace.h"
#include "decimath/support/parallel.hpp"

namespace decimath {

namespace {

/// v^f for a stub fraction f in (0, 1)
std::expected<Decimal, KernelError> stub_discount(const Decimal& v, const Decimal& f,
                                                  const PowFractionConfig& config) {
    if ((v - 1).abs() < 1) {
        return pow_fraction(v, f, config);
    }
    auto log_v = ln(v);
    if (!log_v) {
        return std::unexpected(log_v.error());
    }
    return exp(f * *log_v);
}

Decimal clamp_rate(const Decimal& rate, const CashFlowRootConfig& config) {
    if (rate < config.rate_min) return config.rate_min;
    if (rate > config.rate_max) return config.rate_max;
    return rate;
}

}  // namespace

std::expected<CashFlowValuation, KernelError>
value_cash_flows(std::span<const CashFlow> flows, const Decimal& rate,
                 const PowFractionConfig& config) {
    if (rate <= -1) {
        return kernel_failure(KernelErrorCode::DomainError, 0, rate);
    }

    return guard_decimal([&]() -> std::expected<CashFlowValuation, KernelError> {
        const Decimal v = Decimal{1} / (Decimal{1} + rate);

        Decimal whole_factor{1};  // v^whole_periods
        Decimal whole_periods{0};
        Decimal previous_time{0};
        CashFlowValuation valuation;

        for (size_t i = 0; i < flows.size(); ++i) {
            const Decimal& t = flows[i].time;
            if (t.is_negative() || t < previous_time) {
                return kernel_failure(KernelErrorCode::DomainError, 0, t, i);
            }
            previous_time = t;

            const Decimal periods = t.floor();
            while (whole_periods < periods) {
                whole_factor = whole_factor * v;
                whole_periods += 1;
            }

            Decimal factor = whole_factor;
            const Decimal stub = t - periods;
            if (!stub.is_zero()) {
                auto stub_factor = stub_discount(v, stub, config);
                if (!stub_factor) {
                    KernelError err = stub_factor.error();
                    err.index = i;
                    return std::unexpected(err);
                }
                factor = factor * *stub_factor;
            }

            const Decimal discounted = flows[i].amount * factor;
            valuation.npv += discounted;
            valuation.derivative -= t * discounted * v;
        }
        return valuation;
    });
}

std::expected<CashFlowRootResult, KernelError>
solve_cash_flow_rate(std::span<const CashFlow> flows, const Decimal& guess,
                     const CashFlowRootConfig& config) {
    if (flows.size() < 2) {
        DECIMATH_TRACE_VALIDATION_ERROR(DECIMATH_MODULE_CASHFLOW_ROOT,
                                        static_cast<int>(KernelErrorCode::InsufficientData),
                                        static_cast<double>(flows.size()));
        return kernel_failure(KernelErrorCode::InsufficientData, 0, Decimal{}, flows.size());
    }
    if (config.max_iter == 0 || config.tolerance.is_negative() || config.tolerance.is_zero() ||
        config.rate_min <= -1 || config.rate_min >= config.rate_max) {
        DECIMATH_TRACE_VALIDATION_ERROR(DECIMATH_MODULE_CASHFLOW_ROOT,
                                        static_cast<int>(KernelErrorCode::InvalidConfiguration),
                                        config.rate_min.to_double());
        return kernel_failure(KernelErrorCode::InvalidConfiguration);
    }

    DECIMATH_TRACE_CASHFLOW_START(flows.size(), guess.to_double(), config.max_iter);

    Decimal rate = clamp_rate(guess, config);
    Decimal anchor;  // Last rate that valued without overflow
    Decimal residual;

    for (size_t iter = 0; iter < config.max_iter; ++iter) {
        auto valuation = value_cash_flows(flows, rate, config.pow_fraction);
        for (size_t halving = 0; !valuation && valuation.error().code == KernelErrorCode::Overflow &&
                                 halving < config.max_step_halvings;
             ++halving) {
            const Decimal damped = anchor + (rate - anchor) / 2;
            DECIMATH_TRACE_CASHFLOW_CLAMP(iter, rate.to_double(), damped.to_double());
            rate = damped;
            valuation = value_cash_flows(flows, rate, config.pow_fraction);
        }
        if (!valuation) {
            if (valuation.error().code == KernelErrorCode::Overflow) {
                DECIMATH_TRACE_CONVERGENCE_FAILED(DECIMATH_MODULE_CASHFLOW_ROOT, iter,
                                                  residual.to_double());
                return kernel_failure(KernelErrorCode::ConvergenceFailure, iter, residual);
            }
            KernelError err = valuation.error();
            err.iterations = iter;
            DECIMATH_TRACE_RUNTIME_ERROR(DECIMATH_MODULE_CASHFLOW_ROOT,
                                         static_cast<int>(err.code), iter);
            return std::unexpected(err);
        }
        anchor = rate;

        residual = valuation->npv.abs();
        DECIMATH_TRACE_CONVERGENCE_ITER(DECIMATH_MODULE_CASHFLOW_ROOT, iter,
                                        residual.to_double(), config.tolerance.to_double());

        if (residual < config.tolerance) {
            DECIMATH_TRACE_CONVERGENCE_SUCCESS(DECIMATH_MODULE_CASHFLOW_ROOT, iter,
                                               residual.to_double());
            return CashFlowRootResult{
                .rate = rate,
                .iterations = iter,
                .residual = residual};
        }

        if (valuation->derivative.is_zero()) {
            DECIMATH_TRACE_CONVERGENCE_FAILED(DECIMATH_MODULE_CASHFLOW_ROOT, iter,
                                              residual.to_double());
            return kernel_failure(KernelErrorCode::ConvergenceFailure, iter, residual);
        }

        // A step too large to represent lands on the bound it points at
        const bool step_positive = valuation->npv.is_negative() == valuation->derivative.is_negative();
        Decimal next = step_positive ? config.rate_min : config.rate_max;
        if (auto step = checked_div(valuation->npv, valuation->derivative)) {
            if (auto candidate = checked_sub(rate, *step)) {
                next = *candidate;
            }
        }

        const Decimal clamped = clamp_rate(next, config);
        if (clamped != next) {
            DECIMATH_TRACE_CASHFLOW_CLAMP(iter, next.to_double(), clamped.to_double());
        }
        rate = clamped;
    }

    DECIMATH_TRACE_CONVERGENCE_FAILED(DECIMATH_MODULE_CASHFLOW_ROOT, config.max_iter,
                                      residual.to_double());
    return kernel_failure(KernelErrorCode::ConvergenceFailure, config.max_iter, residual);
}

BatchCashFlowRootResult
solve_cash_flow_rate_batch(std::span<const CashFlowProblem> problems,
                           const CashFlowRootConfig& config) {
    BatchCashFlowRootResult batch;
    batch.results.resize(problems.size());

    DECIMATH_TRACE_BATCH_START(problems.size());

    DECIMATH_PRAGMA_PARALLEL_FOR_DYNAMIC
    for (size_t i = 0; i < problems.size(); ++i) {
        batch.results[i] = solve_cash_flow_rate(problems[i].flows, problems[i].guess, config);
    }

    for (const auto& result : batch.results) {
        if (!result.has_value()) {
            ++batch.failed_count;
        }
    }

    DECIMATH_TRACE_BATCH_COMPLETE(problems.size(), batch.failed_count);
    return batch;
}

}  // namespace decimath
