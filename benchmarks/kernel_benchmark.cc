// SPDX-License-Identifier: MIT
/**
 * @file kernel_benchmark.cc
 * @brief Latency of the decimal kernels and the batch cash-flow solver
 *
 * Run with: ./build/kernel_benchmark
 */

#include "decimath/finance/black_litterman.hpp"
#include "decimath/math/linear_algebra.hpp"
#include "decimath/math/normal_distribution.hpp"
#include "decimath/math/power.hpp"
#include "decimath/math/root_finding.hpp"
#include "decimath/math/transcendental.hpp"
#include <benchmark/benchmark.h>
#include <string>
#include <vector>

using namespace decimath;

namespace {

std::vector<CashFlow> bullet_flows(size_t periods, const Decimal& coupon) {
    std::vector<CashFlow> flows;
    flows.reserve(periods + 1);
    flows.push_back(CashFlow{.time = 0, .amount = -100});
    for (size_t t = 1; t <= periods; ++t) {
        flows.push_back(CashFlow{.time = Decimal{t}, .amount = t == periods ? coupon + 100 : coupon});
    }
    return flows;
}

Matrix covariance(size_t n) {
    Matrix m(n, n);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            m(i, j) = i == j ? 0.04_dec + Decimal{i} * 0.005_dec : 0.006_dec;
        }
    }
    return m;
}

}  // namespace

// ============================================================================
// Transcendentals
// ============================================================================

static void BM_Sqrt(benchmark::State& state) {
    const Decimal x = 12345.6789_dec;
    for (auto _ : state) {
        auto r = decimath::sqrt(x);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_Sqrt);

static void BM_Exp(benchmark::State& state) {
    const Decimal x = 3.75_dec;
    for (auto _ : state) {
        auto r = decimath::exp(x);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_Exp);

static void BM_Ln(benchmark::State& state) {
    const Decimal x = 42.5_dec;
    for (auto _ : state) {
        auto r = decimath::ln(x);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_Ln);

static void BM_NormCdf(benchmark::State& state) {
    const Decimal x = -1.3_dec;
    for (auto _ : state) {
        auto r = norm_cdf(x);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_NormCdf);

static void BM_PowFraction(benchmark::State& state) {
    const Decimal base = 1.035_dec;
    const Decimal f = 0.37_dec;
    for (auto _ : state) {
        auto r = pow_fraction(base, f);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_PowFraction);

// ============================================================================
// Root finding
// ============================================================================

static void BM_CashFlowRate(benchmark::State& state) {
    const auto flows = bullet_flows(static_cast<size_t>(state.range(0)), 6);
    for (auto _ : state) {
        auto r = solve_cash_flow_rate(flows, 0.1_dec);
        benchmark::DoNotOptimize(r);
    }
    state.SetLabel(std::to_string(state.range(0)) + " periods");
}
BENCHMARK(BM_CashFlowRate)->Arg(5)->Arg(30)->Arg(120);

static void BM_CashFlowRate_Batch(benchmark::State& state) {
    const size_t batch_size = static_cast<size_t>(state.range(0));
    std::vector<CashFlowProblem> problems;
    problems.reserve(batch_size);
    for (size_t i = 0; i < batch_size; ++i) {
        problems.push_back(CashFlowProblem{
            .flows = bullet_flows(10 + i % 20, Decimal{3} + Decimal{i % 7}),
            .guess = 0.05_dec});
    }

    for (auto _ : state) {
        auto batch = solve_cash_flow_rate_batch(problems);
        benchmark::DoNotOptimize(batch);
    }

    state.SetItemsProcessed(state.iterations() * batch_size);
    state.SetLabel("batch: " + std::to_string(batch_size) + " problems");
}
BENCHMARK(BM_CashFlowRate_Batch)->Arg(16)->Arg(128);

// ============================================================================
// Linear algebra
// ============================================================================

static void BM_Inverse(benchmark::State& state) {
    const Matrix sigma = covariance(static_cast<size_t>(state.range(0)));
    for (auto _ : state) {
        auto r = inverse(sigma);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_Inverse)->Arg(4)->Arg(10)->Arg(25);

static void BM_Cholesky(benchmark::State& state) {
    const Matrix sigma = covariance(static_cast<size_t>(state.range(0)));
    for (auto _ : state) {
        auto r = cholesky(sigma);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_Cholesky)->Arg(4)->Arg(10)->Arg(25);

static void BM_BlackLitterman(benchmark::State& state) {
    const size_t n = static_cast<size_t>(state.range(0));
    BlackLittermanInput input;
    input.market_weights.assign(n, Decimal{1} / Decimal{n});
    input.covariance = covariance(n);
    input.views = {AbsoluteView{.asset = 0, .expected_return = 0.1_dec},
                   RelativeView{.long_asset = 1, .short_asset = n - 1, .expected_return = 0.02_dec}};
    input.view_confidences = {0.6_dec, 0.4_dec};

    for (auto _ : state) {
        auto r = black_litterman(input);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_BlackLitterman)->Arg(4)->Arg(12);

BENCHMARK_MAIN();
