// SPDX-License-Identifier: MIT
/**
 * @file example_kernel.cc
 * @brief Walk through the decimal kernel: transcendentals, a bond yield
 *        solve, and a Black-Litterman allocation
 */

#include "decimath/finance/black_litterman.hpp"
#include "decimath/finance/bond_yield.hpp"
#include "decimath/finance/time_value.hpp"
#include "decimath/math/normal_distribution.hpp"
#include "decimath/math/transcendental.hpp"
#include <iostream>
#include <variant>
#include <vector>

using namespace decimath;

namespace {

void print_error(const CalcError& error) {
    if (const auto* v = std::get_if<ValidationError>(&error)) {
        std::cout << "   validation error " << static_cast<int>(v->code)
                  << " (value " << v->value << ", index " << v->index << ")\n";
        return;
    }
    const auto& k = std::get<KernelError>(error);
    std::cout << "   kernel error " << static_cast<int>(k.code)
              << " after " << k.iterations << " iterations, residual " << k.residual << "\n";
}

}  // namespace

int main() {
    std::cout << "=== decimath kernel example ===\n\n";

    // 1. Exact decimal arithmetic
    {
        std::cout << "1. Decimal arithmetic:\n";
        const Decimal a = 0.1_dec;
        const Decimal b = 0.2_dec;
        std::cout << "   0.1 + 0.2 = " << (a + b) << "\n";
        std::cout << "   1 / 3     = " << (Decimal{1} / 3) << "\n\n";
    }

    // 2. Transcendentals
    {
        std::cout << "2. Transcendentals:\n";
        auto root = decimath::sqrt(2);
        auto e = decimath::exp(1);
        auto cdf = norm_cdf(1.96_dec);
        if (!root || !e || !cdf) {
            std::cout << "   unexpected kernel failure\n";
            return 1;
        }
        std::cout << "   sqrt(2)     = " << *root << "\n";
        std::cout << "   exp(1)      = " << *e << "\n";
        std::cout << "   N(1.96)     = " << cdf->round_dp(8) << "\n\n";
    }

    // 3. IRR of a five-year annuity
    {
        std::cout << "3. IRR:\n";
        const std::vector<Decimal> flows{-1000, 300, 300, 300, 300, 300};
        auto rate = irr(flows);
        if (!rate) {
            print_error(rate.error());
            return 1;
        }
        std::cout << "   IRR = " << rate->round_dp(6) << "\n\n";
    }

    // 4. Bond yield with a stub first period
    {
        std::cout << "4. Bond yield:\n";
        const BondSchedule bond{
            .coupon_rate = 0.05_dec,
            .frequency = 2,
            .coupons_remaining = 9,
            .fraction_remaining = 0.4_dec};
        auto result = bond_yield(bond, 98.25_dec);
        if (!result) {
            print_error(result.error());
            return 1;
        }
        std::cout << "   YTM = " << result->annual_yield.round_dp(6)
                  << " in " << result->iterations << " iterations\n\n";
    }

    // 5. Black-Litterman with one view
    {
        std::cout << "5. Black-Litterman:\n";
        BlackLittermanInput input;
        input.market_weights = {0.55_dec, 0.30_dec, 0.15_dec};
        input.covariance = Matrix{
            {0.0400_dec, 0.0120_dec, 0.0060_dec},
            {0.0120_dec, 0.0900_dec, 0.0135_dec},
            {0.0060_dec, 0.0135_dec, 0.0225_dec}};
        input.risk_free_rate = 0.02_dec;
        input.views = {AbsoluteView{.asset = 2, .expected_return = 0.08_dec}};
        input.view_confidences = {0.6_dec};

        auto result = black_litterman(input);
        if (!result) {
            print_error(result.error());
            return 1;
        }
        for (size_t i = 0; i < result->optimal_weights.size(); ++i) {
            std::cout << "   asset " << i << ": mu = " << result->posterior_returns[i].round_dp(6)
                      << ", w = " << result->optimal_weights[i].round_dp(6) << "\n";
        }
        std::cout << "   Sharpe = " << result->sharpe_ratio.round_dp(4) << "\n\n";
    }

    // 6. Errors come back as values
    {
        std::cout << "6. Invalid input:\n";
        const std::vector<Decimal> flows{-100};
        auto rate = irr(flows);
        if (!rate) {
            print_error(rate.error());
        }
    }

    return 0;
}
