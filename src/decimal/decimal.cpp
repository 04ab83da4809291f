// SPDX-License-Identifier: MIT
#include "decimath/decimal/decimal.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace decimath {

namespace {

using uint128_t = Decimal::uint128_t;

constexpr uint128_t pow10(uint32_t n) noexcept {
    uint128_t result = 1;
    while (n-- > 0) {
        result *= 10;
    }
    return result;
}

/// 256-bit unsigned scratch value for products and aligned sums
struct Wide {
    std::array<uint64_t, 4> limb{};  // little-endian

    static Wide from(uint128_t v) noexcept {
        Wide w;
        w.limb[0] = static_cast<uint64_t>(v);
        w.limb[1] = static_cast<uint64_t>(v >> 64);
        return w;
    }

    static Wide product(uint128_t a, uint128_t b) noexcept {
        const uint64_t a0 = static_cast<uint64_t>(a);
        const uint64_t a1 = static_cast<uint64_t>(a >> 64);
        const uint64_t b0 = static_cast<uint64_t>(b);
        const uint64_t b1 = static_cast<uint64_t>(b >> 64);

        const uint128_t p00 = static_cast<uint128_t>(a0) * b0;
        const uint128_t p01 = static_cast<uint128_t>(a0) * b1;
        const uint128_t p10 = static_cast<uint128_t>(a1) * b0;
        const uint128_t p11 = static_cast<uint128_t>(a1) * b1;

        Wide w;
        w.limb[0] = static_cast<uint64_t>(p00);
        const uint128_t mid = (p00 >> 64) + static_cast<uint64_t>(p01) + static_cast<uint64_t>(p10);
        w.limb[1] = static_cast<uint64_t>(mid);
        const uint128_t high = (mid >> 64) + (p01 >> 64) + (p10 >> 64) + static_cast<uint64_t>(p11);
        w.limb[2] = static_cast<uint64_t>(high);
        w.limb[3] = static_cast<uint64_t>((high >> 64) + (p11 >> 64));
        return w;
    }

    void add(const Wide& other) noexcept {
        uint128_t carry = 0;
        for (size_t i = 0; i < limb.size(); ++i) {
            const uint128_t sum = static_cast<uint128_t>(limb[i]) + other.limb[i] + carry;
            limb[i] = static_cast<uint64_t>(sum);
            carry = sum >> 64;
        }
    }

    /// Requires *this >= other
    void sub(const Wide& other) noexcept {
        uint64_t borrow = 0;
        for (size_t i = 0; i < limb.size(); ++i) {
            const uint128_t lhs = limb[i];
            const uint128_t rhs = static_cast<uint128_t>(other.limb[i]) + borrow;
            if (lhs >= rhs) {
                limb[i] = static_cast<uint64_t>(lhs - rhs);
                borrow = 0;
            } else {
                limb[i] = static_cast<uint64_t>((lhs + (uint128_t{1} << 64)) - rhs);
                borrow = 1;
            }
        }
    }

    /// Divide in place, return the remainder
    uint64_t divmod(uint64_t divisor) noexcept {
        uint128_t rem = 0;
        for (size_t i = limb.size(); i-- > 0;) {
            const uint128_t cur = (rem << 64) | limb[i];
            limb[i] = static_cast<uint64_t>(cur / divisor);
            rem = cur % divisor;
        }
        return static_cast<uint64_t>(rem);
    }

    void increment() noexcept {
        for (auto& l : limb) {
            if (++l != 0) break;
        }
    }

    [[nodiscard]] int compare(const Wide& other) const noexcept {
        for (size_t i = limb.size(); i-- > 0;) {
            if (limb[i] != other.limb[i]) {
                return limb[i] < other.limb[i] ? -1 : 1;
            }
        }
        return 0;
    }

    [[nodiscard]] bool fits_mantissa() const noexcept {
        return limb[3] == 0 && limb[2] == 0 && limb[1] < (uint64_t{1} << 32);
    }

    [[nodiscard]] bool is_odd() const noexcept { return (limb[0] & 1) != 0; }

    [[nodiscard]] uint128_t low128() const noexcept {
        return (static_cast<uint128_t>(limb[1]) << 64) | limb[0];
    }
};

/// Drop low-order digits, half to even, until the magnitude fits the
/// mantissa at a scale no larger than kMaxScale
std::optional<Decimal> fit(Wide magnitude, uint32_t scale, bool negative) noexcept {
    bool reduced = false;
    bool sticky = false;  // Any non-zero digit dropped before `digit`
    uint64_t digit = 0;   // Last dropped digit
    auto drop_digit = [&]() {
        sticky = sticky || digit != 0;
        digit = magnitude.divmod(10);
        --scale;
        reduced = true;
    };

    while (!magnitude.fits_mantissa() || scale > Decimal::kMaxScale) {
        if (scale == 0) {
            return std::nullopt;
        }
        drop_digit();
    }
    while (reduced && (digit > 5 || (digit == 5 && (sticky || magnitude.is_odd())))) {
        Wide rounded = magnitude;
        rounded.increment();
        if (rounded.fits_mantissa()) {
            magnitude = rounded;
            break;
        }
        // Rounding up carried to 2^96: drop one more digit of the unrounded
        // value and round once from there
        if (scale == 0) {
            return std::nullopt;
        }
        drop_digit();
    }
    return Decimal::from_parts(magnitude.low128(), scale, negative);
}

std::optional<Decimal> add_signed(const Decimal& a, const Decimal& b, bool negate_b) noexcept {
    const bool a_neg = a.is_negative();
    const bool b_neg = b.is_zero() ? false : (b.is_negative() != negate_b);
    const uint32_t scale = std::max(a.scale(), b.scale());

    Wide ma = Wide::product(a.mantissa(), pow10(scale - a.scale()));
    Wide mb = Wide::product(b.mantissa(), pow10(scale - b.scale()));

    if (a_neg == b_neg) {
        ma.add(mb);
        return fit(ma, scale, a_neg);
    }

    const int cmp = ma.compare(mb);
    if (cmp == 0) {
        return Decimal::from_parts(0, scale, false);
    }
    if (cmp > 0) {
        ma.sub(mb);
        return fit(ma, scale, a_neg);
    }
    mb.sub(ma);
    return fit(mb, scale, b_neg);
}

std::optional<Decimal> multiply(const Decimal& a, const Decimal& b) noexcept {
    return fit(Wide::product(a.mantissa(), b.mantissa()), a.scale() + b.scale(),
               a.is_negative() != b.is_negative());
}

/// Long division producing as many fractional digits as the mantissa allows.
/// Requires a non-zero divisor.
std::optional<Decimal> divide(const Decimal& a, const Decimal& b) noexcept {
    const uint128_t divisor = b.mantissa();
    uint128_t q = a.mantissa() / divisor;
    uint128_t r = a.mantissa() % divisor;
    int32_t scale = static_cast<int32_t>(a.scale()) - static_cast<int32_t>(b.scale());
    const bool negative = a.is_negative() != b.is_negative();

    while (scale < 0 || (r != 0 && scale < static_cast<int32_t>(Decimal::kMaxScale))) {
        const uint128_t r10 = r * 10;
        const uint128_t next = q * 10 + r10 / divisor;
        if (next >= Decimal::kMantissaLimit) {
            if (scale < 0) {
                return std::nullopt;
            }
            break;
        }
        q = next;
        r = r10 % divisor;
        ++scale;
    }

    if (r != 0) {
        const uint128_t twice = r * 2;
        if (twice > divisor || (twice == divisor && (q & 1) != 0)) {
            Wide w = Wide::from(q);
            w.increment();
            return fit(w, static_cast<uint32_t>(scale), negative);
        }
    }
    return Decimal::from_parts(q, static_cast<uint32_t>(scale), negative);
}

Decimal require(std::optional<Decimal> result, const char* what) {
    if (!result) {
        throw DecimalOverflowError(what);
    }
    return *result;
}

}  // namespace

Decimal Decimal::trunc() const noexcept {
    return *from_parts(mantissa_ / pow10(scale_), 0, negative_);
}

Decimal Decimal::floor() const {
    const Decimal whole = trunc();
    if (negative_ && whole != *this) {
        return whole - 1;
    }
    return whole;
}

Decimal Decimal::round_dp(uint32_t dp) const noexcept {
    if (scale_ <= dp) {
        return *this;
    }
    const uint128_t divisor = pow10(scale_ - dp);
    uint128_t q = mantissa_ / divisor;
    const uint128_t r = mantissa_ % divisor;
    const uint128_t twice = r * 2;
    if (twice > divisor || (twice == divisor && (q & 1) != 0)) {
        ++q;
    }
    return *from_parts(q, dp, negative_);
}

Decimal Decimal::normalize() const noexcept {
    uint128_t m = mantissa_;
    uint32_t s = scale_;
    while (s > 0 && m % 10 == 0) {
        m /= 10;
        --s;
    }
    return *from_parts(m, s, negative_);
}

std::string Decimal::to_string() const {
    std::string digits;
    uint128_t m = mantissa_;
    do {
        digits.push_back(static_cast<char>('0' + static_cast<int>(m % 10)));
        m /= 10;
    } while (m != 0);
    while (digits.size() < static_cast<size_t>(scale_) + 1) {
        digits.push_back('0');
    }
    std::reverse(digits.begin(), digits.end());
    if (scale_ > 0) {
        digits.insert(digits.size() - scale_, 1, '.');
    }
    if (negative_) {
        digits.insert(digits.begin(), '-');
    }
    return digits;
}

double Decimal::to_double() const noexcept {
    const double magnitude = static_cast<double>(mantissa_) / std::pow(10.0, scale_);
    return negative_ ? -magnitude : magnitude;
}

Decimal& Decimal::operator+=(const Decimal& rhs) { return *this = *this + rhs; }
Decimal& Decimal::operator-=(const Decimal& rhs) { return *this = *this - rhs; }
Decimal& Decimal::operator*=(const Decimal& rhs) { return *this = *this * rhs; }
Decimal& Decimal::operator/=(const Decimal& rhs) { return *this = *this / rhs; }

Decimal operator+(const Decimal& lhs, const Decimal& rhs) {
    return require(add_signed(lhs, rhs, false), "decimal addition overflow");
}

Decimal operator-(const Decimal& lhs, const Decimal& rhs) {
    return require(add_signed(lhs, rhs, true), "decimal subtraction overflow");
}

Decimal operator*(const Decimal& lhs, const Decimal& rhs) {
    return require(multiply(lhs, rhs), "decimal multiplication overflow");
}

Decimal operator/(const Decimal& lhs, const Decimal& rhs) {
    if (rhs.is_zero()) {
        throw DecimalDivisionByZero("decimal division by zero");
    }
    return require(divide(lhs, rhs), "decimal division overflow");
}

bool operator==(const Decimal& lhs, const Decimal& rhs) noexcept {
    return (lhs <=> rhs) == 0;
}

std::weak_ordering operator<=>(const Decimal& lhs, const Decimal& rhs) noexcept {
    if (lhs.is_zero() && rhs.is_zero()) {
        return std::weak_ordering::equivalent;
    }
    if (lhs.negative_ != rhs.negative_) {
        return lhs.negative_ ? std::weak_ordering::less : std::weak_ordering::greater;
    }

    const uint32_t scale = std::max(lhs.scale(), rhs.scale());
    const Wide a = Wide::product(lhs.mantissa_, pow10(scale - lhs.scale()));
    const Wide b = Wide::product(rhs.mantissa_, pow10(scale - rhs.scale()));
    int cmp = a.compare(b);
    if (lhs.negative_) {
        cmp = -cmp;
    }
    if (cmp < 0) return std::weak_ordering::less;
    if (cmp > 0) return std::weak_ordering::greater;
    return std::weak_ordering::equivalent;
}

std::optional<Decimal> checked_add(const Decimal& lhs, const Decimal& rhs) noexcept {
    return add_signed(lhs, rhs, false);
}

std::optional<Decimal> checked_sub(const Decimal& lhs, const Decimal& rhs) noexcept {
    return add_signed(lhs, rhs, true);
}

std::optional<Decimal> checked_mul(const Decimal& lhs, const Decimal& rhs) noexcept {
    return multiply(lhs, rhs);
}

std::optional<Decimal> checked_div(const Decimal& lhs, const Decimal& rhs) noexcept {
    if (rhs.is_zero()) {
        return std::nullopt;
    }
    return divide(lhs, rhs);
}

std::ostream& operator<<(std::ostream& os, const Decimal& value) {
    return os << value.to_string();
}

}  // namespace decimath
