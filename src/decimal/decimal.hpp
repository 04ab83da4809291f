// SPDX-License-Identifier: MIT
/**
 * @file decimal.hpp
 * @brief Exact base-10 fixed-point number used by every kernel routine
 *
 * A Decimal is sign * mantissa / 10^scale with a 96-bit unsigned mantissa and
 * a scale in [0, 28]. Arithmetic is exact whenever the result fits; otherwise
 * low-order digits are dropped with round-half-to-even. Results never depend
 * on the host floating-point unit.
 */

#pragma once

#include <compare>
#include <concepts>
#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

namespace decimath {

/// Thrown when a result's integer part does not fit the 96-bit mantissa
class DecimalOverflowError : public std::overflow_error {
public:
    using std::overflow_error::overflow_error;
};

/// Thrown on division by an exact zero
class DecimalDivisionByZero : public std::domain_error {
public:
    using std::domain_error::domain_error;
};

class Decimal {
public:
    using uint128_t = unsigned __int128;

    /// Largest number of fractional digits
    static constexpr uint32_t kMaxScale = 28;

    /// Exclusive upper bound of the mantissa (2^96)
    static constexpr uint128_t kMantissaLimit = uint128_t{1} << 96;

    /// Zero
    constexpr Decimal() noexcept = default;

    /// Exact conversion from any integer type
    template <std::integral T>
    constexpr Decimal(T value) noexcept {  // NOLINT(google-explicit-constructor)
        if constexpr (std::is_signed_v<T>) {
            if (value < 0) {
                negative_ = true;
                mantissa_ = static_cast<uint128_t>(-static_cast<__int128>(value));
                return;
            }
        }
        mantissa_ = static_cast<uint128_t>(value);
    }

    /// Build from raw parts; empty if the mantissa or scale is out of range
    [[nodiscard]] static constexpr std::optional<Decimal>
    from_parts(uint128_t mantissa, uint32_t scale, bool negative) noexcept {
        if (mantissa >= kMantissaLimit || scale > kMaxScale) {
            return std::nullopt;
        }
        Decimal d;
        d.mantissa_ = mantissa;
        d.scale_ = static_cast<uint8_t>(scale);
        d.negative_ = negative && mantissa != 0;
        return d;
    }

    /// Parse "[+-]digits[.digits][e[+-]digits]"; empty on malformed or
    /// unrepresentable text (no silent rounding)
    [[nodiscard]] static constexpr std::optional<Decimal>
    parse(std::string_view text) noexcept {
        size_t pos = 0;
        bool negative = false;
        if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            negative = text[pos] == '-';
            ++pos;
        }

        uint128_t mantissa = 0;
        int32_t scale = 0;
        bool seen_digit = false;
        bool seen_point = false;
        for (; pos < text.size(); ++pos) {
            const char c = text[pos];
            if (c == '\'' || c == '_') {
                continue;
            }
            if (c == '.') {
                if (seen_point) return std::nullopt;
                seen_point = true;
                continue;
            }
            if (c == 'e' || c == 'E') {
                break;
            }
            if (c < '0' || c > '9') {
                return std::nullopt;
            }
            seen_digit = true;
            mantissa = mantissa * 10 + static_cast<uint128_t>(c - '0');
            if (mantissa >= kMantissaLimit) {
                return std::nullopt;
            }
            if (seen_point) {
                ++scale;
            }
        }
        if (!seen_digit) {
            return std::nullopt;
        }

        if (pos < text.size()) {
            ++pos;  // 'e'
            bool exponent_negative = false;
            if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
                exponent_negative = text[pos] == '-';
                ++pos;
            }
            int32_t exponent = 0;
            bool exponent_digit = false;
            for (; pos < text.size(); ++pos) {
                const char c = text[pos];
                if (c < '0' || c > '9') return std::nullopt;
                exponent_digit = true;
                exponent = exponent * 10 + (c - '0');
                if (exponent > 64) return std::nullopt;
            }
            if (!exponent_digit) {
                return std::nullopt;
            }
            scale += exponent_negative ? exponent : -exponent;
        }

        while (scale < 0) {
            mantissa *= 10;
            if (mantissa >= kMantissaLimit) return std::nullopt;
            ++scale;
        }
        while (scale > static_cast<int32_t>(kMaxScale) && mantissa % 10 == 0) {
            mantissa /= 10;
            --scale;
        }
        return from_parts(mantissa, static_cast<uint32_t>(scale), negative);
    }

    /// Largest representable value, 79228162514264337593543950335
    [[nodiscard]] static constexpr Decimal max() noexcept {
        Decimal d;
        d.mantissa_ = kMantissaLimit - 1;
        return d;
    }

    /// Smallest positive step, 1e-28
    [[nodiscard]] static constexpr Decimal min_positive() noexcept {
        Decimal d;
        d.mantissa_ = 1;
        d.scale_ = kMaxScale;
        return d;
    }

    [[nodiscard]] constexpr uint128_t mantissa() const noexcept { return mantissa_; }
    [[nodiscard]] constexpr uint32_t scale() const noexcept { return scale_; }
    [[nodiscard]] constexpr bool is_negative() const noexcept { return negative_; }
    [[nodiscard]] constexpr bool is_zero() const noexcept { return mantissa_ == 0; }

    [[nodiscard]] constexpr Decimal abs() const noexcept {
        Decimal d = *this;
        d.negative_ = false;
        return d;
    }

    constexpr Decimal operator-() const noexcept {
        Decimal d = *this;
        d.negative_ = !negative_ && mantissa_ != 0;
        return d;
    }

    /// Same mantissa, scale and sign (stronger than ==, which ignores scale)
    [[nodiscard]] constexpr bool identical(const Decimal& other) const noexcept {
        return mantissa_ == other.mantissa_ && scale_ == other.scale_ &&
               negative_ == other.negative_;
    }

    /// Drop the fractional part (toward zero)
    [[nodiscard]] Decimal trunc() const noexcept;

    /// Largest integer not greater than this value
    [[nodiscard]] Decimal floor() const;

    /// Round to `dp` fractional digits, half to even
    [[nodiscard]] Decimal round_dp(uint32_t dp) const noexcept;

    /// Remove trailing fractional zeros (1.2500 -> 1.25)
    [[nodiscard]] Decimal normalize() const noexcept;

    [[nodiscard]] std::string to_string() const;

    /// Lossy conversion for diagnostics and cross-checks only
    [[nodiscard]] double to_double() const noexcept;

    Decimal& operator+=(const Decimal& rhs);
    Decimal& operator-=(const Decimal& rhs);
    Decimal& operator*=(const Decimal& rhs);
    Decimal& operator/=(const Decimal& rhs);

    friend Decimal operator+(const Decimal& lhs, const Decimal& rhs);
    friend Decimal operator-(const Decimal& lhs, const Decimal& rhs);
    friend Decimal operator*(const Decimal& lhs, const Decimal& rhs);
    friend Decimal operator/(const Decimal& lhs, const Decimal& rhs);

    friend bool operator==(const Decimal& lhs, const Decimal& rhs) noexcept;
    friend std::weak_ordering operator<=>(const Decimal& lhs, const Decimal& rhs) noexcept;

private:
    uint128_t mantissa_ = 0;
    uint8_t scale_ = 0;
    bool negative_ = false;
};

/// Arithmetic that reports overflow (and division by zero) as an empty result
[[nodiscard]] std::optional<Decimal> checked_add(const Decimal& lhs, const Decimal& rhs) noexcept;
[[nodiscard]] std::optional<Decimal> checked_sub(const Decimal& lhs, const Decimal& rhs) noexcept;
[[nodiscard]] std::optional<Decimal> checked_mul(const Decimal& lhs, const Decimal& rhs) noexcept;
[[nodiscard]] std::optional<Decimal> checked_div(const Decimal& lhs, const Decimal& rhs) noexcept;

std::ostream& operator<<(std::ostream& os, const Decimal& value);

inline namespace literals {

/// 0.2316419_dec keeps every digit of the literal exactly
consteval Decimal operator""_dec(const char* text) {
    const auto value = Decimal::parse(text);
    if (!value) {
        throw std::invalid_argument("decimal literal is not representable");
    }
    return *value;
}

}  // namespace literals

}  // namespace decimath
