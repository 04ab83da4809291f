// SPDX-License-Identifier: MIT
#pragma once

#include "decimath/decimal/decimal.hpp"

#include <cstddef>
#include <expected>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace decimath {

/// Failure categories surfaced by every numerical kernel routine
enum class KernelErrorCode {
    ConvergenceFailure,   ///< Iteration ceiling reached or derivative vanished
    SingularMatrix,       ///< Pivot magnitude below the configured tolerance
    DivisionByZero,       ///< Exact zero divisor (e.g. zero diagonal entry)
    DimensionMismatch,    ///< Operand shapes are incompatible
    DomainError,          ///< Argument outside the function's domain
    Overflow,             ///< Intermediate result exceeded the decimal range
    InsufficientData,     ///< Too few inputs (e.g. fewer than two cash flows)
    InvalidConfiguration, ///< Config struct rejected before any work is done
    NotPositiveDefinite,  ///< Cholesky met a non-positive pivot
    Unknown
};

/// Detailed kernel error passed through the expected failure path
struct KernelError {
    KernelErrorCode code{KernelErrorCode::Unknown};
    size_t iterations{0};   // Iterations completed before failure
    Decimal residual{};     // Last residual or offending value
    size_t index{0};        // Row/flow index for structural errors (0 if n/a)
};

/// Error codes for caller-supplied parameters rejected by finance routines
enum class ValidationErrorCode {
    InvalidPrice,
    InvalidRate,
    InvalidMaturity,
    InvalidFrequency,
    InvalidQuantity,
    InvalidConfidence,
    InvalidWeights,
    InvalidCovariance,
    InvalidHorizon,
    EmptyInput,
    DimensionMismatch
};

/// Detailed validation error for parameter validation failures
struct ValidationError {
    ValidationErrorCode code;
    Decimal value;  // The invalid value that was provided
    size_t index;   // Optional index for array errors (0 if not applicable)

    ValidationError(ValidationErrorCode code,
                    Decimal value = Decimal{},
                    size_t index = 0)
        : code(code), value(value), index(index) {}
};

/// Error surfaced by the finance consumers
using CalcError = std::variant<ValidationError, KernelError>;

/// Build an unexpected KernelError in one expression
inline std::unexpected<KernelError> kernel_failure(KernelErrorCode code,
                                                   size_t iterations = 0,
                                                   Decimal residual = Decimal{},
                                                   size_t index = 0) {
    return std::unexpected(KernelError{
        .code = code,
        .iterations = iterations,
        .residual = residual,
        .index = index});
}

/// Build an unexpected CalcError from a validation failure
inline std::unexpected<CalcError> validation_failure(ValidationErrorCode code,
                                                     Decimal value = Decimal{},
                                                     size_t index = 0) {
    return std::unexpected<CalcError>(ValidationError(code, value, index));
}

/// Forward a kernel failure through a finance routine
inline std::unexpected<CalcError> calc_failure(const KernelError& error) {
    return std::unexpected<CalcError>(error);
}

/// Evaluate a kernel call and assign its value; on failure return the
/// KernelError from the enclosing function as a CalcError.
#define DECIMATH_KERNEL_ASSIGN(var, expr)                  \
    auto _result_##var = (expr);                           \
    if (!_result_##var) {                                  \
        return ::decimath::calc_failure(_result_##var.error()); \
    }                                                      \
    auto var = std::move(_result_##var).value()

/// Run a kernel body, mapping Decimal arithmetic exceptions to KernelError
///
/// `body` must return std::expected<T, KernelError>.
template <typename F>
auto guard_decimal(F&& body) -> decltype(body()) {
    try {
        return body();
    } catch (const DecimalOverflowError&) {
        return kernel_failure(KernelErrorCode::Overflow);
    } catch (const DecimalDivisionByZero&) {
        return kernel_failure(KernelErrorCode::DivisionByZero);
    }
}

/// Get error code as integer for diagnostics
inline int error_code(const CalcError& error) {
    return std::visit([](const auto& e) -> int {
        return static_cast<int>(e.code);
    }, error);
}

/// Human-readable name of a kernel error code
inline const char* to_string(KernelErrorCode code) {
    switch (code) {
        case KernelErrorCode::ConvergenceFailure: return "ConvergenceFailure";
        case KernelErrorCode::SingularMatrix: return "SingularMatrix";
        case KernelErrorCode::DivisionByZero: return "DivisionByZero";
        case KernelErrorCode::DimensionMismatch: return "DimensionMismatch";
        case KernelErrorCode::DomainError: return "DomainError";
        case KernelErrorCode::Overflow: return "Overflow";
        case KernelErrorCode::InsufficientData: return "InsufficientData";
        case KernelErrorCode::InvalidConfiguration: return "InvalidConfiguration";
        case KernelErrorCode::NotPositiveDefinite: return "NotPositiveDefinite";
        case KernelErrorCode::Unknown: return "Unknown";
    }
    return "Unknown";
}

/// Output stream operator for ValidationError
inline std::ostream& operator<<(std::ostream& os, const ValidationError& err) {
    os << "ValidationError{code=" << static_cast<int>(err.code)
       << ", value=" << err.value
       << ", index=" << err.index << "}";
    return os;
}

/// Output stream operator for KernelError
inline std::ostream& operator<<(std::ostream& os, const KernelError& err) {
    os << "KernelError{code=" << to_string(err.code)
       << ", iterations=" << err.iterations
       << ", residual=" << err.residual
       << ", index=" << err.index << "}";
    return os;
}

inline std::ostream& operator<<(std::ostream& os, const CalcError& err) {
    std::visit([&os](const auto& e) { os << e; }, err);
    return os;
}

}  // namespace decimath
