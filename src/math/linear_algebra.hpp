// SPDX-License-Identifier: MIT
/**
 * @file linear_algebra.hpp
 * @brief Dense Decimal vectors and matrices for portfolio-sized problems
 *
 * Sized for covariance matrices of a few dozen assets: row-major storage,
 * O(n^3) Gauss-Jordan inversion with partial pivoting, Cholesky for
 * symmetric positive-definite input. Every combining operation checks
 * conformable shapes first and reports DimensionMismatch otherwise.
 */

#pragma once

#include "decimath/decimal/decimal.hpp"
#include "decimath/support/error_types.hpp"

#include <cstddef>
#include <expected>
#include <initializer_list>
#include <span>
#include <vector>

namespace decimath {

using Vector = std::vector<Decimal>;

/// Row-major dense matrix of Decimal
class Matrix {
public:
    Matrix() = default;

    /// rows x cols zero matrix
    Matrix(size_t rows, size_t cols)
        : rows_(rows), cols_(cols), data_(rows * cols) {}

    /// Literal construction, e.g. Matrix{{1, 2}, {3, 4}}
    ///
    /// @throws std::invalid_argument when rows differ in length
    Matrix(std::initializer_list<std::initializer_list<Decimal>> rows);

    /// Build from nested rows; DimensionMismatch (index = offending row)
    /// when the rows are ragged
    static std::expected<Matrix, KernelError> from_rows(const std::vector<Vector>& rows);

    static Matrix identity(size_t n);

    /// Square matrix with `diagonal` on the diagonal
    static Matrix diagonal(std::span<const Decimal> diagonal);

    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }
    bool is_square() const { return rows_ == cols_; }
    bool empty() const { return data_.empty(); }

    Decimal& operator()(size_t r, size_t c) { return data_[r * cols_ + c]; }
    const Decimal& operator()(size_t r, size_t c) const { return data_[r * cols_ + c]; }

    std::span<const Decimal> row(size_t r) const {
        return std::span<const Decimal>(data_).subspan(r * cols_, cols_);
    }

    /// Copy of the diagonal (min(rows, cols) entries)
    Vector diagonal_values() const;

    /// |A(i,j) - A(j,i)| <= tolerance for all i, j
    bool is_symmetric(const Decimal& tolerance = Decimal{}) const;

    /// Square with every off-diagonal entry exactly zero
    bool is_diagonal() const;

    /// Shapes match and every entry compares equal
    friend bool operator==(const Matrix& lhs, const Matrix& rhs) = default;

private:
    size_t rows_ = 0;
    size_t cols_ = 0;
    std::vector<Decimal> data_;
};

struct LinearAlgebraConfig {
    /// Gauss-Jordan reports SingularMatrix when the best pivot is below this
    Decimal pivot_tolerance = 0.0000000001_dec;
};

std::expected<Decimal, KernelError> dot(std::span<const Decimal> a, std::span<const Decimal> b);

std::expected<Vector, KernelError> add_vectors(std::span<const Decimal> a, std::span<const Decimal> b);

std::expected<Vector, KernelError> subtract_vectors(std::span<const Decimal> a,
                                                    std::span<const Decimal> b);

std::expected<Vector, KernelError> scale_vector(std::span<const Decimal> v, const Decimal& factor);

/// A * x
std::expected<Vector, KernelError> multiply(const Matrix& a, std::span<const Decimal> x);

/// A * B
std::expected<Matrix, KernelError> multiply(const Matrix& a, const Matrix& b);

/// A * B^T without materializing the transpose (A is m x k, B is n x k)
std::expected<Matrix, KernelError> multiply_transpose_right(const Matrix& a, const Matrix& b);

Matrix transpose(const Matrix& a);

/// Element-wise A + B
std::expected<Matrix, KernelError> add(const Matrix& a, const Matrix& b);

/// factor * A
std::expected<Matrix, KernelError> scale(const Matrix& a, const Decimal& factor);

/// w^T * Sigma * w (portfolio variance)
std::expected<Decimal, KernelError> quadratic_form(std::span<const Decimal> w, const Matrix& sigma);

/// Gauss-Jordan inverse with partial pivoting
///
/// Augments with the identity, picks the largest-magnitude pivot in each
/// column, normalizes the pivot row and eliminates the column from every
/// other row.
///
/// @return SingularMatrix (index = column, residual = |pivot|) when the best
///         pivot is below config.pivot_tolerance
std::expected<Matrix, KernelError> inverse(const Matrix& a, const LinearAlgebraConfig& config = {});

/// O(n) inverse of a diagonal matrix
///
/// @return DivisionByZero (index = row) for a zero diagonal entry,
///         DomainError (index = row) when an off-diagonal entry is non-zero
std::expected<Matrix, KernelError> inverse_diagonal(const Matrix& a);

/// Lower-triangular L with A = L * L^T
///
/// @return NotPositiveDefinite (index = column, residual = pivot) when a
///         pivot is not strictly positive
std::expected<Matrix, KernelError> cholesky(const Matrix& a);

/// Solve (L * L^T) x = b given the factor from cholesky()
std::expected<Vector, KernelError> cholesky_solve(const Matrix& lower, std::span<const Decimal> b);

}  // namespace decimath
