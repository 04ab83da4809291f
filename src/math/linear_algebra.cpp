// SPDX-License-Identifier: MIT
#include "decimath/math/linear_algebra.hpp"

#include "decimath/math/transcendental.hpp"
#include "decimath/support/decimath_trace.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace decimath {

namespace {

std::unexpected<KernelError> dimension_mismatch(size_t index = 0) {
    return kernel_failure(KernelErrorCode::DimensionMismatch, 0, Decimal{}, index);
}

}  // namespace

Matrix::Matrix(std::initializer_list<std::initializer_list<Decimal>> rows)
    : rows_(rows.size()), cols_(rows.size() == 0 ? 0 : rows.begin()->size()) {
    data_.reserve(rows_ * cols_);
    for (const auto& row : rows) {
        if (row.size() != cols_) {
            throw std::invalid_argument("Matrix rows must have equal length");
        }
        data_.insert(data_.end(), row.begin(), row.end());
    }
}

std::expected<Matrix, KernelError> Matrix::from_rows(const std::vector<Vector>& rows) {
    const size_t cols = rows.empty() ? 0 : rows.front().size();
    Matrix m(rows.size(), cols);
    for (size_t r = 0; r < rows.size(); ++r) {
        if (rows[r].size() != cols) {
            return dimension_mismatch(r);
        }
        for (size_t c = 0; c < cols; ++c) {
            m(r, c) = rows[r][c];
        }
    }
    return m;
}

Matrix Matrix::identity(size_t n) {
    Matrix m(n, n);
    for (size_t i = 0; i < n; ++i) {
        m(i, i) = 1;
    }
    return m;
}

Matrix Matrix::diagonal(std::span<const Decimal> diagonal) {
    Matrix m(diagonal.size(), diagonal.size());
    for (size_t i = 0; i < diagonal.size(); ++i) {
        m(i, i) = diagonal[i];
    }
    return m;
}

Vector Matrix::diagonal_values() const {
    const size_t n = std::min(rows_, cols_);
    Vector d(n);
    for (size_t i = 0; i < n; ++i) {
        d[i] = (*this)(i, i);
    }
    return d;
}

bool Matrix::is_symmetric(const Decimal& tolerance) const {
    if (!is_square()) {
        return false;
    }
    for (size_t i = 0; i < rows_; ++i) {
        for (size_t j = i + 1; j < cols_; ++j) {
            const auto diff = checked_sub((*this)(i, j), (*this)(j, i));
            if (!diff || diff->abs() > tolerance) {
                return false;
            }
        }
    }
    return true;
}

bool Matrix::is_diagonal() const {
    if (!is_square()) {
        return false;
    }
    for (size_t i = 0; i < rows_; ++i) {
        for (size_t j = 0; j < cols_; ++j) {
            if (i != j && !(*this)(i, j).is_zero()) {
                return false;
            }
        }
    }
    return true;
}

std::expected<Decimal, KernelError> dot(std::span<const Decimal> a, std::span<const Decimal> b) {
    if (a.size() != b.size()) {
        return dimension_mismatch();
    }
    return guard_decimal([&]() -> std::expected<Decimal, KernelError> {
        Decimal sum;
        for (size_t i = 0; i < a.size(); ++i) {
            sum += a[i] * b[i];
        }
        return sum;
    });
}

std::expected<Vector, KernelError> add_vectors(std::span<const Decimal> a, std::span<const Decimal> b) {
    if (a.size() != b.size()) {
        return dimension_mismatch();
    }
    return guard_decimal([&]() -> std::expected<Vector, KernelError> {
        Vector out(a.size());
        for (size_t i = 0; i < a.size(); ++i) {
            out[i] = a[i] + b[i];
        }
        return out;
    });
}

std::expected<Vector, KernelError> subtract_vectors(std::span<const Decimal> a,
                                                    std::span<const Decimal> b) {
    if (a.size() != b.size()) {
        return dimension_mismatch();
    }
    return guard_decimal([&]() -> std::expected<Vector, KernelError> {
        Vector out(a.size());
        for (size_t i = 0; i < a.size(); ++i) {
            out[i] = a[i] - b[i];
        }
        return out;
    });
}

std::expected<Vector, KernelError> scale_vector(std::span<const Decimal> v, const Decimal& factor) {
    return guard_decimal([&]() -> std::expected<Vector, KernelError> {
        Vector out(v.size());
        for (size_t i = 0; i < v.size(); ++i) {
            out[i] = v[i] * factor;
        }
        return out;
    });
}

std::expected<Vector, KernelError> multiply(const Matrix& a, std::span<const Decimal> x) {
    if (a.cols() != x.size()) {
        return dimension_mismatch();
    }
    return guard_decimal([&]() -> std::expected<Vector, KernelError> {
        Vector out(a.rows());
        for (size_t r = 0; r < a.rows(); ++r) {
            Decimal sum;
            for (size_t c = 0; c < a.cols(); ++c) {
                sum += a(r, c) * x[c];
            }
            out[r] = sum;
        }
        return out;
    });
}

std::expected<Matrix, KernelError> multiply(const Matrix& a, const Matrix& b) {
    if (a.cols() != b.rows()) {
        return dimension_mismatch();
    }
    return guard_decimal([&]() -> std::expected<Matrix, KernelError> {
        Matrix out(a.rows(), b.cols());
        for (size_t r = 0; r < a.rows(); ++r) {
            for (size_t c = 0; c < b.cols(); ++c) {
                Decimal sum;
                for (size_t k = 0; k < a.cols(); ++k) {
                    sum += a(r, k) * b(k, c);
                }
                out(r, c) = sum;
            }
        }
        return out;
    });
}

std::expected<Matrix, KernelError> multiply_transpose_right(const Matrix& a, const Matrix& b) {
    if (a.cols() != b.cols()) {
        return dimension_mismatch();
    }
    return guard_decimal([&]() -> std::expected<Matrix, KernelError> {
        Matrix out(a.rows(), b.rows());
        for (size_t r = 0; r < a.rows(); ++r) {
            for (size_t c = 0; c < b.rows(); ++c) {
                Decimal sum;
                for (size_t k = 0; k < a.cols(); ++k) {
                    sum += a(r, k) * b(c, k);
                }
                out(r, c) = sum;
            }
        }
        return out;
    });
}

Matrix transpose(const Matrix& a) {
    Matrix out(a.cols(), a.rows());
    for (size_t r = 0; r < a.rows(); ++r) {
        for (size_t c = 0; c < a.cols(); ++c) {
            out(c, r) = a(r, c);
        }
    }
    return out;
}

std::expected<Matrix, KernelError> add(const Matrix& a, const Matrix& b) {
    if (a.rows() != b.rows() || a.cols() != b.cols()) {
        return dimension_mismatch();
    }
    return guard_decimal([&]() -> std::expected<Matrix, KernelError> {
        Matrix out(a.rows(), a.cols());
        for (size_t r = 0; r < a.rows(); ++r) {
            for (size_t c = 0; c < a.cols(); ++c) {
                out(r, c) = a(r, c) + b(r, c);
            }
        }
        return out;
    });
}

std::expected<Matrix, KernelError> scale(const Matrix& a, const Decimal& factor) {
    return guard_decimal([&]() -> std::expected<Matrix, KernelError> {
        Matrix out(a.rows(), a.cols());
        for (size_t r = 0; r < a.rows(); ++r) {
            for (size_t c = 0; c < a.cols(); ++c) {
                out(r, c) = a(r, c) * factor;
            }
        }
        return out;
    });
}

std::expected<Decimal, KernelError> quadratic_form(std::span<const Decimal> w, const Matrix& sigma) {
    if (!sigma.is_square() || sigma.rows() != w.size()) {
        return dimension_mismatch();
    }
    auto sigma_w = multiply(sigma, w);
    if (!sigma_w) {
        return std::unexpected(sigma_w.error());
    }
    return dot(w, *sigma_w);
}

std::expected<Matrix, KernelError> inverse(const Matrix& a, const LinearAlgebraConfig& config) {
    if (!a.is_square()) {
        return dimension_mismatch();
    }
    const size_t n = a.rows();
    DECIMATH_TRACE_ALGO_START(DECIMATH_MODULE_MATRIX_INVERSE, n, config.pivot_tolerance.to_double());

    return guard_decimal([&]() -> std::expected<Matrix, KernelError> {
        // [A | I]
        Matrix aug(n, 2 * n);
        for (size_t r = 0; r < n; ++r) {
            for (size_t c = 0; c < n; ++c) {
                aug(r, c) = a(r, c);
            }
            aug(r, n + r) = 1;
        }

        for (size_t col = 0; col < n; ++col) {
            size_t pivot_row = col;
            Decimal pivot_abs = aug(col, col).abs();
            for (size_t r = col + 1; r < n; ++r) {
                const Decimal candidate = aug(r, col).abs();
                if (candidate > pivot_abs) {
                    pivot_abs = candidate;
                    pivot_row = r;
                }
            }
            DECIMATH_TRACE_MATRIX_PIVOT(col, pivot_row, pivot_abs.to_double());

            if (pivot_abs < config.pivot_tolerance) {
                DECIMATH_TRACE_RUNTIME_ERROR(DECIMATH_MODULE_MATRIX_INVERSE,
                                             static_cast<int>(KernelErrorCode::SingularMatrix), col);
                return kernel_failure(KernelErrorCode::SingularMatrix, col, pivot_abs, col);
            }

            if (pivot_row != col) {
                for (size_t c = 0; c < 2 * n; ++c) {
                    std::swap(aug(col, c), aug(pivot_row, c));
                }
            }

            const Decimal pivot = aug(col, col);
            for (size_t c = 0; c < 2 * n; ++c) {
                aug(col, c) = aug(col, c) / pivot;
            }

            for (size_t r = 0; r < n; ++r) {
                if (r == col) continue;
                const Decimal factor = aug(r, col);
                if (factor.is_zero()) continue;
                for (size_t c = 0; c < 2 * n; ++c) {
                    aug(r, c) = aug(r, c) - factor * aug(col, c);
                }
            }
        }

        Matrix inv(n, n);
        for (size_t r = 0; r < n; ++r) {
            for (size_t c = 0; c < n; ++c) {
                inv(r, c) = aug(r, n + c);
            }
        }
        DECIMATH_TRACE_ALGO_COMPLETE(DECIMATH_MODULE_MATRIX_INVERSE, n, 0.0);
        return inv;
    });
}

std::expected<Matrix, KernelError> inverse_diagonal(const Matrix& a) {
    if (!a.is_square()) {
        return dimension_mismatch();
    }
    const size_t n = a.rows();
    for (size_t r = 0; r < n; ++r) {
        for (size_t c = 0; c < n; ++c) {
            if (r != c && !a(r, c).is_zero()) {
                return kernel_failure(KernelErrorCode::DomainError, 0, a(r, c), r);
            }
        }
    }

    return guard_decimal([&]() -> std::expected<Matrix, KernelError> {
        Matrix inv(n, n);
        for (size_t i = 0; i < n; ++i) {
            if (a(i, i).is_zero()) {
                DECIMATH_TRACE_RUNTIME_ERROR(DECIMATH_MODULE_MATRIX_INVERSE,
                                             static_cast<int>(KernelErrorCode::DivisionByZero), i);
                return kernel_failure(KernelErrorCode::DivisionByZero, 0, Decimal{}, i);
            }
            inv(i, i) = Decimal{1} / a(i, i);
        }
        return inv;
    });
}

std::expected<Matrix, KernelError> cholesky(const Matrix& a) {
    if (!a.is_square()) {
        return dimension_mismatch();
    }
    const size_t n = a.rows();
    DECIMATH_TRACE_ALGO_START(DECIMATH_MODULE_CHOLESKY, n, 0.0);

    return guard_decimal([&]() -> std::expected<Matrix, KernelError> {
        Matrix lower(n, n);
        for (size_t j = 0; j < n; ++j) {
            Decimal pivot = a(j, j);
            for (size_t k = 0; k < j; ++k) {
                pivot = pivot - lower(j, k) * lower(j, k);
            }
            if (pivot.is_negative() || pivot.is_zero()) {
                DECIMATH_TRACE_RUNTIME_ERROR(DECIMATH_MODULE_CHOLESKY,
                                             static_cast<int>(KernelErrorCode::NotPositiveDefinite), j);
                return kernel_failure(KernelErrorCode::NotPositiveDefinite, j, pivot, j);
            }
            auto root = sqrt(pivot);
            if (!root) {
                return std::unexpected(root.error());
            }
            lower(j, j) = *root;

            for (size_t i = j + 1; i < n; ++i) {
                Decimal sum = a(i, j);
                for (size_t k = 0; k < j; ++k) {
                    sum = sum - lower(i, k) * lower(j, k);
                }
                lower(i, j) = sum / lower(j, j);
            }
        }
        DECIMATH_TRACE_ALGO_COMPLETE(DECIMATH_MODULE_CHOLESKY, n, 0.0);
        return lower;
    });
}

std::expected<Vector, KernelError> cholesky_solve(const Matrix& lower, std::span<const Decimal> b) {
    if (!lower.is_square() || lower.rows() != b.size()) {
        return dimension_mismatch();
    }
    const size_t n = lower.rows();

    return guard_decimal([&]() -> std::expected<Vector, KernelError> {
        // L y = b
        Vector y(n);
        for (size_t i = 0; i < n; ++i) {
            Decimal sum = b[i];
            for (size_t k = 0; k < i; ++k) {
                sum = sum - lower(i, k) * y[k];
            }
            if (lower(i, i).is_zero()) {
                return kernel_failure(KernelErrorCode::DivisionByZero, 0, Decimal{}, i);
            }
            y[i] = sum / lower(i, i);
        }

        // L^T x = y
        Vector x(n);
        for (size_t i = n; i-- > 0;) {
            Decimal sum = y[i];
            for (size_t k = i + 1; k < n; ++k) {
                sum = sum - lower(k, i) * x[k];
            }
            x[i] = sum / lower(i, i);
        }
        return x;
    });
}

}  // namespace decimath
