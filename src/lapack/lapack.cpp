#include "accelmath/lapack.hpp"
#include "accelmath/blas.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace accelmath {
namespace lapack {

// =========================================================================
// Triangular Solves (single RHS, column-major)
// =========================================================================

// Solve L*x = b where diag(L) = 1. b is overwritten with x.
static void trsv_lower_unit_f32(float* b, const float* L, std::size_t n, std::size_t ldl) {
    for (std::size_t j = 0; j < n; ++j) {
        std::size_t rem = n - j - 1;
        if (rem > 0 && b[j] != 0.0f) {
            blas::axpy_f32(rem, -b[j], L + j + 1 + j * ldl, 1, b + j + 1, 1);
        }
    }
}

// Solve U*x = b (U upper triangular, non-unit diagonal). b is overwritten with x.
static void trsv_upper_f32(float* b, const float* U, std::size_t n, std::size_t ldu) {
    for (std::size_t jj = n; jj > 0; --jj) {
        std::size_t j = jj - 1;
        b[j] /= U[j + j * ldu];
        if (j > 0 && b[j] != 0.0f) {
            // b[0..j-1] -= b[j] * U[0..j-1, j]
            blas::axpy_f32(j, -b[j], U + j * ldu, 1, b, 1);
        }
    }
}

// =========================================================================
// LU Decomposition with Partial Pivoting (in-place)
// =========================================================================

int getrf_f32(std::size_t m, std::size_t n, float* A, std::size_t lda, int* ipiv) {
    std::size_t mn = std::min(m, n);
    if (A == nullptr && m > 0 && n > 0) return -3;
    if (lda < std::max<std::size_t>(1, m)) return -4;
    if (ipiv == nullptr && mn > 0) return -5;

    int info = 0;
    for (std::size_t j = 0; j < mn; ++j) {
        // Pivot search in column j, rows j..m-1
        std::size_t p = j + blas::iamax_f32(m - j, A + j + j * lda, 1);
        ipiv[j] = static_cast<int>(p + 1);

        if (A[p + j * lda] != 0.0f) {
            if (p != j) {
                blas::swap_f32(n, A + j, static_cast<std::ptrdiff_t>(lda),
                               A + p, static_cast<std::ptrdiff_t>(lda));
            }
            if (j + 1 < m) {
                blas::scal_f32(m - j - 1, 1.0f / A[j + j * lda], A + j + 1 + j * lda, 1);
            }
        } else if (info == 0) {
            info = static_cast<int>(j + 1);
        }

        // Rank-1 update of the trailing submatrix
        if (j + 1 < m && j + 1 < n) {
            blas::ger_f32(m - j - 1, n - j - 1, -1.0f,
                          A + j + 1 + j * lda, 1,
                          A + j + (j + 1) * lda, static_cast<std::ptrdiff_t>(lda),
                          A + j + 1 + (j + 1) * lda, lda);
        }
    }
    return info;
}

int getrs_f32(std::size_t n, std::size_t nrhs, const float* LU, std::size_t lda,
              const int* ipiv, float* B, std::size_t ldb) {
    if (lda < std::max<std::size_t>(1, n)) return -4;
    if (ldb < std::max<std::size_t>(1, n)) return -7;
    if (n == 0 || nrhs == 0) return 0;
    if (LU == nullptr) return -3;
    if (ipiv == nullptr) return -5;
    if (B == nullptr) return -6;

    // Apply the row interchanges to B in factorization order
    for (std::size_t i = 0; i < n; ++i) {
        std::size_t p = static_cast<std::size_t>(ipiv[i] - 1);
        if (p != i) {
            blas::swap_f32(nrhs, B + i, static_cast<std::ptrdiff_t>(ldb),
                           B + p, static_cast<std::ptrdiff_t>(ldb));
        }
    }

    for (std::size_t k = 0; k < nrhs; ++k) {
        trsv_lower_unit_f32(B + k * ldb, LU, n, lda);
        trsv_upper_f32(B + k * ldb, LU, n, lda);
    }
    return 0;
}

int gesv_f32(std::size_t n, std::size_t nrhs, float* A, std::size_t lda,
             int* ipiv, float* B, std::size_t ldb) {
    if (lda < std::max<std::size_t>(1, n)) return -4;
    if (ldb < std::max<std::size_t>(1, n)) return -7;

    int info = getrf_f32(n, n, A, lda, ipiv);
    if (info != 0) return info;
    return getrs_f32(n, nrhs, A, lda, ipiv, B, ldb);
}

// =========================================================================
// Eigen Wrappers
// =========================================================================

// Eigen reports an outer stride of 0 for empty matrices
static std::size_t leading_dim(const Eigen::MatrixXf& M) {
    return std::max<std::size_t>(1, static_cast<std::size_t>(M.outerStride()));
}

GesvResult gesv(const Eigen::MatrixXf& A, const Eigen::MatrixXf& B) {
    if (A.rows() != A.cols()) {
        throw std::invalid_argument("gesv: coefficient matrix must be square");
    }
    if (B.rows() != A.rows()) {
        throw std::invalid_argument("gesv: right-hand side has "
                                    + std::to_string(B.rows()) + " rows, expected "
                                    + std::to_string(A.rows()));
    }

    std::size_t n = static_cast<std::size_t>(A.rows());
    GesvResult res;
    res.LU = A;
    res.X = B;
    res.ipiv = Eigen::VectorXi::Zero(A.rows());
    res.info = gesv_f32(n, static_cast<std::size_t>(B.cols()),
                        res.LU.data(), leading_dim(res.LU),
                        res.ipiv.data(),
                        res.X.data(), leading_dim(res.X));
    return res;
}

Eigen::VectorXf solve(const Eigen::MatrixXf& A, const Eigen::VectorXf& b) {
    GesvResult res = gesv(A, b);
    if (res.info > 0) {
        throw std::runtime_error("solve: matrix is singular, U("
                                 + std::to_string(res.info) + "," + std::to_string(res.info)
                                 + ") is exactly zero");
    }
    if (res.info < 0) {
        throw std::invalid_argument("solve: illegal value in argument "
                                    + std::to_string(-res.info));
    }
    return res.X.col(0);
}

LuResult getrf(const Eigen::MatrixXf& A) {
    LuResult res;
    res.LU = A;
    res.ipiv = Eigen::VectorXi::Zero(std::min(A.rows(), A.cols()));
    res.info = getrf_f32(static_cast<std::size_t>(A.rows()), static_cast<std::size_t>(A.cols()),
                         res.LU.data(), leading_dim(res.LU), res.ipiv.data());
    return res;
}

} // namespace lapack
} // namespace accelmath
