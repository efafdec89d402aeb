#pragma once

#include <cstddef>
#include <Eigen/Dense>

namespace accelmath {
namespace lapack {

    // All matrices are column-major with leading dimension ld*.
    // Return values follow LAPACK's INFO convention:
    //   0   success
    //  -i   the i-th argument had an illegal value
    //   i   U(i,i) is exactly zero; the factorization completed but U is singular

    /**
     * @brief LU factorization with partial pivoting, A = P * L * U (sgetrf).
     * A is overwritten by L (unit diagonal, not stored) and U.
     * ipiv receives min(m, n) 1-based row interchanges: row i was swapped with ipiv[i].
     */
    int getrf_f32(std::size_t m, std::size_t n, float* A, std::size_t lda, int* ipiv);

    /**
     * @brief Solve A * X = B using the factors from getrf_f32 (sgetrs).
     * B (n x nrhs) is overwritten with X.
     */
    int getrs_f32(std::size_t n, std::size_t nrhs, const float* LU, std::size_t lda,
                  const int* ipiv, float* B, std::size_t ldb);

    /**
     * @brief Solve A * X = B for a square A (sgesv).
     * A is overwritten with its LU factors, B with the solution.
     * If the return value is positive, B is left unchanged.
     */
    int gesv_f32(std::size_t n, std::size_t nrhs, float* A, std::size_t lda,
                 int* ipiv, float* B, std::size_t ldb);

    // --- Eigen Wrappers ---

    struct GesvResult {
        Eigen::MatrixXf LU;
        Eigen::VectorXi ipiv;
        Eigen::MatrixXf X;
        int info = 0;

        bool ok() const { return info == 0; }
    };

    // Does not throw on singular systems; inspect info.
    GesvResult gesv(const Eigen::MatrixXf& A, const Eigen::MatrixXf& B);

    // Throws std::invalid_argument on shape errors and std::runtime_error if A is singular.
    Eigen::VectorXf solve(const Eigen::MatrixXf& A, const Eigen::VectorXf& b);

    struct LuResult {
        Eigen::MatrixXf LU;
        Eigen::VectorXi ipiv;
        int info = 0;
    };

    LuResult getrf(const Eigen::MatrixXf& A);

}
}
