#pragma once

#include <cstddef>
#include <Eigen/Dense>

namespace accelmath {
namespace blas {

    /**
     * @brief Name of the CBLAS implementation linked in (e.g. "OpenBLAS").
     */
    const char* vendor();

    // --- Level 1 (strided, BLAS argument order) ---

    // y := alpha * x + y
    void axpy_f32(std::size_t n, float alpha, const float* x, std::ptrdiff_t incx,
                  float* y, std::ptrdiff_t incy);
    void axpy_f64(std::size_t n, double alpha, const double* x, std::ptrdiff_t incx,
                  double* y, std::ptrdiff_t incy);

    float dot_f32(std::size_t n, const float* x, std::ptrdiff_t incx,
                  const float* y, std::ptrdiff_t incy);
    double dot_f64(std::size_t n, const double* x, std::ptrdiff_t incx,
                   const double* y, std::ptrdiff_t incy);

    void scal_f32(std::size_t n, float alpha, float* x, std::ptrdiff_t incx);
    void swap_f32(std::size_t n, float* x, std::ptrdiff_t incx, float* y, std::ptrdiff_t incy);

    float nrm2_f32(std::size_t n, const float* x, std::ptrdiff_t incx);
    float asum_f32(std::size_t n, const float* x, std::ptrdiff_t incx);

    /**
     * @brief Index of the first element with the largest absolute value.
     * Zero-based, unlike Fortran BLAS. Returns 0 for n == 0.
     */
    std::size_t iamax_f32(std::size_t n, const float* x, std::ptrdiff_t incx);

    // --- Level 2 ---

    // A := alpha * x * y^T + A   (A is m x n, column-major)
    void ger_f32(std::size_t m, std::size_t n, float alpha,
                 const float* x, std::ptrdiff_t incx,
                 const float* y, std::ptrdiff_t incy,
                 float* A, std::size_t lda);

    // --- Eigen Wrappers ---

    // Returns alpha * x + y. Inputs are not modified.
    Eigen::VectorXf axpy(float alpha, const Eigen::VectorXf& x, const Eigen::VectorXf& y);
    Eigen::VectorXd axpy(double alpha, const Eigen::VectorXd& x, const Eigen::VectorXd& y);

    float dot(const Eigen::VectorXf& a, const Eigen::VectorXf& b);
    double dot(const Eigen::VectorXd& a, const Eigen::VectorXd& b);

    float nrm2(const Eigen::VectorXf& x);
    float asum(const Eigen::VectorXf& x);

}
}
