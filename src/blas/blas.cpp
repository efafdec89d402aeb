#include "accelmath/blas.hpp"
#include <stdexcept>
#include <string>

#include <cblas.h>

namespace accelmath {
namespace blas {

// CBLAS takes int sizes and strides
static int as_int(std::size_t n) { return static_cast<int>(n); }
static int as_int(std::ptrdiff_t inc) { return static_cast<int>(inc); }

const char* vendor() {
#ifdef OPENBLAS_VERSION
    return "OpenBLAS";
#else
    return "CBLAS";
#endif
}

// =========================================================================
// Level 1
// =========================================================================

void axpy_f32(std::size_t n, float alpha, const float* x, std::ptrdiff_t incx,
              float* y, std::ptrdiff_t incy) {
    if (n == 0) return;
    cblas_saxpy(as_int(n), alpha, x, as_int(incx), y, as_int(incy));
}

void axpy_f64(std::size_t n, double alpha, const double* x, std::ptrdiff_t incx,
              double* y, std::ptrdiff_t incy) {
    if (n == 0) return;
    cblas_daxpy(as_int(n), alpha, x, as_int(incx), y, as_int(incy));
}

float dot_f32(std::size_t n, const float* x, std::ptrdiff_t incx,
              const float* y, std::ptrdiff_t incy) {
    if (n == 0) return 0.0f;
    return cblas_sdot(as_int(n), x, as_int(incx), y, as_int(incy));
}

double dot_f64(std::size_t n, const double* x, std::ptrdiff_t incx,
               const double* y, std::ptrdiff_t incy) {
    if (n == 0) return 0.0;
    return cblas_ddot(as_int(n), x, as_int(incx), y, as_int(incy));
}

void scal_f32(std::size_t n, float alpha, float* x, std::ptrdiff_t incx) {
    if (n == 0) return;
    cblas_sscal(as_int(n), alpha, x, as_int(incx));
}

void swap_f32(std::size_t n, float* x, std::ptrdiff_t incx, float* y, std::ptrdiff_t incy) {
    if (n == 0) return;
    cblas_sswap(as_int(n), x, as_int(incx), y, as_int(incy));
}

float nrm2_f32(std::size_t n, const float* x, std::ptrdiff_t incx) {
    if (n == 0) return 0.0f;
    return cblas_snrm2(as_int(n), x, as_int(incx));
}

float asum_f32(std::size_t n, const float* x, std::ptrdiff_t incx) {
    if (n == 0) return 0.0f;
    return cblas_sasum(as_int(n), x, as_int(incx));
}

std::size_t iamax_f32(std::size_t n, const float* x, std::ptrdiff_t incx) {
    if (n == 0) return 0;
    return static_cast<std::size_t>(cblas_isamax(as_int(n), x, as_int(incx)));
}

// =========================================================================
// Level 2
// =========================================================================

void ger_f32(std::size_t m, std::size_t n, float alpha,
             const float* x, std::ptrdiff_t incx,
             const float* y, std::ptrdiff_t incy,
             float* A, std::size_t lda) {
    if (m == 0 || n == 0) return;
    cblas_sger(CblasColMajor, as_int(m), as_int(n), alpha,
               x, as_int(incx), y, as_int(incy), A, as_int(lda));
}

// =========================================================================
// Eigen Wrappers
// =========================================================================

static void check_same_size(Eigen::Index a, Eigen::Index b, const char* op) {
    if (a != b) {
        throw std::invalid_argument(std::string(op) + ": vector sizes do not match");
    }
}

Eigen::VectorXf axpy(float alpha, const Eigen::VectorXf& x, const Eigen::VectorXf& y) {
    check_same_size(x.size(), y.size(), "axpy");
    // saxpy overwrites its accumulator, so work on a copy of y
    Eigen::VectorXf res = y;
    axpy_f32(static_cast<std::size_t>(x.size()), alpha, x.data(), 1, res.data(), 1);
    return res;
}

Eigen::VectorXd axpy(double alpha, const Eigen::VectorXd& x, const Eigen::VectorXd& y) {
    check_same_size(x.size(), y.size(), "axpy");
    Eigen::VectorXd res = y;
    axpy_f64(static_cast<std::size_t>(x.size()), alpha, x.data(), 1, res.data(), 1);
    return res;
}

float dot(const Eigen::VectorXf& a, const Eigen::VectorXf& b) {
    check_same_size(a.size(), b.size(), "dot");
    return dot_f32(static_cast<std::size_t>(a.size()), a.data(), 1, b.data(), 1);
}

double dot(const Eigen::VectorXd& a, const Eigen::VectorXd& b) {
    check_same_size(a.size(), b.size(), "dot");
    return dot_f64(static_cast<std::size_t>(a.size()), a.data(), 1, b.data(), 1);
}

float nrm2(const Eigen::VectorXf& x) {
    return nrm2_f32(static_cast<std::size_t>(x.size()), x.data(), 1);
}

float asum(const Eigen::VectorXf& x) {
    return asum_f32(static_cast<std::size_t>(x.size()), x.data(), 1);
}

} // namespace blas
} // namespace accelmath
