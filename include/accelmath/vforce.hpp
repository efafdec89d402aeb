#pragma once

#include <cstddef>
#include <Eigen/Dense>

namespace accelmath {
namespace vforce {

    /**
     * @brief Checks if the NEON kernels were compiled in.
     */
    bool is_available();

    // --- Elementwise Kernels ---
    // out[i] = f(in[i]) for i in [0, n). out may alias in.

    void vabs_f32(float* out, const float* in, std::size_t n);

    // Integer part, rounding toward zero (3.38 -> 3, -2.12 -> -2)
    void vint_f32(float* out, const float* in, std::size_t n);
    // Nearest integer, ties to even
    void vnint_f32(float* out, const float* in, std::size_t n);
    void vfloor_f32(float* out, const float* in, std::size_t n);
    void vceil_f32(float* out, const float* in, std::size_t n);

    void vsqrt_f32(float* out, const float* in, std::size_t n);
    void vrsqrt_f32(float* out, const float* in, std::size_t n);
    void vrec_f32(float* out, const float* in, std::size_t n);

    void vexp_f32(float* out, const float* in, std::size_t n);
    void vlog_f32(float* out, const float* in, std::size_t n);

    // --- Eigen Wrappers ---

    Eigen::VectorXf vabs(const Eigen::VectorXf& x);
    Eigen::VectorXf vint(const Eigen::VectorXf& x);
    Eigen::VectorXf vnint(const Eigen::VectorXf& x);
    Eigen::VectorXf vfloor(const Eigen::VectorXf& x);
    Eigen::VectorXf vceil(const Eigen::VectorXf& x);
    Eigen::VectorXf vsqrt(const Eigen::VectorXf& x);
    Eigen::VectorXf vrsqrt(const Eigen::VectorXf& x);
    Eigen::VectorXf vrec(const Eigen::VectorXf& x);
    Eigen::VectorXf vexp(const Eigen::VectorXf& x);
    Eigen::VectorXf vlog(const Eigen::VectorXf& x);

}
}
