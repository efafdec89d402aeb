#pragma once

#include <cstddef>
#include <Eigen/Dense>

namespace accelmath {
namespace vdsp {

    // Strided kernels: element k of A is A[k * IA]. Strides must be positive.

    /**
     * @brief Hypotenuse of paired elements: C[k] = sqrt(A[k]^2 + B[k]^2).
     * With A holding x coordinates and B holding y coordinates this is each
     * point's distance from the origin.
     */
    void vdist_f32(const float* A, std::ptrdiff_t IA, const float* B, std::ptrdiff_t IB,
                   float* C, std::ptrdiff_t IC, std::size_t N);

    // C[k] = A[k] - B[k]
    void vsub_f32(const float* A, std::ptrdiff_t IA, const float* B, std::ptrdiff_t IB,
                  float* C, std::ptrdiff_t IC, std::size_t N);

    // Reductions. All return 0 for N == 0.
    float sve_f32(const float* A, std::ptrdiff_t IA, std::size_t N);
    float meanv_f32(const float* A, std::ptrdiff_t IA, std::size_t N);
    float maxv_f32(const float* A, std::ptrdiff_t IA, std::size_t N);
    float minv_f32(const float* A, std::ptrdiff_t IA, std::size_t N);

    // --- Eigen Wrappers ---

    Eigen::VectorXf vdist(const Eigen::VectorXf& a, const Eigen::VectorXf& b);
    Eigen::VectorXf vsub(const Eigen::VectorXf& a, const Eigen::VectorXf& b);

    float sve(const Eigen::VectorXf& a);
    float meanv(const Eigen::VectorXf& a);
    float maxv(const Eigen::VectorXf& a);
    float minv(const Eigen::VectorXf& a);

}
}
