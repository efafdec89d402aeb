#include "accelmath/vdsp.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

#ifdef ACCELMATH_USE_NEON
#include <arm_neon.h>
#endif

namespace accelmath {
namespace vdsp {

// =========================================================================
// Binary Kernels
// =========================================================================

void vdist_f32(const float* A, std::ptrdiff_t IA, const float* B, std::ptrdiff_t IB,
               float* C, std::ptrdiff_t IC, std::size_t N) {
    std::size_t k = 0;
#ifdef ACCELMATH_USE_NEON
    if (IA == 1 && IB == 1 && IC == 1) {
        for (; k + 3 < N; k += 4) {
            float32x4_t va = vld1q_f32(A + k);
            float32x4_t vb = vld1q_f32(B + k);
            float32x4_t sq = vmlaq_f32(vmulq_f32(va, va), vb, vb);
            vst1q_f32(C + k, vsqrtq_f32(sq));
        }
    }
#endif
    for (; k < N; ++k) {
        float a = A[k * IA];
        float b = B[k * IB];
        C[k * IC] = std::sqrt(a * a + b * b);
    }
}

void vsub_f32(const float* A, std::ptrdiff_t IA, const float* B, std::ptrdiff_t IB,
              float* C, std::ptrdiff_t IC, std::size_t N) {
    std::size_t k = 0;
#ifdef ACCELMATH_USE_NEON
    if (IA == 1 && IB == 1 && IC == 1) {
        for (; k + 3 < N; k += 4) {
            vst1q_f32(C + k, vsubq_f32(vld1q_f32(A + k), vld1q_f32(B + k)));
        }
    }
#endif
    for (; k < N; ++k) {
        C[k * IC] = A[k * IA] - B[k * IB];
    }
}

// =========================================================================
// Reductions
// =========================================================================

float sve_f32(const float* A, std::ptrdiff_t IA, std::size_t N) {
    float sum = 0.0f;
    std::size_t k = 0;
#ifdef ACCELMATH_USE_NEON
    if (IA == 1) {
        float32x4_t vsum = vdupq_n_f32(0.0f);
        for (; k + 3 < N; k += 4) {
            vsum = vaddq_f32(vsum, vld1q_f32(A + k));
        }
        sum = vaddvq_f32(vsum);
    }
#endif
    for (; k < N; ++k) sum += A[k * IA];
    return sum;
}

float meanv_f32(const float* A, std::ptrdiff_t IA, std::size_t N) {
    if (N == 0) return 0.0f;
    return sve_f32(A, IA, N) / static_cast<float>(N);
}

float maxv_f32(const float* A, std::ptrdiff_t IA, std::size_t N) {
    if (N == 0) return 0.0f;
    float m = A[0];
    for (std::size_t k = 1; k < N; ++k) {
        if (A[k * IA] > m) m = A[k * IA];
    }
    return m;
}

float minv_f32(const float* A, std::ptrdiff_t IA, std::size_t N) {
    if (N == 0) return 0.0f;
    float m = A[0];
    for (std::size_t k = 1; k < N; ++k) {
        if (A[k * IA] < m) m = A[k * IA];
    }
    return m;
}

// =========================================================================
// Eigen Wrappers
// =========================================================================

static void check_same_size(const Eigen::VectorXf& a, const Eigen::VectorXf& b, const char* op) {
    if (a.size() != b.size()) {
        throw std::invalid_argument(std::string(op) + ": vector sizes do not match ("
                                    + std::to_string(a.size()) + " vs "
                                    + std::to_string(b.size()) + ")");
    }
}

Eigen::VectorXf vdist(const Eigen::VectorXf& a, const Eigen::VectorXf& b) {
    check_same_size(a, b, "vdist");
    Eigen::VectorXf c(a.size());
    vdist_f32(a.data(), 1, b.data(), 1, c.data(), 1, static_cast<std::size_t>(a.size()));
    return c;
}

Eigen::VectorXf vsub(const Eigen::VectorXf& a, const Eigen::VectorXf& b) {
    check_same_size(a, b, "vsub");
    Eigen::VectorXf c(a.size());
    vsub_f32(a.data(), 1, b.data(), 1, c.data(), 1, static_cast<std::size_t>(a.size()));
    return c;
}

float sve(const Eigen::VectorXf& a) {
    return sve_f32(a.data(), 1, static_cast<std::size_t>(a.size()));
}

float meanv(const Eigen::VectorXf& a) {
    return meanv_f32(a.data(), 1, static_cast<std::size_t>(a.size()));
}

float maxv(const Eigen::VectorXf& a) {
    return maxv_f32(a.data(), 1, static_cast<std::size_t>(a.size()));
}

float minv(const Eigen::VectorXf& a) {
    return minv_f32(a.data(), 1, static_cast<std::size_t>(a.size()));
}

} // namespace vdsp
} // namespace accelmath
