#include "accelmath/vforce.hpp"
#include <cmath>

#ifdef ACCELMATH_USE_NEON
#include <arm_neon.h>
#endif

namespace accelmath {
namespace vforce {

bool is_available() {
#ifdef ACCELMATH_USE_NEON
    return true;
#else
    return false;
#endif
}

// =========================================================================
// Rounding and Sign
// =========================================================================

void vabs_f32(float* out, const float* in, std::size_t n) {
#ifdef ACCELMATH_USE_NEON
    std::size_t i = 0;
    for (; i + 3 < n; i += 4) {
        vst1q_f32(out + i, vabsq_f32(vld1q_f32(in + i)));
    }
    for (; i < n; ++i) {
        out[i] = std::fabs(in[i]);
    }
#else
    for (std::size_t i = 0; i < n; ++i) out[i] = std::fabs(in[i]);
#endif
}

void vint_f32(float* out, const float* in, std::size_t n) {
#ifdef ACCELMATH_USE_NEON
    std::size_t i = 0;
    for (; i + 3 < n; i += 4) {
        vst1q_f32(out + i, vrndq_f32(vld1q_f32(in + i)));
    }
    for (; i < n; ++i) {
        out[i] = std::trunc(in[i]);
    }
#else
    for (std::size_t i = 0; i < n; ++i) out[i] = std::trunc(in[i]);
#endif
}

void vnint_f32(float* out, const float* in, std::size_t n) {
#ifdef ACCELMATH_USE_NEON
    std::size_t i = 0;
    for (; i + 3 < n; i += 4) {
        vst1q_f32(out + i, vrndnq_f32(vld1q_f32(in + i)));
    }
    for (; i < n; ++i) {
        out[i] = std::nearbyint(in[i]);
    }
#else
    // nearbyint honours the default round-to-nearest-even mode
    for (std::size_t i = 0; i < n; ++i) out[i] = std::nearbyint(in[i]);
#endif
}

void vfloor_f32(float* out, const float* in, std::size_t n) {
#ifdef ACCELMATH_USE_NEON
    std::size_t i = 0;
    for (; i + 3 < n; i += 4) {
        vst1q_f32(out + i, vrndmq_f32(vld1q_f32(in + i)));
    }
    for (; i < n; ++i) {
        out[i] = std::floor(in[i]);
    }
#else
    for (std::size_t i = 0; i < n; ++i) out[i] = std::floor(in[i]);
#endif
}

void vceil_f32(float* out, const float* in, std::size_t n) {
#ifdef ACCELMATH_USE_NEON
    std::size_t i = 0;
    for (; i + 3 < n; i += 4) {
        vst1q_f32(out + i, vrndpq_f32(vld1q_f32(in + i)));
    }
    for (; i < n; ++i) {
        out[i] = std::ceil(in[i]);
    }
#else
    for (std::size_t i = 0; i < n; ++i) out[i] = std::ceil(in[i]);
#endif
}

// =========================================================================
// Roots and Reciprocals
// =========================================================================

void vsqrt_f32(float* out, const float* in, std::size_t n) {
#ifdef ACCELMATH_USE_NEON
    std::size_t i = 0;
    for (; i + 3 < n; i += 4) {
        vst1q_f32(out + i, vsqrtq_f32(vld1q_f32(in + i)));
    }
    for (; i < n; ++i) {
        out[i] = std::sqrt(in[i]);
    }
#else
    for (std::size_t i = 0; i < n; ++i) out[i] = std::sqrt(in[i]);
#endif
}

// Full-precision 1/sqrt(x), not the vrsqrteq_f32 estimate.
void vrsqrt_f32(float* out, const float* in, std::size_t n) {
#ifdef ACCELMATH_USE_NEON
    float32x4_t vone = vdupq_n_f32(1.0f);
    std::size_t i = 0;
    for (; i + 3 < n; i += 4) {
        vst1q_f32(out + i, vdivq_f32(vone, vsqrtq_f32(vld1q_f32(in + i))));
    }
    for (; i < n; ++i) {
        out[i] = 1.0f / std::sqrt(in[i]);
    }
#else
    for (std::size_t i = 0; i < n; ++i) out[i] = 1.0f / std::sqrt(in[i]);
#endif
}

void vrec_f32(float* out, const float* in, std::size_t n) {
#ifdef ACCELMATH_USE_NEON
    float32x4_t vone = vdupq_n_f32(1.0f);
    std::size_t i = 0;
    for (; i + 3 < n; i += 4) {
        vst1q_f32(out + i, vdivq_f32(vone, vld1q_f32(in + i)));
    }
    for (; i < n; ++i) {
        out[i] = 1.0f / in[i];
    }
#else
    for (std::size_t i = 0; i < n; ++i) out[i] = 1.0f / in[i];
#endif
}

// =========================================================================
// Transcendentals
// =========================================================================

// Scalar libm calls; results match std::exp / std::log exactly.
void vexp_f32(float* out, const float* in, std::size_t n) {
    for (std::size_t i = 0; i < n; ++i) out[i] = std::exp(in[i]);
}

void vlog_f32(float* out, const float* in, std::size_t n) {
    for (std::size_t i = 0; i < n; ++i) out[i] = std::log(in[i]);
}

// =========================================================================
// Eigen Wrappers
// =========================================================================

Eigen::VectorXf vabs(const Eigen::VectorXf& x) {
    Eigen::VectorXf res(x.size());
    vabs_f32(res.data(), x.data(), static_cast<std::size_t>(x.size()));
    return res;
}

Eigen::VectorXf vint(const Eigen::VectorXf& x) {
    Eigen::VectorXf res(x.size());
    vint_f32(res.data(), x.data(), static_cast<std::size_t>(x.size()));
    return res;
}

Eigen::VectorXf vnint(const Eigen::VectorXf& x) {
    Eigen::VectorXf res(x.size());
    vnint_f32(res.data(), x.data(), static_cast<std::size_t>(x.size()));
    return res;
}

Eigen::VectorXf vfloor(const Eigen::VectorXf& x) {
    Eigen::VectorXf res(x.size());
    vfloor_f32(res.data(), x.data(), static_cast<std::size_t>(x.size()));
    return res;
}

Eigen::VectorXf vceil(const Eigen::VectorXf& x) {
    Eigen::VectorXf res(x.size());
    vceil_f32(res.data(), x.data(), static_cast<std::size_t>(x.size()));
    return res;
}

Eigen::VectorXf vsqrt(const Eigen::VectorXf& x) {
    Eigen::VectorXf res(x.size());
    vsqrt_f32(res.data(), x.data(), static_cast<std::size_t>(x.size()));
    return res;
}

Eigen::VectorXf vrsqrt(const Eigen::VectorXf& x) {
    Eigen::VectorXf res(x.size());
    vrsqrt_f32(res.data(), x.data(), static_cast<std::size_t>(x.size()));
    return res;
}

Eigen::VectorXf vrec(const Eigen::VectorXf& x) {
    Eigen::VectorXf res(x.size());
    vrec_f32(res.data(), x.data(), static_cast<std::size_t>(x.size()));
    return res;
}

Eigen::VectorXf vexp(const Eigen::VectorXf& x) {
    Eigen::VectorXf res(x.size());
    vexp_f32(res.data(), x.data(), static_cast<std::size_t>(x.size()));
    return res;
}

Eigen::VectorXf vlog(const Eigen::VectorXf& x) {
    Eigen::VectorXf res(x.size());
    vlog_f32(res.data(), x.data(), static_cast<std::size_t>(x.size()));
    return res;
}

} // namespace vforce
} // namespace accelmath
