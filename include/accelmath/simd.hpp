#pragma once

#include <Eigen/Dense>

namespace accelmath {
namespace simd {

    // Short fixed-width vectors. Eigen maps these onto the SIMD registers of the
    // target (SSE/AVX, NEON) where the width allows it.
    using float2 = Eigen::Matrix<float, 2, 1>;
    using float3 = Eigen::Matrix<float, 3, 1>;
    using float4 = Eigen::Matrix<float, 4, 1>;
    using double2 = Eigen::Matrix<double, 2, 1>;
    using double3 = Eigen::Matrix<double, 3, 1>;
    using double4 = Eigen::Matrix<double, 4, 1>;

    /**
     * @brief Computes a * x + y on a fixed-width vector.
     */
    template <typename V>
    inline V muladd(typename V::Scalar a, const V& x, const V& y) {
        return a * x + y;
    }

    template <typename V>
    inline typename V::Scalar dot(const V& a, const V& b) {
        return a.dot(b);
    }

    template <typename V>
    inline typename V::Scalar length_squared(const V& x) {
        return x.squaredNorm();
    }

    template <typename V>
    inline typename V::Scalar length(const V& x) {
        return x.norm();
    }

    template <typename V>
    inline typename V::Scalar distance_squared(const V& a, const V& b) {
        return (a - b).squaredNorm();
    }

    template <typename V>
    inline typename V::Scalar distance(const V& a, const V& b) {
        return (a - b).norm();
    }

    // The zero vector normalizes to itself.
    template <typename V>
    inline V normalize(const V& x) {
        typename V::Scalar n = x.norm();
        if (n == typename V::Scalar(0)) return V::Zero();
        return x / n;
    }

    template <typename T>
    inline Eigen::Matrix<T, 3, 1> cross(const Eigen::Matrix<T, 3, 1>& a,
                                        const Eigen::Matrix<T, 3, 1>& b) {
        return a.cross(b);
    }

    // Linear interpolation: a + t * (b - a)
    template <typename V>
    inline V mix(const V& a, const V& b, typename V::Scalar t) {
        return a + t * (b - a);
    }

    template <typename V>
    inline V clamp(const V& x, typename V::Scalar lo, typename V::Scalar hi) {
        return x.cwiseMax(lo).cwiseMin(hi);
    }

    template <typename V>
    inline typename V::Scalar reduce_add(const V& x) {
        return x.sum();
    }

    template <typename V>
    inline typename V::Scalar reduce_min(const V& x) {
        return x.minCoeff();
    }

    template <typename V>
    inline typename V::Scalar reduce_max(const V& x) {
        return x.maxCoeff();
    }

}
}
