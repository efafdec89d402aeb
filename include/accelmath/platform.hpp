#pragma once

#include <string>

namespace accelmath {
namespace platform {

// =========================================================================
// Backend Information
// =========================================================================

struct BackendInfo {
    bool neon;                  // vforce/vdsp compiled with NEON kernels
    std::string blas_vendor;    // CBLAS implementation, e.g. "OpenBLAS"
    std::string blas_config;    // Vendor build string, empty if not reported
    std::string eigen_version;  // "major.minor.patch"
    std::string eigen_simd;     // Instruction sets Eigen vectorizes with
    int hardware_threads;
    std::string cpu_model;      // From /proc/cpuinfo, "unknown" if absent
};

/**
 * @brief Detect the compiled backends and host CPU.
 * Cached after first call.
 */
const BackendInfo& detect_backend_info();

/**
 * @brief One-line summary of detect_backend_info(), for logs and demos.
 */
std::string describe_backend();

} // namespace platform
} // namespace accelmath
