#include "accelmath/platform.hpp"
#include "accelmath/blas.hpp"
#include "accelmath/vforce.hpp"

#include <fstream>
#include <sstream>
#include <mutex>
#include <Eigen/Core>
#include <cblas.h>

#ifdef __linux__
#include <unistd.h>
#endif

namespace accelmath {
namespace platform {

// =========================================================================
// /proc/cpuinfo parsing
// =========================================================================

static std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// x86 reports "model name", most ARM kernels only "Hardware" or "CPU part"
static std::string read_cpu_model() {
    std::ifstream f("/proc/cpuinfo");
    if (!f.is_open()) return "unknown";

    std::string hardware;
    std::string part;
    std::string line;
    while (std::getline(f, line)) {
        auto pos = line.find(':');
        if (pos == std::string::npos) continue;
        std::string key = trim(line.substr(0, pos));
        std::string value = trim(line.substr(pos + 1));
        if (value.empty()) continue;

        if (key == "model name") {
            return value;
        } else if (key == "Hardware" && hardware.empty()) {
            hardware = value;
        } else if (key == "CPU part" && part.empty()) {
            part = "CPU part " + value;
        }
    }
    if (!hardware.empty()) return hardware;
    if (!part.empty()) return part;
    return "unknown";
}

// =========================================================================
// Backend Detection
// =========================================================================

static BackendInfo build_backend_info() {
    BackendInfo info{};

    info.neon = vforce::is_available();
    info.blas_vendor = blas::vendor();
#ifdef OPENBLAS_VERSION
    const char* config = openblas_get_config();
    info.blas_config = config ? trim(config) : "";
#endif

    std::ostringstream ev;
    ev << EIGEN_WORLD_VERSION << "." << EIGEN_MAJOR_VERSION << "." << EIGEN_MINOR_VERSION;
    info.eigen_version = ev.str();
    info.eigen_simd = Eigen::SimdInstructionSetsInUse();

#ifdef __linux__
    long n = sysconf(_SC_NPROCESSORS_ONLN);
    info.hardware_threads = n > 0 ? static_cast<int>(n) : 1;
    info.cpu_model = read_cpu_model();
#else
    info.hardware_threads = 1;
    info.cpu_model = "unknown";
#endif

    return info;
}

static std::once_flag g_backend_info_once;
static BackendInfo g_backend_info;

const BackendInfo& detect_backend_info() {
    std::call_once(g_backend_info_once, []() {
        g_backend_info = build_backend_info();
    });
    return g_backend_info;
}

std::string describe_backend() {
    const BackendInfo& info = detect_backend_info();
    std::ostringstream os;
    os << "BLAS: " << info.blas_vendor
       << ", Eigen " << info.eigen_version << " (" << info.eigen_simd << ")"
       << ", NEON kernels: " << (info.neon ? "yes" : "no")
       << ", CPU: " << info.cpu_model
       << " x" << info.hardware_threads;
    return os.str();
}

} // namespace platform
} // namespace accelmath
