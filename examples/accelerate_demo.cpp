/**
 * @file accelerate_demo.cpp
 * @brief Walkthrough of the AccelMath routines
 *
 * This example showcases, in order:
 * - BLAS: saxpy (10 * x + y) and sdot
 * - LAPACK: solving three simultaneous equations with sgesv
 * - simd: the same 10 * p + q on a fixed-width double3
 * - vForce: absolute values, integer parts, square roots, reciprocals
 * - vDSP: distances along a 2-D path
 */

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <Eigen/Dense>

#include "accelmath/blas.hpp"
#include "accelmath/lapack.hpp"
#include "accelmath/path.hpp"
#include "accelmath/platform.hpp"
#include "accelmath/simd.hpp"
#include "accelmath/vdsp.hpp"
#include "accelmath/vforce.hpp"

using namespace std;
using namespace accelmath;

void print_separator(const string& title) {
    cout << "\n" << string(60, '=') << "\n";
    cout << "  " << title << "\n";
    cout << string(60, '=') << "\n\n";
}

template <typename Vec>
void print_vector(const string& name, const Vec& v) {
    cout << "  " << name << " = [ ";
    for (Eigen::Index i = 0; i < v.size(); ++i) {
        cout << v[i] << " ";
    }
    cout << "]\n";
}

void print_vector(const string& name, const vector<float>& v) {
    print_vector(name, Eigen::Map<const Eigen::VectorXf>(v.data(), static_cast<Eigen::Index>(v.size())));
}

int main() {
    cout << "AccelMath Demo\n";
    cout << "==============\n\n";
    cout << platform::describe_backend() << "\n";
    cout << fixed << setprecision(4);

    // ========================================================================
    // BLAS
    // ========================================================================
    print_separator("BLAS: 10 * x + y, then x . y");

    vector<float> x = {1, 2, 3};
    vector<float> y = {3, 4, 5};

    // saxpy accumulates into y in place
    blas::axpy_f32(3, 10.0f, x.data(), 1, y.data(), 1);
    print_vector("10 * x + y", y);

    // y was overwritten above
    y = {3, 4, 5};
    float xy = blas::dot_f32(3, x.data(), 1, y.data(), 1);
    cout << "  x . y = " << xy << "   (1*3 + 2*4 + 3*5)\n";

    // ========================================================================
    // LAPACK
    // ========================================================================
    print_separator("LAPACK: simultaneous equations");

    cout << "  7x + 5y - 3z =  16\n";
    cout << "  3x - 5y + 2z =  -8\n";
    cout << "  5x + 3y - 7z =   0\n\n";

    // Column-major: each row below is one column of the coefficient matrix
    vector<float> A = {
         7,  3,  5,
         5, -5,  3,
        -3,  2, -7
    };
    vector<float> b = {16, -8, 0};
    vector<int> pivot(3, 0);

    int info = lapack::gesv_f32(3, 1, A.data(), 3, pivot.data(), b.data(), 3);
    cout << "  status = " << info << "\n";
    if (info != 0) {
        cerr << "  sgesv failed: U(" << info << "," << info << ") is exactly zero\n";
        return 1;
    }
    cout << "  x = " << b[0] << ", y = " << b[1] << ", z = " << b[2] << "\n";

    // ========================================================================
    // simd
    // ========================================================================
    print_separator("simd: 10 * p + q");

    simd::double3 p(1, 2, 3);
    simd::double3 q(3, 4, 5);
    print_vector("10 * p + q", simd::muladd(10.0, p, q));

    // ========================================================================
    // vForce
    // ========================================================================
    print_separator("vForce: elementwise math");

    vector<float> a = {-3, -2, -5, -10};
    vector<float> a_abs(a.size());
    vforce::vabs_f32(a_abs.data(), a.data(), a.size());
    print_vector("|a|", a_abs);

    vector<float> f = {3.3796f, 1.8036f, -2.1205f};
    vector<float> f_int(f.size());
    vforce::vint_f32(f_int.data(), f.data(), f.size());
    print_vector("int(f)", f_int);

    vector<float> c = {16, 9, 4, 1};
    vector<float> c_sqrt(c.size());
    vforce::vsqrt_f32(c_sqrt.data(), c.data(), c.size());
    print_vector("sqrt(c)", c_sqrt);

    vector<float> d = {1.0f / 3.0f, 2.0f / 5.0f, 1.0f / 8.0f, -3.0f};
    vector<float> d_rec(d.size());
    vforce::vrec_f32(d_rec.data(), d.data(), d.size());
    print_vector("1 / d", d_rec);

    // ========================================================================
    // vDSP
    // ========================================================================
    print_separator("vDSP: distances along a 2-D path");

    vector<vdsp::Point2f> points;
    for (int i = 0; i <= 8; ++i) {
        points.push_back({0.0f, 10.0f * i});
    }
    vdsp::Path2D path = vdsp::Path2D::from_points(points);

    Eigen::VectorXf from_origin = path.distances_from_origin();
    print_vector("distance from origin", from_origin);
    print_vector("segment lengths", path.segment_lengths());
    cout << "  total path length = " << path.length() << "\n";

    return 0;
}
