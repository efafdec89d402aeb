#include <gtest/gtest.h>
#include <accelmath/blas.hpp>
#include <Eigen/Dense>
#include <stdexcept>
#include <string>
#include <vector>

using namespace accelmath::blas;

// Helper to check approximate equality
static void expect_approx_equal(const Eigen::VectorXf& a, const Eigen::VectorXf& b, float tol = 1e-4f) {
    ASSERT_EQ(a.size(), b.size());
    for (int i = 0; i < a.size(); ++i) {
        EXPECT_NEAR(a[i], b[i], tol) << "at index " << i;
    }
}

TEST(BlasTest, SaxpyScalesAndAccumulates) {
    std::vector<float> x = {1, 2, 3};
    std::vector<float> y = {3, 4, 5};

    axpy_f32(3, 10.0f, x.data(), 1, y.data(), 1);

    EXPECT_FLOAT_EQ(y[0], 13.0f);
    EXPECT_FLOAT_EQ(y[1], 24.0f);
    EXPECT_FLOAT_EQ(y[2], 35.0f);
    // x is read-only
    EXPECT_FLOAT_EQ(x[0], 1.0f);
}

TEST(BlasTest, SdotOfSmallVectors) {
    std::vector<float> x = {1, 2, 3};
    std::vector<float> y = {3, 4, 5};
    EXPECT_FLOAT_EQ(dot_f32(3, x.data(), 1, y.data(), 1), 26.0f);
}

TEST(BlasTest, StridedAxpyTouchesOnlyStridedElements) {
    // x uses every other element, y every third
    std::vector<float> x = {1, -1, 2, -1, 3};
    std::vector<float> y = {1, 7, 7, 1, 7, 7, 1};

    axpy_f32(3, 2.0f, x.data(), 2, y.data(), 3);

    EXPECT_FLOAT_EQ(y[0], 3.0f);
    EXPECT_FLOAT_EQ(y[3], 5.0f);
    EXPECT_FLOAT_EQ(y[6], 7.0f);
    EXPECT_FLOAT_EQ(y[1], 7.0f);
    EXPECT_FLOAT_EQ(y[5], 7.0f);
}

TEST(BlasTest, ZeroLengthIsNoOp) {
    float x = 5.0f;
    float y = 7.0f;
    axpy_f32(0, 3.0f, &x, 1, &y, 1);
    EXPECT_FLOAT_EQ(y, 7.0f);
    EXPECT_FLOAT_EQ(dot_f32(0, &x, 1, &y, 1), 0.0f);
    EXPECT_FLOAT_EQ(nrm2_f32(0, &x, 1), 0.0f);
    EXPECT_EQ(iamax_f32(0, &x, 1), 0u);
}

TEST(BlasTest, DoublePrecision) {
    std::vector<double> x = {1, 2, 3};
    std::vector<double> y = {3, 4, 5};
    EXPECT_DOUBLE_EQ(dot_f64(3, x.data(), 1, y.data(), 1), 26.0);

    axpy_f64(3, 0.5, x.data(), 1, y.data(), 1);
    EXPECT_DOUBLE_EQ(y[0], 3.5);
    EXPECT_DOUBLE_EQ(y[2], 6.5);
}

TEST(BlasTest, NormsAndIndexOfMax) {
    std::vector<float> v = {3, -4, 0, 1};
    EXPECT_NEAR(nrm2_f32(2, v.data(), 1), 5.0f, 1e-6f);
    EXPECT_FLOAT_EQ(asum_f32(4, v.data(), 1), 8.0f);
    EXPECT_EQ(iamax_f32(4, v.data(), 1), 1u);

    scal_f32(4, -2.0f, v.data(), 1);
    EXPECT_FLOAT_EQ(v[0], -6.0f);
    EXPECT_FLOAT_EQ(v[1], 8.0f);
}

TEST(BlasTest, SwapRowsOfColumnMajorMatrix) {
    // 2 x 3 column-major: [1 2 3; 4 5 6]
    std::vector<float> A = {1, 4, 2, 5, 3, 6};
    swap_f32(3, A.data(), 2, A.data() + 1, 2);
    std::vector<float> expected = {4, 1, 5, 2, 6, 3};
    EXPECT_EQ(A, expected);
}

TEST(BlasTest, RankOneUpdate) {
    Eigen::MatrixXf A = Eigen::MatrixXf::Random(5, 4);
    Eigen::VectorXf x = Eigen::VectorXf::Random(5);
    Eigen::VectorXf y = Eigen::VectorXf::Random(4);

    Eigen::MatrixXf expected = A + 1.5f * x * y.transpose();
    ger_f32(5, 4, 1.5f, x.data(), 1, y.data(), 1, A.data(), static_cast<std::size_t>(A.outerStride()));

    for (int i = 0; i < A.size(); ++i) {
        EXPECT_NEAR(A(i), expected(i), 1e-5f) << "at index " << i;
    }
}

TEST(BlasTest, EigenWrappersMatchEigen) {
    int N = 1000;
    Eigen::VectorXf a = Eigen::VectorXf::Random(N);
    Eigen::VectorXf b = Eigen::VectorXf::Random(N);
    Eigen::VectorXf b_before = b;

    expect_approx_equal(axpy(2.5f, a, b), 2.5f * a + b);
    // axpy wrapper leaves its accumulator untouched
    expect_approx_equal(b, b_before, 0.0f);

    EXPECT_NEAR(dot(a, b), a.dot(b), 1e-2f);
    EXPECT_NEAR(nrm2(a), a.norm(), 1e-3f);
    EXPECT_NEAR(asum(a), a.cwiseAbs().sum(), 1e-2f);

    Eigen::VectorXd ad = a.cast<double>();
    Eigen::VectorXd bd = b.cast<double>();
    EXPECT_NEAR(dot(ad, bd), ad.dot(bd), 1e-9);
}

TEST(BlasTest, SizeMismatchThrows) {
    Eigen::VectorXf a(3);
    Eigen::VectorXf b(4);
    a.setOnes();
    b.setOnes();
    EXPECT_THROW(dot(a, b), std::invalid_argument);
    EXPECT_THROW(axpy(1.0f, a, b), std::invalid_argument);
}

TEST(BlasTest, VendorIsReported) {
    EXPECT_NE(std::string(vendor()), "");
}
