#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "libscore/errors.hpp"
#include "libscore/matrix_kernel.hpp"
#include "test_support.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <memory>

using namespace libscore;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

// d^2 k / dx_a dy_b by central differences of the scalar kernel (plus x . y when linear).
Eigen::MatrixXd numeric_hessian_xy(const ScalarKernel& k,
                                   const Eigen::RowVectorXd& x,
                                   const Eigen::RowVectorXd& y,
                                   const LengthScale& ls,
                                   bool linear) {
    const double h = 1e-4;
    const Eigen::Index d = x.size();
    auto f = [&](const Eigen::RowVectorXd& a, const Eigen::RowVectorXd& b) {
        return k.value(a, b, ls) + (linear ? a.dot(b) : 0.0);
    };
    Eigen::MatrixXd out(d, d);
    for (Eigen::Index a = 0; a < d; ++a) {
        for (Eigen::Index b = 0; b < d; ++b) {
            Eigen::RowVectorXd xp = x, xm = x, yp = y, ym = y;
            xp(a) += h;
            xm(a) -= h;
            yp(b) += h;
            ym(b) -= h;
            out(a, b) = (f(xp, yp) - f(xp, ym) - f(xm, yp) + f(xm, ym)) / (4.0 * h * h);
        }
    }
    return out;
}

}  // namespace

TEST_CASE("Diagonal kernels are the scalar kernel times the identity", "[matrix_kernel]") {
    Eigen::RowVectorXd x(3);
    x << 0.2, -0.5, 1.0;
    Eigen::RowVectorXd y(3);
    y << -0.3, 0.4, 0.6;

    const DiagonalIMQKernel kernel(LengthScale(1.5));
    const Eigen::MatrixXd K = kernel.value(x, y);
    const double k = ScalarKernel(KernelType::InverseMultiquadric).value(x, y, LengthScale(1.5));
    REQUIRE(K.isApprox(k * Eigen::MatrixXd::Identity(3, 3)));
    REQUIRE(kernel.block_size(3) == 1);
    REQUIRE(kernel.name() == "diagonal_imq");

    const DiagonalGaussianKernel linear(LengthScale(1.5), true);
    REQUIRE_THAT(linear.value(x, y)(1, 1),
                 WithinRel(ScalarKernel(KernelType::SquaredExponential).value(x, y, LengthScale(1.5)) + x.dot(y),
                           1e-12));
    REQUIRE_THAT(linear.value(x, y)(0, 1), WithinAbs(0.0, 1e-15));
}

TEST_CASE("Curl-free kernel is the mixed Hessian of the scalar kernel", "[matrix_kernel]") {
    Eigen::RowVectorXd x(3);
    x << 0.2, -0.5, 1.0;
    Eigen::RowVectorXd y(3);
    y << -0.3, 0.4, 0.6;
    Eigen::VectorXd scales(3);
    scales << 0.9, 1.4, 2.0;

    for (KernelType type : {KernelType::SquaredExponential, KernelType::InverseMultiquadric,
                            KernelType::InverseMultiquadricPower}) {
        for (bool linear : {false, true}) {
            const ScalarKernel scalar(type, 1.3);
            const SquareCurlFreeKernel kernel(scalar, LengthScale(scales), linear);
            const Eigen::MatrixXd K = kernel.value(x, y);
            const Eigen::MatrixXd numeric = numeric_hessian_xy(scalar, x, y, LengthScale(scales), linear);
            for (Eigen::Index a = 0; a < 3; ++a) {
                for (Eigen::Index b = 0; b < 3; ++b) {
                    REQUIRE_THAT(K(a, b), WithinAbs(numeric(a, b), 1e-6));
                }
            }
        }
    }
}

TEST_CASE("Curl-free divergence matches finite differences", "[matrix_kernel]") {
    Eigen::RowVectorXd x(2);
    x << 0.7, -0.1;
    Eigen::RowVectorXd y(2);
    y << -0.2, 0.5;

    for (KernelType type : {KernelType::SquaredExponential, KernelType::InverseMultiquadric,
                            KernelType::InverseMultiquadricPower}) {
        const SquareCurlFreeKernel kernel(ScalarKernel(type, 0.8), LengthScale(1.1), true);
        const Eigen::RowVectorXd div = kernel.divergence(x, y);
        const double h = 1e-6;
        Eigen::RowVectorXd numeric = Eigen::RowVectorXd::Zero(2);
        for (Eigen::Index a = 0; a < 2; ++a) {
            Eigen::RowVectorXd xp = x, xm = x;
            xp(a) += h;
            xm(a) -= h;
            numeric += ((kernel.value(xp, y) - kernel.value(xm, y)) / (2.0 * h)).row(a);
        }
        REQUIRE_THAT(div(0), WithinAbs(numeric(0), 1e-6));
        REQUIRE_THAT(div(1), WithinAbs(numeric(1), 1e-6));
    }
}

TEST_CASE("Kernel matrices over one point set are symmetric positive semidefinite", "[matrix_kernel]") {
    const Eigen::MatrixXd x =
        libscore_test::sample_normal(8, Eigen::VectorXd::Zero(2), Eigen::VectorXd::Ones(2), 21);

    for (KernelStructure structure : {KernelStructure::Diagonal, KernelStructure::CurlFree}) {
        const auto kernel = make_matrix_kernel(structure, KernelType::InverseMultiquadric, LengthScale(1.0), false);
        const Eigen::MatrixXd K = kernel->kernel_matrix(x, x);
        const Eigen::Index b = kernel->block_size(2);
        REQUIRE(K.rows() == 8 * b);
        REQUIRE((K - K.transpose()).cwiseAbs().maxCoeff() < 1e-12);
        Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(K);
        REQUIRE(solver.eigenvalues().minCoeff() > -1e-10);
    }

    const SquareCurlFreeKernel curl(ScalarKernel(KernelType::SquaredExponential), LengthScale(2.0));
    const Eigen::MatrixXd at_same = curl.value(x.row(0), x.row(0));
    // -2 phi'(0) / l^2 = 1 / 4 on the diagonal, zero elsewhere.
    REQUIRE(at_same.isApprox(0.25 * Eigen::MatrixXd::Identity(2, 2)));
}

TEST_CASE("Mean divergence averages the per-sample divergence", "[matrix_kernel]") {
    const Eigen::MatrixXd samples =
        libscore_test::sample_normal(5, Eigen::VectorXd::Zero(2), Eigen::VectorXd::Ones(2), 5);
    const Eigen::MatrixXd y =
        libscore_test::sample_normal(3, Eigen::VectorXd::Zero(2), Eigen::VectorXd::Ones(2), 6);

    const CurlFreeIMQKernel curl(LengthScale(1.2));
    const Eigen::MatrixXd layout = curl.mean_divergence(samples, y);
    REQUIRE(layout.rows() == 6);
    REQUIRE(layout.cols() == 1);

    Eigen::RowVectorXd expected = Eigen::RowVectorXd::Zero(2);
    for (Eigen::Index i = 0; i < 5; ++i) {
        expected += curl.divergence(samples.row(i), y.row(1));
    }
    expected /= 5.0;
    const Eigen::MatrixXd unpacked = curl.unpack(layout, 3, 2);
    REQUIRE(unpacked.rows() == 3);
    REQUIRE(unpacked.row(1).isApprox(expected));

    const DiagonalIMQKernel diag(LengthScale(1.2));
    const Eigen::MatrixXd diag_layout = diag.mean_divergence(samples, y);
    REQUIRE(diag_layout.rows() == 3);
    REQUIRE(diag_layout.cols() == 2);
    REQUIRE(diag.unpack(diag_layout, 3, 2).isApprox(diag_layout));

    REQUIRE_THROWS_AS(curl.unpack(layout, 2, 2), DimensionMismatchError);
}

TEST_CASE("Matrix kernel structures parse by name", "[matrix_kernel]") {
    REQUIRE(parse_kernel_structure("diagonal") == KernelStructure::Diagonal);
    REQUIRE(parse_kernel_structure("curl_free") == KernelStructure::CurlFree);
    REQUIRE_THROWS_AS(parse_kernel_structure("divergence_free"), ConfigurationError);
}
