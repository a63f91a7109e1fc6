#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "libscore/errors.hpp"
#include "libscore/tikhonov.hpp"
#include "test_support.hpp"

#include <Eigen/Dense>

#include <string>
#include <vector>

using namespace libscore;
using Catch::Matchers::WithinAbs;

namespace {

struct ShiftedGaussian {
    Eigen::VectorXd mean;
    Eigen::VectorXd stddev;
    Eigen::MatrixXd samples;
    Eigen::MatrixXd queries;

    ShiftedGaussian() : mean(2), stddev(2) {
        mean << 10.0, -5.0;
        stddev << 0.5, 2.0;
        samples = libscore_test::sample_normal(100, mean, stddev, 56756);
        queries = libscore_test::sample_normal(400, mean, stddev, 56757);
    }
};

Tikhonov::Options wide_bandwidth_options() {
    Tikhonov::Options options;
    options.bandwidth = LengthScale(20.0);
    options.lam = 5e-6;
    return options;
}

}  // namespace

TEST_CASE("Tikhonov estimates the score of a shifted anisotropic Gaussian", "[tikhonov]") {
    const ShiftedGaussian data;
    const Tikhonov tikhonov(wide_bandwidth_options());

    SECTION("held-out queries") {
        const Eigen::MatrixXd scores = tikhonov.estimate_gradients_s_x(data.queries, data.samples);
        REQUIRE(scores.rows() == 400);
        const Eigen::MatrixXd truth = libscore_test::normal_score(data.queries, data.mean, data.stddev);
        REQUIRE(libscore_test::mean_cosine_distance(scores, truth) < 0.05);
    }

    SECTION("training samples") {
        const Eigen::MatrixXd scores = tikhonov.estimate_gradients_s(data.samples);
        const Eigen::MatrixXd truth = libscore_test::normal_score(data.samples, data.mean, data.stddev);
        REQUIRE(libscore_test::mean_cosine_distance(scores, truth) < 0.05);
    }

    SECTION("sample with the last three points removed") {
        const Eigen::MatrixXd subset = data.samples.topRows(97);
        const Eigen::MatrixXd scores = tikhonov.estimate_gradients_s(subset);
        REQUIRE(scores.rows() == 97);
        const Eigen::MatrixXd truth = libscore_test::normal_score(subset, data.mean, data.stddev);
        REQUIRE(libscore_test::mean_cosine_distance(scores, truth) < 0.05);
    }
}

TEST_CASE("Tikhonov in-sample estimates equal queries at the samples", "[tikhonov]") {
    const Eigen::MatrixXd samples =
        libscore_test::sample_normal(30, Eigen::VectorXd::Zero(2), Eigen::VectorXd::Ones(2), 8);
    Tikhonov::Options options;
    options.lam = 1e-3;
    const Tikhonov tikhonov(options);

    const Eigen::MatrixXd in_sample = tikhonov.estimate_gradients_s(samples);
    const Eigen::MatrixXd queried = tikhonov.estimate_gradients_s_x(samples, samples);
    REQUIRE(in_sample.isApprox(queried, 1e-8));
}

TEST_CASE("Tikhonov solves the regularized normal equation", "[tikhonov]") {
    const Eigen::MatrixXd samples =
        libscore_test::sample_normal(25, Eigen::VectorXd::Zero(2), Eigen::VectorXd::Ones(2), 13);
    Tikhonov::Options options;
    options.lam = 1e-2;
    options.bandwidth = LengthScale(1.0);
    const Tikhonov tikhonov(options);
    const KernelSystem system = assemble_kernel_system(options, samples);
    const KernelScoreModel model = tikhonov.fit(system);

    // (C + lam) g = -zeta at the samples: (1/M) K g(X) + lam g(X) + zeta(X) = 0.
    const Eigen::MatrixXd g = system.gram * model.weights() + model.divergence_scale() * system.divergence;
    const Eigen::MatrixXd residual = system.gram * g / 25.0 + options.lam * g + system.divergence;
    REQUIRE_THAT(residual.norm(), WithinAbs(0.0, 1e-8 * system.divergence.norm() / options.lam));
}

TEST_CASE("Tikhonov with a curl-free kernel points toward the mode", "[tikhonov]") {
    const Eigen::VectorXd mean = Eigen::VectorXd::Zero(2);
    const Eigen::VectorXd stddev = Eigen::VectorXd::Ones(2);
    const Eigen::MatrixXd samples = libscore_test::sample_normal(100, mean, stddev, 77);
    const Eigen::MatrixXd queries = libscore_test::grid_2d(-2.0, 2.0, 6);

    Tikhonov::Options options;
    options.kernel_type = KernelType::InverseMultiquadric;
    options.kernel_structure = KernelStructure::CurlFree;
    options.lam = 1e-3;
    const Tikhonov tikhonov(options);

    const Eigen::MatrixXd scores = tikhonov.estimate_gradients_s_x(queries, samples);
    REQUIRE(scores.rows() == 36);
    REQUIRE(scores.cols() == 2);
    REQUIRE(scores.allFinite());
    REQUIRE(libscore_test::mean_cosine_distance(scores, libscore_test::normal_score(queries, mean, stddev)) < 0.1);
}

TEST_CASE("Tikhonov falls back to a unit bandwidth for a single sample", "[tikhonov]") {
    Eigen::MatrixXd single(1, 2);
    single << 0.3, -0.7;

    std::vector<std::string> warnings;
    Tikhonov::Options options;
    options.warning_handler = [&warnings](const std::string& message) { warnings.push_back(message); };
    const Tikhonov tikhonov(options);

    const Eigen::MatrixXd scores = tikhonov.estimate_gradients_s(single);
    REQUIRE(scores.rows() == 1);
    REQUIRE(scores.allFinite());
    REQUIRE_FALSE(warnings.empty());
    REQUIRE(warnings.front().find("median heuristic") != std::string::npos);
}

TEST_CASE("Tikhonov rejects invalid configurations", "[tikhonov]") {
    Tikhonov::Options options;
    options.lam = 0.0;
    REQUIRE_THROWS_AS(Tikhonov(options), ConfigurationError);
    options.lam = -1.0;
    REQUIRE_THROWS_AS(Tikhonov(options), ConfigurationError);

    Tikhonov::Options imqp;
    imqp.kernel_type = KernelType::InverseMultiquadricPower;
    imqp.power = -0.5;
    REQUIRE_THROWS_AS(Tikhonov(imqp), ConfigurationError);

    const Tikhonov tikhonov{Tikhonov::Options()};
    REQUIRE(tikhonov.name() == "tikhonov");
    REQUIRE_THROWS_AS(tikhonov.estimate_gradients_s_x(Eigen::MatrixXd::Zero(2, 2), Eigen::MatrixXd::Ones(4, 3)),
                      DimensionMismatchError);
}
