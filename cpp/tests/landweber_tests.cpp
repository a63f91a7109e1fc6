#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "libscore/errors.hpp"
#include "libscore/landweber.hpp"
#include "test_support.hpp"

#include <Eigen/Dense>

#include <string>
#include <vector>

using namespace libscore;

namespace {

const Eigen::VectorXd& shifted_mean() {
    static const Eigen::VectorXd mean = (Eigen::VectorXd(2) << 10.0, -5.0).finished();
    return mean;
}

const Eigen::VectorXd& shifted_stddev() {
    static const Eigen::VectorXd stddev = (Eigen::VectorXd(2) << 0.5, 2.0).finished();
    return stddev;
}

}  // namespace

TEST_CASE("Landweber produces finite score estimates", "[landweber]") {
    const Eigen::MatrixXd samples = libscore_test::sample_normal(100, shifted_mean(), shifted_stddev(), 56756);
    const Eigen::MatrixXd queries = libscore_test::sample_normal(400, shifted_mean(), shifted_stddev(), 56757);

    Landweber::Options options;
    options.bandwidth = LengthScale(1.0);
    options.num_iter = 1000;
    const Landweber landweber(options);

    SECTION("held-out queries") {
        const Eigen::MatrixXd scores = landweber.estimate_gradients_s_x(queries, samples);
        REQUIRE(scores.rows() == 400);
        REQUIRE(scores.allFinite());
        const double distance = libscore_test::mean_cosine_distance(
            scores, libscore_test::normal_score(queries, shifted_mean(), shifted_stddev()));
        if (distance > 0.05) {
            WARN("Landweber cosine distance " << distance << " exceeds 0.05");
        }
    }

    SECTION("training samples") {
        const Eigen::MatrixXd scores = landweber.estimate_gradients_s(samples);
        REQUIRE(scores.rows() == 100);
        REQUIRE(scores.allFinite());
        const double distance = libscore_test::mean_cosine_distance(
            scores, libscore_test::normal_score(samples, shifted_mean(), shifted_stddev()));
        if (distance > 0.05) {
            WARN("Landweber cosine distance " << distance << " exceeds 0.05");
        }
    }

    SECTION("sample with the last three points removed") {
        const Eigen::MatrixXd subset = samples.topRows(97);
        const Eigen::MatrixXd scores = landweber.estimate_gradients_s(subset);
        REQUIRE(scores.rows() == 97);
        REQUIRE(scores.allFinite());
        const double distance = libscore_test::mean_cosine_distance(
            scores, libscore_test::normal_score(subset, shifted_mean(), shifted_stddev()));
        if (distance > 0.05) {
            WARN("Landweber cosine distance " << distance << " exceeds 0.05");
        }
    }
}

TEST_CASE("Landweber iterations reduce the normal-equation residual", "[landweber]") {
    const Eigen::MatrixXd samples =
        libscore_test::sample_normal(40, Eigen::VectorXd::Zero(2), Eigen::VectorXd::Ones(2), 19);

    Landweber::Options options;
    options.bandwidth = LengthScale(1.0);
    const KernelSystem system = assemble_kernel_system(options, samples);

    options.num_iter = 10;
    const KernelScoreModel early = Landweber(options).fit(system);
    options.num_iter = 200;
    const KernelScoreModel late = Landweber(options).fit(system);

    const double initial = system.divergence.norm();
    const double early_residual = normal_equation_residual(system, early.weights(), early.divergence_scale());
    const double late_residual = normal_equation_residual(system, late.weights(), late.divergence_scale());
    REQUIRE(early_residual < initial);
    REQUIRE(late_residual <= early_residual);

    // a_t = -t * step, with the default step min(1, M / tr K) = 1 for a unit-diagonal Gram matrix.
    REQUIRE(late.divergence_scale() == -200.0);
}

TEST_CASE("Landweber reports a diverging iteration", "[landweber]") {
    const Eigen::MatrixXd samples =
        libscore_test::sample_normal(30, Eigen::VectorXd::Zero(2), Eigen::VectorXd::Ones(2), 23);

    std::vector<std::string> warnings;
    Landweber::Options options;
    options.bandwidth = LengthScale(1.0);
    options.num_iter = 50;
    options.step_size = 1e3;
    options.warning_handler = [&warnings](const std::string& message) { warnings.push_back(message); };
    const Landweber landweber(options);

    const Eigen::MatrixXd scores = landweber.estimate_gradients_s(samples);
    REQUIRE(scores.rows() == 30);
    REQUIRE_FALSE(warnings.empty());
}

TEST_CASE("Landweber rejects invalid configurations", "[landweber]") {
    Landweber::Options options;
    options.num_iter = 0;
    REQUIRE_THROWS_AS(Landweber(options), ConfigurationError);

    Landweber::Options step;
    step.step_size = -0.1;
    REQUIRE_THROWS_AS(Landweber(step), ConfigurationError);

    const Landweber landweber{Landweber::Options()};
    REQUIRE(landweber.name() == "landweber");
}
