#include "libscore/kde.hpp"

#include <cmath>
#include <iostream>
#include <numbers>
#include <stdexcept>
#include <utility>

namespace libscore {

namespace {

// log sum_i exp(row_i) for every row, stable against underflow.
[[nodiscard]] Eigen::VectorXd row_log_sum_exp(const Eigen::MatrixXd& values) {
    const Eigen::VectorXd max = values.rowwise().maxCoeff();
    Eigen::VectorXd out(values.rows());
    for (Eigen::Index k = 0; k < values.rows(); ++k) {
        out(k) = max(k) + std::log((values.row(k).array() - max(k)).exp().sum());
    }
    return out;
}

}  // namespace

KDE::KDE() : KDE(Options()) {}

KDE::KDE(Options options) : options_(std::move(options)) {}

Eigen::VectorXd KDE::bandwidth_for(const Eigen::MatrixXd& samples) const {
    validate_samples(samples, "KDE bandwidth");
    const Eigen::Index d = samples.cols();
    if (options_.bandwidth) {
        return options_.bandwidth->broadcast(d);
    }
    const Eigen::Index M = samples.rows();
    if (M < 2) {
        throw std::invalid_argument("KDE needs at least two samples to derive a bandwidth");
    }
    const Eigen::RowVectorXd mean = samples.colwise().mean();
    const Eigen::VectorXd sigma =
        ((samples.rowwise() - mean).array().square().colwise().sum() / static_cast<double>(M - 1)).sqrt().matrix().transpose();
    const double factor = std::pow(static_cast<double>(M), -1.0 / (static_cast<double>(d) + 4.0));
    for (Eigen::Index a = 0; a < d; ++a) {
        if (!(sigma(a) > 0.0)) {
            throw std::invalid_argument("KDE cannot derive a bandwidth: samples have zero spread in dimension " +
                                        std::to_string(a));
        }
    }
    const Eigen::VectorXd bandwidth = factor * sigma;
    if (options_.verbose) {
        std::cout << "KDE: Scott bandwidth = " << bandwidth.transpose() << std::endl;
    }
    return bandwidth;
}

Eigen::MatrixXd KDE::component_log_weights(const Eigen::MatrixXd& queries,
                                           const Eigen::MatrixXd& samples,
                                           const Eigen::VectorXd& bandwidth) const {
    const Eigen::Index d = samples.cols();
    const Eigen::Index M = samples.rows();
    const Eigen::VectorXd inv_sq = bandwidth.array().square().inverse().matrix();
    // -d/2 log(2 pi) - sum_a log h_a - log M
    const double log_norm = -0.5 * static_cast<double>(d) * std::log(2.0 * std::numbers::pi) -
                            bandwidth.array().log().sum() - std::log(static_cast<double>(M));

    Eigen::MatrixXd log_w(queries.rows(), M);
    for (Eigen::Index k = 0; k < queries.rows(); ++k) {
        for (Eigen::Index i = 0; i < M; ++i) {
            log_w(k, i) = log_norm - 0.5 * scaled_squared_distance(queries.row(k), samples.row(i), inv_sq);
        }
    }
    return log_w;
}

Eigen::VectorXd KDE::density_estimates_log_prob(const Eigen::MatrixXd& query, const Eigen::MatrixXd& samples) const {
    validate_point_sets(query, samples, "KDE::density_estimates_log_prob");
    return row_log_sum_exp(component_log_weights(query, samples, bandwidth_for(samples)));
}

Eigen::MatrixXd KDE::estimate_gradients_s_x(const Eigen::MatrixXd& queries, const Eigen::MatrixXd& samples) const {
    validate_point_sets(queries, samples, "KDE::estimate_gradients_s_x");
    const Eigen::VectorXd bandwidth = bandwidth_for(samples);
    const Eigen::MatrixXd log_w = component_log_weights(queries, samples, bandwidth);
    const Eigen::VectorXd log_p = row_log_sum_exp(log_w);
    const Eigen::RowVectorXd inv_sq = bandwidth.array().square().inverse().matrix().transpose();

    Eigen::MatrixXd scores(queries.rows(), queries.cols());
    for (Eigen::Index k = 0; k < queries.rows(); ++k) {
        // Posterior responsibilities of each mixture component at q_k.
        const Eigen::RowVectorXd w = (log_w.row(k).array() - log_p(k)).exp().matrix();
        const Eigen::RowVectorXd mean = w * samples;  // sum_i w_i x_i, sum_i w_i = 1
        scores.row(k) = (mean - queries.row(k)).cwiseProduct(inv_sq);
    }
    return scores;
}

Eigen::MatrixXd KDE::estimate_gradients_s(const Eigen::MatrixXd& /*x*/) const {
    throw std::logic_error("KDE does not define an in-sample score estimate; use estimate_gradients_s_x");
}

}  // namespace libscore
