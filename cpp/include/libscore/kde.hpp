#pragma once

#include "libscore/scalar_kernel.hpp"
#include "libscore/score_estimator.hpp"

#include <Eigen/Dense>

#include <optional>
#include <string>

namespace libscore {

/**
 * Kernel density estimate baseline.
 *
 * The density is the Gaussian mixture
 *   p(q) = (1/M) sum_i N(q; x_i, diag(h^2))
 * which is normalized for any bandwidth h. Scores are the exact gradient of its
 * logarithm:
 *   grad log p(q) = sum_i w_i(q) (x_i - q) / h^2,   w = softmax_i(log N(q; x_i, h^2))
 *
 * When no bandwidth is supplied, Scott's rule h_a = sigma_a M^(-1/(d+4)) is used.
 */
class KDE final : public ScoreEstimator {
public:
    struct Options : EstimatorOptions {
        std::optional<LengthScale> bandwidth;  // Scalar or per-dimension; Scott's rule when unset

        Options() : EstimatorOptions(), bandwidth() {}
    };

    KDE();

    explicit KDE(Options options);

    [[nodiscard]] std::string name() const override { return "kde"; }

    // Log of the normalized mixture density at each query point (length n_q).
    [[nodiscard]] Eigen::VectorXd density_estimates_log_prob(const Eigen::MatrixXd& query,
                                                             const Eigen::MatrixXd& samples) const;

    [[nodiscard]] Eigen::MatrixXd estimate_gradients_s_x(const Eigen::MatrixXd& queries,
                                                         const Eigen::MatrixXd& samples) const override;

    // Not defined for the density baseline; throws std::logic_error.
    [[nodiscard]] Eigen::MatrixXd estimate_gradients_s(const Eigen::MatrixXd& x) const override;

    // Bandwidth used for the given samples, one entry per feature.
    [[nodiscard]] Eigen::VectorXd bandwidth_for(const Eigen::MatrixXd& samples) const;

    [[nodiscard]] const Options& options() const noexcept { return options_; }

private:
    // Component log-weights log N(q_k; x_i, diag(h^2)) - log M, shape n_q x M.
    [[nodiscard]] Eigen::MatrixXd component_log_weights(const Eigen::MatrixXd& queries,
                                                        const Eigen::MatrixXd& samples,
                                                        const Eigen::VectorXd& bandwidth) const;

    const Options options_;
};

}  // namespace libscore
