#pragma once

#include "libscore/kernel_score_model.hpp"
#include "libscore/score_estimator.hpp"

#include <Eigen/Dense>

#include <optional>
#include <string>

namespace libscore {

/**
 * Landweber iteration for the score-matching normal equation C g = -zeta.
 *
 *   g_0 = 0,   g_{t+1} = g_t - eta (C g_t + zeta)
 *
 * In representer coordinates g_t = K(., X) c_t + a_t zeta:
 *   c_{t+1} = c_t - (eta / M) (K c_t + a_t zeta(X)),   a_{t+1} = a_t - eta
 *
 * There is no explicit penalty; regularization comes from stopping after
 * num_iter steps (roughly lambda ~ 1 / (eta num_iter)). Convergence is slow and
 * the estimate is usually less accurate than Tikhonov or the nu-method at
 * matched settings.
 */
class Landweber final : public ScoreEstimator {
public:
    struct Options : RegularizedOptions {
        int num_iter;                      // Fixed iteration budget
        std::optional<double> step_size;   // Defaults to min(1, M / tr K)

        Options() : RegularizedOptions(), num_iter(100), step_size() {}
    };

    explicit Landweber(Options options);

    [[nodiscard]] std::string name() const override { return "landweber"; }

    [[nodiscard]] KernelScoreModel fit(const Eigen::MatrixXd& samples) const;

    [[nodiscard]] KernelScoreModel fit(const KernelSystem& system) const;

    [[nodiscard]] Eigen::MatrixXd estimate_gradients_s_x(const Eigen::MatrixXd& queries,
                                                         const Eigen::MatrixXd& samples) const override;

    [[nodiscard]] Eigen::MatrixXd estimate_gradients_s(const Eigen::MatrixXd& x) const override;

    [[nodiscard]] const Options& options() const noexcept { return options_; }

private:
    const Options options_;
};

}  // namespace libscore
