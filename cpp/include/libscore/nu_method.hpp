#pragma once

#include "libscore/kernel_score_model.hpp"
#include "libscore/score_estimator.hpp"

#include <Eigen/Dense>

#include <optional>
#include <string>

namespace libscore {

/**
 * nu-method (Chebyshev-accelerated semi-iterative regularization) for the
 * score-matching normal equation C g = -zeta.
 *
 *   g_k = g_{k-1} + mu_k (g_{k-1} - g_{k-2}) - omega_k eta (C g_{k-1} + zeta)
 *
 *   mu_1 = 0,  omega_1 = (4 nu + 2) / (4 nu + 1)
 *   mu_k    = (k-1)(2k-3)(2k+2nu-1) / ((k+2nu-1)(2k+4nu-1)(2k+2nu-3))
 *   omega_k = 4 (2k+2nu-1)(k+nu-1) / ((k+2nu-1)(2k+4nu-1))
 *
 * k iterations regularize like Tikhonov with lambda ~ 1/k^2, so the default
 * budget is floor(1/sqrt(lam)) + 1 steps, far fewer than Landweber needs.
 */
class NuMethod final : public ScoreEstimator {
public:
    struct Options : RegularizedOptions {
        double lam;                      // Effective regularization; sets the stopping depth
        double nu;                       // Qualification of the method
        std::optional<int> num_iter;     // Overrides the lam-derived iteration count
        std::optional<double> step_size; // Defaults to min(1, M / tr K)

        Options() : RegularizedOptions(), lam(1e-3), nu(1.0), num_iter(), step_size() {}
    };

    explicit NuMethod(Options options);

    [[nodiscard]] std::string name() const override { return "nu_method"; }

    [[nodiscard]] int iteration_count() const noexcept;

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
