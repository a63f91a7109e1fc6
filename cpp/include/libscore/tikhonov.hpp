#pragma once

#include "libscore/kernel_score_model.hpp"
#include "libscore/score_estimator.hpp"

#include <Eigen/Dense>

#include <string>

namespace libscore {

/**
 * Tikhonov-regularized kernel score estimator.
 *
 * Solves the score-matching normal equation (C + lambda) g = -zeta in closed form.
 * With the representer form g = K(., X) c + a zeta the solution is
 *   c = (1/lambda) (K + M lambda I)^{-1} zeta(X),   a = -1/lambda
 * where K is the sample Gram matrix (the matrix-kernel operator for curl-free
 * kernels) and zeta(X) the per-sample average kernel gradient.
 *
 * The system matrix is factorized by Cholesky; an LDL^T factorization is used when
 * K + M lambda I is not numerically positive definite.
 */
class Tikhonov final : public ScoreEstimator {
public:
    struct Options : RegularizedOptions {
        double lam;  // Ridge weight

        Options() : RegularizedOptions(), lam(1e-3) {}
    };

    explicit Tikhonov(Options options);

    [[nodiscard]] std::string name() const override { return "tikhonov"; }

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
