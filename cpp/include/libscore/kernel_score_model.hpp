#pragma once

#include "libscore/matrix_kernel.hpp"
#include "libscore/scalar_kernel.hpp"
#include "libscore/score_estimator.hpp"

#include <Eigen/Dense>

#include <memory>
#include <optional>

namespace libscore {

// Options shared by the regularized normal-equation estimators (Tikhonov,
// Landweber, nu-method).
struct RegularizedOptions : EstimatorOptions {
    KernelType kernel_type;
    bool add_linear_kernel;
    double power;                          // Only used by the IMQ power kernel
    KernelStructure kernel_structure;      // Diagonal reduces to the scalar Gram system
    std::optional<LengthScale> bandwidth;  // Median heuristic over the samples when unset

    RegularizedOptions()
        : EstimatorOptions(),
          kernel_type(KernelType::SquaredExponential),
          add_linear_kernel(false),
          power(0.5),
          kernel_structure(KernelStructure::Diagonal),
          bandwidth() {}
};

// Sample-side quantities of the score-matching normal equation
//   (C + lambda) g = -zeta,   C = (1/M) sum_i K_{x_i} K_{x_i}^*
// in the matrix kernel's coefficient layout.
struct KernelSystem {
    std::shared_ptr<const MatrixKernel> kernel;
    Eigen::MatrixXd samples;     // M x d
    Eigen::MatrixXd gram;        // (M b) x (M b)
    Eigen::MatrixXd divergence;  // (M b) x (d / b), zeta evaluated at the samples

    [[nodiscard]] Eigen::Index sample_count() const noexcept { return samples.rows(); }
};

[[nodiscard]] KernelSystem assemble_kernel_system(std::shared_ptr<const MatrixKernel> kernel,
                                                  const Eigen::MatrixXd& samples);

// Builds the matrix kernel for `samples` from the options (resolving the bandwidth)
// and assembles its system.
[[nodiscard]] KernelSystem assemble_kernel_system(const RegularizedOptions& options, const Eigen::MatrixXd& samples);

void validate_regularized_options(const RegularizedOptions& options);

// Every regularized iterate has the representer form
//   g(q) = K(q, X) C + a zeta(q)
// so a fitted estimator is the pair (C, a) together with its training system.
class KernelScoreModel {
public:
    KernelScoreModel(std::shared_ptr<const MatrixKernel> kernel,
                     Eigen::MatrixXd samples,
                     Eigen::MatrixXd weights,
                     double divergence_scale);

    // Scores at arbitrary query points (n_q x d).
    [[nodiscard]] Eigen::MatrixXd predict(const Eigen::MatrixXd& queries) const;

    // Scores at the training samples, reusing the training system.
    [[nodiscard]] Eigen::MatrixXd predict_training(const KernelSystem& system) const;

    [[nodiscard]] const Eigen::MatrixXd& weights() const noexcept { return weights_; }

    [[nodiscard]] double divergence_scale() const noexcept { return divergence_scale_; }

    [[nodiscard]] const Eigen::MatrixXd& samples() const noexcept { return samples_; }

    [[nodiscard]] const MatrixKernel& kernel() const noexcept { return *kernel_; }

private:
    std::shared_ptr<const MatrixKernel> kernel_;
    Eigen::MatrixXd samples_;
    Eigen::MatrixXd weights_;
    double divergence_scale_;
};

// Residual of the normal equation at the samples, || (1/M) K g(X) + zeta(X) ||_F,
// with g(X) = K C + a zeta(X).
[[nodiscard]] double normal_equation_residual(const KernelSystem& system,
                                              const Eigen::MatrixXd& weights,
                                              double divergence_scale);

// Largest step eta with eta * ||C|| <= 1 guaranteed, from ||C|| <= tr(K) / M.
[[nodiscard]] double default_step_size(const KernelSystem& system);

}  // namespace libscore
