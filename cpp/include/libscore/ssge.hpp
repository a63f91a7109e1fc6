#pragma once

#include "libscore/gram_matrix.hpp"
#include "libscore/scalar_kernel.hpp"
#include "libscore/score_estimator.hpp"

#include <Eigen/Dense>

#include <optional>
#include <string>

namespace libscore {

/**
 * Spectral decomposition of a sample Gram matrix, turned into a score estimate.
 *
 * Holds the retained eigenpairs (lambda_k, v_k) of K + eta I, sorted by descending
 * eigenvalue, and the Stein coefficients
 *   beta_k = -(sqrt(M) / lambda_k) sum_j v_jk mean_i dk(x_i, x_j)/dx_i
 * The score at z is sum_k psi_k(z) beta_k, where the Nystrom eigenfunction
 *   psi_k(z) = (sqrt(M) / lambda_k) sum_i v_ik k(z, x_i)
 * is evaluated for new points without another decomposition.
 */
class SSGEModel {
public:
    SSGEModel(GramMatrix gram,
              Eigen::MatrixXd samples,
              LengthScale length_scale,
              Eigen::VectorXd eigenvalues,
              Eigen::MatrixXd eigenvectors,
              Eigen::MatrixXd stein_coefficients);

    // psi_k(z) for every query row, n_q x n_eigen.
    [[nodiscard]] Eigen::MatrixXd eigenfunctions(const Eigen::MatrixXd& queries) const;

    // psi_k at the training points, sqrt(M) V.
    [[nodiscard]] Eigen::MatrixXd training_eigenfunctions() const;

    [[nodiscard]] Eigen::MatrixXd predict(const Eigen::MatrixXd& queries) const;

    [[nodiscard]] Eigen::MatrixXd predict_training() const;

    [[nodiscard]] const Eigen::VectorXd& eigenvalues() const noexcept { return eigenvalues_; }

    [[nodiscard]] const Eigen::MatrixXd& eigenvectors() const noexcept { return eigenvectors_; }

    [[nodiscard]] const Eigen::MatrixXd& stein_coefficients() const noexcept { return stein_coefficients_; }

    [[nodiscard]] const LengthScale& length_scale() const noexcept { return length_scale_; }

    [[nodiscard]] Eigen::Index eigen_count() const noexcept { return eigenvalues_.size(); }

private:
    GramMatrix gram_;
    Eigen::MatrixXd samples_;
    LengthScale length_scale_;
    Eigen::VectorXd eigenvalues_;          // n_eigen, descending
    Eigen::MatrixXd eigenvectors_;         // M x n_eigen
    Eigen::MatrixXd stein_coefficients_;   // n_eigen x d
};

/**
 * Spectral Stein Gradient Estimator.
 *
 * Exactly one truncation policy must be configured: a fixed eigenvalue count, or
 * the smallest prefix of the spectrum whose share of the total eigenvalue mass
 * reaches n_eigen_threshold. eta is a ridge added before the decomposition for
 * conditioning only.
 */
class SSGE final : public ScoreEstimator {
public:
    struct Options : EstimatorOptions {
        KernelType kernel_type;
        bool add_linear_kernel;
        double power;                            // Only used by the IMQ power kernel
        double eta;                              // Ridge added to K before decomposition
        std::optional<Eigen::Index> n_eigen_values;
        std::optional<double> n_eigen_threshold; // In (0, 1]
        std::optional<LengthScale> length_scale; // Median heuristic when unset

        Options()
            : EstimatorOptions(),
              kernel_type(KernelType::SquaredExponential),
              add_linear_kernel(false),
              power(0.5),
              eta(1e-3),
              n_eigen_values(),
              n_eigen_threshold(),
              length_scale() {}
    };

    explicit SSGE(Options options);

    [[nodiscard]] std::string name() const override { return "ssge"; }

    // Length scale from the options, or the median heuristic over `samples`.
    [[nodiscard]] SSGEModel fit(const Eigen::MatrixXd& samples) const;

    [[nodiscard]] SSGEModel fit(const Eigen::MatrixXd& samples, const LengthScale& length_scale) const;

    // Without a fixed length scale, the heuristic is taken over samples and queries together.
    [[nodiscard]] Eigen::MatrixXd estimate_gradients_s_x(const Eigen::MatrixXd& queries,
                                                         const Eigen::MatrixXd& samples) const override;

    [[nodiscard]] Eigen::MatrixXd estimate_gradients_s(const Eigen::MatrixXd& x) const override;

    // Number of leading eigenvalues kept from a descending spectrum.
    [[nodiscard]] Eigen::Index retained_count(const Eigen::VectorXd& descending_eigenvalues) const;

    [[nodiscard]] const Options& options() const noexcept { return options_; }

private:
    const Options options_;
    const GramMatrix gram_;
};

}  // namespace libscore
