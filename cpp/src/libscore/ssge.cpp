#include "libscore/ssge.hpp"

#include "libscore/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace libscore {

namespace {

constexpr double kNearSingularRatio = 1e-10;

}  // namespace

SSGEModel::SSGEModel(GramMatrix gram,
                     Eigen::MatrixXd samples,
                     LengthScale length_scale,
                     Eigen::VectorXd eigenvalues,
                     Eigen::MatrixXd eigenvectors,
                     Eigen::MatrixXd stein_coefficients)
    : gram_(std::move(gram)),
      samples_(std::move(samples)),
      length_scale_(std::move(length_scale)),
      eigenvalues_(std::move(eigenvalues)),
      eigenvectors_(std::move(eigenvectors)),
      stein_coefficients_(std::move(stein_coefficients)) {
    if (eigenvectors_.rows() != samples_.rows() || eigenvectors_.cols() != eigenvalues_.size()) {
        throw DimensionMismatchError("SSGE eigenvectors do not match samples and eigenvalues");
    }
    if (stein_coefficients_.rows() != eigenvalues_.size() || stein_coefficients_.cols() != samples_.cols()) {
        throw DimensionMismatchError("SSGE Stein coefficients do not match the retained spectrum");
    }
}

Eigen::MatrixXd SSGEModel::eigenfunctions(const Eigen::MatrixXd& queries) const {
    validate_point_sets(queries, samples_, "SSGEModel::eigenfunctions");
    const double sqrt_m = std::sqrt(static_cast<double>(samples_.rows()));
    const Eigen::MatrixXd cross = gram_.gram(queries, samples_, length_scale_);  // n_q x M
    return sqrt_m * (cross * eigenvectors_) * eigenvalues_.cwiseInverse().asDiagonal();
}

Eigen::MatrixXd SSGEModel::training_eigenfunctions() const {
    return std::sqrt(static_cast<double>(samples_.rows())) * eigenvectors_;
}

Eigen::MatrixXd SSGEModel::predict(const Eigen::MatrixXd& queries) const {
    return eigenfunctions(queries) * stein_coefficients_;
}

Eigen::MatrixXd SSGEModel::predict_training() const {
    return training_eigenfunctions() * stein_coefficients_;
}

SSGE::SSGE(Options options)
    : options_(std::move(options)), gram_(options_.kernel_type, options_.add_linear_kernel, options_.power) {
    if (!(options_.eta > 0.0) || !std::isfinite(options_.eta)) {
        throw ConfigurationError("SSGE eta must be positive: " + std::to_string(options_.eta));
    }
    const bool has_count = options_.n_eigen_values.has_value();
    const bool has_threshold = options_.n_eigen_threshold.has_value();
    if (has_count == has_threshold) {
        throw ConfigurationError("SSGE requires exactly one of n_eigen_values and n_eigen_threshold");
    }
    if (has_count && *options_.n_eigen_values <= 0) {
        throw ConfigurationError("SSGE n_eigen_values must be positive: " + std::to_string(*options_.n_eigen_values));
    }
    if (has_threshold && (!(*options_.n_eigen_threshold > 0.0) || *options_.n_eigen_threshold > 1.0)) {
        throw ConfigurationError("SSGE n_eigen_threshold must lie in (0, 1]: " +
                                 std::to_string(*options_.n_eigen_threshold));
    }
}

Eigen::Index SSGE::retained_count(const Eigen::VectorXd& descending_eigenvalues) const {
    const Eigen::Index n = descending_eigenvalues.size();
    if (options_.n_eigen_values) {
        return std::min(*options_.n_eigen_values, n);
    }
    const double total = descending_eigenvalues.sum();
    const double target = *options_.n_eigen_threshold * total;
    double cumulative = 0.0;
    for (Eigen::Index k = 0; k < n; ++k) {
        cumulative += descending_eigenvalues(k);
        if (cumulative >= target) {
            return k + 1;
        }
    }
    return n;
}

SSGEModel SSGE::fit(const Eigen::MatrixXd& samples) const {
    validate_samples(samples, "SSGE::fit");
    if (options_.length_scale) {
        return fit(samples, *options_.length_scale);
    }
    return fit(samples, heuristic_length_scale(options_, samples, samples));
}

SSGEModel SSGE::fit(const Eigen::MatrixXd& samples, const LengthScale& length_scale) const {
    validate_samples(samples, "SSGE::fit");
    const Eigen::Index M = samples.rows();
    const double sqrt_m = std::sqrt(static_cast<double>(M));

    const GramGradients gradients = gram_.grad_gram(samples, samples, length_scale);
    Eigen::MatrixXd K = gradients.value;
    K.diagonal().array() += options_.eta;

    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> eigen_solver(K);
    if (eigen_solver.info() != Eigen::Success) {
        throw std::runtime_error("SSGE: eigendecomposition of the Gram matrix failed");
    }
    // Eigen returns ascending eigenvalues; the truncation works on the leading ones.
    const Eigen::VectorXd all_values = eigen_solver.eigenvalues().reverse();
    const Eigen::MatrixXd all_vectors = eigen_solver.eigenvectors().rowwise().reverse();

    const Eigen::Index count = retained_count(all_values);
    Eigen::VectorXd values = all_values.head(count);
    Eigen::MatrixXd vectors = all_vectors.leftCols(count);

    const double smallest = values(count - 1);
    if (!(smallest > kNearSingularRatio * std::abs(values(0)))) {
        emit_warning(options_, "SSGE: regularized Gram matrix is near singular (retained eigenvalue " +
                                   std::to_string(smallest) + " vs leading " + std::to_string(values(0)) +
                                   "); increase eta");
    }

    // beta_k = -(sqrt(M) / lambda_k) v_k^T zeta, zeta_j = mean_i dk(x_i, x_j)/dx_i
    const Eigen::MatrixXd zeta = GramMatrix::mean_grad_x1(gradients);  // M x d
    Eigen::MatrixXd beta = -sqrt_m * (values.cwiseInverse().asDiagonal() * (vectors.transpose() * zeta));

    if (options_.verbose) {
        std::cout << "SSGE: M=" << M << " length_scale=" << length_scale.values().transpose()
                  << " retained " << count << " of " << M << " eigenvalues" << std::endl;
    }
    return SSGEModel(gram_, samples, length_scale, std::move(values), std::move(vectors), std::move(beta));
}

Eigen::MatrixXd SSGE::estimate_gradients_s_x(const Eigen::MatrixXd& queries, const Eigen::MatrixXd& samples) const {
    validate_point_sets(queries, samples, "SSGE::estimate_gradients_s_x");
    if (options_.length_scale) {
        return fit(samples, *options_.length_scale).predict(queries);
    }
    Eigen::MatrixXd combined(samples.rows() + queries.rows(), samples.cols());
    combined << samples, queries;
    const LengthScale length_scale = heuristic_length_scale(options_, combined, combined);
    return fit(samples, length_scale).predict(queries);
}

Eigen::MatrixXd SSGE::estimate_gradients_s(const Eigen::MatrixXd& x) const {
    return fit(x).predict_training();
}

}  // namespace libscore
