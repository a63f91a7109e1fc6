#include "libscore/kernel_score_model.hpp"

#include "libscore/errors.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace libscore {

KernelSystem assemble_kernel_system(std::shared_ptr<const MatrixKernel> kernel, const Eigen::MatrixXd& samples) {
    validate_samples(samples, "assemble_kernel_system");
    if (!kernel) {
        throw std::invalid_argument("assemble_kernel_system requires a kernel");
    }
    KernelSystem system;
    system.samples = samples;
    system.gram = kernel->kernel_matrix(samples, samples);
    system.divergence = kernel->mean_divergence(samples, samples);
    system.kernel = std::move(kernel);
    return system;
}

KernelSystem assemble_kernel_system(const RegularizedOptions& options, const Eigen::MatrixXd& samples) {
    validate_samples(samples, "assemble_kernel_system");
    LengthScale bandwidth = options.bandwidth ? *options.bandwidth : heuristic_length_scale(options, samples, samples);
    std::shared_ptr<const MatrixKernel> kernel = make_matrix_kernel(
        options.kernel_structure, options.kernel_type, std::move(bandwidth), options.add_linear_kernel, options.power);
    return assemble_kernel_system(std::move(kernel), samples);
}

void validate_regularized_options(const RegularizedOptions& options) {
    if (options.kernel_type == KernelType::InverseMultiquadricPower && !(options.power > 0.0)) {
        throw ConfigurationError("inverse multiquadric power must be positive");
    }
}

KernelScoreModel::KernelScoreModel(std::shared_ptr<const MatrixKernel> kernel,
                                   Eigen::MatrixXd samples,
                                   Eigen::MatrixXd weights,
                                   double divergence_scale)
    : kernel_(std::move(kernel)),
      samples_(std::move(samples)),
      weights_(std::move(weights)),
      divergence_scale_(divergence_scale) {
    if (!kernel_) {
        throw std::invalid_argument("KernelScoreModel requires a kernel");
    }
    const Eigen::Index d = samples_.cols();
    const Eigen::Index b = kernel_->block_size(d);
    if (weights_.rows() != samples_.rows() * b || weights_.cols() * b != d) {
        throw DimensionMismatchError("KernelScoreModel weights do not match the training samples");
    }
}

Eigen::MatrixXd KernelScoreModel::predict(const Eigen::MatrixXd& queries) const {
    validate_point_sets(queries, samples_, "KernelScoreModel::predict");
    Eigen::MatrixXd layout = kernel_->kernel_matrix(queries, samples_) * weights_;
    if (divergence_scale_ != 0.0) {
        layout += divergence_scale_ * kernel_->mean_divergence(samples_, queries);
    }
    return kernel_->unpack(layout, queries.rows(), queries.cols());
}

Eigen::MatrixXd KernelScoreModel::predict_training(const KernelSystem& system) const {
    const Eigen::MatrixXd layout = system.gram * weights_ + divergence_scale_ * system.divergence;
    return kernel_->unpack(layout, samples_.rows(), samples_.cols());
}

double normal_equation_residual(const KernelSystem& system, const Eigen::MatrixXd& weights, double divergence_scale) {
    const Eigen::MatrixXd at_samples = system.gram * weights + divergence_scale * system.divergence;
    const double M = static_cast<double>(system.sample_count());
    return ((system.gram * at_samples) / M + system.divergence).norm();
}

double default_step_size(const KernelSystem& system) {
    const double trace = system.gram.trace();
    if (!(trace > 0.0)) {
        return 1.0;
    }
    return std::min(1.0, static_cast<double>(system.sample_count()) / trace);
}

}  // namespace libscore
