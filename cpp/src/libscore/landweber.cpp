#include "libscore/landweber.hpp"

#include "libscore/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>
#include <utility>

namespace libscore {

Landweber::Landweber(Options options) : options_(std::move(options)) {
    validate_regularized_options(options_);
    if (options_.num_iter <= 0) {
        throw ConfigurationError("Landweber num_iter must be positive: " + std::to_string(options_.num_iter));
    }
    if (options_.step_size && (!(*options_.step_size > 0.0) || !std::isfinite(*options_.step_size))) {
        throw ConfigurationError("Landweber step_size must be positive: " + std::to_string(*options_.step_size));
    }
}

KernelScoreModel Landweber::fit(const Eigen::MatrixXd& samples) const {
    return fit(assemble_kernel_system(options_, samples));
}

KernelScoreModel Landweber::fit(const KernelSystem& system) const {
    const double M = static_cast<double>(system.sample_count());
    const double step = options_.step_size ? *options_.step_size : default_step_size(system);
    const int report_every = std::max(1, options_.num_iter / 10);

    Eigen::MatrixXd weights = Eigen::MatrixXd::Zero(system.divergence.rows(), system.divergence.cols());
    double scale = 0.0;
    const double initial_residual = system.divergence.norm();

    for (int t = 0; t < options_.num_iter; ++t) {
        weights -= (step / M) * (system.gram * weights + scale * system.divergence);
        scale -= step;

        if (!weights.allFinite()) {
            emit_warning(options_, "Landweber: iterate became non-finite at step " + std::to_string(t + 1) +
                                       "; reduce step_size");
            break;
        }
        if (options_.verbose && ((t + 1) % report_every == 0)) {
            std::cout << "Landweber Iter " << t + 1 << ": residual="
                      << normal_equation_residual(system, weights, scale) << std::endl;
        }
    }

    const double final_residual = normal_equation_residual(system, weights, scale);
    if (!std::isfinite(final_residual) || final_residual > initial_residual) {
        emit_warning(options_, "Landweber: residual increased from " + std::to_string(initial_residual) + " to " +
                                   std::to_string(final_residual) + "; the iteration is diverging");
    }
    return KernelScoreModel(system.kernel, system.samples, std::move(weights), scale);
}

Eigen::MatrixXd Landweber::estimate_gradients_s_x(const Eigen::MatrixXd& queries, const Eigen::MatrixXd& samples) const {
    validate_point_sets(queries, samples, "Landweber::estimate_gradients_s_x");
    return fit(samples).predict(queries);
}

Eigen::MatrixXd Landweber::estimate_gradients_s(const Eigen::MatrixXd& x) const {
    const KernelSystem system = assemble_kernel_system(options_, x);
    return fit(system).predict_training(system);
}

}  // namespace libscore
