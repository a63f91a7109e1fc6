#include "libscore/nu_method.hpp"

#include "libscore/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <utility>

namespace libscore {

namespace {

struct NuCoefficients {
    double momentum;  // mu_k
    double step;      // omega_k
};

[[nodiscard]] NuCoefficients nu_coefficients(int k, double nu) {
    if (k == 1) {
        return {0.0, (4.0 * nu + 2.0) / (4.0 * nu + 1.0)};
    }
    const double t = static_cast<double>(k);
    const double momentum = (t - 1.0) * (2.0 * t - 3.0) * (2.0 * t + 2.0 * nu - 1.0) /
                            ((t + 2.0 * nu - 1.0) * (2.0 * t + 4.0 * nu - 1.0) * (2.0 * t + 2.0 * nu - 3.0));
    const double step = 4.0 * (2.0 * t + 2.0 * nu - 1.0) * (t + nu - 1.0) /
                        ((t + 2.0 * nu - 1.0) * (2.0 * t + 4.0 * nu - 1.0));
    return {momentum, step};
}

}  // namespace

NuMethod::NuMethod(Options options) : options_(std::move(options)) {
    validate_regularized_options(options_);
    if (!(options_.lam > 0.0) || !std::isfinite(options_.lam)) {
        throw ConfigurationError("nu-method lam must be positive: " + std::to_string(options_.lam));
    }
    if (!(options_.nu > 0.0)) {
        throw ConfigurationError("nu-method nu must be positive: " + std::to_string(options_.nu));
    }
    if (options_.num_iter && *options_.num_iter <= 0) {
        throw ConfigurationError("nu-method num_iter must be positive: " + std::to_string(*options_.num_iter));
    }
    if (!options_.num_iter &&
        1.0 / std::sqrt(options_.lam) >= static_cast<double>(std::numeric_limits<int>::max() - 1)) {
        throw ConfigurationError("nu-method lam is too small to derive an iteration count: " +
                                 std::to_string(options_.lam) + "; set num_iter");
    }
    if (options_.step_size && (!(*options_.step_size > 0.0) || !std::isfinite(*options_.step_size))) {
        throw ConfigurationError("nu-method step_size must be positive: " + std::to_string(*options_.step_size));
    }
}

int NuMethod::iteration_count() const noexcept {
    if (options_.num_iter) {
        return *options_.num_iter;
    }
    return static_cast<int>(1.0 / std::sqrt(options_.lam)) + 1;
}

KernelScoreModel NuMethod::fit(const Eigen::MatrixXd& samples) const {
    return fit(assemble_kernel_system(options_, samples));
}

KernelScoreModel NuMethod::fit(const KernelSystem& system) const {
    const double M = static_cast<double>(system.sample_count());
    const double eta = options_.step_size ? *options_.step_size : default_step_size(system);
    const int iterations = iteration_count();
    const int report_every = std::max(1, iterations / 10);

    // g_0 = 0, and g_1 = -omega_1 eta zeta lives purely in the divergence term.
    Eigen::MatrixXd previous = Eigen::MatrixXd::Zero(system.divergence.rows(), system.divergence.cols());
    Eigen::MatrixXd weights = previous;
    double previous_scale = 0.0;
    double scale = -nu_coefficients(1, options_.nu).step * eta;
    const double initial_residual = system.divergence.norm();

    for (int k = 2; k <= iterations; ++k) {
        const NuCoefficients coef = nu_coefficients(k, options_.nu);
        Eigen::MatrixXd next = (1.0 + coef.momentum) * weights - coef.momentum * previous -
                               (coef.step * eta / M) * (system.gram * weights + scale * system.divergence);
        const double next_scale = (1.0 + coef.momentum) * scale - coef.momentum * previous_scale - coef.step * eta;

        previous = std::move(weights);
        weights = std::move(next);
        previous_scale = scale;
        scale = next_scale;

        if (!weights.allFinite()) {
            emit_warning(options_, "nu-method: iterate became non-finite at step " + std::to_string(k) +
                                       "; reduce step_size");
            break;
        }
        if (options_.verbose && (k % report_every == 0)) {
            std::cout << "nu-method Iter " << k << ": residual="
                      << normal_equation_residual(system, weights, scale) << std::endl;
        }
    }

    const double final_residual = normal_equation_residual(system, weights, scale);
    if (!std::isfinite(final_residual) || final_residual > initial_residual) {
        emit_warning(options_, "nu-method: residual increased from " + std::to_string(initial_residual) + " to " +
                                   std::to_string(final_residual) + "; the iteration is diverging");
    }
    return KernelScoreModel(system.kernel, system.samples, std::move(weights), scale);
}

Eigen::MatrixXd NuMethod::estimate_gradients_s_x(const Eigen::MatrixXd& queries, const Eigen::MatrixXd& samples) const {
    validate_point_sets(queries, samples, "NuMethod::estimate_gradients_s_x");
    return fit(samples).predict(queries);
}

Eigen::MatrixXd NuMethod::estimate_gradients_s(const Eigen::MatrixXd& x) const {
    const KernelSystem system = assemble_kernel_system(options_, x);
    return fit(system).predict_training(system);
}

}  // namespace libscore
