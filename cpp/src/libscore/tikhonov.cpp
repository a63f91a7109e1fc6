#include "libscore/tikhonov.hpp"

#include "libscore/errors.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <utility>

namespace libscore {

Tikhonov::Tikhonov(Options options) : options_(std::move(options)) {
    validate_regularized_options(options_);
    if (!(options_.lam > 0.0) || !std::isfinite(options_.lam)) {
        throw ConfigurationError("Tikhonov lam must be positive: " + std::to_string(options_.lam));
    }
}

KernelScoreModel Tikhonov::fit(const Eigen::MatrixXd& samples) const {
    return fit(assemble_kernel_system(options_, samples));
}

KernelScoreModel Tikhonov::fit(const KernelSystem& system) const {
    const double lam = options_.lam;
    const double M = static_cast<double>(system.sample_count());

    Eigen::MatrixXd A = system.gram;
    A.diagonal().array() += M * lam;

    Eigen::MatrixXd weights;
    Eigen::LLT<Eigen::MatrixXd> llt(A);
    if (llt.info() == Eigen::Success) {
        weights = llt.solve(system.divergence);
    } else {
        emit_warning(options_, "Tikhonov: regularized Gram matrix is not numerically positive definite; "
                               "falling back to LDLT");
        weights = A.ldlt().solve(system.divergence);
    }
    weights /= lam;

    if (!weights.allFinite()) {
        emit_warning(options_, "Tikhonov: solution contains non-finite coefficients");
    }
    if (options_.verbose) {
        std::cout << "Tikhonov: M=" << system.sample_count() << " lam=" << lam
                  << " residual=" << normal_equation_residual(system, weights, -1.0 / lam) << std::endl;
    }
    return KernelScoreModel(system.kernel, system.samples, std::move(weights), -1.0 / lam);
}

Eigen::MatrixXd Tikhonov::estimate_gradients_s_x(const Eigen::MatrixXd& queries, const Eigen::MatrixXd& samples) const {
    validate_point_sets(queries, samples, "Tikhonov::estimate_gradients_s_x");
    return fit(samples).predict(queries);
}

Eigen::MatrixXd Tikhonov::estimate_gradients_s(const Eigen::MatrixXd& x) const {
    const KernelSystem system = assemble_kernel_system(options_, x);
    return fit(system).predict_training(system);
}

}  // namespace libscore
