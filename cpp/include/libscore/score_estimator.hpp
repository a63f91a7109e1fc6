#pragma once

#include "libscore/scalar_kernel.hpp"

#include <Eigen/Dense>

#include <functional>
#include <string>

namespace libscore {

// Receives non-fatal numerical-instability notices.
using WarningHandler = std::function<void(const std::string&)>;

// Writes "Warning: <message>" to std::cerr.
void default_warning_handler(const std::string& message);

struct EstimatorOptions {
    bool verbose;                    // Print solve diagnostics to std::cout
    WarningHandler warning_handler;  // Numerical-instability notices

    EstimatorOptions() : verbose(false), warning_handler(default_warning_handler) {}
};

// Shared contract of every score estimator: given i.i.d. samples of p, estimate
// grad_x log p(x). Estimators are immutable after construction; every call is a
// pure function of its arguments and the configuration.
class ScoreEstimator {
public:
    virtual ~ScoreEstimator() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    // Scores at arbitrary query points (n_q x d) from samples (n_s x d).
    [[nodiscard]] virtual Eigen::MatrixXd estimate_gradients_s_x(const Eigen::MatrixXd& queries,
                                                                 const Eigen::MatrixXd& samples) const = 0;

    // In-sample scores at the training points themselves (not leave-one-out).
    [[nodiscard]] virtual Eigen::MatrixXd estimate_gradients_s(const Eigen::MatrixXd& x) const = 0;
};

// Forwards to the configured handler, falling back to std::cerr when none is set.
void emit_warning(const EstimatorOptions& options, const std::string& message);

// Non-empty sample set with at least one feature.
// Median-heuristic length scale over x1 and x2. Degenerate sets (a single point, or
// mostly coincident points) fall back to a unit length scale with a warning.
[[nodiscard]] LengthScale heuristic_length_scale(const EstimatorOptions& options,
                                                 const Eigen::MatrixXd& x1,
                                                 const Eigen::MatrixXd& x2);

void validate_samples(const Eigen::MatrixXd& samples, const char* context);

// validate_samples on both sets plus matching feature dimension.
void validate_point_sets(const Eigen::MatrixXd& queries, const Eigen::MatrixXd& samples, const char* context);

}  // namespace libscore
