#pragma once

#include "libscore/scalar_kernel.hpp"
#include "libscore/score_estimator.hpp"

#include <Eigen/Dense>

#include <memory>
#include <optional>
#include <string>

namespace libscore {

// Flat configuration covering every estimator; fields a method does not use are ignored.
struct EstimatorConfig {
    std::string kernel_type{"se"};
    std::string kernel_structure{"diagonal"};
    bool add_linear_kernel{false};
    double power{0.5};
    std::optional<Eigen::VectorXd> bandwidth;   // Bandwidth / length scale, size 1 or d

    // SSGE
    double eta{1e-3};
    std::optional<Eigen::Index> n_eigen_values;
    std::optional<double> n_eigen_threshold;

    // Tikhonov / nu-method
    std::optional<double> lam;
    double nu{1.0};

    // Landweber / nu-method
    std::optional<int> num_iter;
    std::optional<double> step_size;

    bool verbose{false};
    WarningHandler warning_handler{default_warning_handler};
};

class ScoreEstimatorFactory {
public:
    // method: "kde", "ssge", "tikhonov", "landweber" or "nu_method".
    static std::unique_ptr<ScoreEstimator> create(const std::string& method, const EstimatorConfig& config = {});
};

}  // namespace libscore
