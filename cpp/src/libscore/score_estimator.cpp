#include "libscore/score_estimator.hpp"

#include "libscore/errors.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

namespace libscore {

void default_warning_handler(const std::string& message) {
    std::cerr << "Warning: " << message << std::endl;
}

void emit_warning(const EstimatorOptions& options, const std::string& message) {
    if (options.warning_handler) {
        options.warning_handler(message);
    } else {
        default_warning_handler(message);
    }
}

LengthScale heuristic_length_scale(const EstimatorOptions& options,
                                   const Eigen::MatrixXd& x1,
                                   const Eigen::MatrixXd& x2) {
    const double width = median_distance(x1, x2);
    if (!(width > 0.0) || !std::isfinite(width)) {
        emit_warning(options, "median heuristic is degenerate (" + std::to_string(x1.rows()) + " x " +
                                  std::to_string(x2.rows()) + " points); using length scale 1.0");
        return LengthScale(1.0);
    }
    return LengthScale(width);
}

void validate_samples(const Eigen::MatrixXd& samples, const char* context) {
    if (samples.rows() == 0 || samples.cols() == 0) {
        throw std::invalid_argument(std::string(context) + ": point set must be non-empty");
    }
    if (!samples.allFinite()) {
        throw std::invalid_argument(std::string(context) + ": point set contains non-finite values");
    }
}

void validate_point_sets(const Eigen::MatrixXd& queries, const Eigen::MatrixXd& samples, const char* context) {
    if (queries.cols() != samples.cols()) {
        throw DimensionMismatchError(std::string(context) + ": queries have dimension " +
                                     std::to_string(queries.cols()) + " but samples have dimension " +
                                     std::to_string(samples.cols()));
    }
    validate_samples(queries, context);
    validate_samples(samples, context);
}

}  // namespace libscore
