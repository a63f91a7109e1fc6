#include "libscore/scalar_kernel.hpp"

#include "libscore/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace libscore {

namespace {

[[nodiscard]] std::string normalize_kernel_id(const std::string& name) {
    std::string normalized;
    normalized.reserve(name.size());
    for (char c : name) {
        if (c == '-' || c == ' ') {
            normalized.push_back('_');
        } else {
            normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return normalized;
}

[[nodiscard]] KernelProfile inverse_power_profile(double s, double p) {
    const double base = 1.0 + s;
    KernelProfile out;
    out.value = std::pow(base, -p);
    out.first = -p * out.value / base;
    out.second = -(p + 1.0) * out.first / base;
    out.third = -(p + 2.0) * out.second / base;
    return out;
}

}  // namespace

KernelType parse_kernel_type(const std::string& name) {
    const std::string id = normalize_kernel_id(name);
    if (id == "se" || id == "rbf" || id == "gaussian" || id == "squared_exponential") {
        return KernelType::SquaredExponential;
    }
    if (id == "imq" || id == "inverse_multiquadric") {
        return KernelType::InverseMultiquadric;
    }
    if (id == "imqp" || id == "imq_p" || id == "inverse_multiquadric_power") {
        return KernelType::InverseMultiquadricPower;
    }
    throw ConfigurationError("Unknown kernel type: " + name);
}

std::string kernel_type_name(KernelType type) {
    switch (type) {
        case KernelType::SquaredExponential:
            return "se";
        case KernelType::InverseMultiquadric:
            return "imq";
        case KernelType::InverseMultiquadricPower:
            return "imqp";
    }
    return "unknown";
}

LengthScale::LengthScale(double value) : values_(Eigen::VectorXd::Constant(1, value)) {
    if (!(value > 0.0) || !std::isfinite(value)) {
        throw ConfigurationError("length scale must be positive and finite: " + std::to_string(value));
    }
}

LengthScale::LengthScale(Eigen::VectorXd values) : values_(std::move(values)) {
    if (values_.size() == 0) {
        throw ConfigurationError("length scale requires at least one entry");
    }
    for (Eigen::Index i = 0; i < values_.size(); ++i) {
        if (!(values_(i) > 0.0) || !std::isfinite(values_(i))) {
            throw ConfigurationError("length scale entries must be positive and finite");
        }
    }
}

Eigen::VectorXd LengthScale::broadcast(Eigen::Index dimension) const {
    if (is_isotropic()) {
        return Eigen::VectorXd::Constant(dimension, values_(0));
    }
    if (values_.size() != dimension) {
        throw DimensionMismatchError("length scale has " + std::to_string(values_.size()) +
                                     " entries but points have dimension " + std::to_string(dimension));
    }
    return values_;
}

Eigen::VectorXd LengthScale::inverse_squared(Eigen::Index dimension) const {
    return broadcast(dimension).array().square().inverse().matrix();
}

ScalarKernel::ScalarKernel(KernelType type, double power) : type_(type), power_(power) {
    if (type_ == KernelType::InverseMultiquadric) {
        power_ = 0.5;
    }
    if (type_ == KernelType::InverseMultiquadricPower && !(power_ > 0.0)) {
        throw ConfigurationError("inverse multiquadric power must be positive: " + std::to_string(power));
    }
}

double ScalarKernel::profile(double scaled_sq_distance) const {
    if (type_ == KernelType::SquaredExponential) {
        return std::exp(-0.5 * scaled_sq_distance);
    }
    if (type_ == KernelType::InverseMultiquadric) {
        return 1.0 / std::sqrt(1.0 + scaled_sq_distance);
    }
    return std::pow(1.0 + scaled_sq_distance, -power_);
}

KernelProfile ScalarKernel::profile_derivatives(double scaled_sq_distance) const {
    if (type_ == KernelType::SquaredExponential) {
        // phi(s) = exp(-s/2): every derivative picks up a factor of -1/2.
        const double e = std::exp(-0.5 * scaled_sq_distance);
        return KernelProfile{e, -0.5 * e, 0.25 * e, -0.125 * e};
    }
    return inverse_power_profile(scaled_sq_distance, power_);
}

double ScalarKernel::value(const ConstRowRef& x,
                           const ConstRowRef& y,
                           const LengthScale& length_scale) const {
    if (x.size() != y.size()) {
        throw DimensionMismatchError("kernel arguments have different dimensions");
    }
    const Eigen::VectorXd inv_sq = length_scale.inverse_squared(x.size());
    return profile(scaled_squared_distance(x, y, inv_sq));
}

Eigen::RowVectorXd ScalarKernel::gradient_x(const ConstRowRef& x,
                                            const ConstRowRef& y,
                                            const LengthScale& length_scale) const {
    if (x.size() != y.size()) {
        throw DimensionMismatchError("kernel arguments have different dimensions");
    }
    const Eigen::VectorXd inv_sq = length_scale.inverse_squared(x.size());
    const double s = scaled_squared_distance(x, y, inv_sq);
    const KernelProfile p = profile_derivatives(s);
    // d/dx_a phi(s) = phi'(s) * 2 (x_a - y_a) / l_a^2
    return 2.0 * p.first * (x - y).cwiseProduct(inv_sq.transpose());
}

double scaled_squared_distance(const ConstRowRef& x,
                               const ConstRowRef& y,
                               const Eigen::VectorXd& inv_sq_scale) {
    return ((x - y).array().square() * inv_sq_scale.transpose().array()).sum();
}

double median_distance(const Eigen::MatrixXd& x1, const Eigen::MatrixXd& x2) {
    require_same_dimension(x1, x2, "median_heuristic");
    if (x1.rows() == 0 || x2.rows() == 0) {
        throw std::invalid_argument("median heuristic requires non-empty point sets");
    }
    const Eigen::Index n = x1.rows();
    const Eigen::Index m = x2.rows();
    std::vector<double> distances;
    distances.reserve(static_cast<std::size_t>(n * m));
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = 0; j < m; ++j) {
            distances.push_back((x1.row(i) - x2.row(j)).norm());
        }
    }
    // k-th largest with k = floor(n*m/2), i.e. ascending position n*m - k.
    const std::size_t total = distances.size();
    const std::size_t k = std::max<std::size_t>(total / 2, 1);
    const auto nth = distances.begin() + static_cast<std::ptrdiff_t>(total - k);
    std::nth_element(distances.begin(), nth, distances.end());
    return *nth;
}

double median_heuristic(const Eigen::MatrixXd& x1, const Eigen::MatrixXd& x2) {
    const double width = median_distance(x1, x2);
    if (!(width > 0.0)) {
        throw std::invalid_argument("median heuristic produced a non-positive length scale; points are degenerate");
    }
    return width;
}

void require_same_dimension(const Eigen::MatrixXd& x1, const Eigen::MatrixXd& x2, const char* context) {
    if (x1.cols() != x2.cols()) {
        throw DimensionMismatchError(std::string(context) + ": point sets have dimensions " +
                                     std::to_string(x1.cols()) + " and " + std::to_string(x2.cols()));
    }
}

}  // namespace libscore
