#pragma once

#include <Eigen/Dense>

#include <string>

namespace libscore {

// A point (row of a point set) without forcing a copy of strided rows.
using ConstRowRef = Eigen::Ref<const Eigen::RowVectorXd, 0, Eigen::InnerStride<>>;

enum class KernelType {
    SquaredExponential,        // exp(-r^2 / 2)
    InverseMultiquadric,       // (1 + r^2)^(-1/2)
    InverseMultiquadricPower   // (1 + r^2)^(-p)
};

// Accepts "se" (also "rbf", "gaussian"), "imq" and "imqp"; anything else is a ConfigurationError.
[[nodiscard]] KernelType parse_kernel_type(const std::string& name);

[[nodiscard]] std::string kernel_type_name(KernelType type);

// Positive kernel length scale, either isotropic (one entry) or one entry per feature.
class LengthScale {
public:
    LengthScale(double value);

    explicit LengthScale(Eigen::VectorXd values);

    [[nodiscard]] bool is_isotropic() const noexcept { return values_.size() == 1; }

    [[nodiscard]] const Eigen::VectorXd& values() const noexcept { return values_; }

    // Per-feature length scales for a d-dimensional point set.
    [[nodiscard]] Eigen::VectorXd broadcast(Eigen::Index dimension) const;

    // Per-feature 1 / l_a^2, the weights of the scaled squared distance.
    [[nodiscard]] Eigen::VectorXd inverse_squared(Eigen::Index dimension) const;

private:
    Eigen::VectorXd values_;
};

// Radial profile phi(s) of a kernel k(x, y) = phi(s), s = sum_a ((x_a - y_a) / l_a)^2,
// together with its derivatives in s.
struct KernelProfile {
    double value{0.0};
    double first{0.0};
    double second{0.0};
    double third{0.0};
};

class ScalarKernel {
public:
    explicit ScalarKernel(KernelType type, double power = 0.5);

    [[nodiscard]] KernelType type() const noexcept { return type_; }

    [[nodiscard]] double power() const noexcept { return power_; }

    [[nodiscard]] double profile(double scaled_sq_distance) const;

    [[nodiscard]] KernelProfile profile_derivatives(double scaled_sq_distance) const;

    [[nodiscard]] double value(const ConstRowRef& x,
                               const ConstRowRef& y,
                               const LengthScale& length_scale) const;

    // Gradient of k(x, y) with respect to x.
    [[nodiscard]] Eigen::RowVectorXd gradient_x(const ConstRowRef& x,
                                                const ConstRowRef& y,
                                                const LengthScale& length_scale) const;

private:
    KernelType type_;
    double power_;
};

[[nodiscard]] double scaled_squared_distance(const ConstRowRef& x,
                                             const ConstRowRef& y,
                                             const Eigen::VectorXd& inv_sq_scale);

// The floor(n*m/2)-th largest Euclidean distance between rows of x1 and rows of x2
// (zero self-distances included). Zero for degenerate sets.
[[nodiscard]] double median_distance(const Eigen::MatrixXd& x1, const Eigen::MatrixXd& x2);

// Data-derived length scale, median_distance that must be positive.
[[nodiscard]] double median_heuristic(const Eigen::MatrixXd& x1, const Eigen::MatrixXd& x2);

// Throws DimensionMismatchError when the two point sets disagree on the feature count.
void require_same_dimension(const Eigen::MatrixXd& x1, const Eigen::MatrixXd& x2, const char* context);

}  // namespace libscore
