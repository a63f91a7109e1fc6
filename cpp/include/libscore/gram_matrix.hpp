#pragma once

#include "libscore/scalar_kernel.hpp"

#include <Eigen/Dense>

#include <string>
#include <vector>

namespace libscore {

// Pairwise kernel values between two point sets and their exact gradients.
//   grad_x1[a](i, j) = dK(i, j) / dx1(i, a)
//   grad_x2[a](i, j) = dK(i, j) / dx2(j, a)
struct GramGradients {
    Eigen::MatrixXd value;
    std::vector<Eigen::MatrixXd> grad_x1;
    std::vector<Eigen::MatrixXd> grad_x2;
};

// Gram-matrix builder shared by every estimator. Optionally augments the scalar
// kernel with the linear kernel x1 . x2.
class GramMatrix {
public:
    GramMatrix(KernelType kernel_type, bool add_linear_kernel, double power = 0.5);

    GramMatrix(const std::string& kernel_type, bool add_linear_kernel);

    [[nodiscard]] const ScalarKernel& kernel() const noexcept { return kernel_; }

    [[nodiscard]] bool add_linear_kernel() const noexcept { return add_linear_kernel_; }

    // K(i, j) = k(x1[i], x2[j]) [+ x1[i] . x2[j]]
    [[nodiscard]] Eigen::MatrixXd gram(const Eigen::MatrixXd& x1,
                                       const Eigen::MatrixXd& x2,
                                       const LengthScale& length_scale) const;

    [[nodiscard]] GramGradients grad_gram(const Eigen::MatrixXd& x1,
                                          const Eigen::MatrixXd& x2,
                                          const LengthScale& length_scale) const;

    // Row j of the result is (1/n) sum_i dK(i, j)/dx1[i], the empirical Stein term
    // for the second argument x2[j]. Shape m x d.
    [[nodiscard]] static Eigen::MatrixXd mean_grad_x1(const GramGradients& gradients);

private:
    ScalarKernel kernel_;
    bool add_linear_kernel_;
};

}  // namespace libscore
