#include "libscore/gram_matrix.hpp"

#include <stdexcept>

namespace libscore {

GramMatrix::GramMatrix(KernelType kernel_type, bool add_linear_kernel, double power)
    : kernel_(kernel_type, power), add_linear_kernel_(add_linear_kernel) {}

GramMatrix::GramMatrix(const std::string& kernel_type, bool add_linear_kernel)
    : GramMatrix(parse_kernel_type(kernel_type), add_linear_kernel) {}

Eigen::MatrixXd GramMatrix::gram(const Eigen::MatrixXd& x1,
                                 const Eigen::MatrixXd& x2,
                                 const LengthScale& length_scale) const {
    require_same_dimension(x1, x2, "gram");
    const Eigen::Index n = x1.rows();
    const Eigen::Index m = x2.rows();
    const Eigen::VectorXd inv_sq = length_scale.inverse_squared(x1.cols());

    Eigen::MatrixXd K(n, m);
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = 0; j < m; ++j) {
            K(i, j) = kernel_.profile(scaled_squared_distance(x1.row(i), x2.row(j), inv_sq));
        }
    }
    if (add_linear_kernel_) {
        K.noalias() += x1 * x2.transpose();
    }
    return K;
}

GramGradients GramMatrix::grad_gram(const Eigen::MatrixXd& x1,
                                    const Eigen::MatrixXd& x2,
                                    const LengthScale& length_scale) const {
    require_same_dimension(x1, x2, "grad_gram");
    const Eigen::Index n = x1.rows();
    const Eigen::Index m = x2.rows();
    const Eigen::Index d = x1.cols();
    const Eigen::VectorXd inv_sq = length_scale.inverse_squared(d);

    GramGradients out;
    out.value.resize(n, m);
    out.grad_x1.assign(static_cast<std::size_t>(d), Eigen::MatrixXd(n, m));
    out.grad_x2.assign(static_cast<std::size_t>(d), Eigen::MatrixXd(n, m));

    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = 0; j < m; ++j) {
            const double s = scaled_squared_distance(x1.row(i), x2.row(j), inv_sq);
            const KernelProfile p = kernel_.profile_derivatives(s);
            out.value(i, j) = p.value;
            for (Eigen::Index a = 0; a < d; ++a) {
                // Radial kernels: dk/dx1 = 2 phi'(s) (x1 - x2) / l^2 = -dk/dx2.
                const double g = 2.0 * p.first * (x1(i, a) - x2(j, a)) * inv_sq(a);
                out.grad_x1[a](i, j) = g;
                out.grad_x2[a](i, j) = -g;
            }
        }
    }

    if (add_linear_kernel_) {
        out.value.noalias() += x1 * x2.transpose();
        for (Eigen::Index a = 0; a < d; ++a) {
            // d(x1 . x2)/dx1[i] = x2[j], d(x1 . x2)/dx2[j] = x1[i]
            out.grad_x1[a].rowwise() += x2.col(a).transpose();
            out.grad_x2[a].colwise() += x1.col(a);
        }
    }
    return out;
}

Eigen::MatrixXd GramMatrix::mean_grad_x1(const GramGradients& gradients) {
    const Eigen::Index n = gradients.value.rows();
    const Eigen::Index m = gradients.value.cols();
    const auto d = static_cast<Eigen::Index>(gradients.grad_x1.size());
    if (n == 0) {
        throw std::invalid_argument("mean_grad_x1 requires at least one row");
    }
    Eigen::MatrixXd out(m, d);
    for (Eigen::Index a = 0; a < d; ++a) {
        out.col(a) = gradients.grad_x1[a].colwise().mean().transpose();
    }
    return out;
}

}  // namespace libscore
