#include "libscore/matrix_kernel.hpp"

#include "libscore/errors.hpp"

#include <cctype>
#include <stdexcept>
#include <utility>

namespace libscore {

KernelStructure parse_kernel_structure(const std::string& name) {
    std::string id;
    for (char c : name) {
        id.push_back(c == '-' ? '_' : static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (id == "diagonal" || id == "diag") {
        return KernelStructure::Diagonal;
    }
    if (id == "curl_free" || id == "curlfree") {
        return KernelStructure::CurlFree;
    }
    throw ConfigurationError("Unknown matrix kernel structure: " + name);
}

MatrixKernel::MatrixKernel(ScalarKernel kernel, LengthScale length_scale, bool add_linear_kernel)
    : kernel_(std::move(kernel)), length_scale_(std::move(length_scale)), add_linear_kernel_(add_linear_kernel) {}

Eigen::MatrixXd MatrixKernel::unpack(const Eigen::MatrixXd& layout,
                                     Eigen::Index n_points,
                                     Eigen::Index dimension) const {
    const Eigen::Index b = block_size(dimension);
    if (layout.rows() != n_points * b || layout.cols() * b != dimension) {
        throw DimensionMismatchError("coefficient layout does not match " + std::to_string(n_points) +
                                     " points of dimension " + std::to_string(dimension));
    }
    if (b == 1) {
        return layout;
    }
    Eigen::MatrixXd out(n_points, dimension);
    for (Eigen::Index i = 0; i < n_points; ++i) {
        out.row(i) = layout.block(i * dimension, 0, dimension, 1).transpose();
    }
    return out;
}

// --- Diagonal ------------------------------------------------------------

DiagonalKernel::DiagonalKernel(ScalarKernel kernel, LengthScale length_scale, bool add_linear_kernel)
    : MatrixKernel(kernel, std::move(length_scale), add_linear_kernel),
      gram_(kernel.type(), add_linear_kernel, kernel.power()) {}

std::string DiagonalKernel::name() const {
    return "diagonal_" + kernel_type_name(scalar_kernel().type());
}

Eigen::MatrixXd DiagonalKernel::value(const ConstRowRef& x,
                                      const ConstRowRef& y) const {
    double k = scalar_kernel().value(x, y, length_scale());
    if (add_linear_kernel()) {
        k += x.dot(y);
    }
    return k * Eigen::MatrixXd::Identity(x.size(), x.size());
}

Eigen::MatrixXd DiagonalKernel::kernel_matrix(const Eigen::MatrixXd& x, const Eigen::MatrixXd& y) const {
    return gram_.gram(x, y, length_scale());
}

Eigen::MatrixXd DiagonalKernel::mean_divergence(const Eigen::MatrixXd& samples, const Eigen::MatrixXd& y) const {
    // div_x (k I) = grad_x k
    return GramMatrix::mean_grad_x1(gram_.grad_gram(samples, y, length_scale()));
}

// --- Curl-free -----------------------------------------------------------

SquareCurlFreeKernel::SquareCurlFreeKernel(ScalarKernel kernel, LengthScale length_scale, bool add_linear_kernel)
    : MatrixKernel(std::move(kernel), std::move(length_scale), add_linear_kernel) {}

std::string SquareCurlFreeKernel::name() const {
    return "curl_free_" + kernel_type_name(scalar_kernel().type());
}

void SquareCurlFreeKernel::fill_block(const ConstRowRef& x,
                                      const ConstRowRef& y,
                                      const Eigen::VectorXd& inv_sq,
                                      Eigen::Ref<Eigen::MatrixXd> block) const {
    const Eigen::Index d = x.size();
    const Eigen::RowVectorXd u = (x - y).cwiseProduct(inv_sq.transpose());
    const KernelProfile p = scalar_kernel().profile_derivatives(scaled_squared_distance(x, y, inv_sq));
    // K_ab = -2 phi'(s) delta_ab / l_a^2 - 4 phi''(s) u_a u_b
    block.noalias() = -4.0 * p.second * (u.transpose() * u);
    for (Eigen::Index a = 0; a < d; ++a) {
        block(a, a) += -2.0 * p.first * inv_sq(a);
        if (add_linear_kernel()) {
            block(a, a) += 1.0;
        }
    }
}

Eigen::MatrixXd SquareCurlFreeKernel::value(const ConstRowRef& x,
                                            const ConstRowRef& y) const {
    if (x.size() != y.size()) {
        throw DimensionMismatchError("kernel arguments have different dimensions");
    }
    Eigen::MatrixXd out(x.size(), x.size());
    fill_block(x, y, length_scale().inverse_squared(x.size()), out);
    return out;
}

Eigen::MatrixXd SquareCurlFreeKernel::kernel_matrix(const Eigen::MatrixXd& x, const Eigen::MatrixXd& y) const {
    require_same_dimension(x, y, "curl-free kernel_matrix");
    const Eigen::Index d = x.cols();
    const Eigen::VectorXd inv_sq = length_scale().inverse_squared(d);
    Eigen::MatrixXd K(x.rows() * d, y.rows() * d);
    for (Eigen::Index i = 0; i < x.rows(); ++i) {
        for (Eigen::Index j = 0; j < y.rows(); ++j) {
            fill_block(x.row(i), y.row(j), inv_sq, K.block(i * d, j * d, d, d));
        }
    }
    return K;
}

Eigen::RowVectorXd SquareCurlFreeKernel::divergence(const ConstRowRef& x,
                                                    const ConstRowRef& y) const {
    if (x.size() != y.size()) {
        throw DimensionMismatchError("kernel arguments have different dimensions");
    }
    const Eigen::VectorXd inv_sq = length_scale().inverse_squared(x.size());
    const Eigen::RowVectorXd u = (x - y).cwiseProduct(inv_sq.transpose());
    const KernelProfile p = scalar_kernel().profile_derivatives(scaled_squared_distance(x, y, inv_sq));
    // sum_a dK_ab/dx_a = u_b [-8 phi'' / l_b^2 - 8 phi''' |u|^2 - 4 phi'' sum_a 1/l_a^2].
    // The linear term contributes the identity, which is divergence free.
    const double shared = -8.0 * p.third * u.squaredNorm() - 4.0 * p.second * inv_sq.sum();
    Eigen::RowVectorXd out(x.size());
    for (Eigen::Index b = 0; b < x.size(); ++b) {
        out(b) = u(b) * (shared - 8.0 * p.second * inv_sq(b));
    }
    return out;
}

Eigen::MatrixXd SquareCurlFreeKernel::mean_divergence(const Eigen::MatrixXd& samples, const Eigen::MatrixXd& y) const {
    require_same_dimension(samples, y, "curl-free mean_divergence");
    if (samples.rows() == 0) {
        throw std::invalid_argument("mean_divergence requires at least one sample");
    }
    const Eigen::Index d = samples.cols();
    Eigen::MatrixXd out = Eigen::MatrixXd::Zero(y.rows() * d, 1);
    for (Eigen::Index j = 0; j < y.rows(); ++j) {
        Eigen::RowVectorXd acc = Eigen::RowVectorXd::Zero(d);
        for (Eigen::Index i = 0; i < samples.rows(); ++i) {
            acc += divergence(samples.row(i), y.row(j));
        }
        out.block(j * d, 0, d, 1) = acc.transpose() / static_cast<double>(samples.rows());
    }
    return out;
}

// --- Named instances -----------------------------------------------------

DiagonalGaussianKernel::DiagonalGaussianKernel(LengthScale length_scale, bool add_linear_kernel)
    : DiagonalKernel(ScalarKernel(KernelType::SquaredExponential), std::move(length_scale), add_linear_kernel) {}

DiagonalIMQKernel::DiagonalIMQKernel(LengthScale length_scale, bool add_linear_kernel)
    : DiagonalKernel(ScalarKernel(KernelType::InverseMultiquadric), std::move(length_scale), add_linear_kernel) {}

DiagonalIMQpKernel::DiagonalIMQpKernel(LengthScale length_scale, double power, bool add_linear_kernel)
    : DiagonalKernel(ScalarKernel(KernelType::InverseMultiquadricPower, power), std::move(length_scale),
                     add_linear_kernel) {}

CurlFreeSEKernel::CurlFreeSEKernel(LengthScale length_scale, bool add_linear_kernel)
    : SquareCurlFreeKernel(ScalarKernel(KernelType::SquaredExponential), std::move(length_scale), add_linear_kernel) {}

CurlFreeIMQKernel::CurlFreeIMQKernel(LengthScale length_scale, bool add_linear_kernel)
    : SquareCurlFreeKernel(ScalarKernel(KernelType::InverseMultiquadric), std::move(length_scale), add_linear_kernel) {}

CurlFreeIMQpKernel::CurlFreeIMQpKernel(LengthScale length_scale, double power, bool add_linear_kernel)
    : SquareCurlFreeKernel(ScalarKernel(KernelType::InverseMultiquadricPower, power), std::move(length_scale),
                           add_linear_kernel) {}

std::unique_ptr<MatrixKernel> make_matrix_kernel(KernelStructure structure,
                                                 KernelType kernel_type,
                                                 LengthScale length_scale,
                                                 bool add_linear_kernel,
                                                 double power) {
    ScalarKernel kernel(kernel_type, power);
    if (structure == KernelStructure::CurlFree) {
        return std::make_unique<SquareCurlFreeKernel>(std::move(kernel), std::move(length_scale), add_linear_kernel);
    }
    return std::make_unique<DiagonalKernel>(std::move(kernel), std::move(length_scale), add_linear_kernel);
}

}  // namespace libscore
