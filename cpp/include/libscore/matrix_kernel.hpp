#pragma once

#include "libscore/gram_matrix.hpp"
#include "libscore/scalar_kernel.hpp"

#include <Eigen/Dense>

#include <memory>
#include <string>

namespace libscore {

enum class KernelStructure {
    Diagonal,  // k(x, y) I_d
    CurlFree   // d^2 k / dx dy
};

[[nodiscard]] KernelStructure parse_kernel_structure(const std::string& name);

// Matrix-valued kernel K(x, y) in R^{d x d} with a fixed length scale.
//
// Operators over point sets use a compact coefficient layout. With block size b
// (1 when the output dimensions decouple, d otherwise) a set of n points maps to
// n*b rows and d/b columns, so the same dense linear algebra serves both kernels.
class MatrixKernel {
public:
    virtual ~MatrixKernel() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    [[nodiscard]] virtual Eigen::MatrixXd value(const ConstRowRef& x,
                                                const ConstRowRef& y) const = 0;

    [[nodiscard]] virtual Eigen::Index block_size(Eigen::Index dimension) const = 0;

    // Operator matrix between two point sets, (n*b) x (m*b).
    [[nodiscard]] virtual Eigen::MatrixXd kernel_matrix(const Eigen::MatrixXd& x,
                                                        const Eigen::MatrixXd& y) const = 0;

    // zeta(y_j) = (1/M) sum_i div_{x_i} K(x_i, y_j) over the rows of `samples`,
    // in coefficient layout (m*b) x (d/b).
    [[nodiscard]] virtual Eigen::MatrixXd mean_divergence(const Eigen::MatrixXd& samples,
                                                          const Eigen::MatrixXd& y) const = 0;

    // Coefficient layout -> one d-dimensional vector per row.
    [[nodiscard]] Eigen::MatrixXd unpack(const Eigen::MatrixXd& layout,
                                         Eigen::Index n_points,
                                         Eigen::Index dimension) const;

    [[nodiscard]] const ScalarKernel& scalar_kernel() const noexcept { return kernel_; }

    [[nodiscard]] const LengthScale& length_scale() const noexcept { return length_scale_; }

    [[nodiscard]] bool add_linear_kernel() const noexcept { return add_linear_kernel_; }

protected:
    MatrixKernel(ScalarKernel kernel, LengthScale length_scale, bool add_linear_kernel);

private:
    ScalarKernel kernel_;
    LengthScale length_scale_;
    bool add_linear_kernel_;
};

// K(x, y) = k(x, y) I_d. Operators reduce to the scalar Gram matrix.
class DiagonalKernel : public MatrixKernel {
public:
    DiagonalKernel(ScalarKernel kernel, LengthScale length_scale, bool add_linear_kernel = false);

    [[nodiscard]] std::string name() const override;

    [[nodiscard]] Eigen::MatrixXd value(const ConstRowRef& x,
                                        const ConstRowRef& y) const override;

    [[nodiscard]] Eigen::Index block_size(Eigen::Index /*dimension*/) const override { return 1; }

    [[nodiscard]] Eigen::MatrixXd kernel_matrix(const Eigen::MatrixXd& x,
                                                const Eigen::MatrixXd& y) const override;

    [[nodiscard]] Eigen::MatrixXd mean_divergence(const Eigen::MatrixXd& samples,
                                                  const Eigen::MatrixXd& y) const override;

private:
    GramMatrix gram_;
};

// K(x, y)_ab = d^2 k(x, y) / dx_a dy_b. For any scalar f, y -> K(x, y) grad f(y) is
// a gradient field, which keeps the Stein construction consistent.
class SquareCurlFreeKernel : public MatrixKernel {
public:
    SquareCurlFreeKernel(ScalarKernel kernel, LengthScale length_scale, bool add_linear_kernel = false);

    [[nodiscard]] std::string name() const override;

    [[nodiscard]] Eigen::MatrixXd value(const ConstRowRef& x,
                                        const ConstRowRef& y) const override;

    [[nodiscard]] Eigen::Index block_size(Eigen::Index dimension) const override { return dimension; }

    [[nodiscard]] Eigen::MatrixXd kernel_matrix(const Eigen::MatrixXd& x,
                                                const Eigen::MatrixXd& y) const override;

    [[nodiscard]] Eigen::MatrixXd mean_divergence(const Eigen::MatrixXd& samples,
                                                  const Eigen::MatrixXd& y) const override;

    // div_x K(x, y), the b-th entry being sum_a dK_ab / dx_a.
    [[nodiscard]] Eigen::RowVectorXd divergence(const ConstRowRef& x,
                                                const ConstRowRef& y) const;

private:
    void fill_block(const ConstRowRef& x,
                    const ConstRowRef& y,
                    const Eigen::VectorXd& inv_sq,
                    Eigen::Ref<Eigen::MatrixXd> block) const;
};

class DiagonalGaussianKernel final : public DiagonalKernel {
public:
    explicit DiagonalGaussianKernel(LengthScale length_scale, bool add_linear_kernel = false);
};

class DiagonalIMQKernel final : public DiagonalKernel {
public:
    explicit DiagonalIMQKernel(LengthScale length_scale, bool add_linear_kernel = false);
};

class DiagonalIMQpKernel final : public DiagonalKernel {
public:
    DiagonalIMQpKernel(LengthScale length_scale, double power, bool add_linear_kernel = false);
};

class CurlFreeSEKernel final : public SquareCurlFreeKernel {
public:
    explicit CurlFreeSEKernel(LengthScale length_scale, bool add_linear_kernel = false);
};

class CurlFreeIMQKernel final : public SquareCurlFreeKernel {
public:
    explicit CurlFreeIMQKernel(LengthScale length_scale, bool add_linear_kernel = false);
};

class CurlFreeIMQpKernel final : public SquareCurlFreeKernel {
public:
    CurlFreeIMQpKernel(LengthScale length_scale, double power, bool add_linear_kernel = false);
};

[[nodiscard]] std::unique_ptr<MatrixKernel> make_matrix_kernel(KernelStructure structure,
                                                               KernelType kernel_type,
                                                               LengthScale length_scale,
                                                               bool add_linear_kernel,
                                                               double power = 0.5);

}  // namespace libscore
