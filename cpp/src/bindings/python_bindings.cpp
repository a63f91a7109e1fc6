#include <pybind11/eigen.h>
#include <pybind11/functional.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "libscore/errors.hpp"
#include "libscore/gram_matrix.hpp"
#include "libscore/kde.hpp"
#include "libscore/landweber.hpp"
#include "libscore/nu_method.hpp"
#include "libscore/score_estimator_factory.hpp"
#include "libscore/ssge.hpp"
#include "libscore/tikhonov.hpp"

namespace py = pybind11;
using namespace libscore;

PYBIND11_MODULE(_libscore, m) {
    m.doc() = "libscore python bindings";

    py::register_exception<ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);
    py::register_exception<DimensionMismatchError>(m, "DimensionMismatchError", PyExc_ValueError);

    py::class_<GramGradients>(m, "GramGradients")
        .def_readonly("value", &GramGradients::value)
        .def_readonly("grad_x1", &GramGradients::grad_x1)
        .def_readonly("grad_x2", &GramGradients::grad_x2);

    py::class_<GramMatrix>(m, "GramMatrix")
        .def(py::init<const std::string&, bool>(), py::arg("kernel_type") = "se", py::arg("add_linear_kernel") = false)
        .def("gram",
             [](const GramMatrix& self, const Eigen::MatrixXd& x1, const Eigen::MatrixXd& x2, double length_scale) {
                 return self.gram(x1, x2, LengthScale(length_scale));
             },
             py::arg("x1"), py::arg("x2"), py::arg("length_scale"))
        .def("grad_gram",
             [](const GramMatrix& self, const Eigen::MatrixXd& x1, const Eigen::MatrixXd& x2, double length_scale) {
                 return self.grad_gram(x1, x2, LengthScale(length_scale));
             },
             py::arg("x1"), py::arg("x2"), py::arg("length_scale"));

    py::class_<EstimatorConfig>(m, "EstimatorConfig")
        .def(py::init<>())
        .def_readwrite("kernel_type", &EstimatorConfig::kernel_type)
        .def_readwrite("kernel_structure", &EstimatorConfig::kernel_structure)
        .def_readwrite("add_linear_kernel", &EstimatorConfig::add_linear_kernel)
        .def_readwrite("power", &EstimatorConfig::power)
        .def_readwrite("bandwidth", &EstimatorConfig::bandwidth)
        .def_readwrite("eta", &EstimatorConfig::eta)
        .def_readwrite("n_eigen_values", &EstimatorConfig::n_eigen_values)
        .def_readwrite("n_eigen_threshold", &EstimatorConfig::n_eigen_threshold)
        .def_readwrite("lam", &EstimatorConfig::lam)
        .def_readwrite("nu", &EstimatorConfig::nu)
        .def_readwrite("num_iter", &EstimatorConfig::num_iter)
        .def_readwrite("step_size", &EstimatorConfig::step_size)
        .def_readwrite("verbose", &EstimatorConfig::verbose)
        .def_readwrite("warning_handler", &EstimatorConfig::warning_handler);

    py::class_<ScoreEstimator>(m, "ScoreEstimator")
        .def("name", &ScoreEstimator::name)
        .def("estimate_gradients_s_x", &ScoreEstimator::estimate_gradients_s_x,
             py::arg("queries"), py::arg("samples"))
        .def("estimate_gradients_s", &ScoreEstimator::estimate_gradients_s, py::arg("x"));

    py::class_<KDE, ScoreEstimator>(m, "KDE")
        .def("density_estimates_log_prob", &KDE::density_estimates_log_prob,
             py::arg("query"), py::arg("samples"));
    py::class_<SSGE, ScoreEstimator>(m, "SSGE");
    py::class_<Tikhonov, ScoreEstimator>(m, "Tikhonov");
    py::class_<Landweber, ScoreEstimator>(m, "Landweber");
    py::class_<NuMethod, ScoreEstimator>(m, "NuMethod");

    m.def("create_estimator", &ScoreEstimatorFactory::create,
          py::arg("method"), py::arg("config") = EstimatorConfig());
}
