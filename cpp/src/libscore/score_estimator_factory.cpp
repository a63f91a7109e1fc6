#include "libscore/score_estimator_factory.hpp"

#include "libscore/errors.hpp"
#include "libscore/kde.hpp"
#include "libscore/landweber.hpp"
#include "libscore/nu_method.hpp"
#include "libscore/ssge.hpp"
#include "libscore/tikhonov.hpp"

#include <cctype>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace libscore {

namespace {

[[nodiscard]] std::string normalize_method(const std::string& method) {
    std::string id;
    for (char c : method) {
        if (c == '-' || c == ' ') {
            id.push_back('_');
        } else {
            id.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return id;
}

[[nodiscard]] std::optional<LengthScale> to_length_scale(const std::optional<Eigen::VectorXd>& values) {
    if (!values) {
        return std::nullopt;
    }
    return LengthScale(*values);
}

template <typename Options>
void copy_common(const EstimatorConfig& config, Options& options) {
    options.verbose = config.verbose;
    options.warning_handler = config.warning_handler;
}

template <typename Options>
void copy_regularized(const EstimatorConfig& config, Options& options) {
    copy_common(config, options);
    options.kernel_type = parse_kernel_type(config.kernel_type);
    options.kernel_structure = parse_kernel_structure(config.kernel_structure);
    options.add_linear_kernel = config.add_linear_kernel;
    options.power = config.power;
    options.bandwidth = to_length_scale(config.bandwidth);
}

}  // namespace

std::unique_ptr<ScoreEstimator> ScoreEstimatorFactory::create(const std::string& method, const EstimatorConfig& config) {
    const std::string id = normalize_method(method);

    if (id == "kde") {
        KDE::Options options;
        copy_common(config, options);
        options.bandwidth = to_length_scale(config.bandwidth);
        return std::make_unique<KDE>(std::move(options));
    }
    if (id == "ssge") {
        SSGE::Options options;
        copy_common(config, options);
        options.kernel_type = parse_kernel_type(config.kernel_type);
        options.add_linear_kernel = config.add_linear_kernel;
        options.power = config.power;
        options.eta = config.eta;
        options.n_eigen_values = config.n_eigen_values;
        options.n_eigen_threshold = config.n_eigen_threshold;
        options.length_scale = to_length_scale(config.bandwidth);
        return std::make_unique<SSGE>(std::move(options));
    }
    if (id == "tikhonov") {
        Tikhonov::Options options;
        copy_regularized(config, options);
        if (config.lam) {
            options.lam = *config.lam;
        }
        return std::make_unique<Tikhonov>(std::move(options));
    }
    if (id == "landweber") {
        Landweber::Options options;
        copy_regularized(config, options);
        if (config.num_iter) {
            options.num_iter = *config.num_iter;
        }
        options.step_size = config.step_size;
        return std::make_unique<Landweber>(std::move(options));
    }
    if (id == "nu_method" || id == "nu" || id == "numethod") {
        NuMethod::Options options;
        copy_regularized(config, options);
        if (config.lam) {
            options.lam = *config.lam;
        }
        options.nu = config.nu;
        options.num_iter = config.num_iter;
        options.step_size = config.step_size;
        return std::make_unique<NuMethod>(std::move(options));
    }
    throw ConfigurationError("Unknown score estimator: " + method);
}

}  // namespace libscore
