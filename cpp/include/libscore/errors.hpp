#pragma once

#include <stdexcept>
#include <string>

namespace libscore {

// Structurally invalid estimator or kernel configuration.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& message) : std::invalid_argument(message) {}
};

// Point sets (or a per-dimension length scale) disagree on the feature dimension.
class DimensionMismatchError : public std::invalid_argument {
public:
    explicit DimensionMismatchError(const std::string& message) : std::invalid_argument(message) {}
};

}  // namespace libscore
