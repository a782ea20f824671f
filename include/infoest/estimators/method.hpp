#pragma once

#include <string>
#include <string_view>

namespace infoest::estimators {

/// Entropy estimation regime.
enum class Method {
    NearestNeighbors,   ///< Binless Kozachenko-Leonenko estimator (bits)
    Gaussian,           ///< Jointly normal assumption, scatter determinant (nats)
    Bin                 ///< Discrete entropy of a histogram or given pmf (bits)
};

/// Canonical name: "nearest-neighbors", "gaussian" or "bin".
[[nodiscard]] std::string to_string(Method method);

/// Inverse of to_string. Throws UnsupportedMethod for any other name.
[[nodiscard]] Method parse_method(std::string_view name);

/// True if the method can only run on raw samples.
[[nodiscard]] bool requires_samples(Method method);

} // namespace infoest::estimators
