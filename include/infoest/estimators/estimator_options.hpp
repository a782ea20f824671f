#pragma once

#include "infoest/estimators/method.hpp"

namespace infoest::estimators {

/// Settings shared by the entropy, mutual information and conditional
/// entropy entry points.
struct EstimatorOptions {
    Method method = Method::NearestNeighbors;   ///< Estimation regime
    double prob_tolerance = 1e-5;               ///< Allowed |sum(prob) - 1| for given distributions
    double histogram_tolerance = 1e-4;          ///< Allowed |sum(prob) - 1| after binning
};

} // namespace infoest::estimators
