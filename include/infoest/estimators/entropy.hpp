#pragma once

#include "infoest/binning/bin_spec.hpp"
#include "infoest/estimators/estimator_options.hpp"
#include "infoest/estimators/method.hpp"
#include <Eigen/Dense>
#include <optional>

namespace infoest::estimators {

/// Entropy of raw samples (N x D, one sample per row).
///
/// - NearestNeighbors: Kozachenko-Leonenko estimate in bits. Needs N >= 2 and
///   allocates an N x N distance matrix.
/// - Gaussian: 0.5 * ln((2 pi e)^D det(X^T X)) in nats; -inf when the
///   scatter matrix is singular.
/// - Bin: discrete entropy (bits) of symbols_to_prob(data, *bins). Throws
///   InvalidArgument if bins is not given.
[[nodiscard]] double entropy_from_samples(const Eigen::MatrixXd& data,
                                          Method method,
                                          const std::optional<binning::BinSpec>& bins = std::nullopt,
                                          double histogram_tol = 1e-4);

[[nodiscard]] double entropy_from_samples(const Eigen::VectorXd& data,
                                          Method method,
                                          const std::optional<binning::BinSpec>& bins = std::nullopt,
                                          double histogram_tol = 1e-4);

[[nodiscard]] double entropy_from_samples(const Eigen::MatrixXd& data,
                                          const EstimatorOptions& opts,
                                          const std::optional<binning::BinSpec>& bins = std::nullopt);

/// Entropy (bits) of an explicit probability mass function.
/// Only Method::Bin applies; the binless methods throw MissingData.
/// Throws TypeMismatch for negative or non-finite entries and
/// ProbabilityNormalizationError if |sum(prob) - 1| > error_val.
[[nodiscard]] double entropy_from_distribution(const Eigen::VectorXd& prob,
                                               Method method = Method::Bin,
                                               double error_val = 1e-5);

[[nodiscard]] double entropy_from_distribution(const Eigen::VectorXd& prob,
                                               const EstimatorOptions& opts);

/// Call shape with optional inputs. Exactly one of data / prob must be set.
struct EntropyRequest {
    std::optional<Eigen::MatrixXd> data;
    std::optional<Eigen::VectorXd> prob;
    Method method = Method::NearestNeighbors;
    std::optional<binning::BinSpec> bins;
    double error_val = 1e-5;
};

/// Validate a request and dispatch to the sample or distribution path.
/// Throws InvalidArgument when both or neither of data and prob are set.
[[nodiscard]] double entropy(const EntropyRequest& request);

// ---- Individual estimators (no argument dispatch) ----

/// Distance from each row of data to its nearest other row.
[[nodiscard]] Eigen::VectorXd nearest_neighbor_distances(const Eigen::MatrixXd& data);

[[nodiscard]] double nearest_neighbor_entropy(const Eigen::MatrixXd& data);

[[nodiscard]] double gaussian_entropy(const Eigen::MatrixXd& data);

/// -sum p log2 p, with 0 log2 0 = 0. No validation of prob.
[[nodiscard]] double discrete_entropy(const Eigen::VectorXd& prob);

} // namespace infoest::estimators
