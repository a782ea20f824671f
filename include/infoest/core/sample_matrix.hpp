#pragma once

#include <Eigen/Dense>

namespace infoest::core {

/// Normalize input samples to an N x D matrix (one sample per row).
/// A vector becomes a single-column matrix. Throws InvalidArgument when
/// there are no samples or no dimensions.
[[nodiscard]] Eigen::MatrixXd as_sample_matrix(const Eigen::VectorXd& samples);
[[nodiscard]] Eigen::MatrixXd as_sample_matrix(const Eigen::MatrixXd& samples);

/// Column-wise concatenation [x y]. Throws DimensionMismatch when the
/// sample counts differ.
[[nodiscard]] Eigen::MatrixXd hstack(const Eigen::MatrixXd& x, const Eigen::MatrixXd& y);

} // namespace infoest::core
