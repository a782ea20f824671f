#pragma once

#include <Eigen/Dense>
#include <vector>

namespace infoest::plot_utils {

/// Midpoints of consecutive edges (edges.size() - 1 values).
std::vector<double> bin_centers(const Eigen::VectorXd& edges);

/// Convert Eigen vector to std::vector<double>.
std::vector<double> eigen_to_vec(const Eigen::VectorXd& v);

/// Convert Eigen matrix to vector of vectors (row-major).
std::vector<std::vector<double>> eigen_to_mat(const Eigen::MatrixXd& m);

} // namespace infoest::plot_utils
