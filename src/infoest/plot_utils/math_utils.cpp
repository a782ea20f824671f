#include "infoest/plot_utils/math_utils.hpp"

namespace infoest::plot_utils {

std::vector<double> bin_centers(const Eigen::VectorXd& edges) {
    if (edges.size() < 2) return {};
    std::vector<double> centers(static_cast<std::size_t>(edges.size() - 1));
    for (Eigen::Index i = 0; i + 1 < edges.size(); ++i) {
        centers[static_cast<std::size_t>(i)] = 0.5 * (edges(i) + edges(i + 1));
    }
    return centers;
}

std::vector<double> eigen_to_vec(const Eigen::VectorXd& v) {
    return std::vector<double>(v.data(), v.data() + v.size());
}

std::vector<std::vector<double>> eigen_to_mat(const Eigen::MatrixXd& m) {
    std::vector<std::vector<double>> result(m.rows());
    for (Eigen::Index i = 0; i < m.rows(); ++i) {
        result[i].resize(m.cols());
        for (Eigen::Index j = 0; j < m.cols(); ++j) {
            result[i][j] = m(i, j);
        }
    }
    return result;
}

} // namespace infoest::plot_utils
