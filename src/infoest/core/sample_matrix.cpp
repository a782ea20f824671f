#include "infoest/core/sample_matrix.hpp"
#include "infoest/core/errors.hpp"
#include <string>

namespace infoest::core {

Eigen::MatrixXd as_sample_matrix(const Eigen::VectorXd& samples) {
    if (samples.size() == 0) {
        throw InvalidArgument("as_sample_matrix: at least one sample is required");
    }
    return Eigen::MatrixXd(samples);
}

Eigen::MatrixXd as_sample_matrix(const Eigen::MatrixXd& samples) {
    if (samples.rows() == 0 || samples.cols() == 0) {
        throw InvalidArgument("as_sample_matrix: expected a non-empty N x D matrix, got "
                              + std::to_string(samples.rows()) + " x "
                              + std::to_string(samples.cols()));
    }
    return samples;
}

Eigen::MatrixXd hstack(const Eigen::MatrixXd& x, const Eigen::MatrixXd& y) {
    if (x.rows() != y.rows()) {
        throw DimensionMismatch("hstack: sample counts differ ("
                                + std::to_string(x.rows()) + " vs "
                                + std::to_string(y.rows()) + ")");
    }
    Eigen::MatrixXd xy(x.rows(), x.cols() + y.cols());
    xy << x, y;
    return xy;
}

} // namespace infoest::core
