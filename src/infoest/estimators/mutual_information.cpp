#include "infoest/estimators/mutual_information.hpp"
#include "infoest/core/sample_matrix.hpp"
#include "infoest/estimators/entropy.hpp"

namespace infoest::estimators {

namespace {

double mi_impl(const Eigen::MatrixXd& X, const Eigen::MatrixXd& Y,
               const std::optional<binning::BinSpec>& bins_x,
               const std::optional<binning::BinSpec>& bins_y,
               const std::optional<binning::BinSpec>& bins_xy,
               Method method, double histogram_tol) {
    const Eigen::MatrixXd XY = core::hstack(X, Y);
    const double hx = entropy_from_samples(X, method, bins_x, histogram_tol);
    const double hy = entropy_from_samples(Y, method, bins_y, histogram_tol);
    const double hxy = entropy_from_samples(XY, method, bins_xy, histogram_tol);
    return hx + hy - hxy;
}

double cond_entropy_impl(const Eigen::MatrixXd& X, const Eigen::MatrixXd& Y,
                         const std::optional<binning::BinSpec>& bins_y,
                         const std::optional<binning::BinSpec>& bins_xy,
                         Method method, double histogram_tol) {
    const Eigen::MatrixXd XY = core::hstack(X, Y);
    const double hxy = entropy_from_samples(XY, method, bins_xy, histogram_tol);
    const double hy = entropy_from_samples(Y, method, bins_y, histogram_tol);
    return hxy - hy;
}

} // anonymous namespace

double mi(const Eigen::MatrixXd& x, const Eigen::MatrixXd& y,
          const std::optional<binning::BinSpec>& bins_x,
          const std::optional<binning::BinSpec>& bins_y,
          const std::optional<binning::BinSpec>& bins_xy,
          Method method) {
    return mi_impl(core::as_sample_matrix(x), core::as_sample_matrix(y),
                   bins_x, bins_y, bins_xy, method, EstimatorOptions{}.histogram_tolerance);
}

double mi(const Eigen::VectorXd& x, const Eigen::VectorXd& y,
          const std::optional<binning::BinSpec>& bins_x,
          const std::optional<binning::BinSpec>& bins_y,
          const std::optional<binning::BinSpec>& bins_xy,
          Method method) {
    return mi_impl(core::as_sample_matrix(x), core::as_sample_matrix(y),
                   bins_x, bins_y, bins_xy, method, EstimatorOptions{}.histogram_tolerance);
}

double mi(const Eigen::MatrixXd& x, const Eigen::MatrixXd& y,
          const EstimatorOptions& opts,
          const std::optional<binning::BinSpec>& bins_x,
          const std::optional<binning::BinSpec>& bins_y,
          const std::optional<binning::BinSpec>& bins_xy) {
    return mi_impl(core::as_sample_matrix(x), core::as_sample_matrix(y),
                   bins_x, bins_y, bins_xy, opts.method, opts.histogram_tolerance);
}

double cond_entropy(const Eigen::MatrixXd& x, const Eigen::MatrixXd& y,
                    const std::optional<binning::BinSpec>& bins_y,
                    const std::optional<binning::BinSpec>& bins_xy,
                    Method method) {
    return cond_entropy_impl(core::as_sample_matrix(x), core::as_sample_matrix(y),
                             bins_y, bins_xy, method, EstimatorOptions{}.histogram_tolerance);
}

double cond_entropy(const Eigen::VectorXd& x, const Eigen::VectorXd& y,
                    const std::optional<binning::BinSpec>& bins_y,
                    const std::optional<binning::BinSpec>& bins_xy,
                    Method method) {
    return cond_entropy_impl(core::as_sample_matrix(x), core::as_sample_matrix(y),
                             bins_y, bins_xy, method, EstimatorOptions{}.histogram_tolerance);
}

double cond_entropy(const Eigen::MatrixXd& x, const Eigen::MatrixXd& y,
                    const EstimatorOptions& opts,
                    const std::optional<binning::BinSpec>& bins_y,
                    const std::optional<binning::BinSpec>& bins_xy) {
    return cond_entropy_impl(core::as_sample_matrix(x), core::as_sample_matrix(y),
                             bins_y, bins_xy, opts.method, opts.histogram_tolerance);
}

} // namespace infoest::estimators
