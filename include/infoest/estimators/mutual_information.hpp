#pragma once

#include "infoest/binning/bin_spec.hpp"
#include "infoest/estimators/estimator_options.hpp"
#include "infoest/estimators/method.hpp"
#include <Eigen/Dense>
#include <optional>

namespace infoest::estimators {

/// Mutual information I(X;Y) = H(X) + H(Y) - H(X,Y).
/// x and y hold one sample per row and must have the same number of rows;
/// the joint entropy uses the column concatenation [x y]. All three
/// entropies use the same method. For Method::Bin, bins_x, bins_y and
/// bins_xy are required (bins_xy covers x.cols() + y.cols() axes).
/// Errors from the entropy estimator propagate unchanged.
[[nodiscard]] double mi(const Eigen::MatrixXd& x,
                        const Eigen::MatrixXd& y,
                        const std::optional<binning::BinSpec>& bins_x = std::nullopt,
                        const std::optional<binning::BinSpec>& bins_y = std::nullopt,
                        const std::optional<binning::BinSpec>& bins_xy = std::nullopt,
                        Method method = Method::NearestNeighbors);

[[nodiscard]] double mi(const Eigen::VectorXd& x,
                        const Eigen::VectorXd& y,
                        const std::optional<binning::BinSpec>& bins_x = std::nullopt,
                        const std::optional<binning::BinSpec>& bins_y = std::nullopt,
                        const std::optional<binning::BinSpec>& bins_xy = std::nullopt,
                        Method method = Method::NearestNeighbors);

[[nodiscard]] double mi(const Eigen::MatrixXd& x,
                        const Eigen::MatrixXd& y,
                        const EstimatorOptions& opts,
                        const std::optional<binning::BinSpec>& bins_x = std::nullopt,
                        const std::optional<binning::BinSpec>& bins_y = std::nullopt,
                        const std::optional<binning::BinSpec>& bins_xy = std::nullopt);

/// Conditional entropy H(X|Y) = H(X,Y) - H(Y).
/// For Method::Bin, bins_y and bins_xy are required.
[[nodiscard]] double cond_entropy(const Eigen::MatrixXd& x,
                                  const Eigen::MatrixXd& y,
                                  const std::optional<binning::BinSpec>& bins_y = std::nullopt,
                                  const std::optional<binning::BinSpec>& bins_xy = std::nullopt,
                                  Method method = Method::NearestNeighbors);

[[nodiscard]] double cond_entropy(const Eigen::VectorXd& x,
                                  const Eigen::VectorXd& y,
                                  const std::optional<binning::BinSpec>& bins_y = std::nullopt,
                                  const std::optional<binning::BinSpec>& bins_xy = std::nullopt,
                                  Method method = Method::NearestNeighbors);

[[nodiscard]] double cond_entropy(const Eigen::MatrixXd& x,
                                  const Eigen::MatrixXd& y,
                                  const EstimatorOptions& opts,
                                  const std::optional<binning::BinSpec>& bins_y = std::nullopt,
                                  const std::optional<binning::BinSpec>& bins_xy = std::nullopt);

} // namespace infoest::estimators
