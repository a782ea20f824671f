#pragma once

#include "infoest/binning/bin_spec.hpp"
#include <Eigen/Dense>
#include <vector>

namespace infoest::binning {

/// D-dimensional histogram of a sample matrix.
/// Counts and probabilities are flattened row-major (last dimension fastest).
struct Histogram {
    std::vector<Eigen::VectorXd> edges;   ///< Bin edges per dimension (shape(d) + 1 values)
    std::vector<int> shape;               ///< Number of bins per dimension
    Eigen::VectorXd counts;               ///< Samples per bin
    Eigen::VectorXd probabilities;        ///< counts / counted samples

    [[nodiscard]] int dims() const { return static_cast<int>(shape.size()); }
    [[nodiscard]] double total() const { return counts.sum(); }

    /// Flat index of a multi-index (one bin index per dimension).
    [[nodiscard]] Eigen::Index flat_index(const std::vector<int>& index) const;
};

/// Resolve a bin spec against the data into explicit per-dimension edges.
/// Count axes span [min, max] of the column; a constant column spans
/// [v - 0.5, v + 0.5].
[[nodiscard]] std::vector<Eigen::VectorXd> resolve_edges(const Eigen::MatrixXd& data,
                                                         const BinSpec& bins);

/// Multi-dimensional histogram of the rows of `data`.
/// Bins are [e_i, e_{i+1}) except the last, which is closed. Rows outside
/// the edges on any axis are dropped.
/// Throws DimensionMismatch if bins.size() != data.cols().
[[nodiscard]] Histogram histogram_dd(const Eigen::MatrixXd& data, const BinSpec& bins);

/// Probability mass per histogram bin, flattened row-major.
/// Throws NormalizationError if the masses do not sum to 1 within tol
/// (e.g. every sample fell outside explicit edges).
[[nodiscard]] Eigen::VectorXd symbols_to_prob(const Eigen::MatrixXd& data,
                                              const BinSpec& bins,
                                              double tol = 1e-4);

[[nodiscard]] Eigen::VectorXd symbols_to_prob(const Eigen::VectorXd& data,
                                              const BinSpec& bins,
                                              double tol = 1e-4);

} // namespace infoest::binning
