#pragma once

#include "infoest/binning/bin_spec.hpp"
#include <Eigen/Dense>
#include <vector>

namespace infoest::binning {

/// Merge per-sample symbols from several sources into one joint variable.
/// Row i of the result is an integer code for the tuple formed by row i of
/// every source; codes are assigned 0, 1, 2, ... in order of first
/// appearance. All sources must have the same number of rows.
/// Returns an N x 1 matrix suitable as input to symbols_to_prob.
[[nodiscard]] Eigen::MatrixXd combine_symbols(const std::vector<Eigen::MatrixXd>& sources);

/// Unit-width bins centred on every distinct integer code of each column,
/// so every joint symbol lands in its own bin. Codes must be integers of
/// magnitude at most 2^52; anything else throws InvalidArgument.
[[nodiscard]] BinSpec symbol_bins(const Eigen::MatrixXd& symbols);

} // namespace infoest::binning
