#pragma once

#include "infoest/binning/histogram.hpp"
#include "infoest/plot_utils/plot_options.hpp"
#include <Eigen/Dense>
#include <matplot/matplot.h>

namespace infoest::plot_utils {

/// Plot the per-bin probabilities of a histogram on the given axes.
/// 1-D histograms are drawn as bars at the bin centers, 2-D histograms as a
/// heatmap (rows = first dimension). Other dimensionalities throw
/// std::invalid_argument.
void plot_histogram(matplot::axes_handle ax,
                    const binning::Histogram& hist,
                    const PlotOptions& opts);

/// Convenience: create figure, plot, save if output_file set.
void plot_histogram(const binning::Histogram& hist, const PlotOptions& opts);

/// Histogram of the nearest-neighbor distances (rho) that drive the
/// nearest-neighbor entropy estimate. data holds one sample per row.
void plot_nearest_neighbor_distances(matplot::axes_handle ax,
                                     const Eigen::MatrixXd& data,
                                     const PlotOptions& opts);

void plot_nearest_neighbor_distances(const Eigen::MatrixXd& data, const PlotOptions& opts);

} // namespace infoest::plot_utils
