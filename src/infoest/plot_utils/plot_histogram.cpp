#include "infoest/plot_utils/plot_histogram.hpp"
#include "infoest/estimators/entropy.hpp"
#include "infoest/plot_utils/math_utils.hpp"
#include <stdexcept>

namespace infoest::plot_utils {

namespace {

void plot_histogram_1d(matplot::axes_handle ax, const binning::Histogram& hist,
                       const PlotOptions& opts) {
    auto x = bin_centers(hist.edges[0]);
    auto y = eigen_to_vec(hist.probabilities);

    auto bars = ax->bar(x, y);
    bars->face_color({opts.alpha, opts.color[1], opts.color[2], opts.color[3]});
    ax->xlabel("x");
    ax->ylabel("probability");
}

void plot_histogram_2d(matplot::axes_handle ax, const binning::Histogram& hist) {
    // Row-major flattening: reshape back to shape[0] x shape[1]
    Eigen::MatrixXd grid(hist.shape[0], hist.shape[1]);
    for (int i = 0; i < hist.shape[0]; ++i) {
        for (int j = 0; j < hist.shape[1]; ++j) {
            grid(i, j) = hist.probabilities(hist.flat_index({i, j}));
        }
    }
    ax->heatmap(eigen_to_mat(grid));
}

} // anonymous namespace

void plot_histogram(matplot::axes_handle ax,
                    const binning::Histogram& hist,
                    const PlotOptions& opts) {
    switch (hist.dims()) {
        case 1:
            plot_histogram_1d(ax, hist, opts);
            break;
        case 2:
            plot_histogram_2d(ax, hist);
            break;
        default:
            throw std::invalid_argument("plot_histogram: only 1-D and 2-D histograms can be plotted");
    }
    if (!opts.title.empty()) {
        ax->title(opts.title);
    }
}

void plot_histogram(const binning::Histogram& hist, const PlotOptions& opts) {
    auto fig = matplot::figure(true);
    fig->width(opts.width);
    fig->height(opts.height);
    auto ax = fig->current_axes();

    plot_histogram(ax, hist, opts);

    if (!opts.output_file.empty()) {
        save_figure(fig, opts.output_file);
    }
}

void plot_nearest_neighbor_distances(matplot::axes_handle ax,
                                     const Eigen::MatrixXd& data,
                                     const PlotOptions& opts) {
    if (opts.num_bins < 1) {
        throw std::invalid_argument("plot_nearest_neighbor_distances: num_bins must be positive");
    }
    auto rho = eigen_to_vec(estimators::nearest_neighbor_distances(data));

    auto h = ax->hist(rho, static_cast<std::size_t>(opts.num_bins));
    h->face_color({opts.alpha, opts.color[1], opts.color[2], opts.color[3]});
    ax->xlabel("nearest-neighbor distance");
    ax->ylabel("count");
    if (!opts.title.empty()) {
        ax->title(opts.title);
    }
}

void plot_nearest_neighbor_distances(const Eigen::MatrixXd& data, const PlotOptions& opts) {
    auto fig = matplot::figure(true);
    fig->width(opts.width);
    fig->height(opts.height);
    auto ax = fig->current_axes();

    plot_nearest_neighbor_distances(ax, data, opts);

    if (!opts.output_file.empty()) {
        save_figure(fig, opts.output_file);
    }
}

} // namespace infoest::plot_utils
