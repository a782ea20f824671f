#pragma once

#include <array>
#include <string>
#include <matplot/matplot.h>

namespace infoest::plot_utils {

/// ARGB color (each component in [0, 1]).  matplot++ uses Alpha/Red/Green/Blue
/// where Alpha=0 is opaque and Alpha=1 is fully transparent.
using Color = std::array<float, 4>;

/// Options controlling plot appearance and output.
struct PlotOptions {
    std::string output_file;          ///< If non-empty, save figure to this path
    std::string title;                ///< Axes title (empty for none)
    Color color = {0.0f, 0.0f, 0.4470f, 0.7410f};   ///< Default MATLAB blue (ARGB)
    float alpha = 0.0f;               ///< Bar transparency
    int num_bins = 30;                ///< Bins for histograms of raw values (distances)
    int width = 800;                  ///< Figure width in pixels
    int height = 600;                 ///< Figure height in pixels
};

/// Save a figure to file by explicitly setting gnuplot terminal and output.
/// Creates the parent directory and waits for gnuplot to finish writing.
void save_figure(matplot::figure_handle fig, const std::string& filename);

} // namespace infoest::plot_utils
