#include "infoest/binning/histogram.hpp"
#include "infoest/core/errors.hpp"
#include "infoest/core/sample_matrix.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>

namespace infoest::binning {

namespace {

Eigen::VectorXd equal_width_edges(const Eigen::VectorXd& column, int num_bins, int dim) {
    if (num_bins < 1) {
        throw core::InvalidArgument("histogram_dd: bin count for dimension " + std::to_string(dim)
                                    + " must be positive, got " + std::to_string(num_bins));
    }
    double lo = column.minCoeff();
    double hi = column.maxCoeff();
    if (!std::isfinite(lo) || !std::isfinite(hi)) {
        throw core::InvalidArgument("histogram_dd: dimension " + std::to_string(dim)
                                    + " contains non-finite samples");
    }
    if (lo == hi) {
        lo -= 0.5;
        hi += 0.5;
    }
    return Eigen::VectorXd::LinSpaced(num_bins + 1, lo, hi);
}

Eigen::VectorXd explicit_edges(const std::vector<double>& edges, int dim) {
    if (edges.size() < 2) {
        throw core::InvalidArgument("histogram_dd: dimension " + std::to_string(dim)
                                    + " needs at least two bin edges");
    }
    for (std::size_t i = 1; i < edges.size(); ++i) {
        if (!(edges[i] > edges[i - 1])) {
            throw core::InvalidArgument("histogram_dd: bin edges for dimension " + std::to_string(dim)
                                        + " must be strictly increasing");
        }
    }
    return Eigen::Map<const Eigen::VectorXd>(edges.data(), static_cast<Eigen::Index>(edges.size()));
}

/// Bin index of x along one axis, or -1 if outside the edges.
int locate(const Eigen::VectorXd& edges, double x) {
    const double* first = edges.data();
    const double* last = edges.data() + edges.size();
    if (!(x >= *first) || !(x <= *(last - 1))) return -1;
    const int nbins = static_cast<int>(edges.size()) - 1;
    if (x == *(last - 1)) return nbins - 1;
    return static_cast<int>(std::upper_bound(first, last, x) - first) - 1;
}

} // anonymous namespace

Eigen::Index Histogram::flat_index(const std::vector<int>& index) const {
    Eigen::Index flat = 0;
    for (std::size_t d = 0; d < shape.size(); ++d) {
        flat = flat * shape[d] + index[d];
    }
    return flat;
}

std::vector<Eigen::VectorXd> resolve_edges(const Eigen::MatrixXd& data, const BinSpec& bins) {
    if (static_cast<Eigen::Index>(bins.size()) != data.cols()) {
        std::ostringstream msg;
        msg << "Data dimensionality is " << data.cols() << " but bins were specified for "
            << bins.size() << " dimensions";
        throw core::DimensionMismatch(msg.str());
    }

    std::vector<Eigen::VectorXd> edges;
    edges.reserve(bins.size());
    for (std::size_t d = 0; d < bins.size(); ++d) {
        const int dim = static_cast<int>(d);
        if (const int* count = std::get_if<int>(&bins[d])) {
            edges.push_back(equal_width_edges(data.col(dim), *count, dim));
        } else {
            edges.push_back(explicit_edges(std::get<std::vector<double>>(bins[d]), dim));
        }
    }
    return edges;
}

Histogram histogram_dd(const Eigen::MatrixXd& data, const BinSpec& bins) {
    const Eigen::MatrixXd X = core::as_sample_matrix(data);

    Histogram hist;
    hist.edges = resolve_edges(X, bins);
    Eigen::Index total_bins = 1;
    for (const auto& e : hist.edges) {
        hist.shape.push_back(static_cast<int>(e.size()) - 1);
        total_bins *= e.size() - 1;
    }
    hist.counts = Eigen::VectorXd::Zero(total_bins);

    std::vector<int> index(hist.shape.size());
    for (Eigen::Index i = 0; i < X.rows(); ++i) {
        bool inside = true;
        for (std::size_t d = 0; d < index.size(); ++d) {
            index[d] = locate(hist.edges[d], X(i, static_cast<Eigen::Index>(d)));
            if (index[d] < 0) {
                inside = false;
                break;
            }
        }
        if (inside) {
            hist.counts(hist.flat_index(index)) += 1.0;
        }
    }

    const double counted = hist.counts.sum();
    if (counted > 0.0) {
        hist.probabilities = hist.counts / counted;
    } else {
        hist.probabilities = Eigen::VectorXd::Zero(total_bins);
    }
    return hist;
}

Eigen::VectorXd symbols_to_prob(const Eigen::MatrixXd& data, const BinSpec& bins, double tol) {
    Histogram hist = histogram_dd(data, bins);
    const double mass = hist.probabilities.sum();
    if (std::abs(mass - 1.0) > tol) {
        std::ostringstream msg;
        msg << "Probabilities should sum to 1, but actually sum to " << mass
            << " (" << hist.total() << " of " << data.rows() << " samples inside the bins)";
        throw core::NormalizationError(msg.str());
    }
    return hist.probabilities;
}

Eigen::VectorXd symbols_to_prob(const Eigen::VectorXd& data, const BinSpec& bins, double tol) {
    return symbols_to_prob(core::as_sample_matrix(data), bins, tol);
}

} // namespace infoest::binning
