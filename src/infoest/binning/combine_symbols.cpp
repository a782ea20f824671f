#include "infoest/binning/combine_symbols.hpp"
#include "infoest/core/errors.hpp"
#include "infoest/core/sample_matrix.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <sstream>
#include <string>

namespace infoest::binning {

namespace {

// Largest magnitude at which code +/- 0.5 is still exact in a double
constexpr double kMaxSymbolCode = 4503599627370496.0;   // 2^52

} // anonymous namespace

Eigen::MatrixXd combine_symbols(const std::vector<Eigen::MatrixXd>& sources) {
    if (sources.empty()) {
        throw core::InvalidArgument("combine_symbols: at least one source is required");
    }

    const Eigen::Index n = core::as_sample_matrix(sources.front()).rows();
    Eigen::Index width = 0;
    for (const auto& s : sources) {
        if (core::as_sample_matrix(s).rows() != n) {
            throw core::DimensionMismatch("combine_symbols: every source needs " + std::to_string(n)
                                          + " samples, got " + std::to_string(s.rows()));
        }
        width += s.cols();
    }

    std::map<std::vector<double>, int> codes;
    Eigen::MatrixXd joint(n, 1);
    std::vector<double> key(static_cast<std::size_t>(width));
    for (Eigen::Index i = 0; i < n; ++i) {
        std::size_t k = 0;
        for (const auto& s : sources) {
            for (Eigen::Index j = 0; j < s.cols(); ++j) {
                key[k++] = s(i, j);
            }
        }
        const auto it = codes.emplace(key, static_cast<int>(codes.size())).first;
        joint(i, 0) = static_cast<double>(it->second);
    }
    return joint;
}

BinSpec symbol_bins(const Eigen::MatrixXd& symbols) {
    const Eigen::MatrixXd S = core::as_sample_matrix(symbols);

    BinSpec bins;
    bins.reserve(static_cast<std::size_t>(S.cols()));
    for (Eigen::Index j = 0; j < S.cols(); ++j) {
        // Edges at code +/- 0.5 for every distinct code; gaps between sparse
        // codes become empty bins.
        std::vector<double> edges;
        edges.reserve(static_cast<std::size_t>(2 * S.rows()));
        for (Eigen::Index i = 0; i < S.rows(); ++i) {
            const double code = S(i, j);
            if (!std::isfinite(code) || code != std::floor(code) || std::abs(code) > kMaxSymbolCode) {
                std::ostringstream msg;
                msg << "symbol_bins: symbols must be integer codes with magnitude <= "
                    << kMaxSymbolCode << ", got " << code;
                throw core::InvalidArgument(msg.str());
            }
            edges.push_back(code - 0.5);
            edges.push_back(code + 0.5);
        }
        std::sort(edges.begin(), edges.end());
        edges.erase(std::unique(edges.begin(), edges.end()), edges.end());
        bins.emplace_back(std::move(edges));
    }
    return bins;
}

} // namespace infoest::binning
