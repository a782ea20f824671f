#include "infoest/estimators/entropy.hpp"
#include "infoest/binning/histogram.hpp"
#include "infoest/core/errors.hpp"
#include "infoest/core/sample_matrix.hpp"
#include <cmath>
#include <limits>
#include <numbers>
#include <sstream>

namespace infoest::estimators {

namespace {

void check_distribution(const Eigen::VectorXd& prob, double error_val) {
    for (Eigen::Index i = 0; i < prob.size(); ++i) {
        if (!std::isfinite(prob(i)) || prob(i) < 0.0) {
            std::ostringstream msg;
            msg << "entropy: 'prob' must hold non-negative finite reals, entry " << i
                << " is " << prob(i);
            throw core::TypeMismatch(msg.str());
        }
    }
    const double mass = prob.sum();
    if (std::abs(mass - 1.0) > error_val) {
        std::ostringstream msg;
        msg << "entropy: 'prob' should sum to 1, but sums to " << mass
            << " (tolerance " << error_val << ")";
        throw core::ProbabilityNormalizationError(msg.str());
    }
}

} // anonymous namespace

Eigen::VectorXd nearest_neighbor_distances(const Eigen::MatrixXd& data) {
    const Eigen::MatrixXd X = core::as_sample_matrix(data);
    const Eigen::Index n = X.rows();

    // O(N^2) memory: full pairwise distance matrix
    Eigen::MatrixXd dist(n, n);
    for (Eigen::Index i = 0; i < n; ++i) {
        dist(i, i) = 0.0;
        for (Eigen::Index j = i + 1; j < n; ++j) {
            const double d = (X.row(i) - X.row(j)).norm();
            dist(i, j) = d;
            dist(j, i) = d;
        }
    }

    // Push self-distances up to the largest distance so the row minimum
    // picks a distinct neighbor.
    dist.diagonal().setConstant(dist.maxCoeff());
    return dist.colwise().minCoeff().transpose();
}

double nearest_neighbor_entropy(const Eigen::MatrixXd& data) {
    const Eigen::MatrixXd X = core::as_sample_matrix(data);
    if (X.rows() < 2) {
        throw core::InvalidArgument("nearest_neighbor_entropy: at least two samples are required, got "
                                    + std::to_string(X.rows()));
    }

    const double n = static_cast<double>(X.rows());
    const double k = static_cast<double>(X.cols());
    const double Ak = k * std::pow(std::numbers::pi, k / 2.0) / std::tgamma(k / 2.0 + 1.0);

    const Eigen::VectorXd rho = nearest_neighbor_distances(X);
    const double mean_log_rho = rho.array().log().mean() * std::numbers::log2e;

    return k * mean_log_rho + std::log2(n * Ak / k) + std::numbers::log2e * std::numbers::egamma;
}

double gaussian_entropy(const Eigen::MatrixXd& data) {
    const Eigen::MatrixXd X = core::as_sample_matrix(data);
    const double d = static_cast<double>(X.cols());

    // Uncentered, unscaled scatter matrix
    const Eigen::MatrixXd scatter = X.transpose() * X;
    // Singular only when the determinant is exactly zero (or negative from roundoff)
    const double det = Eigen::FullPivLU<Eigen::MatrixXd>(scatter).determinant();
    if (det <= 0.0) {
        return -std::numeric_limits<double>::infinity();
    }
    return 0.5 * (d * std::log(2.0 * std::numbers::pi * std::numbers::e) + std::log(det));
}

double discrete_entropy(const Eigen::VectorXd& prob) {
    double sum = 0.0;
    for (Eigen::Index i = 0; i < prob.size(); ++i) {
        const double p = prob(i);
        if (p > 0.0) {
            sum += p * std::log2(p);
        }
    }
    return -sum;
}

double entropy_from_samples(const Eigen::MatrixXd& data,
                            Method method,
                            const std::optional<binning::BinSpec>& bins,
                            double histogram_tol) {
    const Eigen::MatrixXd X = core::as_sample_matrix(data);

    switch (method) {
        case Method::NearestNeighbors:
            return nearest_neighbor_entropy(X);
        case Method::Gaussian:
            return gaussian_entropy(X);
        case Method::Bin:
            if (!bins) {
                throw core::InvalidArgument("entropy: the bin method needs either 'prob' or 'bins'");
            }
            return discrete_entropy(binning::symbols_to_prob(X, *bins, histogram_tol));
    }
    throw core::UnsupportedMethod("entropy: unknown method value "
                                  + std::to_string(static_cast<int>(method)));
}

double entropy_from_samples(const Eigen::VectorXd& data,
                            Method method,
                            const std::optional<binning::BinSpec>& bins,
                            double histogram_tol) {
    return entropy_from_samples(core::as_sample_matrix(data), method, bins, histogram_tol);
}

double entropy_from_samples(const Eigen::MatrixXd& data,
                            const EstimatorOptions& opts,
                            const std::optional<binning::BinSpec>& bins) {
    return entropy_from_samples(data, opts.method, bins, opts.histogram_tolerance);
}

double entropy_from_distribution(const Eigen::VectorXd& prob, Method method, double error_val) {
    check_distribution(prob, error_val);

    if (requires_samples(method)) {
        throw core::MissingData("entropy: method '" + to_string(method)
                                + "' requires the original samples, not a distribution");
    }
    return discrete_entropy(prob);
}

double entropy_from_distribution(const Eigen::VectorXd& prob, const EstimatorOptions& opts) {
    return entropy_from_distribution(prob, opts.method, opts.prob_tolerance);
}

double entropy(const EntropyRequest& request) {
    if (!request.data && !request.prob) {
        throw core::InvalidArgument("entropy requires either 'prob' or 'data' to be defined");
    }
    if (request.data && request.prob) {
        throw core::InvalidArgument("entropy requires only 'prob' or 'data' to be given but not both");
    }
    if (request.prob) {
        return entropy_from_distribution(*request.prob, request.method, request.error_val);
    }
    return entropy_from_samples(*request.data, request.method, request.bins);
}

} // namespace infoest::estimators
