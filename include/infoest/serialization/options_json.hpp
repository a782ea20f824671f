#pragma once

#include <nlohmann/json.hpp>

#include "infoest/binning/bin_spec.hpp"
#include "infoest/core/errors.hpp"
#include "infoest/estimators/estimator_options.hpp"
#include "infoest/estimators/method.hpp"

#include <string>
#include <vector>

namespace infoest::serialization {

using json = nlohmann::json;

// ============================================================
// Bin specification
// ============================================================

/// One entry per axis: an integer bin count or an array of edges.
/// e.g. [8, [0.0, 0.25, 0.5, 1.0]]
inline json bin_spec_to_json(const binning::BinSpec& bins) {
    json arr = json::array();
    for (const auto& axis : bins) {
        if (const int* count = std::get_if<int>(&axis)) {
            arr.push_back(*count);
        } else {
            arr.push_back(std::get<std::vector<double>>(axis));
        }
    }
    return arr;
}

inline binning::BinSpec bin_spec_from_json(const json& j) {
    if (!j.is_array()) {
        throw core::InvalidArgument("bin_spec_from_json: expected an array of axes");
    }
    binning::BinSpec bins;
    bins.reserve(j.size());
    for (const auto& axis : j) {
        if (axis.is_number_integer()) {
            bins.emplace_back(axis.get<int>());
        } else if (axis.is_array()) {
            bins.emplace_back(axis.get<std::vector<double>>());
        } else {
            throw core::InvalidArgument("bin_spec_from_json: axis must be a bin count or an edge array, got "
                                        + axis.dump());
        }
    }
    return bins;
}

// ============================================================
// EstimatorOptions
// ============================================================

inline json to_json(const estimators::EstimatorOptions& opts) {
    json j;
    j["method"] = estimators::to_string(opts.method);
    j["prob_tolerance"] = opts.prob_tolerance;
    j["histogram_tolerance"] = opts.histogram_tolerance;
    return j;
}

/// Missing keys keep their defaults. Unknown method names throw UnsupportedMethod.
inline estimators::EstimatorOptions options_from_json(const json& j) {
    estimators::EstimatorOptions opts;
    if (j.contains("method")) {
        opts.method = estimators::parse_method(j["method"].get<std::string>());
    }
    if (j.contains("prob_tolerance")) {
        opts.prob_tolerance = j["prob_tolerance"].get<double>();
    }
    if (j.contains("histogram_tolerance")) {
        opts.histogram_tolerance = j["histogram_tolerance"].get<double>();
    }
    return opts;
}

} // namespace infoest::serialization
