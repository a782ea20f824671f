#include "infoest/estimators/method.hpp"
#include "infoest/core/errors.hpp"

namespace infoest::estimators {

std::string to_string(Method method) {
    switch (method) {
        case Method::NearestNeighbors: return "nearest-neighbors";
        case Method::Gaussian:         return "gaussian";
        case Method::Bin:              return "bin";
    }
    throw core::UnsupportedMethod("to_string: unknown method value "
                                  + std::to_string(static_cast<int>(method)));
}

Method parse_method(std::string_view name) {
    if (name == "nearest-neighbors") return Method::NearestNeighbors;
    if (name == "gaussian") return Method::Gaussian;
    if (name == "bin") return Method::Bin;
    throw core::UnsupportedMethod("Unsupported entropy method '" + std::string(name)
                                  + "' (expected nearest-neighbors, gaussian or bin)");
}

bool requires_samples(Method method) {
    switch (method) {
        case Method::NearestNeighbors:
        case Method::Gaussian:
            return true;
        case Method::Bin:
            return false;
    }
    throw core::UnsupportedMethod("requires_samples: unknown method value "
                                  + std::to_string(static_cast<int>(method)));
}

} // namespace infoest::estimators
