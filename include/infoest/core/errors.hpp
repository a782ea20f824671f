#pragma once

#include <stdexcept>
#include <string>

namespace infoest::core {

/// Bad or inconsistent arguments (both or neither of data/prob, missing bins,
/// malformed bin axes, too few samples).
class InvalidArgument : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Probability entries that are not non-negative finite reals.
class TypeMismatch : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Shapes that do not line up: bin spec length vs data columns,
/// or row counts across sources.
class DimensionMismatch : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// A computed distribution does not sum to 1 within tolerance.
class NormalizationError : public std::domain_error {
public:
    using std::domain_error::domain_error;
};

/// A caller-supplied distribution does not sum to 1 within tolerance.
class ProbabilityNormalizationError : public NormalizationError {
public:
    using NormalizationError::NormalizationError;
};

/// The method needs raw samples but only a distribution was given.
class MissingData : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Unknown estimation method.
class UnsupportedMethod : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace infoest::core
