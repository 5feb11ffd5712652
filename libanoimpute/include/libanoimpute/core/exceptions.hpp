#pragma once

#include <stdexcept>
#include <string>

namespace libanoimpute {
namespace core {

/**
 * Malformed or unresolvable imputation formula
 *
 * Raised before any model is fitted.
 */
class InvalidFormulaException : public std::invalid_argument {
public:
	explicit InvalidFormulaException(const std::string &message)
	    : std::invalid_argument("Invalid formula: " + message) {
	}
};

/**
 * Family argument invalid, or invalid for the target it is applied to
 * (e.g. robust fitting of a multi-level categorical target)
 */
class UnsupportedFamilyException : public std::invalid_argument {
public:
	explicit UnsupportedFamilyException(const std::string &message)
	    : std::invalid_argument("Unsupported family: " + message) {
	}
};

/**
 * Underlying model fit or prediction failed (no usable rows, singular
 * design, non-convergence, non-finite output)
 */
class ModelFitException : public std::runtime_error {
public:
	explicit ModelFitException(const std::string &message) : std::runtime_error("Model fit failed: " + message) {
	}
};

} // namespace core
} // namespace libanoimpute
