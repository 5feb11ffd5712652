#pragma once

#include "libanoimpute/core/family.hpp"
#include "libanoimpute/core/regression_options.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace libanoimpute {
namespace imputation {

/// What happens to the progress output of multinomial fits
enum class FitTrace {
	DISCARD, ///< Captured and dropped
	SURFACE  ///< Forwarded to the log at INFO
};

/**
 * Options structure for regression imputation
 *
 * All options have defaults matching the usual call
 * regressionImp(formula, data) and can be overridden from key/value text.
 */
struct ImputationOptions {
	/// AUTO or an explicit GLM family
	core::FamilySelector family = core::AutoFamily {};

	/// Outlier-resistant fitting
	bool robust = false;

	/// Maintain "<target>_<imp_suffix>" status columns
	bool imp_var = true;

	std::string imp_suffix = "imp";

	/// Categorical targets take the most likely level instead of a random draw
	bool mod_cat = false;

	FitTrace fit_trace = FitTrace::DISCARD;

	/// Solver settings passed to the backend
	core::RegressionOptions regression;

	/// Seed for the overloads that create their own random engine
	std::optional<uint64_t> seed;

	/**
	 * Parse options from key/value text
	 *
	 * Keys (case-insensitive): family, robust, imp_var, imp_suffix, mod_cat,
	 * fit_trace, intercept, max_iterations, tolerance, qr_tolerance,
	 * huber_k, bisquare_c, robust_max_iterations, seed.
	 * Booleans accept true/false, 1/0, yes/no, TRUE/T/FALSE/F.
	 *
	 * @throws std::invalid_argument on unknown keys or unparsable values
	 * @throws core::UnsupportedFamilyException on an unknown family
	 */
	static ImputationOptions ParseFromMap(const std::map<std::string, std::string> &options_map);

	/**
	 * Check value ranges
	 *
	 * @throws std::invalid_argument if validation fails
	 */
	void Validate() const;

	static ImputationOptions Defaults() {
		return ImputationOptions();
	}
};

} // namespace imputation
} // namespace libanoimpute
