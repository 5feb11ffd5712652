#pragma once

#include <cstdint>
#include <string>
#include <stdexcept>

namespace libanoimpute {
namespace core {

/**
 * Configuration options for the regression backends
 *
 * One structure configures every solver used for imputation models
 * (OLS, robust linear M-estimation, IRLS-based GLMs and multinomial
 * regression). All options have defaults and can be overridden.
 *
 * Design notes:
 * - All defaults specified in-class
 * - Validate() checks value ranges before any solver runs
 * - Iterative solvers share max_iterations/tolerance
 */
struct RegressionOptions {
	// ========================================================================
	// Common regression options
	// ========================================================================

	/// Include intercept term in regression
	/// Default: true
	bool intercept = true;

	// ========================================================================
	// Computational parameters
	// ========================================================================

	/// Maximum iterations for iterative algorithms (IRLS, Newton-Raphson)
	/// Default: 100
	size_t max_iterations = 100;

	/// Convergence tolerance for iterative algorithms
	/// IRLS/Newton: relative change in deviance
	/// Robust IRLS: relative change in coefficients
	/// Default: 1e-8
	double tolerance = 1e-8;

	/// QR decomposition rank tolerance (-1 = auto, use Eigen default)
	/// Default: -1.0 (auto)
	double qr_tolerance = -1.0;

	// ========================================================================
	// Robust fitting
	// ========================================================================

	/// Huber tuning constant (95% efficiency under normal errors)
	/// Default: 1.345
	double huber_k = 1.345;

	/// Tukey bisquare tuning constant (95% efficiency under normal errors)
	/// Default: 4.685
	double bisquare_c = 4.685;

	/// Maximum iterations for robust reweighting loops
	/// Default: 500
	size_t robust_max_iterations = 500;

	// ========================================================================
	// Constructors
	// ========================================================================

	/// Default constructor with all default values
	RegressionOptions() = default;

	/// Convenience constructor for OLS
	static RegressionOptions OLS(bool intercept_ = true) {
		RegressionOptions opts;
		opts.intercept = intercept_;
		return opts;
	}

	/// Convenience constructor for IRLS-based fits
	static RegressionOptions Iterative(size_t max_iterations_, double tolerance_, bool intercept_ = true) {
		RegressionOptions opts;
		opts.intercept = intercept_;
		opts.max_iterations = max_iterations_;
		opts.tolerance = tolerance_;
		return opts;
	}

	// ========================================================================
	// Validation
	// ========================================================================

	/**
	 * Validate option values
	 *
	 * @throws std::invalid_argument if validation fails
	 */
	void Validate() const {
		if (tolerance <= 0.0) {
			throw std::invalid_argument("tolerance must be positive (got " + std::to_string(tolerance) + ")");
		}

		if (max_iterations == 0) {
			throw std::invalid_argument("max_iterations must be positive");
		}

		if (robust_max_iterations == 0) {
			throw std::invalid_argument("robust_max_iterations must be positive");
		}

		if (huber_k <= 0.0) {
			throw std::invalid_argument("huber_k must be positive (got " + std::to_string(huber_k) + ")");
		}

		if (bisquare_c <= 0.0) {
			throw std::invalid_argument("bisquare_c must be positive (got " + std::to_string(bisquare_c) + ")");
		}
	}
};

} // namespace core
} // namespace libanoimpute
