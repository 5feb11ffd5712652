#pragma once

#include "libanoimpute/core/regression_result.hpp"
#include "libanoimpute/core/regression_options.hpp"
#include "libanoimpute/solvers/ols_solver.hpp"
#include <Eigen/Dense>
#include <vector>
#include <limits>
#include <cmath>

namespace libanoimpute {
namespace solvers {

/**
 * Weighted Least Squares (WLS) Regression Solver
 *
 * WLS extends OLS by allowing different weights for observations:
 *   minimize: Σ w_i * (y_i - x_i'β)²
 *
 * This is the inner step of every reweighting loop in the library:
 * IRLS for GLMs (working weights) and robust M-estimation (psi weights).
 * Zero weights are allowed and drop an observation from the fit, which
 * the bisquare loop relies on for gross outliers.
 *
 * Algorithm: Transform to weighted OLS
 * 1. Center X and y at their weighted means when an intercept is requested
 * 2. Transform: X_weighted = sqrt(W) * X, y_weighted = sqrt(W) * y
 * 3. Solve OLS (no intercept) on weighted matrices using rank-deficient solver
 * 4. Recover the intercept from the weighted means
 *
 * Design notes:
 * - Header-only
 * - Leverages OLSSolver for actual solving
 * - Stateless design (all methods are static)
 */
class WLSSolver {
public:
	/**
	 * Fit Weighted Least Squares regression
	 *
	 * @param y Response vector (length n)
	 * @param X Design matrix (n × p)
	 * @param weights Weight vector (length n), all weights >= 0, sum > 0
	 * @param options Regression options (intercept, tolerance, etc.)
	 * @return RegressionResult with coefficients; residuals are unweighted
	 */
	static core::RegressionResult Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
	                                   const Eigen::VectorXd &weights,
	                                   const core::RegressionOptions &options = core::RegressionOptions::OLS());
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline core::RegressionResult WLSSolver::Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
                                               const Eigen::VectorXd &weights,
                                               const core::RegressionOptions &options) {
	const size_t n = static_cast<size_t>(X.rows());
	const size_t p = static_cast<size_t>(X.cols());

	options.Validate();

	if (static_cast<size_t>(weights.size()) != n) {
		throw std::invalid_argument("Weights vector must have same length as y");
	}

	for (size_t i = 0; i < n; i++) {
		auto i_idx = static_cast<Eigen::Index>(i);
		if (!(weights(i_idx) >= 0.0) || !std::isfinite(weights(i_idx))) {
			throw std::invalid_argument("All weights must be finite and non-negative");
		}
	}

	const double sum_weights = weights.sum();
	if (!(sum_weights > 0.0)) {
		throw core::ModelFitException("all observation weights are zero");
	}

	Eigen::VectorXd sqrt_w = weights.array().sqrt();

	double y_weighted_mean = 0.0;
	Eigen::VectorXd x_weighted_means = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(p));

	Eigen::MatrixXd X_work = X;
	Eigen::VectorXd y_work = y;

	if (options.intercept) {
		y_weighted_mean = (weights.array() * y.array()).sum() / sum_weights;
		for (size_t j = 0; j < p; j++) {
			auto j_idx = static_cast<Eigen::Index>(j);
			x_weighted_means(j_idx) = (weights.array() * X.col(j_idx).array()).sum() / sum_weights;
			X_work.col(j_idx) = X.col(j_idx).array() - x_weighted_means(j_idx);
		}
		y_work = y.array() - y_weighted_mean;
	}

	// Apply sqrt(W) transformation to centered (or uncentered) data
	Eigen::MatrixXd X_weighted = sqrt_w.asDiagonal() * X_work;
	Eigen::VectorXd y_weighted = sqrt_w.asDiagonal() * y_work;

	core::RegressionOptions inner = options;
	inner.intercept = false;
	core::RegressionResult weighted = OLSSolver::Fit(y_weighted, X_weighted, inner);

	const size_t coef_offset = options.intercept ? 1 : 0;
	core::RegressionResult result(n, p + coef_offset, weighted.rank + coef_offset);

	for (size_t j = 0; j < p; j++) {
		result.coefficients[static_cast<Eigen::Index>(j + coef_offset)] = weighted.coefficients[static_cast<Eigen::Index>(j)];
		result.is_aliased[j + coef_offset] = weighted.is_aliased[j];
	}

	if (options.intercept) {
		double intercept = y_weighted_mean;
		for (size_t j = 0; j < p; j++) {
			if (!result.is_aliased[j + 1]) {
				intercept -= result.coefficients[static_cast<Eigen::Index>(j + 1)] * x_weighted_means(static_cast<Eigen::Index>(j));
			}
		}
		result.coefficients[0] = intercept;
		result.is_aliased[0] = false;
		result.intercept = intercept;
		result.has_intercept = true;
	}

	result.fitted_values = result.LinearPredictor(X);
	result.residuals = y - result.fitted_values;

	// Weighted R²
	const double ss_res = (weights.array() * result.residuals.array().square()).sum();
	const double y_mean_w = (weights.array() * y.array()).sum() / sum_weights;
	const double ss_tot = (weights.array() * (y.array() - y_mean_w).square()).sum();
	result.r_squared = (ss_tot > 1e-10) ? std::min(std::max(1.0 - ss_res / ss_tot, 0.0), 1.0) : 0.0;

	return result;
}

} // namespace solvers
} // namespace libanoimpute
