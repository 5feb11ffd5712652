#pragma once

#include <Eigen/Dense>
#include <vector>
#include <cstdint>
#include <cmath>
#include <limits>

namespace libanoimpute {
namespace core {

/**
 * Result of a fit with a single linear predictor
 *
 * Shared by OLS, WLS, robust linear regression and the IRLS-based GLM
 * solvers. Layout follows R's lm()/glm(): when an intercept is fitted it
 * sits at coefficients[0] and is never aliased.
 *
 * Design notes:
 * - Aliased (rank-deficient) coefficients are NaN and flagged in is_aliased
 * - GLM-only fields (deviance, iterations) stay NaN/0 for linear fits
 * - Robust-only fields (weights, scale) stay empty/NaN for ordinary fits
 */
struct RegressionResult {
	// ========================================================================
	// Core regression outputs
	// ========================================================================

	/// Estimated coefficients (length = n_params, intercept first if fitted)
	Eigen::VectorXd coefficients;

	/// Intercept term, duplicated from coefficients[0] when has_intercept
	double intercept = 0.0;

	/// Flag indicating if intercept was fitted
	bool has_intercept = false;

	/// Residuals on the response scale: y - fitted (length = n_obs)
	Eigen::VectorXd residuals;

	/// Fitted values on the response scale (length = n_obs)
	Eigen::VectorXd fitted_values;

	// ========================================================================
	// Rank and aliasing information
	// ========================================================================

	/// Rank of the model (includes intercept)
	size_t rank;

	/// Number of parameters (features + intercept)
	size_t n_params;

	/// Number of observations
	size_t n_obs;

	/// True if coefficient is aliased (set to NaN), false if estimated
	std::vector<bool> is_aliased;

	// ========================================================================
	// Fit quality statistics
	// ========================================================================

	/// Coefficient of determination: 1 - SSE/SST
	double r_squared = std::numeric_limits<double>::quiet_NaN();

	// ========================================================================
	// Iterative fits (IRLS / robust reweighting)
	// ========================================================================

	/// Residual deviance (GLM)
	double deviance = std::numeric_limits<double>::quiet_NaN();

	/// Deviance of the intercept-only model (GLM)
	double null_deviance = std::numeric_limits<double>::quiet_NaN();

	/// Iterations used by the outer loop (0 for closed-form fits)
	size_t iterations = 0;

	/// Whether the iterative loop met its tolerance
	bool converged = true;

	/// Final robustness weights (length = n_obs, empty for non-robust fits)
	Eigen::VectorXd robust_weights;

	/// Robust residual scale estimate
	double scale = std::numeric_limits<double>::quiet_NaN();

	// ========================================================================
	// Degrees of freedom
	// ========================================================================

	size_t df_residual() const {
		if (n_obs <= rank) return 0;
		return n_obs - rank;
	}

	// ========================================================================
	// Constructors
	// ========================================================================

	RegressionResult()
		: rank(0), n_params(0), n_obs(0) {}

	RegressionResult(size_t n_obs_, size_t n_params_, size_t rank_)
		: rank(rank_), n_params(n_params_), n_obs(n_obs_) {
		coefficients = Eigen::VectorXd::Constant(static_cast<Eigen::Index>(n_params_),
		                                         std::numeric_limits<double>::quiet_NaN());
		residuals = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(n_obs_));
		fitted_values = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(n_obs_));
		is_aliased.resize(n_params_, true);
	}

	// ========================================================================
	// Utility methods
	// ========================================================================

	/**
	 * Linear predictor for new rows
	 *
	 * Aliased coefficients contribute nothing, matching predict.lm() on a
	 * rank-deficient fit.
	 *
	 * @param X Feature matrix (m × p, without intercept column)
	 * @return Linear predictor (length m)
	 */
	Eigen::VectorXd LinearPredictor(const Eigen::MatrixXd &X) const {
		const size_t offset = has_intercept ? 1 : 0;
		Eigen::VectorXd eta = Eigen::VectorXd::Constant(X.rows(), has_intercept ? coefficients[0] : 0.0);
		for (Eigen::Index j = 0; j < X.cols(); j++) {
			const size_t coef_idx = static_cast<size_t>(j) + offset;
			if (coef_idx >= n_params || is_aliased[coef_idx]) {
				continue;
			}
			eta += coefficients[static_cast<Eigen::Index>(coef_idx)] * X.col(j);
		}
		return eta;
	}
};

/**
 * Result of a multinomial (softmax) fit
 *
 * Baseline-category parameterisation: class 0 has all-zero coefficients,
 * row k-1 of coefficients holds class k against the baseline.
 */
struct MultinomialResult {
	/// Coefficients ((n_classes - 1) × n_params, intercept in column 0 if fitted)
	Eigen::MatrixXd coefficients;

	bool has_intercept = true;

	/// Number of response classes modelled
	size_t n_classes = 0;

	size_t n_params = 0;

	size_t n_obs = 0;

	/// Residual deviance: -2 * log-likelihood
	double deviance = std::numeric_limits<double>::quiet_NaN();

	size_t iterations = 0;

	bool converged = false;

	/**
	 * Class probabilities for new rows
	 *
	 * @param X Feature matrix (m × p, without intercept column)
	 * @return m × n_classes matrix, rows sum to one
	 */
	Eigen::MatrixXd Probabilities(const Eigen::MatrixXd &X) const {
		Eigen::MatrixXd design(X.rows(), static_cast<Eigen::Index>(n_params));
		if (has_intercept) {
			design.col(0).setOnes();
			design.rightCols(X.cols()) = X;
		} else {
			design = X;
		}
		return Softmax(design, coefficients);
	}

	/**
	 * Baseline-category softmax
	 *
	 * @param design m × q matrix, intercept column included when fitted
	 * @param coefficients (K-1) × q, class 0 is the baseline
	 * @return m × K probabilities
	 */
	static Eigen::MatrixXd Softmax(const Eigen::MatrixXd &design, const Eigen::MatrixXd &coefficients) {
		const Eigen::Index m = design.rows();
		const Eigen::Index k = coefficients.rows() + 1;

		Eigen::MatrixXd eta = Eigen::MatrixXd::Zero(m, k);
		eta.rightCols(k - 1) = design * coefficients.transpose();

		Eigen::MatrixXd probs(m, k);
		for (Eigen::Index i = 0; i < m; i++) {
			const Eigen::RowVectorXd e = (eta.row(i).array() - eta.row(i).maxCoeff()).exp();
			probs.row(i) = e / e.sum();
		}
		return probs;
	}
};

} // namespace core
} // namespace libanoimpute
