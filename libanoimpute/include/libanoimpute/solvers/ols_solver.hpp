#pragma once

#include "libanoimpute/core/exceptions.hpp"
#include "libanoimpute/core/regression_result.hpp"
#include "libanoimpute/core/regression_options.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <vector>
#include <limits>
#include <cmath>

namespace libanoimpute {
namespace solvers {

/**
 * Least squares for the linear imputation model
 *
 * Rank-revealing QR with column pivoting. Columns that are constant or
 * collinear with earlier pivots get a NaN coefficient and are skipped by
 * Predict(), the way lm() reports aliased terms.
 *
 *   1. center X and y when an intercept is requested
 *   2. X*P = Q*R, rank from the R diagonal against qr_tolerance
 *   3. solve R_r * beta_r = (Q'y)_r and scatter back through P
 *   4. intercept = mean(y) - mean(X)'beta
 *
 * WLS, the robust solver and GLM IRLS all call Fit() on transformed data.
 */
class OLSSolver {
public:
	/**
	 * Fit y on X
	 *
	 * @param y Response vector (length n)
	 * @param X Design matrix (n × p), without intercept column
	 * @param options Regression options (intercept, qr_tolerance)
	 * @return RegressionResult with coefficients (NaN for aliased)
	 * @throws core::ModelFitException if there are no observations
	 */
	static core::RegressionResult Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
	                                   const core::RegressionOptions &options = core::RegressionOptions::OLS());

	/**
	 * Point predictions for new rows
	 *
	 * @param result Fitted model
	 * @param X New design matrix (m × p), same column layout as the fit
	 * @return Predictions (length m)
	 */
	static Eigen::VectorXd Predict(const core::RegressionResult &result, const Eigen::MatrixXd &X);

private:
	/// R² = 1 - SSE/SST, clamped to [0, 1]
	static double RSquared(const Eigen::VectorXd &y, const Eigen::VectorXd &residuals);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline core::RegressionResult OLSSolver::Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
                                              const core::RegressionOptions &options) {
	const size_t n = static_cast<size_t>(X.rows());
	const size_t p_user = static_cast<size_t>(X.cols());

	options.Validate();

	if (n == 0) {
		throw core::ModelFitException("0 (non-NA) cases");
	}
	if (static_cast<size_t>(y.size()) != n) {
		throw std::invalid_argument("Response length " + std::to_string(y.size()) + " does not match " +
		                            std::to_string(n) + " design rows");
	}

	// Handle intercept by centering data, NOT by augmenting design matrix,
	// so the intercept is never marked as aliased (matches R's lm())
	Eigen::MatrixXd X_work;
	Eigen::VectorXd y_work;
	Eigen::VectorXd x_means;
	double y_mean = 0.0;

	if (options.intercept) {
		y_mean = y.mean();
		x_means = X.colwise().mean();

		y_work = y.array() - y_mean;
		X_work.resize(static_cast<Eigen::Index>(n), static_cast<Eigen::Index>(p_user));
		for (size_t j = 0; j < p_user; j++) {
			auto j_idx = static_cast<Eigen::Index>(j);
			X_work.col(j_idx) = X.col(j_idx).array() - x_means(j_idx);
		}
	} else {
		X_work = X;
		y_work = y;
		x_means = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(p_user));
	}

	const size_t coef_offset = options.intercept ? 1 : 0;
	core::RegressionResult result(n, p_user + coef_offset, 0);

	size_t feature_rank = 0;
	Eigen::VectorXd coef_reduced;
	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr;

	if (p_user > 0) {
		qr.compute(X_work);
		if (options.qr_tolerance > 0.0) {
			qr.setThreshold(options.qr_tolerance);
		}
		feature_rank = static_cast<size_t>(qr.rank());

		if (feature_rank > 0) {
			Eigen::VectorXd QtY = qr.householderQ().transpose() * y_work;
			Eigen::MatrixXd R_reduced = qr.matrixQR().topLeftCorner(static_cast<Eigen::Index>(feature_rank),
			                                                        static_cast<Eigen::Index>(feature_rank));
			coef_reduced =
			    R_reduced.triangularView<Eigen::Upper>().solve(QtY.head(static_cast<Eigen::Index>(feature_rank)));
		}
	}

	result.rank = feature_rank + coef_offset;

	// Assign feature coefficients back in original column order
	for (size_t i = 0; i < feature_rank; i++) {
		auto i_idx = static_cast<Eigen::Index>(i);
		size_t original_idx = static_cast<size_t>(qr.colsPermutation().indices()[i_idx]);

		result.coefficients[static_cast<Eigen::Index>(original_idx + coef_offset)] = coef_reduced[i_idx];
		result.is_aliased[original_idx + coef_offset] = false;
	}

	// Intercept = mean(y) - sum(coef[j] * mean(x[j])) over non-aliased features
	if (options.intercept) {
		double intercept = y_mean;
		for (size_t j = 0; j < p_user; j++) {
			if (!result.is_aliased[j + 1]) {
				intercept -= result.coefficients[static_cast<Eigen::Index>(j + 1)] * x_means(static_cast<Eigen::Index>(j));
			}
		}
		result.coefficients[0] = intercept;
		result.is_aliased[0] = false;
		result.intercept = intercept;
		result.has_intercept = true;
	}

	result.fitted_values = result.LinearPredictor(X);
	result.residuals = y - result.fitted_values;

	result.r_squared = RSquared(y, result.residuals);

	return result;
}

inline Eigen::VectorXd OLSSolver::Predict(const core::RegressionResult &result, const Eigen::MatrixXd &X) {
	const size_t offset = result.has_intercept ? 1 : 0;
	if (static_cast<size_t>(X.cols()) + offset != result.n_params) {
		throw std::invalid_argument("Prediction matrix has " + std::to_string(X.cols()) + " columns, model expects " +
		                            std::to_string(result.n_params - offset));
	}
	return result.LinearPredictor(X);
}

inline double OLSSolver::RSquared(const Eigen::VectorXd &y, const Eigen::VectorXd &residuals) {
	const double ss_res = residuals.squaredNorm();
	const double ss_tot = (y.array() - y.mean()).square().sum();
	if (ss_tot <= 1e-10) {
		return 0.0;
	}
	// Rank-deficient fits can round slightly outside [0, 1]
	return std::min(std::max(1.0 - ss_res / ss_tot, 0.0), 1.0);
}

} // namespace solvers
} // namespace libanoimpute
