#pragma once

#include "libanoimpute/core/exceptions.hpp"
#include "libanoimpute/core/regression_result.hpp"
#include "libanoimpute/core/regression_options.hpp"
#include "libanoimpute/solvers/ols_solver.hpp"
#include "libanoimpute/solvers/wls_solver.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <vector>

namespace libanoimpute {
namespace solvers {

/**
 * Robust Linear Regression Solver (M-estimation)
 *
 * Outlier-resistant replacement for OLS, used when robust imputation is
 * requested for a numeric target. Two IRLS stages:
 *
 * 1. Huber stage (k = huber_k), starting from OLS, with the residual scale
 *    re-estimated as the normalized MAD on every iteration
 * 2. Tukey bisquare stage (c = bisquare_c) with the scale frozen at the
 *    Huber estimate, starting from the Huber coefficients
 *
 * The bisquare stage is redescending: gross outliers get weight zero.
 * Starting it from a Huber fit keeps it in the basin of the robust
 * solution rather than the least-squares one.
 *
 * Both stages stop when the largest coefficient change falls below
 * tolerance * (1 + largest coefficient).
 */
class RobustLinearSolver {
public:
	/**
	 * Fit robust linear regression
	 *
	 * @param y Response vector (length n)
	 * @param X Design matrix (n × p)
	 * @param options huber_k, bisquare_c, robust_max_iterations, tolerance
	 * @return RegressionResult with robust_weights and scale filled in
	 * @throws core::ModelFitException if a stage does not converge
	 */
	static core::RegressionResult Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
	                                   const core::RegressionOptions &options = core::RegressionOptions::OLS());

	/// Normalized median absolute deviation about the median
	static double MadScale(const Eigen::VectorXd &residuals);

	static double HuberWeight(double r, double k) {
		const double a = std::abs(r);
		return a <= k ? 1.0 : k / a;
	}

	static double BisquareWeight(double r, double c) {
		const double u = r / c;
		if (std::abs(u) >= 1.0) {
			return 0.0;
		}
		const double t = 1.0 - u * u;
		return t * t;
	}

private:
	static bool CoefficientsConverged(const Eigen::VectorXd &beta, const Eigen::VectorXd &beta_old, double tolerance);

	static Eigen::VectorXd FiniteCoefficients(const core::RegressionResult &result);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline double RobustLinearSolver::MadScale(const Eigen::VectorXd &residuals) {
	const size_t n = static_cast<size_t>(residuals.size());
	if (n == 0) {
		return 0.0;
	}

	std::vector<double> values(residuals.data(), residuals.data() + n);
	auto median_of = [](std::vector<double> &v) {
		const size_t mid = v.size() / 2;
		std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid), v.end());
		double m = v[mid];
		if (v.size() % 2 == 0) {
			m = (m + *std::max_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid))) / 2.0;
		}
		return m;
	};

	const double center = median_of(values);
	for (size_t i = 0; i < n; i++) {
		values[i] = std::abs(residuals(static_cast<Eigen::Index>(i)) - center);
	}
	return 1.482602218505602 * median_of(values);
}

inline Eigen::VectorXd RobustLinearSolver::FiniteCoefficients(const core::RegressionResult &result) {
	Eigen::VectorXd beta = result.coefficients;
	for (Eigen::Index j = 0; j < beta.size(); j++) {
		if (!std::isfinite(beta(j))) {
			beta(j) = 0.0;
		}
	}
	return beta;
}

inline bool RobustLinearSolver::CoefficientsConverged(const Eigen::VectorXd &beta, const Eigen::VectorXd &beta_old,
                                                      double tolerance) {
	if (beta.size() == 0) {
		return true;
	}
	const double change = (beta - beta_old).cwiseAbs().maxCoeff();
	return change <= tolerance * (1.0 + beta_old.cwiseAbs().maxCoeff());
}

inline core::RegressionResult RobustLinearSolver::Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
                                                       const core::RegressionOptions &options) {
	options.Validate();

	const auto n = static_cast<Eigen::Index>(X.rows());
	core::RegressionResult current = OLSSolver::Fit(y, X, options);

	// Residual scales below this are rounding noise of an exact fit
	const double scale_floor = 1e-12 * (1.0 + y.cwiseAbs().maxCoeff());

	double scale = MadScale(current.residuals);
	if (!(scale > scale_floor)) {
		// More than half the points are fitted exactly: the LS fit is the robust fit
		current.robust_weights = Eigen::VectorXd::Ones(n);
		current.scale = 0.0;
		return current;
	}

	Eigen::VectorXd weights(n);
	size_t total_iterations = 0;

	// Stage 1: Huber with MAD rescaling
	bool converged = false;
	for (size_t iter = 0; iter < options.robust_max_iterations; iter++) {
		for (Eigen::Index i = 0; i < n; i++) {
			weights(i) = HuberWeight(current.residuals(i) / scale, options.huber_k);
		}
		Eigen::VectorXd beta_old = FiniteCoefficients(current);
		current = WLSSolver::Fit(y, X, weights, options);
		total_iterations++;

		const double new_scale = MadScale(current.residuals);
		if (!(new_scale > scale_floor)) {
			converged = true;
			break;
		}
		scale = new_scale;

		if (CoefficientsConverged(FiniteCoefficients(current), beta_old, options.tolerance)) {
			converged = true;
			break;
		}
	}
	if (!converged) {
		throw core::ModelFitException("Huber M-estimation did not converge in " +
		                              std::to_string(options.robust_max_iterations) + " iterations");
	}

	// Stage 2: bisquare with fixed scale
	converged = false;
	for (size_t iter = 0; iter < options.robust_max_iterations; iter++) {
		for (Eigen::Index i = 0; i < n; i++) {
			weights(i) = BisquareWeight(current.residuals(i) / scale, options.bisquare_c);
		}
		Eigen::VectorXd beta_old = FiniteCoefficients(current);
		current = WLSSolver::Fit(y, X, weights, options);
		total_iterations++;

		if (CoefficientsConverged(FiniteCoefficients(current), beta_old, options.tolerance)) {
			converged = true;
			break;
		}
	}
	if (!converged) {
		throw core::ModelFitException("bisquare M-estimation did not converge in " +
		                              std::to_string(options.robust_max_iterations) + " iterations");
	}

	for (Eigen::Index i = 0; i < n; i++) {
		weights(i) = BisquareWeight(current.residuals(i) / scale, options.bisquare_c);
	}
	current.robust_weights = weights;
	current.scale = scale;
	current.iterations = total_iterations;
	current.converged = true;
	return current;
}

} // namespace solvers
} // namespace libanoimpute
