#pragma once

#include "libanoimpute/core/exceptions.hpp"
#include "libanoimpute/core/family.hpp"
#include "libanoimpute/core/regression_result.hpp"
#include "libanoimpute/core/regression_options.hpp"
#include "libanoimpute/solvers/robust_linear_solver.hpp"
#include "libanoimpute/solvers/wls_solver.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <string>

namespace libanoimpute {
namespace solvers {

/**
 * Generalized Linear Model Solver (IRLS)
 *
 * Fits E[y] = g^-1(Xβ) for a FamilySpec by iteratively reweighted least
 * squares, the algorithm behind R's glm():
 *
 *   z_i = η_i + (y_i - μ_i) / μ'(η_i)          (working response)
 *   w_i = μ'(η_i)² / V(μ_i)                    (working weight)
 *   β   = argmin Σ w_i (z_i - x_i'β)²          (WLSSolver)
 *
 * Iteration stops when |dev - dev_old| / (|dev| + 0.1) < tolerance.
 * A step that leaves the family's mean space or yields a non-finite
 * deviance is halved back towards the previous coefficients.
 *
 * FitRobust() is the outlier-resistant variant: every working weight is
 * multiplied by a Huber weight of the Pearson residual
 * (y - μ) / sqrt(V(μ)), and convergence is judged on the coefficients
 * because the robust criterion is not the deviance.
 *
 * Design notes:
 * - Header-only
 * - Stateless design (all methods are static)
 * - Failures (bad response domain, steps that cannot be corrected,
 *   non-convergence) raise core::ModelFitException
 */
class GLMSolver {
public:
	/**
	 * Fit a GLM by IRLS
	 *
	 * @param y Response vector (length n), in the family's support
	 * @param X Design matrix (n × p)
	 * @param family Distribution and link
	 * @param options Regression options (intercept, max_iterations, tolerance)
	 * @return RegressionResult with deviance, null_deviance and iterations
	 */
	static core::RegressionResult Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
	                                   const core::FamilySpec &family,
	                                   const core::RegressionOptions &options = core::RegressionOptions::OLS());

	/**
	 * Fit a GLM with Huber-weighted Pearson residuals
	 *
	 * @return RegressionResult with robust_weights filled in
	 */
	static core::RegressionResult FitRobust(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
	                                         const core::FamilySpec &family,
	                                         const core::RegressionOptions &options = core::RegressionOptions::OLS());

	/**
	 * Response-scale predictions μ = g^-1(Xβ)
	 */
	static Eigen::VectorXd PredictResponse(const core::RegressionResult &result, const Eigen::MatrixXd &X,
	                                       const core::FamilySpec &family);

private:
	static core::RegressionResult FitImpl(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
	                                      const core::FamilySpec &family, const core::RegressionOptions &options,
	                                      bool robust);

	static void ValidateResponse(const Eigen::VectorXd &y, const core::FamilySpec &family);

	static double NullDeviance(const Eigen::VectorXd &y, const core::FamilySpec &family, bool intercept);

	/// Recomputes eta and mu from the current coefficients and returns the deviance
	static double UpdateMean(const core::RegressionResult &fit, const Eigen::MatrixXd &X,
	                         const core::FamilySpec &family, Eigen::VectorXd &eta, Eigen::VectorXd &mu,
	                         const Eigen::VectorXd &y);

	static bool ValidMeans(const Eigen::VectorXd &mu, const core::FamilySpec &family);

	static constexpr size_t kMaxHalvings = 30;
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline core::RegressionResult GLMSolver::Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
                                              const core::FamilySpec &family,
                                              const core::RegressionOptions &options) {
	return FitImpl(y, X, family, options, false);
}

inline core::RegressionResult GLMSolver::FitRobust(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
                                                    const core::FamilySpec &family,
                                                    const core::RegressionOptions &options) {
	return FitImpl(y, X, family, options, true);
}

inline Eigen::VectorXd GLMSolver::PredictResponse(const core::RegressionResult &result, const Eigen::MatrixXd &X,
                                                  const core::FamilySpec &family) {
	Eigen::VectorXd eta = OLSSolver::Predict(result, X);
	Eigen::VectorXd mu(eta.size());
	for (Eigen::Index i = 0; i < eta.size(); i++) {
		mu(i) = family.LinkInverse(eta(i));
	}
	return mu;
}

inline void GLMSolver::ValidateResponse(const Eigen::VectorXd &y, const core::FamilySpec &family) {
	for (Eigen::Index i = 0; i < y.size(); i++) {
		if (!family.ValidResponse(y(i))) {
			throw core::ModelFitException("response value " + std::to_string(y(i)) + " is outside the support of " +
			                              family.Name());
		}
	}
}

inline double GLMSolver::NullDeviance(const Eigen::VectorXd &y, const core::FamilySpec &family, bool intercept) {
	Eigen::VectorXd mu(y.size());
	if (intercept) {
		mu.setConstant(y.mean());
	} else {
		mu.setConstant(family.LinkInverse(0.0));
	}
	return family.Deviance(y, mu);
}

inline double GLMSolver::UpdateMean(const core::RegressionResult &fit, const Eigen::MatrixXd &X,
                                    const core::FamilySpec &family, Eigen::VectorXd &eta, Eigen::VectorXd &mu,
                                    const Eigen::VectorXd &y) {
	eta = fit.LinearPredictor(X);
	for (Eigen::Index i = 0; i < eta.size(); i++) {
		mu(i) = family.LinkInverse(eta(i));
	}
	return family.Deviance(y, mu);
}

inline bool GLMSolver::ValidMeans(const Eigen::VectorXd &mu, const core::FamilySpec &family) {
	for (Eigen::Index i = 0; i < mu.size(); i++) {
		if (!family.ValidMean(mu(i))) {
			return false;
		}
	}
	return true;
}

inline core::RegressionResult GLMSolver::FitImpl(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
                                                  const core::FamilySpec &family,
                                                  const core::RegressionOptions &options, bool robust) {
	options.Validate();
	family.Validate();

	const auto n = static_cast<Eigen::Index>(X.rows());
	if (n == 0) {
		throw core::ModelFitException("0 (non-NA) cases");
	}
	ValidateResponse(y, family);

	Eigen::VectorXd mu(n);
	Eigen::VectorXd eta(n);
	for (Eigen::Index i = 0; i < n; i++) {
		mu(i) = family.InitialMu(y(i));
		eta(i) = family.LinkFun(mu(i));
	}

	double dev_old = family.Deviance(y, mu);
	Eigen::VectorXd beta_old;
	core::RegressionResult fit;
	Eigen::VectorXd z(n);
	Eigen::VectorXd w(n);
	Eigen::VectorXd robust_w = Eigen::VectorXd::Ones(n);

	const size_t max_iterations = robust ? options.robust_max_iterations : options.max_iterations;
	bool converged = false;
	size_t iter = 0;

	while (iter < max_iterations) {
		iter++;

		for (Eigen::Index i = 0; i < n; i++) {
			const double d_mu = family.MuEta(eta(i));
			const double var = family.Variance(mu(i));
			z(i) = eta(i) + (y(i) - mu(i)) / d_mu;
			w(i) = d_mu * d_mu / var;
			if (robust) {
				robust_w(i) = RobustLinearSolver::HuberWeight((y(i) - mu(i)) / std::sqrt(var), options.huber_k);
				w(i) *= robust_w(i);
			}
		}

		fit = WLSSolver::Fit(z, X, w, options);

		double dev = UpdateMean(fit, X, family, eta, mu, y);

		// Step halving towards the previous coefficients, as glm.fit does
		size_t halvings = 0;
		while (!std::isfinite(dev) || !ValidMeans(mu, family)) {
			if (beta_old.size() != fit.coefficients.size()) {
				throw core::ModelFitException("no valid set of coefficients has been found for " + family.Name());
			}
			if (halvings == kMaxHalvings) {
				throw core::ModelFitException("inner loop cannot correct step size in IRLS iteration " +
				                              std::to_string(iter) + " for " + family.Name());
			}
			halvings++;
			for (Eigen::Index j = 0; j < fit.coefficients.size(); j++) {
				if (!fit.is_aliased[static_cast<size_t>(j)]) {
					fit.coefficients(j) = (fit.coefficients(j) + beta_old(j)) / 2.0;
				}
			}
			if (fit.has_intercept) {
				fit.intercept = fit.coefficients(0);
			}
			dev = UpdateMean(fit, X, family, eta, mu, y);
		}

		Eigen::VectorXd beta = fit.coefficients;
		for (Eigen::Index j = 0; j < beta.size(); j++) {
			if (!std::isfinite(beta(j))) {
				beta(j) = 0.0;
			}
		}

		if (robust) {
			if (beta_old.size() == beta.size() &&
			    (beta - beta_old).cwiseAbs().maxCoeff() <= options.tolerance * (1.0 + beta_old.cwiseAbs().maxCoeff())) {
				converged = true;
				dev_old = dev;
				break;
			}
		} else if (std::abs(dev - dev_old) / (std::abs(dev) + 0.1) < options.tolerance) {
			converged = true;
			dev_old = dev;
			break;
		}

		beta_old = beta;
		dev_old = dev;
	}

	if (!converged) {
		throw core::ModelFitException(std::string(robust ? "robust " : "") + "IRLS for " + family.Name() +
		                              " did not converge in " + std::to_string(max_iterations) + " iterations");
	}

	fit.fitted_values = mu;
	fit.residuals = y - mu;
	fit.deviance = dev_old;
	fit.null_deviance = NullDeviance(y, family, options.intercept);
	fit.iterations = iter;
	fit.converged = true;
	if (robust) {
		fit.robust_weights = robust_w;
	}
	return fit;
}

} // namespace solvers
} // namespace libanoimpute
