#pragma once

#include "libanoimpute/core/exceptions.hpp"
#include "libanoimpute/core/regression_result.hpp"
#include "libanoimpute/core/regression_options.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <functional>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace libanoimpute {
namespace solvers {

/// Receives the solver's progress lines ("initial value ...", "iter 10 value ...")
using TraceSink = std::function<void(const std::string &)>;

/**
 * Multinomial (softmax) Regression Solver
 *
 * Baseline-category logit model for a response with K classes:
 *   P(y = k | x) = exp(x'β_k) / Σ_j exp(x'β_j),  β_0 = 0
 *
 * Fitted by Newton-Raphson on the full (K-1)·q parameter vector
 * (q = p + intercept) with step halving on the log-likelihood. A tiny
 * ridge term keeps the Hessian invertible for aliased columns and
 * separated classes. Convergence is declared when the relative change in
 * deviance drops below tolerance, or when the deviance is practically zero
 * (perfectly separated classes, where the coefficients diverge).
 *
 * Progress is reported the way nnet::multinom prints it: the number of
 * weights, the initial value, every tenth iteration and the final value.
 * The trace sink decides whether anyone sees it.
 */
class MultinomialSolver {
public:
	/**
	 * Fit multinomial regression
	 *
	 * @param y Class index per observation, in [0, n_classes)
	 * @param X Design matrix (n × p), without intercept column
	 * @param n_classes Number of classes (>= 2)
	 * @param options intercept, max_iterations, tolerance
	 * @param trace Optional progress sink (nullptr discards progress output)
	 * @return MultinomialResult with (K-1) × q coefficients
	 * @throws core::ModelFitException on non-convergence or non-finite values
	 */
	static core::MultinomialResult Fit(const std::vector<size_t> &y, const Eigen::MatrixXd &X, size_t n_classes,
	                                    const core::RegressionOptions &options = core::RegressionOptions::OLS(),
	                                    const TraceSink &trace = nullptr);

	/// Fit value (deviance / 2) below which the fit counts as converged, nnet's abstol
	static constexpr double kAbsoluteTolerance = 1e-4;

private:
	static double Deviance(const Eigen::MatrixXd &design, const std::vector<size_t> &y, const Eigen::VectorXd &theta,
	                       size_t n_classes);

	static Eigen::MatrixXd Probabilities(const Eigen::MatrixXd &design, const Eigen::VectorXd &theta, size_t n_classes);

	static std::string FormatValue(double value) {
		std::ostringstream oss;
		oss << std::fixed << std::setprecision(6) << value;
		return oss.str();
	}

	static constexpr double kRidge = 1e-8;
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline Eigen::MatrixXd MultinomialSolver::Probabilities(const Eigen::MatrixXd &design, const Eigen::VectorXd &theta,
                                                        size_t n_classes) {
	const Eigen::Index q = design.cols();
	const auto k_free = static_cast<Eigen::Index>(n_classes - 1);
	// theta stacks the per-class coefficient vectors
	const Eigen::Map<const Eigen::MatrixXd> per_class(theta.data(), q, k_free);
	return core::MultinomialResult::Softmax(design, per_class.transpose());
}

inline double MultinomialSolver::Deviance(const Eigen::MatrixXd &design, const std::vector<size_t> &y,
                                          const Eigen::VectorXd &theta, size_t n_classes) {
	Eigen::MatrixXd probs = Probabilities(design, theta, n_classes);
	double dev = 0.0;
	for (size_t i = 0; i < y.size(); i++) {
		const double p = probs(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(y[i]));
		dev -= 2.0 * std::log(std::max(p, 1e-300));
	}
	return dev;
}

inline core::MultinomialResult MultinomialSolver::Fit(const std::vector<size_t> &y, const Eigen::MatrixXd &X,
                                                      size_t n_classes, const core::RegressionOptions &options,
                                                      const TraceSink &trace) {
	options.Validate();

	const auto n = static_cast<Eigen::Index>(X.rows());
	if (n == 0) {
		throw core::ModelFitException("0 (non-NA) cases");
	}
	if (static_cast<Eigen::Index>(y.size()) != n) {
		throw std::invalid_argument("Response length does not match design rows");
	}
	if (n_classes < 2) {
		throw core::ModelFitException("multinomial response needs at least 2 classes");
	}
	for (size_t label : y) {
		if (label >= n_classes) {
			throw std::invalid_argument("Class index " + std::to_string(label) + " out of range");
		}
	}

	// Explicit intercept column: the softmax model has no closed-form centering
	const Eigen::Index q = X.cols() + (options.intercept ? 1 : 0);
	Eigen::MatrixXd design(n, q);
	if (options.intercept) {
		design.col(0).setOnes();
		design.rightCols(X.cols()) = X;
	} else {
		design = X;
	}

	const auto k_free = static_cast<Eigen::Index>(n_classes - 1);
	const Eigen::Index n_par = k_free * q;

	if (trace) {
		trace("# weights:  " + std::to_string(n_par) + " (" + std::to_string(q) + " per class)");
	}

	Eigen::VectorXd theta = Eigen::VectorXd::Zero(n_par);
	double dev = Deviance(design, y, theta, n_classes);
	if (trace) {
		trace("initial  value " + FormatValue(dev / 2.0));
	}

	bool converged = false;
	size_t iter = 0;

	while (iter < options.max_iterations) {
		iter++;

		Eigen::MatrixXd probs = Probabilities(design, theta, n_classes);

		// Gradient of the log-likelihood and negative Hessian, block (k, l)
		Eigen::VectorXd gradient = Eigen::VectorXd::Zero(n_par);
		Eigen::MatrixXd information = Eigen::MatrixXd::Zero(n_par, n_par);

		for (Eigen::Index k = 0; k < k_free; k++) {
			Eigen::VectorXd resid(n);
			for (Eigen::Index i = 0; i < n; i++) {
				const double indicator = (y[static_cast<size_t>(i)] == static_cast<size_t>(k + 1)) ? 1.0 : 0.0;
				resid(i) = indicator - probs(i, k + 1);
			}
			gradient.segment(k * q, q) = design.transpose() * resid;

			for (Eigen::Index l = k; l < k_free; l++) {
				Eigen::VectorXd w(n);
				for (Eigen::Index i = 0; i < n; i++) {
					const double p_k = probs(i, k + 1);
					const double p_l = probs(i, l + 1);
					w(i) = (k == l) ? p_k * (1.0 - p_k) : -p_k * p_l;
				}
				Eigen::MatrixXd block = design.transpose() * w.asDiagonal() * design;
				information.block(k * q, l * q, q, q) = block;
				if (l != k) {
					information.block(l * q, k * q, q, q) = block.transpose();
				}
			}
		}
		information.diagonal().array() += kRidge;

		Eigen::LDLT<Eigen::MatrixXd> ldlt(information);
		if (ldlt.info() != Eigen::Success) {
			throw core::ModelFitException("singular information matrix in multinomial fit");
		}
		Eigen::VectorXd step = ldlt.solve(gradient);
		if (!step.allFinite()) {
			throw core::ModelFitException("non-finite Newton step in multinomial fit");
		}

		// Step halving until the deviance does not increase
		double new_dev = Deviance(design, y, theta + step, n_classes);
		size_t halvings = 0;
		while ((!std::isfinite(new_dev) || new_dev > dev) && halvings < 30) {
			step /= 2.0;
			new_dev = Deviance(design, y, theta + step, n_classes);
			halvings++;
		}
		if (!std::isfinite(new_dev)) {
			throw core::ModelFitException("non-finite deviance in multinomial iteration " + std::to_string(iter));
		}
		theta += step;

		const bool small_change = std::abs(new_dev - dev) / (std::abs(new_dev) + 0.1) < options.tolerance;
		dev = std::min(dev, new_dev);
		// Perfect separation drives the deviance toward zero without the relative change settling
		const bool negligible = dev / 2.0 < kAbsoluteTolerance;

		if (trace && iter % 10 == 0) {
			trace("iter " + std::to_string(iter) + " value " + FormatValue(dev / 2.0));
		}

		if (small_change || negligible) {
			converged = true;
			break;
		}
	}

	if (trace) {
		trace("final  value " + FormatValue(dev / 2.0));
		trace(converged ? "converged" : "stopped after " + std::to_string(iter) + " iterations");
	}

	if (!converged) {
		throw core::ModelFitException("multinomial Newton-Raphson did not converge in " +
		                              std::to_string(options.max_iterations) + " iterations");
	}

	core::MultinomialResult result;
	result.has_intercept = options.intercept;
	result.n_classes = n_classes;
	result.n_params = static_cast<size_t>(q);
	result.n_obs = static_cast<size_t>(n);
	result.deviance = dev;
	result.iterations = iter;
	result.converged = true;
	result.coefficients.resize(k_free, q);
	for (Eigen::Index k = 0; k < k_free; k++) {
		result.coefficients.row(k) = theta.segment(k * q, q).transpose();
	}
	return result;
}

} // namespace solvers
} // namespace libanoimpute
