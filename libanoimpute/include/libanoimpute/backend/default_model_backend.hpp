#pragma once

#include "libanoimpute/backend/model_backend.hpp"

namespace libanoimpute {
namespace backend {

/**
 * ModelBackend on top of the Eigen solvers
 *
 * LINEAR -> OLSSolver, ROBUST_LINEAR -> RobustLinearSolver,
 * GLM -> GLMSolver::Fit, ROBUST_GLM -> GLMSolver::FitRobust,
 * MULTINOMIAL -> MultinomialSolver.
 *
 * Categorical responses are fitted on their level codes: GLM targets with
 * two levels as 0/1 (second level is 1), multinomial targets as class
 * indices. Multinomial classes without training rows are left out of the
 * fit and predicted with probability zero.
 */
class DefaultModelBackend : public ModelBackend {
public:
	std::unique_ptr<FittedModel> Fit(const ModelRequest &request, const core::Dataset &data) override;
};

} // namespace backend
} // namespace libanoimpute
