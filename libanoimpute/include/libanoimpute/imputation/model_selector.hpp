#pragma once

#include "libanoimpute/backend/model_backend.hpp"
#include "libanoimpute/core/dataset.hpp"
#include "libanoimpute/core/family.hpp"
#include <string>

namespace libanoimpute {
namespace imputation {

/// How predictions turn into imputed values
enum class DrawKind {
	VALUE,     ///< Numeric target, prediction is written as is
	BINARY,    ///< Two-level target, prediction is P(second level)
	MULTICLASS ///< Multi-level target, prediction is a probability row
};

/**
 * Fitting and prediction plan for one target
 */
struct ModelPlan {
	backend::ModelKind kind = backend::ModelKind::LINEAR;
	backend::PredictionMode mode = backend::PredictionMode::POINT;
	core::FamilySpec family = core::FamilySpec::Gaussian();
	DrawKind draw = DrawKind::VALUE;

	/// Level count of a categorical or logical target, 0 for numeric targets
	size_t n_levels = 0;

	std::string Describe() const;
};

/**
 * Choose the model for a target from its type and the family policy
 *
 * AUTO: numeric -> linear (robust linear), two levels -> binomial logit
 * GLM (robust GLM), more levels -> multinomial. An explicit family fits a
 * GLM with that family on a numeric target; on a two-level target only
 * binomial families are accepted.
 *
 * @throws core::UnsupportedFamilyException for a categorical target with
 *         fewer than two levels, robust multinomial fitting, or an explicit
 *         non-binomial family on a categorical or logical target
 */
ModelPlan SelectModel(const core::Column &target, const core::FamilySelector &family, bool robust);

} // namespace imputation
} // namespace libanoimpute
