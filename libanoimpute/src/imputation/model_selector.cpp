#include "libanoimpute/imputation/model_selector.hpp"
#include "libanoimpute/core/exceptions.hpp"

namespace libanoimpute {
namespace imputation {

std::string ModelPlan::Describe() const {
	std::string text = backend::ModelKindName(kind);
	if (kind == backend::ModelKind::GLM || kind == backend::ModelKind::ROBUST_GLM) {
		text += " " + family.Name();
	}
	return text;
}

ModelPlan SelectModel(const core::Column &target, const core::FamilySelector &family, bool robust) {
	ModelPlan plan;

	if (target.Type() == core::ColumnType::NUMERIC) {
		if (core::IsAuto(family)) {
			plan.kind = robust ? backend::ModelKind::ROBUST_LINEAR : backend::ModelKind::LINEAR;
			plan.mode = backend::PredictionMode::POINT;
		} else {
			plan.family = std::get<core::FamilySpec>(family);
			plan.family.Validate();
			plan.kind = robust ? backend::ModelKind::ROBUST_GLM : backend::ModelKind::GLM;
			plan.mode = backend::PredictionMode::RESPONSE;
		}
		plan.draw = DrawKind::VALUE;
		return plan;
	}

	plan.n_levels = target.LevelCount();
	if (plan.n_levels < 2) {
		throw core::UnsupportedFamilyException("'" + target.Name() + "' has " + std::to_string(plan.n_levels) +
		                                       " level(s), at least two are needed");
	}

	if (plan.n_levels == 2) {
		if (core::IsAuto(family)) {
			plan.family = core::FamilySpec::Binomial();
		} else {
			plan.family = std::get<core::FamilySpec>(family);
			if (plan.family.distribution != core::Distribution::BINOMIAL) {
				throw core::UnsupportedFamilyException(plan.family.Name() + " cannot model the " +
				                                       core::ColumnTypeName(target.Type()) + " variable '" +
				                                       target.Name() + "'");
			}
			plan.family.Validate();
		}
		plan.kind = robust ? backend::ModelKind::ROBUST_GLM : backend::ModelKind::GLM;
		plan.mode = backend::PredictionMode::RESPONSE;
		plan.draw = DrawKind::BINARY;
		return plan;
	}

	if (!core::IsAuto(family)) {
		throw core::UnsupportedFamilyException(core::FamilySelectorName(family) + " cannot model the " +
		                                       std::to_string(plan.n_levels) + "-level variable '" + target.Name() +
		                                       "'");
	}
	if (robust) {
		throw core::UnsupportedFamilyException("robust fitting is not available for the " +
		                                       std::to_string(plan.n_levels) + "-level variable '" + target.Name() +
		                                       "'");
	}
	plan.kind = backend::ModelKind::MULTINOMIAL;
	plan.mode = backend::PredictionMode::PROBABILITIES;
	plan.draw = DrawKind::MULTICLASS;
	return plan;
}

} // namespace imputation
} // namespace libanoimpute
