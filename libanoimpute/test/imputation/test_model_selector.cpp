#include <catch2/catch_test_macros.hpp>

#include "libanoimpute/core/exceptions.hpp"
#include "libanoimpute/imputation/model_selector.hpp"

using namespace libanoimpute;
using namespace libanoimpute::imputation;
using backend::ModelKind;
using backend::PredictionMode;

namespace {

core::Dataset SelectorDataset() {
	core::Dataset data;
	data.AddNumeric("num", {1.0, 2.0, 3.0});
	data.AddCategorical("bin", {"n", "y", "n"});
	data.AddCategorical("multi", {"a", "b", "c"});
	data.AddLogical("flag", {true, false, true});
	data.AddCategorical("single", {"only", "only", "only"});
	return data;
}

} // namespace

TEST_CASE("SelectModel - AUTO family", "[imputation][selector]") {
	const core::Dataset data = SelectorDataset();
	const core::FamilySelector automatic = core::AutoFamily {};

	SECTION("Numeric targets get a linear model") {
		ModelPlan plan = SelectModel(data.GetColumn("num"), automatic, false);
		REQUIRE(plan.kind == ModelKind::LINEAR);
		REQUIRE(plan.mode == PredictionMode::POINT);
		REQUIRE(plan.draw == DrawKind::VALUE);
		REQUIRE(SelectModel(data.GetColumn("num"), automatic, true).kind == ModelKind::ROBUST_LINEAR);
	}

	SECTION("Two-level targets get a logistic model") {
		for (const char *name : {"bin", "flag"}) {
			ModelPlan plan = SelectModel(data.GetColumn(name), automatic, false);
			REQUIRE(plan.kind == ModelKind::GLM);
			REQUIRE(plan.family == core::FamilySpec::Binomial());
			REQUIRE(plan.mode == PredictionMode::RESPONSE);
			REQUIRE(plan.draw == DrawKind::BINARY);
			REQUIRE(plan.n_levels == 2);
		}
		REQUIRE(SelectModel(data.GetColumn("bin"), automatic, true).kind == ModelKind::ROBUST_GLM);
	}

	SECTION("Multi-level targets get a multinomial model") {
		ModelPlan plan = SelectModel(data.GetColumn("multi"), automatic, false);
		REQUIRE(plan.kind == ModelKind::MULTINOMIAL);
		REQUIRE(plan.mode == PredictionMode::PROBABILITIES);
		REQUIRE(plan.draw == DrawKind::MULTICLASS);
		REQUIRE(plan.n_levels == 3);
		REQUIRE(plan.Describe() == "multinomial");
	}

	SECTION("Unsupported combinations") {
		REQUIRE_THROWS_AS(SelectModel(data.GetColumn("multi"), automatic, true), core::UnsupportedFamilyException);
		REQUIRE_THROWS_AS(SelectModel(data.GetColumn("single"), automatic, false), core::UnsupportedFamilyException);
	}
}

TEST_CASE("SelectModel - Explicit family", "[imputation][selector]") {
	const core::Dataset data = SelectorDataset();

	SECTION("Numeric targets fit the given GLM") {
		ModelPlan plan = SelectModel(data.GetColumn("num"), core::FamilySpec::Poisson(), false);
		REQUIRE(plan.kind == ModelKind::GLM);
		REQUIRE(plan.family == core::FamilySpec::Poisson());
		REQUIRE(plan.mode == PredictionMode::RESPONSE);
		REQUIRE(plan.draw == DrawKind::VALUE);
		REQUIRE(plan.Describe() == "glm poisson(log)");
		REQUIRE(SelectModel(data.GetColumn("num"), core::FamilySpec::Gamma(), true).kind == ModelKind::ROBUST_GLM);
	}

	SECTION("Binomial families on two-level targets") {
		const core::FamilySpec probit = core::FamilySpec::Binomial(core::Link::PROBIT);
		ModelPlan plan = SelectModel(data.GetColumn("bin"), probit, false);
		REQUIRE(plan.family == probit);
		REQUIRE(plan.draw == DrawKind::BINARY);
	}

	SECTION("Other families on categorical targets") {
		REQUIRE_THROWS_AS(SelectModel(data.GetColumn("bin"), core::FamilySpec::Gaussian(), false),
		                  core::UnsupportedFamilyException);
		REQUIRE_THROWS_AS(SelectModel(data.GetColumn("multi"), core::FamilySpec::Binomial(), false),
		                  core::UnsupportedFamilyException);
		REQUIRE_THROWS_AS(SelectModel(data.GetColumn("flag"), core::FamilySpec::Poisson(), false),
		                  core::UnsupportedFamilyException);
	}
}
