#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "libanoimpute/core/exceptions.hpp"
#include "libanoimpute/solvers/glm_solver.hpp"
#include "libanoimpute/solvers/ols_solver.hpp"
#include "../test_helpers.hpp"

using namespace libanoimpute;
using namespace libanoimpute::solvers;
using Catch::Matchers::WithinAbs;

TEST_CASE("GLM: Logistic regression matches maximum likelihood", "[glm][binomial]") {
	auto fixture = testing::LoadFixture("testdata.json");
	Eigen::MatrixXd X = testing::FixtureDesign(fixture);
	auto labels = fixture["b1"].get<std::vector<std::string>>();
	Eigen::VectorXd y(static_cast<Eigen::Index>(labels.size()));
	for (size_t i = 0; i < labels.size(); i++) {
		y(static_cast<Eigen::Index>(i)) = labels[i] == "yes" ? 1.0 : 0.0;
	}

	auto result = GLMSolver::Fit(y, X, core::FamilySpec::Binomial());

	auto expected = fixture["expected"]["logit_b1_x1_x2"].get<std::vector<double>>();
	for (size_t i = 0; i < expected.size(); i++) {
		REQUIRE_THAT(result.coefficients(static_cast<Eigen::Index>(i)), WithinAbs(expected[i], 1e-5));
	}
	REQUIRE(result.converged);
	REQUIRE(result.iterations < 25);
	REQUIRE(result.deviance < result.null_deviance);

	Eigen::VectorXd p = GLMSolver::PredictResponse(result, X, core::FamilySpec::Binomial());
	REQUIRE((p.array() > 0.0).all());
	REQUIRE((p.array() < 1.0).all());
	REQUIRE_THAT((p - result.fitted_values).cwiseAbs().maxCoeff(), WithinAbs(0.0, 1e-10));
}

TEST_CASE("GLM: Poisson regression matches maximum likelihood", "[glm][poisson]") {
	auto fixture = testing::LoadFixture("testdata.json");
	Eigen::MatrixXd X = testing::FixtureDesign(fixture).leftCols(1);
	Eigen::VectorXd y = testing::ToVector(fixture["counts"].get<std::vector<double>>());

	auto result = GLMSolver::Fit(y, X, core::FamilySpec::Poisson());

	auto expected = fixture["expected"]["poisson_counts_x1"].get<std::vector<double>>();
	REQUIRE_THAT(result.coefficients(0), WithinAbs(expected[0], 1e-5));
	REQUIRE_THAT(result.coefficients(1), WithinAbs(expected[1], 1e-5));
}

TEST_CASE("GLM: Gaussian identity reproduces OLS", "[glm][gaussian]") {
	auto fixture = testing::LoadFixture("testdata.json");
	Eigen::MatrixXd X = testing::FixtureDesign(fixture);
	Eigen::VectorXd y = testing::ToVector(fixture["y"].get<std::vector<double>>());

	auto glm = GLMSolver::Fit(y, X, core::FamilySpec::Gaussian());
	auto ols = OLSSolver::Fit(y, X);
	for (Eigen::Index j = 0; j < 3; j++) {
		REQUIRE_THAT(glm.coefficients(j), WithinAbs(ols.coefficients(j), 1e-8));
	}
}

TEST_CASE("GLM: Identity-link Poisson halves steps that leave the mean space", "[glm][poisson]") {
	// The full second IRLS step drives the mean at x = 5 below zero
	Eigen::MatrixXd X(6, 1);
	X << 0.0, 1.0, 2.0, 3.0, 4.0, 5.0;
	Eigen::VectorXd y(6);
	y << 5.0, 12.0, 0.0, 2.0, 1.0, 1.0;
	const auto family = core::FamilySpec::Poisson(core::Link::IDENTITY);

	auto result = GLMSolver::Fit(y, X, family);

	REQUIRE(result.converged);
	REQUIRE((result.fitted_values.array() > 0.0).all());
	REQUIRE_THAT(result.coefficients(0), WithinAbs(6.40336, 1e-3));
	REQUIRE_THAT(result.coefficients(1), WithinAbs(-1.16134, 1e-3));
	REQUIRE_THAT(result.deviance, WithinAbs(15.79468, 1e-4));
	REQUIRE(result.deviance < result.null_deviance);

	// Score equations of the identity-link Poisson likelihood
	const Eigen::ArrayXd score = y.array() / result.fitted_values.array() - 1.0;
	REQUIRE_THAT(score.sum(), WithinAbs(0.0, 1e-2));
	REQUIRE_THAT((score * X.col(0).array()).sum(), WithinAbs(0.0, 1e-2));
}

TEST_CASE("GLM: Invalid first step cannot be halved", "[glm][gamma]") {
	// Gamma inverse link starting from 1/y leaves no earlier coefficients to fall back on
	Eigen::MatrixXd X(4, 1);
	X << 1.0, 2.0, 3.0, 4.0;
	Eigen::VectorXd y(4);
	y << 0.01, 0.02, 100.0, 0.05;

	REQUIRE_THROWS_AS(GLMSolver::Fit(y, X, core::FamilySpec::Gamma()), core::ModelFitException);
}

TEST_CASE("GLM: Robust logistic regression", "[glm][robust]") {
	auto fixture = testing::LoadFixture("testdata.json");
	Eigen::MatrixXd X = testing::FixtureDesign(fixture);
	auto labels = fixture["b1"].get<std::vector<std::string>>();
	Eigen::VectorXd y(static_cast<Eigen::Index>(labels.size()));
	for (size_t i = 0; i < labels.size(); i++) {
		y(static_cast<Eigen::Index>(i)) = labels[i] == "yes" ? 1.0 : 0.0;
	}

	auto result = GLMSolver::FitRobust(y, X, core::FamilySpec::Binomial());
	REQUIRE(result.converged);
	REQUIRE(result.robust_weights.size() == 20);
	REQUIRE((result.robust_weights.array() > 0.0).all());
	REQUIRE((result.robust_weights.array() <= 1.0).all());
	REQUIRE(result.coefficients.allFinite());
}

TEST_CASE("GLM: Invalid responses", "[glm]") {
	Eigen::MatrixXd X(3, 1);
	X << 1, 2, 3;
	Eigen::VectorXd y(3);
	y << 0, 1, 2;
	REQUIRE_THROWS_AS(GLMSolver::Fit(y, X, core::FamilySpec::Binomial()), core::ModelFitException);

	Eigen::VectorXd negative(3);
	negative << 1, -1, 2;
	REQUIRE_THROWS_AS(GLMSolver::Fit(negative, X, core::FamilySpec::Poisson()), core::ModelFitException);

	REQUIRE_THROWS_AS(GLMSolver::Fit(Eigen::VectorXd(0), Eigen::MatrixXd(0, 1), core::FamilySpec::Poisson()),
	                  core::ModelFitException);
}

TEST_CASE("GLM: Non-convergence is reported", "[glm]") {
	auto fixture = testing::LoadFixture("testdata.json");
	Eigen::MatrixXd X = testing::FixtureDesign(fixture);
	Eigen::VectorXd y = testing::ToVector(fixture["counts"].get<std::vector<double>>());

	auto options = core::RegressionOptions::Iterative(1, 1e-12);
	REQUIRE_THROWS_AS(GLMSolver::Fit(y, X, core::FamilySpec::Poisson(), options), core::ModelFitException);
}
