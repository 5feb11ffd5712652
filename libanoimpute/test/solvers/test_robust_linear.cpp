#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "libanoimpute/solvers/ols_solver.hpp"
#include "libanoimpute/solvers/robust_linear_solver.hpp"

using namespace libanoimpute;
using namespace libanoimpute::solvers;
using Catch::Matchers::WithinAbs;

TEST_CASE("Robust linear: Gross outlier is down-weighted", "[robust]") {
	const double noise[] = {0.05, -0.1, 0.08, -0.02, 0.1, -0.07, 0.03, -0.04, 0.06, -0.09, 0.02, -0.05};
	const Eigen::Index n = 12;
	Eigen::MatrixXd X(n, 1);
	Eigen::VectorXd y(n);
	for (Eigen::Index i = 0; i < n; i++) {
		X(i, 0) = static_cast<double>(i + 1);
		y(i) = 1.0 + 2.0 * X(i, 0) + noise[i];
	}
	y(5) += 60.0;

	auto ols = OLSSolver::Fit(y, X);
	auto robust = RobustLinearSolver::Fit(y, X);

	REQUIRE(robust.converged);
	REQUIRE(robust.robust_weights.size() == n);
	REQUIRE(robust.robust_weights(5) < 0.01);
	REQUIRE(robust.scale > 0.0);
	REQUIRE_THAT(robust.coefficients(1), WithinAbs(2.0, 0.05));
	REQUIRE_THAT(robust.coefficients(0), WithinAbs(1.0, 0.3));

	// OLS is pulled towards the outlier
	REQUIRE(std::abs(ols.coefficients(0) - 1.0) > std::abs(robust.coefficients(0) - 1.0));
}

TEST_CASE("Robust linear: Exact fit falls back to least squares", "[robust]") {
	Eigen::MatrixXd X(6, 1);
	X << 1, 2, 3, 4, 5, 6;
	Eigen::VectorXd y = 3.0 * X.col(0).array() - 1.0;

	auto result = RobustLinearSolver::Fit(y, X);
	REQUIRE_THAT(result.coefficients(1), WithinAbs(3.0, 1e-10));
	REQUIRE(result.robust_weights.isOnes());
}

TEST_CASE("Robust linear: Weight functions", "[robust]") {
	REQUIRE(RobustLinearSolver::HuberWeight(1.0, 1.345) == 1.0);
	REQUIRE_THAT(RobustLinearSolver::HuberWeight(-2.69, 1.345), WithinAbs(0.5, 1e-12));
	REQUIRE(RobustLinearSolver::BisquareWeight(5.0, 4.685) == 0.0);
	REQUIRE_THAT(RobustLinearSolver::BisquareWeight(0.0, 4.685), WithinAbs(1.0, 1e-12));

	Eigen::VectorXd r(5);
	r << 1, 2, 3, 4, 100;
	REQUIRE_THAT(RobustLinearSolver::MadScale(r), WithinAbs(1.482602218505602, 1e-12));
}
