#include <catch2/catch_test_macros.hpp>

#include "libanoimpute/core/exceptions.hpp"
#include "libanoimpute/imputation/draw_policy.hpp"
#include <cmath>
#include <limits>

using namespace libanoimpute;
using namespace libanoimpute::imputation;

TEST_CASE("Draw policy - Binary", "[imputation][draw]") {
	std::mt19937_64 rng(7);

	SECTION("Deterministic threshold at one half") {
		REQUIRE(ResolveBinary(0.51, true, rng) == 1);
		REQUIRE(ResolveBinary(0.5, true, rng) == 0);
		REQUIRE(ResolveBinary(0.0, true, rng) == 0);
	}

	SECTION("Degenerate probabilities are certain") {
		for (int i = 0; i < 100; i++) {
			REQUIRE(ResolveBinary(0.0, false, rng) == 0);
			REQUIRE(ResolveBinary(1.0, false, rng) == 1);
		}
	}

	SECTION("Non-finite probabilities") {
		REQUIRE_THROWS_AS(ResolveBinary(std::numeric_limits<double>::quiet_NaN(), false, rng),
		                  core::ModelFitException);
		REQUIRE_THROWS_AS(ResolveBinary(std::numeric_limits<double>::quiet_NaN(), true, rng), core::ModelFitException);
	}
}

TEST_CASE("Draw policy - Multiclass", "[imputation][draw]") {
	std::mt19937_64 rng(11);

	SECTION("Argmax, first maximum on ties") {
		Eigen::RowVectorXd p(3);
		p << 0.2, 0.5, 0.3;
		REQUIRE(ResolveMulticlass(p, true, rng) == 1);
		p << 0.4, 0.2, 0.4;
		REQUIRE(ResolveMulticlass(p, true, rng) == 0);
	}

	SECTION("Zero-probability classes are never drawn") {
		Eigen::RowVectorXd p(3);
		p << 0.0, 0.6, 0.4;
		for (int i = 0; i < 200; i++) {
			REQUIRE(ResolveMulticlass(p, false, rng) != 0);
		}
	}

	SECTION("Frequencies follow the probabilities") {
		Eigen::RowVectorXd p(3);
		p << 0.2, 0.3, 0.5;
		std::vector<int> counts(3, 0);
		const int draws = 20000;
		for (int i = 0; i < draws; i++) {
			counts[ResolveMulticlass(p, false, rng)]++;
		}
		for (size_t k = 0; k < 3; k++) {
			REQUIRE(std::abs(counts[k] / static_cast<double>(draws) - p(static_cast<Eigen::Index>(k))) < 0.02);
		}
	}

	SECTION("Invalid probabilities") {
		Eigen::RowVectorXd zero = Eigen::RowVectorXd::Zero(3);
		REQUIRE_THROWS_AS(ResolveMulticlass(zero, false, rng), core::ModelFitException);
		Eigen::RowVectorXd nan(2);
		nan << 0.5, std::numeric_limits<double>::quiet_NaN();
		REQUIRE_THROWS_AS(ResolveMulticlass(nan, true, rng), core::ModelFitException);
	}
}
