#include <catch2/catch_test_macros.hpp>

#include "libanoimpute/core/exceptions.hpp"
#include "libanoimpute/imputation/imputation_options.hpp"

using namespace libanoimpute;
using namespace libanoimpute::imputation;

TEST_CASE("ImputationOptions - Defaults", "[imputation][options]") {
	ImputationOptions opts = ImputationOptions::Defaults();
	REQUIRE(core::IsAuto(opts.family));
	REQUIRE_FALSE(opts.robust);
	REQUIRE(opts.imp_var);
	REQUIRE(opts.imp_suffix == "imp");
	REQUIRE_FALSE(opts.mod_cat);
	REQUIRE(opts.fit_trace == FitTrace::DISCARD);
	REQUIRE_FALSE(opts.seed.has_value());
	REQUIRE(opts.regression.intercept);
	REQUIRE_NOTHROW(opts.Validate());
}

TEST_CASE("ImputationOptions - Parsing from key/value text", "[imputation][options]") {
	SECTION("All keys") {
		ImputationOptions opts = ImputationOptions::ParseFromMap({{"Family", "binomial(probit)"},
		                                                          {"ROBUST", "TRUE"},
		                                                          {"imp_var", "0"},
		                                                          {"imp_suffix", "flag"},
		                                                          {"mod_cat", "yes"},
		                                                          {"fit_trace", "SURFACE"},
		                                                          {"intercept", "F"},
		                                                          {"max_iterations", "40"},
		                                                          {"tolerance", "1e-6"},
		                                                          {"qr_tolerance", "1e-7"},
		                                                          {"huber_k", "2"},
		                                                          {"bisquare_c", "5.5"},
		                                                          {"robust_max_iterations", "80"},
		                                                          {"seed", "42"}});
		REQUIRE(std::get<core::FamilySpec>(opts.family) == core::FamilySpec::Binomial(core::Link::PROBIT));
		REQUIRE(opts.robust);
		REQUIRE_FALSE(opts.imp_var);
		REQUIRE(opts.imp_suffix == "flag");
		REQUIRE(opts.mod_cat);
		REQUIRE(opts.fit_trace == FitTrace::SURFACE);
		REQUIRE_FALSE(opts.regression.intercept);
		REQUIRE(opts.regression.max_iterations == 40);
		REQUIRE(opts.regression.tolerance == 1e-6);
		REQUIRE(opts.regression.qr_tolerance == 1e-7);
		REQUIRE(opts.regression.huber_k == 2.0);
		REQUIRE(opts.regression.bisquare_c == 5.5);
		REQUIRE(opts.regression.robust_max_iterations == 80);
		REQUIRE(opts.seed.value() == 42);
	}

	SECTION("Empty map gives defaults") {
		ImputationOptions opts = ImputationOptions::ParseFromMap({});
		REQUIRE(core::IsAuto(opts.family));
		REQUIRE(opts.imp_suffix == "imp");
	}

	SECTION("Invalid input") {
		REQUIRE_THROWS_AS(ImputationOptions::ParseFromMap({{"lambda", "1"}}), std::invalid_argument);
		REQUIRE_THROWS_AS(ImputationOptions::ParseFromMap({{"robust", "sometimes"}}), std::invalid_argument);
		REQUIRE_THROWS_AS(ImputationOptions::ParseFromMap({{"tolerance", "small"}}), std::invalid_argument);
		REQUIRE_THROWS_AS(ImputationOptions::ParseFromMap({{"tolerance", "-1"}}), std::invalid_argument);
		REQUIRE_THROWS_AS(ImputationOptions::ParseFromMap({{"seed", "-3"}}), std::invalid_argument);
		REQUIRE_THROWS_AS(ImputationOptions::ParseFromMap({{"max_iterations", "0"}}), std::invalid_argument);
		REQUIRE_THROWS_AS(ImputationOptions::ParseFromMap({{"fit_trace", "loud"}}), std::invalid_argument);
		REQUIRE_THROWS_AS(ImputationOptions::ParseFromMap({{"family", "quasi"}}), core::UnsupportedFamilyException);
		REQUIRE_THROWS_AS(ImputationOptions::ParseFromMap({{"imp_suffix", ""}}), std::invalid_argument);
	}
}
