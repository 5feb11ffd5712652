#include <catch2/catch_test_macros.hpp>

#include "libanoimpute/utils/tracing.hpp"
#include <string>

using namespace libanoimpute::utils;

TEST_CASE("Tracer - Level names", "[utils][tracing]") {
	REQUIRE(ParseLogLevel("trace", LogLevel::WARN) == LogLevel::TRACE);
	REQUIRE(ParseLogLevel("DEBUG", LogLevel::WARN) == LogLevel::DBG);
	REQUIRE(ParseLogLevel("Error", LogLevel::WARN) == LogLevel::ERR);
	REQUIRE(ParseLogLevel("none", LogLevel::WARN) == LogLevel::NONE);
	REQUIRE(ParseLogLevel("verbose", LogLevel::INFO) == LogLevel::INFO);
	REQUIRE(ParseLogLevel("", LogLevel::WARN) == LogLevel::WARN);

	REQUIRE(std::string(LogLevelName(LogLevel::DBG)) == "DEBUG");
	REQUIRE(std::string(LogLevelName(LogLevel::WARN)) == "WARN");
}

TEST_CASE("Tracer - Level threshold", "[utils][tracing]") {
	const LogLevel saved = Tracer::GetLogLevel();

	Tracer::SetLogLevel(LogLevel::WARN);
	REQUIRE_FALSE(Tracer::ShouldLog(LogLevel::INFO));
	REQUIRE(Tracer::ShouldLog(LogLevel::WARN));
	REQUIRE(Tracer::ShouldLog(LogLevel::ERR));

	Tracer::SetLogLevel(LogLevel::NONE);
	REQUIRE_FALSE(Tracer::ShouldLog(LogLevel::ERR));
	REQUIRE_FALSE(Tracer::ShouldLog(LogLevel::NONE));

	Tracer::SetLogLevel(saved);
}

TEST_CASE("Tracer - Timing", "[utils][tracing]") {
	const LogLevel saved = Tracer::GetLogLevel();
	Tracer::SetLogLevel(LogLevel::NONE);

	ANOIMPUTE_TIMING_START();
	const double elapsed = ANOIMPUTE_TIMING_END("noop");
	REQUIRE(elapsed >= 0.0);

	Tracer::SetLogLevel(saved);
}
