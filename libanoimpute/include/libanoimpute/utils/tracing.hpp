#pragma once

#include <chrono>
#include <sstream>
#include <string>

namespace libanoimpute {
namespace utils {

/**
 * @brief Leveled logging for the imputation pipeline
 *
 * Messages go to stderr as
 *   [2026-01-01 12:00:00.000] [anoimpute/INFO] regression_imputer.cpp:42 - text
 *
 * The level comes from ANOIMPUTE_LOG_LEVEL (trace, debug, info, warn,
 * error, none) the first time anything is logged. Release builds default
 * to warn, debug builds to info.
 *
 *   ANOIMPUTE_DEBUG("Fitting " << rows << " rows");
 *   ANOIMPUTE_TIMING_START();
 *   ANOIMPUTE_TIMING_END("Imputation of 'y'");
 */

enum class LogLevel { TRACE = 0, DBG = 1, INFO = 2, WARN = 3, ERR = 4, NONE = 5 };

/// Case-insensitive level name to LogLevel, `fallback` for anything unknown
LogLevel ParseLogLevel(const std::string &text, LogLevel fallback);

const char *LogLevelName(LogLevel level);

class Tracer {
public:
	using Clock = std::chrono::steady_clock;

	/// Overrides the environment for the rest of the process
	static void SetLogLevel(LogLevel level);

	static LogLevel GetLogLevel();

	static bool ShouldLog(LogLevel level);

	static void Log(LogLevel level, const char *file, int line, const std::string &message);

	static Clock::time_point TimingStart() {
		return Clock::now();
	}

	/**
	 * @brief Log the time elapsed since `start` at debug level
	 *
	 * @return Duration in milliseconds
	 */
	static double TimingEnd(Clock::time_point start, const std::string &operation_name, const char *file, int line);

private:
	static void Initialize();

	static LogLevel current_level_;
	static bool initialized_;

	Tracer() = delete;
};

#define ANOIMPUTE_LOG_AT(level, msg)                                                                                   \
	do {                                                                                                               \
		if (libanoimpute::utils::Tracer::ShouldLog(level)) {                                                           \
			std::ostringstream anoimpute_oss;                                                                          \
			anoimpute_oss << msg;                                                                                      \
			libanoimpute::utils::Tracer::Log(level, __FILE__, __LINE__, anoimpute_oss.str());                          \
		}                                                                                                              \
	} while (0)

#define ANOIMPUTE_TRACE(msg) ANOIMPUTE_LOG_AT(libanoimpute::utils::LogLevel::TRACE, msg)
#define ANOIMPUTE_DEBUG(msg) ANOIMPUTE_LOG_AT(libanoimpute::utils::LogLevel::DBG, msg)
#define ANOIMPUTE_INFO(msg)  ANOIMPUTE_LOG_AT(libanoimpute::utils::LogLevel::INFO, msg)
#define ANOIMPUTE_WARN(msg)  ANOIMPUTE_LOG_AT(libanoimpute::utils::LogLevel::WARN, msg)
#define ANOIMPUTE_ERROR(msg) ANOIMPUTE_LOG_AT(libanoimpute::utils::LogLevel::ERR, msg)

#define ANOIMPUTE_TIMING_START() const auto anoimpute_timing_start = libanoimpute::utils::Tracer::TimingStart()

#define ANOIMPUTE_TIMING_END(operation_name)                                                                           \
	libanoimpute::utils::Tracer::TimingEnd(anoimpute_timing_start, operation_name, __FILE__, __LINE__)

} // namespace utils
} // namespace libanoimpute
