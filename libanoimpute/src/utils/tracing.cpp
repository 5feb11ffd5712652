#include "libanoimpute/utils/tracing.hpp"
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace libanoimpute {
namespace utils {

namespace {

struct LevelEntry {
	const char *name;
	const char *label;
	LogLevel level;
};

const LevelEntry kLevels[] = {
    {"trace", "TRACE", LogLevel::TRACE}, {"debug", "DEBUG", LogLevel::DBG}, {"info", "INFO", LogLevel::INFO},
    {"warn", "WARN", LogLevel::WARN},    {"error", "ERROR", LogLevel::ERR}, {"none", "NONE", LogLevel::NONE},
};

#ifdef NDEBUG
constexpr LogLevel kDefaultLevel = LogLevel::WARN;
#else
constexpr LogLevel kDefaultLevel = LogLevel::INFO;
#endif

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
std::mutex g_log_mutex;

std::string Timestamp() {
	const auto now = std::chrono::system_clock::now();
	const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
	const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

	std::tm local {};
	localtime_r(&seconds, &local);

	std::ostringstream oss;
	oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis;
	return oss.str();
}

const char *BaseName(const char *path) {
	const char *base = path;
	for (const char *c = path; *c != '\0'; c++) {
		if (*c == '/' || *c == '\\') {
			base = c + 1;
		}
	}
	return base;
}

} // namespace

LogLevel ParseLogLevel(const std::string &text, LogLevel fallback) {
	std::string lowered(text);
	for (auto &c : lowered) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}
	for (const auto &entry : kLevels) {
		if (lowered == entry.name) {
			return entry.level;
		}
	}
	return fallback;
}

const char *LogLevelName(LogLevel level) {
	for (const auto &entry : kLevels) {
		if (entry.level == level) {
			return entry.label;
		}
	}
	return "UNKNOWN";
}

LogLevel Tracer::current_level_ = kDefaultLevel;
bool Tracer::initialized_ = false;

void Tracer::Initialize() {
	const char *env_level = std::getenv("ANOIMPUTE_LOG_LEVEL");
	current_level_ = env_level == nullptr ? kDefaultLevel : ParseLogLevel(env_level, kDefaultLevel);
	initialized_ = true;
}

void Tracer::SetLogLevel(LogLevel level) {
	std::lock_guard<std::mutex> lock(g_log_mutex);
	current_level_ = level;
	initialized_ = true;
}

LogLevel Tracer::GetLogLevel() {
	std::lock_guard<std::mutex> lock(g_log_mutex);
	if (!initialized_) {
		Initialize();
	}
	return current_level_;
}

bool Tracer::ShouldLog(LogLevel level) {
	return level != LogLevel::NONE && level >= GetLogLevel();
}

void Tracer::Log(LogLevel level, const char *file, int line, const std::string &message) {
	if (!ShouldLog(level)) {
		return;
	}

	const std::string stamp = Timestamp();
	std::lock_guard<std::mutex> lock(g_log_mutex);
	std::cerr << '[' << stamp << "] [anoimpute/" << LogLevelName(level) << "] " << BaseName(file) << ':' << line
	          << " - " << message << '\n';
}

double Tracer::TimingEnd(Clock::time_point start, const std::string &operation_name, const char *file, int line) {
	const double elapsed_ms = std::chrono::duration<double, std::milli>(Clock::now() - start).count();
	if (ShouldLog(LogLevel::DBG)) {
		std::ostringstream oss;
		oss << operation_name << " completed in " << std::fixed << std::setprecision(2) << elapsed_ms << " ms";
		Log(LogLevel::DBG, file, line, oss.str());
	}
	return elapsed_ms;
}

} // namespace utils
} // namespace libanoimpute
