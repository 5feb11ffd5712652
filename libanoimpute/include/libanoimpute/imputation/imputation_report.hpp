#pragma once

#include "libanoimpute/backend/model_backend.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

namespace libanoimpute {
namespace imputation {

enum class NoticeLevel { INFO, WARNING };

/// Non-fatal condition met while imputing
struct Notice {
	NoticeLevel level = NoticeLevel::INFO;
	std::string variable;
	std::string message;
};

/// Terminal state of one target
enum class VariableOutcome {
	NO_MISSING,        ///< Nothing to impute, no model fitted
	NO_IMPUTABLE_ROWS, ///< Every missing cell has a missing predictor
	IMPUTED            ///< Predictions substituted
};

struct VariableReport {
	std::string variable;
	VariableOutcome outcome = VariableOutcome::NO_MISSING;

	/// Set when a model was planned for the target
	bool has_model = false;
	backend::ModelKind model_kind = backend::ModelKind::LINEAR;
	std::string model_description;

	size_t missing_before = 0;
	size_t fit_rows = 0;
	size_t imputed = 0;
	size_t still_missing = 0;

	/// An existing status column was coerced and overwritten
	bool status_overwritten = false;
};

/**
 * Outcome of one imputation call
 *
 * One VariableReport per target, in formula order, and every notice
 * emitted along the way.
 */
struct ImputationReport {
	/// Canonical form of the call
	std::string call;

	std::vector<VariableReport> variables;

	std::vector<Notice> notices;

	/// @throws std::invalid_argument if the variable was not a target
	const VariableReport &ForVariable(const std::string &name) const {
		auto it = std::find_if(variables.begin(), variables.end(),
		                       [&](const VariableReport &report) { return report.variable == name; });
		if (it == variables.end()) {
			throw std::invalid_argument("No report for variable '" + name + "'");
		}
		return *it;
	}

	bool HasNotice(NoticeLevel level, const std::string &message) const {
		return std::any_of(notices.begin(), notices.end(), [&](const Notice &notice) {
			return notice.level == level && notice.message == message;
		});
	}

	size_t TotalImputed() const {
		size_t total = 0;
		for (const auto &report : variables) {
			total += report.imputed;
		}
		return total;
	}
};

} // namespace imputation
} // namespace libanoimpute
