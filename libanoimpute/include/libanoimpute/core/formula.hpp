#pragma once

#include "libanoimpute/core/dataset.hpp"
#include <string>
#include <vector>

namespace libanoimpute {
namespace core {

/**
 * Parsed imputation formula "t1 + t2 ~ p1 + p2"
 *
 * Both sides are ordered, non-empty and free of duplicates. Every name
 * refers to an existing dataset column.
 */
struct Formula {
	std::vector<std::string> targets;
	std::vector<std::string> predictors;

	/// Canonical text form, e.g. "b1 + m1 ~ x1 + x2"
	std::string ToString() const;

	/**
	 * Single-target formula "target ~ predictors"
	 *
	 * A predictor equal to the target is dropped from the right-hand side.
	 */
	Formula ForTarget(const std::string &target) const;

	/// Whether a name appears among the targets
	bool IsTarget(const std::string &name) const;
};

/**
 * Parse formula text against a dataset
 *
 * Whitespace around names is ignored.
 *
 * @throws InvalidFormulaException on a missing or repeated '~', an empty
 *         side or term, a name listed twice on one side, or a name that is
 *         not a column of the dataset
 */
Formula ParseFormula(const std::string &text, const Dataset &data);

} // namespace core
} // namespace libanoimpute
