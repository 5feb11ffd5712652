#pragma once

#include "libanoimpute/core/dataset.hpp"
#include <string>
#include <vector>

namespace libanoimpute {
namespace core {

/**
 * Survey design object wrapping a dataset
 *
 * Imputation through a design operates on its variables only. Weights,
 * strata and cluster ids are carried along unchanged; every call is
 * appended to the call history.
 */
struct SurveyDesign {
	Dataset variables;

	/// Sampling weight per row
	std::vector<double> weights;

	/// Stratum label per row (empty for unstratified designs)
	std::vector<std::string> strata;

	/// Cluster id per row (empty for element sampling)
	std::vector<std::string> cluster_ids;

	/// Canonical strings of the operations applied to the design
	std::vector<std::string> calls;
};

} // namespace core
} // namespace libanoimpute
