#pragma once

#include "libanoimpute/core/dataset.hpp"
#include <string>
#include <vector>

namespace libanoimpute {
namespace imputation {

/**
 * Per-row completeness of a predictor set
 *
 * @return One flag per row, true iff no listed predictor is missing there
 *         (all true for an empty predictor list)
 * @throws std::invalid_argument if a predictor is not a column
 */
std::vector<bool> CompletePredictorRows(const core::Dataset &data, const std::vector<std::string> &predictors);

/// Indices of the rows where both masks are true
std::vector<size_t> RowsWhere(const std::vector<bool> &a, const std::vector<bool> &b);

} // namespace imputation
} // namespace libanoimpute
