#include "libanoimpute/imputation/completeness.hpp"
#include <stdexcept>

namespace libanoimpute {
namespace imputation {

std::vector<bool> CompletePredictorRows(const core::Dataset &data, const std::vector<std::string> &predictors) {
	std::vector<bool> complete(data.RowCount(), true);
	for (const auto &name : predictors) {
		const core::Column &column = data.GetColumn(name);
		for (size_t row = 0; row < complete.size(); row++) {
			if (column.IsMissing(row)) {
				complete[row] = false;
			}
		}
	}
	return complete;
}

std::vector<size_t> RowsWhere(const std::vector<bool> &a, const std::vector<bool> &b) {
	if (a.size() != b.size()) {
		throw std::invalid_argument("Row masks differ in length");
	}
	std::vector<size_t> rows;
	for (size_t row = 0; row < a.size(); row++) {
		if (a[row] && b[row]) {
			rows.push_back(row);
		}
	}
	return rows;
}

} // namespace imputation
} // namespace libanoimpute
