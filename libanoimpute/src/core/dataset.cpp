#include "libanoimpute/core/dataset.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace libanoimpute {
namespace core {

std::string ColumnTypeName(ColumnType type) {
	switch (type) {
	case ColumnType::NUMERIC:
		return "numeric";
	case ColumnType::CATEGORICAL:
		return "categorical";
	case ColumnType::LOGICAL:
		return "logical";
	default:
		return "unknown";
	}
}

// ============================================================================
// Column
// ============================================================================

Column::Column(std::string name, ColumnType type, size_t n_rows)
    : name_(std::move(name)), type_(type), values_(n_rows, 0.0), missing_(n_rows, false) {
}

Column Column::Numeric(std::string name, const std::vector<double> &values) {
	Column column(std::move(name), ColumnType::NUMERIC, values.size());
	for (size_t i = 0; i < values.size(); i++) {
		if (std::isnan(values[i])) {
			column.missing_[i] = true;
		} else {
			column.values_[i] = values[i];
		}
	}
	return column;
}

Column Column::Categorical(std::string name, std::vector<std::string> levels, const std::vector<int> &codes) {
	Column column(std::move(name), ColumnType::CATEGORICAL, codes.size());
	column.levels_ = std::move(levels);
	for (size_t i = 0; i < codes.size(); i++) {
		if (codes[i] < 0) {
			column.missing_[i] = true;
			continue;
		}
		if (static_cast<size_t>(codes[i]) >= column.levels_.size()) {
			throw std::invalid_argument("Level code " + std::to_string(codes[i]) + " out of range for column '" +
			                            column.name_ + "'");
		}
		column.values_[i] = static_cast<double>(codes[i]);
	}
	return column;
}

Column Column::Logical(std::string name, const std::vector<bool> &values, const MissingMask &missing) {
	if (!missing.empty() && missing.size() != values.size()) {
		throw std::invalid_argument("Missing mask length does not match values for column '" + name + "'");
	}
	Column column(std::move(name), ColumnType::LOGICAL, values.size());
	for (size_t i = 0; i < values.size(); i++) {
		column.values_[i] = values[i] ? 1.0 : 0.0;
		column.missing_[i] = !missing.empty() && missing[i];
	}
	return column;
}

size_t Column::MissingCount() const {
	return static_cast<size_t>(std::count(missing_.begin(), missing_.end(), true));
}

bool Column::HasMissing() const {
	return std::find(missing_.begin(), missing_.end(), true) != missing_.end();
}

size_t Column::LevelCount() const {
	switch (type_) {
	case ColumnType::CATEGORICAL:
		return levels_.size();
	case ColumnType::LOGICAL:
		return 2;
	default:
		return 0;
	}
}

std::string Column::Label(size_t row) const {
	if (missing_[row]) {
		return kMissingLabel;
	}
	switch (type_) {
	case ColumnType::CATEGORICAL:
		return levels_[LevelCode(row)];
	case ColumnType::LOGICAL:
		return LogicalValue(row) ? "TRUE" : "FALSE";
	default:
		return std::to_string(values_[row]);
	}
}

void Column::SetNumeric(size_t row, double value) {
	if (type_ != ColumnType::NUMERIC) {
		throw std::invalid_argument("Column '" + name_ + "' is not numeric");
	}
	values_[row] = value;
	missing_[row] = std::isnan(value);
}

void Column::SetLevel(size_t row, size_t code) {
	if (type_ == ColumnType::LOGICAL) {
		SetLogical(row, code != 0);
		return;
	}
	if (type_ != ColumnType::CATEGORICAL) {
		throw std::invalid_argument("Column '" + name_ + "' is not categorical");
	}
	if (code >= levels_.size()) {
		throw std::invalid_argument("Level code " + std::to_string(code) + " out of range for column '" + name_ + "'");
	}
	values_[row] = static_cast<double>(code);
	missing_[row] = false;
}

void Column::SetLogical(size_t row, bool value) {
	if (type_ != ColumnType::LOGICAL) {
		throw std::invalid_argument("Column '" + name_ + "' is not logical");
	}
	values_[row] = value ? 1.0 : 0.0;
	missing_[row] = false;
}

void Column::SetMissing(size_t row) {
	missing_[row] = true;
}

void Column::SetPlaceholder(size_t row) {
	switch (type_) {
	case ColumnType::NUMERIC:
		values_[row] = 1.0;
		break;
	case ColumnType::CATEGORICAL:
		if (levels_.empty()) {
			throw std::invalid_argument("Column '" + name_ + "' has no levels");
		}
		values_[row] = 0.0;
		break;
	case ColumnType::LOGICAL:
		values_[row] = 0.0;
		break;
	}
	missing_[row] = false;
}

void Column::CoerceToLogical() {
	if (type_ == ColumnType::LOGICAL) {
		return;
	}

	for (size_t i = 0; i < values_.size(); i++) {
		if (missing_[i]) {
			continue;
		}
		if (type_ == ColumnType::NUMERIC) {
			values_[i] = values_[i] != 0.0 ? 1.0 : 0.0;
			continue;
		}

		const std::string &label = levels_[LevelCode(i)];
		if (label == "TRUE" || label == "T" || label == "true" || label == "True" || label == "1") {
			values_[i] = 1.0;
		} else if (label == "FALSE" || label == "F" || label == "false" || label == "False" || label == "0") {
			values_[i] = 0.0;
		} else {
			values_[i] = 0.0;
			missing_[i] = true;
		}
	}

	levels_.clear();
	type_ = ColumnType::LOGICAL;
}

Column Column::Subset(const std::vector<size_t> &rows) const {
	Column column(name_, type_, rows.size());
	column.levels_ = levels_;
	for (size_t i = 0; i < rows.size(); i++) {
		column.values_[i] = values_[rows[i]];
		column.missing_[i] = missing_[rows[i]];
	}
	return column;
}

// ============================================================================
// Dataset
// ============================================================================

Dataset &Dataset::AddColumn(Column column) {
	if (index_.count(column.Name()) > 0) {
		throw std::invalid_argument("Column '" + column.Name() + "' already exists");
	}
	if (!columns_.empty() && column.Size() != row_count_) {
		throw std::invalid_argument("Column '" + column.Name() + "' has " + std::to_string(column.Size()) +
		                            " rows, expected " + std::to_string(row_count_));
	}

	if (columns_.empty()) {
		row_count_ = column.Size();
	}
	index_[column.Name()] = columns_.size();
	columns_.push_back(std::move(column));
	return *this;
}

Dataset &Dataset::AddNumeric(const std::string &name, const std::vector<double> &values) {
	return AddColumn(Column::Numeric(name, values));
}

Dataset &Dataset::AddCategorical(const std::string &name, const std::vector<std::string> &labels,
                                 std::vector<std::string> levels) {
	const bool infer_levels = levels.empty();
	std::unordered_map<std::string, int> level_index;
	for (size_t l = 0; l < levels.size(); l++) {
		level_index[levels[l]] = static_cast<int>(l);
	}

	std::vector<int> codes(labels.size(), -1);
	for (size_t i = 0; i < labels.size(); i++) {
		if (labels[i] == kMissingLabel) {
			continue;
		}
		auto it = level_index.find(labels[i]);
		if (it == level_index.end()) {
			if (!infer_levels) {
				throw std::invalid_argument("Label '" + labels[i] + "' is not a level of column '" + name + "'");
			}
			it = level_index.emplace(labels[i], static_cast<int>(levels.size())).first;
			levels.push_back(labels[i]);
		}
		codes[i] = it->second;
	}

	return AddColumn(Column::Categorical(name, std::move(levels), codes));
}

Dataset &Dataset::AddLogical(const std::string &name, const std::vector<bool> &values, const MissingMask &missing) {
	return AddColumn(Column::Logical(name, values, missing));
}

bool Dataset::HasColumn(const std::string &name) const {
	return index_.count(name) > 0;
}

int Dataset::FindColumnIndex(const std::string &name) const {
	auto it = index_.find(name);
	if (it == index_.end()) {
		return -1;
	}
	return static_cast<int>(it->second);
}

const Column &Dataset::GetColumn(const std::string &name) const {
	auto it = index_.find(name);
	if (it == index_.end()) {
		throw std::invalid_argument("Column '" + name + "' not found in dataset");
	}
	return columns_[it->second];
}

Column &Dataset::GetColumn(const std::string &name) {
	auto it = index_.find(name);
	if (it == index_.end()) {
		throw std::invalid_argument("Column '" + name + "' not found in dataset");
	}
	return columns_[it->second];
}

std::vector<std::string> Dataset::ColumnNames() const {
	std::vector<std::string> names;
	names.reserve(columns_.size());
	for (const auto &column : columns_) {
		names.push_back(column.Name());
	}
	return names;
}

Dataset Dataset::Subset(const std::vector<size_t> &rows) const {
	for (size_t row : rows) {
		if (row >= row_count_) {
			throw std::invalid_argument("Row index " + std::to_string(row) + " out of bounds");
		}
	}

	Dataset result;
	for (const auto &column : columns_) {
		result.AddColumn(column.Subset(rows));
	}
	result.row_count_ = rows.size();
	return result;
}

Dataset Dataset::FromMatrix(const Eigen::MatrixXd &values, const std::vector<std::string> &names) {
	if (names.size() != static_cast<size_t>(values.cols())) {
		throw std::invalid_argument("Expected " + std::to_string(values.cols()) + " column names, got " +
		                            std::to_string(names.size()));
	}

	Dataset result;
	for (Eigen::Index j = 0; j < values.cols(); j++) {
		std::vector<double> column(static_cast<size_t>(values.rows()));
		for (Eigen::Index i = 0; i < values.rows(); i++) {
			column[static_cast<size_t>(i)] = values(i, j);
		}
		result.AddNumeric(names[static_cast<size_t>(j)], column);
	}
	return result;
}

} // namespace core
} // namespace libanoimpute
