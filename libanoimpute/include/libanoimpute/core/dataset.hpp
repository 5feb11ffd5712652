#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace libanoimpute {
namespace core {

enum class ColumnType { NUMERIC, CATEGORICAL, LOGICAL };

using MissingMask = std::vector<bool>;

/// Label that marks a missing cell when building categorical columns from text
constexpr const char *kMissingLabel = "";

std::string ColumnTypeName(ColumnType type);

/**
 * A named, typed column with a per-row missing mask
 *
 * Storage is a flat vector of doubles for all types: numeric values,
 * level codes (0-based) for categorical columns and 0/1 for logical
 * columns. The value of a missing cell is unspecified.
 */
class Column {
public:
	Column(std::string name, ColumnType type, size_t n_rows);

	/// Numeric column, NaN entries become missing
	static Column Numeric(std::string name, const std::vector<double> &values);

	/// Categorical column from level codes, negative codes are missing
	static Column Categorical(std::string name, std::vector<std::string> levels, const std::vector<int> &codes);

	/// Logical column, an optional mask marks missing cells
	static Column Logical(std::string name, const std::vector<bool> &values, const MissingMask &missing = {});

	const std::string &Name() const {
		return name_;
	}

	ColumnType Type() const {
		return type_;
	}

	size_t Size() const {
		return values_.size();
	}

	bool IsMissing(size_t row) const {
		return missing_[row];
	}

	const MissingMask &Missing() const {
		return missing_;
	}

	size_t MissingCount() const;

	bool HasMissing() const;

	/// Numeric value, level code or 0/1 depending on the column type
	double Value(size_t row) const {
		return values_[row];
	}

	bool LogicalValue(size_t row) const {
		return values_[row] != 0.0;
	}

	size_t LevelCode(size_t row) const {
		return static_cast<size_t>(values_[row]);
	}

	const std::vector<std::string> &Levels() const {
		return levels_;
	}

	/// Number of distinct levels (2 for logical columns, 0 for numeric)
	size_t LevelCount() const;

	/// Level label of a categorical/logical cell
	std::string Label(size_t row) const;

	void SetNumeric(size_t row, double value);

	void SetLevel(size_t row, size_t code);

	void SetLogical(size_t row, bool value);

	void SetMissing(size_t row);

	/**
	 * Store a present but meaningless value in a cell
	 *
	 * Numeric cells receive 1, categorical cells the first level and
	 * logical cells false.
	 */
	void SetPlaceholder(size_t row);

	/**
	 * Convert this column to LOGICAL in place
	 *
	 * Numeric: non-zero is true. Categorical: labels TRUE/T/true/True/1 and
	 * FALSE/F/false/False/0 convert, any other label becomes missing.
	 */
	void CoerceToLogical();

	/// Copy of the selected rows
	Column Subset(const std::vector<size_t> &rows) const;

private:
	std::string name_;
	ColumnType type_;
	std::vector<double> values_;
	std::vector<std::string> levels_;
	MissingMask missing_;
};

/**
 * In-memory table of equally long named columns
 *
 * Column names are unique. The row count is fixed by the first column
 * added. Column references are invalidated by AddColumn().
 */
class Dataset {
public:
	Dataset() = default;

	size_t RowCount() const {
		return row_count_;
	}

	size_t ColumnCount() const {
		return columns_.size();
	}

	/**
	 * Append a column
	 *
	 * @throws std::invalid_argument on duplicate name or row count mismatch
	 */
	Dataset &AddColumn(Column column);

	Dataset &AddNumeric(const std::string &name, const std::vector<double> &values);

	/**
	 * Append a categorical column from labels
	 *
	 * @param labels One label per row, kMissingLabel marks a missing cell
	 * @param levels Ordered level set; inferred in order of first appearance
	 *               when empty
	 * @throws std::invalid_argument if a label is not in the given level set
	 */
	Dataset &AddCategorical(const std::string &name, const std::vector<std::string> &labels,
	                        std::vector<std::string> levels = {});

	Dataset &AddLogical(const std::string &name, const std::vector<bool> &values, const MissingMask &missing = {});

	bool HasColumn(const std::string &name) const;

	/// Index of named column or -1 when absent
	int FindColumnIndex(const std::string &name) const;

	/// @throws std::invalid_argument if no column has this name
	const Column &GetColumn(const std::string &name) const;
	Column &GetColumn(const std::string &name);

	const Column &GetColumn(size_t index) const {
		return columns_[index];
	}

	std::vector<std::string> ColumnNames() const;

	/// Copy of the selected rows, in the given order
	Dataset Subset(const std::vector<size_t> &rows) const;

	/**
	 * Numeric table from a dense matrix, NaN entries become missing
	 *
	 * @throws std::invalid_argument if names.size() != values.cols()
	 */
	static Dataset FromMatrix(const Eigen::MatrixXd &values, const std::vector<std::string> &names);

private:
	std::vector<Column> columns_;
	std::unordered_map<std::string, size_t> index_;
	size_t row_count_ = 0;
};

} // namespace core
} // namespace libanoimpute
