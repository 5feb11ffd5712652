#pragma once

#include "libanoimpute/core/dataset.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace libanoimpute {
namespace core {

/**
 * Numeric encoding of a predictor set
 *
 * Numeric predictors map to one column each, logical predictors to one
 * 0/1 column, and a categorical predictor with k levels to k-1 treatment
 * dummies against its first level. The encoding is taken from the full
 * level set of each column, so a frame built for fitting encodes
 * prediction rows with the same layout.
 */
class ModelFrame {
public:
	/**
	 * @param data Dataset holding the predictor columns
	 * @param predictors Predictor names, in formula order
	 * @throws std::invalid_argument if a predictor is not a column
	 */
	static ModelFrame Build(const Dataset &data, const std::vector<std::string> &predictors);

	/**
	 * Design matrix for the given rows (no intercept column)
	 *
	 * @throws std::invalid_argument if a predictor is missing in one of the rows
	 */
	Eigen::MatrixXd Encode(const Dataset &data, const std::vector<size_t> &rows) const;

	/// Encoded column labels, e.g. "x1", "m1:b" for the dummy of level b
	const std::vector<std::string> &ColumnLabels() const {
		return labels_;
	}

	size_t Width() const {
		return labels_.size();
	}

	/// Numeric response values of the given rows
	static Eigen::VectorXd NumericResponse(const Column &target, const std::vector<size_t> &rows);

	/// 0/1 response: 1 for the second level (or true)
	static Eigen::VectorXd BinaryResponse(const Column &target, const std::vector<size_t> &rows);

	/// Level codes of the given rows
	static std::vector<size_t> ClassResponse(const Column &target, const std::vector<size_t> &rows);

private:
	struct Term {
		std::string name;
		ColumnType type;
		size_t n_levels;
		size_t first_column;
	};

	std::vector<Term> terms_;
	std::vector<std::string> labels_;
};

} // namespace core
} // namespace libanoimpute
