#include "libanoimpute/core/model_frame.hpp"
#include <stdexcept>

namespace libanoimpute {
namespace core {

ModelFrame ModelFrame::Build(const Dataset &data, const std::vector<std::string> &predictors) {
	ModelFrame frame;
	for (const auto &name : predictors) {
		const Column &column = data.GetColumn(name);
		Term term {name, column.Type(), 0, frame.labels_.size()};

		switch (column.Type()) {
		case ColumnType::NUMERIC:
		case ColumnType::LOGICAL:
			frame.labels_.push_back(name);
			break;
		case ColumnType::CATEGORICAL:
			term.n_levels = column.LevelCount();
			for (size_t level = 1; level < term.n_levels; level++) {
				frame.labels_.push_back(name + ":" + column.Levels()[level]);
			}
			break;
		}
		frame.terms_.push_back(term);
	}
	return frame;
}

Eigen::MatrixXd ModelFrame::Encode(const Dataset &data, const std::vector<size_t> &rows) const {
	Eigen::MatrixXd X = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(rows.size()),
	                                          static_cast<Eigen::Index>(labels_.size()));

	for (const auto &term : terms_) {
		const Column &column = data.GetColumn(term.name);
		if (column.Type() != term.type) {
			throw std::invalid_argument("Column '" + term.name + "' changed type since the model frame was built");
		}
		const auto col = static_cast<Eigen::Index>(term.first_column);

		for (size_t r = 0; r < rows.size(); r++) {
			const size_t row = rows[r];
			if (column.IsMissing(row)) {
				throw std::invalid_argument("Predictor '" + term.name + "' is missing in row " + std::to_string(row));
			}
			const auto r_idx = static_cast<Eigen::Index>(r);
			if (term.type == ColumnType::CATEGORICAL) {
				const size_t code = column.LevelCode(row);
				if (code > 0) {
					X(r_idx, col + static_cast<Eigen::Index>(code - 1)) = 1.0;
				}
			} else {
				X(r_idx, col) = column.Value(row);
			}
		}
	}
	return X;
}

Eigen::VectorXd ModelFrame::NumericResponse(const Column &target, const std::vector<size_t> &rows) {
	Eigen::VectorXd y(static_cast<Eigen::Index>(rows.size()));
	for (size_t r = 0; r < rows.size(); r++) {
		y(static_cast<Eigen::Index>(r)) = target.Value(rows[r]);
	}
	return y;
}

Eigen::VectorXd ModelFrame::BinaryResponse(const Column &target, const std::vector<size_t> &rows) {
	Eigen::VectorXd y(static_cast<Eigen::Index>(rows.size()));
	for (size_t r = 0; r < rows.size(); r++) {
		y(static_cast<Eigen::Index>(r)) = target.Value(rows[r]) > 0.0 ? 1.0 : 0.0;
	}
	return y;
}

std::vector<size_t> ModelFrame::ClassResponse(const Column &target, const std::vector<size_t> &rows) {
	std::vector<size_t> y;
	y.reserve(rows.size());
	for (size_t row : rows) {
		y.push_back(target.LevelCode(row));
	}
	return y;
}

} // namespace core
} // namespace libanoimpute
