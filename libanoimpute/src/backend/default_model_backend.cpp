#include "libanoimpute/backend/default_model_backend.hpp"
#include "libanoimpute/core/exceptions.hpp"
#include "libanoimpute/core/model_frame.hpp"
#include "libanoimpute/solvers/glm_solver.hpp"
#include "libanoimpute/solvers/multinomial_solver.hpp"
#include "libanoimpute/solvers/ols_solver.hpp"
#include "libanoimpute/solvers/robust_linear_solver.hpp"
#include "libanoimpute/utils/tracing.hpp"
#include <cmath>
#include <memory>
#include <sstream>
#include <utility>

namespace libanoimpute {
namespace backend {

std::string ModelKindName(ModelKind kind) {
	switch (kind) {
	case ModelKind::LINEAR:
		return "linear";
	case ModelKind::ROBUST_LINEAR:
		return "robust linear";
	case ModelKind::GLM:
		return "glm";
	case ModelKind::ROBUST_GLM:
		return "robust glm";
	case ModelKind::MULTINOMIAL:
		return "multinomial";
	default:
		return "unknown";
	}
}

namespace {

void CheckFinite(const Eigen::MatrixXd &values, const std::string &target) {
	if (!values.allFinite()) {
		throw core::ModelFitException("non-finite predictions for '" + target + "'");
	}
}

/// Linear models and GLMs: one linear predictor
class LinearPredictorModel : public FittedModel {
public:
	LinearPredictorModel(ModelKind kind, core::FamilySpec family, core::Formula formula, core::ModelFrame frame,
	                     core::RegressionResult fit)
	    : kind_(kind), family_(family), formula_(std::move(formula)), frame_(std::move(frame)), fit_(std::move(fit)) {
	}

	Eigen::MatrixXd Predict(const core::Dataset &newdata, PredictionMode mode) const override {
		if (mode == PredictionMode::PROBABILITIES) {
			throw std::invalid_argument("Class probabilities requested from a " + ModelKindName(kind_) + " model");
		}

		std::vector<size_t> rows(newdata.RowCount());
		for (size_t i = 0; i < rows.size(); i++) {
			rows[i] = i;
		}
		const Eigen::MatrixXd X = frame_.Encode(newdata, rows);

		Eigen::MatrixXd out(X.rows(), 1);
		if (kind_ == ModelKind::GLM || kind_ == ModelKind::ROBUST_GLM) {
			out.col(0) = mode == PredictionMode::RESPONSE ? solvers::GLMSolver::PredictResponse(fit_, X, family_)
			                                              : solvers::OLSSolver::Predict(fit_, X);
		} else {
			out.col(0) = solvers::OLSSolver::Predict(fit_, X);
		}
		CheckFinite(out, formula_.targets.front());
		return out;
	}

	std::string Summary() const override {
		std::ostringstream oss;
		oss << ModelKindName(kind_);
		if (kind_ == ModelKind::GLM || kind_ == ModelKind::ROBUST_GLM) {
			oss << " " << family_.Name();
		}
		oss << " for " << formula_.ToString() << ": n=" << fit_.n_obs << ", rank=" << fit_.rank
		    << ", df.residual=" << fit_.df_residual();
		if (std::isfinite(fit_.deviance)) {
			oss << ", deviance=" << fit_.deviance << ", null deviance=" << fit_.null_deviance;
		} else {
			oss << ", R2=" << fit_.r_squared;
		}
		if (std::isfinite(fit_.scale)) {
			oss << ", scale=" << fit_.scale;
		}
		if (fit_.iterations > 0) {
			oss << ", iterations=" << fit_.iterations;
		}
		return oss.str();
	}

private:
	ModelKind kind_;
	core::FamilySpec family_;
	core::Formula formula_;
	core::ModelFrame frame_;
	core::RegressionResult fit_;
};

/// Softmax model over the classes observed in the training rows
class MultinomialModel : public FittedModel {
public:
	MultinomialModel(core::Formula formula, core::ModelFrame frame, core::MultinomialResult fit,
	                 std::vector<size_t> observed_classes, size_t n_levels)
	    : formula_(std::move(formula)), frame_(std::move(frame)), fit_(std::move(fit)),
	      observed_classes_(std::move(observed_classes)), n_levels_(n_levels) {
	}

	Eigen::MatrixXd Predict(const core::Dataset &newdata, PredictionMode mode) const override {
		if (mode != PredictionMode::PROBABILITIES) {
			throw std::invalid_argument("Multinomial models only predict class probabilities");
		}

		std::vector<size_t> rows(newdata.RowCount());
		for (size_t i = 0; i < rows.size(); i++) {
			rows[i] = i;
		}
		const Eigen::MatrixXd X = frame_.Encode(newdata, rows);
		const Eigen::MatrixXd fitted = fit_.Probabilities(X);

		Eigen::MatrixXd probs = Eigen::MatrixXd::Zero(X.rows(), static_cast<Eigen::Index>(n_levels_));
		for (size_t k = 0; k < observed_classes_.size(); k++) {
			probs.col(static_cast<Eigen::Index>(observed_classes_[k])) = fitted.col(static_cast<Eigen::Index>(k));
		}
		CheckFinite(probs, formula_.targets.front());
		return probs;
	}

	std::string Summary() const override {
		std::ostringstream oss;
		oss << "multinomial for " << formula_.ToString() << ": n=" << fit_.n_obs << ", classes="
		    << observed_classes_.size() << "/" << n_levels_ << ", deviance=" << fit_.deviance
		    << ", iterations=" << fit_.iterations;
		return oss.str();
	}

private:
	core::Formula formula_;
	core::ModelFrame frame_;
	core::MultinomialResult fit_;
	std::vector<size_t> observed_classes_;
	size_t n_levels_;
};

} // namespace

std::unique_ptr<FittedModel> DefaultModelBackend::Fit(const ModelRequest &request, const core::Dataset &data) {
	if (request.formula.targets.size() != 1) {
		throw std::invalid_argument("Model request must name exactly one target");
	}
	const std::string &target_name = request.formula.targets.front();
	if (request.rows.empty()) {
		throw core::ModelFitException("0 (non-NA) cases for '" + target_name + "'");
	}

	const core::Column &target = data.GetColumn(target_name);
	for (size_t row : request.rows) {
		if (target.IsMissing(row)) {
			throw std::invalid_argument("Target '" + target_name + "' is missing in fit row " + std::to_string(row));
		}
	}

	core::ModelFrame frame = core::ModelFrame::Build(data, request.formula.predictors);
	const Eigen::MatrixXd X = frame.Encode(data, request.rows);

	ANOIMPUTE_TRACE("Design for '" << target_name << "': " << X.rows() << " x " << X.cols());

	if (request.kind == ModelKind::MULTINOMIAL) {
		const size_t n_levels = target.LevelCount();
		std::vector<size_t> classes = core::ModelFrame::ClassResponse(target, request.rows);

		// Compact the observed classes to 0..K-1
		std::vector<int> compact(n_levels, -1);
		std::vector<size_t> observed;
		for (size_t label : classes) {
			if (compact[label] < 0) {
				compact[label] = 0;
			}
		}
		for (size_t level = 0; level < n_levels; level++) {
			if (compact[level] == 0) {
				compact[level] = static_cast<int>(observed.size());
				observed.push_back(level);
			}
		}
		if (observed.size() < 2) {
			throw core::ModelFitException("'" + target_name + "' has fewer than two observed classes");
		}
		for (auto &label : classes) {
			label = static_cast<size_t>(compact[label]);
		}

		core::MultinomialResult fit =
		    solvers::MultinomialSolver::Fit(classes, X, observed.size(), request.regression, request.trace);
		return std::make_unique<MultinomialModel>(request.formula, std::move(frame), std::move(fit), std::move(observed),
		                                          n_levels);
	}

	Eigen::VectorXd y;
	if (target.Type() == core::ColumnType::NUMERIC) {
		y = core::ModelFrame::NumericResponse(target, request.rows);
	} else {
		y = core::ModelFrame::BinaryResponse(target, request.rows);
		if (y.minCoeff() == y.maxCoeff()) {
			throw core::ModelFitException("'" + target_name + "' has fewer than two observed classes");
		}
	}

	core::RegressionResult fit;
	switch (request.kind) {
	case ModelKind::LINEAR:
		fit = solvers::OLSSolver::Fit(y, X, request.regression);
		break;
	case ModelKind::ROBUST_LINEAR:
		fit = solvers::RobustLinearSolver::Fit(y, X, request.regression);
		break;
	case ModelKind::GLM:
		fit = solvers::GLMSolver::Fit(y, X, request.family, request.regression);
		break;
	case ModelKind::ROBUST_GLM:
		fit = solvers::GLMSolver::FitRobust(y, X, request.family, request.regression);
		break;
	default:
		throw std::invalid_argument("Unhandled model kind " + ModelKindName(request.kind));
	}

	return std::make_unique<LinearPredictorModel>(request.kind, request.family, request.formula, std::move(frame),
	                                              std::move(fit));
}

} // namespace backend
} // namespace libanoimpute
