#include "libanoimpute/imputation/regression_imputer.hpp"
#include "libanoimpute/backend/default_model_backend.hpp"
#include "libanoimpute/core/exceptions.hpp"
#include "libanoimpute/imputation/completeness.hpp"
#include "libanoimpute/imputation/draw_policy.hpp"
#include "libanoimpute/utils/tracing.hpp"
#include <cmath>
#include <memory>
#include <sstream>
#include <utility>

namespace libanoimpute {
namespace imputation {

RegressionImputer::RegressionImputer(ImputationOptions options, std::unique_ptr<backend::ModelBackend> backend)
    : options_(std::move(options)), backend_(std::move(backend)) {
	if (!backend_) {
		backend_ = std::make_unique<backend::DefaultModelBackend>();
	}
}

std::string RegressionImputer::DescribeCall(const core::Formula &formula) const {
	std::ostringstream oss;
	oss << "regressionImp(" << formula.ToString() << ", family = " << core::FamilySelectorName(options_.family)
	    << ", robust = " << (options_.robust ? "TRUE" : "FALSE") << ", imp_var = " << (options_.imp_var ? "TRUE" : "FALSE")
	    << ", imp_suffix = \"" << options_.imp_suffix << "\", mod_cat = " << (options_.mod_cat ? "TRUE" : "FALSE")
	    << ")";
	return oss.str();
}

std::mt19937_64 RegressionImputer::MakeEngine() const {
	if (options_.seed.has_value()) {
		return std::mt19937_64(*options_.seed);
	}
	std::random_device device;
	std::seed_seq seq {device(), device(), device(), device()};
	return std::mt19937_64(seq);
}

void RegressionImputer::Notify(ImputationReport &report, NoticeLevel level, const std::string &variable,
                               const std::string &message) const {
	if (level == NoticeLevel::WARNING) {
		ANOIMPUTE_WARN(message);
	} else {
		ANOIMPUTE_INFO(message);
	}
	report.notices.push_back(Notice {level, variable, message});
}

ImputationReport RegressionImputer::Impute(const std::string &formula_text, core::Dataset &data) {
	std::mt19937_64 rng = MakeEngine();
	return Impute(formula_text, data, rng);
}

ImputationReport RegressionImputer::Impute(const std::string &formula_text, core::SurveyDesign &design) {
	std::mt19937_64 rng = MakeEngine();
	return Impute(formula_text, design, rng);
}

ImputationReport RegressionImputer::Impute(const std::string &formula_text, core::SurveyDesign &design,
                                           std::mt19937_64 &rng) {
	ImputationReport report = Impute(formula_text, design.variables, rng);
	design.calls.push_back(report.call);
	return report;
}

ImputationReport RegressionImputer::Impute(const std::string &formula_text, core::Dataset &data,
                                           std::mt19937_64 &rng) {
	options_.Validate();

	const core::Formula formula = core::ParseFormula(formula_text, data);

	ImputationReport report;
	report.call = DescribeCall(formula);
	ANOIMPUTE_DEBUG("Imputing " << report.call << " on " << data.RowCount() << " rows");

	// Predictors that are not imputed in this call keep their missing cells
	std::vector<std::string> static_predictors;
	for (const auto &name : formula.predictors) {
		if (!formula.IsTarget(name)) {
			static_predictors.push_back(name);
		}
	}
	const std::vector<bool> static_complete = CompletePredictorRows(data, static_predictors);

	for (const auto &target : formula.targets) {
		report.variables.push_back(ImputeTarget(formula, target, static_complete, data, rng, report));
	}
	return report;
}

bool RegressionImputer::CommitStatusColumn(const std::string &target, const core::MissingMask &pre_mask,
                                           core::Dataset &data, ImputationReport &report) const {
	if (!options_.imp_var) {
		return false;
	}

	const std::string status_name = target + "_" + options_.imp_suffix;
	if (!data.HasColumn(status_name)) {
		data.AddLogical(status_name, pre_mask);
		return false;
	}

	core::Column &status = data.GetColumn(status_name);
	status.CoerceToLogical();
	for (size_t row = 0; row < pre_mask.size(); row++) {
		status.SetLogical(row, pre_mask[row]);
	}
	Notify(report, NoticeLevel::WARNING, target,
	       "The following TRUE/FALSE imputation status variables will be updated: " + status_name);
	return true;
}

VariableReport RegressionImputer::ImputeTarget(const core::Formula &formula, const std::string &target,
                                               const std::vector<bool> &static_complete, core::Dataset &data,
                                               std::mt19937_64 &rng, ImputationReport &report) {
	VariableReport result;
	result.variable = target;

	const core::Column &column = data.GetColumn(target);
	result.missing_before = column.MissingCount();

	if (result.missing_before == 0) {
		Notify(report, NoticeLevel::INFO, target, "No missings in " + target + ".");
		result.outcome = VariableOutcome::NO_MISSING;
		return result;
	}

	const ModelPlan plan = SelectModel(column, options_.family, options_.robust);
	result.has_model = true;
	result.model_kind = plan.kind;
	result.model_description = plan.Describe();

	const core::Formula single = formula.ForTarget(target);

	// Predictors imputed earlier in this call are judged on their current values
	std::vector<std::string> dynamic_predictors;
	for (const auto &name : single.predictors) {
		if (formula.IsTarget(name)) {
			dynamic_predictors.push_back(name);
		}
	}
	std::vector<bool> complete = static_complete;
	if (!dynamic_predictors.empty()) {
		const std::vector<bool> dynamic_complete = CompletePredictorRows(data, dynamic_predictors);
		for (size_t row = 0; row < complete.size(); row++) {
			complete[row] = complete[row] && dynamic_complete[row];
		}
	}

	const core::MissingMask pre_mask = column.Missing();
	std::vector<bool> present(pre_mask.size());
	for (size_t row = 0; row < pre_mask.size(); row++) {
		present[row] = !pre_mask[row];
	}
	const std::vector<size_t> fit_rows = RowsWhere(complete, present);
	const std::vector<size_t> impute_rows = RowsWhere(complete, pre_mask);

	result.fit_rows = fit_rows.size();

	if (impute_rows.empty()) {
		result.status_overwritten = CommitStatusColumn(target, pre_mask, data, report);
		Notify(report, NoticeLevel::INFO, target,
		       "No missings in " + target + " with valid values in the predictor variables.");
		result.outcome = VariableOutcome::NO_IMPUTABLE_ROWS;
		result.still_missing = result.missing_before;
		return result;
	}

	ANOIMPUTE_TIMING_START();

	backend::ModelRequest request;
	request.kind = plan.kind;
	request.family = plan.family;
	request.formula = single;
	request.rows = fit_rows;
	request.regression = options_.regression;
	if (plan.kind == backend::ModelKind::MULTINOMIAL && options_.fit_trace == FitTrace::SURFACE) {
		request.trace = [](const std::string &line) { ANOIMPUTE_INFO(line); };
	}

	std::unique_ptr<backend::FittedModel> model = backend_->Fit(request, data);
	ANOIMPUTE_DEBUG("Fitted " << model->Summary());

	core::Dataset newdata = data.Subset(impute_rows);
	core::Column &placeholder = newdata.GetColumn(target);
	for (size_t row = 0; row < newdata.RowCount(); row++) {
		placeholder.SetPlaceholder(row);
	}

	const Eigen::MatrixXd predictions = model->Predict(newdata, plan.mode);
	model.reset();

	const auto expected_cols = plan.draw == DrawKind::MULTICLASS ? static_cast<Eigen::Index>(plan.n_levels) : 1;
	if (predictions.rows() != static_cast<Eigen::Index>(impute_rows.size()) || predictions.cols() != expected_cols) {
		throw core::ModelFitException("prediction for '" + target + "' returned " + std::to_string(predictions.rows()) +
		                              " x " + std::to_string(predictions.cols()) + " values, expected " +
		                              std::to_string(impute_rows.size()) + " x " + std::to_string(expected_cols));
	}

	// Resolve everything before touching the dataset
	std::vector<double> values(impute_rows.size());
	for (size_t r = 0; r < impute_rows.size(); r++) {
		const auto r_idx = static_cast<Eigen::Index>(r);
		switch (plan.draw) {
		case DrawKind::VALUE:
			values[r] = predictions(r_idx, 0);
			if (!std::isfinite(values[r])) {
				throw core::ModelFitException("non-finite prediction for '" + target + "'");
			}
			break;
		case DrawKind::BINARY:
			values[r] = static_cast<double>(ResolveBinary(predictions(r_idx, 0), options_.mod_cat, rng));
			break;
		case DrawKind::MULTICLASS:
			values[r] = static_cast<double>(ResolveMulticlass(predictions.row(r_idx), options_.mod_cat, rng));
			break;
		}
	}

	core::Column &writable = data.GetColumn(target);
	for (size_t r = 0; r < impute_rows.size(); r++) {
		if (plan.draw == DrawKind::VALUE) {
			writable.SetNumeric(impute_rows[r], values[r]);
		} else {
			writable.SetLevel(impute_rows[r], static_cast<size_t>(values[r]));
		}
	}
	result.status_overwritten = CommitStatusColumn(target, pre_mask, data, report);

	result.outcome = VariableOutcome::IMPUTED;
	result.imputed = impute_rows.size();
	result.still_missing = result.missing_before - result.imputed;

	if (result.still_missing > 0) {
		Notify(report, NoticeLevel::WARNING, target,
		       "There are still missing values in variable " + target +
		           ". Probably due to missing values in the regressors.");
	}

	ANOIMPUTE_TIMING_END("Imputation of '" + target + "'");
	return result;
}

} // namespace imputation
} // namespace libanoimpute
