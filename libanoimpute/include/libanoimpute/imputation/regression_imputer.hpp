#pragma once

#include "libanoimpute/backend/model_backend.hpp"
#include "libanoimpute/core/dataset.hpp"
#include "libanoimpute/core/formula.hpp"
#include "libanoimpute/core/survey_design.hpp"
#include "libanoimpute/imputation/imputation_options.hpp"
#include "libanoimpute/imputation/imputation_report.hpp"
#include "libanoimpute/imputation/model_selector.hpp"
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace libanoimpute {
namespace imputation {

/**
 * Regression imputation driver
 *
 * For each target of a formula "t1 + t2 ~ p1 + p2", in order:
 *  1. no missing values: notice, nothing else
 *  2. rows with the target present and all predictors present are the fit
 *     rows; rows with the target missing and all predictors present are
 *     the impute rows
 *  3. no impute rows: the status column is written and a notice emitted
 *  4. otherwise the planned model is fitted on the fit rows and predicts
 *     the impute rows (with a placeholder in the target cell)
 *  5. categorical predictions are resolved by the draw policy, the values
 *     are written into the impute rows and the status column is committed
 *  6. missing cells left over (missing predictors) raise a warning
 *
 * Later targets see the values imputed for earlier ones. A fit or
 * prediction failure leaves the failing target and its status column
 * untouched and propagates; earlier targets stay imputed.
 */
class RegressionImputer {
public:
	/**
	 * @param options Imputation options, validated on every call
	 * @param backend Model backend; DefaultModelBackend when null
	 */
	explicit RegressionImputer(ImputationOptions options = ImputationOptions(),
	                           std::unique_ptr<backend::ModelBackend> backend = nullptr);

	/**
	 * Impute the targets of a formula in place
	 *
	 * @param formula Formula text "t1 + t2 ~ p1 + p2"
	 * @param data Dataset, mutated in place
	 * @param rng Random engine for stochastic draws of categorical targets
	 * @return Per-target report and notices
	 * @throws core::InvalidFormulaException before anything is changed
	 * @throws core::UnsupportedFamilyException when the offending target is reached
	 * @throws core::ModelFitException on fit or prediction failure
	 */
	ImputationReport Impute(const std::string &formula, core::Dataset &data, std::mt19937_64 &rng);

	/// Same, with an engine seeded from options.seed (or std::random_device)
	ImputationReport Impute(const std::string &formula, core::Dataset &data);

	/**
	 * Impute the variables of a survey design
	 *
	 * Weights, strata and ids are left as they are; the canonical call is
	 * appended to design.calls once imputation has finished.
	 */
	ImputationReport Impute(const std::string &formula, core::SurveyDesign &design, std::mt19937_64 &rng);

	ImputationReport Impute(const std::string &formula, core::SurveyDesign &design);

	const ImputationOptions &Options() const {
		return options_;
	}

	/// Canonical text of a call with the current options
	std::string DescribeCall(const core::Formula &formula) const;

private:
	VariableReport ImputeTarget(const core::Formula &formula, const std::string &target,
	                            const std::vector<bool> &static_complete, core::Dataset &data, std::mt19937_64 &rng,
	                            ImputationReport &report);

	/// Write the pre-imputation mask into "<target>_<suffix>"
	bool CommitStatusColumn(const std::string &target, const core::MissingMask &pre_mask, core::Dataset &data,
	                        ImputationReport &report) const;

	void Notify(ImputationReport &report, NoticeLevel level, const std::string &variable,
	            const std::string &message) const;

	std::mt19937_64 MakeEngine() const;

	ImputationOptions options_;
	std::unique_ptr<backend::ModelBackend> backend_;
};

} // namespace imputation
} // namespace libanoimpute
