#pragma once

#include "libanoimpute/core/dataset.hpp"
#include "libanoimpute/core/family.hpp"
#include "libanoimpute/core/formula.hpp"
#include "libanoimpute/core/regression_options.hpp"
#include "libanoimpute/solvers/multinomial_solver.hpp"
#include <Eigen/Dense>
#include <memory>
#include <string>
#include <vector>

namespace libanoimpute {
namespace backend {

/// Fitting routine chosen for one target
enum class ModelKind { LINEAR, ROBUST_LINEAR, GLM, ROBUST_GLM, MULTINOMIAL };

/// Scale of the values returned by FittedModel::Predict
enum class PredictionMode {
	POINT,        ///< Linear-model point prediction, one column
	RESPONSE,     ///< GLM mean on the response scale, one column
	PROBABILITIES ///< One column per class, rows sum to one
};

std::string ModelKindName(ModelKind kind);

/**
 * Everything a backend needs to fit one target
 */
struct ModelRequest {
	ModelKind kind = ModelKind::LINEAR;

	/// Used by GLM and ROBUST_GLM
	core::FamilySpec family = core::FamilySpec::Gaussian();

	/// Single-target formula "target ~ predictors"
	core::Formula formula;

	/// Rows of the dataset to fit on (target and predictors present)
	std::vector<size_t> rows;

	core::RegressionOptions regression;

	/// Receives multinomial progress output; nullptr discards it
	solvers::TraceSink trace;
};

/**
 * Model bound to one target, predictor set, row subset and family
 */
class FittedModel {
public:
	virtual ~FittedModel() = default;

	/**
	 * Predict every row of newdata
	 *
	 * newdata must carry the predictor columns and the target column; the
	 * target values themselves are not used.
	 *
	 * @return rows × 1 for POINT and RESPONSE, rows × n_classes for PROBABILITIES
	 * @throws core::ModelFitException if the predictions are not finite
	 */
	virtual Eigen::MatrixXd Predict(const core::Dataset &newdata, PredictionMode mode) const = 0;

	/// One-line description for debug logging
	virtual std::string Summary() const = 0;
};

/**
 * Fitting seam used by the imputation driver
 *
 * The driver treats fitting as a black box: fit(request, data) -> model,
 * model.predict(newdata, mode) -> values. Tests substitute a mock.
 */
class ModelBackend {
public:
	virtual ~ModelBackend() = default;

	/**
	 * @throws core::ModelFitException if the model cannot be fitted
	 */
	virtual std::unique_ptr<FittedModel> Fit(const ModelRequest &request, const core::Dataset &data) = 0;
};

} // namespace backend
} // namespace libanoimpute
