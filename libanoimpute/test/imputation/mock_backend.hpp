#pragma once

#include "libanoimpute/backend/model_backend.hpp"
#include "libanoimpute/core/exceptions.hpp"
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace libanoimpute {
namespace testing {

/// What the mock saw, shared with the test after the backend is handed over
struct MockLog {
	std::vector<backend::ModelRequest> requests;
	std::vector<core::Dataset> predict_inputs;
	std::vector<backend::PredictionMode> predict_modes;
};

/**
 * Backend returning fixed predictions
 *
 * POINT and RESPONSE predictions are `value` for every row; class
 * probabilities are `probabilities` for every row.
 */
class MockBackend : public backend::ModelBackend {
public:
	MockBackend(std::shared_ptr<MockLog> log, double value, std::vector<double> probabilities = {},
	            std::set<std::string> failing_targets = {})
	    : log_(std::move(log)), value_(value), probabilities_(std::move(probabilities)),
	      failing_targets_(std::move(failing_targets)) {
	}

	std::unique_ptr<backend::FittedModel> Fit(const backend::ModelRequest &request, const core::Dataset &) override {
		log_->requests.push_back(request);
		if (failing_targets_.count(request.formula.targets.front()) > 0) {
			throw core::ModelFitException("mock failure for '" + request.formula.targets.front() + "'");
		}
		return std::make_unique<Model>(log_, value_, probabilities_);
	}

private:
	class Model : public backend::FittedModel {
	public:
		Model(std::shared_ptr<MockLog> log, double value, std::vector<double> probabilities)
		    : log_(std::move(log)), value_(value), probabilities_(std::move(probabilities)) {
		}

		Eigen::MatrixXd Predict(const core::Dataset &newdata, backend::PredictionMode mode) const override {
			log_->predict_inputs.push_back(newdata);
			log_->predict_modes.push_back(mode);
			const auto n = static_cast<Eigen::Index>(newdata.RowCount());
			if (mode == backend::PredictionMode::PROBABILITIES) {
				Eigen::MatrixXd probs(n, static_cast<Eigen::Index>(probabilities_.size()));
				for (Eigen::Index i = 0; i < n; i++) {
					for (size_t k = 0; k < probabilities_.size(); k++) {
						probs(i, static_cast<Eigen::Index>(k)) = probabilities_[k];
					}
				}
				return probs;
			}
			return Eigen::MatrixXd::Constant(n, 1, value_);
		}

		std::string Summary() const override {
			return "mock";
		}

	private:
		std::shared_ptr<MockLog> log_;
		double value_;
		std::vector<double> probabilities_;
	};

	std::shared_ptr<MockLog> log_;
	double value_;
	std::vector<double> probabilities_;
	std::set<std::string> failing_targets_;
};

} // namespace testing
} // namespace libanoimpute
