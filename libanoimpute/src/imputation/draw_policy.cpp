#include "libanoimpute/imputation/draw_policy.hpp"
#include "libanoimpute/core/exceptions.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace libanoimpute {
namespace imputation {

size_t ResolveBinary(double p, bool deterministic, std::mt19937_64 &rng) {
	if (!std::isfinite(p)) {
		throw core::ModelFitException("predicted probability is not finite");
	}
	if (deterministic) {
		return p > 0.5 ? 1 : 0;
	}
	std::bernoulli_distribution draw(std::min(std::max(p, 0.0), 1.0));
	return draw(rng) ? 1 : 0;
}

size_t ResolveMulticlass(const Eigen::RowVectorXd &probabilities, bool deterministic, std::mt19937_64 &rng) {
	if (probabilities.size() == 0 || !probabilities.allFinite()) {
		throw core::ModelFitException("predicted class probabilities are not finite");
	}

	if (deterministic) {
		Eigen::Index best = 0;
		for (Eigen::Index k = 1; k < probabilities.size(); k++) {
			if (probabilities(k) > probabilities(best)) {
				best = k;
			}
		}
		return static_cast<size_t>(best);
	}

	std::vector<double> weights(static_cast<size_t>(probabilities.size()));
	double total = 0.0;
	for (Eigen::Index k = 0; k < probabilities.size(); k++) {
		weights[static_cast<size_t>(k)] = std::max(probabilities(k), 0.0);
		total += weights[static_cast<size_t>(k)];
	}
	if (!(total > 0.0)) {
		throw core::ModelFitException("predicted class probabilities are all zero");
	}
	std::discrete_distribution<size_t> draw(weights.begin(), weights.end());
	return draw(rng);
}

} // namespace imputation
} // namespace libanoimpute
