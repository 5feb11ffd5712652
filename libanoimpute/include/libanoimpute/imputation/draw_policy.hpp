#pragma once

#include <Eigen/Dense>
#include <random>

namespace libanoimpute {
namespace imputation {

/**
 * Level code for a two-level target from P(second level)
 *
 * Deterministic: second level iff p > 0.5. Stochastic: Bernoulli(p).
 *
 * @return 0 for the first level, 1 for the second
 * @throws core::ModelFitException if p is not finite
 */
size_t ResolveBinary(double p, bool deterministic, std::mt19937_64 &rng);

/**
 * Level code for a multi-level target from its class probabilities
 *
 * Deterministic: index of the largest probability, the first one on ties.
 * Stochastic: one categorical draw.
 *
 * @throws core::ModelFitException if a probability is not finite or all are zero
 */
size_t ResolveMulticlass(const Eigen::RowVectorXd &probabilities, bool deterministic, std::mt19937_64 &rng);

} // namespace imputation
} // namespace libanoimpute
