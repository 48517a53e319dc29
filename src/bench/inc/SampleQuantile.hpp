#ifndef CADENCE_SAMPLEQUANTILE_HPP
#define CADENCE_SAMPLEQUANTILE_HPP
/**
 * @file SampleQuantile.hpp
 * @brief Critical values and sample-size estimates for the stopping rule.
 *
 * The stopping rule uses the normal approximation for the sampling
 * distribution of the mean: the half-width of a two-sided confidence
 * interval at level c is
 *
 *   margin = z(c) * stdev / sqrt(n),   z(c) = Phi^-1((1 + c) / 2)
 *
 * and sampling has converged once margin <= allowedDeviation * mean.
 */

#include <vector>

#include "src/bench/inc/SampleStats.hpp"

namespace cadence {
namespace bench {

/* --------------------------------- API --------------------------------- */

/**
 * @brief Inverse of the standard normal CDF.
 * @param p Probability in (0, 1).
 * @throws ConfigurationError if p is outside (0, 1).
 */
double inverseNormalCdf(double p);

/**
 * @brief Two-sided critical value for a confidence level (1.959964 for 0.95).
 * @throws ConfigurationError if confidenceLevel is outside (0, 1).
 */
double zValue(double confidenceLevel);

/**
 * @brief Half-width of the confidence interval around the running mean.
 * @return 0 for fewer than two samples.
 */
double marginOfError(const RunningStats& stats, double confidenceLevel);

/**
 * @brief Number of samples needed for margin <= allowedDeviation * mean.
 *
 * Estimated from the current spread as ceil((z * stdev / (allowedDeviation * mean))^2),
 * never less than 2. Saturates at INT_MAX when no finite sample count can
 * satisfy the rule (zero mean with nonzero spread).
 */
int requiredSampleSize(const RunningStats& stats, double allowedDeviation,
                       double confidenceLevel = 0.95);

/** @brief Convenience overload over a raw timing sequence. */
int requiredSampleSize(const std::vector<double>& timings, double allowedDeviation,
                       double confidenceLevel = 0.95);

} // namespace bench
} // namespace cadence

#endif // CADENCE_SAMPLEQUANTILE_HPP
