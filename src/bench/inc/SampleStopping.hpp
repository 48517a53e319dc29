#ifndef CADENCE_SAMPLESTOPPING_HPP
#define CADENCE_SAMPLESTOPPING_HPP
/**
 * @file SampleStopping.hpp
 * @brief Adaptive stopping rule: stop once the mean is known within allowedDeviation.
 */

#include <cmath>
#include <cstddef>

#include "src/bench/inc/SampleConfig.hpp"
#include "src/bench/inc/SampleQuantile.hpp"
#include "src/bench/inc/SampleStats.hpp"

namespace cadence {
namespace bench {

/* ------------------------------ StoppingRule ------------------------------ */

/**
 * @brief Decides after each measured sample whether sampling may stop.
 *
 * Converged means: at least two samples, at least minRuns samples, and
 *
 *   z(confidenceLevel) * stdev / sqrt(n) <= allowedDeviation * mean
 *
 * The comparison is kept division-free so a zero mean converges only when the
 * spread is zero too; a tiny but noisy mean keeps sampling until maxRuns.
 * Reaching maxRuns stops unconditionally without marking convergence.
 *
 * Construct from a validated config; the critical value is computed once.
 *
 * @note RT-safe after construction (no allocation).
 */
class StoppingRule {
public:
  explicit StoppingRule(const SamplingConfig& cfg)
      : z_(zValue(cfg.confidenceLevel)), allowedDeviation_(cfg.allowedDeviation),
        minRuns_(static_cast<std::size_t>(cfg.minRuns)),
        maxRuns_(static_cast<std::size_t>(cfg.maxRuns)) {}

  /** @brief Record a sample. @return true when sampling should stop. */
  bool push(double sample) noexcept {
    stats_.push(sample);
    converged_ = checkConverged();
    return converged_ || stats_.count() >= maxRuns_;
  }

  /** @brief Half-width of the current confidence interval (0 below two samples). */
  [[nodiscard]] double margin() const noexcept {
    if (stats_.count() < 2) {
      return 0.0;
    }
    return z_ * stats_.stdev() / std::sqrt(static_cast<double>(stats_.count()));
  }

  [[nodiscard]] bool converged() const noexcept { return converged_; }
  [[nodiscard]] double criticalValue() const noexcept { return z_; }
  [[nodiscard]] const RunningStats& stats() const noexcept { return stats_; }

private:
  bool checkConverged() const noexcept {
    const std::size_t N = stats_.count();
    if (N < 2 || N < minRuns_) {
      return false;
    }
    const double MARGIN = margin();
    const double TOLERANCE = allowedDeviation_ * stats_.mean();
    if (!std::isfinite(MARGIN) || !std::isfinite(TOLERANCE)) {
      return false;
    }
    return MARGIN <= TOLERANCE;
  }

  double z_;
  double allowedDeviation_;
  std::size_t minRuns_;
  std::size_t maxRuns_;
  RunningStats stats_{};
  bool converged_ = false;
};

} // namespace bench
} // namespace cadence

#endif // CADENCE_SAMPLESTOPPING_HPP
