#ifndef CADENCE_SAMPLESTATS_HPP
#define CADENCE_SAMPLESTATS_HPP
/**
 * @file SampleStats.hpp
 * @brief Descriptive statistics over timing sequences (count, min, max, mean, stdev, total).
 */

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "src/bench/inc/SampleErrors.hpp"

namespace cadence {
namespace bench {

/** @brief Ordered per-invocation durations in seconds (invocation order). */
using Timings = std::vector<double>;

/* ------------------------------ RunningStats ------------------------------ */

/**
 * @brief Online accumulator for mean and variance (Welford's update).
 *
 * Tracks the deviation sum M2 instead of a raw sum of squares, so variance
 * of small, close-together durations does not cancel catastrophically.
 * Shared by describe() and the sampler's stopping rule.
 *
 * @note RT-safe (no allocation).
 */
class RunningStats {
public:
  void push(double x) noexcept {
    ++count_;
    total_ += x;
    if (count_ == 1) {
      mean_ = x;
      min_ = x;
      max_ = x;
      return;
    }
    min_ = std::min(min_, x);
    max_ = std::max(max_, x);
    const double DELTA = x - mean_;
    mean_ += DELTA / static_cast<double>(count_);
    m2_ += DELTA * (x - mean_);
  }

  [[nodiscard]] std::size_t count() const noexcept { return count_; }
  [[nodiscard]] double mean() const noexcept { return mean_; }
  [[nodiscard]] double min() const noexcept { return min_; }
  [[nodiscard]] double max() const noexcept { return max_; }

  /** @brief Left-to-right sum of every pushed value. */
  [[nodiscard]] double total() const noexcept { return total_; }

  /** @brief Sample (n-1) variance; 0 for fewer than two values. */
  [[nodiscard]] double variance() const noexcept {
    if (count_ < 2) {
      return 0.0;
    }
    // Rounding can leave M2 a hair below zero for identical samples.
    return std::max(0.0, m2_ / static_cast<double>(count_ - 1));
  }

  [[nodiscard]] double stdev() const noexcept { return std::sqrt(variance()); }

private:
  std::size_t count_ = 0;
  double mean_ = 0.0;
  double m2_ = 0.0;
  double min_ = 0.0;
  double max_ = 0.0;
  double total_ = 0.0;
};

/* ------------------------------ StatsReport ------------------------------ */

/** @brief Summary of a timing sequence (seconds). */
struct StatsReport {
  std::size_t count{}; ///< number of samples
  double min{};        ///< minimum
  double max{};        ///< maximum
  double mean{};       ///< arithmetic mean
  double stdev{};      ///< sample standard deviation (0 for a single sample)
  double total{};      ///< sum of all samples

  bool operator==(const StatsReport&) const = default;
};

/* --------------------------------- API --------------------------------- */

/**
 * @brief Summarize a timing sequence.
 * @param timings Samples in seconds; left untouched.
 * @return StatsReport with count == timings.size().
 * @throws EmptyInputError if timings is empty.
 * @note NOT RT-safe (may throw).
 */
inline StatsReport describe(const std::vector<double>& timings) {
  if (timings.empty()) {
    throw EmptyInputError();
  }

  RunningStats acc;
  for (const double VAL : timings) {
    acc.push(VAL);
  }

  StatsReport out;
  out.count = acc.count();
  out.min = acc.min();
  out.max = acc.max();
  out.mean = std::clamp(acc.mean(), acc.min(), acc.max());
  out.stdev = acc.stdev();
  out.total = acc.total();
  return out;
}

/**
 * @brief Flatten a report into ordered (key, value) pairs.
 *
 * Keys: count, min, max, mean, stdev, total. Suitable for dataframe-style
 * consumers that expect one flat record per measurement.
 */
inline std::vector<std::pair<std::string, double>> toKeyValues(const StatsReport& r) {
  return {{"count", static_cast<double>(r.count)},
          {"min", r.min},
          {"max", r.max},
          {"mean", r.mean},
          {"stdev", r.stdev},
          {"total", r.total}};
}

} // namespace bench
} // namespace cadence

#endif // CADENCE_SAMPLESTATS_HPP
