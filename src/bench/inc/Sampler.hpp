#ifndef CADENCE_SAMPLER_HPP
#define CADENCE_SAMPLER_HPP
/**
 * @file Sampler.hpp
 * @brief Time a callable repeatedly until its mean cost is statistically stable.
 *
 * Typical usage:
 * @code{.cpp}
 *   cadence::bench::SamplingConfig cfg;
 *   cfg.clockKind = cadence::bench::ClockKind::WallTime;
 *   const auto timings = cadence::bench::measure([&] { parseFile(path); }, cfg);
 *   const auto report = cadence::bench::describe(timings);
 * @endcode
 *
 * Invocations are strictly sequential on the calling thread. Dispatch and
 * clock-read overhead is included in every sample, so sub-microsecond
 * targets are not meaningfully measurable.
 */

#include <algorithm>
#include <cstddef>
#include <functional>
#include <utility>

#include "src/bench/inc/SampleClock.hpp"
#include "src/bench/inc/SampleConfig.hpp"
#include "src/bench/inc/SampleErrors.hpp"
#include "src/bench/inc/SampleStats.hpp"
#include "src/bench/inc/SampleStopping.hpp"

namespace cadence {
namespace bench {

/* ----------------------------- SampleOutcome ----------------------------- */

/** @brief Raw samples plus how the stopping rule ended. */
struct SampleOutcome {
  Timings timings{};     ///< Measured durations (seconds), invocation order
  bool converged{false}; ///< Stopping rule fired before maxRuns
  double margin{};       ///< Final CI half-width (seconds)
};

/* --------------------------------- API --------------------------------- */

/**
 * @brief Run warmup and measured phases, timing with a caller-supplied clock.
 *
 * @param fn    Invoked with no arguments; exceptions propagate unchanged and
 *              discard every sample collected so far.
 * @param cfg   Validated before the first invocation.
 * @param clock Any callable returning the current time in seconds as double.
 * @throws ConfigurationError before fn is invoked when cfg is invalid.
 * @throws TimeBudgetError when measured time exceeds cfg.maxTotalSeconds.
 * @note NOT RT-safe (heap allocation, invokes arbitrary user code).
 */
template <typename Fn, typename Clock>
SampleOutcome sampleWith(Fn&& fn, const SamplingConfig& cfg, Clock&& clock) {
  validateSamplingConfig(cfg);
  StoppingRule rule(cfg);

  if (cfg.warmup) {
    for (int w = 0; w < cfg.warmupRuns; ++w) {
      std::invoke(fn);
    }
  }

  SampleOutcome out;
  out.timings.reserve(static_cast<std::size_t>(std::min(cfg.maxRuns, 64)));
  for (;;) {
    const double T0 = clock();
    std::invoke(fn);
    const double T1 = clock();

    // A clock stepping backwards must not produce negative samples.
    const double ELAPSED = std::max(0.0, T1 - T0);
    out.timings.push_back(ELAPSED);
    const bool DONE = rule.push(ELAPSED);

    if (cfg.maxTotalSeconds && rule.stats().total() > *cfg.maxTotalSeconds) {
      throw TimeBudgetError(rule.stats().total(), *cfg.maxTotalSeconds);
    }
    if (DONE) {
      break;
    }
  }

  out.converged = rule.converged();
  out.margin = rule.margin();
  return out;
}

/** @brief sampleWith() timed by the clock named in cfg.clockKind. */
template <typename Fn>
SampleOutcome sample(Fn&& fn, const SamplingConfig& cfg = SamplingConfig{}) {
  return sampleWith(std::forward<Fn>(fn), cfg, SystemClock{cfg.clockKind});
}

/**
 * @brief Measure with an injected clock; returns the raw timing sequence.
 * cfg.clockKind is ignored.
 */
template <typename Fn, typename Clock>
Timings measureWith(Fn&& fn, const SamplingConfig& cfg, Clock&& clock) {
  return sampleWith(std::forward<Fn>(fn), cfg, std::forward<Clock>(clock)).timings;
}

/**
 * @brief Measure a zero-argument callable; returns the raw timing sequence.
 *
 * The result holds between cfg.minRuns and cfg.maxRuns samples, all >= 0.
 * Warmup invocations are never part of it.
 */
template <typename Fn>
Timings measure(Fn&& fn, const SamplingConfig& cfg = SamplingConfig{}) {
  return sample(std::forward<Fn>(fn), cfg).timings;
}

/**
 * @brief Measure fn(args...), passing the same arguments on every invocation.
 * Arguments are held by reference for the duration of the call.
 */
template <typename Fn, typename... Args>
Timings measureCall(const SamplingConfig& cfg, Fn&& fn, Args&&... args) {
  return measure([&]() { std::invoke(fn, args...); }, cfg);
}

} // namespace bench
} // namespace cadence

#endif // CADENCE_SAMPLER_HPP
