#ifndef CADENCE_SAMPLECONFIG_HPP
#define CADENCE_SAMPLECONFIG_HPP
/**
 * @file SampleConfig.hpp
 * @brief Sampling tunables, their validation, and a flag parser that preserves gtest args.
 */

#include <cmath>     // std::isfinite
#include <cstdio>    // std::fprintf
#include <cstdlib>   // std::atoi, std::strtod, std::exit
#include <optional>
#include <string>
#include <string_view>

#include "src/bench/inc/SampleClock.hpp"
#include "src/bench/inc/SampleErrors.hpp"

namespace cadence {
namespace bench {

/* ---------------------------- SamplingConfig ---------------------------- */

/** @brief Controls warmup, the stopping rule, and the clock for one measure() call. */
struct SamplingConfig {
  bool warmup = true;                         ///< Run (and discard) a warmup phase first
  int warmupRuns = 1;                         ///< Untimed warmup invocations when warmup is on
  double allowedDeviation = 0.1;              ///< Tolerated CI half-width relative to the mean
  double confidenceLevel = 0.95;              ///< Confidence of the interval, in (0, 1)
  int minRuns = 3;                            ///< Fewest measured invocations
  int maxRuns = 1000;                         ///< Most measured invocations (hard stop)
  ClockKind clockKind = ClockKind::ProcessTime; ///< Clock bracketing each invocation
  std::optional<double> maxTotalSeconds{};    ///< Abort when measured time exceeds this
};

/* -------------------------------- Validate -------------------------------- */

/**
 * @brief Reject self-contradictory configurations.
 * @throws ConfigurationError naming the first offending field.
 * @note NOT RT-safe (may throw, heap allocation for the message).
 */
inline void validateSamplingConfig(const SamplingConfig& cfg) {
  const auto IN_OPEN_UNIT = [](double v) { return std::isfinite(v) && v > 0.0 && v < 1.0; };

  if (cfg.warmup && cfg.warmupRuns <= 0) {
    throw ConfigurationError("warmupRuns must be positive when warmup is enabled, got " +
                             std::to_string(cfg.warmupRuns));
  }
  if (!IN_OPEN_UNIT(cfg.allowedDeviation)) {
    throw ConfigurationError("allowedDeviation must be in (0, 1), got " +
                             std::to_string(cfg.allowedDeviation));
  }
  if (!IN_OPEN_UNIT(cfg.confidenceLevel)) {
    throw ConfigurationError("confidenceLevel must be in (0, 1), got " +
                             std::to_string(cfg.confidenceLevel));
  }
  if (cfg.minRuns < 1) {
    throw ConfigurationError("minRuns must be at least 1, got " + std::to_string(cfg.minRuns));
  }
  if (cfg.maxRuns < cfg.minRuns) {
    throw ConfigurationError("maxRuns (" + std::to_string(cfg.maxRuns) +
                             ") is smaller than minRuns (" + std::to_string(cfg.minRuns) + ")");
  }
  if (cfg.maxTotalSeconds && !(std::isfinite(*cfg.maxTotalSeconds) && *cfg.maxTotalSeconds > 0.0)) {
    throw ConfigurationError("maxTotalSeconds must be positive, got " +
                             std::to_string(*cfg.maxTotalSeconds));
  }
}

/* ----------------------------- HarnessConfig ----------------------------- */

/** @brief Sampling knobs plus test-binary options (CLI-overridable). */
struct HarnessConfig {
  SamplingConfig sampling{};        ///< Passed to every SampleCase
  std::optional<std::string> csv{}; ///< Optional CSV output path
  bool quickMode = false;           ///< Looser stopping rule for fast iteration
};

/* --------------------------------- API --------------------------------- */

/**
 * @brief Parse sampling flags, leaving unknown args for gtest. Mutates argc/argv.
 *
 * Recognized flags:
 *   --warmup-runs N        --no-warmup          --allowed-deviation D
 *   --confidence C         --min-runs N         --max-runs N
 *   --clock wall|process   --max-time SECONDS   --csv PATH
 *   --quick            (min-runs 2, max-runs 50, allowed-deviation 0.2 unless set)
 *
 * Values are not range-checked here; validateSamplingConfig() does that.
 *
 * @note NOT RT-safe (heap allocation, console I/O, may call exit()).
 */
inline void parseSampleFlags(HarnessConfig& cfg, int* argc, char** argv) {
  const auto NEED_ARG = [&](const char* name, int i, int argcVal, char** argvVal) -> const char* {
    if (i + 1 >= argcVal) {
      std::fprintf(stderr, "Missing value for %s\n", name);
      std::exit(2);
    }
    return argvVal[i + 1];
  };

  SamplingConfig& s = cfg.sampling;

  // Track explicit values so --quick does not override them
  bool minRunsSet = false;
  bool maxRunsSet = false;
  bool deviationSet = false;

  int w = 1;
  for (int i = 1; i < *argc; ++i) {
    std::string_view a = argv[i];

    if (a == "--warmup-runs") {
      s.warmupRuns = std::atoi(NEED_ARG("--warmup-runs", i, *argc, argv));
      s.warmup = true;
      ++i;
    } else if (a == "--no-warmup") {
      s.warmup = false;
    } else if (a == "--allowed-deviation") {
      s.allowedDeviation = std::strtod(NEED_ARG("--allowed-deviation", i, *argc, argv), nullptr);
      deviationSet = true;
      ++i;
    } else if (a == "--confidence") {
      s.confidenceLevel = std::strtod(NEED_ARG("--confidence", i, *argc, argv), nullptr);
      ++i;
    } else if (a == "--min-runs") {
      s.minRuns = std::atoi(NEED_ARG("--min-runs", i, *argc, argv));
      minRunsSet = true;
      ++i;
    } else if (a == "--max-runs") {
      s.maxRuns = std::atoi(NEED_ARG("--max-runs", i, *argc, argv));
      maxRunsSet = true;
      ++i;
    } else if (a == "--clock") {
      const char* NAME = NEED_ARG("--clock", i, *argc, argv);
      const auto KIND = parseClockKind(NAME);
      if (!KIND) {
        std::fprintf(stderr, "Unknown clock '%s' (expected wall or process)\n", NAME);
        std::exit(2);
      }
      s.clockKind = *KIND;
      ++i;
    } else if (a == "--max-time") {
      s.maxTotalSeconds = std::strtod(NEED_ARG("--max-time", i, *argc, argv), nullptr);
      ++i;
    } else if (a == "--csv") {
      cfg.csv = std::string(NEED_ARG("--csv", i, *argc, argv));
      ++i;
    } else if (a == "--quick") {
      cfg.quickMode = true;
    }

    // Pass-through to gtest
    else {
      argv[w++] = argv[i];
    }
  }
  *argc = w;

  if (cfg.quickMode) {
    if (!minRunsSet) {
      s.minRuns = 2;
    }
    if (!maxRunsSet) {
      s.maxRuns = 50;
    }
    if (!deviationSet) {
      s.allowedDeviation = 0.2;
    }
  }
}

} // namespace bench
} // namespace cadence

#endif // CADENCE_SAMPLECONFIG_HPP
