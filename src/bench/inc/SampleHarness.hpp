#ifndef CADENCE_SAMPLEHARNESS_HPP
#define CADENCE_SAMPLEHARNESS_HPP
/**
 * @file SampleHarness.hpp
 * @brief Test-side constructs layered over the sampler.
 *
 * Includes console printing, metadata capture, and the SampleCase class that
 * runs measure + describe, prints a result line and records a row for the
 * gtest listener.
 */

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <ctime>
#include <string>
#include <tuple>
#include <utility>

#include <unistd.h> // gethostname

#include "src/bench/inc/SampleConfig.hpp"
#include "src/bench/inc/SampleRegistry.hpp"
#include "src/bench/inc/SampleStats.hpp"
#include "src/bench/inc/Sampler.hpp"

namespace cadence {
namespace bench {

/* ----------------------------- Console Printing ----------------------------- */

/**
 * @brief Format a duration in seconds with an s/ms/us unit.
 * @note RT-safe (pure computation).
 */
inline void formatSeconds(char* buf, std::size_t bufLen, double seconds) {
  if (seconds >= 1.0) {
    std::snprintf(buf, bufLen, "%.3f s", seconds);
  } else if (seconds >= 1e-3) {
    std::snprintf(buf, bufLen, "%.3f ms", seconds * 1e3);
  } else {
    std::snprintf(buf, bufLen, "%.3f us", seconds * 1e6);
  }
}

/**
 * @brief Print a compact, scannable result line.
 *
 * Format: [Suite.Name]  mean=1.234 ms  sd=0.045 ms  n=12  (min=1.190 ms max=1.310 ms
 * total=14.808 ms, process)
 *
 * @note NOT RT-safe (console I/O).
 */
inline void printReport(const char* label, const StatsReport& r, ClockKind clock,
                        bool converged) {
  char meanBuf[24];
  char sdBuf[24];
  char minBuf[24];
  char maxBuf[24];
  char totalBuf[24];
  formatSeconds(meanBuf, sizeof(meanBuf), r.mean);
  formatSeconds(sdBuf, sizeof(sdBuf), r.stdev);
  formatSeconds(minBuf, sizeof(minBuf), r.min);
  formatSeconds(maxBuf, sizeof(maxBuf), r.max);
  formatSeconds(totalBuf, sizeof(totalBuf), r.total);

  const char* STABILITY = converged ? "" : " [NOT CONVERGED]";

  std::printf("%s  mean=%s  sd=%s  n=%zu  (min=%s max=%s total=%s, %s)%s\n", label, meanBuf,
              sdBuf, r.count, minBuf, maxBuf, totalBuf, toString(clock), STABILITY);
}

/**
 * @brief Print actionable hints when sampling ran out of runs.
 * @note NOT RT-safe (console I/O).
 */
inline void printHints(const SampleOutcome& outcome, const StatsReport& r,
                       const SamplingConfig& cfg) {
  if (outcome.converged) {
    return;
  }
  const double RELATIVE = (r.mean > 0.0) ? outcome.margin / r.mean : 0.0;
  std::fprintf(stderr,
               "  [WARN] Stopped at max-runs=%d with margin %.1f%% of mean (allowed %.1f%%).\n"
               "         Try a larger --max-runs or a looser --allowed-deviation\n",
               cfg.maxRuns, RELATIVE * 100.0, cfg.allowedDeviation * 100.0);
  if (cfg.clockKind == ClockKind::ProcessTime && r.mean == 0.0) {
    std::fprintf(stderr, "  [INFO] Process time is 0: target may be sleep/IO bound, try --clock wall\n");
  }
}

/* ----------------------------- Metadata Capture ----------------------------- */

/**
 * @brief Capture current timestamp in ISO 8601 format.
 * @note NOT RT-safe (system calls, heap allocation).
 */
inline std::string captureTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::array<char, 32> buf{};
  std::strftime(buf.data(), buf.size(), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return std::string(buf.data());
}

/**
 * @brief Capture system hostname.
 * @note NOT RT-safe (system call, heap allocation).
 */
inline std::string captureHostname() {
  std::array<char, 256> buf{};
  if (gethostname(buf.data(), buf.size()) == 0) {
    buf.back() = '\0';
    return std::string(buf.data());
  }
  return "unknown";
}

/**
 * @brief Detect platform architecture.
 * @note RT-safe (compile-time constant string).
 */
inline std::string capturePlatform() {
#if defined(__x86_64__)
  return "x86_64";
#elif defined(__aarch64__)
  return "aarch64";
#elif defined(__arm__)
  return "arm";
#elif defined(__i386__)
  return "x86";
#elif defined(__riscv)
  return "riscv";
#else
  return "unknown";
#endif
}

/**
 * @brief Capture all metadata at once; hostname and platform are cached.
 * @return Tuple of (timestamp, hostname, platform).
 * @note NOT RT-safe (system calls, heap allocation).
 */
inline std::tuple<std::string, std::string, std::string> captureMetadata() {
  static const std::string HOSTNAME = captureHostname();
  static const std::string PLATFORM = capturePlatform();
  return std::make_tuple(captureTimestamp(), HOSTNAME, PLATFORM);
}

/* ----------------------------- Row Builder ----------------------------- */

/**
 * @brief Build a SampleRow from a test name, its config and the outcome.
 * @note NOT RT-safe (captures metadata via system calls).
 */
inline SampleRow buildSampleRow(const std::string& testName, const SamplingConfig& cfg,
                                const StatsReport& report, const SampleOutcome& outcome) {
  auto [timestamp, hostname, platform] = captureMetadata();

  SampleRow row;
  row.testName = testName;
  row.clock = toString(cfg.clockKind);
  row.warmup = cfg.warmup;
  row.warmupRuns = cfg.warmup ? cfg.warmupRuns : 0;
  row.allowedDeviation = cfg.allowedDeviation;
  row.confidenceLevel = cfg.confidenceLevel;
  row.minRuns = cfg.minRuns;
  row.maxRuns = cfg.maxRuns;
  row.report = report;
  row.converged = outcome.converged;
  row.margin = outcome.margin;
  row.timestamp = timestamp;
  row.hostname = hostname;
  row.platform = platform;
  return row;
}

/* ------------------------------ SampleResult ------------------------------ */

/** @brief Result of a measured section. */
struct SampleResult {
  Timings timings{};     ///< Raw per-invocation seconds
  StatsReport report{};  ///< describe(timings)
  bool converged{false}; ///< Stopping rule fired before maxRuns
  double margin{};       ///< Final CI half-width (seconds)
  std::string label;     ///< Section label (e.g., "measured")
};

/* ------------------------------- SampleCase ------------------------------- */

/**
 * @brief Facade that measures, summarizes, prints and records one test section.
 *
 * Typical usage:
 *   SampleCase sc{"Suite.Name", cfg};
 *   const SampleResult r = sc.measured([&]{ body(); });
 *
 * Errors from the body, ConfigurationError and TimeBudgetError propagate
 * before anything is printed or recorded.
 *
 * @note NOT RT-safe (heap allocation, console I/O).
 */
class SampleCase {
public:
  SampleCase(std::string testName, SamplingConfig cfg)
      : testName_(std::move(testName)), cfg_(std::move(cfg)) {}

  /** @brief Sample fn with this case's config and report the result. */
  template <typename Fn> SampleResult measured(Fn&& fn, std::string label = "measured") {
    SampleOutcome outcome = sample(std::forward<Fn>(fn), cfg_);
    const StatsReport REPORT = describe(outcome.timings);

    const std::string LABEL_STR = "[" + testName_ + "]";
    printReport(LABEL_STR.c_str(), REPORT, cfg_.clockKind, outcome.converged);
    printHints(outcome, REPORT, cfg_);

    SampleRegistry::instance().set(buildSampleRow(testName_, cfg_, REPORT, outcome));

    return SampleResult{std::move(outcome.timings), REPORT, outcome.converged, outcome.margin,
                        std::move(label)};
  }

  // Accessors
  [[nodiscard]] const SamplingConfig& config() const noexcept { return cfg_; }
  [[nodiscard]] const std::string& testName() const noexcept { return testName_; }

private:
  std::string testName_;
  SamplingConfig cfg_{};
};

} // namespace bench
} // namespace cadence

#endif // CADENCE_SAMPLEHARNESS_HPP
