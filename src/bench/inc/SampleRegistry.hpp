#ifndef CADENCE_SAMPLEREGISTRY_HPP
#define CADENCE_SAMPLEREGISTRY_HPP
/**
 * @file SampleRegistry.hpp
 * @brief Minimal per-test result handoff between SampleCase and a gtest listener.
 */

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "src/bench/inc/SampleStats.hpp"

namespace cadence {
namespace bench {

/* -------------------------------- SampleRow -------------------------------- */

/** @brief Flat row of fields to emit into CSV. */
struct SampleRow {
  std::string testName;
  std::string clock;
  bool warmup{};
  int warmupRuns{};
  double allowedDeviation{};
  double confidenceLevel{};
  int minRuns{};
  int maxRuns{};
  StatsReport report{};
  bool converged{};
  double margin{};

  // Run metadata
  std::string timestamp;
  std::string hostname;
  std::string platform;
};

/* ---------------------------- SampleSummaryEntry ---------------------------- */

/** @brief Lightweight summary entry for end-of-run table (avoids copying full SampleRow). */
struct SampleSummaryEntry {
  std::string testName;
  double meanS{};
  double stdevS{};
  std::size_t count{};
  bool converged{};
};

/* ------------------------------ SampleRegistry ------------------------------ */

/**
 * @brief Thread-safe single-slot registry for the last SampleRow produced by SampleCase.
 *
 * Also accumulates lightweight summary entries for the end-of-run table.
 *
 * @note NOT RT-safe (mutex locking, heap allocation).
 */
class SampleRegistry {
public:
  static SampleRegistry& instance() {
    static SampleRegistry r;
    return r;
  }

  void set(SampleRow row) {
    std::lock_guard<std::mutex> lock(mu_);
    summary_.push_back(SampleSummaryEntry{row.testName, row.report.mean, row.report.stdev,
                                          row.report.count, row.converged});
    last_ = std::move(row);
  }

  std::optional<SampleRow> take() {
    std::lock_guard<std::mutex> lock(mu_);
    auto out = std::move(last_);
    last_.reset();
    return out;
  }

  /** @brief Copy of accumulated summary entries (for end-of-run table). */
  [[nodiscard]] std::vector<SampleSummaryEntry> summary() const {
    std::lock_guard<std::mutex> lock(mu_);
    return summary_;
  }

  /** @brief Drop everything recorded so far. */
  void clear() {
    std::lock_guard<std::mutex> lock(mu_);
    last_.reset();
    summary_.clear();
  }

private:
  SampleRegistry() = default;
  mutable std::mutex mu_;
  std::optional<SampleRow> last_;
  std::vector<SampleSummaryEntry> summary_;
};

} // namespace bench
} // namespace cadence

#endif // CADENCE_SAMPLEREGISTRY_HPP
