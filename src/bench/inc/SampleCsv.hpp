#ifndef CADENCE_SAMPLECSV_HPP
#define CADENCE_SAMPLECSV_HPP
/**
 * @file SampleCsv.hpp
 * @brief CSV helpers for writing sampling results and raw timing sequences.
 */

#include <cstddef>
#include <ios>
#include <limits>
#include <ostream>
#include <vector>

#include "src/bench/inc/SampleRegistry.hpp"
#include "src/bench/inc/SampleStats.hpp"

namespace cadence {
namespace bench {

namespace detail {

/** @brief Restores stream precision on scope exit. */
class PrecisionGuard {
public:
  explicit PrecisionGuard(std::ostream& os)
      : os_(os), saved_(os.precision(std::numeric_limits<double>::max_digits10)) {}
  ~PrecisionGuard() { os_.precision(saved_); }

  PrecisionGuard(const PrecisionGuard&) = delete;
  PrecisionGuard& operator=(const PrecisionGuard&) = delete;

private:
  std::ostream& os_;
  std::streamsize saved_;
};

} // namespace detail

/* --------------------------------- API --------------------------------- */

/**
 * @brief Write the header for per-test summary rows.
 * @param includeMetadata When true, append `timestamp,hostname,platform`.
 * @note NOT RT-safe (stream I/O).
 */
inline void writeCsvHeader(std::ostream& csv, bool includeMetadata = false) {
  csv << "test,clock,warmup,warmupRuns,allowedDeviation,confidenceLevel,minRuns,maxRuns,"
         "count,min,max,mean,stdev,total,converged,margin";
  if (includeMetadata) {
    csv << ",timestamp,hostname,platform";
  }
  csv << "\n";
}

/**
 * @brief Write a single result row. Metadata columns are emitted when any is set.
 * @note NOT RT-safe (stream I/O).
 */
inline void writeCsvRow(std::ostream& csv, const SampleRow& row) {
  detail::PrecisionGuard guard(csv);

  csv << row.testName << "," << row.clock << "," << (row.warmup ? "1" : "0") << ","
      << row.warmupRuns << "," << row.allowedDeviation << "," << row.confidenceLevel << ","
      << row.minRuns << "," << row.maxRuns << "," << row.report.count << "," << row.report.min
      << "," << row.report.max << "," << row.report.mean << "," << row.report.stdev << ","
      << row.report.total << "," << (row.converged ? "1" : "0") << "," << row.margin;

  if (!row.timestamp.empty() || !row.hostname.empty() || !row.platform.empty()) {
    csv << "," << row.timestamp << "," << row.hostname << "," << row.platform;
  }

  csv << "\n";
}

/**
 * @brief Write a raw timing sequence as `run,seconds` rows (run is 0-based).
 * @note NOT RT-safe (stream I/O).
 */
inline void writeTimingsCsv(std::ostream& csv, const std::vector<double>& timings) {
  detail::PrecisionGuard guard(csv);

  csv << "run,seconds\n";
  for (std::size_t i = 0; i < timings.size(); ++i) {
    csv << i << "," << timings[i] << "\n";
  }
}

} // namespace bench
} // namespace cadence

#endif // CADENCE_SAMPLECSV_HPP
