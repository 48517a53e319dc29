#ifndef CADENCE_SAMPLELISTENER_HPP
#define CADENCE_SAMPLELISTENER_HPP
/**
 * @file SampleListener.hpp
 * @brief GoogleTest event listener for end-of-run summary and CSV emission.
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include "src/bench/inc/SampleConfig.hpp"
#include "src/bench/inc/SampleCsv.hpp"
#include "src/bench/inc/SampleHarness.hpp"
#include "src/bench/inc/SampleRegistry.hpp"

namespace cadence {
namespace bench {

/* --------------------------------- API --------------------------------- */

/**
 * @brief Print end-of-run summary table from accumulated results.
 *
 * Format:
 * @code
 * ============================== SAMPLING SUMMARY ==============================
 * Test                              Mean          Stdev       Runs   Status
 * ------------------------------------------------------------------------------
 * ClockKinds.SleepWallTime          2.083 ms      0.041 ms       3   OK
 * Convergence.NoisyTarget           0.912 ms      0.310 ms      50   NOT CONVERGED
 * ------------------------------------------------------------------------------
 * 2 tests | 1 converged | 1 not converged
 * @endcode
 *
 * @note NOT RT-safe (console I/O, heap allocation).
 */
inline void printSummaryTable(const std::vector<SampleSummaryEntry>& entries) {
  if (entries.empty()) {
    return;
  }

  std::size_t maxNameLen = 4; // "Test"
  for (const auto& e : entries) {
    maxNameLen = std::max(maxNameLen, e.testName.size());
  }
  if (maxNameLen > 50) {
    maxNameLen = 50;
  }

  const int TOTAL_WIDTH = static_cast<int>(maxNameLen) + 52;

  std::fprintf(stdout, "\n");
  for (int i = 0; i < TOTAL_WIDTH; ++i) {
    std::fputc('=', stdout);
  }
  std::fprintf(stdout, "\n%-*s  %12s  %12s  %6s  %s\n", static_cast<int>(maxNameLen), "Test",
               "Mean", "Stdev", "Runs", "Status");
  for (int i = 0; i < TOTAL_WIDTH; ++i) {
    std::fputc('-', stdout);
  }
  std::fprintf(stdout, "\n");

  int convergedCount = 0;
  int otherCount = 0;
  for (const auto& e : entries) {
    std::string displayName = e.testName;
    if (displayName.size() > maxNameLen) {
      displayName = displayName.substr(0, maxNameLen - 2) + "..";
    }

    char meanBuf[24];
    char sdBuf[24];
    formatSeconds(meanBuf, sizeof(meanBuf), e.meanS);
    formatSeconds(sdBuf, sizeof(sdBuf), e.stdevS);

    const char* STATUS = e.converged ? "OK" : "NOT CONVERGED";
    if (e.converged) {
      ++convergedCount;
    } else {
      ++otherCount;
    }

    std::fprintf(stdout, "%-*s  %12s  %12s  %6zu  %s\n", static_cast<int>(maxNameLen),
                 displayName.c_str(), meanBuf, sdBuf, e.count, STATUS);
  }

  for (int i = 0; i < TOTAL_WIDTH; ++i) {
    std::fputc('-', stdout);
  }
  std::fprintf(stdout, "\n%d tests | %d converged | %d not converged\n",
               static_cast<int>(entries.size()), convergedCount, otherCount);
}

inline void installSampleEventListener(const HarnessConfig& cfg,
                                       ::testing::UnitTest* ut = nullptr) {
  if (!ut) {
    ut = ::testing::UnitTest::GetInstance();
  }

  class SummaryListener : public ::testing::EmptyTestEventListener {
  public:
    void OnTestProgramEnd(const ::testing::UnitTest& /*ut*/) override {
      const auto ENTRIES = SampleRegistry::instance().summary();
      if (ENTRIES.size() >= 2) {
        printSummaryTable(ENTRIES);
      }
    }
  };

  auto& listeners = ut->listeners();
  listeners.Append(new SummaryListener());

  // CSV listener (only if --csv provided)
  if (!cfg.csv) {
    return;
  }

  class CsvListener : public ::testing::EmptyTestEventListener {
  public:
    explicit CsvListener(std::string path) : path_(std::move(path)) {
      out_.open(path_, std::ios::out | std::ios::trunc);
      if (out_) {
        writeCsvHeader(out_, /*includeMetadata=*/true);
      } else {
        std::fprintf(stderr, "  [WARN] Cannot open CSV output '%s'\n", path_.c_str());
      }
    }
    ~CsvListener() override {
      if (out_) {
        out_.flush();
        out_.close();
      }
    }

    void OnTestEnd(const ::testing::TestInfo& /*info*/) override {
      if (!out_) {
        return;
      }
      if (auto row = SampleRegistry::instance().take()) {
        writeCsvRow(out_, *row);
      }
    }

  private:
    std::string path_;
    std::ofstream out_{};
  };

  listeners.Append(new CsvListener(*cfg.csv));
}

} // namespace bench
} // namespace cadence

#endif // CADENCE_SAMPLELISTENER_HPP
