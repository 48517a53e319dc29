/**
 * @file SampleListener_uTest.cpp
 * @brief Unit tests for the end-of-run summary table.
 */

#include "src/bench/inc/SampleListener.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using cadence::bench::printSummaryTable;
using cadence::bench::SampleSummaryEntry;

/* ----------------------------- Summary Table Tests ----------------------------- */

/** @test Empty input prints nothing. */
TEST(SampleListenerTest, EmptySummaryPrintsNothing) {
  ::testing::internal::CaptureStdout();
  printSummaryTable({});
  EXPECT_TRUE(::testing::internal::GetCapturedStdout().empty());
}

/** @test Table lists each entry with its status and a totals line. */
TEST(SampleListenerTest, SummaryTableRowsAndTotals) {
  const std::vector<SampleSummaryEntry> ENTRIES = {
      {"Suite.Fast", 0.002, 0.0001, 3, true},
      {"Suite.Noisy", 0.0009, 0.0003, 50, false},
  };

  ::testing::internal::CaptureStdout();
  printSummaryTable(ENTRIES);
  const std::string OUT = ::testing::internal::GetCapturedStdout();

  EXPECT_NE(OUT.find("Suite.Fast"), std::string::npos);
  EXPECT_NE(OUT.find("2.000 ms"), std::string::npos);
  EXPECT_NE(OUT.find("Suite.Noisy"), std::string::npos);
  EXPECT_NE(OUT.find("NOT CONVERGED"), std::string::npos);
  EXPECT_NE(OUT.find("2 tests | 1 converged | 1 not converged"), std::string::npos);
}

/** @test Long names are truncated to keep columns aligned. */
TEST(SampleListenerTest, LongNamesTruncated) {
  const std::string LONG_NAME(80, 'x');
  const std::vector<SampleSummaryEntry> ENTRIES = {{LONG_NAME, 1.0, 0.0, 2, true}};

  ::testing::internal::CaptureStdout();
  printSummaryTable(ENTRIES);
  const std::string OUT = ::testing::internal::GetCapturedStdout();

  EXPECT_EQ(OUT.find(LONG_NAME), std::string::npos);
  EXPECT_NE(OUT.find(std::string(48, 'x') + ".."), std::string::npos);
}
