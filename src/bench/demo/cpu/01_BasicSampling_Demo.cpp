/**
 * @file 01_BasicSampling_Demo.cpp
 * @brief Demo 01: Adaptive sampling workflow
 *
 * Teaches the measure-describe-export workflow:
 *  1. Sample a target until the confidence interval is tight enough
 *  2. Compare two implementations by their summaries
 *  3. Export per-test rows with --csv and raw timings with writeTimingsCsv()
 *
 * Usage:
 *   @code{.sh}
 *   ./CadenceDemo_01_BasicSampling --csv baseline.csv
 *   ./CadenceDemo_01_BasicSampling --allowed-deviation 0.02 --max-runs 5000
 *   ./CadenceDemo_01_BasicSampling --quick
 *   @endcode
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <fstream>
#include <vector>

#include "src/bench/inc/Sampling.hpp"
#include "helpers/DemoWorkloads.hpp"

namespace cb = cadence::bench;
namespace demo = cadence::bench::demo;

/* ----------------------------- Constants ----------------------------- */

static constexpr std::size_t DATA_SIZE = 100000;
static constexpr int QUERIES = 64;

/* ----------------------------- Tests ----------------------------- */

/** @test Sample a single target with the command-line config. */
SAMPLE_TEST(BasicSampling, SingleTarget) {
  CADENCE_SAMPLE_GUARD(sc);

  const auto SORTED = demo::makeSorted(demo::makeRandomDoubles(DATA_SIZE));
  volatile std::size_t sink = 0;

  const cb::SampleResult RESULT = sc.measured(
      [&] {
        for (int q = 0; q < QUERIES; ++q) {
          sink = sink + demo::binarySearch(SORTED, static_cast<double>(q) / QUERIES);
        }
      },
      "binary_search");

  EXPECT_GT(RESULT.report.count, 0U);
  (void)sink;
}

/** @test A/B comparison: linear scan vs binary search over the same queries. */
SAMPLE_TEST(BasicSampling, LinearVsBinarySearch) {
  const auto SORTED = demo::makeSorted(demo::makeRandomDoubles(DATA_SIZE));
  const cb::SamplingConfig& cfg = cb::detail::getHarnessConfig().sampling;
  volatile std::size_t sink = 0;

  cb::SampleCase linear{"BasicSampling.LinearVsBinarySearch/linear", cfg};
  const cb::SampleResult A = linear.measured([&] {
    for (int q = 0; q < QUERIES; ++q) {
      sink = sink + demo::linearSearch(SORTED, static_cast<double>(q) / QUERIES);
    }
  });

  cb::SampleCase binary{"BasicSampling.LinearVsBinarySearch/binary", cfg};
  const cb::SampleResult B = binary.measured([&] {
    for (int q = 0; q < QUERIES; ++q) {
      sink = sink + demo::binarySearch(SORTED, static_cast<double>(q) / QUERIES);
    }
  });

  std::printf("  speedup: %.1fx\n", (B.report.mean > 0.0) ? A.report.mean / B.report.mean : 0.0);
  EXPECT_LT(B.report.mean, A.report.mean) << "binary search should beat a linear scan";
  (void)sink;
}

/** @test Dump raw timings for offline plotting. */
SAMPLE_TEST(BasicSampling, ExportRawTimings) {
  const auto DATA = demo::makeRandomDoubles(DATA_SIZE);
  volatile double sink = 0.0;

  const cb::Timings T = cb::measure(
      [&] {
        auto copy = DATA;
        std::sort(copy.begin(), copy.end());
        sink = sink + copy.front();
      },
      cb::detail::getHarnessConfig().sampling);

  std::ofstream out("basic_sampling_timings.csv");
  if (out) {
    cb::writeTimingsCsv(out, T);
    std::printf("  wrote %zu timings to basic_sampling_timings.csv\n", T.size());
  }

  EXPECT_FALSE(T.empty());
  (void)sink;
}

SAMPLE_MAIN()
