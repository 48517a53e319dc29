/**
 * @file 02_ClockSelection_Demo.cpp
 * @brief Demo 02: Choosing between wall time and process time
 *
 * The same blocking target is sampled under both clocks. Process time only
 * counts the CPU burst; wall time also counts the wait. Sleep-bound code
 * measured with process time can look free, which the harness flags with an
 * [INFO] hint when a run does not converge.
 *
 * Usage:
 *   @code{.sh}
 *   ./CadenceDemo_02_ClockSelection
 *   ./CadenceDemo_02_ClockSelection --csv clocks.csv
 *   @endcode
 */

#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>

#include "src/bench/inc/Sampling.hpp"
#include "helpers/DemoWorkloads.hpp"

namespace cb = cadence::bench;
namespace demo = cadence::bench::demo;

/* ----------------------------- Constants ----------------------------- */

static constexpr std::size_t DATA_SIZE = 4096;
static constexpr auto WAIT = std::chrono::microseconds(500);

/* ----------------------------- Helpers ----------------------------- */

namespace {

cb::SampleResult sampleWithClock(const char* name, cb::ClockKind kind) {
  cb::SamplingConfig cfg = cb::detail::getHarnessConfig().sampling;
  cfg.clockKind = kind;

  const auto DATA = demo::makeRandomDoubles(DATA_SIZE);
  volatile double sink = 0.0;

  cb::SampleCase sc{name, cfg};
  cb::SampleResult result = sc.measured([&] { sink = sink + demo::burstThenWait(DATA, WAIT); });
  (void)sink;
  return result;
}

} // namespace

/* ----------------------------- Tests ----------------------------- */

/** @test Wall time includes the wait. */
SAMPLE_TEST(ClockSelection, WallTime) {
  const cb::SampleResult R = sampleWithClock("ClockSelection.WallTime", cb::ClockKind::WallTime);

  EXPECT_GE(R.report.min, 500e-6);
}

/** @test Process time sees only the CPU burst. */
SAMPLE_TEST(ClockSelection, ProcessTime) {
  const cb::SampleResult R =
      sampleWithClock("ClockSelection.ProcessTime", cb::ClockKind::ProcessTime);

  EXPECT_LT(R.report.mean, 500e-6);
}

SAMPLE_MAIN()
