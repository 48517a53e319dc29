/**
 * @file SampleClock_uTest.cpp
 * @brief Unit tests for wall/process clock readings and ClockKind parsing.
 */

#include "src/bench/inc/SampleClock.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

using cadence::bench::ClockKind;
using cadence::bench::parseClockKind;
using cadence::bench::processSeconds;
using cadence::bench::SystemClock;
using cadence::bench::toString;
using cadence::bench::wallSeconds;

/* ----------------------------- ClockKind Tests ----------------------------- */

/** @test Names round-trip through parseClockKind. */
TEST(SampleClockTest, ClockKindNames) {
  EXPECT_STREQ(toString(ClockKind::WallTime), "wall");
  EXPECT_STREQ(toString(ClockKind::ProcessTime), "process");
  EXPECT_EQ(parseClockKind("wall"), ClockKind::WallTime);
  EXPECT_EQ(parseClockKind("process"), ClockKind::ProcessTime);
  EXPECT_FALSE(parseClockKind("cpu").has_value());
  EXPECT_FALSE(parseClockKind("").has_value());
}

/* ----------------------------- Wall Clock Tests ----------------------------- */

/** @test Wall clock never goes backwards. */
TEST(SampleClockTest, WallClockMonotonic) {
  double prev = wallSeconds();
  for (int i = 0; i < 1000; ++i) {
    const double NOW = wallSeconds();
    EXPECT_GE(NOW, prev);
    prev = NOW;
  }
}

/** @test Wall clock advances across a sleep. */
TEST(SampleClockTest, WallClockCountsSleep) {
  const double T0 = wallSeconds();
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  const double T1 = wallSeconds();

  EXPECT_GE(T1 - T0, 0.015);
}

/* ----------------------------- Process Clock Tests ----------------------------- */

/** @test Process clock advances with CPU work. */
TEST(SampleClockTest, ProcessClockCountsCpuWork) {
  const double T0 = processSeconds();
  volatile double sink = 0.0;
  for (int i = 0; i < 5000000; ++i) {
    sink = sink + static_cast<double>(i) * 0.5;
  }
  const double T1 = processSeconds();

  EXPECT_GT(T1 - T0, 0.0);
}

/** @test Process clock barely moves while sleeping. */
TEST(SampleClockTest, ProcessClockIgnoresSleep) {
  const double T0 = processSeconds();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  const double T1 = processSeconds();

  EXPECT_LT(T1 - T0, 0.025);
}

/* ----------------------------- SystemClock Tests ----------------------------- */

/** @test SystemClock dispatches on its kind. */
TEST(SampleClockTest, SystemClockSelectsSource) {
  const SystemClock WALL{ClockKind::WallTime};
  const SystemClock PROCESS{ClockKind::ProcessTime};

  const double W0 = WALL();
  const double P0 = PROCESS();
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  const double W1 = WALL();
  const double P1 = PROCESS();

  EXPECT_GE(W1 - W0, 0.025);
  EXPECT_LT(P1 - P0, W1 - W0);
}
