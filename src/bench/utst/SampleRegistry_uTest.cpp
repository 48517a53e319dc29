/**
 * @file SampleRegistry_uTest.cpp
 * @brief Unit tests for cadence::bench::SampleRegistry.
 *
 * Tests singleton access, set/take operations, and summary accumulation.
 */

#include "src/bench/inc/SampleRegistry.hpp"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

using cadence::bench::SampleRegistry;
using cadence::bench::SampleRow;
using cadence::bench::StatsReport;

namespace {

SampleRow makeTestRow(const std::string& name, bool converged = true) {
  SampleRow row;
  row.testName = name;
  row.clock = "process";
  row.minRuns = 3;
  row.maxRuns = 100;
  row.report = StatsReport{.count = 5, .min = 0.8, .max = 1.2, .mean = 1.0, .stdev = 0.1,
                           .total = 5.0};
  row.converged = converged;
  return row;
}

} // namespace

/* ----------------------------- Singleton Tests ----------------------------- */

/** @test Registry is a singleton. */
TEST(SampleRegistryTest, IsSingleton) {
  SampleRegistry& r1 = SampleRegistry::instance();
  SampleRegistry& r2 = SampleRegistry::instance();

  EXPECT_EQ(&r1, &r2);
}

/* ----------------------------- Set/Take Tests ----------------------------- */

/** @test Set and take returns the row. */
TEST(SampleRegistryTest, SetAndTakeReturnsRow) {
  SampleRegistry& registry = SampleRegistry::instance();
  registry.clear();

  registry.set(makeTestRow("SetTakeTest"));
  const auto RESULT = registry.take();

  ASSERT_TRUE(RESULT.has_value());
  EXPECT_EQ(RESULT->testName, "SetTakeTest");
  EXPECT_EQ(RESULT->report.count, 5U);
  EXPECT_DOUBLE_EQ(RESULT->report.mean, 1.0);
}

/** @test Take on empty registry returns nullopt. */
TEST(SampleRegistryTest, TakeOnEmptyReturnsNullopt) {
  SampleRegistry& registry = SampleRegistry::instance();
  registry.clear();

  EXPECT_FALSE(registry.take().has_value());
}

/** @test Second take after set returns nullopt. */
TEST(SampleRegistryTest, TakeClearsSlot) {
  SampleRegistry& registry = SampleRegistry::instance();
  registry.clear();

  registry.set(makeTestRow("Once"));
  EXPECT_TRUE(registry.take().has_value());
  EXPECT_FALSE(registry.take().has_value());
}

/** @test Later set overwrites the slot. */
TEST(SampleRegistryTest, SetOverwritesPrevious) {
  SampleRegistry& registry = SampleRegistry::instance();
  registry.clear();

  registry.set(makeTestRow("First"));
  registry.set(makeTestRow("Second"));

  const auto RESULT = registry.take();
  ASSERT_TRUE(RESULT.has_value());
  EXPECT_EQ(RESULT->testName, "Second");
}

/* ----------------------------- Summary Tests ----------------------------- */

/** @test Summary keeps every set, in order, and survives take(). */
TEST(SampleRegistryTest, SummaryAccumulates) {
  SampleRegistry& registry = SampleRegistry::instance();
  registry.clear();

  registry.set(makeTestRow("A", true));
  registry.set(makeTestRow("B", false));
  (void)registry.take();

  const auto SUMMARY = registry.summary();
  ASSERT_EQ(SUMMARY.size(), 2U);
  EXPECT_EQ(SUMMARY[0].testName, "A");
  EXPECT_TRUE(SUMMARY[0].converged);
  EXPECT_EQ(SUMMARY[1].testName, "B");
  EXPECT_FALSE(SUMMARY[1].converged);
  EXPECT_DOUBLE_EQ(SUMMARY[1].meanS, 1.0);
  EXPECT_EQ(SUMMARY[1].count, 5U);
}

/* ----------------------------- Thread Safety Tests ----------------------------- */

/** @test Concurrent sets all land in the summary. */
TEST(SampleRegistryTest, ConcurrentSets) {
  SampleRegistry& registry = SampleRegistry::instance();
  registry.clear();

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&registry, t] {
      for (int i = 0; i < 25; ++i) {
        registry.set(makeTestRow("T" + std::to_string(t)));
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }

  EXPECT_EQ(registry.summary().size(), 100U);
  registry.clear();
}
