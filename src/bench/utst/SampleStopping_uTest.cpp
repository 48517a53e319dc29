/**
 * @file SampleStopping_uTest.cpp
 * @brief Unit tests for cadence::bench::StoppingRule.
 *
 * Feeds hand-picked sample sequences and checks when the rule fires.
 */

#include "src/bench/inc/SampleStopping.hpp"

#include <gtest/gtest.h>

#include <cmath>

using cadence::bench::SamplingConfig;
using cadence::bench::StoppingRule;
using cadence::bench::zValue;

namespace {

SamplingConfig makeConfig(int minRuns, int maxRuns, double deviation = 0.1) {
  SamplingConfig cfg;
  cfg.minRuns = minRuns;
  cfg.maxRuns = maxRuns;
  cfg.allowedDeviation = deviation;
  return cfg;
}

} // namespace

/* ----------------------------- Convergence Tests ----------------------------- */

/** @test A single sample never converges (no spread estimate). */
TEST(StoppingRuleTest, SingleSampleNeverConverges) {
  StoppingRule rule(makeConfig(1, 100));

  EXPECT_FALSE(rule.push(1.0));
  EXPECT_FALSE(rule.converged());
}

/** @test Constant samples converge as soon as two exist. */
TEST(StoppingRuleTest, ConstantSamplesConvergeAtTwo) {
  StoppingRule rule(makeConfig(1, 100));

  EXPECT_FALSE(rule.push(0.5));
  EXPECT_TRUE(rule.push(0.5));
  EXPECT_TRUE(rule.converged());
  EXPECT_DOUBLE_EQ(rule.margin(), 0.0);
}

/** @test minRuns holds off an otherwise converged rule. */
TEST(StoppingRuleTest, MinRunsDelaysStop) {
  StoppingRule rule(makeConfig(4, 100));

  EXPECT_FALSE(rule.push(0.5));
  EXPECT_FALSE(rule.push(0.5));
  EXPECT_FALSE(rule.push(0.5));
  EXPECT_TRUE(rule.push(0.5));
  EXPECT_TRUE(rule.converged());
}

/** @test Low relative spread converges; margin/mean within allowed deviation. */
TEST(StoppingRuleTest, LowSpreadConverges) {
  StoppingRule rule(makeConfig(3, 100));

  EXPECT_FALSE(rule.push(1.0));
  EXPECT_FALSE(rule.push(1.1));
  // n=3: sd 0.0577, margin 0.0653 <= 0.1 * 1.0333
  EXPECT_TRUE(rule.push(1.0));
  EXPECT_TRUE(rule.converged());
  EXPECT_LE(rule.margin() / rule.stats().mean(), 0.1);
}

/* ----------------------------- maxRuns Tests ----------------------------- */

/** @test High spread hits maxRuns without converging. */
TEST(StoppingRuleTest, HighSpreadStopsAtMaxRuns) {
  StoppingRule rule(makeConfig(2, 10));

  int pushes = 0;
  bool done = false;
  while (!done) {
    done = rule.push((pushes % 2 == 0) ? 1.0 : 3.0);
    ++pushes;
  }

  EXPECT_EQ(pushes, 10);
  EXPECT_FALSE(rule.converged());
  EXPECT_GT(rule.margin() / rule.stats().mean(), 0.1);
}

/** @test maxRuns == 1 stops after one sample. */
TEST(StoppingRuleTest, MaxRunsOneStopsImmediately) {
  StoppingRule rule(makeConfig(1, 1));

  EXPECT_TRUE(rule.push(0.25));
  EXPECT_FALSE(rule.converged());
}

/* ----------------------------- Near-Zero Mean Tests ----------------------------- */

/** @test All-zero samples converge (zero margin against zero tolerance). */
TEST(StoppingRuleTest, AllZeroSamplesConverge) {
  StoppingRule rule(makeConfig(2, 100));

  EXPECT_FALSE(rule.push(0.0));
  EXPECT_TRUE(rule.push(0.0));
  EXPECT_TRUE(rule.converged());
}

/** @test Zero-dominated noisy samples keep going until maxRuns. */
TEST(StoppingRuleTest, NoisyNearZeroMeanDoesNotConverge) {
  StoppingRule rule(makeConfig(2, 20));

  int pushes = 0;
  bool done = false;
  while (!done) {
    done = rule.push((pushes % 4 == 0) ? 1e-9 : 0.0);
    ++pushes;
  }

  EXPECT_EQ(pushes, 20);
  EXPECT_FALSE(rule.converged());
}

/** @test Critical value is taken from the confidence level. */
TEST(StoppingRuleTest, CriticalValueFromConfidence) {
  SamplingConfig cfg = makeConfig(2, 10);
  cfg.confidenceLevel = 0.99;
  const StoppingRule RULE(cfg);

  EXPECT_DOUBLE_EQ(RULE.criticalValue(), zValue(0.99));
}
