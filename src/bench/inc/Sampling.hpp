#ifndef CADENCE_SAMPLING_HPP
#define CADENCE_SAMPLING_HPP
/**
 * @file Sampling.hpp
 * @brief All-in-one convenience header for adaptive sampling.
 *
 * Library users typically need only Sampler.hpp and SampleStats.hpp; test
 * binaries include this file for the GoogleTest integration as well.
 *
 * @code{.cpp}
 *   #include "src/bench/inc/Sampling.hpp"
 *
 *   SAMPLE_TEST(MyLib, Parse) {
 *     CADENCE_SAMPLE_GUARD(sc);
 *     sc.measured([&]{ ... });
 *   }
 *
 *   SAMPLE_MAIN()
 * @endcode
 */

// Core: configuration, sampling and summary statistics
#include "src/bench/inc/SampleConfig.hpp"
#include "src/bench/inc/SampleQuantile.hpp"
#include "src/bench/inc/SampleStats.hpp"
#include "src/bench/inc/Sampler.hpp"

// CSV serialization
#include "src/bench/inc/SampleCsv.hpp"

// Harness (console printing, metadata capture, SampleCase)
#include "src/bench/inc/SampleHarness.hpp"

// GoogleTest integration
#include "src/bench/inc/SampleListener.hpp"
#include "src/bench/inc/SampleTestMacros.hpp"

#endif // CADENCE_SAMPLING_HPP
