#ifndef CADENCE_SAMPLETESTMACROS_HPP
#define CADENCE_SAMPLETESTMACROS_HPP
/**
 * @file SampleTestMacros.hpp
 * @brief Macros for writing GoogleTest-style sampling tests.
 *
 * | Macro | Purpose |
 * |-------|---------|
 * | `SAMPLE_TEST(Suite, Name)` | Declare a sampling test |
 * | `CADENCE_SAMPLE_GUARD(sc)` | Create a SampleCase named after the running test |
 * | `SAMPLE_MAIN()` | Drop-in main() with flag parsing, validation and CSV support |
 *
 * @code{.cpp}
 * #include "src/bench/inc/Sampling.hpp"
 *
 * SAMPLE_TEST(MyComponent, Parse) {
 *   CADENCE_SAMPLE_GUARD(sc);
 *   auto result = sc.measured([&]{ parse(input); });
 *   EXPECT_TRUE(result.converged);
 * }
 *
 * SAMPLE_MAIN()
 * @endcode
 *
 * Run with:
 * @code{.sh}
 * ./MyTest --clock wall --allowed-deviation 0.05 --csv results.csv
 * ./MyTest --quick
 * @endcode
 */

#include <cstdio>
#include <cstdlib>
#include <string>

#include "src/bench/inc/SampleConfig.hpp"
#include "src/bench/inc/SampleErrors.hpp"
#include "src/bench/inc/SampleHarness.hpp"
#include "src/bench/inc/SampleListener.hpp"

namespace cadence {
namespace bench {
namespace detail {

/* -------------------------------- Detail -------------------------------- */

/** @brief Singleton access to the shared HarnessConfig (parsed once). */
inline HarnessConfig& harnessConfigSingleton() {
  static HarnessConfig cfg{};
  return cfg;
}

/** @brief Const accessor for read-only use sites. */
inline const HarnessConfig& getHarnessConfig() { return harnessConfigSingleton(); }

/**
 * @brief Parse flags into the shared config and validate the sampling part.
 * Prints the problem and exits with status 2 on ConfigurationError.
 */
inline void initHarnessConfig(int* argc, char** argv) {
  HarnessConfig& cfg = harnessConfigSingleton();
  parseSampleFlags(cfg, argc, argv);
  try {
    validateSamplingConfig(cfg.sampling);
  } catch (const ConfigurationError& e) {
    std::fprintf(stderr, "Invalid sampling configuration: %s\n", e.what());
    std::exit(2);
  }
}

} // namespace detail
} // namespace bench
} // namespace cadence

/* -------------------------- Test Declaration Macros -------------------------- */

/** @brief Define a sampling test (semantic alias of gtest TEST). */
#define SAMPLE_TEST(Suite, Name) TEST(Suite, Name)

/* ----------------------------- Scoped Guard ----------------------------- */

/**
 * @brief Create a SampleCase named "Suite.Name" using the parsed command-line config.
 */
#define CADENCE_SAMPLE_GUARD(varName)                                                              \
  cadence::bench::SampleCase varName {                                                             \
    ::testing::UnitTest::GetInstance()->current_test_info()->test_suite_name() +                   \
        std::string(".") + ::testing::UnitTest::GetInstance()->current_test_info()->name(),        \
        cadence::bench::detail::getHarnessConfig().sampling                                        \
  }

/* ------------------------------ Main Macro ------------------------------ */

/**
 * @brief Drop-in replacement for main() in sampling test binaries.
 *
 * Expands to:
 *   - Parse sampling flags (--clock, --min-runs, --csv, etc.) and validate them
 *   - Install summary / CSV listeners
 *   - Initialize GoogleTest and run all tests
 */
#define SAMPLE_MAIN()                                                                              \
  int main(int argc, char** argv) {                                                                \
    cadence::bench::detail::initHarnessConfig(&argc, argv);                                        \
    cadence::bench::installSampleEventListener(cadence::bench::detail::getHarnessConfig());        \
    ::testing::InitGoogleTest(&argc, argv);                                                        \
    return RUN_ALL_TESTS();                                                                        \
  }

#endif // CADENCE_SAMPLETESTMACROS_HPP
