/**
 * @file TestHelpers.hpp
 * @brief Shared workloads for sampling performance tests
 *
 * Provides deterministic data generators and small workloads whose cost is
 * either CPU-bound (visible to the process clock) or sleep-bound (visible
 * only to the wall clock).
 */

#ifndef CADENCE_TEST_HELPERS_HPP
#define CADENCE_TEST_HELPERS_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <random>
#include <thread>
#include <vector>

namespace cadence {
namespace bench {
namespace test {

/**
 * @brief Generate deterministic test data
 *
 * @param size Number of bytes to generate
 * @param seed Random seed for reproducibility
 * @return Vector of pseudo-random bytes
 */
inline std::vector<std::uint8_t> makeTestData(std::size_t size, std::uint32_t seed = 42) {
  std::vector<std::uint8_t> data(size);
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> dist(0, 255);

  for (std::size_t i = 0; i < size; ++i) {
    data[i] = static_cast<std::uint8_t>(dist(rng));
  }

  return data;
}

/**
 * @brief Simple sum workload
 *
 * @param data Pointer to byte array
 * @param len Length of array
 * @return Sum of all bytes
 */
inline std::uint64_t sumBytes(const std::uint8_t* data, std::size_t len) {
  std::uint64_t sum = 0;
  for (std::size_t i = 0; i < len; ++i) {
    sum += data[i];
  }
  return sum;
}

/**
 * @brief Busy-wait on the steady clock for roughly the given duration
 *
 * Consumes CPU for the whole interval, so wall and process time agree.
 */
inline void spinFor(std::chrono::microseconds duration) {
  const auto DEADLINE = std::chrono::steady_clock::now() + duration;
  volatile std::uint64_t spins = 0;
  while (std::chrono::steady_clock::now() < DEADLINE) {
    spins = spins + 1;
  }
}

/** @brief Block without consuming CPU (process time stays near zero). */
inline void sleepFor(std::chrono::microseconds duration) { std::this_thread::sleep_for(duration); }

} // namespace test
} // namespace bench
} // namespace cadence

#endif // CADENCE_TEST_HELPERS_HPP
