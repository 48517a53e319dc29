/**
 * @file DemoWorkloads.hpp
 * @brief Slow/fast workload pairs and a blocking workload for sampling demos
 *
 * Workloads are deterministic (same input = same output) and write through
 * volatile sinks at the call site so -O2 cannot drop them.
 */

#ifndef CADENCE_DEMO_WORKLOADS_HPP
#define CADENCE_DEMO_WORKLOADS_HPP

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <random>
#include <thread>
#include <vector>

namespace cadence {
namespace bench {
namespace demo {

/* ----------------------------- Data Generators ----------------------------- */

/** @brief Deterministic random doubles in [0, 1). */
inline std::vector<double> makeRandomDoubles(std::size_t count, std::uint32_t seed = 12345) {
  std::vector<double> v(count);
  std::mt19937_64 rng(seed);
  std::uniform_real_distribution<double> dist(0.0, 1.0);
  for (auto& x : v) {
    x = dist(rng);
  }
  return v;
}

/** @brief Sorted copy of the input. */
inline std::vector<double> makeSorted(std::vector<double> data) {
  std::sort(data.begin(), data.end());
  return data;
}

/* ----------------------------- Search Workloads ----------------------------- */

/** @brief Slow: linear scan for the first element >= target. */
inline std::size_t linearSearch(const std::vector<double>& sorted, double target) {
  for (std::size_t i = 0; i < sorted.size(); ++i) {
    if (sorted[i] >= target) {
      return i;
    }
  }
  return sorted.size();
}

/** @brief Fast: binary search for the first element >= target. */
inline std::size_t binarySearch(const std::vector<double>& sorted, double target) {
  return static_cast<std::size_t>(std::lower_bound(sorted.begin(), sorted.end(), target) -
                                  sorted.begin());
}

/* ----------------------------- Blocking Workload ----------------------------- */

/**
 * @brief Short CPU burst followed by a blocking wait.
 *
 * Models a request that mostly waits on I/O: wall time is dominated by the
 * wait, process time only sees the burst.
 */
inline double burstThenWait(const std::vector<double>& data, std::chrono::microseconds wait) {
  double acc = 0.0;
  for (const double X : data) {
    acc += X * X;
  }
  std::this_thread::sleep_for(wait);
  return acc;
}

} // namespace demo
} // namespace bench
} // namespace cadence

#endif // CADENCE_DEMO_WORKLOADS_HPP
