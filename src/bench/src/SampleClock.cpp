/**
 * @file SampleClock.cpp
 * @brief Wall and process clock readings.
 */

#include "src/bench/inc/SampleClock.hpp"

#include <cerrno>
#include <chrono>
#include <system_error>

#include <time.h> // clock_gettime

namespace cadence {
namespace bench {

double wallSeconds() {
  using clock = std::chrono::steady_clock;
  return std::chrono::duration<double>(clock::now().time_since_epoch()).count();
}

double processSeconds() {
  struct timespec ts {};
  if (::clock_gettime(CLOCK_PROCESS_CPUTIME_ID, &ts) != 0) {
    throw std::system_error(errno, std::generic_category(),
                            "clock_gettime(CLOCK_PROCESS_CPUTIME_ID) failed");
  }
  return static_cast<double>(ts.tv_sec) + static_cast<double>(ts.tv_nsec) * 1e-9;
}

} // namespace bench
} // namespace cadence
