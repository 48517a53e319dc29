#ifndef CADENCE_SAMPLECLOCK_HPP
#define CADENCE_SAMPLECLOCK_HPP
/**
 * @file SampleClock.hpp
 * @brief Clock sources used to bracket each invocation of the target.
 *
 * Two sources are provided:
 * - Wall time: monotonic steady clock, unaffected by NTP or manual clock changes.
 * - Process time: CPU time consumed by the whole process, excluding time spent
 *   sleeping or blocked.
 *
 * Any callable returning seconds as double can stand in for SystemClock via
 * measureWith(), which is how tests drive the sampler deterministically.
 */

#include <optional>
#include <string_view>

namespace cadence {
namespace bench {

/* ------------------------------- ClockKind ------------------------------- */

/** @brief Which clock times each invocation. */
enum class ClockKind {
  WallTime,   ///< Elapsed real time (steady_clock)
  ProcessTime ///< CPU time of this process (CLOCK_PROCESS_CPUTIME_ID)
};

/** @return "wall" or "process". */
constexpr const char* toString(ClockKind kind) noexcept {
  return kind == ClockKind::WallTime ? "wall" : "process";
}

/** @brief Parse "wall" / "process"; nullopt for anything else. */
inline std::optional<ClockKind> parseClockKind(std::string_view s) noexcept {
  if (s == "wall") {
    return ClockKind::WallTime;
  }
  if (s == "process") {
    return ClockKind::ProcessTime;
  }
  return std::nullopt;
}

/* ---------------------------- Clock Readings ---------------------------- */

/**
 * @brief Current wall time in seconds from a monotonic clock.
 * @note NOT RT-safe (system call).
 */
double wallSeconds();

/**
 * @brief CPU time consumed by this process, in seconds.
 * @throws std::system_error if clock_gettime fails.
 * @note NOT RT-safe (system call).
 */
double processSeconds();

/* ------------------------------ SystemClock ------------------------------ */

/** @brief Reads the clock selected by a ClockKind. */
struct SystemClock {
  ClockKind kind = ClockKind::ProcessTime;

  double operator()() const {
    return kind == ClockKind::WallTime ? wallSeconds() : processSeconds();
  }
};

} // namespace bench
} // namespace cadence

#endif // CADENCE_SAMPLECLOCK_HPP
