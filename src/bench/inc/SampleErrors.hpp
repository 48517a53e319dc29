#ifndef CADENCE_SAMPLEERRORS_HPP
#define CADENCE_SAMPLEERRORS_HPP
/**
 * @file SampleErrors.hpp
 * @brief Exception types raised by the sampler and summarizer.
 *
 * Failures thrown by the callable under test are not wrapped: they reach the
 * caller of measure() unchanged.
 */

#include <stdexcept>
#include <string>

namespace cadence {
namespace bench {

/* ----------------------------- Exceptions ----------------------------- */

/** @brief Self-contradictory SamplingConfig; thrown before anything is invoked. */
class ConfigurationError : public std::invalid_argument {
public:
  explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

/** @brief describe() was handed an empty timing sequence. */
class EmptyInputError : public std::domain_error {
public:
  EmptyInputError() : std::domain_error("cannot describe an empty timing sequence") {}
};

/** @brief Measured time exceeded SamplingConfig::maxTotalSeconds. */
class TimeBudgetError : public std::runtime_error {
public:
  TimeBudgetError(double spentSeconds, double budgetSeconds)
      : std::runtime_error("exceeded maximum allowed time: " + std::to_string(spentSeconds) +
                           " > " + std::to_string(budgetSeconds)),
        spent_(spentSeconds), budget_(budgetSeconds) {}

  [[nodiscard]] double spentSeconds() const noexcept { return spent_; }
  [[nodiscard]] double budgetSeconds() const noexcept { return budget_; }

private:
  double spent_;
  double budget_;
};

} // namespace bench
} // namespace cadence

#endif // CADENCE_SAMPLEERRORS_HPP
