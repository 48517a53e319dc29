/**
 * @file SampleQuantile.cpp
 * @brief Inverse normal CDF, critical values and required sample size.
 */

#include "src/bench/inc/SampleQuantile.hpp"

#include <algorithm>
#include <array>
#include <climits>
#include <cmath>
#include <string>

#include "src/bench/inc/SampleErrors.hpp"

namespace cadence {
namespace bench {

namespace {

// Rational approximation coefficients for Phi^-1 (P. J. Acklam), rel. error < 1.15e-9.
constexpr std::array<double, 6> A = {-3.969683028665376e+01, 2.209460984245205e+02,
                                     -2.759285104469687e+02, 1.383577518672690e+02,
                                     -3.066479806614716e+01, 2.506628277459239e+00};
constexpr std::array<double, 5> B = {-5.447609879822406e+01, 1.615858368580409e+02,
                                     -1.556989798598866e+02, 6.680131188771972e+01,
                                     -1.328068155288572e+01};
constexpr std::array<double, 6> C = {-7.784894002430293e-03, -3.223964580411365e-01,
                                     -2.400758277161838e+00, -2.549732539343734e+00,
                                     4.374664141464968e+00,  2.938163982698783e+00};
constexpr std::array<double, 4> D = {7.784695709041462e-03, 3.224671290700398e-01,
                                     2.445134137142996e+00, 3.754408661907416e+00};

constexpr double P_LOW = 0.02425;
constexpr double P_HIGH = 1.0 - P_LOW;
constexpr double SQRT_2 = 1.41421356237309504880;
constexpr double SQRT_2PI = 2.50662827463100050242;

double tailApprox(double q) {
  return (((((C[0] * q + C[1]) * q + C[2]) * q + C[3]) * q + C[4]) * q + C[5]) /
         ((((D[0] * q + D[1]) * q + D[2]) * q + D[3]) * q + 1.0);
}

void requireOpenUnit(double v, const char* name) {
  if (!(v > 0.0 && v < 1.0)) {
    throw ConfigurationError(std::string(name) + " must be in (0, 1), got " + std::to_string(v));
  }
}

} // namespace

double inverseNormalCdf(double p) {
  requireOpenUnit(p, "probability");

  double x = 0.0;
  if (p < P_LOW) {
    x = tailApprox(std::sqrt(-2.0 * std::log(p)));
  } else if (p <= P_HIGH) {
    const double Q = p - 0.5;
    const double R = Q * Q;
    x = (((((A[0] * R + A[1]) * R + A[2]) * R + A[3]) * R + A[4]) * R + A[5]) * Q /
        (((((B[0] * R + B[1]) * R + B[2]) * R + B[3]) * R + B[4]) * R + 1.0);
  } else {
    x = -tailApprox(std::sqrt(-2.0 * std::log1p(-p)));
  }

  // One Halley step against the exact CDF brings the error to double precision.
  const double E = 0.5 * std::erfc(-x / SQRT_2) - p;
  const double U = E * SQRT_2PI * std::exp(x * x / 2.0);
  return x - U / (1.0 + x * U / 2.0);
}

double zValue(double confidenceLevel) {
  requireOpenUnit(confidenceLevel, "confidence level");
  return inverseNormalCdf((1.0 + confidenceLevel) / 2.0);
}

double marginOfError(const RunningStats& stats, double confidenceLevel) {
  if (stats.count() < 2) {
    return 0.0;
  }
  return zValue(confidenceLevel) * stats.stdev() /
         std::sqrt(static_cast<double>(stats.count()));
}

int requiredSampleSize(const RunningStats& stats, double allowedDeviation,
                       double confidenceLevel) {
  requireOpenUnit(allowedDeviation, "allowed deviation");
  if (stats.count() < 2) {
    return 2;
  }

  const double SPREAD = zValue(confidenceLevel) * stats.stdev();
  if (SPREAD == 0.0) {
    return 2;
  }
  const double TOLERANCE = allowedDeviation * stats.mean();
  if (!(TOLERANCE > 0.0)) {
    return INT_MAX;
  }

  const double RATIO = SPREAD / TOLERANCE;
  const double REQUIRED = std::ceil(RATIO * RATIO);
  if (!std::isfinite(REQUIRED) || REQUIRED >= static_cast<double>(INT_MAX)) {
    return INT_MAX;
  }
  return std::max(2, static_cast<int>(REQUIRED));
}

int requiredSampleSize(const std::vector<double>& timings, double allowedDeviation,
                       double confidenceLevel) {
  RunningStats acc;
  for (const double VAL : timings) {
    acc.push(VAL);
  }
  return requiredSampleSize(acc, allowedDeviation, confidenceLevel);
}

} // namespace bench
} // namespace cadence
