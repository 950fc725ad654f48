/**
 * @file safe_math.h
 * @brief Numerically stable mathematical operations
 *
 * Provides:
 * - Zero denominator protection for divisions
 * - Compensated summation (Kahan, Neumaier)
 * - Half-to-even decimal rounding of split points
 */

#ifndef SCENARIO_BINNING_SAFE_MATH_H
#define SCENARIO_BINNING_SAFE_MATH_H

#include "scenario_binning_common.h"
#include <vector>
#include <algorithm>
#include <numeric>
#include <cfenv>

namespace ScenarioBinning {

// =============================================================================
// BASIC SAFE OPERATIONS
// =============================================================================

/**
 * @brief Safe division with zero denominator protection
 * @param num Numerator
 * @param denom Denominator
 * @param epsilon Minimum denominator magnitude
 * @return num/denom, or 0 when |denom| <= epsilon
 */
inline double safe_divide(double num, double denom, double epsilon = EPSILON) {
  return (std::abs(denom) > epsilon) ? (num / denom) : 0.0;
}

/**
 * @brief Check if a value is finite and not NaN
 */
inline bool is_valid_number(double value) {
  return std::isfinite(value) && !std::isnan(value);
}

/**
 * @brief Round to a number of decimals, ties to even
 *
 * round_half_even(2.5, 0) == 2, round_half_even(0.125, 2) == 0.12
 *
 * @param value Value to round
 * @param digits Number of decimals (0 rounds to integers)
 */
inline double round_half_even(double value, int digits) {
  const double scale = std::pow(10.0, digits);
  const int saved_mode = std::fegetround();
  std::fesetround(FE_TONEAREST);
  const double rounded = std::nearbyint(value * scale) / scale;
  std::fesetround(saved_mode);
  return rounded;
}

// =============================================================================
// COMPENSATED SUMMATION (Kahan & Neumaier algorithms)
// =============================================================================

/**
 * @brief Kahan summation algorithm for compensated sum
 *
 * Reduces numerical error in sum from O(nε) to O(ε).
 *
 * Reference:
 * Kahan, W. (1965). "Further remarks on reducing truncation errors".
 * Communications of the ACM, 8(1), 40.
 */
inline double kahan_sum(const std::vector<double>& values) {
  double sum = 0.0;
  double c = 0.0;  // Running compensation for lost low-order bits

  for (double value : values) {
    double y = value - c;
    double t = sum + y;
    c = (t - sum) - y;
    sum = t;
  }

  return sum;
}

/**
 * @brief Neumaier variant of Kahan summation (more robust)
 *
 * Reference:
 * Neumaier, A. (1974). "Rundungsfehleranalyse einiger Verfahren
 * zur Summation endlicher Summen". ZAMM, 54, 39-51.
 */
inline double neumaier_sum(const std::vector<double>& values) {
  if (values.empty()) return 0.0;

  double sum = values[0];
  double c = 0.0;

  for (size_t i = 1; i < values.size(); ++i) {
    double t = sum + values[i];

    if (std::abs(sum) >= std::abs(values[i])) {
      c += (sum - t) + values[i];
    } else {
      c += (values[i] - t) + sum;
    }

    sum = t;
  }

  return sum + c;
}

/**
 * @brief Compensated sum; plain accumulation for short vectors
 * @param values Vector of values to sum
 * @param high_precision If true, use Neumaier; else use Kahan
 */
inline double compensated_sum(const std::vector<double>& values,
                              bool high_precision = false) {
  if (values.size() < 10) {
    return std::accumulate(values.begin(), values.end(), 0.0);
  }

  return high_precision ? neumaier_sum(values) : kahan_sum(values);
}

} // namespace ScenarioBinning

#endif // SCENARIO_BINNING_SAFE_MATH_H
