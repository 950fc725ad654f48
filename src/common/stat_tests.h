/**
 * @file stat_tests.h
 * @brief Two-sample significance tests between bins
 *
 * Used by the p-value constraint of the scenario optimizer.
 */

#ifndef SCENARIO_BINNING_STAT_TESTS_H
#define SCENARIO_BINNING_STAT_TESTS_H

#include "scenario_binning_common.h"

namespace ScenarioBinning {

/**
 * @brief Two-sided p-value of the Z-test for two proportions
 *
 * z = (p1 - p2) / sqrt(p (1 - p) (1/n1 + 1/n2)), p the pooled event rate.
 * Returns 1 when either bin is empty or the pooled variance vanishes
 * (identical event rates cannot be told apart).
 *
 * @param event1 Event count in bin 1
 * @param nonevent1 Nonevent count in bin 1
 * @param event2 Event count in bin 2
 * @param nonevent2 Nonevent count in bin 2
 */
inline double test_proportions(double event1, double nonevent1,
                               double event2, double nonevent2) {
  double n1 = event1 + nonevent1;
  double n2 = event2 + nonevent2;

  if (n1 <= 0.0 || n2 <= 0.0) {
    return 1.0;
  }

  double p1 = event1 / n1;
  double p2 = event2 / n2;
  double p = (event1 + event2) / (n1 + n2);

  double variance = p * (1.0 - p) * (1.0 / n1 + 1.0 / n2);
  if (variance <= EPSILON * EPSILON) {
    return 1.0;
  }

  double z = (p1 - p2) / std::sqrt(variance);

  // 2 * (1 - Phi(|z|))
  return std::erfc(std::abs(z) / std::sqrt(2.0));
}

} // namespace ScenarioBinning

#endif // SCENARIO_BINNING_STAT_TESTS_H
