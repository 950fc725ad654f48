/**
 * @file woe_iv_utils.h
 * @brief Weight of Evidence, Information Value and divergence calculations
 *
 * WoE is expressed as log(nonevent% / event%), so bins with an event rate
 * above the overall rate have negative WoE.
 *
 * Scientific References:
 * - Good, I. J. (1950). "Probability and the Weighing of Evidence".
 * - Kullback, S., & Leibler, R. A. (1951). "On information and sufficiency".
 * - Lin, J. (1991). "Divergence measures based on the Shannon entropy".
 * - Siddiqi, N. (2006). "Credit Risk Scorecards" (Chapter 3: WoE and IV).
 */

#ifndef SCENARIO_BINNING_WOE_IV_UTILS_H
#define SCENARIO_BINNING_WOE_IV_UTILS_H

#include "scenario_binning_common.h"
#include "safe_math.h"

namespace ScenarioBinning {

/**
 * @brief Weight of Evidence of a bin
 *
 * Bins with a zero count of either class get WoE 0.
 *
 * @param nonevent Nonevent count in bin
 * @param event Event count in bin
 * @param total_nonevent Total nonevent count
 * @param total_event Total event count
 */
inline double compute_woe(double nonevent, double event,
                          double total_nonevent, double total_event) {
  if (nonevent <= 0.0 || event <= 0.0 ||
      total_nonevent <= 0.0 || total_event <= 0.0) {
    return 0.0;
  }

  double dist_nonevent = nonevent / total_nonevent;
  double dist_event = event / total_event;

  return std::log(dist_nonevent / dist_event);
}

/**
 * @brief Information Value contribution of a bin
 *
 * IV_i = (nonevent%_i - event%_i) * WoE_i
 */
inline double compute_iv(double nonevent, double event,
                         double total_nonevent, double total_event) {
  double woe = compute_woe(nonevent, event, total_nonevent, total_event);
  if (woe == 0.0) return 0.0;

  double iv = (nonevent / total_nonevent - event / total_event) * woe;
  return is_valid_number(iv) ? iv : 0.0;
}

/**
 * @brief Jensen-Shannon divergence contribution of a bin
 *
 * JS_i = 0.5 * (p log(p/m) + q log(q/m)), m = (p + q) / 2
 */
inline double compute_js(double nonevent, double event,
                         double total_nonevent, double total_event) {
  if (total_nonevent <= 0.0 || total_event <= 0.0) return 0.0;

  double p = nonevent / total_nonevent;
  double q = event / total_event;
  double m = 0.5 * (p + q);

  double js = 0.0;
  if (p > 0.0) js += p * std::log(p / m);
  if (q > 0.0) js += q * std::log(q / m);

  return 0.5 * js;
}

/**
 * @brief Event rate of a bin, 0 for empty bins
 */
inline double compute_event_rate(double nonevent, double event) {
  return safe_divide(event, nonevent + event);
}

/**
 * @brief Total IV with compensated summation
 */
inline double compute_total_iv(const std::vector<double>& iv_values,
                               bool high_precision = false) {
  return compensated_sum(iv_values, high_precision);
}

} // namespace ScenarioBinning

#endif // SCENARIO_BINNING_WOE_IV_UTILS_H
