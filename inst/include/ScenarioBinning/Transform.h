#ifndef SCENARIO_BINNING_TRANSFORM_H
#define SCENARIO_BINNING_TRANSFORM_H

#include <string>
#include <vector>

namespace ScenarioBinning {

enum class TransformMetric {
  WOE,
  EVENT_RATE,
  INDICES,
  BINS
};

TransformMetric string_to_transform_metric(const std::string& metric);
std::string transform_metric_to_string(TransformMetric metric);

/**
 * @brief Value assigned to special or missing records
 *
 * Either a fixed number or the fitted Special/Missing row's own statistic.
 */
struct MetricFill {
  bool is_empirical = false;
  double value = 0.0;

  static MetricFill empirical() {
    MetricFill fill;
    fill.is_empirical = true;
    return fill;
  }

  static MetricFill constant(double v) {
    MetricFill fill;
    fill.value = v;
    return fill;
  }
};

/**
 * @brief Map raw values to WoE, event rate or bin index
 *
 * @param splits Fitted splits
 * @param n_nonevent Fitted nonevent counts: clean bins, Special, Missing
 * @param n_event Fitted event counts: clean bins, Special, Missing
 * @param special_codes Values treated as special
 * @param x Values to transform
 * @param metric WOE, EVENT_RATE or INDICES
 * @param metric_special Substitute for special values
 * @param metric_missing Substitute for missing (NaN or infinite) values
 * @throws ValidationError on a BINS metric or mismatched count vectors
 */
std::vector<double> transform_binary_target(const std::vector<double>& splits,
                                            const std::vector<long>& n_nonevent,
                                            const std::vector<long>& n_event,
                                            const std::vector<double>& special_codes,
                                            const std::vector<double>& x,
                                            TransformMetric metric,
                                            const MetricFill& metric_special = MetricFill(),
                                            const MetricFill& metric_missing = MetricFill());

/**
 * @brief Map raw values to their interval label, "Special" or "Missing"
 */
std::vector<std::string> transform_bins(const std::vector<double>& splits,
                                        const std::vector<double>& special_codes,
                                        const std::vector<double>& x,
                                        int show_digits = 2);

} // namespace ScenarioBinning

#endif // SCENARIO_BINNING_TRANSFORM_H
