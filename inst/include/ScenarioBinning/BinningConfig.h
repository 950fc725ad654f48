#ifndef SCENARIO_BINNING_CONFIG_H
#define SCENARIO_BINNING_CONFIG_H

#include <optional>
#include <string>
#include <vector>

namespace ScenarioBinning {

/**
 * @brief Candidate split generators used when no user splits are given
 */
enum class PrebinningMethod {
  CART,
  QUANTILE,
  UNIFORM
};

/**
 * @brief Event rate trend enforced over the final bins
 *
 * ASCENDING/DESCENDING: event rate increases/decreases with bin order
 * CONVEX/CONCAVE: event rate curve is convex/concave
 * PEAK/VALLEY: ascending then descending / descending then ascending
 * NONE: no trend constraint
 */
enum class MonotonicTrend {
  NONE,
  ASCENDING,
  DESCENDING,
  CONVEX,
  CONCAVE,
  PEAK,
  VALLEY
};

/**
 * @brief Bin pairs tested against max_pvalue
 */
enum class PValuePolicy {
  ALL,
  CONSECUTIVE
};

/**
 * @brief Class weights applied by the CART prebinning
 */
struct ClassWeight {
  enum class Mode { NONE, BALANCED, CUSTOM };

  Mode mode = Mode::NONE;
  double nonevent = 1.0;
  double event = 1.0;

  static ClassWeight balanced() {
    ClassWeight cw;
    cw.mode = Mode::BALANCED;
    return cw;
  }

  static ClassWeight custom(double w_nonevent, double w_event) {
    ClassWeight cw;
    cw.mode = Mode::CUSTOM;
    cw.nonevent = w_nonevent;
    cw.event = w_event;
    return cw;
  }
};

/**
 * @brief Options of the scenario-based optimal binning
 *
 * Unset optionals disable the corresponding constraint. Fractions of bin
 * size are relative to each scenario's own number of records.
 */
struct BinningConfig {
  std::string name;

  // Pre-binning
  PrebinningMethod prebinning_method = PrebinningMethod::CART;
  int max_n_prebins = 20;
  double min_prebin_size = 0.05;

  // Optimization constraints
  std::optional<int> min_n_bins;
  std::optional<int> max_n_bins;
  std::optional<double> min_bin_size;
  std::optional<double> max_bin_size;
  MonotonicTrend monotonic_trend = MonotonicTrend::NONE;
  double min_event_rate_diff = 0.0;
  std::optional<double> max_pvalue;
  PValuePolicy max_pvalue_policy = PValuePolicy::CONSECUTIVE;

  ClassWeight class_weight;

  // User supplied prebins
  std::optional<std::vector<double>> user_splits;
  std::optional<std::vector<bool>> user_splits_fixed;

  std::vector<double> special_codes;
  std::optional<int> split_digits;

  double time_limit = 100.0;
  bool verbose = false;
};

/**
 * @brief Check every option against its domain
 * @throws ValidationError on the first invalid option
 */
void validate_config(const BinningConfig& config);

PrebinningMethod string_to_prebinning_method(const std::string& method);
std::string prebinning_method_to_string(PrebinningMethod method);

MonotonicTrend string_to_monotonic_trend(const std::string& trend);
std::string monotonic_trend_to_string(MonotonicTrend trend);

PValuePolicy string_to_pvalue_policy(const std::string& policy);
std::string pvalue_policy_to_string(PValuePolicy policy);

} // namespace ScenarioBinning

#endif // SCENARIO_BINNING_CONFIG_H
