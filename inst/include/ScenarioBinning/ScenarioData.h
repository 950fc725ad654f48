#ifndef SCENARIO_BINNING_SCENARIO_DATA_H
#define SCENARIO_BINNING_SCENARIO_DATA_H

#include <cstddef>
#include <vector>

namespace ScenarioBinning {

/**
 * @brief Nonevent/event tally of a set of records
 */
struct ClassCounts {
  long nonevent = 0;
  long event = 0;

  ClassCounts() = default;
  ClassCounts(long ne, long e) : nonevent(ne), event(e) {}

  long total() const { return nonevent + event; }

  void add(int label) {
    if (label == 1) event++;
    else nonevent++;
  }
};

/**
 * @brief Records of one scenario split into clean, missing and special subsets
 */
struct ScenarioSubset {
  std::vector<double> x_clean;
  std::vector<int> y_clean;
  std::vector<double> x_missing;
  std::vector<int> y_missing;
  std::vector<double> x_special;
  std::vector<int> y_special;

  /// Raw number of records before partitioning
  std::size_t n_samples = 0;

  ClassCounts missing_counts() const;
  ClassCounts special_counts() const;
};

/**
 * @brief Preprocessed scenarios with their weights
 */
struct ScenarioData {
  std::vector<ScenarioSubset> scenarios;
  std::vector<double> weights;
  std::vector<ClassCounts> missing;
  std::vector<ClassCounts> special;

  /// Number of records treated as missing because they were infinite
  std::size_t n_infinite = 0;

  std::size_t n_scenarios() const { return scenarios.size(); }

  /// Raw record count of every scenario
  std::vector<long> n_samples_scenario() const;

  /// Raw record count over all scenarios
  long n_samples() const;

  long n_clean() const;
  long n_missing() const;
  long n_special() const;
};

/**
 * @brief Validate scenario inputs and partition every scenario
 *
 * @param X Feature values per scenario
 * @param Y Binary labels (0/1) per scenario
 * @param weights Scenario weights; empty means every scenario weighs 1
 * @param special_codes Values routed to the special subset
 * @param check_input Reject infinite feature values instead of treating
 *        them as missing
 * @throws ValidationError on inconsistent shapes, labels or weights
 */
ScenarioData split_data_scenarios(const std::vector<std::vector<double>>& X,
                                  const std::vector<std::vector<int>>& Y,
                                  const std::vector<double>& weights,
                                  const std::vector<double>& special_codes,
                                  bool check_input = false);

/**
 * @brief Convert numeric labels to 0/1 integers
 *
 * @param y Labels of one scenario
 * @param scenario Index used in the error message
 * @throws ValidationError if a label is not exactly 0 or 1
 */
std::vector<int> binary_labels(const std::vector<double>& y, std::size_t scenario = 0);

/**
 * @brief Check the scenario count of X, Y and weights
 * @throws ValidationError if they disagree
 */
void check_scenarios_shape(const std::vector<std::vector<double>>& X,
                           const std::vector<std::vector<int>>& Y,
                           const std::vector<double>& weights);

} // namespace ScenarioBinning

#endif // SCENARIO_BINNING_SCENARIO_DATA_H
