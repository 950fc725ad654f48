#ifndef SCENARIO_BINNING_SCENARIO_OPTIMAL_BINNING_H
#define SCENARIO_BINNING_SCENARIO_OPTIMAL_BINNING_H

#include "BinningConfig.h"
#include "BinningTable.h"
#include "SolverBackend.h"
#include "Transform.h"

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace ScenarioBinning {

/**
 * @brief Wall-clock seconds spent in each pipeline stage
 */
struct TimingInfo {
  double total = 0.0;
  double preprocessing = 0.0;
  double prebinning = 0.0;
  double refinement = 0.0;
  double optimizer = 0.0;
  double postprocessing = 0.0;
};

/**
 * @brief Everything produced by a successful fit
 */
struct FitResult {
  std::vector<double> splits;
  SolverStatus status = SolverStatus::UNKNOWN;

  /// Optimizer selection over the refined prebins
  std::vector<bool> solution;
  std::vector<double> refined_splits;

  BinningTable table;
  std::vector<BinningTable> scenario_tables;

  /// Aggregate counts: clean bins, Special, Missing
  std::vector<long> n_nonevent;
  std::vector<long> n_event;

  std::vector<double> special_codes;

  /// Prebins left after refinement
  int n_prebins = 0;
  /// Candidate prebins before refinement
  int n_initial_prebins = 0;
  int n_refinements = 0;
  std::size_t n_scenarios = 0;
  long n_samples = 0;
  long n_clean = 0;
  long n_missing = 0;
  long n_special = 0;

  bool solver_run = false;
  SolverStatistics solver_statistics;
  TimingInfo timing;
  std::vector<std::string> warnings;
};

/**
 * @brief Scenario-based optimal binning of a numerical variable with a
 * binary target
 *
 * One binning is chosen for all scenarios at once: the objective weighs the
 * IV of every scenario, bin sizes and significance hold in every scenario,
 * and the event rate trend holds on the weighted aggregate.
 *
 * Usage:
 *   ScenarioOptimalBinning optb(config);
 *   optb.fit(X, Y);
 *   auto woe = optb.transform(x, TransformMetric::WOE);
 */
class ScenarioOptimalBinning {
public:
  explicit ScenarioOptimalBinning(BinningConfig config = BinningConfig(),
                                  SolverFactory solver_factory = nullptr,
                                  std::ostream* log_sink = nullptr);

  /**
   * @brief Fit the binning
   *
   * @param X Feature values per scenario
   * @param Y Binary labels per scenario
   * @param weights Scenario weights; empty means 1 for every scenario
   * @param check_input Reject infinite feature values
   * @throws ValidationError, FixedSplitConflictError
   */
  ScenarioOptimalBinning& fit(const std::vector<std::vector<double>>& X,
                              const std::vector<std::vector<int>>& Y,
                              const std::vector<double>& weights = {},
                              bool check_input = false);

  std::vector<double> fit_transform(const std::vector<double>& x,
                                    const std::vector<std::vector<double>>& X,
                                    const std::vector<std::vector<int>>& Y,
                                    const std::vector<double>& weights = {},
                                    TransformMetric metric = TransformMetric::WOE,
                                    const MetricFill& metric_special = MetricFill(),
                                    const MetricFill& metric_missing = MetricFill(),
                                    bool check_input = false);

  std::vector<double> transform(const std::vector<double>& x,
                                TransformMetric metric = TransformMetric::WOE,
                                const MetricFill& metric_special = MetricFill(),
                                const MetricFill& metric_missing = MetricFill()) const;

  std::vector<std::string> transform_bins(const std::vector<double>& x,
                                          int show_digits = 2) const;

  bool is_fitted() const { return result_ != nullptr; }

  const BinningConfig& config() const { return config_; }

  // Fitted state; every accessor throws NotFittedError before fit()
  const std::vector<double>& splits() const;
  SolverStatus status() const;
  const BinningTable& binning_table() const;
  const BinningTable& binning_table_scenario(std::size_t scenario) const;
  const FitResult& result() const;

  /**
   * @brief Print a report of the fitted binning
   * @param print_level 0: summary, 1: adds timing and solver statistics,
   *        2: adds options and the aggregate table
   */
  void information(std::ostream& os, int print_level = 1) const;

private:
  BinningConfig config_;
  SolverFactory solver_factory_;
  std::ostream* log_sink_;
  std::shared_ptr<const FitResult> result_;

  const FitResult& fitted() const;
};

} // namespace ScenarioBinning

#endif // SCENARIO_BINNING_SCENARIO_OPTIMAL_BINNING_H
