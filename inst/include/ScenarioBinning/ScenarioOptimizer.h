#ifndef SCENARIO_BINNING_SCENARIO_OPTIMIZER_H
#define SCENARIO_BINNING_SCENARIO_OPTIMIZER_H

#include "BinningConfig.h"
#include "CountMatrix.h"
#include "Logger.h"
#include "SolverBackend.h"

#include <vector>

namespace ScenarioBinning {

struct OptimizerResult {
  SolverStatus status = SolverStatus::UNKNOWN;

  /// One flag per prebin; solution[i] means a bin ends at prebin i
  std::vector<bool> solution;

  SolverStatistics statistics;

  /// False when the problem was decided without calling the solver
  bool solver_run = false;
};

/// Factory of the bundled branch-and-bound solver
SolverFactory default_solver_factory();

/**
 * @brief Splits kept by a solution: splits[i] for every i < n_splits with
 * solution[i] set
 */
std::vector<double> optimal_splits(const std::vector<double>& splits,
                                   const std::vector<bool>& solution);

/**
 * @brief Builds and solves the extensive-form binning model
 *
 * Variable x[i][j] (j <= i) states that prebin j belongs to the bin ending
 * at prebin i. The objective maximizes the scenario-weighted sum of IV, with
 * size and p-value constraints enforced per scenario and trend constraints
 * on the weighted aggregate event rate.
 */
class ScenarioOptimizer {
public:
  /**
   * @param config Binning options (bin counts, sizes, trend, p-value, time limit)
   * @param n_samples_scenario Raw record count of every scenario, base of
   *        the bin size fractions
   * @param solver_factory Creates the backend for each optimize() call
   * @param logger Optional logger
   */
  ScenarioOptimizer(const BinningConfig& config, std::vector<long> n_samples_scenario,
                    SolverFactory solver_factory = default_solver_factory(),
                    Logger* logger = nullptr);

  /**
   * @brief Choose the optimal subset of prebin boundaries
   *
   * @param counts Prebin count matrix, one column per scenario
   * @param weights Scenario weights
   * @param fixed Fixed flags, empty or one per split (n_bins - 1)
   */
  OptimizerResult optimize(const CountMatrix& counts, const std::vector<double>& weights,
                           const std::vector<bool>& fixed) const;

private:
  BinningConfig config_;
  std::vector<long> n_samples_scenario_;
  SolverFactory solver_factory_;
  Logger* logger_;
};

} // namespace ScenarioBinning

#endif // SCENARIO_BINNING_SCENARIO_OPTIMIZER_H
