#include "ScenarioBinning/ScenarioOptimalBinning.h"
#include "ScenarioBinning/CountMatrix.h"
#include "ScenarioBinning/Exceptions.h"
#include "ScenarioBinning/Logger.h"
#include "ScenarioBinning/Prebinning.h"
#include "ScenarioBinning/PrebinRefiner.h"
#include "ScenarioBinning/ScenarioData.h"
#include "ScenarioBinning/ScenarioOptimizer.h"
#include "common/format_utils.h"
#include "common/safe_math.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <numeric>
#include <utility>

namespace ScenarioBinning {

namespace {

/// Sort user splits and carry their fixed flags along
void prepare_user_splits(const BinningConfig& config, std::vector<double>& splits,
                         std::vector<bool>& fixed) {
  const std::vector<double>& user_splits = *config.user_splits;

  std::vector<double> sorted(user_splits);
  std::sort(sorted.begin(), sorted.end());
  if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end()) {
    throw ValidationError("User splits are not unique.");
  }

  std::vector<std::size_t> order(user_splits.size());
  std::iota(order.begin(), order.end(), 0);
  std::sort(order.begin(), order.end(), [&user_splits](std::size_t a, std::size_t b) {
    return user_splits[a] < user_splits[b];
  });

  splits.clear();
  fixed.clear();
  for (std::size_t idx : order) {
    splits.push_back(user_splits[idx]);
    fixed.push_back(config.user_splits_fixed ? (*config.user_splits_fixed)[idx] : false);
  }
}

std::pair<double, double> clean_range(const std::vector<double>& x) {
  if (x.empty()) {
    return {std::numeric_limits<double>::quiet_NaN(), std::numeric_limits<double>::quiet_NaN()};
  }
  const auto [lo, hi] = std::minmax_element(x.begin(), x.end());
  return {*lo, *hi};
}

} // namespace

ScenarioOptimalBinning::ScenarioOptimalBinning(BinningConfig config,
                                               SolverFactory solver_factory,
                                               std::ostream* log_sink)
  : config_(std::move(config)),
    solver_factory_(solver_factory ? std::move(solver_factory) : default_solver_factory()),
    log_sink_(log_sink != nullptr ? log_sink : &std::cerr) {}

ScenarioOptimalBinning& ScenarioOptimalBinning::fit(const std::vector<std::vector<double>>& X,
                                                    const std::vector<std::vector<int>>& Y,
                                                    const std::vector<double>& weights,
                                                    bool check_input) {
  Logger logger(config_.verbose, LogLevel::INFO, log_sink_);
  Logger::Timer total_timer;

  logger.info("Optimal binning started.");
  logger.info("Options: check parameters.");
  validate_config(config_);

  auto result = std::make_shared<FitResult>();
  result->special_codes = config_.special_codes;

  // ---------------------------------------------------------------------------
  // Pre-processing
  // ---------------------------------------------------------------------------
  logger.info("Pre-processing started.");
  Logger::Timer stage_timer;

  ScenarioData data = split_data_scenarios(X, Y, weights, config_.special_codes, check_input);
  if (data.n_infinite > 0) {
    logger.warning(data.n_infinite, " infinite value(s) treated as missing.");
  }

  result->n_scenarios = data.n_scenarios();
  result->n_samples = data.n_samples();
  result->n_clean = data.n_clean();
  result->n_missing = data.n_missing();
  result->n_special = data.n_special();
  result->timing.preprocessing = stage_timer.elapsed();

  logger.info("Pre-processing: number of samples: ", result->n_samples);
  logger.info("Pre-processing: number of clean samples: ", result->n_clean);
  logger.info("Pre-processing: number of missing samples: ", result->n_missing);
  logger.info("Pre-processing: number of special samples: ", result->n_special);
  logger.info("Pre-processing terminated. Time: ", format_double(result->timing.preprocessing, 4), "s");

  // ---------------------------------------------------------------------------
  // Pre-binning
  // ---------------------------------------------------------------------------
  logger.info("Pre-binning started.");
  stage_timer = Logger::Timer();

  std::vector<double> splits;
  std::vector<bool> fixed;
  if (config_.user_splits) {
    prepare_user_splits(config_, splits, fixed);
  } else {
    const long min_bin_size = static_cast<long>(
      std::ceil(config_.min_prebin_size * static_cast<double>(data.n_samples())));
    const PooledSample pooled = pool_scenarios(data);
    const auto generator = make_split_generator(config_, min_bin_size);
    splits = generator->generate(pooled.x, pooled.y, pooled.sample_weight);
    fixed.assign(splits.size(), false);
    logger.debug("Pre-binning: method ", generator->name(), ", min bin size ", min_bin_size);
  }

  if (config_.split_digits) {
    for (double& split : splits) {
      split = round_half_even(split, *config_.split_digits);
    }
  }

  result->n_initial_prebins = static_cast<int>(splits.size()) + 1;
  result->timing.prebinning = stage_timer.elapsed();
  logger.info("Pre-binning: number of candidate prebins: ", result->n_initial_prebins);
  logger.info("Pre-binning terminated. Time: ", format_double(result->timing.prebinning, 4), "s");

  // ---------------------------------------------------------------------------
  // Refinement of pure prebins
  // ---------------------------------------------------------------------------
  stage_timer = Logger::Timer();

  PrebinRefiner refiner(data, &logger);
  RefinementResult refined = refiner.refine(splits, fixed);

  result->n_refinements = refined.n_refinements;
  result->n_prebins = static_cast<int>(refined.splits.size()) + 1;
  result->refined_splits = refined.splits;
  result->timing.refinement = stage_timer.elapsed();
  logger.info("Pre-binning: number of refinements: ", refined.n_refinements);
  logger.info("Pre-binning: number of prebins: ", result->n_prebins);

  if (refined.splits.empty()) {
    logger.warning("No candidate splits remain after pre-binning; a single clean bin is used.");
  }

  // ---------------------------------------------------------------------------
  // Optimization
  // ---------------------------------------------------------------------------
  logger.info("Optimizer started.");
  stage_timer = Logger::Timer();

  ScenarioOptimizer optimizer(config_, data.n_samples_scenario(), solver_factory_, &logger);
  OptimizerResult optimized = optimizer.optimize(refined.counts, data.weights, refined.fixed);

  result->status = optimized.status;
  result->solution = optimized.solution;
  result->solver_run = optimized.solver_run;
  result->solver_statistics = optimized.statistics;
  result->splits = optimal_splits(refined.splits, optimized.solution);
  result->timing.optimizer = stage_timer.elapsed();

  switch (optimized.status) {
  case SolverStatus::FEASIBLE:
    logger.warning("Time limit of ", config_.time_limit,
                   "s reached; the best solution found is not proven optimal.");
    break;
  case SolverStatus::STOPPED:
    logger.warning("Time limit of ", config_.time_limit,
                   "s reached before a solution was found; a single clean bin is used.");
    break;
  case SolverStatus::INFEASIBLE:
    logger.warning("The optimization problem is infeasible; a single clean bin is used.");
    break;
  default:
    break;
  }

  logger.info("Optimizer terminated. Status: ", solver_status_to_string(optimized.status),
              ". Time: ", format_double(result->timing.optimizer, 4), "s");

  // ---------------------------------------------------------------------------
  // Post-processing
  // ---------------------------------------------------------------------------
  logger.info("Post-processing started.");
  stage_timer = Logger::Timer();

  const CountMatrix final_counts = compute_count_matrix(result->splits, data);
  const std::size_t n_bins = result->splits.size() + 1;

  result->n_nonevent.assign(n_bins + 2, 0);
  result->n_event.assign(n_bins + 2, 0);

  double global_min = std::numeric_limits<double>::quiet_NaN();
  double global_max = std::numeric_limits<double>::quiet_NaN();

  for (std::size_t s = 0; s < data.n_scenarios(); ++s) {
    std::vector<long> ne = final_counts.nonevent_column(s);
    std::vector<long> e = final_counts.event_column(s);
    ne.push_back(data.special[s].nonevent);
    e.push_back(data.special[s].event);
    ne.push_back(data.missing[s].nonevent);
    e.push_back(data.missing[s].event);

    for (std::size_t i = 0; i < ne.size(); ++i) {
      result->n_nonevent[i] += ne[i];
      result->n_event[i] += e[i];
    }

    const auto [min_x, max_x] = clean_range(data.scenarios[s].x_clean);
    if (!std::isnan(min_x)) {
      global_min = std::isnan(global_min) ? min_x : std::min(global_min, min_x);
      global_max = std::isnan(global_max) ? max_x : std::max(global_max, max_x);
    }

    result->scenario_tables.emplace_back(config_.name, result->splits, std::move(ne),
                                         std::move(e), min_x, max_x);
  }

  result->table = BinningTable(config_.name, result->splits, result->n_nonevent,
                               result->n_event, global_min, global_max);

  result->timing.postprocessing = stage_timer.elapsed();
  logger.info("Post-processing terminated. Time: ",
              format_double(result->timing.postprocessing, 4), "s");

  result->timing.total = total_timer.elapsed();
  result->warnings = logger.warnings();
  logger.info("Optimal binning terminated. Status: ", solver_status_to_string(result->status),
              ". Time: ", format_double(result->timing.total, 4), "s");

  result_ = std::move(result);
  return *this;
}

std::vector<double> ScenarioOptimalBinning::fit_transform(const std::vector<double>& x,
                                                          const std::vector<std::vector<double>>& X,
                                                          const std::vector<std::vector<int>>& Y,
                                                          const std::vector<double>& weights,
                                                          TransformMetric metric,
                                                          const MetricFill& metric_special,
                                                          const MetricFill& metric_missing,
                                                          bool check_input) {
  return fit(X, Y, weights, check_input).transform(x, metric, metric_special, metric_missing);
}

std::vector<double> ScenarioOptimalBinning::transform(const std::vector<double>& x,
                                                      TransformMetric metric,
                                                      const MetricFill& metric_special,
                                                      const MetricFill& metric_missing) const {
  const FitResult& fit_result = fitted();
  return transform_binary_target(fit_result.splits, fit_result.n_nonevent, fit_result.n_event,
                                 fit_result.special_codes, x, metric, metric_special,
                                 metric_missing);
}

std::vector<std::string> ScenarioOptimalBinning::transform_bins(const std::vector<double>& x,
                                                                int show_digits) const {
  const FitResult& fit_result = fitted();
  return ScenarioBinning::transform_bins(fit_result.splits, fit_result.special_codes, x,
                                         show_digits);
}

const FitResult& ScenarioOptimalBinning::fitted() const {
  if (!result_) {
    throw NotFittedError("This ScenarioOptimalBinning instance is not fitted yet. "
                         "Call fit() with appropriate arguments.");
  }
  return *result_;
}

const std::vector<double>& ScenarioOptimalBinning::splits() const {
  return fitted().splits;
}

SolverStatus ScenarioOptimalBinning::status() const {
  return fitted().status;
}

const BinningTable& ScenarioOptimalBinning::binning_table() const {
  return fitted().table;
}

const BinningTable& ScenarioOptimalBinning::binning_table_scenario(std::size_t scenario) const {
  const FitResult& fit_result = fitted();
  if (scenario >= fit_result.scenario_tables.size()) {
    throw ValidationError("scenario_id must be < " +
                          std::to_string(fit_result.scenario_tables.size()) + "; got " +
                          std::to_string(scenario) + ".");
  }
  return fit_result.scenario_tables[scenario];
}

const FitResult& ScenarioOptimalBinning::result() const {
  return fitted();
}

void ScenarioOptimalBinning::information(std::ostream& os, int print_level) const {
  if (print_level < 0 || print_level > 2) {
    throw ValidationError("print_level must be 0, 1 or 2; got " + std::to_string(print_level) + ".");
  }

  const FitResult& r = fitted();

  os << "Scenario optimal binning";
  if (!config_.name.empty()) os << " (" << config_.name << ")";
  os << "\n"
     << "  Status               : " << solver_status_to_string(r.status) << "\n"
     << "  Number of scenarios  : " << r.n_scenarios << "\n"
     << "  Number of prebins    : " << r.n_prebins << " (of " << r.n_initial_prebins
     << " candidates)\n"
     << "  Number of refinements: " << r.n_refinements << "\n"
     << "  Number of bins       : " << r.splits.size() + 1 << "\n"
     << "  IV                   : " << format_double(r.table.iv(), 6) << "\n"
     << "  Gini                 : " << format_double(r.table.gini(), 6) << "\n";

  if (print_level >= 1) {
    os << "\n  Samples: " << r.n_samples << " (clean " << r.n_clean << ", missing "
       << r.n_missing << ", special " << r.n_special << ")\n";

    os << "\n  Timing\n"
       << "    Total          : " << format_double(r.timing.total, 4) << " sec\n"
       << "    Pre-processing : " << format_double(r.timing.preprocessing, 4) << " sec\n"
       << "    Pre-binning    : " << format_double(r.timing.prebinning, 4) << " sec\n"
       << "    Refinement     : " << format_double(r.timing.refinement, 4) << " sec\n"
       << "    Solver         : " << format_double(r.timing.optimizer, 4) << " sec\n"
       << "    Post-processing: " << format_double(r.timing.postprocessing, 4) << " sec\n";

    if (r.solver_run) {
      const SolverStatistics& st = r.solver_statistics;
      os << "\n  Solver statistics\n"
         << "    Variables  : " << st.n_variables << "\n"
         << "    Constraints: " << st.n_constraints << "\n"
         << "    Nodes      : " << st.n_nodes << "\n"
         << "    Conflicts  : " << st.n_conflicts << "\n"
         << "    Objective  : " << format_double(st.objective, 6) << "\n";
    }

    for (const auto& warning : r.warnings) {
      os << "  Warning: " << warning << "\n";
    }
  }

  if (print_level == 2) {
    os << "\n  Options\n"
       << "    prebinning_method  : " << prebinning_method_to_string(config_.prebinning_method) << "\n"
       << "    max_n_prebins      : " << config_.max_n_prebins << "\n"
       << "    min_prebin_size    : " << config_.min_prebin_size << "\n"
       << "    monotonic_trend    : " << monotonic_trend_to_string(config_.monotonic_trend) << "\n"
       << "    min_event_rate_diff: " << config_.min_event_rate_diff << "\n"
       << "    max_pvalue_policy  : " << pvalue_policy_to_string(config_.max_pvalue_policy) << "\n"
       << "    time_limit         : " << config_.time_limit << "\n";

    os << "\n";
    r.table.print(os);
  }
}

} // namespace ScenarioBinning
