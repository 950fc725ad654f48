#include "ScenarioBinning/ScenarioOptimizer.h"
#include "ScenarioBinning/BranchAndBoundSolver.h"
#include "ScenarioBinning/Exceptions.h"
#include "common/stat_tests.h"
#include "common/woe_iv_utils.h"

#include <algorithm>
#include <cmath>
#include <memory>
#include <string>
#include <utility>

namespace ScenarioBinning {

SolverFactory default_solver_factory() {
  return []() { return std::make_unique<BranchAndBoundSolver>(); };
}

std::vector<double> optimal_splits(const std::vector<double>& splits,
                                   const std::vector<bool>& solution) {
  std::vector<double> selected;
  const std::size_t n = std::min(splits.size(), solution.size());
  for (std::size_t i = 0; i < n; ++i) {
    if (solution[i]) selected.push_back(splits[i]);
  }
  return selected;
}

ScenarioOptimizer::ScenarioOptimizer(const BinningConfig& config,
                                     std::vector<long> n_samples_scenario,
                                     SolverFactory solver_factory, Logger* logger)
  : config_(config), n_samples_scenario_(std::move(n_samples_scenario)),
    solver_factory_(std::move(solver_factory)), logger_(logger) {}

namespace {

/// Big-M of the pairwise trend rows; event rate differences lie in [-1, 1]
constexpr double BIG_M_PAIR = 2.0;

/// Big-M of the convexity rows; second differences lie in [-2, 2]
constexpr double BIG_M_TRIPLE = 3.0;

/**
 * Precomputed per-(i, j) statistics of the candidate bin spanning prebins
 * j..i, stored in lower-triangular row-major order.
 */
class TriangularTable {
public:
  explicit TriangularTable(std::size_t n) : data_(n * (n + 1) / 2, 0.0) {}

  double& operator()(std::size_t i, std::size_t j) { return data_[i * (i + 1) / 2 + j]; }
  double operator()(std::size_t i, std::size_t j) const { return data_[i * (i + 1) / 2 + j]; }

private:
  std::vector<double> data_;
};

/// Telescoped linear form of the aggregate event rate of the bin ending at i
std::vector<LinearTerm> event_rate_terms(const std::vector<std::vector<VarId>>& x,
                                         const TriangularTable& D, std::size_t i,
                                         double scale) {
  std::vector<LinearTerm> terms;
  terms.reserve(i + 1);
  for (std::size_t j = 0; j < i; ++j) {
    const double coef = D(i, j) - D(i, j + 1);
    if (coef != 0.0) terms.push_back({x[i][j], scale * coef});
  }
  if (D(i, i) != 0.0) terms.push_back({x[i][i], scale * D(i, i)});
  return terms;
}

void append(std::vector<LinearTerm>& terms, const std::vector<LinearTerm>& more) {
  terms.insert(terms.end(), more.begin(), more.end());
}

} // namespace

OptimizerResult ScenarioOptimizer::optimize(const CountMatrix& counts,
                                            const std::vector<double>& weights,
                                            const std::vector<bool>& fixed) const {
  OptimizerResult result;

  if (counts.empty()) {
    result.status = SolverStatus::OPTIMAL;
    result.statistics.status = SolverStatus::OPTIMAL;
    return result;
  }

  const std::size_t n = counts.n_bins();
  const std::size_t n_scenarios = counts.n_scenarios();

  if (weights.size() != n_scenarios || n_samples_scenario_.size() != n_scenarios) {
    throw ValidationError("Count matrix, weights and scenario sizes must cover the same scenarios.");
  }
  if (!fixed.empty() && fixed.size() + 1 != n) {
    throw ValidationError("Fixed flags must have one entry per split.");
  }

  // ---------------------------------------------------------------------------
  // Precomputation
  // ---------------------------------------------------------------------------

  std::vector<ClassCounts> totals(n_scenarios);
  for (std::size_t s = 0; s < n_scenarios; ++s) {
    totals[s] = counts.scenario_total(s);
  }

  TriangularTable D(n);
  TriangularTable V(n);

  for (std::size_t i = 0; i < n; ++i) {
    double agg_nonevent = 0.0;
    double agg_event = 0.0;
    std::vector<double> ne(n_scenarios, 0.0);
    std::vector<double> e(n_scenarios, 0.0);

    for (std::size_t j = i + 1; j-- > 0;) {
      double value = 0.0;
      for (std::size_t s = 0; s < n_scenarios; ++s) {
        ne[s] += counts.nonevent(j, s);
        e[s] += counts.event(j, s);
        agg_nonevent += weights[s] * counts.nonevent(j, s);
        agg_event += weights[s] * counts.event(j, s);
        value += weights[s] * compute_iv(ne[s], e[s],
                                         static_cast<double>(totals[s].nonevent),
                                         static_cast<double>(totals[s].event));
      }
      D(i, j) = compute_event_rate(agg_nonevent, agg_event);
      V(i, j) = value;
    }
  }

  // ---------------------------------------------------------------------------
  // Variables
  // ---------------------------------------------------------------------------

  std::unique_ptr<SolverBackend> solver = solver_factory_();

  std::vector<std::vector<VarId>> x(n);
  for (std::size_t i = 0; i < n; ++i) {
    x[i].resize(i + 1);
    for (std::size_t j = 0; j <= i; ++j) {
      x[i][j] = solver->add_variable("x[" + std::to_string(i) + "," + std::to_string(j) + "]");
    }
  }

  const MonotonicTrend trend = config_.monotonic_trend;
  const bool has_switch = trend == MonotonicTrend::PEAK || trend == MonotonicTrend::VALLEY;
  std::vector<VarId> y;
  if (has_switch) {
    for (std::size_t i = 0; i < n; ++i) {
      y.push_back(solver->add_variable("y[" + std::to_string(i) + "]"));
    }
  }

  // ---------------------------------------------------------------------------
  // Structural constraints
  // ---------------------------------------------------------------------------

  // Every prebin belongs to exactly one bin
  for (std::size_t j = 0; j < n; ++j) {
    std::vector<LinearTerm> terms;
    for (std::size_t i = j; i < n; ++i) terms.push_back({x[i][j], 1.0});
    solver->add_constraint(LinearConstraint(terms, ConstraintSense::EQUAL, 1.0));
  }

  // Bins are contiguous runs ending at their last prebin
  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = 0; j < i; ++j) {
      solver->add_constraint(LinearConstraint({{x[i][j], 1.0}, {x[i][j + 1], -1.0}},
                                              ConstraintSense::LESS_EQUAL, 0.0));
    }
  }

  solver->add_constraint(LinearConstraint({{x[n - 1][n - 1], 1.0}}, ConstraintSense::EQUAL, 1.0));

  for (std::size_t i = 0; i < fixed.size(); ++i) {
    if (fixed[i]) {
      solver->add_constraint(LinearConstraint({{x[i][i], 1.0}}, ConstraintSense::EQUAL, 1.0));
    }
  }

  std::vector<LinearTerm> n_bins_terms;
  for (std::size_t i = 0; i < n; ++i) n_bins_terms.push_back({x[i][i], 1.0});
  if (config_.min_n_bins) {
    solver->add_constraint(LinearConstraint(n_bins_terms, ConstraintSense::GREATER_EQUAL,
                                            *config_.min_n_bins));
  }
  if (config_.max_n_bins) {
    solver->add_constraint(LinearConstraint(n_bins_terms, ConstraintSense::LESS_EQUAL,
                                            *config_.max_n_bins));
  }

  // Bin sizes, per scenario
  if (config_.min_bin_size || config_.max_bin_size) {
    for (std::size_t s = 0; s < n_scenarios; ++s) {
      const double n_s = static_cast<double>(n_samples_scenario_[s]);
      for (std::size_t i = 0; i < n; ++i) {
        std::vector<LinearTerm> size_terms;
        for (std::size_t j = 0; j <= i; ++j) {
          const double records = static_cast<double>(counts.records(j, s));
          if (records > 0) size_terms.push_back({x[i][j], records});
        }

        if (config_.min_bin_size) {
          const double min_size = std::ceil(*config_.min_bin_size * n_s);
          std::vector<LinearTerm> terms = size_terms;
          terms.push_back({x[i][i], -min_size});
          solver->add_constraint(LinearConstraint(terms, ConstraintSense::GREATER_EQUAL, 0.0));
        }
        if (config_.max_bin_size) {
          const double max_size = std::ceil(*config_.max_bin_size * n_s);
          std::vector<LinearTerm> terms = size_terms;
          terms.push_back({x[i][i], -max_size});
          solver->add_constraint(LinearConstraint(terms, ConstraintSense::LESS_EQUAL, 0.0));
        }
      }
    }
  }

  // ---------------------------------------------------------------------------
  // Event rate trend
  // ---------------------------------------------------------------------------

  const double d = config_.min_event_rate_diff;
  const double M = BIG_M_PAIR;

  // Consecutive bins (z+1..i) after (..z): x[z][z] and x[i][z+1] are both set
  auto add_pair_trend = [&](std::size_t z, std::size_t i, bool ascending,
                            const std::vector<LinearTerm>& extra, double extra_rhs) {
    std::vector<LinearTerm> terms = event_rate_terms(x, D, i, ascending ? 1.0 : -1.0);
    append(terms, event_rate_terms(x, D, z, ascending ? -1.0 : 1.0));
    terms.push_back({x[z][z], -M});
    terms.push_back({x[i][z + 1], -M});
    append(terms, extra);
    solver->add_constraint(LinearConstraint(terms, ConstraintSense::GREATER_EQUAL,
                                            d - 2.0 * M + extra_rhs));
  };

  if (trend == MonotonicTrend::ASCENDING || trend == MonotonicTrend::DESCENDING) {
    const bool ascending = trend == MonotonicTrend::ASCENDING;
    for (std::size_t z = 0; z + 1 < n; ++z) {
      for (std::size_t i = z + 1; i < n; ++i) {
        add_pair_trend(z, i, ascending, {}, 0.0);
      }
    }
  } else if (has_switch) {
    for (std::size_t i = 0; i + 1 < n; ++i) {
      solver->add_constraint(LinearConstraint({{y[i], 1.0}, {y[i + 1], -1.0}},
                                              ConstraintSense::LESS_EQUAL, 0.0));
    }

    // Peak: ascending while y = 0, descending once y = 1. Valley mirrors it.
    const bool peak = trend == MonotonicTrend::PEAK;
    for (std::size_t z = 0; z + 1 < n; ++z) {
      for (std::size_t i = z + 1; i < n; ++i) {
        // relaxed when y[i] = 1
        add_pair_trend(z, i, peak, {{y[i], M}}, 0.0);
        // relaxed when y[i] = 0
        add_pair_trend(z, i, !peak, {{y[i], -M}}, -M);
      }
    }
  } else if (trend == MonotonicTrend::CONVEX || trend == MonotonicTrend::CONCAVE) {
    const double sign = trend == MonotonicTrend::CONVEX ? 1.0 : -1.0;
    const double M3 = BIG_M_TRIPLE;
    for (std::size_t z = 0; z + 2 < n; ++z) {
      for (std::size_t i = z + 1; i + 1 < n; ++i) {
        for (std::size_t k = i + 1; k < n; ++k) {
          std::vector<LinearTerm> terms = event_rate_terms(x, D, z, sign);
          append(terms, event_rate_terms(x, D, i, -2.0 * sign));
          append(terms, event_rate_terms(x, D, k, sign));
          terms.push_back({x[z][z], -M3});
          terms.push_back({x[i][z + 1], -M3});
          terms.push_back({x[k][i + 1], -M3});
          solver->add_constraint(LinearConstraint(terms, ConstraintSense::GREATER_EQUAL,
                                                  -3.0 * M3));
        }
      }
    }
  }

  // ---------------------------------------------------------------------------
  // Significance between bins, per scenario
  // ---------------------------------------------------------------------------

  long n_pvalue_rows = 0;
  if (config_.max_pvalue) {
    const double max_pvalue = *config_.max_pvalue;
    const bool all_pairs = config_.max_pvalue_policy == PValuePolicy::ALL;

    // Per scenario cumulative counts for range sums
    std::vector<std::vector<double>> cum_ne(n_scenarios, std::vector<double>(n + 1, 0.0));
    std::vector<std::vector<double>> cum_e(n_scenarios, std::vector<double>(n + 1, 0.0));
    for (std::size_t s = 0; s < n_scenarios; ++s) {
      for (std::size_t j = 0; j < n; ++j) {
        cum_ne[s][j + 1] = cum_ne[s][j] + counts.nonevent(j, s);
        cum_e[s][j + 1] = cum_e[s][j] + counts.event(j, s);
      }
    }

    auto violates = [&](std::size_t r, std::size_t i, std::size_t k, std::size_t j) {
      for (std::size_t s = 0; s < n_scenarios; ++s) {
        const double ne1 = cum_ne[s][i + 1] - cum_ne[s][r];
        const double e1 = cum_e[s][i + 1] - cum_e[s][r];
        const double ne2 = cum_ne[s][j + 1] - cum_ne[s][k];
        const double e2 = cum_e[s][j + 1] - cum_e[s][k];
        if (test_proportions(e1, ne1, e2, ne2) > max_pvalue) return true;
      }
      return false;
    };

    // Bin r..i and bin k..j cannot both be selected
    for (std::size_t i = 0; i + 1 < n; ++i) {
      for (std::size_t r = 0; r <= i; ++r) {
        const std::size_t k_end = all_pairs ? n : i + 2;
        for (std::size_t k = i + 1; k < k_end; ++k) {
          for (std::size_t j = k; j < n; ++j) {
            if (!violates(r, i, k, j)) continue;

            std::vector<LinearTerm> terms = {{x[i][r], 1.0}, {x[j][k], 1.0},
                                             {x[k - 1][k - 1], 1.0}};
            if (r > 0) terms.push_back({x[r - 1][r - 1], 1.0});
            const double rhs = static_cast<double>(terms.size()) - 1.0;
            solver->add_constraint(LinearConstraint(terms, ConstraintSense::LESS_EQUAL, rhs));
            n_pvalue_rows++;
          }
        }
      }
    }
  }

  // ---------------------------------------------------------------------------
  // Objective and search order
  // ---------------------------------------------------------------------------

  std::vector<LinearTerm> objective;
  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = 0; j < i; ++j) {
      objective.push_back({x[i][j], V(i, j) - V(i, j + 1)});
    }
    objective.push_back({x[i][i], V(i, i)});
  }
  solver->set_objective(objective, true);

  std::vector<VarId> decisions;
  for (std::size_t i = 0; i < n; ++i) {
    if (has_switch) decisions.push_back(y[i]);
    decisions.push_back(x[i][i]);
  }
  solver->add_decision_strategy(decisions);

  if (logger_ != nullptr) {
    logger_->debug("Optimizer model: ", n, " prebins, ", n_scenarios, " scenarios, ",
                   n_pvalue_rows, " p-value rows");
  }

  // ---------------------------------------------------------------------------
  // Solve
  // ---------------------------------------------------------------------------

  result.status = solver->solve(config_.time_limit);
  result.statistics = solver->statistics();
  result.solver_run = true;

  result.solution.assign(n, false);
  if (has_solution(result.status)) {
    for (std::size_t i = 0; i < n; ++i) {
      result.solution[i] = solver->boolean_value(x[i][i]);
    }
  } else {
    result.solution[n - 1] = true;
  }

  return result;
}

} // namespace ScenarioBinning
