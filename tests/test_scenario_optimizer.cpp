#include <gtest/gtest.h>

#include "ScenarioBinning/BranchAndBoundSolver.h"
#include "ScenarioBinning/ScenarioOptimizer.h"
#include "common/stat_tests.h"
#include "test_helpers.h"

#include <memory>

using namespace ScenarioBinning;
using namespace ScenarioBinning::testing_helpers;

namespace {

/// Four prebins of 50 records with event rates 0.2, 0.6, 0.3, 0.8
ScenarioSpec zigzag() {
  return ScenarioSpec{{{40, 10}, {20, 30}, {35, 15}, {10, 40}}};
}

struct Problem {
  ScenarioData data;
  std::vector<double> splits;
  CountMatrix counts;
};

Problem make_problem(const std::vector<ScenarioSpec>& specs) {
  Problem p{make_data(specs), unit_splits(specs[0].prebins.size()), CountMatrix()};
  p.counts = compute_count_matrix(p.splits, p.data);
  return p;
}

OptimizerResult run(const BinningConfig& config, const Problem& p,
                    const std::vector<bool>& fixed = {}) {
  ScenarioOptimizer optimizer(config, p.data.n_samples_scenario());
  return optimizer.optimize(p.counts, p.data.weights, fixed);
}

/// Event rates of the bins selected by a solution
std::vector<double> solution_rates(const Problem& p, const OptimizerResult& result) {
  CountMatrix final_counts = compute_count_matrix(optimal_splits(p.splits, result.solution), p.data);
  return aggregate_event_rates(final_counts, p.data.weights);
}

} // namespace

TEST(ScenarioOptimizerTest, EmptyMatrixSkipsSolver) {
  int calls = 0;
  SolverFactory factory = [&calls]() {
    ++calls;
    return std::make_unique<BranchAndBoundSolver>();
  };

  BinningConfig config;
  ScenarioOptimizer optimizer(config, {10, 10}, factory);
  OptimizerResult result = optimizer.optimize(CountMatrix(), {1.0, 1.0}, {});

  EXPECT_EQ(result.status, SolverStatus::OPTIMAL);
  EXPECT_TRUE(result.solution.empty());
  EXPECT_FALSE(result.solver_run);
  EXPECT_EQ(calls, 0);
}

TEST(ScenarioOptimizerTest, UnconstrainedKeepsEveryInformativeSplit) {
  Problem p = make_problem({zigzag(), zigzag()});
  OptimizerResult result = run(BinningConfig(), p);

  EXPECT_EQ(result.status, SolverStatus::OPTIMAL);
  EXPECT_TRUE(result.solver_run);
  EXPECT_EQ(result.solution, (std::vector<bool>{true, true, true, true}));
  EXPECT_GT(result.statistics.objective, 0.0);
}

TEST(ScenarioOptimizerTest, AscendingTrendHoldsOnAggregate) {
  Problem p = make_problem({zigzag(), zigzag()});
  BinningConfig config;
  config.monotonic_trend = MonotonicTrend::ASCENDING;

  OptimizerResult result = run(config, p);
  ASSERT_EQ(result.status, SolverStatus::OPTIMAL);
  ASSERT_EQ(result.solution.size(), 4u);
  EXPECT_TRUE(result.solution.back());

  std::vector<double> rates = solution_rates(p, result);
  ASSERT_GE(rates.size(), 2u);
  for (std::size_t i = 1; i < rates.size(); ++i) {
    EXPECT_GE(rates[i], rates[i - 1]);
  }
}

TEST(ScenarioOptimizerTest, DescendingTrendHoldsOnAggregate) {
  Problem p = make_problem({zigzag(), zigzag()});
  BinningConfig config;
  config.monotonic_trend = MonotonicTrend::DESCENDING;

  OptimizerResult result = run(config, p);
  ASSERT_EQ(result.status, SolverStatus::OPTIMAL);

  std::vector<double> rates = solution_rates(p, result);
  for (std::size_t i = 1; i < rates.size(); ++i) {
    EXPECT_LE(rates[i], rates[i - 1]);
  }
}

TEST(ScenarioOptimizerTest, MinEventRateDiffSeparatesBins) {
  Problem p = make_problem({zigzag(), zigzag()});
  BinningConfig config;
  config.monotonic_trend = MonotonicTrend::ASCENDING;
  config.min_event_rate_diff = 0.3;

  OptimizerResult result = run(config, p);
  ASSERT_EQ(result.status, SolverStatus::OPTIMAL);

  std::vector<double> rates = solution_rates(p, result);
  for (std::size_t i = 1; i < rates.size(); ++i) {
    EXPECT_GE(rates[i] - rates[i - 1], 0.3 - 1e-9);
  }
}

TEST(ScenarioOptimizerTest, PeakTrendIsUnimodal) {
  Problem p = make_problem({zigzag(), zigzag()});
  BinningConfig config;
  config.monotonic_trend = MonotonicTrend::PEAK;

  OptimizerResult result = run(config, p);
  ASSERT_EQ(result.status, SolverStatus::OPTIMAL);

  std::vector<double> rates = solution_rates(p, result);
  std::size_t i = 1;
  while (i < rates.size() && rates[i] >= rates[i - 1]) ++i;
  while (i < rates.size() && rates[i] <= rates[i - 1]) ++i;
  EXPECT_EQ(i, rates.size());
}

TEST(ScenarioOptimizerTest, ConvexTrendHasNonNegativeSecondDifferences) {
  Problem p = make_problem({zigzag(), zigzag()});
  BinningConfig config;
  config.monotonic_trend = MonotonicTrend::CONVEX;

  OptimizerResult result = run(config, p);
  ASSERT_EQ(result.status, SolverStatus::OPTIMAL);

  std::vector<double> rates = solution_rates(p, result);
  for (std::size_t i = 2; i < rates.size(); ++i) {
    EXPECT_GE(rates[i - 2] - 2.0 * rates[i - 1] + rates[i], -1e-9);
  }
}

TEST(ScenarioOptimizerTest, BinSizeBoundsHoldInEveryScenario) {
  Problem p = make_problem({zigzag(), zigzag()});
  BinningConfig config;
  config.min_bin_size = 0.3;

  OptimizerResult result = run(config, p);
  ASSERT_EQ(result.status, SolverStatus::OPTIMAL);

  CountMatrix final_counts = compute_count_matrix(optimal_splits(p.splits, result.solution), p.data);
  for (std::size_t i = 0; i < final_counts.n_bins(); ++i) {
    for (std::size_t s = 0; s < final_counts.n_scenarios(); ++s) {
      EXPECT_GE(final_counts.records(i, s), 60);
    }
  }
}

TEST(ScenarioOptimizerTest, BinCountAndFixedSplits) {
  Problem p = make_problem({zigzag(), zigzag()});
  BinningConfig config;
  config.max_n_bins = 2;

  OptimizerResult result = run(config, p, {false, true, false});
  ASSERT_EQ(result.status, SolverStatus::OPTIMAL);
  EXPECT_EQ(result.solution, (std::vector<bool>{false, true, false, true}));

  config.max_n_bins = 1;
  OptimizerResult single = run(config, p);
  ASSERT_EQ(single.status, SolverStatus::OPTIMAL);
  EXPECT_EQ(single.solution, (std::vector<bool>{false, false, false, true}));
}

TEST(ScenarioOptimizerTest, InfeasibleFixedSplitsFallBackToSingleBin) {
  Problem p = make_problem({zigzag(), zigzag()});
  BinningConfig config;
  config.max_n_bins = 1;

  OptimizerResult result = run(config, p, {true, false, false});
  EXPECT_EQ(result.status, SolverStatus::INFEASIBLE);
  EXPECT_EQ(result.solution, (std::vector<bool>{false, false, false, true}));
}

TEST(ScenarioOptimizerTest, PValueHoldsPerScenario) {
  ScenarioSpec a{{{25, 25}, {26, 24}, {5, 45}, {4, 46}}};
  ScenarioSpec b{{{30, 20}, {24, 26}, {8, 42}, {6, 44}}};
  Problem p = make_problem({a, b});
  BinningConfig config;
  config.max_pvalue = 0.05;

  OptimizerResult result = run(config, p);
  ASSERT_EQ(result.status, SolverStatus::OPTIMAL);

  CountMatrix final_counts = compute_count_matrix(optimal_splits(p.splits, result.solution), p.data);
  for (std::size_t i = 1; i < final_counts.n_bins(); ++i) {
    for (std::size_t s = 0; s < final_counts.n_scenarios(); ++s) {
      double pvalue = test_proportions(final_counts.event(i - 1, s), final_counts.nonevent(i - 1, s),
                                       final_counts.event(i, s), final_counts.nonevent(i, s));
      EXPECT_LE(pvalue, 0.05);
    }
  }
}

TEST(ScenarioOptimizerTest, ZeroTimeLimitDoesNotHang) {
  Problem p = make_problem({zigzag(), zigzag()});
  BinningConfig config;
  config.time_limit = 0.0;

  OptimizerResult result = run(config, p);
  EXPECT_TRUE(result.status == SolverStatus::STOPPED || result.status == SolverStatus::FEASIBLE);
  ASSERT_EQ(result.solution.size(), 4u);
  EXPECT_TRUE(result.solution.back());
}

TEST(ScenarioOptimizerTest, LargeConcaveModelRespectsTimeLimit) {
  ScenarioSpec first;
  ScenarioSpec second;
  for (int k = 0; k < 40; ++k) {
    first.prebins.push_back({30 + (k * 7) % 11, 10 + (k * 13) % 17});
    second.prebins.push_back({25 + (k * 5) % 13, 12 + (k * 11) % 19});
  }
  Problem p = make_problem({first, second});

  BinningConfig config;
  config.monotonic_trend = MonotonicTrend::CONCAVE;
  config.max_pvalue = 0.05;
  config.max_pvalue_policy = PValuePolicy::ALL;
  config.time_limit = 0.2;

  OptimizerResult result = run(config, p);
  EXPECT_TRUE(result.solver_run);
  EXPECT_NE(result.status, SolverStatus::UNKNOWN);
  EXPECT_LT(result.statistics.time, config.time_limit + 0.3);
  ASSERT_EQ(result.solution.size(), 40u);
  EXPECT_TRUE(result.solution.back());
}

TEST(ScenarioOptimizerTest, OptimalSplitsSkipSentinel) {
  EXPECT_EQ(optimal_splits({1.5, 2.5, 3.5}, {true, false, true, true}),
            (std::vector<double>{1.5, 3.5}));
  EXPECT_TRUE(optimal_splits({}, {}).empty());
}
