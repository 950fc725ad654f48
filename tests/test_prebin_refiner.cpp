#include <gtest/gtest.h>

#include "ScenarioBinning/CountMatrix.h"
#include "ScenarioBinning/Exceptions.h"
#include "ScenarioBinning/PrebinRefiner.h"
#include "ScenarioBinning/ScenarioData.h"

using namespace ScenarioBinning;

namespace {

/// Two scenarios over x = 1..8; splits {2.5, 4.5, 6.5} leave the last two
/// bins of scenario A pure
ScenarioData eight_value_data() {
  std::vector<std::vector<double>> X = {{1, 2, 3, 4, 5, 6, 7, 8},
                                        {1, 2, 3, 4, 5, 6, 7, 8}};
  std::vector<std::vector<int>> Y = {{0, 1, 0, 1, 0, 0, 1, 1},
                                     {1, 0, 1, 0, 1, 0, 0, 1}};
  return split_data_scenarios(X, Y, {}, {});
}

void expect_counts_conserved(const CountMatrix& counts, const ScenarioData& data) {
  for (std::size_t s = 0; s < counts.n_scenarios(); ++s) {
    EXPECT_EQ(counts.scenario_total(s).total(),
              static_cast<long>(data.scenarios[s].x_clean.size()));
  }
}

} // namespace

TEST(CountMatrixTest, BinIndexIsRightOpen) {
  const std::vector<double> splits = {2.5, 4.5};
  EXPECT_EQ(bin_index(splits, 1.0), 0u);
  EXPECT_EQ(bin_index(splits, 2.4999), 0u);
  EXPECT_EQ(bin_index(splits, 2.5), 1u);
  EXPECT_EQ(bin_index(splits, 4.0), 1u);
  EXPECT_EQ(bin_index(splits, 4.5), 2u);
  EXPECT_EQ(bin_index(splits, 100.0), 2u);
  EXPECT_EQ(bin_index({}, 3.0), 0u);
}

TEST(CountMatrixTest, CountsEveryCleanRecordOnce) {
  ScenarioData data = eight_value_data();
  CountMatrix counts = compute_count_matrix({2.5, 4.5, 6.5}, data);

  ASSERT_EQ(counts.n_bins(), 4u);
  ASSERT_EQ(counts.n_scenarios(), 2u);
  EXPECT_EQ(counts.nonevent(2, 0), 2);
  EXPECT_EQ(counts.event(2, 0), 0);
  EXPECT_EQ(counts.event(3, 0), 2);
  EXPECT_EQ(counts.event_column(1), (std::vector<long>{1, 1, 1, 1}));
  expect_counts_conserved(counts, data);

  EXPECT_EQ(counts.pure_bins(), (std::vector<bool>{false, false, true, true}));
  EXPECT_TRUE(counts.has_pure_bin());
}

TEST(PrebinRefinerTest, RemovalMaskFoldsLastBinIntoLastSplit) {
  EXPECT_EQ(split_removal_mask({true, false, false}), (std::vector<bool>{true, false}));
  EXPECT_EQ(split_removal_mask({false, false, true}), (std::vector<bool>{false, true}));
  EXPECT_EQ(split_removal_mask({false, true, false}), (std::vector<bool>{false, true}));
  EXPECT_EQ(split_removal_mask({false, true, false, false}),
            (std::vector<bool>{false, true, false}));
  EXPECT_TRUE(split_removal_mask({true}).empty());
}

TEST(PrebinRefinerTest, TwoScenarioExampleLeavesNoPureBin) {
  std::vector<std::vector<double>> X = {{1, 2, 3, 4, 5, 6}, {1, 2, 3, 4, 5, 6}};
  std::vector<std::vector<int>> Y = {{0, 0, 0, 1, 1, 1}, {0, 0, 0, 1, 1, 1}};
  ScenarioData data = split_data_scenarios(X, Y, {}, {});

  const std::vector<double> splits = {2.5, 4.5};
  CountMatrix initial = compute_count_matrix(splits, data);
  ASSERT_EQ(initial.event(0, 0), 0);
  ASSERT_EQ(initial.event(0, 1), 0);

  RefinementResult result = PrebinRefiner(data).refine(splits, {});

  EXPECT_LT(result.splits.size(), splits.size());
  EXPECT_FALSE(result.counts.has_pure_bin());
  EXPECT_GE(result.n_refinements, 1);
  EXPECT_LE(result.n_refinements, static_cast<int>(splits.size()));
}

TEST(PrebinRefinerTest, RemovesPureBinsAndConservesCounts) {
  ScenarioData data = eight_value_data();

  RefinementResult result = PrebinRefiner(data).refine({2.5, 4.5, 6.5}, {});

  EXPECT_EQ(result.splits, (std::vector<double>{2.5, 4.5}));
  EXPECT_EQ(result.fixed, (std::vector<bool>{false, false}));
  EXPECT_EQ(result.n_refinements, 1);
  ASSERT_EQ(result.counts.n_bins(), 3u);
  EXPECT_FALSE(result.counts.has_pure_bin());
  expect_counts_conserved(result.counts, data);
}

TEST(PrebinRefinerTest, IsIdempotent) {
  ScenarioData data = eight_value_data();
  PrebinRefiner refiner(data);

  RefinementResult first = refiner.refine({2.5, 4.5, 6.5}, {});
  RefinementResult second = refiner.refine(first.splits, first.fixed);

  EXPECT_EQ(second.splits, first.splits);
  EXPECT_EQ(second.n_refinements, 0);
  ASSERT_EQ(second.counts.n_bins(), first.counts.n_bins());
  for (std::size_t i = 0; i < first.counts.n_bins(); ++i) {
    for (std::size_t s = 0; s < first.counts.n_scenarios(); ++s) {
      EXPECT_EQ(second.counts.nonevent(i, s), first.counts.nonevent(i, s));
      EXPECT_EQ(second.counts.event(i, s), first.counts.event(i, s));
    }
  }
}

TEST(PrebinRefinerTest, FixedSplitConflictLeavesCandidatesUntouched) {
  ScenarioData data = eight_value_data();
  const std::vector<double> splits = {2.5, 4.5, 6.5};
  const std::vector<bool> fixed = {false, false, true};
  const std::vector<double> splits_before = splits;

  try {
    PrebinRefiner(data).refine(splits, fixed);
    FAIL() << "Expected FixedSplitConflictError";
  } catch (const FixedSplitConflictError& e) {
    EXPECT_EQ(e.splits(), (std::vector<double>{6.5}));
  }

  EXPECT_EQ(splits, splits_before);
}

TEST(PrebinRefinerTest, EmptyCandidatesReturnImmediately) {
  ScenarioData data = eight_value_data();
  RefinementResult result = PrebinRefiner(data).refine({}, {});

  EXPECT_TRUE(result.splits.empty());
  EXPECT_TRUE(result.counts.empty());
  EXPECT_EQ(result.n_refinements, 0);
}

TEST(PrebinRefinerTest, RemovingEverySplitYieldsEmptyMatrix) {
  std::vector<std::vector<double>> X = {{1, 2, 3, 4}};
  std::vector<std::vector<int>> Y = {{0, 0, 1, 1}};
  ScenarioData data = split_data_scenarios(X, Y, {}, {});

  RefinementResult result = PrebinRefiner(data).refine({1.5, 2.5, 3.5}, {});

  EXPECT_TRUE(result.splits.empty());
  EXPECT_TRUE(result.counts.empty());
  EXPECT_LE(result.n_refinements, 3);
}

TEST(PrebinRefinerTest, RejectsMismatchedFixedFlags) {
  ScenarioData data = eight_value_data();
  EXPECT_THROW(PrebinRefiner(data).refine({2.5, 4.5}, {true}), ValidationError);
}
