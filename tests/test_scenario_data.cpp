#include <gtest/gtest.h>

#include "ScenarioBinning/Exceptions.h"
#include "ScenarioBinning/ScenarioData.h"

#include <cmath>
#include <limits>

using namespace ScenarioBinning;

namespace {
const double NaN = std::numeric_limits<double>::quiet_NaN();
const double Inf = std::numeric_limits<double>::infinity();
}

TEST(ScenarioDataTest, PartitionsCleanMissingAndSpecial) {
  std::vector<std::vector<double>> X = {{1.0, NaN, -999.0, 2.0, 3.0},
                                        {4.0, 5.0, NaN}};
  std::vector<std::vector<int>> Y = {{0, 1, 1, 0, 1},
                                     {1, 0, 0}};

  ScenarioData data = split_data_scenarios(X, Y, {}, {-999.0});

  ASSERT_EQ(data.n_scenarios(), 2u);
  EXPECT_EQ(data.scenarios[0].x_clean, (std::vector<double>{1.0, 2.0, 3.0}));
  EXPECT_EQ(data.scenarios[0].y_clean, (std::vector<int>{0, 0, 1}));
  EXPECT_EQ(data.scenarios[0].x_special, (std::vector<double>{-999.0}));
  EXPECT_EQ(data.scenarios[0].x_missing.size(), 1u);

  EXPECT_EQ(data.missing[0].event, 1);
  EXPECT_EQ(data.missing[0].nonevent, 0);
  EXPECT_EQ(data.special[0].event, 1);
  EXPECT_EQ(data.missing[1].nonevent, 1);
  EXPECT_EQ(data.special[1].total(), 0);

  EXPECT_EQ(data.n_samples_scenario(), (std::vector<long>{5, 3}));
  EXPECT_EQ(data.n_samples(), 8);
  EXPECT_EQ(data.n_clean(), 5);
  EXPECT_EQ(data.n_missing(), 2);
  EXPECT_EQ(data.n_special(), 1);
}

TEST(ScenarioDataTest, WeightsDefaultToOne) {
  ScenarioData data = split_data_scenarios({{1.0}, {2.0}, {3.0}}, {{0}, {1}, {0}}, {}, {});
  EXPECT_EQ(data.weights, (std::vector<double>{1.0, 1.0, 1.0}));

  ScenarioData weighted = split_data_scenarios({{1.0}, {2.0}}, {{0}, {1}}, {0.25, 0.75}, {});
  EXPECT_EQ(weighted.weights, (std::vector<double>{0.25, 0.75}));
}

TEST(ScenarioDataTest, RejectsInconsistentShapes) {
  EXPECT_THROW(split_data_scenarios({{1.0}, {2.0}}, {{0}}, {}, {}), ValidationError);
  EXPECT_THROW(split_data_scenarios({}, {}, {}, {}), ValidationError);
  EXPECT_THROW(split_data_scenarios({{1.0, 2.0}}, {{0}}, {}, {}), ValidationError);
  EXPECT_THROW(split_data_scenarios({{1.0}, {2.0}}, {{0}, {1}}, {1.0}, {}), ValidationError);
}

TEST(ScenarioDataTest, RejectsInvalidLabelsAndWeights) {
  EXPECT_THROW(split_data_scenarios({{1.0, 2.0}}, {{0, 2}}, {}, {}), ValidationError);
  EXPECT_THROW(split_data_scenarios({{1.0}}, {{1}}, {-1.0}, {}), ValidationError);
  EXPECT_THROW(split_data_scenarios({{1.0}}, {{1}}, {NaN}, {}), ValidationError);
}

TEST(ScenarioDataTest, InfiniteValuesAreMissingUnlessChecked) {
  std::vector<std::vector<double>> X = {{1.0, Inf, -Inf, 2.0}};
  std::vector<std::vector<int>> Y = {{0, 1, 0, 1}};

  ScenarioData data = split_data_scenarios(X, Y, {}, {}, false);
  EXPECT_EQ(data.n_infinite, 2u);
  EXPECT_EQ(data.n_missing(), 2);
  EXPECT_EQ(data.n_clean(), 2);

  EXPECT_THROW(split_data_scenarios(X, Y, {}, {}, true), ValidationError);
}

TEST(ScenarioDataTest, BinaryLabelsRejectNonIntegralValues) {
  EXPECT_EQ(binary_labels({0.0, 1.0, 1.0, 0.0}), (std::vector<int>{0, 1, 1, 0}));
  EXPECT_THROW(binary_labels({0.0, 0.7}), ValidationError);
  EXPECT_THROW(binary_labels({1.0, 2.0}, 3), ValidationError);
  EXPECT_THROW(binary_labels({NaN}), ValidationError);
}
