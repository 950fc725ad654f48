#include <gtest/gtest.h>

#include "ScenarioBinning/Exceptions.h"
#include "ScenarioBinning/Transform.h"

#include <cmath>
#include <limits>

using namespace ScenarioBinning;

namespace {

const double NaN = std::numeric_limits<double>::quiet_NaN();

const std::vector<double> kSplits = {2.0};
const std::vector<long> kNonevent = {40, 10, 5, 5};
const std::vector<long> kEvent = {10, 40, 5, 15};
const std::vector<double> kSpecial = {-999.0};
const std::vector<double> kValues = {1.0, 3.0, NaN, -999.0, 2.0};

} // namespace

TEST(TransformTest, IndicesFollowRightOpenBins) {
  std::vector<double> empirical = transform_binary_target(
      kSplits, kNonevent, kEvent, kSpecial, kValues, TransformMetric::INDICES,
      MetricFill::empirical(), MetricFill::empirical());
  EXPECT_EQ(empirical, (std::vector<double>{0.0, 1.0, 3.0, 2.0, 1.0}));

  std::vector<double> defaults = transform_binary_target(
      kSplits, kNonevent, kEvent, kSpecial, kValues, TransformMetric::INDICES);
  EXPECT_EQ(defaults, (std::vector<double>{0.0, 1.0, 0.0, 0.0, 1.0}));
}

TEST(TransformTest, WoeUsesFittedTotals) {
  std::vector<double> woe = transform_binary_target(
      kSplits, kNonevent, kEvent, kSpecial, kValues, TransformMetric::WOE,
      MetricFill::constant(-1.0), MetricFill::empirical());

  const double total_nonevent = 60.0;
  const double total_event = 70.0;
  EXPECT_NEAR(woe[0], std::log((40.0 / total_nonevent) / (10.0 / total_event)), 1e-12);
  EXPECT_NEAR(woe[1], std::log((10.0 / total_nonevent) / (40.0 / total_event)), 1e-12);
  EXPECT_NEAR(woe[2], std::log((5.0 / total_nonevent) / (15.0 / total_event)), 1e-12);
  EXPECT_DOUBLE_EQ(woe[3], -1.0);
  EXPECT_DOUBLE_EQ(woe[4], woe[1]);
}

TEST(TransformTest, EventRates) {
  std::vector<double> rates = transform_binary_target(
      kSplits, kNonevent, kEvent, kSpecial, kValues, TransformMetric::EVENT_RATE,
      MetricFill::empirical(), MetricFill::constant(0.5));
  EXPECT_NEAR(rates[0], 0.2, 1e-12);
  EXPECT_NEAR(rates[1], 0.8, 1e-12);
  EXPECT_DOUBLE_EQ(rates[2], 0.5);
  EXPECT_NEAR(rates[3], 0.5, 1e-12);
}

TEST(TransformTest, InfiniteValuesAreMissing) {
  const double inf = std::numeric_limits<double>::infinity();
  std::vector<double> idx = transform_binary_target(
      kSplits, kNonevent, kEvent, {}, {inf, -inf}, TransformMetric::INDICES,
      MetricFill(), MetricFill::empirical());
  EXPECT_EQ(idx, (std::vector<double>{3.0, 3.0}));
}

TEST(TransformTest, BinLabels) {
  std::vector<std::string> bins = transform_bins(kSplits, kSpecial, kValues);
  EXPECT_EQ(bins, (std::vector<std::string>{"(-inf, 2.00)", "[2.00, inf)", "Missing",
                                            "Special", "[2.00, inf)"}));
  EXPECT_EQ(transform_bins({}, {}, {7.0}, 1), (std::vector<std::string>{"(-inf, inf)"}));
}

TEST(TransformTest, RejectsInvalidRequests) {
  EXPECT_THROW(transform_binary_target(kSplits, kNonevent, kEvent, kSpecial, kValues,
                                       TransformMetric::BINS),
               ValidationError);
  EXPECT_THROW(transform_binary_target(kSplits, {1, 2}, {1, 2}, kSpecial, kValues,
                                       TransformMetric::WOE),
               ValidationError);
  EXPECT_THROW(string_to_transform_metric("mean"), ValidationError);
  EXPECT_EQ(string_to_transform_metric("event_rate"), TransformMetric::EVENT_RATE);
  EXPECT_EQ(transform_metric_to_string(TransformMetric::INDICES), "indices");
}
