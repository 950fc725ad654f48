#ifndef SCENARIO_BINNING_PREBINNING_H
#define SCENARIO_BINNING_PREBINNING_H

#include "BinningConfig.h"
#include "ScenarioData.h"

#include <memory>
#include <string>
#include <vector>

namespace ScenarioBinning {

/**
 * @brief Clean records of all scenarios concatenated, weighted by their
 * scenario weight
 */
struct PooledSample {
  std::vector<double> x;
  std::vector<int> y;
  std::vector<double> sample_weight;
};

PooledSample pool_scenarios(const ScenarioData& data);

/**
 * @brief Source of initial candidate splits
 *
 * Implementations return strictly increasing split points; an empty result
 * means a single bin.
 */
class CandidateSplitGenerator {
public:
  virtual ~CandidateSplitGenerator() = default;

  virtual std::vector<double> generate(const std::vector<double>& x,
                                       const std::vector<int>& y,
                                       const std::vector<double>& sample_weight) const = 0;

  virtual std::string name() const = 0;
};

/**
 * @brief Best-first Gini decision tree on a single feature
 *
 * Grows at most max_leaf_nodes leaves, always expanding the leaf with the
 * largest weighted impurity decrease. Leaves keep at least min_samples_leaf
 * records. Thresholds are midpoints between consecutive distinct values.
 */
class CartSplitGenerator : public CandidateSplitGenerator {
public:
  CartSplitGenerator(int max_leaf_nodes, long min_samples_leaf,
                     ClassWeight class_weight = ClassWeight())
    : max_leaf_nodes_(max_leaf_nodes), min_samples_leaf_(min_samples_leaf),
      class_weight_(class_weight) {}

  std::vector<double> generate(const std::vector<double>& x,
                               const std::vector<int>& y,
                               const std::vector<double>& sample_weight) const override;

  std::string name() const override { return "cart"; }

private:
  int max_leaf_nodes_;
  long min_samples_leaf_;
  ClassWeight class_weight_;
};

/**
 * @brief Splits at equally spaced percentiles
 */
class QuantileSplitGenerator : public CandidateSplitGenerator {
public:
  QuantileSplitGenerator(int n_bins, long min_bin_size)
    : n_bins_(n_bins), min_bin_size_(min_bin_size) {}

  std::vector<double> generate(const std::vector<double>& x,
                               const std::vector<int>& y,
                               const std::vector<double>& sample_weight) const override;

  std::string name() const override { return "quantile"; }

private:
  int n_bins_;
  long min_bin_size_;
};

/**
 * @brief Splits at equally spaced points between min(x) and max(x)
 */
class UniformSplitGenerator : public CandidateSplitGenerator {
public:
  UniformSplitGenerator(int n_bins, long min_bin_size)
    : n_bins_(n_bins), min_bin_size_(min_bin_size) {}

  std::vector<double> generate(const std::vector<double>& x,
                               const std::vector<int>& y,
                               const std::vector<double>& sample_weight) const override;

  std::string name() const override { return "uniform"; }

private:
  int n_bins_;
  long min_bin_size_;
};

/**
 * @brief Drop splits whose left bin holds fewer than min_bin_size records
 *
 * A dropped split merges its left bin into the right neighbour, so the
 * shortfall accumulates until a large enough bin is formed.
 */
std::vector<double> enforce_min_bin_size(const std::vector<double>& sorted_x,
                                         const std::vector<double>& splits,
                                         long min_bin_size);

/**
 * @brief Build the generator selected by config.prebinning_method
 *
 * @param config Binning options
 * @param min_bin_size Minimum number of records per prebin
 */
std::unique_ptr<CandidateSplitGenerator> make_split_generator(const BinningConfig& config,
                                                              long min_bin_size);

} // namespace ScenarioBinning

#endif // SCENARIO_BINNING_PREBINNING_H
