#include "ScenarioBinning/Prebinning.h"
#include "ScenarioBinning/Exceptions.h"
#include "common/scenario_binning_common.h"

#include <queue>
#include <utility>

namespace ScenarioBinning {

// =============================================================================
// POOLING
// =============================================================================

PooledSample pool_scenarios(const ScenarioData& data) {
  PooledSample pooled;
  const long n_clean = data.n_clean();
  pooled.x.reserve(n_clean);
  pooled.y.reserve(n_clean);
  pooled.sample_weight.reserve(n_clean);

  for (std::size_t s = 0; s < data.n_scenarios(); ++s) {
    const ScenarioSubset& subset = data.scenarios[s];
    pooled.x.insert(pooled.x.end(), subset.x_clean.begin(), subset.x_clean.end());
    pooled.y.insert(pooled.y.end(), subset.y_clean.begin(), subset.y_clean.end());
    pooled.sample_weight.insert(pooled.sample_weight.end(), subset.x_clean.size(),
                                data.weights[s]);
  }

  return pooled;
}

// =============================================================================
// CART
// =============================================================================

namespace {

/// Gini impurity of a weighted two-class node
double gini(double w_event, double w_nonevent) {
  double total = w_event + w_nonevent;
  if (total <= EPSILON) return 0.0;
  double p1 = w_event / total;
  double p0 = w_nonevent / total;
  return 1.0 - p1 * p1 - p0 * p0;
}

/// Node of the tree as a contiguous range of the sorted sample
struct TreeNode {
  std::size_t begin;
  std::size_t end;
};

struct SplitCandidate {
  std::size_t position = 0;
  double threshold = 0.0;
  double gain = -1.0;
  bool valid = false;
};

class SortedSample {
public:
  SortedSample(const std::vector<double>& x, const std::vector<int>& y,
               const std::vector<double>& weight)
    : n_(x.size()), x_(n_), cum_event_(n_ + 1, 0.0), cum_nonevent_(n_ + 1, 0.0) {
    std::vector<std::size_t> order(n_);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&x](std::size_t a, std::size_t b) { return x[a] < x[b]; });

    for (std::size_t k = 0; k < n_; ++k) {
      const std::size_t idx = order[k];
      x_[k] = x[idx];
      cum_event_[k + 1] = cum_event_[k] + (y[idx] == 1 ? weight[idx] : 0.0);
      cum_nonevent_[k + 1] = cum_nonevent_[k] + (y[idx] == 1 ? 0.0 : weight[idx]);
    }
  }

  std::size_t size() const { return n_; }
  double value(std::size_t k) const { return x_[k]; }

  double w_event(std::size_t begin, std::size_t end) const {
    return cum_event_[end] - cum_event_[begin];
  }
  double w_nonevent(std::size_t begin, std::size_t end) const {
    return cum_nonevent_[end] - cum_nonevent_[begin];
  }
  double weight(std::size_t begin, std::size_t end) const {
    return w_event(begin, end) + w_nonevent(begin, end);
  }

private:
  std::size_t n_;
  std::vector<double> x_;
  std::vector<double> cum_event_;
  std::vector<double> cum_nonevent_;
};

/**
 * Best split of a node by weighted impurity decrease, scaled by the node's
 * share of the total weight so that gains of different nodes compare.
 */
SplitCandidate find_best_split(const SortedSample& sample, const TreeNode& node,
                               std::size_t min_leaf, double total_weight) {
  SplitCandidate best;
  const std::size_t n = node.end - node.begin;
  if (n < 2 * min_leaf || total_weight <= EPSILON) return best;

  const double w_node = sample.weight(node.begin, node.end);
  if (w_node <= EPSILON) return best;

  const double impurity = gini(sample.w_event(node.begin, node.end),
                               sample.w_nonevent(node.begin, node.end));
  if (impurity <= IMPURITY_THRESHOLD) return best;

  for (std::size_t p = node.begin + min_leaf; p <= node.end - min_leaf; ++p) {
    const double a = sample.value(p - 1);
    const double b = sample.value(p);
    if (!(a < b)) continue;

    const double w_left = sample.weight(node.begin, p);
    const double w_right = sample.weight(p, node.end);
    const double imp_left = gini(sample.w_event(node.begin, p), sample.w_nonevent(node.begin, p));
    const double imp_right = gini(sample.w_event(p, node.end), sample.w_nonevent(p, node.end));

    const double gain = (w_node / total_weight) *
      (impurity - (w_left / w_node) * imp_left - (w_right / w_node) * imp_right);

    if (gain > best.gain) {
      double threshold = 0.5 * (a + b);
      if (!(threshold > a) || threshold > b) threshold = b;
      best.position = p;
      best.threshold = threshold;
      best.gain = gain;
      best.valid = true;
    }
  }

  return best;
}

} // namespace

std::vector<double> CartSplitGenerator::generate(const std::vector<double>& x,
                                                 const std::vector<int>& y,
                                                 const std::vector<double>& sample_weight) const {
  if (x.size() != y.size() || x.size() != sample_weight.size()) {
    throw ValidationError("CART prebinning requires x, y and sample_weight of equal size.");
  }
  if (x.empty() || max_leaf_nodes_ < 2) {
    return {};
  }

  // Class weights multiply the sample weights
  double cw_event = 1.0;
  double cw_nonevent = 1.0;
  if (class_weight_.mode == ClassWeight::Mode::BALANCED) {
    long n_event = std::count(y.begin(), y.end(), 1);
    long n_nonevent = static_cast<long>(y.size()) - n_event;
    if (n_event > 0) cw_event = static_cast<double>(y.size()) / (2.0 * n_event);
    if (n_nonevent > 0) cw_nonevent = static_cast<double>(y.size()) / (2.0 * n_nonevent);
  } else if (class_weight_.mode == ClassWeight::Mode::CUSTOM) {
    cw_event = class_weight_.event;
    cw_nonevent = class_weight_.nonevent;
  }

  std::vector<double> weight(x.size());
  for (std::size_t i = 0; i < x.size(); ++i) {
    weight[i] = sample_weight[i] * (y[i] == 1 ? cw_event : cw_nonevent);
  }

  const SortedSample sample(x, y, weight);
  const std::size_t min_leaf = static_cast<std::size_t>(std::max(1L, min_samples_leaf_));
  const double total_weight = sample.weight(0, sample.size());

  using NodePair = std::pair<double, std::size_t>;
  std::priority_queue<NodePair> expansion_queue;
  std::vector<TreeNode> nodes;
  std::vector<SplitCandidate> node_splits;

  auto push_node = [&](const TreeNode& node) {
    SplitCandidate split = find_best_split(sample, node, min_leaf, total_weight);
    nodes.push_back(node);
    node_splits.push_back(split);
    if (split.valid && split.gain > IMPURITY_THRESHOLD) {
      expansion_queue.push({split.gain, nodes.size() - 1});
    }
  };

  push_node(TreeNode{0, sample.size()});

  std::vector<double> thresholds;
  int leaf_count = 1;

  while (!expansion_queue.empty() && leaf_count < max_leaf_nodes_) {
    const std::size_t id = expansion_queue.top().second;
    expansion_queue.pop();

    const TreeNode node = nodes[id];
    const SplitCandidate split = node_splits[id];
    thresholds.push_back(split.threshold);
    leaf_count++;

    push_node(TreeNode{node.begin, split.position});
    push_node(TreeNode{split.position, node.end});
  }

  std::sort(thresholds.begin(), thresholds.end());
  return thresholds;
}

// =============================================================================
// QUANTILE AND UNIFORM
// =============================================================================

std::vector<double> enforce_min_bin_size(const std::vector<double>& sorted_x,
                                         const std::vector<double>& splits,
                                         long min_bin_size) {
  if (min_bin_size <= 1 || splits.empty()) {
    return splits;
  }

  auto count_below = [&sorted_x](double value) {
    return static_cast<long>(
      std::lower_bound(sorted_x.begin(), sorted_x.end(), value) - sorted_x.begin());
  };

  std::vector<double> kept;
  long left_start = 0;
  for (double split : splits) {
    const long below = count_below(split);
    if (below - left_start >= min_bin_size) {
      kept.push_back(split);
      left_start = below;
    }
  }

  // The last bin is merged leftwards when it falls short
  if (!kept.empty() &&
      static_cast<long>(sorted_x.size()) - count_below(kept.back()) < min_bin_size) {
    kept.pop_back();
  }

  return kept;
}

namespace {

/// Drop edges closer than MIN_EDGE_WIDTH to their predecessor and keep the interior
std::vector<double> interior_edges(const std::vector<double>& edges) {
  std::vector<double> unique_edges;
  for (double edge : edges) {
    if (unique_edges.empty() || edge - unique_edges.back() >= MIN_EDGE_WIDTH) {
      unique_edges.push_back(edge);
    }
  }
  if (unique_edges.size() <= 2) return {};
  return std::vector<double>(unique_edges.begin() + 1, unique_edges.end() - 1);
}

/// Percentile with linear interpolation between order statistics
double percentile(const std::vector<double>& sorted_x, double q) {
  const double pos = q / 100.0 * static_cast<double>(sorted_x.size() - 1);
  const std::size_t lo = static_cast<std::size_t>(std::floor(pos));
  const std::size_t hi = std::min(lo + 1, sorted_x.size() - 1);
  const double frac = pos - static_cast<double>(lo);
  return sorted_x[lo] + (sorted_x[hi] - sorted_x[lo]) * frac;
}

} // namespace

std::vector<double> QuantileSplitGenerator::generate(const std::vector<double>& x,
                                                     const std::vector<int>&,
                                                     const std::vector<double>&) const {
  if (x.empty() || n_bins_ < 2) return {};

  std::vector<double> sorted_x(x);
  std::sort(sorted_x.begin(), sorted_x.end());

  std::vector<double> edges(n_bins_ + 1);
  for (int k = 0; k <= n_bins_; ++k) {
    edges[k] = percentile(sorted_x, 100.0 * k / n_bins_);
  }

  return enforce_min_bin_size(sorted_x, interior_edges(edges), min_bin_size_);
}

std::vector<double> UniformSplitGenerator::generate(const std::vector<double>& x,
                                                    const std::vector<int>&,
                                                    const std::vector<double>&) const {
  if (x.empty() || n_bins_ < 2) return {};

  std::vector<double> sorted_x(x);
  std::sort(sorted_x.begin(), sorted_x.end());

  const double x_min = sorted_x.front();
  const double x_max = sorted_x.back();
  std::vector<double> edges(n_bins_ + 1);
  for (int k = 0; k <= n_bins_; ++k) {
    edges[k] = x_min + (x_max - x_min) * k / n_bins_;
  }

  return enforce_min_bin_size(sorted_x, interior_edges(edges), min_bin_size_);
}

std::unique_ptr<CandidateSplitGenerator> make_split_generator(const BinningConfig& config,
                                                              long min_bin_size) {
  switch (config.prebinning_method) {
  case PrebinningMethod::CART:
    return std::make_unique<CartSplitGenerator>(config.max_n_prebins, min_bin_size,
                                                config.class_weight);
  case PrebinningMethod::QUANTILE:
    return std::make_unique<QuantileSplitGenerator>(config.max_n_prebins, min_bin_size);
  case PrebinningMethod::UNIFORM:
    return std::make_unique<UniformSplitGenerator>(config.max_n_prebins, min_bin_size);
  }
  throw ValidationError("Unknown prebinning method.");
}

} // namespace ScenarioBinning
