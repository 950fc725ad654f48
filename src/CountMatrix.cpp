#include "ScenarioBinning/CountMatrix.h"

#include <algorithm>

namespace ScenarioBinning {

std::size_t bin_index(const std::vector<double>& splits, double x) {
  return static_cast<std::size_t>(
    std::upper_bound(splits.begin(), splits.end(), x) - splits.begin());
}

CountMatrix::CountMatrix(std::size_t n_bins, std::size_t n_scenarios)
  : n_bins_(n_bins), n_scenarios_(n_scenarios),
    nonevent_(n_bins * n_scenarios, 0), event_(n_bins * n_scenarios, 0) {}

void CountMatrix::add(std::size_t bin, std::size_t scenario, int label) {
  if (label == 1) {
    event_[bin * n_scenarios_ + scenario]++;
  } else {
    nonevent_[bin * n_scenarios_ + scenario]++;
  }
}

std::vector<long> CountMatrix::nonevent_column(std::size_t scenario) const {
  std::vector<long> column(n_bins_);
  for (std::size_t i = 0; i < n_bins_; ++i) {
    column[i] = nonevent(i, scenario);
  }
  return column;
}

std::vector<long> CountMatrix::event_column(std::size_t scenario) const {
  std::vector<long> column(n_bins_);
  for (std::size_t i = 0; i < n_bins_; ++i) {
    column[i] = event(i, scenario);
  }
  return column;
}

ClassCounts CountMatrix::scenario_total(std::size_t scenario) const {
  ClassCounts total;
  for (std::size_t i = 0; i < n_bins_; ++i) {
    total.nonevent += nonevent(i, scenario);
    total.event += event(i, scenario);
  }
  return total;
}

std::vector<bool> CountMatrix::pure_bins() const {
  std::vector<bool> mask(n_bins_, false);
  for (std::size_t i = 0; i < n_bins_; ++i) {
    for (std::size_t s = 0; s < n_scenarios_; ++s) {
      if (nonevent(i, s) == 0 || event(i, s) == 0) {
        mask[i] = true;
        break;
      }
    }
  }
  return mask;
}

bool CountMatrix::has_pure_bin() const {
  const std::vector<bool> mask = pure_bins();
  return std::find(mask.begin(), mask.end(), true) != mask.end();
}

CountMatrix compute_count_matrix(const std::vector<double>& splits,
                                 const ScenarioData& data) {
  const std::size_t n_bins = splits.size() + 1;
  const std::size_t n_scenarios = data.n_scenarios();
  CountMatrix counts(n_bins, n_scenarios);

  // Each scenario writes only its own column
#pragma omp parallel for schedule(static)
  for (long s = 0; s < static_cast<long>(n_scenarios); ++s) {
    const ScenarioSubset& subset = data.scenarios[s];
    for (std::size_t k = 0; k < subset.x_clean.size(); ++k) {
      counts.add(bin_index(splits, subset.x_clean[k]), s, subset.y_clean[k]);
    }
  }

  return counts;
}

} // namespace ScenarioBinning
