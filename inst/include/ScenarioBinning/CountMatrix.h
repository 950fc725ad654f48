#ifndef SCENARIO_BINNING_COUNT_MATRIX_H
#define SCENARIO_BINNING_COUNT_MATRIX_H

#include "ScenarioData.h"

#include <cstddef>
#include <vector>

namespace ScenarioBinning {

/**
 * @brief Bin of a clean value for ascending splits
 *
 * Returns the number of splits <= x, so bin i covers [splits[i-1], splits[i])
 * with unbounded first and last bins.
 */
std::size_t bin_index(const std::vector<double>& splits, double x);

/**
 * @brief Nonevent/event counts per (bin, scenario)
 *
 * Row-major storage: one row per bin, one column per scenario.
 */
class CountMatrix {
public:
  CountMatrix() = default;
  CountMatrix(std::size_t n_bins, std::size_t n_scenarios);

  std::size_t n_bins() const { return n_bins_; }
  std::size_t n_scenarios() const { return n_scenarios_; }
  bool empty() const { return n_bins_ == 0; }

  long nonevent(std::size_t bin, std::size_t scenario) const {
    return nonevent_[bin * n_scenarios_ + scenario];
  }
  long event(std::size_t bin, std::size_t scenario) const {
    return event_[bin * n_scenarios_ + scenario];
  }
  long records(std::size_t bin, std::size_t scenario) const {
    return nonevent(bin, scenario) + event(bin, scenario);
  }

  void add(std::size_t bin, std::size_t scenario, int label);

  /// Nonevent counts of one scenario, one entry per bin
  std::vector<long> nonevent_column(std::size_t scenario) const;
  std::vector<long> event_column(std::size_t scenario) const;

  /// Counts of one scenario summed over bins
  ClassCounts scenario_total(std::size_t scenario) const;

  /// Bins lacking nonevents or events in at least one scenario
  std::vector<bool> pure_bins() const;

  bool has_pure_bin() const;

private:
  std::size_t n_bins_ = 0;
  std::size_t n_scenarios_ = 0;
  std::vector<long> nonevent_;
  std::vector<long> event_;
};

/**
 * @brief Count the clean records of every scenario into len(splits)+1 bins
 */
CountMatrix compute_count_matrix(const std::vector<double>& splits,
                                 const ScenarioData& data);

} // namespace ScenarioBinning

#endif // SCENARIO_BINNING_COUNT_MATRIX_H
