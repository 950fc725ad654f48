#ifndef SCENARIO_BINNING_PREBIN_REFINER_H
#define SCENARIO_BINNING_PREBIN_REFINER_H

#include "CountMatrix.h"
#include "Logger.h"
#include "ScenarioData.h"

#include <vector>

namespace ScenarioBinning {

/**
 * @brief Candidate splits after pure prebins were removed
 */
struct RefinementResult {
  std::vector<double> splits;
  std::vector<bool> fixed;
  CountMatrix counts;
  int n_refinements = 0;
};

/**
 * @brief Map a pure-bin mask onto the splits to remove
 *
 * Split i is removed when bin i is pure; the last split is also removed when
 * the last bin is pure. The result has bin_mask.size() - 1 entries.
 */
std::vector<bool> split_removal_mask(const std::vector<bool>& bin_mask);

/**
 * @brief Removes splits until no prebin lacks events or nonevents in any
 * scenario
 */
class PrebinRefiner {
public:
  /**
   * @param data Preprocessed scenarios; must outlive the refiner
   * @param logger Optional logger for per-pass messages
   */
  explicit PrebinRefiner(const ScenarioData& data, Logger* logger = nullptr)
    : data_(data), logger_(logger) {}

  /**
   * @brief Refine a candidate set to a fixed point
   *
   * @param splits Ascending candidate splits
   * @param fixed Fixed flags, empty or one per split
   * @throws FixedSplitConflictError when a fixed split must be removed
   */
  RefinementResult refine(const std::vector<double>& splits,
                          const std::vector<bool>& fixed) const;

private:
  const ScenarioData& data_;
  Logger* logger_;
};

} // namespace ScenarioBinning

#endif // SCENARIO_BINNING_PREBIN_REFINER_H
