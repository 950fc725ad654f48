#include "ScenarioBinning/PrebinRefiner.h"
#include "ScenarioBinning/Exceptions.h"

#include <sstream>
#include <utility>

namespace ScenarioBinning {

std::vector<bool> split_removal_mask(const std::vector<bool>& bin_mask) {
  if (bin_mask.size() < 2) {
    return {};
  }

  const std::size_t n_splits = bin_mask.size() - 1;
  std::vector<bool> remove(bin_mask.begin(), bin_mask.begin() + n_splits);
  remove[n_splits - 1] = bin_mask[n_splits - 1] || bin_mask[n_splits];
  return remove;
}

RefinementResult PrebinRefiner::refine(const std::vector<double>& splits,
                                       const std::vector<bool>& fixed) const {
  RefinementResult result;
  result.splits = splits;
  result.fixed = fixed.empty() ? std::vector<bool>(splits.size(), false) : fixed;

  if (result.fixed.size() != result.splits.size()) {
    throw ValidationError("Fixed flags and splits must have the same length.");
  }

  if (result.splits.empty()) {
    return result;
  }

  const std::size_t max_passes = splits.size();

  for (std::size_t pass = 0; pass <= max_passes; ++pass) {
    result.counts = compute_count_matrix(result.splits, data_);

    const std::vector<bool> bin_mask = result.counts.pure_bins();
    const std::vector<bool> remove = split_removal_mask(bin_mask);

    std::vector<double> fixed_conflicts;
    std::size_t n_remove = 0;
    for (std::size_t i = 0; i < remove.size(); ++i) {
      if (!remove[i]) continue;
      n_remove++;
      if (result.fixed[i]) {
        fixed_conflicts.push_back(result.splits[i]);
      }
    }

    if (n_remove == 0) {
      return result;
    }

    if (!fixed_conflicts.empty()) {
      std::ostringstream oss;
      oss << "Fixed splits are removed due to pure prebins. Consider removing "
          << "these user splits from user_splits_fixed: [";
      for (std::size_t i = 0; i < fixed_conflicts.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << fixed_conflicts[i];
      }
      oss << "]";
      throw FixedSplitConflictError(oss.str(), fixed_conflicts);
    }

    std::vector<double> kept_splits;
    std::vector<bool> kept_fixed;
    kept_splits.reserve(result.splits.size() - n_remove);
    for (std::size_t i = 0; i < remove.size(); ++i) {
      if (!remove[i]) {
        kept_splits.push_back(result.splits[i]);
        kept_fixed.push_back(result.fixed[i]);
      }
    }

    if (logger_ != nullptr) {
      logger_->debug("Refinement pass ", pass + 1, ": removed ", n_remove,
                     " split(s), ", kept_splits.size(), " left");
    }

    result.splits = std::move(kept_splits);
    result.fixed = std::move(kept_fixed);
    result.n_refinements++;

    if (result.splits.empty()) {
      result.counts = CountMatrix();
      return result;
    }
  }

  // Every pass removes at least one split, so the loop ends above
  return result;
}

} // namespace ScenarioBinning
