#ifndef SCENARIO_BINNING_BINNING_TABLE_H
#define SCENARIO_BINNING_BINNING_TABLE_H

#include <iosfwd>
#include <string>
#include <vector>

namespace ScenarioBinning {

struct BinningTableRow {
  std::string bin;
  long count = 0;
  double count_share = 0.0;
  long nonevent = 0;
  long event = 0;
  double event_rate = 0.0;
  double woe = 0.0;
  double iv = 0.0;
  double js = 0.0;
};

/**
 * @brief Per-bin summary of a fitted binning
 *
 * Count vectors hold one entry per clean bin followed by the Special and
 * Missing rows. Statistics are computed once at construction.
 */
class BinningTable {
public:
  BinningTable() = default;

  /**
   * @param name Variable name
   * @param splits Optimal splits
   * @param n_nonevent Nonevent counts, splits.size() + 3 entries
   * @param n_event Event counts, splits.size() + 3 entries
   * @param min_x Smallest clean value seen
   * @param max_x Largest clean value seen
   * @param show_digits Decimals of the interval labels
   * @throws ValidationError if the count vectors do not match the splits
   */
  BinningTable(std::string name, std::vector<double> splits,
               std::vector<long> n_nonevent, std::vector<long> n_event,
               double min_x, double max_x, int show_digits = 2);

  const std::string& name() const { return name_; }
  const std::vector<double>& splits() const { return splits_; }
  const std::vector<BinningTableRow>& rows() const { return rows_; }
  const std::vector<long>& n_nonevent() const { return n_nonevent_; }
  const std::vector<long>& n_event() const { return n_event_; }

  /// Number of clean bins (excludes Special and Missing)
  std::size_t n_bins() const { return splits_.size() + 1; }

  const BinningTableRow& special_row() const { return rows_[n_bins()]; }
  const BinningTableRow& missing_row() const { return rows_[n_bins() + 1]; }

  long total_count() const { return total_nonevent_ + total_event_; }
  long total_nonevent() const { return total_nonevent_; }
  long total_event() const { return total_event_; }
  double iv() const { return iv_; }
  double js() const { return js_; }
  double gini() const { return gini_; }
  double min_x() const { return min_x_; }
  double max_x() const { return max_x_; }

  /// Tab separated rendering with a totals line
  void print(std::ostream& os) const;

private:
  std::string name_;
  std::vector<double> splits_;
  std::vector<long> n_nonevent_;
  std::vector<long> n_event_;
  std::vector<BinningTableRow> rows_;
  long total_nonevent_ = 0;
  long total_event_ = 0;
  double iv_ = 0.0;
  double js_ = 0.0;
  double gini_ = 0.0;
  double min_x_ = 0.0;
  double max_x_ = 0.0;
};

/**
 * @brief Gini coefficient from the ROC curve of bins ranked by event rate
 */
double gini_coefficient(const std::vector<long>& n_nonevent, const std::vector<long>& n_event);

} // namespace ScenarioBinning

#endif // SCENARIO_BINNING_BINNING_TABLE_H
