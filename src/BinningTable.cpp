#include "ScenarioBinning/BinningTable.h"
#include "ScenarioBinning/Exceptions.h"
#include "common/format_utils.h"
#include "common/woe_iv_utils.h"

#include <algorithm>
#include <ostream>
#include <utility>

namespace ScenarioBinning {

double gini_coefficient(const std::vector<long>& n_nonevent, const std::vector<long>& n_event) {
  double total_nonevent = 0.0;
  double total_event = 0.0;
  std::vector<std::size_t> order;
  for (std::size_t i = 0; i < n_event.size(); ++i) {
    total_nonevent += n_nonevent[i];
    total_event += n_event[i];
    if (n_nonevent[i] + n_event[i] > 0) order.push_back(i);
  }

  if (total_nonevent <= 0.0 || total_event <= 0.0) {
    return 0.0;
  }

  // Highest event rate first
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    return compute_event_rate(n_nonevent[a], n_event[a]) >
           compute_event_rate(n_nonevent[b], n_event[b]);
  });

  double auc = 0.0;
  double fpr = 0.0;
  double tpr = 0.0;
  for (std::size_t idx : order) {
    const double next_fpr = fpr + n_nonevent[idx] / total_nonevent;
    const double next_tpr = tpr + n_event[idx] / total_event;
    auc += (next_fpr - fpr) * (next_tpr + tpr) * 0.5;
    fpr = next_fpr;
    tpr = next_tpr;
  }

  return 2.0 * auc - 1.0;
}

BinningTable::BinningTable(std::string name, std::vector<double> splits,
                           std::vector<long> n_nonevent, std::vector<long> n_event,
                           double min_x, double max_x, int show_digits)
  : name_(std::move(name)), splits_(std::move(splits)),
    n_nonevent_(std::move(n_nonevent)), n_event_(std::move(n_event)),
    min_x_(min_x), max_x_(max_x) {
  const std::size_t n_rows = splits_.size() + 3;
  if (n_nonevent_.size() != n_rows || n_event_.size() != n_rows) {
    throw ValidationError("Binning table expects " + std::to_string(n_rows) +
                          " count entries (bins, Special, Missing).");
  }

  for (std::size_t i = 0; i < n_rows; ++i) {
    total_nonevent_ += n_nonevent_[i];
    total_event_ += n_event_[i];
  }

  std::vector<std::string> labels = interval_labels(splits_, show_digits);
  labels.push_back(SPECIAL_LABEL);
  labels.push_back(MISSING_LABEL);

  const double tne = static_cast<double>(total_nonevent_);
  const double te = static_cast<double>(total_event_);
  const double total = tne + te;

  std::vector<double> iv_values(n_rows);
  std::vector<double> js_values(n_rows);
  rows_.resize(n_rows);

  for (std::size_t i = 0; i < n_rows; ++i) {
    BinningTableRow& row = rows_[i];
    const double ne = static_cast<double>(n_nonevent_[i]);
    const double e = static_cast<double>(n_event_[i]);

    row.bin = labels[i];
    row.nonevent = n_nonevent_[i];
    row.event = n_event_[i];
    row.count = row.nonevent + row.event;
    row.count_share = safe_divide(ne + e, total);
    row.event_rate = compute_event_rate(ne, e);
    row.woe = compute_woe(ne, e, tne, te);
    row.iv = compute_iv(ne, e, tne, te);
    row.js = compute_js(ne, e, tne, te);

    iv_values[i] = row.iv;
    js_values[i] = row.js;
  }

  iv_ = compute_total_iv(iv_values);
  js_ = compensated_sum(js_values);
  gini_ = gini_coefficient(n_nonevent_, n_event_);
}

void BinningTable::print(std::ostream& os) const {
  os << "Bin\tCount\tCount (%)\tNon-event\tEvent\tEvent rate\tWoE\tIV\tJS\n";
  for (const auto& row : rows_) {
    os << row.bin << "\t" << row.count << "\t" << format_double(row.count_share, 4) << "\t"
       << row.nonevent << "\t" << row.event << "\t" << format_double(row.event_rate, 4) << "\t"
       << format_double(row.woe, 4) << "\t" << format_double(row.iv, 4) << "\t"
       << format_double(row.js, 4) << "\n";
  }
  os << "Totals\t" << total_count() << "\t" << format_double(total_count() > 0 ? 1.0 : 0.0, 4)
     << "\t" << total_nonevent_ << "\t" << total_event_ << "\t"
     << format_double(compute_event_rate(static_cast<double>(total_nonevent_),
                                         static_cast<double>(total_event_)), 4)
     << "\t\t" << format_double(iv_, 4) << "\t" << format_double(js_, 4) << "\n";
}

} // namespace ScenarioBinning
