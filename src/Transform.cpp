#include "ScenarioBinning/Transform.h"
#include "ScenarioBinning/CountMatrix.h"
#include "ScenarioBinning/Exceptions.h"
#include "common/format_utils.h"
#include "common/woe_iv_utils.h"

#include <cmath>
#include <unordered_set>

namespace ScenarioBinning {

TransformMetric string_to_transform_metric(const std::string& metric) {
  if (metric == "woe") return TransformMetric::WOE;
  if (metric == "event_rate") return TransformMetric::EVENT_RATE;
  if (metric == "indices") return TransformMetric::INDICES;
  if (metric == "bins") return TransformMetric::BINS;
  throw ValidationError("Invalid value for metric. Allowed string values are "
                        "\"woe\", \"event_rate\", \"indices\" and \"bins\".");
}

std::string transform_metric_to_string(TransformMetric metric) {
  switch (metric) {
  case TransformMetric::WOE: return "woe";
  case TransformMetric::EVENT_RATE: return "event_rate";
  case TransformMetric::INDICES: return "indices";
  case TransformMetric::BINS: return "bins";
  }
  return "woe";
}

namespace {

enum class ValueKind { CLEAN, SPECIAL, MISSING };

ValueKind classify(double value, const std::unordered_set<double>& specials) {
  if (std::isnan(value)) return ValueKind::MISSING;
  if (specials.count(value) > 0) return ValueKind::SPECIAL;
  if (std::isinf(value)) return ValueKind::MISSING;
  return ValueKind::CLEAN;
}

} // namespace

std::vector<double> transform_binary_target(const std::vector<double>& splits,
                                            const std::vector<long>& n_nonevent,
                                            const std::vector<long>& n_event,
                                            const std::vector<double>& special_codes,
                                            const std::vector<double>& x,
                                            TransformMetric metric,
                                            const MetricFill& metric_special,
                                            const MetricFill& metric_missing) {
  if (metric == TransformMetric::BINS) {
    throw ValidationError("Use transform_bins for the \"bins\" metric.");
  }

  const std::size_t n_bins = splits.size() + 1;
  if (n_nonevent.size() != n_bins + 2 || n_event.size() != n_bins + 2) {
    throw ValidationError("Count vectors must hold one entry per bin plus Special and Missing.");
  }

  double total_nonevent = 0.0;
  double total_event = 0.0;
  for (std::size_t i = 0; i < n_nonevent.size(); ++i) {
    total_nonevent += n_nonevent[i];
    total_event += n_event[i];
  }

  // Metric value of every table row: clean bins, Special, Missing
  std::vector<double> row_metric(n_bins + 2);
  for (std::size_t i = 0; i < row_metric.size(); ++i) {
    const double ne = static_cast<double>(n_nonevent[i]);
    const double e = static_cast<double>(n_event[i]);
    switch (metric) {
    case TransformMetric::WOE:
      row_metric[i] = compute_woe(ne, e, total_nonevent, total_event);
      break;
    case TransformMetric::EVENT_RATE:
      row_metric[i] = compute_event_rate(ne, e);
      break;
    default:
      row_metric[i] = static_cast<double>(i);
      break;
    }
  }

  const double special_value = metric_special.is_empirical ? row_metric[n_bins]
                                                           : metric_special.value;
  const double missing_value = metric_missing.is_empirical ? row_metric[n_bins + 1]
                                                           : metric_missing.value;

  const std::unordered_set<double> specials(special_codes.begin(), special_codes.end());

  std::vector<double> transformed(x.size());
  for (std::size_t k = 0; k < x.size(); ++k) {
    switch (classify(x[k], specials)) {
    case ValueKind::CLEAN:
      transformed[k] = row_metric[bin_index(splits, x[k])];
      break;
    case ValueKind::SPECIAL:
      transformed[k] = special_value;
      break;
    case ValueKind::MISSING:
      transformed[k] = missing_value;
      break;
    }
  }

  return transformed;
}

std::vector<std::string> transform_bins(const std::vector<double>& splits,
                                        const std::vector<double>& special_codes,
                                        const std::vector<double>& x,
                                        int show_digits) {
  const std::vector<std::string> labels = interval_labels(splits, show_digits);
  const std::unordered_set<double> specials(special_codes.begin(), special_codes.end());

  std::vector<std::string> transformed(x.size());
  for (std::size_t k = 0; k < x.size(); ++k) {
    switch (classify(x[k], specials)) {
    case ValueKind::CLEAN:
      transformed[k] = labels[bin_index(splits, x[k])];
      break;
    case ValueKind::SPECIAL:
      transformed[k] = SPECIAL_LABEL;
      break;
    case ValueKind::MISSING:
      transformed[k] = MISSING_LABEL;
      break;
    }
  }

  return transformed;
}

} // namespace ScenarioBinning
