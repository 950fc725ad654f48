/**
 * @file format_utils.h
 * @brief Number and interval formatting for bin labels and reports
 */

#ifndef SCENARIO_BINNING_FORMAT_UTILS_H
#define SCENARIO_BINNING_FORMAT_UTILS_H

#include "scenario_binning_common.h"
#include <iomanip>
#include <sstream>

namespace ScenarioBinning {

/**
 * Format double with specified precision
 *
 * @param value Double value to format
 * @param precision Number of decimal places
 * @return Formatted string
 */
inline std::string format_double(double value, int precision = 6) {
  if (std::isnan(value)) {
    return "nan";
  } else if (std::isinf(value)) {
    return value > 0 ? "inf" : "-inf";
  }

  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << value;
  return oss.str();
}

/**
 * @brief Right-open interval labels of the clean bins
 *
 * (-inf, a), [a, b), ..., [z, inf); a single bin is (-inf, inf).
 */
inline std::vector<std::string> interval_labels(const std::vector<double>& splits,
                                                int show_digits) {
  std::vector<std::string> labels;
  labels.reserve(splits.size() + 1);

  if (splits.empty()) {
    labels.push_back("(-inf, inf)");
    return labels;
  }

  labels.push_back("(-inf, " + format_double(splits.front(), show_digits) + ")");
  for (size_t i = 1; i < splits.size(); ++i) {
    labels.push_back("[" + format_double(splits[i - 1], show_digits) + ", " +
                     format_double(splits[i], show_digits) + ")");
  }
  labels.push_back("[" + format_double(splits.back(), show_digits) + ", inf)");

  return labels;
}

} // namespace ScenarioBinning

#endif // SCENARIO_BINNING_FORMAT_UTILS_H
