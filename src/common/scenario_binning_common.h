/**
 * @file scenario_binning_common.h
 * @brief Common constants shared by the scenario binning sources
 */

#ifndef SCENARIO_BINNING_COMMON_H
#define SCENARIO_BINNING_COMMON_H

#include <vector>
#include <string>
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace ScenarioBinning {

// =============================================================================
// NUMERICAL CONSTANTS
// =============================================================================

/// Default epsilon for numerical stability
constexpr double EPSILON = 1e-10;

/// Feasibility tolerance of the branch-and-bound solver
constexpr double SOLVER_TOLERANCE = 1e-9;

/// Minimum width between quantile/uniform prebin edges
constexpr double MIN_EDGE_WIDTH = 1e-8;

/// Minimum impurity decrease for a CART split to be considered
constexpr double IMPURITY_THRESHOLD = 1e-12;

/// Number of propagated rows between two deadline checks
constexpr long DEADLINE_CHECK_PERIOD = 256;

/// Labels of the special and missing rows
const std::string SPECIAL_LABEL = "Special";
const std::string MISSING_LABEL = "Missing";

} // namespace ScenarioBinning

#endif // SCENARIO_BINNING_COMMON_H
