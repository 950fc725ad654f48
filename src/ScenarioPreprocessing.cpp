#include "ScenarioBinning/ScenarioData.h"
#include "ScenarioBinning/Exceptions.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_set>

namespace ScenarioBinning {

namespace {

ClassCounts tally(const std::vector<int>& labels) {
  ClassCounts counts;
  for (int label : labels) {
    counts.add(label);
  }
  return counts;
}

} // namespace

ClassCounts ScenarioSubset::missing_counts() const {
  return tally(y_missing);
}

ClassCounts ScenarioSubset::special_counts() const {
  return tally(y_special);
}

std::vector<long> ScenarioData::n_samples_scenario() const {
  std::vector<long> n_samples;
  n_samples.reserve(scenarios.size());
  for (const auto& scenario : scenarios) {
    n_samples.push_back(static_cast<long>(scenario.n_samples));
  }
  return n_samples;
}

long ScenarioData::n_samples() const {
  long total = 0;
  for (const auto& scenario : scenarios) {
    total += static_cast<long>(scenario.n_samples);
  }
  return total;
}

long ScenarioData::n_clean() const {
  long total = 0;
  for (const auto& scenario : scenarios) {
    total += static_cast<long>(scenario.x_clean.size());
  }
  return total;
}

long ScenarioData::n_missing() const {
  long total = 0;
  for (const auto& scenario : scenarios) {
    total += static_cast<long>(scenario.x_missing.size());
  }
  return total;
}

long ScenarioData::n_special() const {
  long total = 0;
  for (const auto& scenario : scenarios) {
    total += static_cast<long>(scenario.x_special.size());
  }
  return total;
}

std::vector<int> binary_labels(const std::vector<double>& y, std::size_t scenario) {
  std::vector<int> labels(y.size());
  for (std::size_t i = 0; i < y.size(); ++i) {
    if (y[i] == 0.0) {
      labels[i] = 0;
    } else if (y[i] == 1.0) {
      labels[i] = 1;
    } else {
      throw ValidationError("Y[" + std::to_string(scenario) +
                            "] must contain only 0 and 1 labels.");
    }
  }
  return labels;
}

void check_scenarios_shape(const std::vector<std::vector<double>>& X,
                           const std::vector<std::vector<int>>& Y,
                           const std::vector<double>& weights) {
  if (X.size() != Y.size()) {
    throw ValidationError("X and Y must have the same length; got " +
                          std::to_string(X.size()) + " != " +
                          std::to_string(Y.size()) + ".");
  }

  if (X.empty()) {
    throw ValidationError("At least one scenario is required.");
  }

  if (!weights.empty() && weights.size() != X.size()) {
    throw ValidationError("Number of scenarios and number of weights must coincide; got " +
                          std::to_string(X.size()) + " != " +
                          std::to_string(weights.size()) + ".");
  }

  for (double w : weights) {
    if (!std::isfinite(w) || w < 0.0) {
      throw ValidationError("Scenario weights must be finite and non-negative.");
    }
  }

  for (size_t s = 0; s < X.size(); ++s) {
    if (X[s].size() != Y[s].size()) {
      throw ValidationError("Feature and target of scenario " + std::to_string(s) +
                            " must have the same size. Got feature size: " +
                            std::to_string(X[s].size()) + ", target size: " +
                            std::to_string(Y[s].size()));
    }

    for (int label : Y[s]) {
      if (label != 0 && label != 1) {
        throw ValidationError("Target of scenario " + std::to_string(s) +
                              " must contain only values 0 and 1");
      }
    }
  }
}

ScenarioData split_data_scenarios(const std::vector<std::vector<double>>& X,
                                  const std::vector<std::vector<int>>& Y,
                                  const std::vector<double>& weights,
                                  const std::vector<double>& special_codes,
                                  bool check_input) {
  check_scenarios_shape(X, Y, weights);

  if (check_input) {
    for (size_t s = 0; s < X.size(); ++s) {
      for (double value : X[s]) {
        if (std::isinf(value)) {
          throw ValidationError("Feature of scenario " + std::to_string(s) +
                                " contains infinite values.");
        }
      }
    }
  }

  const size_t n_scenarios = X.size();
  const std::unordered_set<double> specials(special_codes.begin(), special_codes.end());

  ScenarioData data;
  data.scenarios.resize(n_scenarios);
  data.weights = weights.empty() ? std::vector<double>(n_scenarios, 1.0) : weights;
  data.missing.resize(n_scenarios);
  data.special.resize(n_scenarios);

  std::vector<size_t> n_infinite(n_scenarios, 0);

  // Scenarios are independent; each one fills its own slot
#pragma omp parallel for schedule(dynamic)
  for (long s = 0; s < static_cast<long>(n_scenarios); ++s) {
    const auto& x = X[s];
    const auto& y = Y[s];
    ScenarioSubset& subset = data.scenarios[s];

    subset.n_samples = x.size();
    subset.x_clean.reserve(x.size());
    subset.y_clean.reserve(x.size());

    for (size_t i = 0; i < x.size(); ++i) {
      const double value = x[i];
      if (std::isnan(value)) {
        subset.x_missing.push_back(value);
        subset.y_missing.push_back(y[i]);
      } else if (specials.count(value) > 0) {
        subset.x_special.push_back(value);
        subset.y_special.push_back(y[i]);
      } else if (std::isinf(value)) {
        subset.x_missing.push_back(value);
        subset.y_missing.push_back(y[i]);
        n_infinite[s]++;
      } else {
        subset.x_clean.push_back(value);
        subset.y_clean.push_back(y[i]);
      }
    }

    data.missing[s] = subset.missing_counts();
    data.special[s] = subset.special_counts();
  }

  for (size_t count : n_infinite) {
    data.n_infinite += count;
  }

  return data;
}

} // namespace ScenarioBinning
