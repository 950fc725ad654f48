#include "ScenarioBinning/BinningConfig.h"
#include "ScenarioBinning/Exceptions.h"

#include <cmath>
#include <string>

namespace ScenarioBinning {

void validate_config(const BinningConfig& config) {
  if (config.max_n_prebins <= 1) {
    throw ValidationError("max_n_prebins must be an integer greater than 1; got " +
                          std::to_string(config.max_n_prebins) + ".");
  }

  if (!(config.min_prebin_size > 0.0 && config.min_prebin_size <= 0.5)) {
    throw ValidationError("min_prebin_size must be in (0, 0.5]; got " +
                          std::to_string(config.min_prebin_size) + ".");
  }

  if (config.min_n_bins && *config.min_n_bins <= 0) {
    throw ValidationError("min_n_bins must be a positive integer; got " +
                          std::to_string(*config.min_n_bins) + ".");
  }

  if (config.max_n_bins && *config.max_n_bins <= 0) {
    throw ValidationError("max_n_bins must be a positive integer; got " +
                          std::to_string(*config.max_n_bins) + ".");
  }

  if (config.min_n_bins && config.max_n_bins &&
      *config.min_n_bins > *config.max_n_bins) {
    throw ValidationError("min_n_bins must be <= max_n_bins; got " +
                          std::to_string(*config.min_n_bins) + " <= " +
                          std::to_string(*config.max_n_bins) + ".");
  }

  if (config.min_bin_size &&
      !(*config.min_bin_size > 0.0 && *config.min_bin_size <= 0.5)) {
    throw ValidationError("min_bin_size must be in (0, 0.5]; got " +
                          std::to_string(*config.min_bin_size) + ".");
  }

  if (config.max_bin_size &&
      !(*config.max_bin_size > 0.0 && *config.max_bin_size <= 1.0)) {
    throw ValidationError("max_bin_size must be in (0, 1.0]; got " +
                          std::to_string(*config.max_bin_size) + ".");
  }

  if (config.min_bin_size && config.max_bin_size &&
      *config.min_bin_size > *config.max_bin_size) {
    throw ValidationError("min_bin_size must be <= max_bin_size; got " +
                          std::to_string(*config.min_bin_size) + " <= " +
                          std::to_string(*config.max_bin_size) + ".");
  }

  if (!(config.min_event_rate_diff >= 0.0 && config.min_event_rate_diff <= 1.0)) {
    throw ValidationError("min_event_rate_diff must be in [0, 1]; got " +
                          std::to_string(config.min_event_rate_diff) + ".");
  }

  if (config.max_pvalue &&
      !(*config.max_pvalue > 0.0 && *config.max_pvalue <= 1.0)) {
    throw ValidationError("max_pvalue must be in (0, 1.0]; got " +
                          std::to_string(*config.max_pvalue) + ".");
  }

  if (config.class_weight.mode == ClassWeight::Mode::CUSTOM &&
      !(config.class_weight.nonevent > 0.0 && config.class_weight.event > 0.0 &&
        std::isfinite(config.class_weight.nonevent) &&
        std::isfinite(config.class_weight.event))) {
    throw ValidationError("class_weight values must be positive and finite.");
  }

  if (config.user_splits) {
    for (double split : *config.user_splits) {
      if (!std::isfinite(split)) {
        throw ValidationError("user_splits must contain finite values only.");
      }
    }
  }

  if (config.user_splits_fixed) {
    if (!config.user_splits) {
      throw ValidationError("user_splits must be provided.");
    }
    if (config.user_splits->size() != config.user_splits_fixed->size()) {
      throw ValidationError("Inconsistent length of user_splits and user_splits_fixed: " +
                            std::to_string(config.user_splits->size()) + " != " +
                            std::to_string(config.user_splits_fixed->size()) +
                            ". Lengths must be equal");
    }
  }

  if (config.split_digits &&
      (*config.split_digits < 0 || *config.split_digits > 8)) {
    throw ValidationError("split_digits must be an integer in [0, 8]; got " +
                          std::to_string(*config.split_digits) + ".");
  }

  if (!(config.time_limit >= 0.0)) {
    throw ValidationError("time_limit must be a positive value in seconds; got " +
                          std::to_string(config.time_limit) + ".");
  }
}

PrebinningMethod string_to_prebinning_method(const std::string& method) {
  if (method == "cart") return PrebinningMethod::CART;
  if (method == "quantile") return PrebinningMethod::QUANTILE;
  if (method == "uniform") return PrebinningMethod::UNIFORM;
  throw ValidationError("Invalid value for prebinning_method. Allowed string "
                        "values are \"cart\", \"quantile\" and \"uniform\".");
}

std::string prebinning_method_to_string(PrebinningMethod method) {
  switch (method) {
    case PrebinningMethod::QUANTILE: return "quantile";
    case PrebinningMethod::UNIFORM: return "uniform";
    default: return "cart";
  }
}

MonotonicTrend string_to_monotonic_trend(const std::string& trend) {
  if (trend == "ascending") return MonotonicTrend::ASCENDING;
  if (trend == "descending") return MonotonicTrend::DESCENDING;
  if (trend == "convex") return MonotonicTrend::CONVEX;
  if (trend == "concave") return MonotonicTrend::CONCAVE;
  if (trend == "peak") return MonotonicTrend::PEAK;
  if (trend == "valley") return MonotonicTrend::VALLEY;
  if (trend == "none" || trend.empty()) return MonotonicTrend::NONE;
  throw ValidationError("Invalid value for monotonic trend. Allowed string values are "
                        "\"ascending\", \"descending\", \"concave\", \"convex\", "
                        "\"peak\", \"valley\" and \"none\".");
}

std::string monotonic_trend_to_string(MonotonicTrend trend) {
  switch (trend) {
    case MonotonicTrend::ASCENDING: return "ascending";
    case MonotonicTrend::DESCENDING: return "descending";
    case MonotonicTrend::CONVEX: return "convex";
    case MonotonicTrend::CONCAVE: return "concave";
    case MonotonicTrend::PEAK: return "peak";
    case MonotonicTrend::VALLEY: return "valley";
    default: return "none";
  }
}

PValuePolicy string_to_pvalue_policy(const std::string& policy) {
  if (policy == "all") return PValuePolicy::ALL;
  if (policy == "consecutive") return PValuePolicy::CONSECUTIVE;
  throw ValidationError("Invalid value for max_pvalue_policy. Allowed string "
                        "values are \"all\" and \"consecutive\".");
}

std::string pvalue_policy_to_string(PValuePolicy policy) {
  return policy == PValuePolicy::ALL ? "all" : "consecutive";
}

} // namespace ScenarioBinning
