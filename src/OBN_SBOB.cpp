// [[Rcpp::plugins(cpp17)]]
// [[Rcpp::depends(Rcpp)]]

#include <Rcpp.h>
#include <optional>
#include <string>
#include <vector>

/**
 * @file OBN_SBOB.cpp
 * @brief R interface of the scenario-based optimal binning (SBOB)
 *
 * A single binning is fitted jointly over several scenarios of the same
 * numerical variable. The C++ library does the work; this file converts R
 * objects, routes logging to the R console and re-emits warnings.
 */

#include "ScenarioBinning/ScenarioBinning.h"

using namespace Rcpp;
using namespace ScenarioBinning;

namespace {

template <typename T, typename RVector>
std::optional<T> optional_scalar(const Nullable<RVector>& value) {
  if (value.isNull()) return std::nullopt;
  RVector v(value.get());
  if (v.size() == 0) return std::nullopt;
  return static_cast<T>(v[0]);
}

ClassWeight parse_class_weight(SEXP class_weight) {
  if (Rf_isNull(class_weight)) {
    return ClassWeight();
  }
  if (TYPEOF(class_weight) == STRSXP) {
    std::string mode = as<std::string>(class_weight);
    if (mode == "balanced") return ClassWeight::balanced();
    if (mode == "none") return ClassWeight();
    stop("class_weight must be 'balanced', 'none' or a numeric vector c(w0, w1).");
  }
  NumericVector w(class_weight);
  if (w.size() != 2) {
    stop("class_weight must be 'balanced', 'none' or a numeric vector c(w0, w1).");
  }
  return ClassWeight::custom(w[0], w[1]);
}

MetricFill parse_metric_fill(SEXP value, const char* name) {
  if (Rf_isNull(value)) {
    return MetricFill();
  }
  if (TYPEOF(value) == STRSXP) {
    if (as<std::string>(value) == "empirical") return MetricFill::empirical();
    stop("%s must be numeric or 'empirical'.", name);
  }
  return MetricFill::constant(as<double>(value));
}

DataFrame table_to_dataframe(const BinningTable& table) {
  const auto& rows = table.rows();
  const int n = static_cast<int>(rows.size());

  IntegerVector ids(n);
  CharacterVector bins(n);
  NumericVector count(n), count_share(n), nonevent(n), event(n);
  NumericVector event_rate(n), woe(n), iv(n), js(n);

  for (int i = 0; i < n; ++i) {
    ids[i] = i + 1;
    bins[i] = rows[i].bin;
    count[i] = rows[i].count;
    count_share[i] = rows[i].count_share;
    nonevent[i] = rows[i].nonevent;
    event[i] = rows[i].event;
    event_rate[i] = rows[i].event_rate;
    woe[i] = rows[i].woe;
    iv[i] = rows[i].iv;
    js[i] = rows[i].js;
  }

  return DataFrame::create(
    Named("id") = ids,
    Named("bin") = bins,
    Named("count") = count,
    Named("count_distr") = count_share,
    Named("count_neg") = nonevent,
    Named("count_pos") = event,
    Named("event_rate") = event_rate,
    Named("woe") = woe,
    Named("iv") = iv,
    Named("js") = js,
    Named("stringsAsFactors") = false
  );
}

} // namespace

//' @title Scenario-Based Optimal Binning for Numerical Variables
//'
//' @description
//' Fits one binning of a numerical variable jointly over several scenarios
//' (for example, stressed versions of the same portfolio). The binning
//' maximizes the scenario-weighted sum of Information Value, while bin size
//' and significance constraints hold in every scenario and the monotonic
//' trend holds on the weighted aggregate event rate.
//'
//' @param X List of numeric feature vectors, one per scenario.
//' @param Y List of binary (0/1) integer target vectors, one per scenario.
//' @param weights Optional scenario weights (default 1 for every scenario).
//' @param prebinning_method One of "cart", "quantile" or "uniform".
//' @param max_n_prebins Maximum number of prebins (default 20).
//' @param min_prebin_size Minimum prebin size as a fraction of all records (default 0.05).
//' @param min_n_bins,max_n_bins Optional bounds on the number of bins.
//' @param min_bin_size,max_bin_size Optional bin size bounds, as fractions of each
//'   scenario's records.
//' @param monotonic_trend "none", "ascending", "descending", "convex", "concave",
//'   "peak" or "valley".
//' @param min_event_rate_diff Minimum event rate gap between consecutive bins.
//' @param max_pvalue Optional maximum p-value between bins.
//' @param max_pvalue_policy "consecutive" or "all".
//' @param class_weight NULL, "balanced" or c(w0, w1), used by the CART prebinning.
//' @param user_splits Optional user split points.
//' @param user_splits_fixed Optional logical vector marking user splits that must be kept.
//' @param special_codes Optional values treated as special.
//' @param split_digits Optional number of decimals of the candidate splits.
//' @param time_limit Solver time limit in seconds (default 100).
//' @param check_input Reject infinite values instead of treating them as missing.
//' @param verbose Print progress messages.
//'
//' @return A list with \code{splits}, \code{status}, \code{n_prebins} (after
//'   refinement), \code{n_initial_prebins},
//'   \code{n_refinements}, the aggregate \code{table}, the per-scenario
//'   \code{tables}, aggregate counts \code{n_nonevent} and \code{n_event},
//'   \code{special_codes}, \code{timing} and \code{warnings}.
//'
//' @export
// [[Rcpp::export]]
List optimal_binning_numerical_scenarios(
    List X,
    List Y,
    Nullable<NumericVector> weights = R_NilValue,
    std::string prebinning_method = "cart",
    int max_n_prebins = 20,
    double min_prebin_size = 0.05,
    Nullable<IntegerVector> min_n_bins = R_NilValue,
    Nullable<IntegerVector> max_n_bins = R_NilValue,
    Nullable<NumericVector> min_bin_size = R_NilValue,
    Nullable<NumericVector> max_bin_size = R_NilValue,
    std::string monotonic_trend = "none",
    double min_event_rate_diff = 0.0,
    Nullable<NumericVector> max_pvalue = R_NilValue,
    std::string max_pvalue_policy = "consecutive",
    SEXP class_weight = R_NilValue,
    Nullable<NumericVector> user_splits = R_NilValue,
    Nullable<LogicalVector> user_splits_fixed = R_NilValue,
    Nullable<NumericVector> special_codes = R_NilValue,
    Nullable<IntegerVector> split_digits = R_NilValue,
    double time_limit = 100.0,
    bool check_input = false,
    bool verbose = false) {

  try {
    BinningConfig config;
    config.prebinning_method = string_to_prebinning_method(prebinning_method);
    config.max_n_prebins = max_n_prebins;
    config.min_prebin_size = min_prebin_size;
    config.min_n_bins = optional_scalar<int>(min_n_bins);
    config.max_n_bins = optional_scalar<int>(max_n_bins);
    config.min_bin_size = optional_scalar<double>(min_bin_size);
    config.max_bin_size = optional_scalar<double>(max_bin_size);
    config.monotonic_trend = string_to_monotonic_trend(monotonic_trend);
    config.min_event_rate_diff = min_event_rate_diff;
    config.max_pvalue = optional_scalar<double>(max_pvalue);
    config.max_pvalue_policy = string_to_pvalue_policy(max_pvalue_policy);
    config.class_weight = parse_class_weight(class_weight);
    if (user_splits.isNotNull()) {
      config.user_splits = as<std::vector<double>>(user_splits.get());
    }
    if (user_splits_fixed.isNotNull()) {
      config.user_splits_fixed = as<std::vector<bool>>(user_splits_fixed.get());
    }
    if (special_codes.isNotNull()) {
      config.special_codes = as<std::vector<double>>(special_codes.get());
    }
    config.split_digits = optional_scalar<int>(split_digits);
    config.time_limit = time_limit;
    config.verbose = verbose;

    std::vector<std::vector<double>> x_scenarios;
    std::vector<std::vector<int>> y_scenarios;
    for (R_xlen_t s = 0; s < X.size(); ++s) {
      x_scenarios.push_back(as<std::vector<double>>(X[s]));
    }
    for (R_xlen_t s = 0; s < Y.size(); ++s) {
      // Numeric labels such as 0.7 are rejected rather than truncated
      y_scenarios.push_back(binary_labels(as<std::vector<double>>(Y[s]),
                                          static_cast<std::size_t>(s)));
    }
    std::vector<double> scenario_weights;
    if (weights.isNotNull()) {
      scenario_weights = as<std::vector<double>>(weights.get());
    }

    ScenarioOptimalBinning optb(config, nullptr, &Rcpp::Rcout);
    optb.fit(x_scenarios, y_scenarios, scenario_weights, check_input);
    const FitResult& result = optb.result();

    for (const auto& message : result.warnings) {
      Rcpp::warning("%s", message.c_str());
    }

    List tables(result.scenario_tables.size());
    for (size_t s = 0; s < result.scenario_tables.size(); ++s) {
      tables[s] = table_to_dataframe(result.scenario_tables[s]);
    }

    List timing = List::create(
      Named("total") = result.timing.total,
      Named("preprocessing") = result.timing.preprocessing,
      Named("prebinning") = result.timing.prebinning,
      Named("refinement") = result.timing.refinement,
      Named("optimizer") = result.timing.optimizer,
      Named("postprocessing") = result.timing.postprocessing
    );

    return List::create(
      Named("splits") = wrap(result.splits),
      Named("status") = solver_status_to_string(result.status),
      Named("n_prebins") = result.n_prebins,
      Named("n_initial_prebins") = result.n_initial_prebins,
      Named("n_refinements") = result.n_refinements,
      Named("table") = table_to_dataframe(result.table),
      Named("tables") = tables,
      Named("n_nonevent") = wrap(result.n_nonevent),
      Named("n_event") = wrap(result.n_event),
      Named("special_codes") = wrap(result.special_codes),
      Named("total_iv") = result.table.iv(),
      Named("gini") = result.table.gini(),
      Named("timing") = timing,
      Named("warnings") = wrap(result.warnings)
    );
  } catch(std::exception &e) {
    forward_exception_to_r(e);
  } catch(...) {
    ::Rf_error("Unknown C++ exception in optimal_binning_numerical_scenarios");
  }

  // Should never reach here
  return R_NilValue;
}

//' @title Apply a Scenario-Based Binning to New Data
//'
//' @param obresults List returned by \code{optimal_binning_numerical_scenarios}.
//' @param feature Numeric vector to transform.
//' @param metric "woe", "event_rate", "indices" or "bins".
//' @param metric_special Value for special codes: a number or "empirical" (default 0).
//' @param metric_missing Value for missing values: a number or "empirical" (default 0).
//' @param show_digits Decimals of the bin labels when \code{metric = "bins"}.
//'
//' @return A numeric vector, or a character vector for \code{metric = "bins"}.
//'
//' @export
// [[Rcpp::export]]
SEXP obn_scenarios_apply(const List& obresults,
                         const NumericVector& feature,
                         std::string metric = "woe",
                         SEXP metric_special = R_NilValue,
                         SEXP metric_missing = R_NilValue,
                         int show_digits = 2) {
  try {
    for (const char* element : {"splits", "n_nonevent", "n_event", "special_codes"}) {
      if (!obresults.containsElementNamed(element)) {
        stop("The 'obresults' list must contain a '%s' element.", element);
      }
    }

    std::vector<double> splits = as<std::vector<double>>(obresults["splits"]);
    std::vector<long> n_nonevent;
    std::vector<long> n_event;
    for (double v : as<std::vector<double>>(obresults["n_nonevent"])) n_nonevent.push_back(static_cast<long>(v));
    for (double v : as<std::vector<double>>(obresults["n_event"])) n_event.push_back(static_cast<long>(v));
    std::vector<double> special = as<std::vector<double>>(obresults["special_codes"]);
    std::vector<double> x = as<std::vector<double>>(feature);

    TransformMetric transform_metric = string_to_transform_metric(metric);
    if (transform_metric == TransformMetric::BINS) {
      return wrap(transform_bins(splits, special, x, show_digits));
    }

    return wrap(transform_binary_target(splits, n_nonevent, n_event, special, x,
                                        transform_metric,
                                        parse_metric_fill(metric_special, "metric_special"),
                                        parse_metric_fill(metric_missing, "metric_missing")));
  } catch(std::exception &e) {
    forward_exception_to_r(e);
  } catch(...) {
    ::Rf_error("Unknown C++ exception in obn_scenarios_apply");
  }

  return R_NilValue;
}
