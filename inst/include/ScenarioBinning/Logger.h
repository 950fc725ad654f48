#ifndef SCENARIO_BINNING_LOGGER_H
#define SCENARIO_BINNING_LOGGER_H

#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace ScenarioBinning {

enum class LogLevel {
  NONE = 0,
  ERROR = 1,
  WARNING = 2,
  INFO = 3,
  DEBUG = 4
};

/**
 * @brief Verbose-gated logger writing "[LEVEL] message" lines to a stream
 *
 * The sink defaults to std::cerr; the R bindings hand in Rcpp::Rcout.
 * Warnings are always recorded (see warnings()) so that callers can surface
 * them even when verbose output is off.
 */
class Logger {
public:
  explicit Logger(bool verbose = false, LogLevel level = LogLevel::INFO,
                  std::ostream* sink = &std::cerr)
    : verbose_(verbose), log_level_(level), sink_(sink) {}

  template<typename... Args>
  void error(Args&&... args) {
    if (verbose_ && log_level_ >= LogLevel::ERROR) {
      log("ERROR", std::forward<Args>(args)...);
    }
  }

  template<typename... Args>
  void warning(Args&&... args) {
    warnings_.push_back(concat(std::forward<Args>(args)...));
    if (verbose_ && log_level_ >= LogLevel::WARNING) {
      log("WARNING", warnings_.back());
    }
  }

  template<typename... Args>
  void info(Args&&... args) {
    if (verbose_ && log_level_ >= LogLevel::INFO) {
      log("INFO", std::forward<Args>(args)...);
    }
  }

  template<typename... Args>
  void debug(Args&&... args) {
    if (verbose_ && log_level_ >= LogLevel::DEBUG) {
      log("DEBUG", std::forward<Args>(args)...);
    }
  }

  template<typename... Args>
  void log(const std::string& level, Args&&... args) {
    if (!verbose_ || sink_ == nullptr) return;
    *sink_ << "[" << level << "] ";
    log_impl(std::forward<Args>(args)...);
    *sink_ << std::endl;
  }

  /**
   * @brief Scoped stopwatch; logs the elapsed time of a stage on request
   */
  class Timer {
  public:
    Timer() : start_time_(std::chrono::high_resolution_clock::now()) {}

    double elapsed() const {
      auto end_time = std::chrono::high_resolution_clock::now();
      return std::chrono::duration<double>(end_time - start_time_).count();
    }

  private:
    std::chrono::high_resolution_clock::time_point start_time_;
  };

  bool is_verbose() const { return verbose_; }
  LogLevel get_level() const { return log_level_; }
  const std::vector<std::string>& warnings() const { return warnings_; }

  void set_verbose(bool verbose) { verbose_ = verbose; }
  void set_level(LogLevel level) { log_level_ = level; }
  void set_sink(std::ostream* sink) { sink_ = sink; }

private:
  bool verbose_;
  LogLevel log_level_;
  std::ostream* sink_;
  std::vector<std::string> warnings_;

  void log_impl() {}

  template<typename T, typename... Args>
  void log_impl(T&& t, Args&&... args) {
    *sink_ << t;
    log_impl(std::forward<Args>(args)...);
  }

  template<typename... Args>
  static std::string concat(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
  }
};

} // namespace ScenarioBinning

#endif // SCENARIO_BINNING_LOGGER_H
