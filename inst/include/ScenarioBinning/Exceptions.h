#ifndef SCENARIO_BINNING_EXCEPTIONS_H
#define SCENARIO_BINNING_EXCEPTIONS_H

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ScenarioBinning {

/**
 * @brief Root of all errors raised by the scenario binning library
 */
class BinningException : public std::runtime_error {
public:
  explicit BinningException(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Malformed or inconsistent configuration or input shapes
 *
 * Raised eagerly, before any computation takes place.
 */
class ValidationError : public BinningException {
public:
  explicit ValidationError(const std::string& msg) : BinningException(msg) {}
};

/**
 * @brief A user-pinned split would have to be removed to avoid a pure prebin
 */
class FixedSplitConflictError : public BinningException {
public:
  FixedSplitConflictError(const std::string& msg, std::vector<double> splits)
    : BinningException(msg), splits_(std::move(splits)) {}

  /// Fixed split values that produce pure prebins
  const std::vector<double>& splits() const { return splits_; }

private:
  std::vector<double> splits_;
};

/**
 * @brief Fitted-state accessor called before a successful fit
 */
class NotFittedError : public BinningException {
public:
  explicit NotFittedError(const std::string& msg) : BinningException(msg) {}
};

} // namespace ScenarioBinning

#endif // SCENARIO_BINNING_EXCEPTIONS_H
