#ifndef SCENARIO_BINNING_SOLVER_BACKEND_H
#define SCENARIO_BINNING_SOLVER_BACKEND_H

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace ScenarioBinning {

/**
 * @brief Outcome of a solver run
 *
 * OPTIMAL: search completed with a best solution
 * FEASIBLE: time limit hit after a solution was found
 * INFEASIBLE: search completed without any solution
 * STOPPED: time limit hit before any solution was found
 * UNKNOWN: solve() has not run
 */
enum class SolverStatus {
  OPTIMAL,
  FEASIBLE,
  INFEASIBLE,
  STOPPED,
  UNKNOWN
};

inline std::string solver_status_to_string(SolverStatus status) {
  switch (status) {
  case SolverStatus::OPTIMAL: return "OPTIMAL";
  case SolverStatus::FEASIBLE: return "FEASIBLE";
  case SolverStatus::INFEASIBLE: return "INFEASIBLE";
  case SolverStatus::STOPPED: return "STOPPED";
  case SolverStatus::UNKNOWN: return "UNKNOWN";
  }
  return "UNKNOWN";
}

/// True when the status carries a usable solution
inline bool has_solution(SolverStatus status) {
  return status == SolverStatus::OPTIMAL || status == SolverStatus::FEASIBLE;
}

enum class ConstraintSense {
  LESS_EQUAL,
  GREATER_EQUAL,
  EQUAL
};

/// Index of a boolean decision variable
using VarId = int;

struct LinearTerm {
  VarId var;
  double coef;
};

/**
 * @brief sum(coef * var) <sense> rhs over boolean variables
 */
struct LinearConstraint {
  std::vector<LinearTerm> terms;
  ConstraintSense sense = ConstraintSense::LESS_EQUAL;
  double rhs = 0.0;

  LinearConstraint() = default;
  LinearConstraint(std::vector<LinearTerm> t, ConstraintSense s, double r)
    : terms(std::move(t)), sense(s), rhs(r) {}
};

struct SolverStatistics {
  int n_variables = 0;
  int n_constraints = 0;
  long n_nodes = 0;
  long n_conflicts = 0;
  double objective = 0.0;
  double time = 0.0;
  SolverStatus status = SolverStatus::UNKNOWN;
};

/**
 * @brief Boolean linear optimization capability used by the optimizer
 *
 * Any exact or heuristic 0-1 solver can sit behind this interface.
 */
class SolverBackend {
public:
  virtual ~SolverBackend() = default;

  virtual VarId add_variable(const std::string& name) = 0;

  virtual void add_constraint(const LinearConstraint& constraint) = 0;

  virtual void set_objective(const std::vector<LinearTerm>& terms, bool maximize) = 0;

  /// Variables to branch on first, in order
  virtual void add_decision_strategy(const std::vector<VarId>& vars) = 0;

  /**
   * @brief Run the search
   * @param time_limit Wall-clock limit in seconds
   */
  virtual SolverStatus solve(double time_limit) = 0;

  /// Value of a variable in the best solution found
  virtual bool boolean_value(VarId var) const = 0;

  virtual SolverStatistics statistics() const = 0;
};

using SolverFactory = std::function<std::unique_ptr<SolverBackend>()>;

} // namespace ScenarioBinning

#endif // SCENARIO_BINNING_SOLVER_BACKEND_H
