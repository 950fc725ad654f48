#ifndef SCENARIO_BINNING_BRANCH_AND_BOUND_SOLVER_H
#define SCENARIO_BINNING_BRANCH_AND_BOUND_SOLVER_H

#include "SolverBackend.h"

#include <chrono>
#include <string>
#include <vector>

namespace ScenarioBinning {

/**
 * @brief Depth-first branch-and-bound over 0-1 variables
 *
 * Every constraint is kept as sum(a * x) <= b; equalities and >= rows are
 * rewritten on insertion. Each row tracks its minimum activity over the free
 * variables, so a row forces a free variable as soon as flipping it would
 * exceed the slack. All changes go to a trail and are undone exactly on
 * backtrack.
 *
 * Branching follows the decision strategy, value 1 first. A node is pruned
 * when the fixed objective plus all positive free coefficients cannot beat
 * the incumbent.
 *
 * The deadline is checked at every node and periodically while rows are
 * propagated, so a single long propagation cannot overrun the time limit.
 */
class BranchAndBoundSolver : public SolverBackend {
public:
  BranchAndBoundSolver() = default;

  VarId add_variable(const std::string& name) override;
  void add_constraint(const LinearConstraint& constraint) override;
  void set_objective(const std::vector<LinearTerm>& terms, bool maximize) override;
  void add_decision_strategy(const std::vector<VarId>& vars) override;
  SolverStatus solve(double time_limit) override;
  bool boolean_value(VarId var) const override;
  SolverStatistics statistics() const override;

  const std::string& variable_name(VarId var) const { return names_[var]; }

private:
  using Clock = std::chrono::steady_clock;

  struct Row {
    std::vector<LinearTerm> terms;
    double rhs = 0.0;
    double min_activity = 0.0;
    double max_abs_coef = 0.0;
  };

  struct Occurrence {
    int row;
    double coef;
  };

  struct TrailEntry {
    enum class Kind { ASSIGN, ACTIVITY, OBJECTIVE } kind;
    int index;
    double old_a;
    double old_b;
  };

  // Model
  std::vector<std::string> names_;
  std::vector<Row> rows_;
  std::vector<std::vector<Occurrence>> occurrences_;
  std::vector<double> objective_;
  bool maximize_ = true;
  std::vector<VarId> decision_order_;
  int n_user_constraints_ = 0;

  // Search state
  std::vector<signed char> value_;
  std::vector<TrailEntry> trail_;
  std::vector<int> propagation_queue_;
  double obj_fixed_ = 0.0;
  double obj_free_positive_ = 0.0;

  // Incumbent
  bool has_incumbent_ = false;
  double best_objective_ = 0.0;
  std::vector<bool> best_solution_;

  // Limits and counters
  Clock::time_point deadline_;
  bool timed_out_ = false;
  long n_nodes_ = 0;
  long n_conflicts_ = 0;
  double solve_time_ = 0.0;
  SolverStatus status_ = SolverStatus::UNKNOWN;

  void reset_search();
  bool assign(VarId var, bool val);
  bool propagate();
  bool deadline_reached();
  void undo(std::size_t mark);
  VarId select_variable() const;
  void record_incumbent();
  void search();
};

} // namespace ScenarioBinning

#endif // SCENARIO_BINNING_BRANCH_AND_BOUND_SOLVER_H
