#include "ScenarioBinning/BranchAndBoundSolver.h"
#include "common/scenario_binning_common.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>

namespace ScenarioBinning {

namespace {

/// Upper clamp on time limits so the deadline arithmetic cannot overflow
constexpr double MAX_TIME_LIMIT = 1e7;

} // namespace

VarId BranchAndBoundSolver::add_variable(const std::string& name) {
  names_.push_back(name);
  occurrences_.emplace_back();
  objective_.push_back(0.0);
  return static_cast<VarId>(names_.size() - 1);
}

void BranchAndBoundSolver::add_constraint(const LinearConstraint& constraint) {
  // Merge repeated variables so each row holds one term per variable
  std::map<VarId, double> merged;
  for (const auto& term : constraint.terms) {
    if (term.var < 0 || term.var >= static_cast<VarId>(names_.size())) {
      throw std::invalid_argument("Constraint refers to an unknown variable.");
    }
    merged[term.var] += term.coef;
  }

  std::vector<LinearTerm> terms;
  terms.reserve(merged.size());
  for (const auto& [var, coef] : merged) {
    if (coef != 0.0) terms.push_back({var, coef});
  }

  auto add_row = [this](const std::vector<LinearTerm>& row_terms, double rhs, double sign) {
    Row row;
    row.rhs = sign * rhs;
    for (const auto& term : row_terms) {
      row.terms.push_back({term.var, sign * term.coef});
      row.max_abs_coef = std::max(row.max_abs_coef, std::abs(term.coef));
      occurrences_[term.var].push_back({static_cast<int>(rows_.size()), sign * term.coef});
    }
    rows_.push_back(std::move(row));
  };

  switch (constraint.sense) {
  case ConstraintSense::LESS_EQUAL:
    add_row(terms, constraint.rhs, 1.0);
    break;
  case ConstraintSense::GREATER_EQUAL:
    add_row(terms, constraint.rhs, -1.0);
    break;
  case ConstraintSense::EQUAL:
    add_row(terms, constraint.rhs, 1.0);
    add_row(terms, constraint.rhs, -1.0);
    break;
  }

  n_user_constraints_++;
}

void BranchAndBoundSolver::set_objective(const std::vector<LinearTerm>& terms, bool maximize) {
  std::fill(objective_.begin(), objective_.end(), 0.0);
  for (const auto& term : terms) {
    if (term.var < 0 || term.var >= static_cast<VarId>(names_.size())) {
      throw std::invalid_argument("Objective refers to an unknown variable.");
    }
    objective_[term.var] += term.coef;
  }
  maximize_ = maximize;
}

void BranchAndBoundSolver::add_decision_strategy(const std::vector<VarId>& vars) {
  for (VarId var : vars) {
    if (var < 0 || var >= static_cast<VarId>(names_.size())) {
      throw std::invalid_argument("Decision strategy refers to an unknown variable.");
    }
    decision_order_.push_back(var);
  }
}

// =============================================================================
// SEARCH STATE
// =============================================================================

void BranchAndBoundSolver::reset_search() {
  value_.assign(names_.size(), -1);
  trail_.clear();
  propagation_queue_.clear();

  for (auto& row : rows_) {
    row.min_activity = 0.0;
    for (const auto& term : row.terms) {
      row.min_activity += std::min(term.coef, 0.0);
    }
  }

  obj_fixed_ = 0.0;
  obj_free_positive_ = 0.0;
  for (double& coef : objective_) {
    if (!maximize_) coef = -coef;
    obj_free_positive_ += std::max(coef, 0.0);
  }

  has_incumbent_ = false;
  best_objective_ = 0.0;
  best_solution_.assign(names_.size(), false);
  timed_out_ = false;
  n_nodes_ = 0;
  n_conflicts_ = 0;

  for (int r = 0; r < static_cast<int>(rows_.size()); ++r) {
    propagation_queue_.push_back(r);
  }
}

bool BranchAndBoundSolver::assign(VarId var, bool val) {
  if (value_[var] >= 0) {
    return value_[var] == static_cast<signed char>(val);
  }

  trail_.push_back({TrailEntry::Kind::ASSIGN, var, 0.0, 0.0});
  value_[var] = static_cast<signed char>(val);

  const double c = objective_[var];
  trail_.push_back({TrailEntry::Kind::OBJECTIVE, var, obj_fixed_, obj_free_positive_});
  if (val) obj_fixed_ += c;
  obj_free_positive_ -= std::max(c, 0.0);

  for (const auto& occ : occurrences_[var]) {
    const double delta = (val ? occ.coef : 0.0) - std::min(occ.coef, 0.0);
    if (delta == 0.0) continue;
    Row& row = rows_[occ.row];
    trail_.push_back({TrailEntry::Kind::ACTIVITY, occ.row, row.min_activity, 0.0});
    row.min_activity += delta;
    propagation_queue_.push_back(occ.row);
  }

  return true;
}

bool BranchAndBoundSolver::propagate() {
  long n_pops = 0;
  while (!propagation_queue_.empty()) {
    if (++n_pops % DEADLINE_CHECK_PERIOD == 0 && deadline_reached()) {
      propagation_queue_.clear();
      return false;
    }

    const int r = propagation_queue_.back();
    propagation_queue_.pop_back();

    const Row& row = rows_[r];
    const double slack = row.rhs - row.min_activity;
    if (slack < -SOLVER_TOLERANCE) {
      propagation_queue_.clear();
      return false;
    }
    if (row.max_abs_coef <= slack + SOLVER_TOLERANCE) continue;

    for (const auto& term : row.terms) {
      if (value_[term.var] >= 0) continue;
      if (std::abs(term.coef) > slack + SOLVER_TOLERANCE) {
        // Free variables sit at their activity-minimizing value in min_activity
        assign(term.var, term.coef < 0.0);
      }
    }
  }
  return true;
}

bool BranchAndBoundSolver::deadline_reached() {
  if (!timed_out_ && Clock::now() >= deadline_) {
    timed_out_ = true;
  }
  return timed_out_;
}

void BranchAndBoundSolver::undo(std::size_t mark) {
  while (trail_.size() > mark) {
    const TrailEntry entry = trail_.back();
    trail_.pop_back();
    switch (entry.kind) {
    case TrailEntry::Kind::ASSIGN:
      value_[entry.index] = -1;
      break;
    case TrailEntry::Kind::ACTIVITY:
      rows_[entry.index].min_activity = entry.old_a;
      break;
    case TrailEntry::Kind::OBJECTIVE:
      obj_fixed_ = entry.old_a;
      obj_free_positive_ = entry.old_b;
      break;
    }
  }
}

VarId BranchAndBoundSolver::select_variable() const {
  for (VarId var : decision_order_) {
    if (value_[var] < 0) return var;
  }
  for (VarId var = 0; var < static_cast<VarId>(value_.size()); ++var) {
    if (value_[var] < 0) return var;
  }
  return -1;
}

void BranchAndBoundSolver::record_incumbent() {
  if (has_incumbent_ && obj_fixed_ <= best_objective_ + SOLVER_TOLERANCE) return;

  has_incumbent_ = true;
  best_objective_ = obj_fixed_;
  for (std::size_t i = 0; i < value_.size(); ++i) {
    best_solution_[i] = value_[i] == 1;
  }
}

void BranchAndBoundSolver::search() {
  n_nodes_++;
  if (deadline_reached()) return;

  if (has_incumbent_ && obj_fixed_ + obj_free_positive_ <= best_objective_ + SOLVER_TOLERANCE) {
    return;
  }

  const VarId var = select_variable();
  if (var < 0) {
    // Every row was checked on its last change, so a full assignment is feasible
    record_incumbent();
    return;
  }

  for (bool val : {true, false}) {
    const std::size_t mark = trail_.size();
    if (assign(var, val) && propagate()) {
      search();
    } else if (!timed_out_) {
      n_conflicts_++;
    }
    propagation_queue_.clear();
    undo(mark);
    if (timed_out_) return;
  }
}

SolverStatus BranchAndBoundSolver::solve(double time_limit) {
  const Clock::time_point start = Clock::now();
  const double limit = std::min(std::max(time_limit, 0.0), MAX_TIME_LIMIT);
  deadline_ = start + std::chrono::duration_cast<Clock::duration>(
    std::chrono::duration<double>(limit));

  std::vector<double> objective_backup = objective_;
  reset_search();

  if (!deadline_reached()) {
    if (propagate()) {
      search();
    } else if (!timed_out_) {
      n_conflicts_++;
    }
  }

  objective_ = std::move(objective_backup);
  undo(0);

  if (timed_out_) {
    status_ = has_incumbent_ ? SolverStatus::FEASIBLE : SolverStatus::STOPPED;
  } else {
    status_ = has_incumbent_ ? SolverStatus::OPTIMAL : SolverStatus::INFEASIBLE;
  }

  solve_time_ = std::chrono::duration<double>(Clock::now() - start).count();
  return status_;
}

bool BranchAndBoundSolver::boolean_value(VarId var) const {
  if (var < 0 || var >= static_cast<VarId>(names_.size())) {
    throw std::out_of_range("Unknown variable.");
  }
  if (!has_incumbent_) return false;
  return best_solution_[var];
}

SolverStatistics BranchAndBoundSolver::statistics() const {
  SolverStatistics stats;
  stats.n_variables = static_cast<int>(names_.size());
  stats.n_constraints = n_user_constraints_;
  stats.n_nodes = n_nodes_;
  stats.n_conflicts = n_conflicts_;
  stats.objective = maximize_ ? best_objective_ : -best_objective_;
  stats.time = solve_time_;
  stats.status = status_;
  return stats;
}

} // namespace ScenarioBinning
