#include <gtest/gtest.h>

#include "ScenarioBinning/BranchAndBoundSolver.h"

#include <stdexcept>
#include <string>
#include <vector>

using namespace ScenarioBinning;

TEST(BranchAndBoundSolverTest, SolvesKnapsack) {
  BranchAndBoundSolver solver;
  VarId a = solver.add_variable("a");
  VarId b = solver.add_variable("b");
  VarId c = solver.add_variable("c");

  solver.add_constraint(LinearConstraint({{a, 2.0}, {b, 3.0}, {c, 1.0}},
                                         ConstraintSense::LESS_EQUAL, 4.0));
  solver.set_objective({{a, 5.0}, {b, 4.0}, {c, 3.0}}, true);

  EXPECT_EQ(solver.statistics().status, SolverStatus::UNKNOWN);
  EXPECT_EQ(solver.solve(10.0), SolverStatus::OPTIMAL);
  EXPECT_TRUE(solver.boolean_value(a));
  EXPECT_FALSE(solver.boolean_value(b));
  EXPECT_TRUE(solver.boolean_value(c));

  SolverStatistics stats = solver.statistics();
  EXPECT_DOUBLE_EQ(stats.objective, 8.0);
  EXPECT_EQ(stats.n_variables, 3);
  EXPECT_EQ(stats.n_constraints, 1);
  EXPECT_GT(stats.n_nodes, 0);
  EXPECT_EQ(stats.status, SolverStatus::OPTIMAL);
}

TEST(BranchAndBoundSolverTest, EqualityAndMinimization) {
  BranchAndBoundSolver solver;
  VarId a = solver.add_variable("a");
  VarId b = solver.add_variable("b");
  VarId c = solver.add_variable("c");

  solver.add_constraint(LinearConstraint({{a, 1.0}, {b, 1.0}, {c, 1.0}},
                                         ConstraintSense::EQUAL, 2.0));
  solver.set_objective({{a, 3.0}, {b, 1.0}, {c, 2.0}}, false);

  EXPECT_EQ(solver.solve(10.0), SolverStatus::OPTIMAL);
  EXPECT_FALSE(solver.boolean_value(a));
  EXPECT_TRUE(solver.boolean_value(b));
  EXPECT_TRUE(solver.boolean_value(c));
  EXPECT_DOUBLE_EQ(solver.statistics().objective, 3.0);
}

TEST(BranchAndBoundSolverTest, MergesRepeatedTerms) {
  BranchAndBoundSolver solver;
  VarId a = solver.add_variable("a");
  VarId b = solver.add_variable("b");

  // 2a + b <= 2 written with a repeated term
  solver.add_constraint(LinearConstraint({{a, 1.0}, {b, 1.0}, {a, 1.0}},
                                         ConstraintSense::LESS_EQUAL, 2.0));
  solver.set_objective({{a, 1.0}, {b, 1.0}}, true);

  EXPECT_EQ(solver.solve(10.0), SolverStatus::OPTIMAL);
  EXPECT_DOUBLE_EQ(solver.statistics().objective, 1.0);
}

TEST(BranchAndBoundSolverTest, DetectsInfeasibility) {
  BranchAndBoundSolver solver;
  VarId a = solver.add_variable("a");
  VarId b = solver.add_variable("b");

  solver.add_constraint(LinearConstraint({{a, 1.0}, {b, 1.0}}, ConstraintSense::GREATER_EQUAL, 3.0));
  solver.set_objective({{a, 1.0}}, true);

  EXPECT_EQ(solver.solve(10.0), SolverStatus::INFEASIBLE);
  EXPECT_FALSE(solver.boolean_value(a));
}

TEST(BranchAndBoundSolverTest, ZeroTimeLimitStopsImmediately) {
  BranchAndBoundSolver solver;
  VarId a = solver.add_variable("a");
  solver.set_objective({{a, 1.0}}, true);

  EXPECT_EQ(solver.solve(0.0), SolverStatus::STOPPED);
  EXPECT_EQ(solver.statistics().status, SolverStatus::STOPPED);
}

TEST(BranchAndBoundSolverTest, FollowsDecisionStrategyOnTies) {
  BranchAndBoundSolver solver;
  VarId a = solver.add_variable("a");
  VarId b = solver.add_variable("b");

  solver.add_constraint(LinearConstraint({{a, 1.0}, {b, 1.0}}, ConstraintSense::EQUAL, 1.0));
  solver.set_objective({{a, 1.0}, {b, 1.0}}, true);
  solver.add_decision_strategy({b, a});

  EXPECT_EQ(solver.solve(10.0), SolverStatus::OPTIMAL);
  EXPECT_TRUE(solver.boolean_value(b));
  EXPECT_FALSE(solver.boolean_value(a));
}

TEST(BranchAndBoundSolverTest, RejectsUnknownVariables) {
  BranchAndBoundSolver solver;
  solver.add_variable("a");

  EXPECT_THROW(solver.add_constraint(LinearConstraint({{3, 1.0}}, ConstraintSense::LESS_EQUAL, 1.0)),
               std::invalid_argument);
  EXPECT_THROW(solver.add_decision_strategy({5}), std::invalid_argument);
  EXPECT_THROW(solver.boolean_value(7), std::out_of_range);
}

TEST(BranchAndBoundSolverTest, PositiveTimeLimitBoundsLongSearches) {
  // 2 * sum(x) == 61 has no 0-1 solution, but propagation only detects it
  // about 60 levels deep, so the tree is far too large to exhaust
  BranchAndBoundSolver solver;
  std::vector<LinearTerm> terms;
  std::vector<LinearTerm> objective;
  for (int i = 0; i < 60; ++i) {
    VarId var = solver.add_variable("x" + std::to_string(i));
    terms.push_back({var, 2.0});
    objective.push_back({var, 1.0});
  }
  solver.add_constraint(LinearConstraint(terms, ConstraintSense::EQUAL, 61.0));
  solver.set_objective(objective, true);

  const double time_limit = 0.2;
  EXPECT_EQ(solver.solve(time_limit), SolverStatus::STOPPED);

  SolverStatistics stats = solver.statistics();
  EXPECT_GT(stats.n_nodes, 0);
  EXPECT_GE(stats.time, time_limit);
  EXPECT_LT(stats.time, time_limit + 0.3);
}
