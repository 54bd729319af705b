#include "safety/cbf_qp_solver.hpp"

#include <algorithm>
#include <cmath>

namespace rsa::safety {

namespace {

struct InnerSolution {
  core::Vector action;
  double slack = 0.0;
  double residual = 0.0;
};

InnerSolution SolveInner(const QpProblem& problem, const double mu) {
  InnerSolution inner;
  const core::Vector shifted = problem.nominal - 0.5 * mu * problem.normal;
  inner.action = core::ProjectOntoBall(shifted, problem.max_norm);
  inner.slack = std::clamp(mu / (2.0 * problem.slack_penalty), 0.0, problem.max_slack);
  inner.residual = problem.normal.dot(inner.action) - inner.slack - problem.bound;
  return inner;
}

bool ValidateProblem(const QpProblem& problem, std::string& message) {
  if (problem.nominal.size() == 0 || problem.nominal.size() != problem.normal.size()) {
    message = "nominal action and constraint normal must share a non-zero dimension";
    return false;
  }
  if (!problem.nominal.allFinite() || !problem.normal.allFinite() ||
      !std::isfinite(problem.bound)) {
    message = "qp inputs contain non-finite values";
    return false;
  }
  if (!std::isfinite(problem.max_norm) || problem.max_norm <= 0.0) {
    message = "action bound must be finite and > 0";
    return false;
  }
  if (!std::isfinite(problem.slack_penalty) || problem.slack_penalty <= 0.0) {
    message = "slack penalty must be finite and > 0";
    return false;
  }
  if (std::isnan(problem.max_slack) || problem.max_slack < 0.0) {
    message = "slack bound must be >= 0";
    return false;
  }
  return true;
}

QpSolution Finish(QpSolution solution, const InnerSolution& inner, const double mu) {
  solution.action = inner.action;
  solution.slack = inner.slack;
  solution.multiplier = mu;
  solution.residual = inner.residual;
  return solution;
}

} // namespace

const char* ToString(const QpStatus status) {
  switch (status) {
  case QpStatus::kSolved:
    return "solved";
  case QpStatus::kInfeasible:
    return "infeasible";
  case QpStatus::kNotConverged:
    return "not_converged";
  case QpStatus::kInvalidProblem:
    return "invalid_problem";
  }
  return "invalid_problem";
}

QpSolution SolveCbfQp(const QpProblem& problem, const QpSolverOptions& options) {
  QpSolution solution;
  if (!ValidateProblem(problem, solution.message)) {
    solution.status = QpStatus::kInvalidProblem;
    return solution;
  }
  if (options.max_iterations == 0U) {
    solution.status = QpStatus::kNotConverged;
    solution.message = "iteration budget is zero";
    return solution;
  }

  // Smallest reachable value of normal . u - s over the feasible box.
  const double best_case = -problem.max_norm * problem.normal.norm() - problem.max_slack;
  if (best_case > problem.bound + options.tolerance) {
    solution.status = QpStatus::kInfeasible;
    solution.message = "constraint cannot be met within the action and slack bounds";
    return solution;
  }

  std::size_t iterations = 1;
  InnerSolution inner = SolveInner(problem, 0.0);
  if (inner.residual <= options.tolerance) {
    solution.status = QpStatus::kSolved;
    solution.iterations = iterations;
    return Finish(solution, inner, 0.0);
  }

  double lo = 0.0;
  double hi = 1.0;
  InnerSolution hi_inner = SolveInner(problem, hi);
  ++iterations;
  while (hi_inner.residual > options.tolerance) {
    if (iterations >= options.max_iterations) {
      solution.status = QpStatus::kNotConverged;
      solution.iterations = iterations;
      solution.message = "multiplier bracket not found within iteration budget";
      return Finish(solution, hi_inner, hi);
    }
    lo = hi;
    hi *= 2.0;
    hi_inner = SolveInner(problem, hi);
    ++iterations;
    if (!std::isfinite(hi)) {
      solution.status = QpStatus::kNotConverged;
      solution.iterations = iterations;
      solution.message = "multiplier diverged";
      return solution;
    }
  }

  // Invariant: residual(lo) > tolerance >= residual(hi).
  while (hi_inner.residual < -options.tolerance) {
    if (iterations >= options.max_iterations) {
      solution.status = QpStatus::kNotConverged;
      solution.iterations = iterations;
      solution.message = "bisection did not reach tolerance within iteration budget";
      return Finish(solution, hi_inner, hi);
    }
    const double mid = 0.5 * (lo + hi);
    const InnerSolution mid_inner = SolveInner(problem, mid);
    ++iterations;
    if (mid_inner.residual > options.tolerance) {
      lo = mid;
    } else {
      hi = mid;
      hi_inner = mid_inner;
    }
  }

  solution.status = QpStatus::kSolved;
  solution.iterations = iterations;
  return Finish(solution, hi_inner, hi);
}

} // namespace rsa::safety
