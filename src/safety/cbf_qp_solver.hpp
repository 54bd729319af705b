#pragma once

#include "core/linalg.hpp"

#include <cstddef>
#include <limits>
#include <string>

namespace rsa::safety {

// minimize  |u - nominal|^2 + slack_penalty * s^2
// s.t.      normal . u <= bound + s,   |u| <= max_norm,   0 <= s <= max_slack
//
// For a CBF constraint, normal = grad B(x) and bound = -alpha * B(x).
struct QpProblem {
  core::Vector nominal;
  core::Vector normal;
  double bound = 0.0;
  double max_norm = 1.0;
  double slack_penalty = 1000.0;
  double max_slack = std::numeric_limits<double>::infinity();
};

struct QpSolverOptions {
  std::size_t max_iterations = 50;
  double tolerance = 1e-6;
};

enum class QpStatus {
  kSolved,
  kInfeasible,
  kNotConverged,
  kInvalidProblem,
};

const char* ToString(QpStatus status);

struct QpSolution {
  QpStatus status = QpStatus::kInvalidProblem;
  core::Vector action;
  double slack = 0.0;
  double multiplier = 0.0;
  std::size_t iterations = 0;
  // normal . u - s - bound at the returned point (<= tolerance when solved).
  double residual = 0.0;
  std::string message;
};

// Dual bisection on the single constraint multiplier mu >= 0.
//
// For fixed mu the inner problem has the closed form
//   u(mu) = Proj_ball(nominal - mu * normal / 2),  s(mu) = clamp(mu / (2 penalty), 0, max_slack)
// and g(mu) = normal . u(mu) - s(mu) - bound is non-increasing. mu = 0 is
// optimal when g(0) <= 0; otherwise the root of g is bracketed by doubling and
// refined by bisection. Every evaluation of g counts toward max_iterations.
QpSolution SolveCbfQp(const QpProblem& problem, const QpSolverOptions& options);

} // namespace rsa::safety
