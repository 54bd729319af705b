#include "safety/safety_filter.hpp"

#include <cmath>
#include <utility>

namespace rsa::safety {

namespace {

FilterResult EmergencyStop(FilterResult result, const std::size_t dimension, std::string reason) {
  result.outcome = FilterOutcome::kEmergencyStop;
  result.action = core::Vector::Zero(static_cast<Eigen::Index>(dimension));
  result.slack = 0.0;
  result.activated = true;
  result.slack_active = false;
  result.reason = std::move(reason);
  return result;
}

} // namespace

const char* ToString(const FilterOutcome outcome) {
  switch (outcome) {
  case FilterOutcome::kAccepted:
    return "accepted";
  case FilterOutcome::kRelaxed:
    return "relaxed";
  case FilterOutcome::kEmergencyStop:
    return "emergency_stop";
  }
  return "emergency_stop";
}

QpProblem SafetyFilter::Formulate(const IBarrierFunction& barrier, const core::Vector& state,
                                  const core::Vector& nominal, double& barrier_value) const {
  barrier_value = barrier.Evaluate(state);

  QpProblem problem;
  problem.nominal = nominal;
  problem.normal = barrier.Gradient(state);
  problem.bound = -config_.barrier_alpha * barrier_value;
  problem.max_norm = config_.max_action;
  problem.slack_penalty = config_.slack_penalty;
  problem.max_slack = config_.max_slack;
  return problem;
}

FilterResult SafetyFilter::Filter(const IBarrierFunction& barrier, const core::Vector& state,
                                  const core::Vector& nominal) const {
  FilterResult result;
  const std::size_t dimension = nominal.size() == 0 ? barrier.Dimension() : core::Dim(nominal);

  if (core::Dim(state) != barrier.Dimension() || !state.allFinite()) {
    return EmergencyStop(result, dimension, "state estimate is non-finite or has wrong dimension");
  }

  const QpProblem problem = Formulate(barrier, state, nominal, result.barrier_value);

  QpSolverOptions options;
  options.max_iterations = config_.max_iterations;
  options.tolerance = config_.tolerance;
  QpSolution solution = SolveCbfQp(problem, options);
  result.iterations = solution.iterations;
  result.outcome = FilterOutcome::kAccepted;

  if (solution.status != QpStatus::kSolved) {
    const std::string first_failure = std::string(ToString(solution.status)) + ": " + solution.message;
    options.tolerance *= config_.relax_tolerance_factor;
    options.max_iterations *= config_.relax_iteration_factor;
    solution = SolveCbfQp(problem, options);
    result.iterations += solution.iterations;
    result.outcome = FilterOutcome::kRelaxed;
    if (solution.status != QpStatus::kSolved) {
      result.solver_status = solution.status;
      return EmergencyStop(result, dimension,
                           "solver failed twice (" + first_failure + "; retry " +
                               ToString(solution.status) + ": " + solution.message + ")");
    }
  }

  result.solver_status = solution.status;
  if (!solution.action.allFinite() || !std::isfinite(solution.slack)) {
    return EmergencyStop(result, dimension, "solver returned a non-finite action");
  }

  result.action = solution.action;
  result.slack = solution.slack;
  result.slack_active = solution.slack > config_.slack_epsilon;
  // Saturation alone is not a safety intervention: compare against the
  // nominal already clipped to the action ball.
  const core::Vector saturated = core::ProjectOntoBall(nominal, config_.max_action);
  result.activated = (result.action - saturated).norm() >
                         config_.activation_tolerance ||
                     result.slack_active;
  return result;
}

} // namespace rsa::safety
