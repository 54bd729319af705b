#pragma once

#include "core/linalg.hpp"
#include "safety/barrier.hpp"
#include "safety/cbf_qp_solver.hpp"

#include <cstddef>
#include <limits>
#include <string>

namespace rsa::safety {

struct SafetyConfig {
  double barrier_alpha = 0.5;
  double slack_penalty = 1000.0;
  // +inf keeps the constraint soft; a finite value allows infeasibility.
  double max_slack = std::numeric_limits<double>::infinity();
  double max_action = 0.15;
  std::size_t max_iterations = 50;
  double tolerance = 1e-6;
  // Slack above this is reported as constraint activity.
  double slack_epsilon = 1e-5;
  // |u - clip(u_nominal)| above this marks the filter as active.
  double activation_tolerance = 1e-4;
  // Retry multipliers applied after a first solver failure.
  double relax_tolerance_factor = 100.0;
  std::size_t relax_iteration_factor = 2;
  // Robust tightening delta = margin_base + margin_sigmas * max belief std.
  double margin_base = 0.0;
  double margin_sigmas = 0.0;
};

enum class FilterOutcome {
  kAccepted,
  kRelaxed,
  kEmergencyStop,
};

const char* ToString(FilterOutcome outcome);

struct FilterResult {
  FilterOutcome outcome = FilterOutcome::kEmergencyStop;
  core::Vector action;
  double slack = 0.0;
  // Solver iterations summed over the first attempt and the retry.
  std::size_t iterations = 0;
  bool activated = false;
  bool slack_active = false;
  double barrier_value = 0.0;
  QpStatus solver_status = QpStatus::kInvalidProblem;
  // Empty unless the outcome is kEmergencyStop.
  std::string reason;
};

// Projects a nominal action onto the CBF safe set.
//
// Formulate -> Solve -> {Accept | Relax-and-retry-once | EmergencyStop}:
// - first attempt uses the configured tolerance and iteration budget.
// - on failure the tolerance is multiplied by relax_tolerance_factor and the
//   budget by relax_iteration_factor, once.
// - a second failure, or any non-finite output, yields the zero action with
//   outcome kEmergencyStop and a reason.
class SafetyFilter {
public:
  SafetyFilter() = default;
  explicit SafetyFilter(const SafetyConfig& config) : config_(config) {}

  const SafetyConfig& Config() const {
    return config_;
  }

  FilterResult Filter(const IBarrierFunction& barrier, const core::Vector& state,
                      const core::Vector& nominal) const;

private:
  QpProblem Formulate(const IBarrierFunction& barrier, const core::Vector& state,
                      const core::Vector& nominal, double& barrier_value) const;

  SafetyConfig config_;
};

} // namespace rsa::safety
