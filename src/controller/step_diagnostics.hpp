#pragma once

#include "core/errors/step_error.hpp"
#include "core/linalg.hpp"
#include "safety/safety_filter.hpp"
#include "semantics/belnap.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace rsa::controller {

struct ClaimAssessment {
  std::string claim_id;
  std::string source_id;
  semantics::BelnapValue reported = semantics::BelnapValue::kUnknown;
  semantics::BelnapValue assessed = semantics::BelnapValue::kUnknown;
  double support = 0.0;
  double counter_support = 0.0;
};

// Read-only record of one controller step, handed to the recorder.
struct StepDiagnostics {
  std::size_t step_index = 0;

  core::Vector belief_mean;
  double ess = 0.0;
  double entropy = 0.0;
  bool resampled = false;
  bool numeric_degeneracy = false;
  // Only populated when a risk value function is configured.
  bool risk_evaluated = false;
  double belief_cvar = 0.0;

  std::vector<ClaimAssessment> claims;
  bool credal_active = false;
  std::size_t credal_size = 0;
  core::Vector credal_lower_mean;

  bool query_triggered = false;
  double evi = 0.0;
  double entropy_before_query = 0.0;
  double entropy_after_query = 0.0;
  double query_cost = 0.0;

  core::Vector nominal_action;
  core::Vector action;
  safety::FilterOutcome filter_outcome = safety::FilterOutcome::kAccepted;
  bool filter_activated = false;
  double slack = 0.0;
  std::size_t solver_iterations = 0;
  double safety_margin = 0.0;
  double barrier_value = 0.0;

  core::errors::StepErrorKind error_kind = core::errors::StepErrorKind::kNone;
  std::string error_message;
};

} // namespace rsa::controller
