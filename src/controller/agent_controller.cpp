#include "controller/agent_controller.hpp"

#include <algorithm>
#include <cmath>

namespace rsa::controller {

namespace {

using core::errors::StepErrorKind;
using core::logging::FormatField;

// Largest component, floored at zero.
double MaxComponent(const core::Vector& values) {
  return values.size() == 0 ? 0.0 : std::max(0.0, values.maxCoeff());
}

} // namespace

const char* ToString(const StepStatus status) {
  switch (status) {
  case StepStatus::kOk:
    return "ok";
  case StepStatus::kSolverFailure:
    return "solver_failure";
  case StepStatus::kInvalidInput:
    return "invalid_input";
  }
  return "invalid_input";
}

AgentController::AgentController(const ControllerConfig& config,
                                 const safety::IBarrierFunction& barrier, IPolicy& policy)
    : config_(config),
      barrier_(barrier),
      policy_(policy),
      rng_(config.seed),
      tracker_(config.belief, config.credal),
      trust_(config.trust),
      status_engine_(config.thresholds, config.calibration_costs, config.min_calibration_samples),
      risk_(config.risk_alpha, config.discount),
      query_(config.query),
      filter_(config.safety) {}

bool AgentController::Reset(std::string& error) {
  return Reset(config_.initial_mean, config_.initial_std, error);
}

bool AgentController::Reset(const core::Vector& mean, const core::Vector& std_dev,
                            std::string& error) {
  if (core::Dim(mean) != barrier_.Dimension()) {
    error = "reset mean dimension " + std::to_string(mean.size()) +
            " does not match barrier dimension " + std::to_string(barrier_.Dimension());
    return false;
  }
  if (!tracker_.Reset(mean, std_dev, rng_, error)) {
    return false;
  }
  credal_origin_.reset();
  last_assessments_.clear();
  last_action_.resize(0);
  step_index_ = 0;
  return true;
}

bool AgentController::ValidateInputs(const core::Vector& observation,
                                     const std::vector<semantics::Claim>& claims,
                                     std::string& error) const {
  if (!tracker_.ValidateObservation(observation, config_.obs_noise, error)) {
    return false;
  }
  for (const semantics::Claim& claim : claims) {
    if (!semantics::ValidateClaim(claim, error)) {
      return false;
    }
  }
  return true;
}

bool AgentController::AssessClaim(const semantics::Claim& claim, ClaimAssessment& assessment,
                                  std::string& error) {
  assessment.claim_id = claim.id;
  assessment.source_id = claim.source_id;
  assessment.reported = claim.value;
  if (!tracker_.Support(claim.region, assessment.support, assessment.counter_support, error)) {
    return false;
  }
  if (!status_engine_.Assess(assessment.support, assessment.counter_support, assessment.assessed,
                             error)) {
    return false;
  }
  last_assessments_[claim.id] = assessment;
  return true;
}

void AgentController::ResolveCredalSet(StepDiagnostics& diagnostics) {
  if (!tracker_.Credal().Active() || !credal_origin_.has_value()) {
    return;
  }

  ClaimAssessment origin;
  std::string error;
  if (!AssessClaim(*credal_origin_, origin, error)) {
    LogWarn("credal origin claim could not be re-assessed",
            {{"claim_id", credal_origin_->id}, {"error", error}});
    return;
  }
  if (origin.assessed == semantics::BelnapValue::kContradictory) {
    return;
  }

  LogInfo("credal set resolved",
          {{"claim_id", credal_origin_->id},
           {"status", semantics::ToString(origin.assessed)},
           {"step", std::to_string(diagnostics.step_index)}});
  tracker_.MutableCredal().Discard();
  credal_origin_.reset();
}

void AgentController::MaybeQuery(StepDiagnostics& diagnostics) {
  if (!config_.query.enabled || !query_value_fn_ || oracle_ == nullptr) {
    return;
  }

  const double query_noise = config_.obs_noise * config_.query.noise_scale;
  std::string error;
  double evi = 0.0;
  if (!query_.ExpectedValueOfInformation(tracker_.Belief(), query_value_fn_, query_noise,
                                         config_.query.samples, rng_, evi, error)) {
    LogWarn("evi evaluation failed", {{"error", error}});
    return;
  }
  diagnostics.evi = evi;

  const bool fire = query_.ShouldQuery(evi);
  if (logger_ != nullptr) {
    logger_->Debug("query decision", {{"evi", FormatField(evi)},
                                      {"delta_star", FormatField(config_.query.delta_star)},
                                      {"query", fire ? "true" : "false"}});
  }
  if (!fire) {
    return;
  }

  core::Vector observation;
  if (!oracle_->RequestObservation(query_noise, observation, error)) {
    LogWarn("query observation unavailable", {{"error", error}});
    return;
  }

  diagnostics.entropy_before_query = tracker_.Entropy();
  belief::UpdateReport report;
  if (!tracker_.UpdateObservation(observation, query_noise, report, error)) {
    LogWarn("query observation rejected", {{"error", error}});
    return;
  }
  diagnostics.query_triggered = true;
  diagnostics.entropy_after_query = tracker_.Entropy();
  diagnostics.query_cost = config_.query.cost;
  diagnostics.numeric_degeneracy = diagnostics.numeric_degeneracy || report.numeric_degeneracy;
  if (tracker_.ResampleIfNeeded(rng_)) {
    diagnostics.resampled = true;
  }
}

BeliefView AgentController::MakeView() const {
  BeliefView view;
  view.belief = &tracker_.Belief();
  view.mean = tracker_.Mean();
  view.std_dev = tracker_.Belief().StdDev();
  if (tracker_.Credal().Active()) {
    std::string error;
    core::Vector lower;
    if (tracker_.Credal().Set().LowerMean(lower, error)) {
      view.credal = &tracker_.Credal().Set();
      view.credal_lower_mean = std::move(lower);
    }
  }
  return view;
}

double AgentController::RobustMargin() const {
  double sigma = MaxComponent(tracker_.Belief().StdDev());
  if (tracker_.Credal().Active()) {
    core::Vector variance;
    std::string error;
    if (tracker_.Credal().Set().UpperVariance(variance, error)) {
      sigma = std::max(sigma, std::sqrt(MaxComponent(variance)));
    }
  }
  return config_.safety.margin_base + config_.safety.margin_sigmas * sigma;
}

StepResult AgentController::Step(const core::Vector& observation,
                                 const std::vector<semantics::Claim>& claims) {
  StepResult result;
  StepDiagnostics& diagnostics = result.diagnostics;
  diagnostics.step_index = step_index_;

  std::string error;
  if (!ValidateInputs(observation, claims, error)) {
    result.status = StepStatus::kInvalidInput;
    result.reason = error;
    diagnostics.error_kind = StepErrorKind::kInvalidInput;
    diagnostics.error_message = error;
    LogWarn("step rejected", {{"step", std::to_string(step_index_)}, {"error", error}});
    return result;
  }

  if (last_action_.size() != 0 &&
      !tracker_.Predict(last_action_ * config_.dt, config_.process_noise, rng_,
                        error)) {
    LogWarn("motion prediction skipped", {{"step", std::to_string(step_index_)}, {"error", error}});
  }
  belief::UpdateReport report;
  if (!tracker_.UpdateObservation(observation, config_.obs_noise, report, error)) {
    result.status = StepStatus::kInvalidInput;
    result.reason = error;
    diagnostics.error_kind = StepErrorKind::kInvalidInput;
    diagnostics.error_message = error;
    return result;
  }
  diagnostics.resampled = tracker_.ResampleIfNeeded(rng_);

  for (const semantics::Claim& claim : claims) {
    semantics::SourceTrust& trust = trust_.Get(claim.source_id);
    belief::UpdateReport claim_report;
    if (!tracker_.ApplyClaim(claim, trust, claim_report, error)) {
      LogWarn("claim not applied", {{"claim_id", claim.id}, {"error", error}});
      continue;
    }
    report.numeric_degeneracy = report.numeric_degeneracy || claim_report.numeric_degeneracy;
    if (claim_report.credal_created) {
      credal_origin_ = claim;
      LogInfo("credal set created",
              {{"claim_id", claim.id},
               {"source_id", claim.source_id},
               {"members", std::to_string(tracker_.Credal().Set().Size())},
               {"log_odds", FormatField(trust.LogOdds())}});
    }
  }

  for (const semantics::Claim& claim : claims) {
    ClaimAssessment assessment;
    if (!AssessClaim(claim, assessment, error)) {
      LogWarn("claim not assessed", {{"claim_id", claim.id}, {"error", error}});
      continue;
    }
    diagnostics.claims.push_back(assessment);
  }
  ResolveCredalSet(diagnostics);

  diagnostics.numeric_degeneracy = report.numeric_degeneracy;
  MaybeQuery(diagnostics);

  if (diagnostics.numeric_degeneracy) {
    diagnostics.error_kind = StepErrorKind::kNumericDegeneracy;
    diagnostics.error_message = "weights degenerated and were reset to uniform";
    LogWarn("numeric degeneracy", {{"step", std::to_string(step_index_)}});
  }

  const BeliefView view = MakeView();
  diagnostics.belief_mean = view.mean;
  diagnostics.ess = tracker_.Ess();
  diagnostics.entropy = tracker_.Entropy();
  diagnostics.credal_active = view.credal != nullptr;
  diagnostics.credal_size = view.credal != nullptr ? view.credal->Size() : 0U;
  diagnostics.credal_lower_mean = view.credal_lower_mean;

  if (risk_value_fn_) {
    bool evaluated = false;
    if (view.credal != nullptr) {
      evaluated = risk_.EvaluateCredal(*view.credal, risk_value_fn_, diagnostics.belief_cvar, error);
    } else {
      evaluated =
          risk_.EvaluateBelief(tracker_.Belief(), risk_value_fn_, diagnostics.belief_cvar, error);
    }
    diagnostics.risk_evaluated = evaluated;
    if (!evaluated) {
      LogWarn("risk evaluation failed", {{"error", error}});
    }
  }

  diagnostics.nominal_action = policy_.SelectAction(view);

  const double margin = RobustMargin();
  const safety::TightenedBarrier tightened(barrier_, margin);
  const core::Vector& estimate = view.Estimate();
  const safety::FilterResult filtered = filter_.Filter(tightened, estimate, diagnostics.nominal_action);

  diagnostics.safety_margin = margin;
  diagnostics.barrier_value = barrier_.Evaluate(estimate);
  diagnostics.filter_outcome = filtered.outcome;
  diagnostics.filter_activated = filtered.activated;
  diagnostics.slack = filtered.slack;
  diagnostics.solver_iterations = filtered.iterations;
  diagnostics.action = filtered.action;

  if (filtered.outcome == safety::FilterOutcome::kEmergencyStop) {
    result.status = StepStatus::kSolverFailure;
    result.reason = filtered.reason;
    diagnostics.error_kind = StepErrorKind::kSolverFailure;
    diagnostics.error_message = filtered.reason;
    if (logger_ != nullptr) {
      logger_->Error("emergency stop", {{"step", std::to_string(step_index_)},
                                        {"reason", filtered.reason}});
    }
  } else {
    result.status = StepStatus::kOk;
    if (filtered.slack_active) {
      LogInfo("cbf slack active", {{"step", std::to_string(step_index_)},
                                   {"slack", FormatField(filtered.slack)},
                                   {"barrier", FormatField(diagnostics.barrier_value)}});
    }
  }
  result.action = filtered.action;
  last_action_ = filtered.action;

  Emit(diagnostics);
  ++step_index_;
  return result;
}

bool AgentController::ReportClaimOutcome(const semantics::Claim& claim, const bool claim_was_true,
                                         std::string& error) {
  if (!semantics::ValidateClaim(claim, error)) {
    return false;
  }

  ClaimAssessment assessment;
  const auto it = last_assessments_.find(claim.id);
  if (it != last_assessments_.end()) {
    assessment = it->second;
  } else if (!AssessClaim(claim, assessment, error)) {
    return false;
  }

  // A source is right when its reported value agrees with what happened.
  bool source_correct = false;
  switch (claim.value) {
  case semantics::BelnapValue::kTrue:
    source_correct = claim_was_true;
    break;
  case semantics::BelnapValue::kFalse:
    source_correct = !claim_was_true;
    break;
  case semantics::BelnapValue::kUnknown:
  case semantics::BelnapValue::kContradictory:
    source_correct = false;
    break;
  }
  trust_.Get(claim.source_id).Update(source_correct);

  status_engine_.AddSample(semantics::CalibrationSample{.support = assessment.support,
                                                        .counter_support = assessment.counter_support,
                                                        .outcome = claim_was_true});
  MaybeRecalibrate();
  return true;
}

void AgentController::MaybeRecalibrate() {
  if (!config_.auto_recalibrate ||
      status_engine_.SampleCount() < config_.min_calibration_samples) {
    return;
  }
  semantics::RecalibrationResult recalibration;
  std::string error;
  if (!status_engine_.Recalibrate(recalibration, error)) {
    LogWarn("recalibration skipped", {{"error", error}});
    return;
  }
  LogInfo("status thresholds recalibrated",
          {{"accept", FormatField(recalibration.thresholds.accept)},
           {"reject", FormatField(recalibration.thresholds.reject)},
           {"ece_before", FormatField(recalibration.ece_before)},
           {"ece_after", FormatField(recalibration.ece_after)}});
  status_engine_.ClearSamples();
}

void AgentController::Emit(const StepDiagnostics& diagnostics) {
  if (recorder_ == nullptr) {
    return;
  }
  std::string error;
  if (!recorder_->Record(diagnostics, error)) {
    LogWarn("diagnostics not recorded", {{"error", error}});
  }
}

void AgentController::LogInfo(std::string_view message,
                              std::initializer_list<core::logging::LogFieldView> fields) {
  if (logger_ != nullptr) {
    logger_->Info(message, fields);
  }
}

void AgentController::LogWarn(std::string_view message,
                              std::initializer_list<core::logging::LogFieldView> fields) {
  if (logger_ != nullptr) {
    logger_->Warn(message, fields);
  }
}

} // namespace rsa::controller
