#pragma once

#include "belief/belief_tracker.hpp"
#include "controller/interfaces.hpp"
#include "controller/step_diagnostics.hpp"
#include "core/logging/logger.hpp"
#include "core/rng.hpp"
#include "credal/credal_set.hpp"
#include "query/query_engine.hpp"
#include "risk/risk_evaluator.hpp"
#include "safety/barrier.hpp"
#include "safety/safety_filter.hpp"
#include "semantics/claim.hpp"
#include "semantics/status_engine.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rsa::controller {

struct ControllerConfig {
  belief::BeliefConfig belief;
  credal::CredalConfig credal;

  semantics::StatusThresholds thresholds;
  semantics::CalibrationCosts calibration_costs;
  std::size_t min_calibration_samples = 20;
  // Retune thresholds automatically once enough outcomes were reported.
  bool auto_recalibrate = false;
  semantics::TrustPrior trust;

  double risk_alpha = 0.1;
  double discount = 0.98;

  query::QueryConfig query;
  safety::SafetyConfig safety;

  double dt = 0.1;
  double obs_noise = 0.1;
  double process_noise = 0.01;
  core::Vector initial_mean = core::MakeVector({0.0, 0.0});
  core::Vector initial_std = core::MakeVector({0.05, 0.05});

  std::uint64_t seed = 42;
};

enum class StepStatus {
  kOk,
  kSolverFailure,
  kInvalidInput,
};

const char* ToString(StepStatus status);

// Outcome of one Step().
//
// - kOk: `action` is the filtered action.
// - kSolverFailure: `action` is the exact zero vector, `reason` says why.
// - kInvalidInput: `action` is empty, nothing was mutated.
struct StepResult {
  StepStatus status = StepStatus::kInvalidInput;
  core::Vector action;
  std::string reason;
  StepDiagnostics diagnostics;
};

// Per-step decision cycle: predict, observe, absorb claims, assess claim
// statuses, maybe query, ask the policy, then filter for safety.
//
// The controller owns its RNG, belief, credal set, trust registry and status
// engine. Barrier and policy are borrowed and must outlive it; oracle,
// recorder and logger are optional.
class AgentController {
public:
  AgentController(const ControllerConfig& config, const safety::IBarrierFunction& barrier,
                  IPolicy& policy);

  void SetOracle(IObservationOracle* oracle) {
    oracle_ = oracle;
  }
  void SetRecorder(IDiagnosticsRecorder* recorder) {
    recorder_ = recorder;
  }
  void SetLogger(core::logging::Logger* logger) {
    logger_ = logger;
  }
  // Belief value used for the EVI query decision. Queries are skipped while
  // unset.
  void SetQueryValueFunction(query::BeliefValueFunction value_fn) {
    query_value_fn_ = std::move(value_fn);
  }
  // Per-state value whose CVaR is reported in diagnostics.
  void SetRiskValueFunction(belief::StateFunction value_fn) {
    risk_value_fn_ = std::move(value_fn);
  }

  // Re-initializes the belief around the configured initial mean. Trust and
  // calibration samples are kept.
  bool Reset(std::string& error);
  bool Reset(const core::Vector& mean, const core::Vector& std_dev, std::string& error);

  StepResult Step(const core::Vector& observation, const std::vector<semantics::Claim>& claims);

  // Feeds back whether a claim turned out true: updates the source's trust
  // and stores a calibration sample with the supports last seen for it.
  bool ReportClaimOutcome(const semantics::Claim& claim, bool claim_was_true, std::string& error);

  const belief::BeliefTracker& Belief() const {
    return tracker_;
  }
  const semantics::TrustRegistry& Trust() const {
    return trust_;
  }
  const semantics::StatusEngine& Status() const {
    return status_engine_;
  }
  const ControllerConfig& Config() const {
    return config_;
  }
  std::size_t StepIndex() const {
    return step_index_;
  }
  core::Rng& MutableRng() {
    return rng_;
  }

private:
  bool ValidateInputs(const core::Vector& observation, const std::vector<semantics::Claim>& claims,
                      std::string& error) const;
  bool AssessClaim(const semantics::Claim& claim, ClaimAssessment& assessment, std::string& error);
  void ResolveCredalSet(StepDiagnostics& diagnostics);
  void MaybeQuery(StepDiagnostics& diagnostics);
  BeliefView MakeView() const;
  double RobustMargin() const;
  void MaybeRecalibrate();
  void Emit(const StepDiagnostics& diagnostics);

  void LogInfo(std::string_view message, std::initializer_list<core::logging::LogFieldView> fields);
  void LogWarn(std::string_view message, std::initializer_list<core::logging::LogFieldView> fields);

  ControllerConfig config_;
  const safety::IBarrierFunction& barrier_;
  IPolicy& policy_;
  IObservationOracle* oracle_ = nullptr;
  IDiagnosticsRecorder* recorder_ = nullptr;
  core::logging::Logger* logger_ = nullptr;
  query::BeliefValueFunction query_value_fn_;
  belief::StateFunction risk_value_fn_;

  core::Rng rng_;
  belief::BeliefTracker tracker_;
  semantics::TrustRegistry trust_;
  semantics::StatusEngine status_engine_;
  risk::RiskEvaluator risk_;
  query::QueryDecisionEngine query_;
  safety::SafetyFilter filter_;

  std::optional<semantics::Claim> credal_origin_;
  std::map<std::string, ClaimAssessment> last_assessments_;
  core::Vector last_action_;
  std::size_t step_index_ = 0;
};

} // namespace rsa::controller
