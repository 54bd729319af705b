#pragma once

#include "config/agent_config.hpp"
#include "controller/interfaces.hpp"
#include "core/logging/logger.hpp"
#include "risk/risk_evaluator.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace rsa::runner {

enum class PolicyKind {
  kGoalSeeking,
  kHostile,
};

const char* ToString(PolicyKind kind);
bool ParsePolicyKind(std::string_view raw, PolicyKind& kind, std::string& error);

struct RolloutOptions {
  std::size_t episodes = 10;
  PolicyKind policy = PolicyKind::kGoalSeeking;
  // Feed ground truth for every delivered claim back into trust/calibration.
  bool report_claim_outcomes = true;
  std::vector<double> cvar_alphas = {0.05, 0.1, 0.25};
};

struct EpisodeResult {
  std::size_t episode = 0;
  double total_return = 0.0;
  std::size_t steps = 0;
  std::size_t violations = 0;
  bool reached_goal = false;
  std::size_t filter_activations = 0;
  std::size_t queries = 0;
  std::size_t emergency_stops = 0;
  std::size_t claims = 0;
  std::size_t credal_steps = 0;
};

struct RolloutSummary {
  std::size_t episodes = 0;
  std::size_t total_steps = 0;
  std::size_t violations = 0;
  std::size_t episodes_with_violation = 0;
  std::size_t goals_reached = 0;
  std::size_t filter_activations = 0;
  double activation_rate = 0.0;
  std::size_t queries = 0;
  std::size_t emergency_stops = 0;
  std::size_t claims = 0;
  std::size_t credal_steps = 0;
  std::size_t numeric_degeneracy_steps = 0;
  risk::ReturnSummary returns;
  // Final Beta reliability per claim source.
  std::map<std::string, double> source_reliability;
  std::vector<EpisodeResult> per_episode;
};

// Drives ForbiddenCircleEnv + AgentController for N episodes with one
// controller instance, so trust and calibration persist across episodes.
//
// Contract:
// - Returns false only on setup failures or invalid controller input.
// - Safety violations and emergency stops are counted, not treated as errors.
class RolloutRunner {
public:
  RolloutRunner(const config::AgentConfig& config, const RolloutOptions& options)
      : config_(config), options_(options) {}

  void SetRecorder(controller::IDiagnosticsRecorder* recorder) {
    recorder_ = recorder;
  }
  void SetLogger(core::logging::Logger* logger) {
    logger_ = logger;
  }

  bool Run(RolloutSummary& summary, std::string& error);

private:
  config::AgentConfig config_;
  RolloutOptions options_;
  controller::IDiagnosticsRecorder* recorder_ = nullptr;
  core::logging::Logger* logger_ = nullptr;
};

} // namespace rsa::runner
