#include "runner/rollout_runner.hpp"

#include "controller/agent_controller.hpp"
#include "envs/forbidden_circle_env.hpp"
#include "policy/goal_seeking_policy.hpp"
#include "policy/hostile_policy.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace rsa::runner {

namespace {

// Decorrelates the world's noise stream from the controller's.
constexpr std::uint64_t kEnvSeedSalt = 0x9E3779B97F4A7C15ULL;

struct PendingClaim {
  semantics::Claim claim;
  bool truth = false;
};

} // namespace

const char* ToString(const PolicyKind kind) {
  switch (kind) {
  case PolicyKind::kGoalSeeking:
    return "goal";
  case PolicyKind::kHostile:
    return "hostile";
  }
  return "goal";
}

bool ParsePolicyKind(std::string_view raw, PolicyKind& kind, std::string& error) {
  if (raw == "goal") {
    kind = PolicyKind::kGoalSeeking;
    return true;
  }
  if (raw == "hostile") {
    kind = PolicyKind::kHostile;
    return true;
  }
  error = "invalid policy '" + std::string(raw) + "' (expected goal|hostile)";
  return false;
}

bool RolloutRunner::Run(RolloutSummary& summary, std::string& error) {
  summary = RolloutSummary{};
  if (options_.episodes == 0U) {
    error = "episodes must be > 0";
    return false;
  }

  config::SyncDerivedFields(config_);
  envs::ForbiddenCircleEnv env(config_.env, config_.seed ^ kEnvSeedSalt);
  const core::Vector goal = config_.env.goal;

  std::unique_ptr<controller::IPolicy> policy;
  policy::HostilePolicy* hostile = nullptr;
  if (options_.policy == PolicyKind::kHostile) {
    auto owned = std::make_unique<policy::HostilePolicy>(config_.env.obstacle_center);
    hostile = owned.get();
    policy = std::move(owned);
  } else {
    policy = std::make_unique<policy::GoalSeekingPolicy>(goal);
  }

  controller::AgentController agent(config_.controller, env.Barrier(), *policy);
  agent.SetLogger(logger_);
  agent.SetRecorder(recorder_);
  agent.SetRiskValueFunction([goal](const core::Vector& x) {
    return -(x - goal).norm();
  });
  if (config_.controller.query.enabled) {
    agent.SetOracle(&env);
    agent.SetQueryValueFunction([goal](const belief::ParticleBelief& belief) {
      return -(belief.Mean() - goal).norm();
    });
  }

  std::vector<double> returns;
  returns.reserve(options_.episodes);
  const core::Vector start_std =
      core::Vector::Constant(config_.env.obstacle_center.size(), config_.env.observation_noise);

  for (std::size_t episode = 0; episode < options_.episodes; ++episode) {
    core::Vector observation;
    if (!env.Reset(observation, error)) {
      return false;
    }
    if (!agent.Reset(observation, start_std, error)) {
      return false;
    }
    if (hostile != nullptr) {
      hostile->Reset();
    }
    if (recorder_ != nullptr) {
      recorder_->BeginEpisode(episode);
    }
    if (logger_ != nullptr) {
      logger_->SetEpisode(episode);
    }

    EpisodeResult result;
    result.episode = episode;
    std::vector<PendingClaim> pending;
    bool done = false;
    while (!done) {
      std::vector<semantics::Claim> claims;
      claims.reserve(pending.size());
      for (const PendingClaim& item : pending) {
        claims.push_back(item.claim);
      }

      const controller::StepResult step = agent.Step(observation, claims);
      if (step.status == controller::StepStatus::kInvalidInput) {
        error = "controller rejected step input: " + step.reason;
        return false;
      }
      if (options_.report_claim_outcomes) {
        for (const PendingClaim& item : pending) {
          if (!agent.ReportClaimOutcome(item.claim, item.truth, error)) {
            return false;
          }
        }
      }
      result.claims += pending.size();
      pending.clear();

      const controller::StepDiagnostics& d = step.diagnostics;
      result.filter_activations += d.filter_activated ? 1U : 0U;
      result.queries += d.query_triggered ? 1U : 0U;
      result.credal_steps += d.credal_active ? 1U : 0U;
      summary.numeric_degeneracy_steps += d.numeric_degeneracy ? 1U : 0U;
      if (step.status == controller::StepStatus::kSolverFailure) {
        ++result.emergency_stops;
      }

      envs::EnvStep env_step;
      if (!env.Step(step.action, env_step, error)) {
        return false;
      }
      ++result.steps;
      // Queries are paid for out of the step reward.
      result.total_return += env_step.reward - d.query_cost;
      result.violations += env_step.violation ? 1U : 0U;
      result.reached_goal = result.reached_goal || env_step.reached_goal;

      // Truth of a claim is fixed at emission time.
      for (semantics::Claim& claim : env_step.claims) {
        const bool truth = claim.region.contains(env.State());
        pending.push_back({.claim = std::move(claim), .truth = truth});
      }
      observation = env_step.observation;
      done = env_step.done;
    }

    if (logger_ != nullptr) {
      logger_->Debug("episode finished",
                     {{"return", core::logging::FormatField(result.total_return)},
                      {"steps", std::to_string(result.steps)},
                      {"violations", std::to_string(result.violations)}});
    }

    returns.push_back(result.total_return);
    summary.total_steps += result.steps;
    summary.violations += result.violations;
    summary.episodes_with_violation += result.violations > 0U ? 1U : 0U;
    summary.goals_reached += result.reached_goal ? 1U : 0U;
    summary.filter_activations += result.filter_activations;
    summary.queries += result.queries;
    summary.emergency_stops += result.emergency_stops;
    summary.claims += result.claims;
    summary.credal_steps += result.credal_steps;
    summary.per_episode.push_back(result);
  }

  if (logger_ != nullptr) {
    logger_->ClearEpisode();
  }
  summary.episodes = options_.episodes;
  summary.activation_rate = summary.total_steps == 0U
                                ? 0.0
                                : static_cast<double>(summary.filter_activations) /
                                      static_cast<double>(summary.total_steps);
  for (const auto& [source_id, trust] : agent.Trust().Sources()) {
    summary.source_reliability[source_id] = trust.Reliability();
  }
  return risk::SummarizeReturns(returns, options_.cvar_alphas, summary.returns, error);
}

} // namespace rsa::runner
