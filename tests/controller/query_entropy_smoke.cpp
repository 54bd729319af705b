#include "../common/assertions.hpp"
#include "controller/agent_controller.hpp"
#include "envs/forbidden_circle_env.hpp"
#include "policy/goal_seeking_policy.hpp"
#include "query/query_engine.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

using rsa::core::MakeVector;
using rsa::tests::common::AssertTrue;
using rsa::tests::common::Fail;

namespace {

constexpr int kTrials = 20;

struct TrialStats {
  std::size_t queries = 0;
  double mean_reduction = 0.0;
  // Mean distance of the post-query belief mean to the true state.
  double mean_error = 0.0;
  double max_abs_evi = 0.0;
};

// One step from a broad prior per trial. Every fired query must shrink the
// belief entropy and charge the configured cost.
TrialStats RunTrials(const rsa::query::BeliefValueFunction& value_fn, const double delta_star) {
  rsa::envs::EnvConfig env_config;
  env_config.observation_noise = 0.1;
  rsa::envs::ForbiddenCircleEnv env(env_config, 2024);
  rsa::policy::GoalSeekingPolicy policy(env_config.goal);

  rsa::controller::ControllerConfig config;
  config.belief.particles = 1000;
  config.obs_noise = env_config.observation_noise;
  config.query.enabled = true;
  config.query.noise_scale = 0.2;
  config.query.delta_star = delta_star;
  config.seed = 11;

  rsa::controller::AgentController agent(config, env.Barrier(), policy);
  agent.SetOracle(&env);
  agent.SetQueryValueFunction(value_fn);

  const std::vector<rsa::core::Vector> starts = {
      MakeVector({0.6, 0.2}), MakeVector({-0.5, 0.5}), MakeVector({0.1, -0.7}),
      MakeVector({-0.6, -0.4})};
  TrialStats stats;
  for (int trial = 0; trial < kTrials; ++trial) {
    const rsa::core::Vector& start = starts[static_cast<std::size_t>(trial) % starts.size()];
    std::string error;
    rsa::core::Vector observation;
    if (!env.ResetTo(start, observation, error)) {
      Fail("env reset failed: " + error);
    }
    if (!agent.Reset(start, MakeVector({0.3, 0.3}), error)) {
      Fail("agent reset failed: " + error);
    }

    const rsa::controller::StepResult step = agent.Step(observation, {});
    AssertTrue(step.status == rsa::controller::StepStatus::kOk, "step should succeed");
    const rsa::controller::StepDiagnostics& d = step.diagnostics;
    AssertTrue(std::isfinite(d.evi), "evi must be finite");
    stats.max_abs_evi = std::max(stats.max_abs_evi, std::abs(d.evi));
    if (!d.query_triggered) {
      AssertTrue(d.evi < delta_star, "query skipped at or above delta_star");
      AssertTrue(d.query_cost == 0.0, "a skipped query must not be charged");
      continue;
    }

    ++stats.queries;
    AssertTrue(d.evi >= delta_star, "query fired below delta_star");
    AssertTrue(d.entropy_before_query > 0.0, "entropy before query must be positive");
    AssertTrue(d.entropy_after_query < d.entropy_before_query,
               "query observation must reduce entropy");
    AssertTrue(d.query_cost == config.query.cost, "query cost must be charged");
    stats.mean_reduction +=
        (d.entropy_before_query - d.entropy_after_query) / d.entropy_before_query;
    stats.mean_error += (d.belief_mean - start).norm();
  }

  AssertTrue(env.QueryCount() == stats.queries, "oracle calls must match fired queries");
  if (stats.queries > 0U) {
    stats.mean_reduction /= static_cast<double>(stats.queries);
    stats.mean_error /= static_cast<double>(stats.queries);
  }
  return stats;
}

} // namespace

int main() {
  // Entropy-seeking value: a broad belief makes every query worth it.
  const TrialStats entropy = RunTrials(
      [](const rsa::belief::ParticleBelief& belief) { return -belief.Entropy(); }, 0.5);
  std::cout << "entropy value: mean entropy reduction " << entropy.mean_reduction << '\n';
  AssertTrue(entropy.queries == static_cast<std::size_t>(kTrials),
             "broad belief should trigger a query every trial");
  AssertTrue(entropy.mean_reduction >= 0.2, "queries should remove at least 20% of the entropy");

  // The rollout runner scores beliefs by distance of the mean to the goal.
  const rsa::core::Vector goal = rsa::envs::EnvConfig{}.goal;
  const rsa::query::BeliefValueFunction goal_distance =
      [goal](const rsa::belief::ParticleBelief& belief) { return -(belief.Mean() - goal).norm(); };

  // The value is concave in the mean and the posterior mean is a martingale,
  // so EVI stays near zero and the default threshold never fires.
  const TrialStats idle = RunTrials(goal_distance, rsa::query::QueryConfig{}.delta_star);
  std::cout << "goal value: max |evi| " << idle.max_abs_evi << '\n';
  AssertTrue(idle.queries == 0U, "goal-distance EVI should stay below the default threshold");
  AssertTrue(idle.max_abs_evi <= 0.1, "goal-distance EVI should be close to zero");

  // Forced queries still sharpen the belief around the true state.
  const TrialStats forced = RunTrials(goal_distance, -1.0);
  std::cout << "goal value: mean entropy reduction " << forced.mean_reduction
            << ", mean error " << forced.mean_error << '\n';
  AssertTrue(forced.queries == static_cast<std::size_t>(kTrials),
             "a negative threshold should query every trial");
  AssertTrue(forced.mean_reduction >= 0.2, "queries should remove at least 20% of the entropy");
  AssertTrue(forced.mean_error <= 0.06, "queried beliefs should centre on the true state");
  return 0;
}
