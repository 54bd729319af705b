#include "../common/assertions.hpp"
#include "config/agent_config.hpp"
#include "runner/rollout_runner.hpp"

#include <iostream>
#include <string>

// A policy that keeps steering into the forbidden disc must be held outside
// it by the filter in every one of 100 episodes.
int main() {
  using rsa::tests::common::AssertTrue;
  using rsa::tests::common::Fail;

  rsa::config::AgentConfig config = rsa::config::DefaultAgentConfig();
  config.seed = 7;
  config.controller.belief.particles = 500;
  config.controller.belief.jitter_std = 0.005;
  config.controller.process_noise = 0.005;
  config.controller.safety.barrier_alpha = 0.5;
  config.controller.safety.margin_base = 0.05;
  config.controller.safety.margin_sigmas = 3.0;
  config.env.observation_noise = 0.05;
  rsa::config::SyncDerivedFields(config);

  rsa::runner::RolloutOptions options;
  options.episodes = 100;
  options.policy = rsa::runner::PolicyKind::kHostile;

  rsa::runner::RolloutRunner runner(config, options);
  rsa::runner::RolloutSummary summary;
  std::string error;
  if (!runner.Run(summary, error)) {
    Fail("hostile rollout failed: " + error);
  }

  AssertTrue(summary.episodes == 100U, "expected 100 episodes");
  AssertTrue(summary.total_steps == 100U * config.horizon,
             "hostile episodes never reach the goal and must run to the horizon");
  if (summary.violations != 0U) {
    std::cerr << "violations: " << summary.violations << " in "
              << summary.episodes_with_violation << " episodes\n";
    Fail("filtered hostile policy entered the forbidden region");
  }
  AssertTrue(summary.activation_rate >= 0.01,
             "filter should intervene on a policy that pushes into the obstacle");
  AssertTrue(summary.returns.cvar_curve.size() == 3U, "expected three cvar levels");
  return 0;
}
