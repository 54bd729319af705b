#pragma once

#include "controller/interfaces.hpp"
#include "core/linalg.hpp"
#include "core/rng.hpp"
#include "safety/barrier.hpp"
#include "semantics/claim.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace rsa::envs {

struct EnvConfig {
  double obstacle_radius = 0.3;
  core::Vector obstacle_center = core::MakeVector({0.0, 0.0});
  core::Vector goal = core::MakeVector({0.8, 0.8});
  double goal_radius = 0.1;
  double observation_noise = 0.1;
  // Per-component clip applied to incoming actions.
  double max_action = 0.15;
  double dt = 0.1;
  // Std of additive Gaussian disturbance on the true state, 0 disables it.
  double process_noise = 0.0;
  std::size_t horizon = 50;

  double goal_bonus = 10.0;
  double violation_penalty = 10.0;

  // Gossip source: occasionally claims "agent is north of the obstacle" with
  // both truth and falsity support.
  bool gossip = false;
  double gossip_probability = 0.1;
};

struct EnvStep {
  core::Vector observation;
  double reward = 0.0;
  bool done = false;
  bool reached_goal = false;
  bool violation = false;
  std::size_t timestep = 0;
  // Claims emitted during this step, already addressed to the agent.
  std::vector<semantics::Claim> claims;
};

// 2-D single-integrator world with a forbidden disc and a goal disc.
//
// x+ = x + clip(u, -max_action, max_action) * dt. Reward is -|x - goal|, with
// +goal_bonus on reaching the goal (terminal) and -violation_penalty whenever
// the true state is strictly inside the disc. Episodes also end at `horizon`.
//
// Also serves as the low-noise observation oracle for query actions.
class ForbiddenCircleEnv final : public controller::IObservationOracle {
public:
  explicit ForbiddenCircleEnv(const EnvConfig& config, std::uint64_t seed = 42);

  // Samples a start state at radius U(0.5, 1.0) around the origin (outside
  // the disc) and returns the first noisy observation.
  bool Reset(core::Vector& observation, std::string& error);

  // Places the agent at a given state. Used by scripted scenarios.
  bool ResetTo(const core::Vector& state, core::Vector& observation, std::string& error);

  bool Step(const core::Vector& action, EnvStep& step, std::string& error);

  bool RequestObservation(double noise_std, core::Vector& observation,
                          std::string& error) override;

  const safety::CircularForbiddenRegion& Barrier() const {
    return barrier_;
  }
  const EnvConfig& Config() const {
    return config_;
  }
  const core::Vector& State() const {
    return state_;
  }
  std::size_t Timestep() const {
    return timestep_;
  }
  std::size_t QueryCount() const {
    return query_count_;
  }
  core::Rng& MutableRng() {
    return rng_;
  }

  bool InObstacle(const core::Vector& x) const;
  bool AtGoal(const core::Vector& x) const;

  // Region referenced by gossip claims: y > obstacle centre.
  semantics::Region GossipRegion() const;

private:
  core::Vector Observe(double noise_std);
  void MaybeEmitGossip(std::vector<semantics::Claim>& claims);

  EnvConfig config_;
  safety::CircularForbiddenRegion barrier_;
  core::Rng rng_;
  core::Vector state_;
  std::size_t timestep_ = 0;
  std::size_t gossip_count_ = 0;
  std::size_t query_count_ = 0;
};

} // namespace rsa::envs
