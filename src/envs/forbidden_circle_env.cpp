#include "envs/forbidden_circle_env.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <string>
#include <utility>

namespace rsa::envs {

namespace {

constexpr double kStartRadiusMin = 0.5;
constexpr double kStartRadiusMax = 1.0;
constexpr std::size_t kMaxStartAttempts = 1000;

} // namespace

ForbiddenCircleEnv::ForbiddenCircleEnv(const EnvConfig& config, const std::uint64_t seed)
    : config_(config), barrier_(config.obstacle_center, config.obstacle_radius), rng_(seed) {}

bool ForbiddenCircleEnv::InObstacle(const core::Vector& x) const {
  return (x - config_.obstacle_center).norm() < config_.obstacle_radius;
}

bool ForbiddenCircleEnv::AtGoal(const core::Vector& x) const {
  return (x - config_.goal).norm() <= config_.goal_radius;
}

semantics::Region ForbiddenCircleEnv::GossipRegion() const {
  semantics::Region region = semantics::MakeHalfSpaceRegion(1U, config_.obstacle_center[1], true);
  region.name = "north";
  return region;
}

core::Vector ForbiddenCircleEnv::Observe(const double noise_std) {
  core::Vector observation = state_;
  for (Eigen::Index d = 0; d < observation.size(); ++d) {
    observation[d] += noise_std * rng_.Normal();
  }
  return observation;
}

bool ForbiddenCircleEnv::Reset(core::Vector& observation, std::string& error) {
  if (config_.obstacle_center.size() != 2 || config_.goal.size() != 2) {
    error = "forbidden circle env is two-dimensional";
    return false;
  }

  for (std::size_t attempt = 0; attempt < kMaxStartAttempts; ++attempt) {
    const double angle = 2.0 * std::numbers::pi * rng_.Uniform();
    const double radius = kStartRadiusMin + (kStartRadiusMax - kStartRadiusMin) * rng_.Uniform();
    state_ = core::MakeVector({radius * std::cos(angle), radius * std::sin(angle)});
    if (!InObstacle(state_)) {
      timestep_ = 0;
      gossip_count_ = 0;
      observation = Observe(config_.observation_noise);
      return true;
    }
  }
  error = "could not sample a start state outside the obstacle";
  return false;
}

bool ForbiddenCircleEnv::ResetTo(const core::Vector& state, core::Vector& observation,
                                 std::string& error) {
  if (state.size() != 2 || !state.allFinite()) {
    error = "start state must be a finite 2-D vector";
    return false;
  }
  state_ = state;
  timestep_ = 0;
  gossip_count_ = 0;
  observation = Observe(config_.observation_noise);
  return true;
}

bool ForbiddenCircleEnv::Step(const core::Vector& action, EnvStep& step, std::string& error) {
  if (state_.size() == 0) {
    error = "env step before reset";
    return false;
  }
  if (action.size() != state_.size() || !action.allFinite()) {
    error = "action must be a finite vector of dimension " + std::to_string(state_.size());
    return false;
  }

  step = EnvStep{};
  for (Eigen::Index i = 0; i < state_.size(); ++i) {
    const double clipped = std::clamp(action[i], -config_.max_action, config_.max_action);
    state_[i] += clipped * config_.dt;
    if (config_.process_noise > 0.0) {
      state_[i] += config_.process_noise * rng_.Normal();
    }
  }
  ++timestep_;

  step.reward = -(state_ - config_.goal).norm();
  if (AtGoal(state_)) {
    step.done = true;
    step.reached_goal = true;
    step.reward += config_.goal_bonus;
  }
  if (InObstacle(state_)) {
    step.violation = true;
    step.reward -= config_.violation_penalty;
  }
  if (timestep_ >= config_.horizon) {
    step.done = true;
  }

  step.timestep = timestep_;
  step.observation = Observe(config_.observation_noise);
  MaybeEmitGossip(step.claims);
  return true;
}

void ForbiddenCircleEnv::MaybeEmitGossip(std::vector<semantics::Claim>& claims) {
  if (!config_.gossip || rng_.Uniform() >= config_.gossip_probability) {
    return;
  }
  semantics::Claim claim;
  claim.id = "location_north_" + std::to_string(gossip_count_++);
  claim.source_id = "gossip";
  claim.value = semantics::BelnapValue::kContradictory;
  claim.region = GossipRegion();
  claims.push_back(std::move(claim));
}

bool ForbiddenCircleEnv::RequestObservation(const double noise_std, core::Vector& observation,
                                            std::string& error) {
  if (state_.size() == 0) {
    error = "observation requested before reset";
    return false;
  }
  if (!std::isfinite(noise_std) || noise_std <= 0.0) {
    error = "query noise must be a positive finite std";
    return false;
  }
  ++query_count_;
  observation = Observe(noise_std);
  return true;
}

} // namespace rsa::envs
