#include "core/linalg.hpp"
#include "envs/forbidden_circle_env.hpp"

#include <catch2/catch.hpp>

#include <string>

using rsa::core::MakeVector;

namespace {

rsa::envs::EnvConfig QuietConfig() {
  rsa::envs::EnvConfig config;
  config.observation_noise = 1e-6;
  return config;
}

} // namespace

TEST_CASE("Reset starts outside the obstacle", "[envs]") {
  rsa::envs::ForbiddenCircleEnv env(rsa::envs::EnvConfig{}, 3);
  std::string error;
  for (int i = 0; i < 50; ++i) {
    rsa::core::Vector observation;
    REQUIRE(env.Reset(observation, error));
    const double radius = env.State().norm();
    REQUIRE(radius >= 0.5);
    REQUIRE(radius <= 1.0);
    REQUIRE_FALSE(env.InObstacle(env.State()));
    REQUIRE(env.Timestep() == 0U);
    REQUIRE(observation.size() == 2);
  }
}

TEST_CASE("Actions are clipped per component and integrated", "[envs]") {
  rsa::envs::ForbiddenCircleEnv env(QuietConfig(), 5);
  std::string error;
  rsa::core::Vector observation;
  REQUIRE(env.ResetTo(MakeVector({0.5, -0.5}), observation, error));

  rsa::envs::EnvStep step;
  REQUIRE(env.Step(MakeVector({1.0, -0.05}), step, error));
  REQUIRE(env.State()[0] == Catch::Detail::Approx(0.515));
  REQUIRE(env.State()[1] == Catch::Detail::Approx(-0.505));
  REQUIRE(step.timestep == 1U);
  REQUIRE_FALSE(step.done);
  REQUIRE_FALSE(step.violation);
  REQUIRE(step.reward == Catch::Detail::Approx(-(env.State() - env.Config().goal).norm()));
  REQUIRE(step.observation[0] == Catch::Detail::Approx(0.515).margin(1e-4));
}

TEST_CASE("Entering the obstacle is penalized without ending the episode", "[envs]") {
  rsa::envs::ForbiddenCircleEnv env(QuietConfig(), 7);
  std::string error;
  rsa::core::Vector observation;
  REQUIRE(env.ResetTo(MakeVector({0.305, 0.0}), observation, error));

  rsa::envs::EnvStep step;
  REQUIRE(env.Step(MakeVector({-0.15, 0.0}), step, error));
  REQUIRE(step.violation);
  REQUIRE_FALSE(step.done);
  const double distance = (env.State() - env.Config().goal).norm();
  REQUIRE(step.reward == Catch::Detail::Approx(-distance - 10.0));
}

TEST_CASE("Reaching the goal ends the episode with a bonus", "[envs]") {
  rsa::envs::ForbiddenCircleEnv env(QuietConfig(), 9);
  std::string error;
  rsa::core::Vector observation;
  REQUIRE(env.ResetTo(MakeVector({0.8, 0.69}), observation, error));

  rsa::envs::EnvStep step;
  REQUIRE(env.Step(MakeVector({0.0, 0.15}), step, error));
  REQUIRE(step.done);
  REQUIRE(step.reached_goal);
  REQUIRE(step.reward > 9.0);
}

TEST_CASE("Episodes end at the horizon", "[envs]") {
  rsa::envs::EnvConfig config = QuietConfig();
  config.horizon = 3;
  rsa::envs::ForbiddenCircleEnv env(config, 11);
  std::string error;
  rsa::core::Vector observation;
  REQUIRE(env.ResetTo(MakeVector({-0.8, -0.8}), observation, error));

  rsa::envs::EnvStep step;
  for (int i = 0; i < 3; ++i) {
    REQUIRE(env.Step(MakeVector({0.0, 0.0}), step, error));
  }
  REQUIRE(step.done);
  REQUIRE_FALSE(step.reached_goal);
}

TEST_CASE("Malformed actions and steps before reset fail", "[envs]") {
  rsa::envs::ForbiddenCircleEnv env(rsa::envs::EnvConfig{}, 13);
  std::string error;
  rsa::envs::EnvStep step;
  REQUIRE_FALSE(env.Step(MakeVector({0.0, 0.0}), step, error));

  rsa::core::Vector observation;
  REQUIRE(env.ResetTo(MakeVector({0.5, 0.5}), observation, error));
  REQUIRE_FALSE(env.Step(MakeVector({0.0}), step, error));
  REQUIRE_FALSE(env.ResetTo(MakeVector({0.5}), observation, error));
}

TEST_CASE("Gossip claims are contradictory statements about the north side", "[envs]") {
  rsa::envs::EnvConfig config = QuietConfig();
  config.gossip = true;
  config.gossip_probability = 1.0;
  rsa::envs::ForbiddenCircleEnv env(config, 17);
  std::string error;
  rsa::core::Vector observation;
  REQUIRE(env.ResetTo(MakeVector({0.5, -0.5}), observation, error));

  rsa::envs::EnvStep step;
  REQUIRE(env.Step(MakeVector({0.0, 0.0}), step, error));
  REQUIRE(step.claims.size() == 1U);
  const rsa::semantics::Claim& claim = step.claims.front();
  REQUIRE(claim.id == "location_north_0");
  REQUIRE(claim.source_id == "gossip");
  REQUIRE(claim.value == rsa::semantics::BelnapValue::kContradictory);
  REQUIRE(claim.region.contains(MakeVector({0.0, 0.4})));
  REQUIRE_FALSE(claim.region.contains(env.State()));

  REQUIRE(env.Step(MakeVector({0.0, 0.0}), step, error));
  REQUIRE(step.claims.front().id == "location_north_1");
}

TEST_CASE("Query observations use the requested noise", "[envs]") {
  rsa::envs::ForbiddenCircleEnv env(rsa::envs::EnvConfig{}, 19);
  std::string error;
  rsa::core::Vector observation;
  REQUIRE_FALSE(env.RequestObservation(0.01, observation, error));

  REQUIRE(env.ResetTo(MakeVector({0.6, 0.2}), observation, error));
  REQUIRE(env.RequestObservation(1e-9, observation, error));
  REQUIRE(observation[0] == Catch::Detail::Approx(0.6).margin(1e-6));
  REQUIRE(env.QueryCount() == 1U);
  REQUIRE_FALSE(env.RequestObservation(0.0, observation, error));
  REQUIRE(env.QueryCount() == 1U);
}
