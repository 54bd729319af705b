#include "config/agent_config.hpp"
#include "config/validator.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <cmath>
#include <string>

using rsa::core::MakeVector;

namespace {

bool HasIssue(const rsa::config::ValidationReport& report, const std::string& path) {
  return std::any_of(report.issues.begin(), report.issues.end(),
                     [&path](const rsa::config::ValidationIssue& issue) {
                       return issue.path == path;
                     });
}

rsa::config::ValidationReport ValidateText(const std::string& text) {
  rsa::config::ValidationReport report;
  std::string error;
  if (!rsa::config::ValidateAgentConfigText(text, report, error)) {
    FAIL(error);
  }
  return report;
}

} // namespace

TEST_CASE("Defaults are valid and synchronized", "[config]") {
  const rsa::config::AgentConfig config = rsa::config::DefaultAgentConfig();
  REQUIRE_FALSE(config.controller.query.enabled);
  REQUIRE(config.controller.seed == config.seed);
  REQUIRE(config.controller.safety.max_action == config.env.max_action);
  REQUIRE(config.controller.obs_noise == config.env.observation_noise);
  REQUIRE(config.env.horizon == config.horizon);

  rsa::config::ValidationReport report;
  rsa::config::ValidateAgentConfig(config, report);
  REQUIRE(report.valid);
  REQUIRE(report.issues.empty());
}

TEST_CASE("An empty object parses to the defaults", "[config]") {
  rsa::config::AgentConfig config;
  std::string error;
  REQUIRE(rsa::config::ParseAgentConfigText("{}", config, error));
  REQUIRE(config.seed == 42U);
  REQUIRE(config.controller.belief.particles == 5000U);
  REQUIRE(std::isinf(config.controller.safety.max_slack));
}

TEST_CASE("Overrides reach the controller and the environment", "[config]") {
  const std::string text = R"({
    "seed": 7,
    "horizon": 80,
    "belief": {"particles": 300, "resample_threshold": 0.4, "initial_std": 0.2},
    "semantics": {"accept_threshold": 0.75, "reject_threshold": 0.25},
    "credal": {"members": 3, "placement": "endpoint_clustered", "forgetting": 0.9},
    "risk": {"alpha": 0.2},
    "query": {"enabled": true, "delta_star": 0.05},
    "safety": {"max_slack": 0.5, "qp_max_iter": 80, "margin_sigmas": 2.0},
    "motion": {"dt": 0.2},
    "env": {"observation_noise": 0.05, "max_action": 0.2, "gossip": true}
  })";
  rsa::config::AgentConfig config;
  std::string error;
  REQUIRE(rsa::config::ParseAgentConfigText(text, config, error));

  const rsa::controller::ControllerConfig& c = config.controller;
  REQUIRE(config.seed == 7U);
  REQUIRE(c.seed == 7U);
  REQUIRE(config.env.horizon == 80U);
  REQUIRE(c.belief.particles == 300U);
  REQUIRE(c.belief.resample_fraction == Catch::Detail::Approx(0.4));
  REQUIRE(c.initial_std == MakeVector({0.2, 0.2}));
  REQUIRE(c.thresholds.accept == Catch::Detail::Approx(0.75));
  REQUIRE(c.credal.members == 3U);
  REQUIRE(c.credal.placement == rsa::credal::PlacementPolicy::kEndpointClustered);
  REQUIRE(c.trust.forgetting == Catch::Detail::Approx(0.9));
  REQUIRE(c.risk_alpha == Catch::Detail::Approx(0.2));
  REQUIRE(c.query.enabled);
  REQUIRE(c.safety.max_slack == Catch::Detail::Approx(0.5));
  REQUIRE(c.safety.max_iterations == 80U);
  REQUIRE(config.env.dt == Catch::Detail::Approx(0.2));
  REQUIRE(c.obs_noise == Catch::Detail::Approx(0.05));
  REQUIRE(c.safety.max_action == Catch::Detail::Approx(0.2));
  REQUIRE(config.env.gossip);
}

TEST_CASE("A null slack bound keeps the constraint soft", "[config]") {
  rsa::config::AgentConfig config;
  std::string error;
  REQUIRE(rsa::config::ParseAgentConfigText(R"({"safety": {"max_slack": null}})", config, error));
  REQUIRE(std::isinf(config.controller.safety.max_slack));
}

TEST_CASE("Type errors name the offending field", "[config]") {
  rsa::config::AgentConfig config;
  std::string error;
  REQUIRE_FALSE(
      rsa::config::ParseAgentConfigText(R"({"belief": {"particles": "many"}})", config, error));
  REQUIRE(error.find("belief.particles") != std::string::npos);

  REQUIRE_FALSE(rsa::config::ParseAgentConfigText(R"({"seed": -1})", config, error));
  REQUIRE(error.find("seed") != std::string::npos);

  REQUIRE_FALSE(rsa::config::ParseAgentConfigText(R"({"safety": 3})", config, error));
  REQUIRE(error.find("safety") != std::string::npos);

  REQUIRE_FALSE(
      rsa::config::ParseAgentConfigText(R"({"credal": {"placement": "random"}})", config, error));
  REQUIRE(error.find("credal.placement") != std::string::npos);

  REQUIRE_FALSE(rsa::config::ParseAgentConfigText("[1, 2]", config, error));
  REQUIRE_FALSE(rsa::config::ParseAgentConfigText("{", config, error));
  REQUIRE(error.find("invalid config JSON") != std::string::npos);
}

TEST_CASE("Syntax errors are reported at the root", "[config][validator]") {
  const rsa::config::ValidationReport report = ValidateText("{\"seed\": ");
  REQUIRE_FALSE(report.valid);
  REQUIRE(HasIssue(report, "$"));
}

TEST_CASE("Unknown top-level keys are reported", "[config][validator]") {
  const rsa::config::ValidationReport report = ValidateText(R"({"sead": 3})");
  REQUIRE_FALSE(report.valid);
  REQUIRE(HasIssue(report, "sead"));
}

TEST_CASE("Range checks report every offending field", "[config][validator]") {
  const rsa::config::ValidationReport report = ValidateText(R"({
    "discount": 1.5,
    "belief": {"particles": 0, "resample_threshold": 0.0},
    "semantics": {"accept_threshold": 0.3, "reject_threshold": 0.6},
    "credal": {"members": 9, "forgetting": 0.0},
    "risk": {"alpha": 0.0},
    "safety": {"barrier_alpha": 20.0, "max_slack": -1.0},
    "env": {"goal": [0.1, 0.0], "gossip_probability": 2.0}
  })");
  REQUIRE_FALSE(report.valid);
  REQUIRE(HasIssue(report, "discount"));
  REQUIRE(HasIssue(report, "belief.particles"));
  REQUIRE(HasIssue(report, "belief.resample_threshold"));
  REQUIRE(HasIssue(report, "semantics"));
  REQUIRE(HasIssue(report, "credal.members"));
  REQUIRE(HasIssue(report, "credal.forgetting"));
  REQUIRE(HasIssue(report, "risk.alpha"));
  REQUIRE(HasIssue(report, "safety.barrier_alpha"));
  REQUIRE(HasIssue(report, "safety.max_slack"));
  REQUIRE(HasIssue(report, "env.goal"));
  REQUIRE(HasIssue(report, "env.gossip_probability"));
}

TEST_CASE("Obstacle geometry must be two-dimensional", "[config][validator]") {
  const rsa::config::ValidationReport report =
      ValidateText(R"({"env": {"obstacle_center": [0.0, 0.0, 0.0]}})");
  REQUIRE_FALSE(report.valid);
  REQUIRE(HasIssue(report, "env.obstacle_center"));
}

TEST_CASE("Missing config files are I/O errors", "[config][validator]") {
  rsa::config::ValidationReport report;
  std::string error;
  REQUIRE_FALSE(
      rsa::config::ValidateAgentConfigFile("/nonexistent/rsa/config.json", report, error));
  REQUIRE(error.find("unable to read") != std::string::npos);

  rsa::config::AgentConfig config;
  REQUIRE_FALSE(rsa::config::LoadAgentConfigFile("/nonexistent/rsa/config.json", config, error));
}
