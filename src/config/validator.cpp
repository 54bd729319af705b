#include "config/validator.hpp"

#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"
#include "credal/credal_set.hpp"
#include "semantics/status_engine.hpp"

#include <array>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

namespace fs = std::filesystem;

namespace rsa::config {

namespace {

using JsonValue = core::json::Value;

constexpr std::array<std::string_view, 11> kKnownTopLevelKeys = {
    "seed",   "discount", "horizon", "belief", "semantics", "credal",
    "risk",   "query",    "safety",  "motion", "env",
};

void AddIssue(ValidationReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

void RequirePositive(ValidationReport& report, std::string path, const double value) {
  if (!(value > 0.0)) {
    AddIssue(report, std::move(path), "must be > 0");
  }
}

void RequireNonNegative(ValidationReport& report, std::string path, const double value) {
  if (!(value >= 0.0)) {
    AddIssue(report, std::move(path), "must be >= 0");
  }
}

// Half-open (low, high] check used for fractions and probabilities.
void RequireInHalfOpen(ValidationReport& report, std::string path, const double value,
                       const double low, const double high) {
  if (!(value > low && value <= high)) {
    AddIssue(report, std::move(path),
             "must be in (" + core::logging::FormatField(low) + ", " +
                 core::logging::FormatField(high) + "]");
  }
}

void ValidateBelief(const controller::ControllerConfig& c, ValidationReport& report) {
  if (c.belief.particles < 1U) {
    AddIssue(report, "belief.particles", "must be >= 1");
  }
  RequireInHalfOpen(report, "belief.resample_threshold", c.belief.resample_fraction, 0.0, 1.0);
  RequireNonNegative(report, "belief.jitter_std", c.belief.jitter_std);
  RequireNonNegative(report, "belief.process_noise", c.process_noise);
  if (!(c.initial_std.array() > 0.0).all()) {
    AddIssue(report, "belief.initial_std", "must be > 0");
  }
}

void ValidateSemantics(const controller::ControllerConfig& c, ValidationReport& report) {
  std::string threshold_error;
  if (!semantics::ValidateThresholds(c.thresholds, threshold_error)) {
    AddIssue(report, "semantics", threshold_error);
  }
  if (c.min_calibration_samples < 1U) {
    AddIssue(report, "semantics.min_calibration_samples", "must be >= 1");
  }
  RequireNonNegative(report, "semantics.cost_false_positive", c.calibration_costs.false_positive);
  RequireNonNegative(report, "semantics.cost_false_negative", c.calibration_costs.false_negative);
}

void ValidateCredal(const controller::ControllerConfig& c, ValidationReport& report) {
  if (c.credal.members < 1U || c.credal.members > credal::kMaxMembers) {
    AddIssue(report, "credal.members",
             "must be in [1, " + std::to_string(credal::kMaxMembers) + "]");
  }
  RequirePositive(report, "credal.trust_alpha", c.trust.alpha);
  RequirePositive(report, "credal.trust_beta", c.trust.beta);
  RequireInHalfOpen(report, "credal.forgetting", c.trust.forgetting, 0.0, 1.0);
}

void ValidateQuery(const controller::ControllerConfig& c, ValidationReport& report) {
  RequireNonNegative(report, "query.cost", c.query.cost);
  if (c.query.enabled) {
    RequirePositive(report, "query.delta_star", c.query.delta_star);
  }
  if (c.query.samples < 1U) {
    AddIssue(report, "query.samples", "must be >= 1");
  }
  RequirePositive(report, "query.noise_scale", c.query.noise_scale);
}

void ValidateSafety(const controller::ControllerConfig& c, ValidationReport& report) {
  RequirePositive(report, "safety.barrier_alpha", c.safety.barrier_alpha);
  if (c.safety.barrier_alpha * c.dt > 1.0) {
    AddIssue(report, "safety.barrier_alpha",
             "barrier_alpha * motion.dt must be <= 1 for the discrete-time barrier condition");
  }
  if (c.safety.max_iterations < 1U) {
    AddIssue(report, "safety.qp_max_iter", "must be >= 1");
  }
  RequirePositive(report, "safety.slack_penalty", c.safety.slack_penalty);
  if (std::isnan(c.safety.max_slack) || c.safety.max_slack < 0.0) {
    AddIssue(report, "safety.max_slack", "must be >= 0 or null");
  }
  RequirePositive(report, "safety.tolerance", c.safety.tolerance);
  RequireNonNegative(report, "safety.margin_base", c.safety.margin_base);
  RequireNonNegative(report, "safety.margin_sigmas", c.safety.margin_sigmas);
}

void ValidateEnv(const envs::EnvConfig& env, ValidationReport& report) {
  RequirePositive(report, "env.obstacle_radius", env.obstacle_radius);
  RequirePositive(report, "env.goal_radius", env.goal_radius);
  RequirePositive(report, "env.observation_noise", env.observation_noise);
  RequirePositive(report, "env.max_action", env.max_action);
  RequireNonNegative(report, "env.process_noise", env.process_noise);
  if (!(env.gossip_probability >= 0.0 && env.gossip_probability <= 1.0)) {
    AddIssue(report, "env.gossip_probability", "must be in [0, 1]");
  }
  if (env.obstacle_center.size() != 2) {
    AddIssue(report, "env.obstacle_center", "must have exactly 2 components");
  }
  if (env.goal.size() != 2) {
    AddIssue(report, "env.goal", "must have exactly 2 components");
  }
  if (env.obstacle_center.size() == 2 && env.goal.size() == 2 &&
      (env.goal - env.obstacle_center).norm() <
          env.obstacle_radius + env.goal_radius) {
    AddIssue(report, "env.goal", "goal region must lie outside the obstacle");
  }
}

void ValidateUnknownKeys(const JsonValue& root, ValidationReport& report) {
  for (const auto& [key, value] : root.object_value) {
    bool known = false;
    for (const std::string_view candidate : kKnownTopLevelKeys) {
      known = known || candidate == key;
    }
    if (!known) {
      AddIssue(report, key, "unknown top-level key");
    }
  }
}

void ValidateRoot(const JsonValue& root, ValidationReport& report) {
  if (!root.IsObject()) {
    AddIssue(report, "$", "config root must be a JSON object");
    report.valid = false;
    return;
  }
  ValidateUnknownKeys(root, report);

  AgentConfig config;
  ConfigFieldError field_error;
  if (!ParseAgentConfigValue(root, config, field_error)) {
    AddIssue(report, field_error.path, field_error.message);
    report.valid = false;
    return;
  }
  ValidateAgentConfig(config, report);
}

} // namespace

void ValidateAgentConfig(const AgentConfig& config, ValidationReport& report) {
  if (config.horizon < 1U) {
    AddIssue(report, "horizon", "must be >= 1");
  }
  RequireInHalfOpen(report, "discount", config.discount, 0.0, 1.0);
  RequireInHalfOpen(report, "risk.alpha", config.controller.risk_alpha, 0.0, 1.0);
  RequirePositive(report, "motion.dt", config.controller.dt);

  ValidateBelief(config.controller, report);
  ValidateSemantics(config.controller, report);
  ValidateCredal(config.controller, report);
  ValidateQuery(config.controller, report);
  ValidateSafety(config.controller, report);
  ValidateEnv(config.env, report);
  report.valid = report.issues.empty();
}

bool ValidateAgentConfigText(std::string_view json_text, ValidationReport& report,
                             std::string& error) {
  error.clear();
  report = ValidationReport{};

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    AddIssue(report, "$", parse_error + " (fix JSON syntax and rerun 'rsa validate <config.json>')");
    report.valid = false;
    return true;
  }

  ValidateRoot(root, report);
  report.valid = report.issues.empty();
  return true;
}

bool ValidateAgentConfigFile(const std::string& config_path, ValidationReport& report,
                             std::string& error) {
  std::ifstream file(fs::path(config_path), std::ios::binary);
  if (!file) {
    error = "unable to read config file: " + config_path;
    return false;
  }

  const std::string contents((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());
  if (contents.empty()) {
    report = ValidationReport{};
    AddIssue(report, "$", "config file is empty; provide a valid JSON object");
    report.valid = false;
    return true;
  }
  return ValidateAgentConfigText(contents, report, error);
}

} // namespace rsa::config
