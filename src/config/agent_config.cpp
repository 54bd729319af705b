#include "config/agent_config.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace rsa::config {

namespace {

using JsonValue = core::json::Value;

std::string JoinPath(std::initializer_list<std::string_view> path) {
  std::string joined;
  for (const std::string_view key : path) {
    if (!joined.empty()) {
      joined += ".";
    }
    joined += key;
  }
  return joined;
}

bool Fail(std::initializer_list<std::string_view> path, std::string message,
          ConfigFieldError& field_error) {
  field_error.path = JoinPath(path);
  field_error.message = std::move(message);
  return false;
}

bool TryGetNonNegativeInteger(const JsonValue& value, std::uint64_t& out) {
  if (!value.IsNumber() || !std::isfinite(value.number_value) || value.number_value < 0.0) {
    return false;
  }
  const double floored = std::floor(value.number_value);
  if (floored != value.number_value ||
      floored > static_cast<double>(std::numeric_limits<std::uint64_t>::max())) {
    return false;
  }
  out = static_cast<std::uint64_t>(floored);
  return true;
}

bool ReadNumber(const JsonValue& root, std::initializer_list<std::string_view> path,
                double& target, ConfigFieldError& field_error) {
  const JsonValue* value = core::json::FindPath(root, path);
  if (value == nullptr) {
    return true;
  }
  if (!value->IsNumber() || !std::isfinite(value->number_value)) {
    return Fail(path, "must be a finite number", field_error);
  }
  target = value->number_value;
  return true;
}

template <typename Integer>
bool ReadInteger(const JsonValue& root, std::initializer_list<std::string_view> path,
                 Integer& target, ConfigFieldError& field_error) {
  const JsonValue* value = core::json::FindPath(root, path);
  if (value == nullptr) {
    return true;
  }
  std::uint64_t parsed = 0;
  if (!TryGetNonNegativeInteger(*value, parsed)) {
    return Fail(path, "must be a non-negative integer", field_error);
  }
  target = static_cast<Integer>(parsed);
  return true;
}

bool ReadBool(const JsonValue& root, std::initializer_list<std::string_view> path, bool& target,
              ConfigFieldError& field_error) {
  const JsonValue* value = core::json::FindPath(root, path);
  if (value == nullptr) {
    return true;
  }
  if (!value->IsBool()) {
    return Fail(path, "must be a boolean", field_error);
  }
  target = value->bool_value;
  return true;
}

bool ReadVector(const JsonValue& root, std::initializer_list<std::string_view> path,
                core::Vector& target, ConfigFieldError& field_error) {
  const JsonValue* value = core::json::FindPath(root, path);
  if (value == nullptr) {
    return true;
  }
  if (!value->IsArray() || value->array_value.empty()) {
    return Fail(path, "must be a non-empty array of numbers", field_error);
  }
  std::vector<double> parsed;
  parsed.reserve(value->array_value.size());
  for (const JsonValue& element : value->array_value) {
    if (!element.IsNumber() || !std::isfinite(element.number_value)) {
      return Fail(path, "must be a non-empty array of numbers", field_error);
    }
    parsed.push_back(element.number_value);
  }
  target = core::ToVector(parsed);
  return true;
}

// null selects an unbounded slack.
bool ReadOptionalBound(const JsonValue& root, std::initializer_list<std::string_view> path,
                       double& target, ConfigFieldError& field_error) {
  const JsonValue* value = core::json::FindPath(root, path);
  if (value == nullptr) {
    return true;
  }
  if (value->type == JsonValue::Type::kNull) {
    target = std::numeric_limits<double>::infinity();
    return true;
  }
  return ReadNumber(root, path, target, field_error);
}

bool ReadSections(const JsonValue& root, ConfigFieldError& field_error) {
  for (const char* section :
       {"belief", "semantics", "credal", "risk", "query", "safety", "motion", "env"}) {
    const JsonValue* value = core::json::FindMember(root, section);
    if (value != nullptr && !value->IsObject()) {
      return Fail({section}, "must be an object", field_error);
    }
  }
  return true;
}

} // namespace

AgentConfig DefaultAgentConfig() {
  AgentConfig config;
  config.controller.query.enabled = false;
  SyncDerivedFields(config);
  return config;
}

void SyncDerivedFields(AgentConfig& config) {
  controller::ControllerConfig& controller = config.controller;
  controller.seed = config.seed;
  controller.discount = config.discount;
  controller.obs_noise = config.env.observation_noise;
  controller.safety.max_action = config.env.max_action;
  config.env.dt = controller.dt;
  config.env.horizon = config.horizon;
}

bool ParseAgentConfigValue(const JsonValue& root, AgentConfig& config,
                           ConfigFieldError& field_error) {
  if (!root.IsObject()) {
    return Fail({"$"}, "config root must be a JSON object", field_error);
  }
  config = DefaultAgentConfig();
  if (!ReadSections(root, field_error)) {
    return false;
  }

  controller::ControllerConfig& c = config.controller;
  envs::EnvConfig& env = config.env;

  double initial_std = c.initial_std.size() == 0 ? 0.05 : c.initial_std[0];
  const bool ok =
      ReadInteger(root, {"seed"}, config.seed, field_error) &&
      ReadNumber(root, {"discount"}, config.discount, field_error) &&
      ReadInteger(root, {"horizon"}, config.horizon, field_error) &&

      ReadInteger(root, {"belief", "particles"}, c.belief.particles, field_error) &&
      ReadNumber(root, {"belief", "resample_threshold"}, c.belief.resample_fraction,
                 field_error) &&
      ReadNumber(root, {"belief", "jitter_std"}, c.belief.jitter_std, field_error) &&
      ReadNumber(root, {"belief", "process_noise"}, c.process_noise, field_error) &&
      ReadNumber(root, {"belief", "initial_std"}, initial_std, field_error) &&

      ReadNumber(root, {"semantics", "accept_threshold"}, c.thresholds.accept, field_error) &&
      ReadNumber(root, {"semantics", "reject_threshold"}, c.thresholds.reject, field_error) &&
      ReadInteger(root, {"semantics", "min_calibration_samples"}, c.min_calibration_samples,
                  field_error) &&
      ReadBool(root, {"semantics", "auto_recalibrate"}, c.auto_recalibrate, field_error) &&
      ReadNumber(root, {"semantics", "cost_false_positive"}, c.calibration_costs.false_positive,
                 field_error) &&
      ReadNumber(root, {"semantics", "cost_false_negative"}, c.calibration_costs.false_negative,
                 field_error) &&

      ReadInteger(root, {"credal", "members"}, c.credal.members, field_error) &&
      ReadNumber(root, {"credal", "trust_alpha"}, c.trust.alpha, field_error) &&
      ReadNumber(root, {"credal", "trust_beta"}, c.trust.beta, field_error) &&
      ReadNumber(root, {"credal", "forgetting"}, c.trust.forgetting, field_error) &&

      ReadNumber(root, {"risk", "alpha"}, c.risk_alpha, field_error) &&

      ReadBool(root, {"query", "enabled"}, c.query.enabled, field_error) &&
      ReadNumber(root, {"query", "cost"}, c.query.cost, field_error) &&
      ReadNumber(root, {"query", "delta_star"}, c.query.delta_star, field_error) &&
      ReadInteger(root, {"query", "samples"}, c.query.samples, field_error) &&
      ReadNumber(root, {"query", "noise_scale"}, c.query.noise_scale, field_error) &&

      ReadNumber(root, {"safety", "barrier_alpha"}, c.safety.barrier_alpha, field_error) &&
      ReadInteger(root, {"safety", "qp_max_iter"}, c.safety.max_iterations, field_error) &&
      ReadNumber(root, {"safety", "slack_penalty"}, c.safety.slack_penalty, field_error) &&
      ReadOptionalBound(root, {"safety", "max_slack"}, c.safety.max_slack, field_error) &&
      ReadNumber(root, {"safety", "tolerance"}, c.safety.tolerance, field_error) &&
      ReadNumber(root, {"safety", "margin_base"}, c.safety.margin_base, field_error) &&
      ReadNumber(root, {"safety", "margin_sigmas"}, c.safety.margin_sigmas, field_error) &&

      ReadNumber(root, {"motion", "dt"}, c.dt, field_error) &&

      ReadNumber(root, {"env", "obstacle_radius"}, env.obstacle_radius, field_error) &&
      ReadVector(root, {"env", "obstacle_center"}, env.obstacle_center, field_error) &&
      ReadVector(root, {"env", "goal"}, env.goal, field_error) &&
      ReadNumber(root, {"env", "goal_radius"}, env.goal_radius, field_error) &&
      ReadNumber(root, {"env", "observation_noise"}, env.observation_noise, field_error) &&
      ReadNumber(root, {"env", "max_action"}, env.max_action, field_error) &&
      ReadNumber(root, {"env", "process_noise"}, env.process_noise, field_error) &&
      ReadBool(root, {"env", "gossip"}, env.gossip, field_error) &&
      ReadNumber(root, {"env", "gossip_probability"}, env.gossip_probability, field_error);
  if (!ok) {
    return false;
  }

  if (const JsonValue* raw = core::json::FindPath(root, {"credal", "placement"}); raw != nullptr) {
    if (!raw->IsString()) {
      return Fail({"credal", "placement"}, "must be a string", field_error);
    }
    std::string placement_error;
    if (!credal::ParsePlacementPolicy(raw->string_value, c.credal.placement, placement_error)) {
      return Fail({"credal", "placement"}, placement_error, field_error);
    }
  }

  c.initial_std = core::Vector::Constant(env.obstacle_center.size(), initial_std);
  c.initial_mean = core::Vector::Zero(env.obstacle_center.size());
  SyncDerivedFields(config);
  return true;
}

bool ParseAgentConfigText(std::string_view json_text, AgentConfig& config, std::string& error) {
  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    error = "invalid config JSON: " + parse_error;
    return false;
  }
  ConfigFieldError field_error;
  if (!ParseAgentConfigValue(root, config, field_error)) {
    error = "config field '" + field_error.path + "' " + field_error.message;
    return false;
  }
  return true;
}

bool LoadAgentConfigFile(const std::string& config_path, AgentConfig& config, std::string& error) {
  std::ifstream file(fs::path(config_path), std::ios::binary);
  if (!file) {
    error = "unable to read config file: " + config_path;
    return false;
  }
  const std::string contents((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());
  if (!ParseAgentConfigText(contents, config, error)) {
    error = config_path + ": " + error;
    return false;
  }
  return true;
}

} // namespace rsa::config
