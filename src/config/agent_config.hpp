#pragma once

#include "controller/agent_controller.hpp"
#include "core/json_dom.hpp"
#include "envs/forbidden_circle_env.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace rsa::config {

// Fully-resolved runtime configuration for one agent + environment pair.
//
// JSON layout (every key optional, missing keys keep defaults):
//   seed, discount, horizon,
//   belief    { particles, resample_threshold, jitter_std, process_noise, initial_std }
//   semantics { accept_threshold, reject_threshold, min_calibration_samples,
//               auto_recalibrate, cost_false_positive, cost_false_negative }
//   credal    { members, placement, trust_alpha, trust_beta, forgetting }
//   risk      { alpha }
//   query     { enabled, cost, delta_star, samples, noise_scale }
//   safety    { barrier_alpha, qp_max_iter, slack_penalty, max_slack, tolerance,
//               margin_base, margin_sigmas }
//   motion    { dt }
//   env       { obstacle_radius, obstacle_center, goal, goal_radius, observation_noise,
//               max_action, process_noise, gossip, gossip_probability }
struct AgentConfig {
  std::uint64_t seed = 42;
  double discount = 0.98;
  std::size_t horizon = 50;
  controller::ControllerConfig controller;
  envs::EnvConfig env;
};

// Defaults with the query action disabled, matching configs/default.json.
AgentConfig DefaultAgentConfig();

// Copies shared values into both halves: env.max_action feeds the safety
// filter ball, env.observation_noise the likelihood, dt and horizon the env.
void SyncDerivedFields(AgentConfig& config);

struct ConfigFieldError {
  std::string path;
  std::string message;
};

// Parses a JSON DOM into `config`, starting from DefaultAgentConfig().
//
// Contract:
// - Returns false on the first field with the wrong JSON type and fills
//   `field_error` with its dotted path.
// - Does not range-check values; see ValidateAgentConfig().
bool ParseAgentConfigValue(const core::json::Value& root, AgentConfig& config,
                           ConfigFieldError& field_error);

bool ParseAgentConfigText(std::string_view json_text, AgentConfig& config, std::string& error);

bool LoadAgentConfigFile(const std::string& config_path, AgentConfig& config, std::string& error);

} // namespace rsa::config
