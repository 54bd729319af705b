#pragma once

#include "core/logging/logger.hpp"
#include "runner/rollout_runner.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace rsa::cli {

// Options for `rsa rollout`. Overrides win over config file values.
struct RolloutCliOptions {
  std::string config_path;
  std::optional<std::size_t> episodes;
  std::optional<std::uint64_t> seed;
  runner::PolicyKind policy = runner::PolicyKind::kGoalSeeking;
  bool gossip = false;
  // Diagnostics and summary are only written when set.
  std::optional<std::filesystem::path> output_dir;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Routes `rsa` subcommands and returns process exit codes with a stable
// contract for scripts and CI:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => config file failed validation
//   30 => rollout completed but the true state entered the forbidden region
int Dispatch(int argc, char** argv);

} // namespace rsa::cli
