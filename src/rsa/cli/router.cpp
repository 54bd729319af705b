#include "rsa/cli/router.hpp"

#include "config/agent_config.hpp"
#include "config/validator.hpp"
#include "core/errors/exit_codes.hpp"
#include "recorder/diagnostics_jsonl_writer.hpp"
#include "recorder/rollout_summary_writer.hpp"

#include <charconv>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace rsa::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitSafetyViolations =
    core::errors::ToInt(core::errors::ExitCode::kSafetyViolations);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  rsa rollout --config <config.json> [--episodes <n>] [--seed <s>] "
         "[--policy <goal|hostile>] [--gossip] [--out <dir>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  rsa validate <config.json>\n"
      << "  rsa version\n";
}

bool ParseUnsigned(std::string_view raw, std::uint64_t& value) {
  if (raw.empty()) {
    return false;
  }
  const char* begin = raw.data();
  const char* end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  return ec == std::errc() && ptr == end;
}

bool ValidateConfigPath(const std::string& config_path, std::string& error) {
  if (config_path.empty()) {
    error = "config path cannot be empty";
    return false;
  }
  std::error_code ec;
  if (!fs::exists(config_path, ec) || ec) {
    error = "config file not found: " + config_path;
    return false;
  }
  if (!fs::is_regular_file(config_path, ec) || ec) {
    error = "config path must point to a regular file: " + config_path;
    return false;
  }
  return true;
}

void PrintIssues(const std::string& config_path, const config::ValidationReport& report) {
  std::cerr << "invalid config: " << config_path << '\n';
  for (const auto& issue : report.issues) {
    std::cerr << "  - " << issue.path << ": " << issue.message << '\n';
  }
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }
  std::cout << "rsa 0.1.0\n";
  return kExitSuccess;
}

int CommandValidate(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: validate requires exactly 1 argument: <config.json>\n";
    return kExitUsage;
  }

  std::string error;
  const std::string config_path(args.front());
  if (!ValidateConfigPath(config_path, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  config::ValidationReport report;
  if (!config::ValidateAgentConfigFile(config_path, report, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  if (!report.valid) {
    PrintIssues(config_path, report);
    return kExitConfigInvalid;
  }

  std::cout << "valid: " << config_path << '\n';
  return kExitSuccess;
}

// Any unknown flag or positional argument is a usage error.
bool ParseRolloutOptions(const std::vector<std::string_view>& args, RolloutCliOptions& options,
                         std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--gossip") {
      options.gossip = true;
      continue;
    }

    const bool takes_value = token == "--config" || token == "--episodes" || token == "--seed" ||
                             token == "--policy" || token == "--out" || token == "--log-level";
    if (!takes_value) {
      error = token.empty() || token.front() != '-' ? "unexpected argument: " + std::string(token)
                                                    : "unknown option: " + std::string(token);
      return false;
    }
    if (i + 1 >= args.size()) {
      error = "missing value for " + std::string(token);
      return false;
    }
    const std::string_view value = args[++i];

    if (token == "--config") {
      options.config_path = std::string(value);
    } else if (token == "--episodes") {
      std::uint64_t parsed = 0;
      if (!ParseUnsigned(value, parsed) || parsed == 0U) {
        error = "--episodes must be a positive integer";
        return false;
      }
      options.episodes = static_cast<std::size_t>(parsed);
    } else if (token == "--seed") {
      std::uint64_t parsed = 0;
      if (!ParseUnsigned(value, parsed)) {
        error = "--seed must be a non-negative integer";
        return false;
      }
      options.seed = parsed;
    } else if (token == "--policy") {
      if (!runner::ParsePolicyKind(value, options.policy, error)) {
        return false;
      }
    } else if (token == "--out") {
      options.output_dir = fs::path(value);
    } else if (!core::logging::ParseLogLevel(value, options.log_level, error)) {
      return false;
    }
  }

  if (options.config_path.empty()) {
    error = "rollout requires --config <config.json>";
    return false;
  }
  return true;
}

int CommandRollout(const std::vector<std::string_view>& args) {
  RolloutCliOptions options;
  std::string error;
  if (!ParseRolloutOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  logger.SetAgentId("rollout");

  if (!ValidateConfigPath(options.config_path, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  config::ValidationReport report;
  if (!config::ValidateAgentConfigFile(options.config_path, report, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  if (!report.valid) {
    PrintIssues(options.config_path, report);
    return kExitConfigInvalid;
  }

  config::AgentConfig agent_config;
  if (!config::LoadAgentConfigFile(options.config_path, agent_config, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }
  if (options.seed.has_value()) {
    agent_config.seed = *options.seed;
  }
  if (options.gossip) {
    agent_config.env.gossip = true;
  }
  config::SyncDerivedFields(agent_config);

  runner::RolloutOptions rollout_options;
  rollout_options.policy = options.policy;
  if (options.episodes.has_value()) {
    rollout_options.episodes = *options.episodes;
  }

  std::unique_ptr<recorder::DiagnosticsJsonlWriter> diagnostics;
  if (options.output_dir.has_value()) {
    // Fresh diagnostics per invocation; the writer appends.
    std::error_code ec;
    fs::remove(*options.output_dir / "diagnostics.jsonl", ec);
    if (ec) {
      std::cerr << "error: failed to clear previous diagnostics: " << ec.message() << '\n';
      return kExitFailure;
    }
    diagnostics = std::make_unique<recorder::DiagnosticsJsonlWriter>(*options.output_dir);
  }

  runner::RolloutRunner rollout(agent_config, rollout_options);
  rollout.SetLogger(&logger);
  rollout.SetRecorder(diagnostics.get());

  logger.Info("rollout started", {{"config", options.config_path},
                                  {"episodes", std::to_string(rollout_options.episodes)},
                                  {"policy", runner::ToString(rollout_options.policy)},
                                  {"seed", std::to_string(agent_config.seed)}});

  runner::RolloutSummary summary;
  if (!rollout.Run(summary, error)) {
    logger.Error("rollout failed", {{"error", error}});
    std::cerr << "error: rollout failed: " << error << '\n';
    return kExitFailure;
  }

  logger.Info("rollout finished",
              {{"violations", std::to_string(summary.violations)},
               {"activation_rate", core::logging::FormatField(summary.activation_rate)},
               {"mean_return", core::logging::FormatField(summary.returns.mean)}});

  if (options.output_dir.has_value()) {
    fs::path summary_path;
    if (!recorder::WriteRolloutSummary(summary, *options.output_dir, summary_path, error)) {
      std::cerr << "error: failed to write summary.json: " << error << '\n';
      return kExitFailure;
    }
    std::cout << "summary: " << summary_path.string() << '\n';
    if (diagnostics->RecordCount() > 0U) {
      std::cout << "diagnostics: " << diagnostics->WrittenPath().string() << '\n';
    }
  }

  std::cout << "episodes: " << summary.episodes << '\n';
  std::cout << "steps: " << summary.total_steps << '\n';
  std::cout << "goals_reached: " << summary.goals_reached << '\n';
  std::cout << "violations: " << summary.violations << '\n';
  std::cout << "activation_rate: " << core::logging::FormatField(summary.activation_rate) << '\n';
  std::cout << "queries: " << summary.queries << '\n';
  std::cout << "emergency_stops: " << summary.emergency_stops << '\n';
  std::cout << "mean_return: " << core::logging::FormatField(summary.returns.mean) << '\n';
  for (const risk::CvarPoint& point : summary.returns.cvar_curve) {
    std::cout << "cvar@" << core::logging::FormatField(point.alpha) << ": "
              << core::logging::FormatField(point.cvar) << '\n';
  }

  if (summary.violations > 0U) {
    std::cerr << "safety violations observed: " << summary.violations << '\n';
    return kExitSafetyViolations;
  }
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "validate") {
    return CommandValidate(args);
  }
  if (command == "rollout") {
    return CommandRollout(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace rsa::cli
