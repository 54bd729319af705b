#pragma once

#include "runner/rollout_runner.hpp"

#include <filesystem>
#include <string>

namespace rsa::recorder {

std::string ToJson(const runner::RolloutSummary& summary);

// Writes `<output_dir>/summary.json` (overwrites).
//
// Contract:
// - creates `output_dir` when missing.
// - returns false and sets `error` on failure.
bool WriteRolloutSummary(const runner::RolloutSummary& summary,
                         const std::filesystem::path& output_dir,
                         std::filesystem::path& written_path, std::string& error);

} // namespace rsa::recorder
