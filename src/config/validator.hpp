#pragma once

#include "config/agent_config.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace rsa::config {

struct ValidationIssue {
  std::string path;
  std::string message;
};

struct ValidationReport {
  bool valid = false;
  std::vector<ValidationIssue> issues;
};

// Range and consistency checks on an already-typed config. Appends issues
// and sets `report.valid` from the final issue list.
void ValidateAgentConfig(const AgentConfig& config, ValidationReport& report);

// Validates config JSON text.
//
// Contract:
// - Returns true when validation completed (even if the config is invalid).
// - Syntax errors are reported under path `$`; unknown top-level keys and
//   wrong field types under their dotted path.
bool ValidateAgentConfigText(std::string_view json_text, ValidationReport& report,
                             std::string& error);

// Contract:
// - Returns false if file I/O fails and sets `error`.
// - Otherwise returns true and populates `report`.
bool ValidateAgentConfigFile(const std::string& config_path, ValidationReport& report,
                             std::string& error);

} // namespace rsa::config
