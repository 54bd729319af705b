#pragma once

namespace rsa::core::errors {

// Process-exit contract for the `rsa` CLI.
//
// 0/1/2 keep their conventional meanings (success, failure, usage). The
// remaining values let batch scripts tell a bad config apart from a rollout
// that ran but observed safety violations.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kSafetyViolations = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace rsa::core::errors
