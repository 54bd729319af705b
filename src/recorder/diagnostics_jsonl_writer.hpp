#pragma once

#include "controller/interfaces.hpp"
#include "controller/step_diagnostics.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>

namespace rsa::recorder {

// One-line JSON rendering of a step record. `episode` is stamped in front
// so files from multi-episode rollouts can be grouped.
std::string ToJson(const controller::StepDiagnostics& diagnostics, std::size_t episode);

// Appends one serialized step to `<output_dir>/diagnostics.jsonl`.
//
// Contract:
// - Creates `output_dir` if needed.
// - Opens `diagnostics.jsonl` in append mode.
// - Writes exactly one line per call.
// - Returns false with `error` populated on failure.
bool AppendDiagnosticsJsonl(const controller::StepDiagnostics& diagnostics, std::size_t episode,
                            const std::filesystem::path& output_dir,
                            std::filesystem::path& written_path, std::string& error);

// IDiagnosticsRecorder that streams every step to diagnostics.jsonl.
class DiagnosticsJsonlWriter final : public controller::IDiagnosticsRecorder {
public:
  explicit DiagnosticsJsonlWriter(std::filesystem::path output_dir)
      : output_dir_(std::move(output_dir)) {}

  void BeginEpisode(std::size_t episode) override {
    episode_ = episode;
  }

  bool Record(const controller::StepDiagnostics& diagnostics, std::string& error) override;

  std::size_t RecordCount() const {
    return records_;
  }
  // Empty until the first successful Record().
  const std::filesystem::path& WrittenPath() const {
    return written_path_;
  }

private:
  std::filesystem::path output_dir_;
  std::filesystem::path written_path_;
  std::size_t episode_ = 0;
  std::size_t records_ = 0;
};

} // namespace rsa::recorder
