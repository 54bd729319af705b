#include "recorder/rollout_summary_writer.hpp"

#include "core/json_utils.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace rsa::recorder {

std::string ToJson(const runner::RolloutSummary& summary) {
  std::ostringstream out;
  out << "{\n"
      << "  \"episodes\": " << summary.episodes << ",\n"
      << "  \"total_steps\": " << summary.total_steps << ",\n"
      << "  \"violations\": " << summary.violations << ",\n"
      << "  \"episodes_with_violation\": " << summary.episodes_with_violation << ",\n"
      << "  \"goals_reached\": " << summary.goals_reached << ",\n"
      << "  \"filter_activations\": " << summary.filter_activations << ",\n"
      << "  \"activation_rate\": " << core::FormatJsonNumber(summary.activation_rate) << ",\n"
      << "  \"queries\": " << summary.queries << ",\n"
      << "  \"emergency_stops\": " << summary.emergency_stops << ",\n"
      << "  \"claims\": " << summary.claims << ",\n"
      << "  \"credal_steps\": " << summary.credal_steps << ",\n"
      << "  \"numeric_degeneracy_steps\": " << summary.numeric_degeneracy_steps << ",\n";

  out << "  \"returns\": {\"mean\": " << core::FormatJsonNumber(summary.returns.mean)
      << ", \"worst\": " << core::FormatJsonNumber(summary.returns.worst)
      << ", \"best\": " << core::FormatJsonNumber(summary.returns.best) << ", \"cvar\": [";
  for (std::size_t i = 0; i < summary.returns.cvar_curve.size(); ++i) {
    const risk::CvarPoint& point = summary.returns.cvar_curve[i];
    out << (i > 0U ? ", " : "") << "{\"alpha\": " << core::FormatJsonNumber(point.alpha)
        << ", \"cvar\": " << core::FormatJsonNumber(point.cvar) << "}";
  }
  out << "]},\n";

  out << "  \"source_reliability\": {";
  bool first = true;
  for (const auto& [source_id, reliability] : summary.source_reliability) {
    out << (first ? "" : ", ") << core::Quoted(source_id) << ": "
        << core::FormatJsonNumber(reliability);
    first = false;
  }
  out << "}\n}\n";
  return out.str();
}

bool WriteRolloutSummary(const runner::RolloutSummary& summary, const fs::path& output_dir,
                         fs::path& written_path, std::string& error) {
  if (output_dir.empty()) {
    error = "output directory cannot be empty";
    return false;
  }

  std::error_code ec;
  fs::create_directories(output_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + output_dir.string() + "': " + ec.message();
    return false;
  }

  written_path = output_dir / "summary.json";
  std::ofstream out_file(written_path, std::ios::binary | std::ios::trunc);
  if (!out_file) {
    error = "failed to open summary '" + written_path.string() + "' for writing";
    return false;
  }
  out_file << ToJson(summary);
  if (!out_file) {
    error = "failed while writing summary '" + written_path.string() + "'";
    return false;
  }
  return true;
}

} // namespace rsa::recorder
