#include "recorder/diagnostics_jsonl_writer.hpp"

#include "core/json_utils.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace rsa::recorder {

namespace {

const char* JsonBool(const bool value) {
  return value ? "true" : "false";
}

std::string ClaimsToJson(const std::vector<controller::ClaimAssessment>& claims) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < claims.size(); ++i) {
    const controller::ClaimAssessment& claim = claims[i];
    if (i > 0U) {
      out << ",";
    }
    out << "{\"claim_id\":" << core::Quoted(claim.claim_id)
        << ",\"source_id\":" << core::Quoted(claim.source_id)
        << ",\"reported\":" << core::Quoted(semantics::ToString(claim.reported))
        << ",\"assessed\":" << core::Quoted(semantics::ToString(claim.assessed))
        << ",\"support\":" << core::FormatJsonNumber(claim.support)
        << ",\"counter_support\":" << core::FormatJsonNumber(claim.counter_support) << "}";
  }
  out << "]";
  return out.str();
}

} // namespace

std::string ToJson(const controller::StepDiagnostics& d, const std::size_t episode) {
  std::ostringstream out;
  out << "{\"episode\":" << episode << ",\"step\":" << d.step_index
      << ",\"belief_mean\":" << core::FormatJsonArray(d.belief_mean)
      << ",\"ess\":" << core::FormatJsonNumber(d.ess)
      << ",\"entropy\":" << core::FormatJsonNumber(d.entropy)
      << ",\"resampled\":" << JsonBool(d.resampled)
      << ",\"numeric_degeneracy\":" << JsonBool(d.numeric_degeneracy);
  if (d.risk_evaluated) {
    out << ",\"belief_cvar\":" << core::FormatJsonNumber(d.belief_cvar);
  }
  out << ",\"claims\":" << ClaimsToJson(d.claims)
      << ",\"credal\":{\"active\":" << JsonBool(d.credal_active) << ",\"size\":" << d.credal_size
      << ",\"lower_mean\":" << core::FormatJsonArray(d.credal_lower_mean) << "}";
  out << ",\"query\":{\"triggered\":" << JsonBool(d.query_triggered)
      << ",\"evi\":" << core::FormatJsonNumber(d.evi);
  if (d.query_triggered) {
    out << ",\"entropy_before\":" << core::FormatJsonNumber(d.entropy_before_query)
        << ",\"entropy_after\":" << core::FormatJsonNumber(d.entropy_after_query)
        << ",\"cost\":" << core::FormatJsonNumber(d.query_cost);
  }
  out << "}";
  out << ",\"nominal_action\":" << core::FormatJsonArray(d.nominal_action)
      << ",\"action\":" << core::FormatJsonArray(d.action)
      << ",\"filter\":{\"outcome\":" << core::Quoted(safety::ToString(d.filter_outcome))
      << ",\"activated\":" << JsonBool(d.filter_activated)
      << ",\"slack\":" << core::FormatJsonNumber(d.slack)
      << ",\"iterations\":" << d.solver_iterations
      << ",\"margin\":" << core::FormatJsonNumber(d.safety_margin)
      << ",\"barrier\":" << core::FormatJsonNumber(d.barrier_value) << "}"
      << ",\"error\":{\"kind\":" << core::Quoted(core::errors::ToString(d.error_kind))
      << ",\"message\":" << core::Quoted(d.error_message) << "}}";
  return out.str();
}

bool AppendDiagnosticsJsonl(const controller::StepDiagnostics& diagnostics,
                            const std::size_t episode, const fs::path& output_dir,
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

  written_path = output_dir / "diagnostics.jsonl";
  std::ofstream out_file(written_path, std::ios::binary | std::ios::app);
  if (!out_file) {
    error = "failed to open diagnostics log '" + written_path.string() + "' for append";
    return false;
  }

  out_file << ToJson(diagnostics, episode) << '\n';
  if (!out_file) {
    error = "failed while writing diagnostics log '" + written_path.string() + "'";
    return false;
  }
  return true;
}

bool DiagnosticsJsonlWriter::Record(const controller::StepDiagnostics& diagnostics,
                                    std::string& error) {
  if (!AppendDiagnosticsJsonl(diagnostics, episode_, output_dir_, written_path_, error)) {
    return false;
  }
  ++records_;
  return true;
}

} // namespace rsa::recorder
