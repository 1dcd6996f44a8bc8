#include "lsp/diagnostic.hpp"

#include <stdexcept>

#include "lsp/json_utils.hpp"

namespace lsp {

void to_json(nlohmann::json& j, const DiagnosticSeverity& d) {
  j = static_cast<int>(d);
}

void from_json(const nlohmann::json& j, DiagnosticSeverity& d) {
  auto value = j.get<int>();
  if (value < static_cast<int>(DiagnosticSeverity::kError) ||
      value > static_cast<int>(DiagnosticSeverity::kHint)) {
    throw std::out_of_range("diagnostic severity out of range");
  }
  d = static_cast<DiagnosticSeverity>(value);
}

void to_json(nlohmann::json& j, const Diagnostic& d) {
  to_json_required(j, "range", d.range);
  to_json_optional(j, "severity", d.severity);
  to_json_optional(j, "code", d.code);
  to_json_optional(j, "source", d.source);
  to_json_required(j, "message", d.message);
}

void from_json(const nlohmann::json& j, Diagnostic& d) {
  from_json_required(j, "range", d.range);
  from_json_optional(j, "severity", d.severity);
  from_json_optional(j, "code", d.code);
  from_json_optional(j, "source", d.source);
  from_json_required(j, "message", d.message);
}

void to_json(nlohmann::json& j, const PublishDiagnosticsParams& p) {
  to_json_required(j, "uri", p.uri);
  to_json_optional(j, "version", p.version);
  to_json_required(j, "diagnostics", p.diagnostics);
}

void from_json(const nlohmann::json& j, PublishDiagnosticsParams& p) {
  from_json_required(j, "uri", p.uri);
  from_json_optional(j, "version", p.version);
  from_json_required(j, "diagnostics", p.diagnostics);
}

}  // namespace lsp
