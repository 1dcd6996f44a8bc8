#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

enum class DiagnosticSeverity {
  kError = 1,
  kWarning = 2,
  kInformation = 3,
  kHint = 4,
};

void to_json(nlohmann::json& j, const DiagnosticSeverity& d);
void from_json(const nlohmann::json& j, DiagnosticSeverity& d);

struct Diagnostic {
  Range range;
  std::optional<DiagnosticSeverity> severity;
  std::optional<std::string> code;
  std::optional<std::string> source;
  std::string message;
};

void to_json(nlohmann::json& j, const Diagnostic& d);
void from_json(const nlohmann::json& j, Diagnostic& d);

// textDocument/publishDiagnostics, server to client
struct PublishDiagnosticsParams {
  DocumentUri uri;
  std::optional<int> version;
  std::vector<Diagnostic> diagnostics;
};

void to_json(nlohmann::json& j, const PublishDiagnosticsParams& p);
void from_json(const nlohmann::json& j, PublishDiagnosticsParams& p);

}  // namespace lsp
