#include "lsp/client_capabilities.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

// Workspace specific client capabilities
void to_json(nlohmann::json& j, const WorkspaceClientCapabilities& c) {
  j = nlohmann::json::object();
  to_json_optional(j, "applyEdit", c.applyEdit);
  if (c.didChangeConfiguration.has_value()) {
    j["didChangeConfiguration"] = nlohmann::json::object();
  }
  to_json_optional(j, "workspaceFolders", c.workspaceFolders);
  to_json_optional(j, "configuration", c.configuration);
}

void from_json(const nlohmann::json& j, WorkspaceClientCapabilities& c) {
  from_json_optional(j, "applyEdit", c.applyEdit);
  from_json_presence(j, "didChangeConfiguration", c.didChangeConfiguration);
  from_json_optional(j, "workspaceFolders", c.workspaceFolders);
  from_json_optional(j, "configuration", c.configuration);
}

// Text document specific client capabilities
void to_json(nlohmann::json& j, const TextDocumentClientCapabilities& c) {
  j = nlohmann::json::object();
  if (c.publishDiagnostics.has_value()) {
    j["publishDiagnostics"] = nlohmann::json::object();
  }
  if (c.inlayHint.has_value()) {
    j["inlayHint"] = nlohmann::json::object();
  }
}

void from_json(const nlohmann::json& j, TextDocumentClientCapabilities& c) {
  from_json_presence(j, "publishDiagnostics", c.publishDiagnostics);
  from_json_presence(j, "inlayHint", c.inlayHint);
}

// General client capabilities
void to_json(nlohmann::json& j, const GeneralClientCapabilities& c) {
  j = nlohmann::json::object();
  to_json_optional(j, "positionEncodings", c.positionEncodings);
}

void from_json(const nlohmann::json& j, GeneralClientCapabilities& c) {
  from_json_optional(j, "positionEncodings", c.positionEncodings);
}

void to_json(nlohmann::json& j, const ClientCapabilities& c) {
  j = nlohmann::json::object();
  to_json_optional(j, "workspace", c.workspace);
  to_json_optional(j, "textDocument", c.textDocument);
  to_json_optional(j, "general", c.general);
  to_json_optional(j, "experimental", c.experimental);
}

void from_json(const nlohmann::json& j, ClientCapabilities& c) {
  from_json_optional(j, "workspace", c.workspace);
  from_json_optional(j, "textDocument", c.textDocument);
  from_json_optional(j, "general", c.general);
  from_json_optional(j, "experimental", c.experimental);
}

}  // namespace lsp
