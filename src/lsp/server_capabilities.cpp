#include "lsp/server_capabilities.hpp"

#include <stdexcept>

#include "lsp/json_utils.hpp"

namespace lsp {

void to_json(nlohmann::json& j, const TextDocumentSyncKind& o) {
  j = static_cast<int>(o);
}

void from_json(const nlohmann::json& j, TextDocumentSyncKind& o) {
  auto value = j.get<int>();
  if (value < 0 || value > 2) {
    throw std::runtime_error("Invalid text document sync kind");
  }
  o = static_cast<TextDocumentSyncKind>(value);
}

void to_json(nlohmann::json& j, const TextDocumentSyncOptions& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "openClose", o.openClose);
  to_json_optional(j, "change", o.change);
}

void from_json(const nlohmann::json& j, TextDocumentSyncOptions& o) {
  from_json_optional(j, "openClose", o.openClose);
  from_json_optional(j, "change", o.change);
}

void to_json(nlohmann::json& j, const CompletionOptions& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "triggerCharacters", o.triggerCharacters);
  to_json_optional(j, "resolveProvider", o.resolveProvider);
}

void from_json(const nlohmann::json& j, CompletionOptions& o) {
  from_json_optional(j, "triggerCharacters", o.triggerCharacters);
  from_json_optional(j, "resolveProvider", o.resolveProvider);
}

void to_json(nlohmann::json& j, const InlayHintOptions& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "resolveProvider", o.resolveProvider);
}

void from_json(const nlohmann::json& j, InlayHintOptions& o) {
  from_json_optional(j, "resolveProvider", o.resolveProvider);
}

void to_json(nlohmann::json& j, const WorkspaceFoldersServerCapabilities& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "supported", o.supported);
  to_json_optional(j, "changeNotifications", o.changeNotifications);
}

void from_json(
    const nlohmann::json& j, WorkspaceFoldersServerCapabilities& o) {
  from_json_optional(j, "supported", o.supported);
  from_json_optional(j, "changeNotifications", o.changeNotifications);
}

void to_json(nlohmann::json& j, const ServerCapabilities::Workspace& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "workspaceFolders", o.workspaceFolders);
}

void from_json(const nlohmann::json& j, ServerCapabilities::Workspace& o) {
  from_json_optional(j, "workspaceFolders", o.workspaceFolders);
}

void to_json(nlohmann::json& j, const ServerCapabilities& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "positionEncoding", o.positionEncoding);
  to_json_optional(j, "textDocumentSync", o.textDocumentSync);
  to_json_optional(j, "completionProvider", o.completionProvider);
  to_json_optional(j, "hoverProvider", o.hoverProvider);
  to_json_optional(j, "definitionProvider", o.definitionProvider);
  to_json_optional(j, "inlayHintProvider", o.inlayHintProvider);
  to_json_optional(j, "workspace", o.workspace);
}

void from_json(const nlohmann::json& j, ServerCapabilities& o) {
  from_json_optional(j, "positionEncoding", o.positionEncoding);
  from_json_optional(j, "textDocumentSync", o.textDocumentSync);
  from_json_optional(j, "completionProvider", o.completionProvider);
  from_json_optional(j, "hoverProvider", o.hoverProvider);
  from_json_optional(j, "definitionProvider", o.definitionProvider);
  from_json_optional(j, "inlayHintProvider", o.inlayHintProvider);
  from_json_optional(j, "workspace", o.workspace);
}

}  // namespace lsp
