#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

// Capability bodies the server never inspects are modelled as empty structs;
// only their presence in the client's initialize request matters.
struct DidChangeConfigurationClientCapabilities {};

struct PublishDiagnosticsClientCapabilities {};

struct InlayHintClientCapabilities {};

// Workspace specific client capabilities
struct WorkspaceClientCapabilities {
  std::optional<bool> applyEdit;
  std::optional<DidChangeConfigurationClientCapabilities>
      didChangeConfiguration;
  std::optional<bool> workspaceFolders;
  std::optional<bool> configuration;
};

void to_json(nlohmann::json& j, const WorkspaceClientCapabilities& c);
void from_json(const nlohmann::json& j, WorkspaceClientCapabilities& c);

// Text document specific client capabilities
struct TextDocumentClientCapabilities {
  std::optional<PublishDiagnosticsClientCapabilities> publishDiagnostics;
  std::optional<InlayHintClientCapabilities> inlayHint;
};

void to_json(nlohmann::json& j, const TextDocumentClientCapabilities& c);
void from_json(const nlohmann::json& j, TextDocumentClientCapabilities& c);

// General client capabilities
// Encodings are kept as raw strings so that unknown values offered by newer
// clients do not fail the whole initialize request.
struct GeneralClientCapabilities {
  std::optional<std::vector<std::string>> positionEncodings;
};

void to_json(nlohmann::json& j, const GeneralClientCapabilities& c);
void from_json(const nlohmann::json& j, GeneralClientCapabilities& c);

struct ClientCapabilities {
  std::optional<WorkspaceClientCapabilities> workspace;
  std::optional<TextDocumentClientCapabilities> textDocument;
  std::optional<GeneralClientCapabilities> general;
  std::optional<nlohmann::json> experimental;
};

void to_json(nlohmann::json& j, const ClientCapabilities& c);
void from_json(const nlohmann::json& j, ClientCapabilities& c);

}  // namespace lsp
