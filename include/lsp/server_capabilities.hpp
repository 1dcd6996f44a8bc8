#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

enum class TextDocumentSyncKind {
  kNone = 0,
  kFull = 1,
  kIncremental = 2,
};

void to_json(nlohmann::json& j, const TextDocumentSyncKind& o);
void from_json(const nlohmann::json& j, TextDocumentSyncKind& o);

struct TextDocumentSyncOptions {
  std::optional<bool> openClose = true;
  std::optional<TextDocumentSyncKind> change = TextDocumentSyncKind::kFull;
};

void to_json(nlohmann::json& j, const TextDocumentSyncOptions& o);
void from_json(const nlohmann::json& j, TextDocumentSyncOptions& o);

struct CompletionOptions {
  std::optional<std::vector<std::string>> triggerCharacters;
  std::optional<bool> resolveProvider;
};

void to_json(nlohmann::json& j, const CompletionOptions& o);
void from_json(const nlohmann::json& j, CompletionOptions& o);

struct InlayHintOptions {
  std::optional<bool> resolveProvider;
};

void to_json(nlohmann::json& j, const InlayHintOptions& o);
void from_json(const nlohmann::json& j, InlayHintOptions& o);

struct WorkspaceFoldersServerCapabilities {
  std::optional<bool> supported;
  std::optional<bool> changeNotifications;
};

void to_json(nlohmann::json& j, const WorkspaceFoldersServerCapabilities& o);
void from_json(const nlohmann::json& j, WorkspaceFoldersServerCapabilities& o);

struct ServerCapabilities {
  std::optional<PositionEncodingKind> positionEncoding;
  std::optional<TextDocumentSyncOptions> textDocumentSync;
  std::optional<CompletionOptions> completionProvider;
  std::optional<bool> hoverProvider;
  std::optional<bool> definitionProvider;
  std::optional<InlayHintOptions> inlayHintProvider;

  struct Workspace {
    std::optional<WorkspaceFoldersServerCapabilities> workspaceFolders;
  };
  std::optional<Workspace> workspace;
};

void to_json(nlohmann::json& j, const ServerCapabilities::Workspace& o);
void from_json(const nlohmann::json& j, ServerCapabilities::Workspace& o);

void to_json(nlohmann::json& j, const ServerCapabilities& o);
void from_json(const nlohmann::json& j, ServerCapabilities& o);

}  // namespace lsp
