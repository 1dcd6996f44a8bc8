#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "nuls/compiler/compiler_backend.hpp"
#include "nuls/core/capability_gate.hpp"
#include "nuls/core/language_service_base.hpp"
#include "nuls/services/document_store.hpp"
#include "nuls/services/settings_resolver.hpp"
#include "nuls/services/validation_throttle.hpp"

namespace nuls::services {

// Session state of one client connection and the operations on it.
// Every field carries its own lock, so a slow compiler call for one
// document never blocks requests on another.
class NuLanguageService : public LanguageServiceBase {
 public:
  NuLanguageService(
      std::shared_ptr<compiler::CompilerBackend> backend,
      std::shared_ptr<spdlog::logger> logger = nullptr,
      ValidationThrottle::Clock clock = nullptr);

  auto SetDiagnosticPublisher(DiagnosticPublisher publisher) -> void override;
  auto SetConfigurationFetcher(ConfigurationFetcher fetcher) -> void override;

  auto LatchCapabilities(const lsp::ClientCapabilities& capabilities)
      -> void override;
  auto CanChangeConfiguration() const -> bool override;

  auto OnDocumentOpened(std::string uri, std::string content, int version)
      -> asio::awaitable<std::expected<void, LspError>> override;

  auto OnDocumentChanged(
      std::string uri, int version,
      std::vector<lsp::TextDocumentContentChangeEvent> changes)
      -> asio::awaitable<std::expected<void, LspError>> override;

  auto OnDocumentClosed(std::string uri) -> void override;

  auto OnConfigurationChanged(nlohmann::json settings)
      -> asio::awaitable<std::expected<void, LspError>> override;

  auto GetCompletions(std::string uri, lsp::Position position)
      -> asio::awaitable<std::expected<std::vector<lsp::CompletionItem>,
                                       LspError>> override;

  auto GetDefinition(std::string uri, lsp::Position position)
      -> asio::awaitable<std::expected<lsp::DefinitionResult, LspError>>
      override;

  auto GetHover(std::string uri, lsp::Position position)
      -> asio::awaitable<std::expected<lsp::HoverResult, LspError>> override;

  auto GetInlayHints(std::string uri, lsp::Range range)
      -> asio::awaitable<std::expected<std::vector<lsp::InlayHint>, LspError>>
      override;

  // Run --ide-check for the document and publish its diagnostics
  auto ValidateDocument(std::string uri)
      -> asio::awaitable<std::expected<void, LspError>>;

  // ValidateDocument, skipped when a validation succeeded too recently
  auto ThrottledValidate(std::string uri)
      -> asio::awaitable<std::expected<void, LspError>>;

  auto Documents() -> DocumentStore& {
    return documents_;
  }
  auto Documents() const -> const DocumentStore& {
    return documents_;
  }
  auto Settings() -> SettingsResolver& {
    return settings_;
  }

 private:
  auto RunCompiler(
      compiler::IdeOperation operation, const TextDocument& document,
      const IdeSettings& settings)
      -> asio::awaitable<std::expected<compiler::CompilerResponse, LspError>>;

  auto StoreInlayHints(const std::string& uri, std::vector<lsp::InlayHint> hints)
      -> void;

  std::shared_ptr<spdlog::logger> logger_;
  std::shared_ptr<compiler::CompilerBackend> backend_;

  CapabilityGate capabilities_;
  DocumentStore documents_;
  SettingsResolver settings_;
  ValidationThrottle throttle_;

  mutable std::shared_mutex inlay_hints_mutex_;
  std::unordered_map<std::string, std::vector<lsp::InlayHint>> inlay_hints_;

  DiagnosticPublisher diagnostic_publisher_;
};

}  // namespace nuls::services
