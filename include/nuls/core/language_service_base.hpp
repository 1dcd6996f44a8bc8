#pragma once

#include <expected>
#include <functional>
#include <string>
#include <vector>

#include <asio.hpp>
#include <lsp/basic.hpp>
#include <lsp/diagnostic.hpp>
#include <lsp/client_capabilities.hpp>
#include <lsp/document_features.hpp>
#include <lsp/document_sync.hpp>
#include <lsp/error.hpp>
#include <lsp/navigation.hpp>
#include <lsp/workspace.hpp>
#include <nlohmann/json.hpp>

namespace nuls {

using lsp::error::LspError;

// Business operations behind the protocol surface
class LanguageServiceBase {
 public:
  LanguageServiceBase() = default;
  LanguageServiceBase(const LanguageServiceBase&) = delete;
  LanguageServiceBase(LanguageServiceBase&&) = delete;
  auto operator=(const LanguageServiceBase&) -> LanguageServiceBase& = delete;
  auto operator=(LanguageServiceBase&&) -> LanguageServiceBase& = delete;
  virtual ~LanguageServiceBase() = default;

  using DiagnosticPublisher = std::function<void(
      std::string uri, int version, std::vector<lsp::Diagnostic>)>;

  virtual auto SetDiagnosticPublisher(DiagnosticPublisher publisher)
      -> void = 0;

  // Pulls workspace/configuration from the client
  using ConfigurationFetcher = std::function<
      asio::awaitable<std::expected<lsp::ConfigurationResult, LspError>>(
          lsp::ConfigurationParams)>;

  virtual auto SetConfigurationFetcher(ConfigurationFetcher fetcher)
      -> void = 0;

  // Record what the client supports; called once from initialize
  virtual auto LatchCapabilities(const lsp::ClientCapabilities& capabilities)
      -> void = 0;

  virtual auto CanChangeConfiguration() const -> bool = 0;

  // Document lifecycle events. Failures of the follow-up validation are
  // returned after the document state has been updated.
  virtual auto OnDocumentOpened(
      std::string uri, std::string content, int version)
      -> asio::awaitable<std::expected<void, LspError>> = 0;

  virtual auto OnDocumentChanged(
      std::string uri, int version,
      std::vector<lsp::TextDocumentContentChangeEvent> changes)
      -> asio::awaitable<std::expected<void, LspError>> = 0;

  virtual auto OnDocumentClosed(std::string uri) -> void = 0;

  // Settings changed on the client; re-validates every open document
  virtual auto OnConfigurationChanged(nlohmann::json settings)
      -> asio::awaitable<std::expected<void, LspError>> = 0;

  virtual auto GetCompletions(std::string uri, lsp::Position position)
      -> asio::awaitable<
          std::expected<std::vector<lsp::CompletionItem>, LspError>> = 0;

  virtual auto GetDefinition(std::string uri, lsp::Position position)
      -> asio::awaitable<std::expected<lsp::DefinitionResult, LspError>> = 0;

  virtual auto GetHover(std::string uri, lsp::Position position)
      -> asio::awaitable<std::expected<lsp::HoverResult, LspError>> = 0;

  // Inlay hints recorded by the last validation, within `range`
  virtual auto GetInlayHints(std::string uri, lsp::Range range)
      -> asio::awaitable<
          std::expected<std::vector<lsp::InlayHint>, LspError>> = 0;
};

}  // namespace nuls
