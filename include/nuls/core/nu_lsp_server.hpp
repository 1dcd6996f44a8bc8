#pragma once

#include <memory>
#include <string_view>

#include <asio.hpp>

#include "lsp/lifecycle.hpp"
#include "lsp/lsp_server.hpp"
#include "nuls/core/language_service_base.hpp"

namespace nuls {

class NuLspServer : public lsp::LspServer {
 public:
  NuLspServer(
      asio::any_io_executor executor,
      std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
      std::shared_ptr<LanguageServiceBase> language_service,
      std::shared_ptr<spdlog::logger> logger = nullptr);

 private:
  // Server state
  bool initialized_ = false;
  bool shutdown_requested_ = false;

  std::shared_ptr<spdlog::logger> logger_;
  asio::any_io_executor executor_;

  std::shared_ptr<LanguageServiceBase> language_service_{nullptr};

  // Notification failures have no response to carry them, so they are
  // logged and shown to the user through window/logMessage
  auto ReportNotificationFailure(
      std::string_view method, const lsp::LspError& error)
      -> asio::awaitable<void>;

  auto ShowMessage(lsp::MessageType type, std::string message)
      -> asio::awaitable<void>;

 protected:
  // Initialize Request
  auto OnInitialize(lsp::InitializeParams params) -> asio::awaitable<
      std::expected<lsp::InitializeResult, lsp::LspError>> override;

  // Initialized Notification
  auto OnInitialized(lsp::InitializedParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Shutdown Request
  auto OnShutdown(lsp::ShutdownParams params) -> asio::awaitable<
      std::expected<lsp::ShutdownResult, lsp::LspError>> override;

  // Exit Notification
  auto OnExit(lsp::ExitParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Did Open Text Document Notification
  auto OnDidOpenTextDocument(lsp::DidOpenTextDocumentParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Did Change Text Document Notification
  auto OnDidChangeTextDocument(lsp::DidChangeTextDocumentParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Did Close Text Document Notification
  auto OnDidCloseTextDocument(lsp::DidCloseTextDocumentParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Goto Definition Request
  auto OnGotoDefinition(lsp::DefinitionParams params) -> asio::awaitable<
      std::expected<lsp::DefinitionResult, lsp::LspError>> override;

  // Hover Request
  auto OnHover(lsp::HoverParams params)
      -> asio::awaitable<std::expected<lsp::HoverResult, lsp::LspError>>
      override;

  // Inlay Hint Request
  auto OnInlayHint(lsp::InlayHintParams params) -> asio::awaitable<
      std::expected<lsp::InlayHintResult, lsp::LspError>> override;

  // Completion Request
  auto OnCompletion(lsp::CompletionParams params) -> asio::awaitable<
      std::expected<lsp::CompletionResult, lsp::LspError>> override;

  // DidChangeConfiguration Notification
  auto OnDidChangeConfiguration(lsp::DidChangeConfigurationParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // DidChangeWorkspaceFolders Notification
  auto OnDidChangeWorkspaceFolders(lsp::DidChangeWorkspaceFoldersParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;
};

}  // namespace nuls
