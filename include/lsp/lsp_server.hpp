#pragma once

#include <expected>
#include <memory>
#include <string>
#include <utility>

#include <asio.hpp>
#include <jsonrpc/endpoint/endpoint.hpp>
#include <spdlog/spdlog.h>

#include "lsp/diagnostic.hpp"
#include "lsp/document_features.hpp"
#include "lsp/document_sync.hpp"
#include "lsp/error.hpp"
#include "lsp/lifecycle.hpp"
#include "lsp/navigation.hpp"
#include "lsp/window.hpp"
#include "lsp/workspace.hpp"

namespace lsp {

using lsp::error::LspError;
using lsp::error::LspErrorCode;
using lsp::error::Ok;

// Binds the protocol methods the server speaks to virtual handlers and
// sends server-initiated messages over a JSON-RPC endpoint.
class LspServer {
 public:
  LspServer(
      asio::any_io_executor executor,
      std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  LspServer(const LspServer&) = delete;
  LspServer(LspServer&&) = delete;
  auto operator=(const LspServer&) -> LspServer& = delete;
  auto operator=(LspServer&&) -> LspServer& = delete;

  virtual ~LspServer() = default;

  // Serve until the endpoint shuts down
  auto Start() -> asio::awaitable<std::expected<void, LspError>>;
  auto Shutdown() -> asio::awaitable<std::expected<void, LspError>>;

  auto Logger() -> std::shared_ptr<spdlog::logger> {
    return logger_;
  }

 protected:
  template <typename Result>
  using Reply = asio::awaitable<std::expected<Result, LspError>>;

  // Lifecycle
  virtual auto OnInitialize(InitializeParams params)
      -> Reply<InitializeResult> = 0;
  virtual auto OnInitialized(InitializedParams params) -> Reply<void> = 0;
  virtual auto OnShutdown(ShutdownParams params) -> Reply<ShutdownResult> = 0;
  virtual auto OnExit(ExitParams params) -> Reply<void> = 0;

  // Document synchronization
  virtual auto OnDidOpenTextDocument(DidOpenTextDocumentParams params)
      -> Reply<void> = 0;
  virtual auto OnDidChangeTextDocument(DidChangeTextDocumentParams params)
      -> Reply<void> = 0;
  virtual auto OnDidCloseTextDocument(DidCloseTextDocumentParams params)
      -> Reply<void> = 0;

  // Language features
  virtual auto OnGotoDefinition(DefinitionParams params)
      -> Reply<DefinitionResult> = 0;
  virtual auto OnHover(HoverParams params) -> Reply<HoverResult> = 0;
  virtual auto OnInlayHint(InlayHintParams params)
      -> Reply<InlayHintResult> = 0;
  virtual auto OnCompletion(CompletionParams params)
      -> Reply<CompletionResult> = 0;

  // Workspace
  virtual auto OnDidChangeConfiguration(DidChangeConfigurationParams params)
      -> Reply<void> = 0;
  virtual auto OnDidChangeWorkspaceFolders(
      DidChangeWorkspaceFoldersParams params) -> Reply<void> = 0;

  // Server-initiated messages
  auto RegisterCapability(RegistrationParams params)
      -> Reply<RegistrationResult>;
  auto PublishDiagnostics(PublishDiagnosticsParams params) -> Reply<void>;
  auto GetConfiguration(ConfigurationParams params)
      -> Reply<ConfigurationResult>;
  auto LogMessage(LogMessageParams params) -> Reply<void>;

 private:
  template <typename Params, typename Result>
  using RequestHandler = Reply<Result> (LspServer::*)(Params);

  template <typename Params>
  using NotificationHandler = Reply<void> (LspServer::*)(Params);

  void RegisterHandlers();

  template <typename Params, typename Result>
  void BindRequest(
      const std::string& method, RequestHandler<Params, Result> handler) {
    endpoint_->RegisterMethodCall<Params, Result, LspError>(
        method, [this, handler](const Params& params) {
          return (this->*handler)(params);
        });
  }

  template <typename Params>
  void BindNotification(
      const std::string& method, NotificationHandler<Params> handler) {
    endpoint_->RegisterNotification<Params, LspError>(
        method, [this, handler](const Params& params) {
          return (this->*handler)(params);
        });
  }

  template <typename Params, typename Result>
  auto SendRequest(std::string method, Params params) -> Reply<Result> {
    auto result =
        co_await endpoint_->SendMethodCall<Params, Result>(method, params);
    if (!result) {
      Logger()->error("{} failed: {}", method, result.error().Message());
      co_return LspError::UnexpectedFromRpcError(result.error());
    }
    co_return std::move(*result);
  }

  template <typename Params>
  auto SendNotification(std::string method, Params params) -> Reply<void> {
    auto result =
        co_await endpoint_->SendNotification<Params>(method, params);
    if (!result) {
      Logger()->error(
          "{} was not delivered: {}", method, result.error().Message());
      co_return LspError::UnexpectedFromRpcError(result.error());
    }
    co_return Ok();
  }

  std::shared_ptr<spdlog::logger> logger_;
  std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint_;
  asio::any_io_executor executor_;
  asio::executor_work_guard<asio::any_io_executor> work_guard_;
};

}  // namespace lsp
