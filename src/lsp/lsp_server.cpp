#include "lsp/lsp_server.hpp"

#include <utility>

namespace lsp {

LspServer::LspServer(
    asio::any_io_executor executor,
    std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
    std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()),
      endpoint_(std::move(endpoint)),
      executor_(executor),
      work_guard_(asio::make_work_guard(executor)) {
}

auto LspServer::Start() -> Reply<void> {
  RegisterHandlers();

  auto started = co_await endpoint_->Start();
  if (!started) {
    Logger()->error("Endpoint failed to start: {}", started.error().Message());
    co_return LspError::UnexpectedFromRpcError(started.error());
  }
  Logger()->debug("Endpoint started");

  auto stopped = co_await endpoint_->WaitForShutdown();
  if (!stopped) {
    Logger()->error(
        "Endpoint stopped with an error: {}", stopped.error().Message());
    co_return LspError::UnexpectedFromRpcError(stopped.error());
  }
  Logger()->debug("Endpoint stopped");
  co_return Ok();
}

auto LspServer::Shutdown() -> Reply<void> {
  Logger()->debug("Shutting down endpoint");

  if (endpoint_) {
    auto result = co_await endpoint_->Shutdown();
    if (!result) {
      Logger()->error(
          "Endpoint shutdown failed: {}", result.error().Message());
      co_return LspError::UnexpectedFromRpcError(result.error());
    }
  }

  // Let io_context::run return once pending work drains
  work_guard_.reset();
  co_return Ok();
}

void LspServer::RegisterHandlers() {
  BindRequest("initialize", &LspServer::OnInitialize);
  BindNotification("initialized", &LspServer::OnInitialized);
  BindRequest("shutdown", &LspServer::OnShutdown);
  BindNotification("exit", &LspServer::OnExit);

  BindNotification("textDocument/didOpen", &LspServer::OnDidOpenTextDocument);
  BindNotification(
      "textDocument/didChange", &LspServer::OnDidChangeTextDocument);
  BindNotification(
      "textDocument/didClose", &LspServer::OnDidCloseTextDocument);

  BindRequest("textDocument/definition", &LspServer::OnGotoDefinition);
  BindRequest("textDocument/hover", &LspServer::OnHover);
  BindRequest("textDocument/inlayHint", &LspServer::OnInlayHint);
  BindRequest("textDocument/completion", &LspServer::OnCompletion);

  BindNotification(
      "workspace/didChangeConfiguration",
      &LspServer::OnDidChangeConfiguration);
  BindNotification(
      "workspace/didChangeWorkspaceFolders",
      &LspServer::OnDidChangeWorkspaceFolders);
}

auto LspServer::RegisterCapability(RegistrationParams params)
    -> Reply<RegistrationResult> {
  return SendRequest<RegistrationParams, RegistrationResult>(
      "client/registerCapability", std::move(params));
}

auto LspServer::PublishDiagnostics(PublishDiagnosticsParams params)
    -> Reply<void> {
  return SendNotification<PublishDiagnosticsParams>(
      "textDocument/publishDiagnostics", std::move(params));
}

auto LspServer::GetConfiguration(ConfigurationParams params)
    -> Reply<ConfigurationResult> {
  return SendRequest<ConfigurationParams, ConfigurationResult>(
      "workspace/configuration", std::move(params));
}

auto LspServer::LogMessage(LogMessageParams params) -> Reply<void> {
  return SendNotification<LogMessageParams>(
      "window/logMessage", std::move(params));
}

}  // namespace lsp
