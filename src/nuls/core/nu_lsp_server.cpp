#include "nuls/core/nu_lsp_server.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace nuls {

using lsp::LspError;
using lsp::LspErrorCode;
using lsp::Ok;

namespace {

constexpr std::string_view kServerName = "nuls";
constexpr std::string_view kServerVersion = "0.1.0";
constexpr std::string_view kDidChangeConfigurationMethod =
    "workspace/didChangeConfiguration";

auto FolderNames(const std::vector<lsp::WorkspaceFolder>& folders)
    -> std::vector<std::string> {
  std::vector<std::string> names;
  names.reserve(folders.size());
  for (const auto& folder : folders) {
    names.push_back(folder.name);
  }
  return names;
}

}  // namespace

NuLspServer::NuLspServer(
    asio::any_io_executor executor,
    std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
    std::shared_ptr<LanguageServiceBase> language_service,
    std::shared_ptr<spdlog::logger> logger)
    : lsp::LspServer(executor, std::move(endpoint), logger),
      logger_(logger ? logger : spdlog::default_logger()),
      executor_(executor),
      language_service_(std::move(language_service)) {
  // Diagnostics are produced by validations that may finish after the
  // triggering notification was handled, so they are sent on their own
  language_service_->SetDiagnosticPublisher(
      [this](
          std::string uri, int version,
          std::vector<lsp::Diagnostic> diagnostics) {
        auto coroutine =
            [this, uri = std::move(uri), version,
             diagnostics = std::move(diagnostics)]() -> asio::awaitable<void> {
          auto result = co_await PublishDiagnostics(
              {.uri = uri, .version = version, .diagnostics = diagnostics});
          if (!result) {
            Logger()->warn("Diagnostics for {} were not delivered", uri);
          }
        };
        asio::co_spawn(executor_, std::move(coroutine), asio::detached);
      });

  language_service_->SetConfigurationFetcher(
      [this](lsp::ConfigurationParams params) {
        return GetConfiguration(std::move(params));
      });
}

auto NuLspServer::OnInitialize(lsp::InitializeParams params)
    -> asio::awaitable<std::expected<lsp::InitializeResult, lsp::LspError>> {
  if (initialized_) {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kInvalidRequest, "initialize may only be sent once");
  }
  initialized_ = true;

  language_service_->LatchCapabilities(
      params.capabilities.value_or(lsp::ClientCapabilities{}));

  lsp::TextDocumentSyncOptions sync_options{
      .openClose = true,
      .change = lsp::TextDocumentSyncKind::kIncremental,
  };

  lsp::ServerCapabilities::Workspace workspace{
      .workspaceFolders =
          lsp::WorkspaceFoldersServerCapabilities{
              .supported = true,
              .changeNotifications = true,
          },
  };

  lsp::ServerCapabilities capabilities{
      .positionEncoding = lsp::PositionEncodingKind::kUtf16,
      .textDocumentSync = sync_options,
      .completionProvider = lsp::CompletionOptions{},
      .hoverProvider = true,
      .definitionProvider = true,
      .inlayHintProvider = lsp::InlayHintOptions{.resolveProvider = false},
      .workspace = workspace,
  };

  co_return lsp::InitializeResult{
      .capabilities = capabilities,
      .serverInfo = lsp::ProductInfo{
          .name = std::string(kServerName),
          .version = std::string(kServerVersion)}};
}

auto NuLspServer::OnInitialized(lsp::InitializedParams /*unused*/)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  if (language_service_->CanChangeConfiguration()) {
    auto register_configuration = [this]() -> asio::awaitable<void> {
      auto registration = lsp::Registration{
          .id = std::string(kDidChangeConfigurationMethod),
          .method = std::string(kDidChangeConfigurationMethod),
      };
      auto result = co_await RegisterCapability(
          lsp::RegistrationParams{.registrations = {registration}});
      if (!result) {
        auto message = fmt::format(
            "Failed to register {}: {}", kDidChangeConfigurationMethod,
            result.error().Message());
        Logger()->info("{}", message);
        co_await ShowMessage(lsp::MessageType::kInfo, std::move(message));
      } else {
        Logger()->info("Registered {}", kDidChangeConfigurationMethod);
      }
    };
    asio::co_spawn(executor_, register_configuration, asio::detached);
  }

  Logger()->info("Server initialized");
  co_await ShowMessage(lsp::MessageType::kInfo, "server initialized!");
  co_return Ok();
}

auto NuLspServer::OnShutdown(lsp::ShutdownParams /*unused*/)
    -> asio::awaitable<std::expected<lsp::ShutdownResult, lsp::LspError>> {
  shutdown_requested_ = true;
  Logger()->info("Server shutdown requested");
  co_await ShowMessage(lsp::MessageType::kInfo, "server shutdown...!");
  co_return lsp::ShutdownResult{};
}

auto NuLspServer::OnExit(lsp::ExitParams /*unused*/)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  if (!shutdown_requested_) {
    Logger()->warn("Exit received before shutdown");
  }
  co_return co_await lsp::LspServer::Shutdown();
}

auto NuLspServer::OnDidOpenTextDocument(lsp::DidOpenTextDocumentParams params)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  auto& text_doc = params.textDocument;
  Logger()->debug("OnDidOpenTextDocument received: {}", text_doc.uri);

  auto result = co_await language_service_->OnDocumentOpened(
      text_doc.uri, std::move(text_doc.text), text_doc.version);
  if (!result) {
    co_await ReportNotificationFailure("textDocument/didOpen", result.error());
  }
  co_return Ok();
}

auto NuLspServer::OnDidChangeTextDocument(
    lsp::DidChangeTextDocumentParams params)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  Logger()->debug(
      "OnDidChangeTextDocument received: {} (version {})",
      params.textDocument.uri, params.textDocument.version);

  auto result = co_await language_service_->OnDocumentChanged(
      params.textDocument.uri, params.textDocument.version,
      std::move(params.contentChanges));
  if (!result) {
    co_await ReportNotificationFailure(
        "textDocument/didChange", result.error());
  }
  co_return Ok();
}

auto NuLspServer::OnDidCloseTextDocument(
    lsp::DidCloseTextDocumentParams params)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  Logger()->debug(
      "OnDidCloseTextDocument received: {}", params.textDocument.uri);
  language_service_->OnDocumentClosed(params.textDocument.uri);
  co_return Ok();
}

auto NuLspServer::OnGotoDefinition(lsp::DefinitionParams params)
    -> asio::awaitable<std::expected<lsp::DefinitionResult, lsp::LspError>> {
  Logger()->debug("OnGotoDefinition received: {}", params.textDocument.uri);
  co_return co_await language_service_->GetDefinition(
      params.textDocument.uri, params.position);
}

auto NuLspServer::OnHover(lsp::HoverParams params)
    -> asio::awaitable<std::expected<lsp::HoverResult, lsp::LspError>> {
  Logger()->debug("OnHover received: {}", params.textDocument.uri);
  co_return co_await language_service_->GetHover(
      params.textDocument.uri, params.position);
}

auto NuLspServer::OnInlayHint(lsp::InlayHintParams params)
    -> asio::awaitable<std::expected<lsp::InlayHintResult, lsp::LspError>> {
  Logger()->debug("OnInlayHint received: {}", params.textDocument.uri);
  auto hints = co_await language_service_->GetInlayHints(
      params.textDocument.uri, params.range);
  if (!hints) {
    co_return std::unexpected(hints.error());
  }
  co_return std::move(*hints);
}

auto NuLspServer::OnCompletion(lsp::CompletionParams params)
    -> asio::awaitable<std::expected<lsp::CompletionResult, lsp::LspError>> {
  Logger()->debug("OnCompletion received: {}", params.textDocument.uri);
  auto items = co_await language_service_->GetCompletions(
      params.textDocument.uri, params.position);
  if (!items) {
    co_return std::unexpected(items.error());
  }
  co_return std::move(*items);
}

auto NuLspServer::OnDidChangeConfiguration(
    lsp::DidChangeConfigurationParams params)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  Logger()->debug("OnDidChangeConfiguration received");
  auto result =
      co_await language_service_->OnConfigurationChanged(
          std::move(params.settings));
  if (!result) {
    co_await ReportNotificationFailure(
        "workspace/didChangeConfiguration", result.error());
  }
  co_return Ok();
}

auto NuLspServer::OnDidChangeWorkspaceFolders(
    lsp::DidChangeWorkspaceFoldersParams params)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  auto message = fmt::format(
      "workspace folders: added=[{}]; removed=[{}]",
      fmt::join(FolderNames(params.event.added), ", "),
      fmt::join(FolderNames(params.event.removed), ", "));
  Logger()->info("{}", message);
  co_await ShowMessage(lsp::MessageType::kInfo, std::move(message));
  co_return Ok();
}

auto NuLspServer::ReportNotificationFailure(
    std::string_view method, const lsp::LspError& error)
    -> asio::awaitable<void> {
  Logger()->error("{} failed: {}", method, error.Message());
  co_await ShowMessage(lsp::MessageType::kError, error.Message());
}

auto NuLspServer::ShowMessage(lsp::MessageType type, std::string message)
    -> asio::awaitable<void> {
  auto result = co_await LogMessage(
      lsp::LogMessageParams{.type = type, .message = message});
  if (!result) {
    Logger()->warn("Message not shown to the client: {}", message);
  }
}

}  // namespace nuls
