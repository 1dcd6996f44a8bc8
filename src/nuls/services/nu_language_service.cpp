#include "nuls/services/nu_language_service.hpp"

#include <mutex>
#include <variant>

#include "nuls/features/response_mappers.hpp"

namespace nuls::services {

using lsp::error::Ok;

namespace {

auto IsBefore(const lsp::Position& lhs, const lsp::Position& rhs) -> bool {
  return lhs.line < rhs.line ||
         (lhs.line == rhs.line && lhs.character < rhs.character);
}

auto IsWithin(const lsp::Position& position, const lsp::Range& range)
    -> bool {
  return !IsBefore(position, range.start) && !IsBefore(range.end, position);
}

}  // namespace

NuLanguageService::NuLanguageService(
    std::shared_ptr<compiler::CompilerBackend> backend,
    std::shared_ptr<spdlog::logger> logger, ValidationThrottle::Clock clock)
    : logger_(logger ? logger : spdlog::default_logger()),
      backend_(std::move(backend)),
      settings_(capabilities_, logger_),
      throttle_(std::move(clock)) {
}

auto NuLanguageService::SetDiagnosticPublisher(DiagnosticPublisher publisher)
    -> void {
  diagnostic_publisher_ = std::move(publisher);
}

auto NuLanguageService::SetConfigurationFetcher(ConfigurationFetcher fetcher)
    -> void {
  settings_.SetConfigurationFetcher(std::move(fetcher));
}

auto NuLanguageService::LatchCapabilities(
    const lsp::ClientCapabilities& capabilities) -> void {
  capabilities_.Latch(capabilities);
  logger_->debug(
      "Client capabilities: publishDiagnostics={} "
      "didChangeConfiguration={} configuration={}",
      capabilities_.CanPublishDiagnostics(),
      capabilities_.CanChangeConfiguration(),
      capabilities_.CanLookupConfiguration());
}

auto NuLanguageService::CanChangeConfiguration() const -> bool {
  return capabilities_.CanChangeConfiguration();
}

auto NuLanguageService::OnDocumentOpened(
    std::string uri, std::string content, int version)
    -> asio::awaitable<std::expected<void, LspError>> {
  documents_.Open(uri, std::move(content), version);
  co_return co_await ValidateDocument(std::move(uri));
}

auto NuLanguageService::OnDocumentChanged(
    std::string uri, int version,
    std::vector<lsp::TextDocumentContentChangeEvent> changes)
    -> asio::awaitable<std::expected<void, LspError>> {
  if (auto result = documents_.ApplyChange(uri, version, changes); !result) {
    co_return result;
  }
  co_return co_await ThrottledValidate(std::move(uri));
}

auto NuLanguageService::OnDocumentClosed(std::string uri) -> void {
  documents_.Close(uri);
  std::unique_lock lock(inlay_hints_mutex_);
  inlay_hints_.erase(uri);
}

auto NuLanguageService::OnConfigurationChanged(nlohmann::json settings)
    -> asio::awaitable<std::expected<void, LspError>> {
  settings_.OnConfigurationChanged(settings);

  std::expected<void, LspError> first_failure = Ok();
  for (auto& uri : documents_.Uris()) {
    auto result = co_await ValidateDocument(uri);
    if (!result) {
      logger_->warn(
          "Re-validation of {} failed: {}", uri, result.error().Message());
      if (first_failure) {
        first_failure = std::move(result);
      }
    }
  }
  co_return first_failure;
}

auto NuLanguageService::ThrottledValidate(std::string uri)
    -> asio::awaitable<std::expected<void, LspError>> {
  co_return co_await throttle_.Run(
      [this, uri = std::move(uri)]() { return ValidateDocument(uri); });
}

auto NuLanguageService::ValidateDocument(std::string uri)
    -> asio::awaitable<std::expected<void, LspError>> {
  if (!capabilities_.CanPublishDiagnostics()) {
    logger_->info("Client did not report diagnostic capability");
    co_return Ok();
  }

  auto document = documents_.Get(uri);
  if (!document) {
    co_return std::unexpected(document.error());
  }

  auto settings = co_await settings_.GetSettings(uri);
  if (!settings) {
    co_return std::unexpected(settings.error());
  }

  auto response = co_await RunCompiler(
      compiler::IdeOperation::Check(settings->max_number_of_problems),
      *document, *settings);
  if (!response) {
    co_return std::unexpected(response.error());
  }

  // Spans refer to the text that was compiled, so convert them through the
  // same snapshot even if the document changed meanwhile
  std::vector<lsp::Diagnostic> diagnostics;
  std::vector<lsp::InlayHint> hints;
  for (const auto& check : features::DecodeChecks(response->stdout_text)) {
    if (const auto* diagnostic =
            std::get_if<features::IdeCheckDiagnostic>(&check)) {
      diagnostics.push_back(features::MapDiagnostic(*diagnostic, *document));
    } else if (const auto* hint =
                   std::get_if<features::IdeCheckHint>(&check)) {
      hints.push_back(features::MapInlayHint(*hint, *document));
    }
  }

  auto current = documents_.Find(uri);
  if (!current) {
    logger_->debug("{} was closed during validation", uri);
    co_return Ok();
  }

  if (!settings->hints.show_inferred_types) {
    hints.clear();
  }
  StoreInlayHints(uri, std::move(hints));

  if (diagnostic_publisher_) {
    diagnostic_publisher_(uri, current->Version(), std::move(diagnostics));
  } else {
    logger_->warn("No diagnostic publisher installed, dropping {}", uri);
  }
  co_return Ok();
}

auto NuLanguageService::GetCompletions(std::string uri, lsp::Position position)
    -> asio::awaitable<
        std::expected<std::vector<lsp::CompletionItem>, LspError>> {
  auto document = documents_.Get(uri);
  if (!document) {
    co_return std::unexpected(document.error());
  }
  auto settings = co_await settings_.GetSettings(uri);
  if (!settings) {
    co_return std::unexpected(settings.error());
  }

  auto response = co_await RunCompiler(
      compiler::IdeOperation::Complete(document->OffsetAt(position)),
      *document, *settings);
  if (!response) {
    co_return std::unexpected(response.error());
  }

  auto complete =
      features::DecodeResponse<features::IdeComplete>(*response);
  if (!complete) {
    co_return std::unexpected(complete.error());
  }
  co_return features::MapCompletions(*complete);
}

auto NuLanguageService::GetDefinition(std::string uri, lsp::Position position)
    -> asio::awaitable<std::expected<lsp::DefinitionResult, LspError>> {
  auto document = documents_.Get(uri);
  if (!document) {
    co_return std::unexpected(document.error());
  }
  auto settings = co_await settings_.GetSettings(uri);
  if (!settings) {
    co_return std::unexpected(settings.error());
  }

  auto response = co_await RunCompiler(
      compiler::IdeOperation::GotoDefinition(document->OffsetAt(position)),
      *document, *settings);
  if (!response) {
    co_return std::unexpected(response.error());
  }

  auto definition =
      features::DecodeResponse<features::IdeGotoDef>(*response);
  if (!definition) {
    co_return std::unexpected(definition.error());
  }

  // Conversion failures are reported by MapGotoDefinition, and only for
  // files that exist
  std::optional<TextDocument> target;
  if (auto target_uri = features::DefinitionUri(*definition);
      target_uri && target_uri->has_value()) {
    target = documents_.Find(**target_uri);
  }

  co_return features::MapGotoDefinition(
      *definition, *document, target, response->source_path, logger_);
}

auto NuLanguageService::GetHover(std::string uri, lsp::Position position)
    -> asio::awaitable<std::expected<lsp::HoverResult, LspError>> {
  auto document = documents_.Get(uri);
  if (!document) {
    co_return std::unexpected(document.error());
  }
  auto settings = co_await settings_.GetSettings(uri);
  if (!settings) {
    co_return std::unexpected(settings.error());
  }

  auto response = co_await RunCompiler(
      compiler::IdeOperation::Hover(document->OffsetAt(position)), *document,
      *settings);
  if (!response) {
    co_return std::unexpected(response.error());
  }

  auto hover = features::DecodeResponse<features::IdeHover>(*response);
  if (!hover) {
    co_return std::unexpected(hover.error());
  }
  co_return features::MapHover(*hover, *document);
}

auto NuLanguageService::GetInlayHints(std::string uri, lsp::Range range)
    -> asio::awaitable<std::expected<std::vector<lsp::InlayHint>, LspError>> {
  std::vector<lsp::InlayHint> hints;
  {
    std::shared_lock lock(inlay_hints_mutex_);
    if (auto it = inlay_hints_.find(uri); it != inlay_hints_.end()) {
      for (const auto& hint : it->second) {
        if (IsWithin(hint.position, range)) {
          hints.push_back(hint);
        }
      }
    }
  }
  co_return hints;
}

auto NuLanguageService::RunCompiler(
    compiler::IdeOperation operation, const TextDocument& document,
    const IdeSettings& settings)
    -> asio::awaitable<std::expected<compiler::CompilerResponse, LspError>> {
  auto response = co_await backend_->Run(
      operation, document.Text(), settings, document.Uri());
  if (!response) {
    logger_->error(
        "{} query for {} failed: {}", compiler::ToFlag(operation.kind),
        document.Uri(), response.error().Message());
    co_return std::unexpected(response.error().ToLspError());
  }
  co_return std::move(*response);
}

auto NuLanguageService::StoreInlayHints(
    const std::string& uri, std::vector<lsp::InlayHint> hints) -> void {
  std::unique_lock lock(inlay_hints_mutex_);
  inlay_hints_.insert_or_assign(uri, std::move(hints));
}

}  // namespace nuls::services
