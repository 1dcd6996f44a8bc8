#include "nuls/features/response_mappers.hpp"

#include <filesystem>
#include <system_error>

#include <fmt/format.h>

#include "nuls/utils/uri.hpp"

namespace nuls::features {

using lsp::error::LspErrorCode;

namespace {

auto DecodeCheckLine(std::string_view line) -> std::optional<IdeCheck> {
  auto json = nlohmann::json::parse(line, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    return std::nullopt;
  }
  auto type = json.find("type");
  if (type == json.end() || !type->is_string()) {
    return std::nullopt;
  }

  try {
    if (*type == "diagnostic") {
      return json.get<IdeCheckDiagnostic>();
    }
    if (*type == "hint") {
      return json.get<IdeCheckHint>();
    }
  } catch (const nlohmann::json::exception&) {
    return std::nullopt;
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  }
  return std::nullopt;
}

}  // namespace

auto DecodeChecks(std::string_view stdout_text) -> std::vector<IdeCheck> {
  std::vector<IdeCheck> checks;
  while (!stdout_text.empty()) {
    auto newline = stdout_text.find('\n');
    auto line = stdout_text.substr(0, newline);
    stdout_text.remove_prefix(
        newline == std::string_view::npos ? stdout_text.size() : newline + 1);

    if (auto check = DecodeCheckLine(line)) {
      checks.push_back(std::move(*check));
    }
  }
  return checks;
}

auto MapCompletions(const IdeComplete& complete)
    -> std::vector<lsp::CompletionItem> {
  std::vector<lsp::CompletionItem> items;
  items.reserve(complete.completions.size());
  for (std::size_t i = 0; i < complete.completions.size(); ++i) {
    const auto& label = complete.completions[i];
    items.push_back(lsp::CompletionItem{
        .label = label,
        .kind = label.find('(') != std::string::npos
                    ? lsp::CompletionItemKind::kFunction
                    : lsp::CompletionItemKind::kField,
        .data = i + 1,
    });
  }
  return items;
}

auto MapHover(const IdeHover& hover, const TextDocument& source)
    -> lsp::Hover {
  lsp::Hover result{.contents = hover.hover};
  if (hover.span) {
    result.range = source.RangeOf(hover.span->start, hover.span->end);
  }
  return result;
}

auto DefinitionUri(const IdeGotoDef& definition)
    -> std::expected<std::optional<std::string>, LspError> {
  if (definition.file.empty() || definition.file == kPreludeFile) {
    return std::nullopt;
  }

  std::filesystem::path path(definition.file);
  if (!path.is_absolute()) {
    return LspError::UnexpectedFromCode(
        LspErrorCode::kParseError,
        "failed to parse filesystem path in response from `nu "
        "--ide-goto-def`");
  }
  return utils::PathToUri(path.lexically_normal().string());
}

auto MapGotoDefinition(
    const IdeGotoDef& definition, const TextDocument& source,
    const std::optional<TextDocument>& target, std::string_view compiled_path,
    std::shared_ptr<spdlog::logger> logger)
    -> std::expected<lsp::DefinitionResult, LspError> {
  if (!logger) {
    logger = spdlog::default_logger();
  }

  if (!compiled_path.empty() && definition.file == compiled_path) {
    return lsp::Location{
        .uri = source.Uri(),
        .range = source.RangeOf(definition.start, definition.end),
    };
  }

  if (definition.file.empty() || definition.file == kPreludeFile) {
    return std::nullopt;
  }

  // Existence is checked first so a missing file is never an error
  std::error_code ec;
  if (!std::filesystem::exists(definition.file, ec)) {
    logger->error("File {} does not exist", definition.file);
    return std::nullopt;
  }

  auto uri = DefinitionUri(definition);
  if (!uri) {
    return std::unexpected(uri.error());
  }
  if (!uri->has_value()) {
    return std::nullopt;
  }

  const auto& document = target ? *target : source;
  return lsp::Location{
      .uri = std::move(**uri),
      .range = document.RangeOf(definition.start, definition.end),
  };
}

auto MapDiagnostic(
    const IdeCheckDiagnostic& diagnostic, const TextDocument& source)
    -> lsp::Diagnostic {
  return lsp::Diagnostic{
      .range = source.RangeOf(diagnostic.span.start, diagnostic.span.end),
      .severity = diagnostic.severity,
      .source = std::string(kDiagnosticSource),
      .message = diagnostic.message,
  };
}

auto MapInlayHint(const IdeCheckHint& hint, const TextDocument& source)
    -> lsp::InlayHint {
  return lsp::InlayHint{
      .position = source.PositionAt(hint.position.end),
      .label = hint.type_name,
      .kind = lsp::InlayHintKind::kType,
      .paddingLeft = true,
  };
}

}  // namespace nuls::features
