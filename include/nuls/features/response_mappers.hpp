#pragma once

#include <expected>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include <lsp/basic.hpp>
#include <lsp/diagnostic.hpp>
#include <lsp/document_features.hpp>
#include <lsp/error.hpp>
#include <lsp/navigation.hpp>
#include <spdlog/spdlog.h>

#include "nuls/compiler/compiler_backend.hpp"
#include "nuls/core/text_document.hpp"
#include "nuls/features/ide_types.hpp"

namespace nuls::features {

using lsp::error::LspError;

// Source label attached to published diagnostics
constexpr std::string_view kDiagnosticSource = "nu";

// File name the compiler reports for definitions in its built-in prelude
constexpr std::string_view kPreludeFile = "__prelude__";

// Decode the single JSON document printed by a completion, hover or goto
// query. Malformed output is a parse error naming the command line.
template <typename T>
auto DecodeResponse(const compiler::CompilerResponse& response)
    -> std::expected<T, LspError> {
  auto json = nlohmann::json::parse(response.stdout_text, nullptr, false);
  if (json.is_discarded()) {
    return LspError::UnexpectedFromCode(
        lsp::error::LspErrorCode::kParseError,
        "cannot parse response from " + response.cmdline);
  }
  try {
    return json.get<T>();
  } catch (const nlohmann::json::exception& e) {
    return LspError::UnexpectedFromCode(
        lsp::error::LspErrorCode::kParseError,
        "cannot parse response from " + response.cmdline + ": " + e.what());
  }
}

// Decode --ide-check output, one JSON object per line. Lines that do not
// parse and unknown tags are dropped.
auto DecodeChecks(std::string_view stdout_text) -> std::vector<IdeCheck>;

auto MapCompletions(const IdeComplete& complete)
    -> std::vector<lsp::CompletionItem>;

auto MapHover(const IdeHover& hover, const TextDocument& source) -> lsp::Hover;

// Resolve a definition reported by the compiler. Definitions in the prelude
// or in files missing on disk have no location, whatever their path, and
// definitions in the compiled temp file (`compiled_path`) point back into
// the source. An existing file that cannot become a uri is a parse error. The
// range is converted through the target document when it is open, else
// through the source.
auto MapGotoDefinition(
    const IdeGotoDef& definition, const TextDocument& source,
    const std::optional<TextDocument>& target, std::string_view compiled_path,
    std::shared_ptr<spdlog::logger> logger = nullptr)
    -> std::expected<lsp::DefinitionResult, LspError>;

// Uri of the file a definition points into, or nullopt when it has none
auto DefinitionUri(const IdeGotoDef& definition)
    -> std::expected<std::optional<std::string>, LspError>;

auto MapDiagnostic(
    const IdeCheckDiagnostic& diagnostic, const TextDocument& source)
    -> lsp::Diagnostic;

// Inferred types are shown after the end of the hinted span
auto MapInlayHint(const IdeCheckHint& hint, const TextDocument& source)
    -> lsp::InlayHint;

}  // namespace nuls::features
