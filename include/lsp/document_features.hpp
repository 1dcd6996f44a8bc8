#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"
#include "lsp/json_utils.hpp"

namespace lsp {

// textDocument/hover
struct HoverParams : TextDocumentPositionParams {};

void to_json(nlohmann::json& j, const HoverParams& p);
void from_json(const nlohmann::json& j, HoverParams& p);

// `contents` is sent as a bare MarkedString, no markdown
struct Hover {
  std::string contents;
  std::optional<Range> range;
};

void to_json(nlohmann::json& j, const Hover& h);
void from_json(const nlohmann::json& j, Hover& h);

using HoverResult = std::optional<Hover>;

// textDocument/inlayHint
struct InlayHintParams {
  TextDocumentIdentifier textDocument;
  Range range{};
};

void to_json(nlohmann::json& j, const InlayHintParams& p);
void from_json(const nlohmann::json& j, InlayHintParams& p);

enum class InlayHintKind { kType = 1, kParameter = 2 };

void to_json(nlohmann::json& j, const InlayHintKind& k);
void from_json(const nlohmann::json& j, InlayHintKind& k);

struct InlayHint {
  Position position;
  std::string label;
  std::optional<InlayHintKind> kind;
  std::optional<bool> paddingLeft;

  friend auto operator==(const InlayHint&, const InlayHint&) -> bool = default;
};

void to_json(nlohmann::json& j, const InlayHint& h);
void from_json(const nlohmann::json& j, InlayHint& h);

using InlayHintResult = std::optional<std::vector<InlayHint>>;

// textDocument/completion
// The trigger context is not used, every request completes at `position`.
struct CompletionParams : TextDocumentPositionParams {};

void to_json(nlohmann::json& j, const CompletionParams& p);
void from_json(const nlohmann::json& j, CompletionParams& p);

// Only the kinds the compiler can report
enum class CompletionItemKind {
  kFunction = 3,
  kField = 5,
};

void to_json(nlohmann::json& j, const CompletionItemKind& k);
void from_json(const nlohmann::json& j, CompletionItemKind& k);

struct CompletionItem {
  std::string label;
  std::optional<CompletionItemKind> kind;
  std::optional<nlohmann::json> data;
};

void to_json(nlohmann::json& j, const CompletionItem& i);
void from_json(const nlohmann::json& j, CompletionItem& i);

using CompletionResult = std::optional<std::vector<CompletionItem>>;

}  // namespace lsp
