#include "lsp/document_features.hpp"

#include <stdexcept>

#include "lsp/json_utils.hpp"

namespace lsp {

void to_json(nlohmann::json& j, const HoverParams& p) {
  to_json(j, static_cast<const TextDocumentPositionParams&>(p));
}

void from_json(const nlohmann::json& j, HoverParams& p) {
  from_json(j, static_cast<TextDocumentPositionParams&>(p));
}

void to_json(nlohmann::json& j, const Hover& h) {
  to_json_required(j, "contents", h.contents);
  to_json_optional(j, "range", h.range);
}

void from_json(const nlohmann::json& j, Hover& h) {
  from_json_required(j, "contents", h.contents);
  from_json_optional(j, "range", h.range);
}

void to_json(nlohmann::json& j, const InlayHintParams& p) {
  to_json_required(j, "textDocument", p.textDocument);
  to_json_required(j, "range", p.range);
}

void from_json(const nlohmann::json& j, InlayHintParams& p) {
  from_json_required(j, "textDocument", p.textDocument);
  from_json_required(j, "range", p.range);
}

void to_json(nlohmann::json& j, const InlayHintKind& k) {
  j = static_cast<int>(k);
}

void from_json(const nlohmann::json& j, InlayHintKind& k) {
  switch (auto value = j.get<int>()) {
    case static_cast<int>(InlayHintKind::kType):
    case static_cast<int>(InlayHintKind::kParameter):
      k = static_cast<InlayHintKind>(value);
      return;
    default:
      throw std::out_of_range("unknown inlay hint kind");
  }
}

void to_json(nlohmann::json& j, const InlayHint& h) {
  to_json_required(j, "position", h.position);
  to_json_required(j, "label", h.label);
  to_json_optional(j, "kind", h.kind);
  to_json_optional(j, "paddingLeft", h.paddingLeft);
}

void from_json(const nlohmann::json& j, InlayHint& h) {
  from_json_required(j, "position", h.position);
  from_json_required(j, "label", h.label);
  from_json_optional(j, "kind", h.kind);
  from_json_optional(j, "paddingLeft", h.paddingLeft);
}

void to_json(nlohmann::json& j, const CompletionParams& p) {
  to_json(j, static_cast<const TextDocumentPositionParams&>(p));
}

void from_json(const nlohmann::json& j, CompletionParams& p) {
  from_json(j, static_cast<TextDocumentPositionParams&>(p));
}

void to_json(nlohmann::json& j, const CompletionItemKind& k) {
  j = static_cast<int>(k);
}

void from_json(const nlohmann::json& j, CompletionItemKind& k) {
  switch (auto value = j.get<int>()) {
    case static_cast<int>(CompletionItemKind::kFunction):
    case static_cast<int>(CompletionItemKind::kField):
      k = static_cast<CompletionItemKind>(value);
      return;
    default:
      throw std::out_of_range("unknown completion item kind");
  }
}

void to_json(nlohmann::json& j, const CompletionItem& i) {
  to_json_required(j, "label", i.label);
  to_json_optional(j, "kind", i.kind);
  to_json_optional(j, "data", i.data);
}

void from_json(const nlohmann::json& j, CompletionItem& i) {
  from_json_required(j, "label", i.label);
  from_json_optional(j, "kind", i.kind);
  from_json_optional(j, "data", i.data);
}

}  // namespace lsp
