#include "lsp/document_sync.hpp"

#include <variant>

#include "lsp/json_utils.hpp"

namespace lsp {

void to_json(nlohmann::json& j, const DidOpenTextDocumentParams& p) {
  to_json_required(j, "textDocument", p.textDocument);
}

void from_json(const nlohmann::json& j, DidOpenTextDocumentParams& p) {
  from_json_required(j, "textDocument", p.textDocument);
}

void to_json(
    nlohmann::json& j, const TextDocumentContentPartialChangeEvent& e) {
  to_json_required(j, "range", e.range);
  to_json_optional(j, "rangeLength", e.rangeLength);
  to_json_required(j, "text", e.text);
}

void from_json(
    const nlohmann::json& j, TextDocumentContentPartialChangeEvent& e) {
  from_json_required(j, "range", e.range);
  from_json_optional(j, "rangeLength", e.rangeLength);
  from_json_required(j, "text", e.text);
}

void to_json(nlohmann::json& j, const TextDocumentContentFullChangeEvent& e) {
  to_json_required(j, "text", e.text);
}

void from_json(const nlohmann::json& j, TextDocumentContentFullChangeEvent& e) {
  from_json_required(j, "text", e.text);
}

void to_json(nlohmann::json& j, const TextDocumentContentChangeEvent& e) {
  std::visit([&j](const auto& event) { to_json(j, event); }, e);
}

// The two event shapes differ only by the presence of `range`
void from_json(const nlohmann::json& j, TextDocumentContentChangeEvent& e) {
  if (j.contains("range")) {
    e = j.get<TextDocumentContentPartialChangeEvent>();
    return;
  }
  e = j.get<TextDocumentContentFullChangeEvent>();
}

void to_json(nlohmann::json& j, const DidChangeTextDocumentParams& p) {
  to_json_required(j, "textDocument", p.textDocument);
  to_json_required(j, "contentChanges", p.contentChanges);
}

void from_json(const nlohmann::json& j, DidChangeTextDocumentParams& p) {
  from_json_required(j, "textDocument", p.textDocument);
  from_json_required(j, "contentChanges", p.contentChanges);
}

void to_json(nlohmann::json& j, const DidCloseTextDocumentParams& p) {
  to_json_required(j, "textDocument", p.textDocument);
}

void from_json(const nlohmann::json& j, DidCloseTextDocumentParams& p) {
  from_json_required(j, "textDocument", p.textDocument);
}

}  // namespace lsp
