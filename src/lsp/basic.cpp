#include "lsp/basic.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

void to_json(nlohmann::json& j, const Position& p) {
  to_json_required(j, "line", p.line);
  to_json_required(j, "character", p.character);
}

void from_json(const nlohmann::json& j, Position& p) {
  from_json_required(j, "line", p.line);
  from_json_required(j, "character", p.character);
}

void to_json(nlohmann::json& j, const Range& r) {
  to_json_required(j, "start", r.start);
  to_json_required(j, "end", r.end);
}

void from_json(const nlohmann::json& j, Range& r) {
  from_json_required(j, "start", r.start);
  from_json_required(j, "end", r.end);
}

void to_json(nlohmann::json& j, const Location& l) {
  to_json_required(j, "uri", l.uri);
  to_json_required(j, "range", l.range);
}

void from_json(const nlohmann::json& j, Location& l) {
  from_json_required(j, "uri", l.uri);
  from_json_required(j, "range", l.range);
}

void to_json(nlohmann::json& j, const TextDocumentIdentifier& t) {
  to_json_required(j, "uri", t.uri);
}

void from_json(const nlohmann::json& j, TextDocumentIdentifier& t) {
  from_json_required(j, "uri", t.uri);
}

void to_json(nlohmann::json& j, const VersionedTextDocumentIdentifier& v) {
  to_json(j, static_cast<const TextDocumentIdentifier&>(v));
  to_json_required(j, "version", v.version);
}

void from_json(const nlohmann::json& j, VersionedTextDocumentIdentifier& v) {
  from_json(j, static_cast<TextDocumentIdentifier&>(v));
  from_json_required(j, "version", v.version);
}

void to_json(nlohmann::json& j, const TextDocumentItem& t) {
  to_json_required(j, "uri", t.uri);
  to_json_required(j, "languageId", t.languageId);
  to_json_required(j, "version", t.version);
  to_json_required(j, "text", t.text);
}

void from_json(const nlohmann::json& j, TextDocumentItem& t) {
  from_json_required(j, "uri", t.uri);
  from_json_required(j, "languageId", t.languageId);
  from_json_required(j, "version", t.version);
  from_json_required(j, "text", t.text);
}

void to_json(nlohmann::json& j, const TextDocumentPositionParams& t) {
  to_json_required(j, "textDocument", t.textDocument);
  to_json_required(j, "position", t.position);
}

void from_json(const nlohmann::json& j, TextDocumentPositionParams& t) {
  from_json_required(j, "textDocument", t.textDocument);
  from_json_required(j, "position", t.position);
}

void to_json(nlohmann::json& j, const WorkspaceFolder& w) {
  to_json_required(j, "uri", w.uri);
  to_json_required(j, "name", w.name);
}

void from_json(const nlohmann::json& j, WorkspaceFolder& w) {
  from_json_required(j, "uri", w.uri);
  from_json_required(j, "name", w.name);
}

}  // namespace lsp
