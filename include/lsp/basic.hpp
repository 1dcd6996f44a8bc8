#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace lsp {

using DocumentUri = std::string;

// Zero-based line and character offset. `character` counts UTF-16 code units
// unless another encoding was negotiated at initialize.
struct Position {
  int line;
  int character;

  friend auto operator==(const Position&, const Position&) -> bool = default;
};

void to_json(nlohmann::json& j, const Position& p);
void from_json(const nlohmann::json& j, Position& p);

enum class PositionEncodingKind {
  kUtf8,
  kUtf16,
  kUtf32,
};

NLOHMANN_JSON_SERIALIZE_ENUM(
    PositionEncodingKind, {
                              {PositionEncodingKind::kUtf8, "utf-8"},
                              {PositionEncodingKind::kUtf16, "utf-16"},
                              {PositionEncodingKind::kUtf32, "utf-32"},
                          })

// Half-open range, `end` is exclusive.
struct Range {
  Position start;
  Position end;

  friend auto operator==(const Range&, const Range&) -> bool = default;
};

void to_json(nlohmann::json& j, const Range& r);
void from_json(const nlohmann::json& j, Range& r);

struct Location {
  DocumentUri uri;
  Range range;
};

void to_json(nlohmann::json& j, const Location& l);
void from_json(const nlohmann::json& j, Location& l);

struct TextDocumentIdentifier {
  DocumentUri uri;
};

void to_json(nlohmann::json& j, const TextDocumentIdentifier& t);
void from_json(const nlohmann::json& j, TextDocumentIdentifier& t);

struct VersionedTextDocumentIdentifier : TextDocumentIdentifier {
  int version;
};

void to_json(nlohmann::json& j, const VersionedTextDocumentIdentifier& v);
void from_json(const nlohmann::json& j, VersionedTextDocumentIdentifier& v);

// Full document content as sent with didOpen
struct TextDocumentItem {
  DocumentUri uri;
  std::string languageId;
  int version;
  std::string text;
};

void to_json(nlohmann::json& j, const TextDocumentItem& t);
void from_json(const nlohmann::json& j, TextDocumentItem& t);

// Shared base of hover, completion and definition params
struct TextDocumentPositionParams {
  TextDocumentIdentifier textDocument;
  Position position;
};

void to_json(nlohmann::json& j, const TextDocumentPositionParams& t);
void from_json(const nlohmann::json& j, TextDocumentPositionParams& t);

struct WorkspaceFolder {
  DocumentUri uri;
  std::string name;
};

void to_json(nlohmann::json& j, const WorkspaceFolder& w);
void from_json(const nlohmann::json& j, WorkspaceFolder& w);

}  // namespace lsp
