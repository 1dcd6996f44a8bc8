#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <lsp/basic.hpp>
#include <lsp/document_sync.hpp>
#include <lsp/error.hpp>

#include "nuls/core/text_document.hpp"

namespace nuls::services {

using lsp::error::LspError;

// Open documents keyed by uri.
// Readers take a shared lock and writers an exclusive one; callers receive
// copies so no lock outlives a call.
class DocumentStore {
 public:
  DocumentStore() = default;

  // Insert or replace the document
  auto Open(std::string uri, std::string text, int version) -> void;

  // Apply the content changes of one didChange notification in order.
  // Range edits are expressed against the text produced by the preceding
  // edits of the same notification.
  auto ApplyChange(
      const std::string& uri, int version,
      const std::vector<lsp::TextDocumentContentChangeEvent>& changes)
      -> std::expected<void, LspError>;

  auto Close(const std::string& uri) -> void;

  [[nodiscard]] auto Contains(const std::string& uri) const -> bool;

  // Snapshot of the document, or a document-not-found error
  auto Get(const std::string& uri) const -> std::expected<TextDocument, LspError>;

  // Snapshot of the document when it is tracked
  auto Find(const std::string& uri) const -> std::optional<TextDocument>;

  auto GetContent(const std::string& uri) const
      -> std::expected<std::string, LspError>;

  auto OffsetAt(const std::string& uri, const lsp::Position& position) const
      -> std::expected<std::size_t, LspError>;

  auto PositionAt(const std::string& uri, std::size_t offset) const
      -> std::expected<lsp::Position, LspError>;

  // Uris of all open documents
  auto Uris() const -> std::vector<std::string>;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, TextDocument> documents_;
};

}  // namespace nuls::services
