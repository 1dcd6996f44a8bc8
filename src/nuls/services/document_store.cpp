#include "nuls/services/document_store.hpp"

#include <mutex>
#include <type_traits>
#include <variant>

#include <fmt/format.h>

namespace nuls::services {

using lsp::error::LspErrorCode;

namespace {

auto DocumentNotFound(const std::string& uri) -> std::unexpected<LspError> {
  return LspError::UnexpectedFromCode(
      LspErrorCode::kDocumentNotFound,
      fmt::format("document not found: {}", uri));
}

}  // namespace

auto DocumentStore::Open(std::string uri, std::string text, int version)
    -> void {
  std::unique_lock lock(mutex_);
  auto key = uri;
  documents_.insert_or_assign(
      std::move(key), TextDocument(std::move(uri), std::move(text), version));
}

auto DocumentStore::ApplyChange(
    const std::string& uri, int version,
    const std::vector<lsp::TextDocumentContentChangeEvent>& changes)
    -> std::expected<void, LspError> {
  std::unique_lock lock(mutex_);
  auto it = documents_.find(uri);
  if (it == documents_.end()) {
    return DocumentNotFound(uri);
  }

  auto& document = it->second;
  for (const auto& change : changes) {
    std::visit(
        [&document](const auto& event) {
          using T = std::decay_t<decltype(event)>;
          if constexpr (std::is_same_v<
                            T, lsp::TextDocumentContentPartialChangeEvent>) {
            document.ApplyEdit(event.range, event.text);
          } else {
            document.Replace(event.text);
          }
        },
        change);
  }
  document.SetVersion(version);
  return {};
}

auto DocumentStore::Close(const std::string& uri) -> void {
  std::unique_lock lock(mutex_);
  documents_.erase(uri);
}

auto DocumentStore::Contains(const std::string& uri) const -> bool {
  std::shared_lock lock(mutex_);
  return documents_.contains(uri);
}

auto DocumentStore::Get(const std::string& uri) const
    -> std::expected<TextDocument, LspError> {
  if (auto document = Find(uri)) {
    return std::move(*document);
  }
  return DocumentNotFound(uri);
}

auto DocumentStore::Find(const std::string& uri) const
    -> std::optional<TextDocument> {
  std::shared_lock lock(mutex_);
  auto it = documents_.find(uri);
  if (it == documents_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto DocumentStore::GetContent(const std::string& uri) const
    -> std::expected<std::string, LspError> {
  std::shared_lock lock(mutex_);
  auto it = documents_.find(uri);
  if (it == documents_.end()) {
    return DocumentNotFound(uri);
  }
  return it->second.Text();
}

auto DocumentStore::OffsetAt(
    const std::string& uri, const lsp::Position& position) const
    -> std::expected<std::size_t, LspError> {
  std::shared_lock lock(mutex_);
  auto it = documents_.find(uri);
  if (it == documents_.end()) {
    return DocumentNotFound(uri);
  }
  return it->second.OffsetAt(position);
}

auto DocumentStore::PositionAt(const std::string& uri, std::size_t offset) const
    -> std::expected<lsp::Position, LspError> {
  std::shared_lock lock(mutex_);
  auto it = documents_.find(uri);
  if (it == documents_.end()) {
    return DocumentNotFound(uri);
  }
  return it->second.PositionAt(offset);
}

auto DocumentStore::Uris() const -> std::vector<std::string> {
  std::shared_lock lock(mutex_);
  std::vector<std::string> uris;
  uris.reserve(documents_.size());
  for (const auto& [uri, document] : documents_) {
    uris.push_back(uri);
  }
  return uris;
}

}  // namespace nuls::services
