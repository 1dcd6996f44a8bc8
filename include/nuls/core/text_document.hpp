#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <lsp/basic.hpp>

namespace nuls {

// An open document: its uri, full text, version and the byte offsets of its
// line breaks, kept in sync with the text.
class TextDocument {
 public:
  TextDocument(std::string uri, std::string text, int version);

  [[nodiscard]] auto Uri() const -> const std::string& {
    return uri_;
  }
  [[nodiscard]] auto Text() const -> const std::string& {
    return text_;
  }
  [[nodiscard]] auto Version() const -> int {
    return version_;
  }
  [[nodiscard]] auto LineBreaks() const -> const std::vector<std::size_t>& {
    return line_breaks_;
  }

  // Position (UTF-16) to byte offset, clamping out-of-range input
  [[nodiscard]] auto OffsetAt(const lsp::Position& position) const
      -> std::size_t;

  // Byte offset to position (UTF-16), clamping past the end of the text
  [[nodiscard]] auto PositionAt(std::size_t offset) const -> lsp::Position;

  [[nodiscard]] auto RangeOf(std::size_t start, std::size_t end) const
      -> lsp::Range;

  auto Replace(std::string text) -> void;

  // Replace the text covered by `range`. An end before the start is treated
  // as an empty range at the start.
  auto ApplyEdit(const lsp::Range& range, std::string_view new_text) -> void;

  auto SetVersion(int version) -> void {
    version_ = version;
  }

 private:
  std::string uri_;
  std::string text_;
  int version_;
  std::vector<std::size_t> line_breaks_;
};

}  // namespace nuls
