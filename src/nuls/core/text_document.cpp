#include "nuls/core/text_document.hpp"

#include <algorithm>

#include "nuls/utils/text_position.hpp"

namespace nuls {

TextDocument::TextDocument(std::string uri, std::string text, int version)
    : uri_(std::move(uri)),
      text_(std::move(text)),
      version_(version),
      line_breaks_(utils::FindLineBreaks(text_)) {
}

auto TextDocument::OffsetAt(const lsp::Position& position) const
    -> std::size_t {
  return utils::ConvertPosition(position, text_, line_breaks_);
}

auto TextDocument::PositionAt(std::size_t offset) const -> lsp::Position {
  return utils::PositionAt(offset, text_, line_breaks_);
}

auto TextDocument::RangeOf(std::size_t start, std::size_t end) const
    -> lsp::Range {
  return lsp::Range{.start = PositionAt(start), .end = PositionAt(end)};
}

auto TextDocument::Replace(std::string text) -> void {
  text_ = std::move(text);
  line_breaks_ = utils::FindLineBreaks(text_);
}

auto TextDocument::ApplyEdit(const lsp::Range& range, std::string_view new_text)
    -> void {
  const auto start = OffsetAt(range.start);
  const auto end = std::max(start, OffsetAt(range.end));
  text_.replace(start, end - start, new_text);
  line_breaks_ = utils::FindLineBreaks(text_);
}

}  // namespace nuls
