#include "nuls/utils/text_position.hpp"

#include <algorithm>

#include "nuls/utils/utf8.hpp"

namespace nuls::utils {

namespace {

auto LineStart(
    std::size_t line, const std::vector<std::size_t>& line_breaks)
    -> std::size_t {
  return line == 0 ? 0 : line_breaks[line - 1] + 1;
}

auto LineEnd(
    std::size_t line, std::string_view text,
    const std::vector<std::size_t>& line_breaks) -> std::size_t {
  return line < line_breaks.size() ? line_breaks[line] : text.size();
}

}  // namespace

auto FindLineBreaks(std::string_view text) -> std::vector<std::size_t> {
  std::vector<std::size_t> line_breaks;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\n') {
      line_breaks.push_back(i);
    }
  }
  return line_breaks;
}

auto FindLineBreak(
    const std::vector<std::size_t>& line_breaks, std::size_t offset)
    -> std::optional<std::size_t> {
  auto it = std::upper_bound(line_breaks.begin(), line_breaks.end(), offset);
  if (it == line_breaks.begin()) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(std::distance(line_breaks.begin(), it) - 1);
}

auto ConvertPosition(const lsp::Position& position, std::string_view text)
    -> std::size_t {
  return ConvertPosition(position, text, FindLineBreaks(text));
}

auto ConvertPosition(
    const lsp::Position& position, std::string_view text,
    const std::vector<std::size_t>& line_breaks) -> std::size_t {
  const auto line = static_cast<std::size_t>(std::max(position.line, 0));
  const auto character =
      static_cast<std::size_t>(std::max(position.character, 0));

  if (line > line_breaks.size()) {
    return text.size();
  }

  auto offset = LineStart(line, line_breaks);
  const auto line_end = LineEnd(line, text, line_breaks);

  std::size_t units = 0;
  while (offset < line_end && units < character) {
    auto step = NextUtf8Step(text, offset);
    // A character inside a surrogate pair stays on the pair's first byte
    if (units + step.utf16_units > character) {
      break;
    }
    units += step.utf16_units;
    offset = std::min(offset + step.bytes, line_end);
  }
  return offset;
}

auto PositionAt(
    std::size_t offset, std::string_view text,
    const std::vector<std::size_t>& line_breaks) -> lsp::Position {
  offset = std::min(offset, text.size());

  auto preceding =
      offset == 0 ? std::nullopt : FindLineBreak(line_breaks, offset - 1);
  const std::size_t line = preceding ? *preceding + 1 : 0;

  auto cursor = LineStart(line, line_breaks);
  std::size_t units = 0;
  while (cursor < offset) {
    auto step = NextUtf8Step(text, cursor);
    if (cursor + step.bytes > offset) {
      break;
    }
    cursor += step.bytes;
    units += step.utf16_units;
  }

  return lsp::Position{
      .line = static_cast<int>(line),
      .character = static_cast<int>(units),
  };
}

}  // namespace nuls::utils
