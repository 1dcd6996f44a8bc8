#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include <lsp/basic.hpp>

namespace nuls::utils {

// Byte offsets of every '\n' in `text`, in ascending order
auto FindLineBreaks(std::string_view text) -> std::vector<std::size_t>;

// Index into `line_breaks` of the last break at or before `offset`, or
// nullopt when `offset` precedes the first break. The comparison is
// inclusive: a break sitting exactly at `offset` is returned, so with breaks
// {18, 32} offset 18 yields 0 and offset 32 yields 1. PositionAt passes
// `offset - 1` so the '\n' itself stays on the line it terminates.
auto FindLineBreak(
    const std::vector<std::size_t>& line_breaks, std::size_t offset)
    -> std::optional<std::size_t>;

// Convert an editor position (UTF-16 code units) to a byte offset.
// Positions past the last line clamp to the end of the text; characters
// past the end of a line clamp to the line terminator.
auto ConvertPosition(const lsp::Position& position, std::string_view text)
    -> std::size_t;

auto ConvertPosition(
    const lsp::Position& position, std::string_view text,
    const std::vector<std::size_t>& line_breaks) -> std::size_t;

// Convert a byte offset to an editor position. Offsets past the end clamp
// to the end of the text; offsets inside a multi-byte sequence resolve to
// the start of that sequence.
auto PositionAt(
    std::size_t offset, std::string_view text,
    const std::vector<std::size_t>& line_breaks) -> lsp::Position;

}  // namespace nuls::utils
