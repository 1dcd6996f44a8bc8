#pragma once

#include <cstddef>
#include <string_view>

namespace nuls::utils {

// Length in bytes of the well-formed UTF-8 sequence starting at `offset`,
// or 0 when the bytes there are not a complete well-formed sequence.
auto Utf8SequenceLength(std::string_view text, std::size_t offset)
    -> std::size_t;

struct Utf8Step {
  std::size_t bytes;
  std::size_t utf16_units;
};

// Bytes consumed by the sequence found at `offset` and the UTF-16 code units
// needed to encode it. Malformed bytes count as a single unit each,
// consuming one byte.
auto NextUtf8Step(std::string_view text, std::size_t offset) -> Utf8Step;

auto IsValidUtf8(std::string_view text) -> bool;

}  // namespace nuls::utils
