#include "nuls/utils/utf8.hpp"

namespace nuls::utils {

namespace {

auto IsContinuation(unsigned char byte) -> bool {
  return (byte & 0xC0) == 0x80;
}

}  // namespace

auto Utf8SequenceLength(std::string_view text, std::size_t offset)
    -> std::size_t {
  if (offset >= text.size()) {
    return 0;
  }

  auto at = [&](std::size_t i) -> unsigned char {
    return static_cast<unsigned char>(text[offset + i]);
  };
  const auto remaining = text.size() - offset;
  const auto lead = at(0);

  if (lead < 0x80) {
    return 1;
  }
  if (lead >= 0xC2 && lead <= 0xDF) {
    return (remaining >= 2 && IsContinuation(at(1))) ? 2 : 0;
  }
  if (lead >= 0xE0 && lead <= 0xEF) {
    if (remaining < 3 || !IsContinuation(at(1)) || !IsContinuation(at(2))) {
      return 0;
    }
    // Reject overlong encodings and UTF-16 surrogates
    if (lead == 0xE0 && at(1) < 0xA0) {
      return 0;
    }
    if (lead == 0xED && at(1) >= 0xA0) {
      return 0;
    }
    return 3;
  }
  if (lead >= 0xF0 && lead <= 0xF4) {
    if (remaining < 4 || !IsContinuation(at(1)) || !IsContinuation(at(2)) ||
        !IsContinuation(at(3))) {
      return 0;
    }
    // Reject overlong encodings and code points above U+10FFFF
    if (lead == 0xF0 && at(1) < 0x90) {
      return 0;
    }
    if (lead == 0xF4 && at(1) >= 0x90) {
      return 0;
    }
    return 4;
  }
  return 0;
}

auto NextUtf8Step(std::string_view text, std::size_t offset) -> Utf8Step {
  auto length = Utf8SequenceLength(text, offset);
  if (length == 0) {
    return {.bytes = 1, .utf16_units = 1};
  }
  // Code points outside the BMP need a surrogate pair
  return {.bytes = length, .utf16_units = length == 4 ? 2U : 1U};
}

auto IsValidUtf8(std::string_view text) -> bool {
  std::size_t offset = 0;
  while (offset < text.size()) {
    auto length = Utf8SequenceLength(text, offset);
    if (length == 0) {
      return false;
    }
    offset += length;
  }
  return true;
}

}  // namespace nuls::utils
