#include "nuls/utils/text_position.hpp"

#include <string>
#include <vector>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using nuls::utils::ConvertPosition;
using nuls::utils::FindLineBreak;
using nuls::utils::FindLineBreaks;
using nuls::utils::PositionAt;

namespace {

const std::string kScript =
    "#! /usr/bin/env nu\n"
    "def main [] {\n"
    "    ls | sort-by 'size' | first\n"
    "}";

}  // namespace

TEST_CASE("FindLineBreaks lists every newline offset", "[text_position]") {
  REQUIRE(FindLineBreaks(kScript) == std::vector<std::size_t>{18, 32, 64});
  REQUIRE(FindLineBreaks("").empty());
  REQUIRE(FindLineBreaks("no newline").empty());
  REQUIRE(FindLineBreaks("\n\n") == std::vector<std::size_t>{0, 1});
}

TEST_CASE("ConvertPosition maps positions to byte offsets", "[text_position]") {
  REQUIRE(ConvertPosition({.line = 0, .character = 0}, kScript) == 0);
  REQUIRE(ConvertPosition({.line = 2, .character = 4}, kScript) == 37);
  REQUIRE(ConvertPosition({.line = 1, .character = 0}, kScript) == 19);
  REQUIRE(ConvertPosition({.line = 3, .character = 1}, kScript) == 66);
}

TEST_CASE("ConvertPosition clamps out-of-range input", "[text_position]") {
  SECTION("Line past the end clamps to the end of the text") {
    REQUIRE(
        ConvertPosition({.line = 10, .character = 0}, kScript) ==
        kScript.size());
  }

  SECTION("Character past the end of a line clamps to its terminator") {
    REQUIRE(ConvertPosition({.line = 0, .character = 200}, kScript) == 18);
    REQUIRE(
        ConvertPosition({.line = 3, .character = 200}, kScript) ==
        kScript.size());
  }

  SECTION("Negative coordinates clamp to zero") {
    REQUIRE(ConvertPosition({.line = -1, .character = -5}, kScript) == 0);
  }
}

TEST_CASE("ConvertPosition counts UTF-16 code units", "[text_position]") {
  // "é" is 2 bytes / 1 unit, "😀" is 4 bytes / 2 units
  const std::string text = "let é = '😀x'\nnext";

  REQUIRE(ConvertPosition({.line = 0, .character = 5}, text) == 6);
  REQUIRE(ConvertPosition({.line = 0, .character = 9}, text) == 10);
  REQUIRE(ConvertPosition({.line = 0, .character = 11}, text) == 14);
  REQUIRE(ConvertPosition({.line = 1, .character = 2}, text) == 19);

  // Halfway through the surrogate pair stays on the first byte
  REQUIRE(ConvertPosition({.line = 0, .character = 10}, text) == 10);
}

TEST_CASE("FindLineBreak locates the preceding line break", "[text_position]") {
  const std::vector<std::size_t> line_breaks{18, 32, 64};

  REQUIRE_FALSE(FindLineBreak(line_breaks, 0).has_value());
  REQUIRE_FALSE(FindLineBreak(line_breaks, 17).has_value());
  // A break exactly at the offset counts as preceding it
  REQUIRE(FindLineBreak(line_breaks, 18) == 0);
  REQUIRE(FindLineBreak(line_breaks, 31) == 0);
  REQUIRE(FindLineBreak(line_breaks, 32) == 1);
  REQUIRE(FindLineBreak(line_breaks, 64) == 2);
  REQUIRE(FindLineBreak(line_breaks, 1000) == 2);
  REQUIRE_FALSE(FindLineBreak({}, 5).has_value());
}

TEST_CASE("PositionAt maps byte offsets to positions", "[text_position]") {
  const auto line_breaks = FindLineBreaks(kScript);

  REQUIRE(
      PositionAt(0, kScript, line_breaks) ==
      lsp::Position{.line = 0, .character = 0});
  REQUIRE(
      PositionAt(18, kScript, line_breaks) ==
      lsp::Position{.line = 0, .character = 18});
  REQUIRE(
      PositionAt(19, kScript, line_breaks) ==
      lsp::Position{.line = 1, .character = 0});
  REQUIRE(
      PositionAt(37, kScript, line_breaks) ==
      lsp::Position{.line = 2, .character = 4});
  REQUIRE(
      PositionAt(10'000, kScript, line_breaks) ==
      lsp::Position{.line = 3, .character = 1});
}

TEST_CASE("Positions and offsets round-trip", "[text_position]") {
  const std::string text = "let é = '😀x'\n# 中文 comment\n\nend";
  const auto line_breaks = FindLineBreaks(text);

  for (std::size_t offset = 0; offset <= text.size(); ++offset) {
    auto position = PositionAt(offset, text, line_breaks);
    auto back = ConvertPosition(position, text, line_breaks);
    // Offsets inside a multi-byte sequence resolve to the sequence start
    REQUIRE(back <= offset);
    REQUIRE(PositionAt(back, text, line_breaks) == position);
  }

  SECTION("Offsets after multi-unit characters are exact") {
    REQUIRE(
        PositionAt(14, text, line_breaks) ==
        lsp::Position{.line = 0, .character = 11});
    REQUIRE(
        ConvertPosition({.line = 0, .character = 11}, text, line_breaks) ==
        14);
    REQUIRE(
        PositionAt(22, text, line_breaks) ==
        lsp::Position{.line = 1, .character = 3});
  }
}
