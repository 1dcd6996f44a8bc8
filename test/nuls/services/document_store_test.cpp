#include "nuls/services/document_store.hpp"

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using lsp::error::LspErrorCode;
using nuls::services::DocumentStore;

namespace {

constexpr std::string_view kUri = "file:///home/user/script.nu";

auto Edit(int start_line, int start_char, int end_line, int end_char,
          std::string text) -> lsp::TextDocumentContentChangeEvent {
  return lsp::TextDocumentContentPartialChangeEvent{
      .range =
          {.start = {.line = start_line, .character = start_char},
           .end = {.line = end_line, .character = end_char}},
      .text = std::move(text),
  };
}

}  // namespace

TEST_CASE("DocumentStore open, read and close", "[document_store]") {
  DocumentStore store;
  const std::string uri(kUri);

  store.Open(uri, "ls | first\n", 1);
  REQUIRE(store.Contains(uri));
  REQUIRE(store.GetContent(uri) == "ls | first\n");
  REQUIRE(store.Get(uri)->Version() == 1);

  SECTION("Open again replaces the document") {
    store.Open(uri, "ps\n", 4);
    REQUIRE(store.GetContent(uri) == "ps\n");
    REQUIRE(store.Get(uri)->Version() == 4);
    REQUIRE(store.Uris().size() == 1);
  }

  SECTION("Close forgets the document") {
    store.Close(uri);
    REQUIRE_FALSE(store.Contains(uri));
    REQUIRE_FALSE(store.Find(uri).has_value());
  }
}

TEST_CASE("DocumentStore reports untracked documents", "[document_store]") {
  DocumentStore store;
  const std::string uri(kUri);

  auto content = store.GetContent(uri);
  REQUIRE_FALSE(content.has_value());
  REQUIRE(content.error().Code() == LspErrorCode::kDocumentNotFound);
  REQUIRE(content.error().ToJson()["code"] == -32602);

  REQUIRE_FALSE(store.OffsetAt(uri, {.line = 0, .character = 0}).has_value());
  REQUIRE_FALSE(store.PositionAt(uri, 0).has_value());

  auto change = store.ApplyChange(uri, 2, {Edit(0, 0, 0, 0, "x")});
  REQUIRE_FALSE(change.has_value());
  REQUIRE(change.error().Code() == LspErrorCode::kDocumentNotFound);
}

TEST_CASE("DocumentStore applies incremental edits", "[document_store]") {
  DocumentStore store;
  const std::string uri(kUri);
  store.Open(uri, "let x = 1\nls | first\n", 1);

  SECTION("Single range replacement") {
    REQUIRE(store.ApplyChange(uri, 2, {Edit(1, 5, 1, 10, "last")}));
    REQUIRE(store.GetContent(uri) == "let x = 1\nls | last\n");
    REQUIRE(store.Get(uri)->Version() == 2);
  }

  SECTION("Edits apply in order against the updated text") {
    REQUIRE(store.ApplyChange(
        uri, 2,
        {
            Edit(0, 4, 0, 5, "value"),
            // Same line, now shifted by the first edit
            Edit(0, 12, 0, 13, "42"),
            Edit(1, 0, 1, 0, "# list\n"),
        }));
    REQUIRE(
        store.GetContent(uri) == "let value = 42\n# list\nls | first\n");
  }

  SECTION("Insertion spanning lines updates line breaks") {
    REQUIRE(store.ApplyChange(uri, 2, {Edit(0, 9, 0, 9, "\nlet y = 2")}));
    REQUIRE(store.OffsetAt(uri, {.line = 2, .character = 0}) == 20);
    REQUIRE(
        store.PositionAt(uri, 20) == lsp::Position{.line = 2, .character = 0});
  }

  SECTION("Full replacement") {
    REQUIRE(store.ApplyChange(
        uri, 3, {lsp::TextDocumentContentFullChangeEvent{.text = "ps\n"}}));
    REQUIRE(store.GetContent(uri) == "ps\n");
  }

  SECTION("Reversed range is treated as an insertion") {
    REQUIRE(store.ApplyChange(uri, 2, {Edit(0, 5, 0, 3, "!")}));
    REQUIRE(store.GetContent(uri) == "let x! = 1\nls | first\n");
  }
}

TEST_CASE("DocumentStore converts with multi-byte text", "[document_store]") {
  DocumentStore store;
  const std::string uri(kUri);
  store.Open(uri, "let s = '😀'\nlet t = 'é'\n", 1);

  // Replace the emoji, which spans two UTF-16 units
  REQUIRE(store.ApplyChange(uri, 2, {Edit(0, 9, 0, 11, "ok")}));
  REQUIRE(store.GetContent(uri) == "let s = 'ok'\nlet t = 'é'\n");

  REQUIRE(store.OffsetAt(uri, {.line = 1, .character = 10}) == 24);
  REQUIRE(
      store.PositionAt(uri, 24) == lsp::Position{.line = 1, .character = 10});
}
