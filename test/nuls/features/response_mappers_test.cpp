#include "nuls/features/response_mappers.hpp"

#include <filesystem>
#include <string>
#include <variant>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "nuls/utils/uri.hpp"
#include "test/nuls/common/file_fixture.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using lsp::error::LspErrorCode;
using nuls::TextDocument;
using nuls::compiler::CompilerResponse;
using nuls::features::DecodeChecks;
using nuls::features::DecodeResponse;
using nuls::features::DefinitionUri;
using nuls::features::IdeCheckDiagnostic;
using nuls::features::IdeCheckHint;
using nuls::features::IdeComplete;
using nuls::features::IdeGotoDef;
using nuls::features::IdeHover;
using nuls::features::MapCompletions;
using nuls::features::MapDiagnostic;
using nuls::features::MapGotoDefinition;
using nuls::features::MapHover;
using nuls::features::MapInlayHint;
using nuls::test::FileTestFixture;

namespace {

constexpr auto kSourceUri = "file:///home/user/main.nu";

// Line 1 starts at offset 22; the string literal spans 39..46
constexpr auto kSourceText =
    "let names = ['a' 'b']\nlet count: int = \"three\"\n";

auto MakeSource() -> TextDocument {
  return TextDocument(kSourceUri, kSourceText, 3);
}

auto Pos(int line, int character) -> lsp::Position {
  return lsp::Position{.line = line, .character = character};
}

auto MakeRange(int start_line, int start_char, int end_line, int end_char)
    -> lsp::Range {
  return lsp::Range{
      .start = Pos(start_line, start_char), .end = Pos(end_line, end_char)};
}

}  // namespace

TEST_CASE("MapCompletions numbers items and picks kinds", "[mappers]") {
  auto items = MapCompletions(
      IdeComplete{.completions = {"where", "which", "while", "str trim()"}});

  REQUIRE(items.size() == 4);
  REQUIRE(items[0].label == "where");
  REQUIRE(items[1].label == "which");
  REQUIRE(items[2].label == "while");
  REQUIRE(items[0].kind == lsp::CompletionItemKind::kField);
  REQUIRE(items[3].kind == lsp::CompletionItemKind::kFunction);
  REQUIRE(items[0].data.value() == 1);
  REQUIRE(items[2].data.value() == 3);
  REQUIRE(items[3].data.value() == 4);
}

TEST_CASE("MapCompletions accepts an empty list", "[mappers]") {
  REQUIRE(MapCompletions(IdeComplete{}).empty());
}

TEST_CASE("DecodeResponse reads a single JSON document", "[mappers]") {
  CompilerResponse response{
      .cmdline = "nu --ide-complete 10 /tmp/nuls-abc.nu",
      .source_path = "/tmp/nuls-abc.nu",
      .stdout_text = R"({"completions":["where","which","while"]})" "\n",
  };

  auto complete = DecodeResponse<IdeComplete>(response);
  REQUIRE(complete.has_value());
  REQUIRE(
      complete->completions ==
      std::vector<std::string>{"where", "which", "while"});
}

TEST_CASE("DecodeResponse reports malformed output", "[mappers]") {
  CompilerResponse response{
      .cmdline = "nu --ide-hover 4 /tmp/nuls-abc.nu",
      .source_path = "/tmp/nuls-abc.nu",
      .stdout_text = "Error: nu::parser::unexpected_eof",
  };

  auto hover = DecodeResponse<IdeHover>(response);
  REQUIRE_FALSE(hover.has_value());
  REQUIRE(hover.error().Code() == LspErrorCode::kParseError);
  REQUIRE(
      hover.error().Message() ==
      "cannot parse response from nu --ide-hover 4 /tmp/nuls-abc.nu");

  response.stdout_text = R"({"typename":"int"})";
  auto missing_field = DecodeResponse<IdeHover>(response);
  REQUIRE_FALSE(missing_field.has_value());
  REQUIRE(missing_field.error().Code() == LspErrorCode::kParseError);
}

TEST_CASE("DecodeResponse treats an empty goto object as no target",
          "[mappers]") {
  CompilerResponse response{
      .cmdline = "nu --ide-goto-def 4 /tmp/nuls-abc.nu",
      .source_path = "/tmp/nuls-abc.nu",
      .stdout_text = "{}",
  };

  auto definition = DecodeResponse<IdeGotoDef>(response);
  REQUIRE(definition.has_value());
  REQUIRE(definition->file.empty());

  auto source = MakeSource();
  auto location = MapGotoDefinition(*definition, source, std::nullopt, "");
  REQUIRE(location.has_value());
  REQUIRE_FALSE(location->has_value());
}

TEST_CASE("DecodeChecks keeps diagnostics and hints", "[mappers]") {
  constexpr auto kOutput =
      R"({"type":"diagnostic","severity":"Error","message":"Type mismatch.","span":{"start":39,"end":46}})"
      "\n"
      R"({"type":"hint","typename":"list<string>","position":{"start":4,"end":9}})"
      "\n"
      "not json at all\n"
      "\n"
      R"({"type":"unknown","span":{"start":0,"end":1}})"
      "\n"
      R"({"type":"diagnostic","severity":"Fatal","message":"x","span":{"start":0,"end":1}})"
      "\n"
      R"({"type":"diagnostic","severity":"warning","message":"Unused.","span":{"start":4,"end":9}})";

  auto checks = DecodeChecks(kOutput);
  REQUIRE(checks.size() == 3);

  REQUIRE(std::holds_alternative<IdeCheckDiagnostic>(checks[0]));
  const auto& error = std::get<IdeCheckDiagnostic>(checks[0]);
  REQUIRE(error.message == "Type mismatch.");
  REQUIRE(error.severity == lsp::DiagnosticSeverity::kError);
  REQUIRE(error.span.start == 39);
  REQUIRE(error.span.end == 46);

  REQUIRE(std::holds_alternative<IdeCheckHint>(checks[1]));
  const auto& hint = std::get<IdeCheckHint>(checks[1]);
  REQUIRE(hint.type_name == "list<string>");
  REQUIRE(hint.position.end == 9);

  REQUIRE(
      std::get<IdeCheckDiagnostic>(checks[2]).severity ==
      lsp::DiagnosticSeverity::kWarning);
}

TEST_CASE("DecodeChecks accepts empty output", "[mappers]") {
  REQUIRE(DecodeChecks("").empty());
  REQUIRE(DecodeChecks("\n\n").empty());
}

TEST_CASE("MapDiagnostic converts the span", "[mappers]") {
  auto source = MakeSource();
  auto diagnostic = MapDiagnostic(
      IdeCheckDiagnostic{
          .message = "Type mismatch.",
          .severity = lsp::DiagnosticSeverity::kError,
          .span = {.start = 39, .end = 46},
      },
      source);

  REQUIRE(diagnostic.range == MakeRange(1, 17, 1, 24));
  REQUIRE(diagnostic.severity == lsp::DiagnosticSeverity::kError);
  REQUIRE(diagnostic.source == "nu");
  REQUIRE(diagnostic.message == "Type mismatch.");
}

TEST_CASE("MapInlayHint places the label after the span", "[mappers]") {
  auto source = MakeSource();
  auto hint = MapInlayHint(
      IdeCheckHint{
          .position = {.start = 4, .end = 9}, .type_name = "list<string>"},
      source);

  REQUIRE(hint.position == Pos(0, 9));
  REQUIRE(hint.label == "list<string>");
  REQUIRE(hint.kind == lsp::InlayHintKind::kType);
  REQUIRE(hint.paddingLeft == true);
}

TEST_CASE("MapHover keeps the optional range", "[mappers]") {
  auto source = MakeSource();

  auto with_span = MapHover(
      IdeHover{
          .hover = "list<string>",
          .span = nuls::features::Span{.start = 4, .end = 9}},
      source);
  REQUIRE(with_span.contents == "list<string>");
  REQUIRE(with_span.range == MakeRange(0, 4, 0, 9));

  auto without_span = MapHover(IdeHover{.hover = "int"}, source);
  REQUIRE(without_span.contents == "int");
  REQUIRE_FALSE(without_span.range.has_value());
}

TEST_CASE("DefinitionUri skips files without a location", "[mappers]") {
  REQUIRE(DefinitionUri(IdeGotoDef{}) == std::optional<std::string>{});
  REQUIRE(
      DefinitionUri(IdeGotoDef{.file = "__prelude__"}) ==
      std::optional<std::string>{});

  auto relative = DefinitionUri(IdeGotoDef{.file = "lib/util.nu"});
  REQUIRE_FALSE(relative.has_value());
  REQUIRE(relative.error().Code() == LspErrorCode::kParseError);
  REQUIRE(
      relative.error().Message() ==
      "failed to parse filesystem path in response from `nu --ide-goto-def`");

  REQUIRE(
      DefinitionUri(IdeGotoDef{.file = "/home/user/lib/../util.nu"}) ==
      std::optional<std::string>{"file:///home/user/util.nu"});
}

TEST_CASE("MapGotoDefinition resolves definition targets", "[mappers]") {
  FileTestFixture fixture("nuls_mappers");
  auto source = MakeSource();
  // The definition sits on line 2 of the target
  auto library = fixture.CreateFile("lib.nu", "\n\ndef greet [] {}\n");
  auto library_uri = nuls::utils::PathToUri(library.string());
  IdeGotoDef definition{.file = library.string(), .start = 6, .end = 11};

  SECTION("Open target converts through its own text") {
    TextDocument target(library_uri, "\n\ndef greet [] {}\n", 1);
    auto location = MapGotoDefinition(definition, source, target, "");
    REQUIRE(location.has_value());
    REQUIRE(location->has_value());
    REQUIRE((*location)->uri == library_uri);
    REQUIRE((*location)->range == MakeRange(2, 4, 2, 9));
  }

  SECTION("Closed target converts through the source text") {
    auto location = MapGotoDefinition(definition, source, std::nullopt, "");
    REQUIRE(location.has_value());
    REQUIRE(location->has_value());
    REQUIRE((*location)->uri == library_uri);
    REQUIRE((*location)->range == MakeRange(0, 6, 0, 11));
  }

  SECTION("Definitions in the compiled file point into the source") {
    IdeGotoDef local{.file = "/tmp/nuls-abc123.nu", .start = 4, .end = 9};
    auto location =
        MapGotoDefinition(local, source, std::nullopt, "/tmp/nuls-abc123.nu");
    REQUIRE(location.has_value());
    REQUIRE(location->has_value());
    REQUIRE((*location)->uri == kSourceUri);
    REQUIRE((*location)->range == MakeRange(0, 4, 0, 9));
  }

  SECTION("Missing files have no location") {
    IdeGotoDef missing{
        .file = (fixture.TempDir() / "missing.nu").string(),
        .start = 0,
        .end = 1};
    auto location = MapGotoDefinition(missing, source, std::nullopt, "");
    REQUIRE(location.has_value());
    REQUIRE_FALSE(location->has_value());
  }

  SECTION("Prelude definitions have no location") {
    auto location = MapGotoDefinition(
        IdeGotoDef{.file = "__prelude__", .start = 0, .end = 3}, source,
        std::nullopt, "");
    REQUIRE(location.has_value());
    REQUIRE_FALSE(location->has_value());
  }

  SECTION("Missing relative files have no location") {
    auto location = MapGotoDefinition(
        IdeGotoDef{.file = "missing_relative.nu", .start = 0, .end = 1},
        source, std::nullopt, "");
    REQUIRE(location.has_value());
    REQUIRE_FALSE(location->has_value());
  }

  SECTION("Existing relative paths are parse errors") {
    auto relative = std::filesystem::relative(library);
    auto location = MapGotoDefinition(
        IdeGotoDef{.file = relative.string(), .start = 0, .end = 1}, source,
        std::nullopt, "");
    REQUIRE_FALSE(location.has_value());
    REQUIRE(location.error().Code() == LspErrorCode::kParseError);
  }
}
