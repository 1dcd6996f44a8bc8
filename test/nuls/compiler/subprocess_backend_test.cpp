#include "nuls/compiler/subprocess_backend.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <asio.hpp>
#include <catch2/catch_all.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "test/nuls/common/async_fixture.hpp"
#include "test/nuls/common/file_fixture.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using nuls::IdeSettings;
using nuls::compiler::CompilerErrorKind;
using nuls::compiler::IdeOperation;
using nuls::compiler::SubprocessBackend;
using nuls::test::FileTestFixture;
using nuls::test::RunAsyncTest;

namespace {

auto ReadFile(const std::filesystem::path& path) -> std::string {
  std::ifstream file(path, std::ios::binary);
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

// A stand-in compiler that records its arguments and the source it was given
auto CreateRecordingCompiler(FileTestFixture& fixture, std::string_view output)
    -> std::filesystem::path {
  auto dir = fixture.TempDir().string();
  return fixture.CreateScript(
      "nu",
      fmt::format(
          "printf '%s\\n' \"$@\" > '{0}/args.txt'\n"
          "for last; do :; done\n"
          "cat \"$last\" > '{0}/source.txt'\n"
          "printf '%s' '{1}'\n",
          dir, output));
}

auto SettingsFor(const std::filesystem::path& executable) -> IdeSettings {
  IdeSettings settings;
  settings.executable_path = executable.string();
  return settings;
}

}  // namespace

TEST_CASE(
    "SubprocessBackend passes the document through a temp file",
    "[subprocess_backend]") {
  FileTestFixture fixture("nuls_backend");
  auto executable = CreateRecordingCompiler(
      fixture, R"({"completions":["where","which","while"]})");

  RunAsyncTest([&](asio::any_io_executor executor) -> asio::awaitable<void> {
    SubprocessBackend backend(executor);
    auto settings = SettingsFor(executable);
    settings.include_dirs = {"/opt/nu/lib"};

    auto response = co_await backend.Run(
        IdeOperation::Complete(2), "[1 2] | wh",
        settings, "file:///home/user/scripts/main.nu");
    REQUIRE(response.has_value());
    REQUIRE(
        response->stdout_text == R"({"completions":["where","which","while"]})");

    auto expected_args = fmt::format(
        "--ide-complete\n2\n--include-path\n/home/user/scripts\x1e/opt/nu/lib\n"
        "{}\n",
        response->source_path);
    REQUIRE(ReadFile(fixture.TempDir() / "args.txt") == expected_args);
    REQUIRE(ReadFile(fixture.TempDir() / "source.txt") == "[1 2] | wh");
    REQUIRE(response->source_path.ends_with(".nu"));
    REQUIRE(response->cmdline.starts_with(executable.string() +
                                          " --ide-complete 2"));

    // One temp file per call
    REQUIRE_FALSE(std::filesystem::exists(response->source_path));
  });
}

TEST_CASE(
    "SubprocessBackend leaves out the include path for untitled documents",
    "[subprocess_backend]") {
  FileTestFixture fixture("nuls_backend");
  auto executable = CreateRecordingCompiler(fixture, "");

  RunAsyncTest([&](asio::any_io_executor executor) -> asio::awaitable<void> {
    SubprocessBackend backend(executor);
    auto response = co_await backend.Run(
        IdeOperation::Check(1000), "let x = 1", SettingsFor(executable),
        "untitled:Untitled-1");
    REQUIRE(response.has_value());
    REQUIRE(response->stdout_text.empty());
    REQUIRE(
        ReadFile(fixture.TempDir() / "args.txt") ==
        fmt::format("--ide-check\n1000\n{}\n", response->source_path));
  });
}

TEST_CASE(
    "SubprocessBackend keeps output of a failing compiler",
    "[subprocess_backend]") {
  FileTestFixture fixture("nuls_backend");
  auto executable = fixture.CreateScript(
      "nu", "echo 'parse failed' >&2\necho '{\"hover\":\"int\"}'\nexit 3\n");

  RunAsyncTest([&](asio::any_io_executor executor) -> asio::awaitable<void> {
    SubprocessBackend backend(executor);
    auto response = co_await backend.Run(
        IdeOperation::Hover(4), "let x = 1", SettingsFor(executable),
        "untitled:Untitled-1");
    REQUIRE(response.has_value());
    REQUIRE(response->stdout_text == "{\"hover\":\"int\"}\n");
  });
}

TEST_CASE(
    "SubprocessBackend stops a compiler that runs too long",
    "[subprocess_backend]") {
  FileTestFixture fixture("nuls_backend");
  auto executable = fixture.CreateScript("nu", "exec sleep 10\n");

  RunAsyncTest([&](asio::any_io_executor executor) -> asio::awaitable<void> {
    SubprocessBackend backend(executor);
    auto settings = SettingsFor(executable);
    settings.max_invocation_time = std::chrono::milliseconds(100);

    auto started = std::chrono::steady_clock::now();
    auto response = co_await backend.Run(
        IdeOperation::Check(10), "let x = 1", settings, "untitled:Untitled-1");
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE_FALSE(response.has_value());
    REQUIRE(response.error().Kind() == CompilerErrorKind::kTimeout);
    REQUIRE(response.error().Message().find("did not finish within") !=
            std::string::npos);
    REQUIRE(elapsed < std::chrono::seconds(5));
  });
}

TEST_CASE(
    "SubprocessBackend reports a missing executable", "[subprocess_backend]") {
  FileTestFixture fixture("nuls_backend");
  auto missing = fixture.TempDir() / "no-such-nu";

  RunAsyncTest([&](asio::any_io_executor executor) -> asio::awaitable<void> {
    SubprocessBackend backend(executor);
    auto response = co_await backend.Run(
        IdeOperation::Check(10), "let x = 1", SettingsFor(missing),
        "untitled:Untitled-1");
    REQUIRE_FALSE(response.has_value());
    REQUIRE(response.error().Kind() == CompilerErrorKind::kProcessSpawn);
  });
}

TEST_CASE(
    "SubprocessBackend rejects output that is not UTF-8",
    "[subprocess_backend]") {
  FileTestFixture fixture("nuls_backend");
  auto executable = fixture.CreateScript("nu", "printf '\\377\\376'\n");

  RunAsyncTest([&](asio::any_io_executor executor) -> asio::awaitable<void> {
    SubprocessBackend backend(executor);
    auto response = co_await backend.Run(
        IdeOperation::Hover(0), "x", SettingsFor(executable),
        "untitled:Untitled-1");
    REQUIRE_FALSE(response.has_value());
    REQUIRE(response.error().Kind() == CompilerErrorKind::kOutputDecoding);
  });
}

TEST_CASE(
    "SubprocessBackend rejects malformed document uris",
    "[subprocess_backend]") {
  FileTestFixture fixture("nuls_backend");
  auto executable = CreateRecordingCompiler(fixture, "");

  RunAsyncTest([&](asio::any_io_executor executor) -> asio::awaitable<void> {
    SubprocessBackend backend(executor);
    auto response = co_await backend.Run(
        IdeOperation::Check(10), "x", SettingsFor(executable),
        "file:///tmp/bad%zz.nu");
    REQUIRE_FALSE(response.has_value());
    REQUIRE(response.error().Kind() == CompilerErrorKind::kPathConstruction);
    REQUIRE_FALSE(std::filesystem::exists(fixture.TempDir() / "args.txt"));
  });
}
