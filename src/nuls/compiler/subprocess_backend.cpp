#include "nuls/compiler/subprocess_backend.hpp"

#include <chrono>
#include <string>
#include <tuple>
#include <variant>

#include <asio/experimental/awaitable_operators.hpp>
#include <fmt/format.h>

#include "nuls/compiler/child_process.hpp"
#include "nuls/compiler/temp_source_file.hpp"
#include "nuls/utils/utf8.hpp"

namespace nuls::compiler {

namespace {

struct CapturedOutput {
  std::string stdout_text;
  std::string stderr_text;
  int exit_code = 0;
};

auto Capture(ChildProcess& child) -> asio::awaitable<CapturedOutput> {
  using asio::experimental::awaitable_operators::operator&&;

  auto [stdout_text, stderr_text] =
      co_await (child.ReadStdout() && child.ReadStderr());
  auto exit_code = co_await child.Wait();
  co_return CapturedOutput{
      .stdout_text = std::move(stdout_text),
      .stderr_text = std::move(stderr_text),
      .exit_code = exit_code,
  };
}

// "850ms" below a second, "1.5s" above
auto FormatDuration(std::chrono::milliseconds duration) -> std::string {
  if (duration >= std::chrono::seconds(1)) {
    return fmt::format(
        "{:.1f}s", std::chrono::duration<double>(duration).count());
  }
  return fmt::format("{}ms", duration.count());
}

auto ElapsedSince(std::chrono::steady_clock::time_point start)
    -> std::chrono::milliseconds {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
}

}  // namespace

SubprocessBackend::SubprocessBackend(
    asio::any_io_executor executor, std::shared_ptr<spdlog::logger> logger)
    : executor_(std::move(executor)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto SubprocessBackend::Run(
    IdeOperation operation, std::string text, IdeSettings settings,
    std::string source_uri)
    -> asio::awaitable<std::expected<CompilerResponse, CompilerError>> {
  using asio::experimental::awaitable_operators::operator||;

  auto source_file = TempSourceFile::Create(text);
  if (!source_file) {
    co_return std::unexpected(source_file.error());
  }

  auto arguments =
      BuildArguments(operation, settings, source_uri, source_file->Path());
  if (!arguments) {
    co_return std::unexpected(arguments.error());
  }

  auto cmdline = FormatCommandLine(settings.executable_path, *arguments);
  const auto started = std::chrono::steady_clock::now();

  auto child =
      ChildProcess::Spawn(executor_, settings.executable_path, *arguments);
  if (!child) {
    logger_->error("{}", child.error().Message());
    co_return std::unexpected(child.error());
  }

  asio::steady_timer deadline(executor_, settings.max_invocation_time);
  auto outcome = co_await (
      Capture(**child) || deadline.async_wait(asio::use_awaitable));

  if (outcome.index() == 1) {
    // The child is killed and reaped when `child` goes out of scope
    const auto limit = FormatDuration(settings.max_invocation_time);
    logger_->warn("{} timed out after {}", cmdline, limit);
    co_return CompilerError::Unexpected(
        CompilerErrorKind::kTimeout,
        fmt::format("`{}` did not finish within {}", cmdline, limit));
  }

  auto output = std::get<0>(std::move(outcome));
  logger_->debug(
      "{} completed ({})", cmdline, FormatDuration(ElapsedSince(started)));
  if (!output.stderr_text.empty()) {
    logger_->debug("{} stderr: {}", cmdline, output.stderr_text);
  }
  if (output.exit_code != 0) {
    logger_->debug("{} exited with code {}", cmdline, output.exit_code);
  }

  if (!utils::IsValidUtf8(output.stdout_text)) {
    co_return CompilerError::Unexpected(
        CompilerErrorKind::kOutputDecoding,
        fmt::format("output of `{}` is not valid UTF-8", cmdline));
  }

  co_return CompilerResponse{
      .cmdline = std::move(cmdline),
      .source_path = source_file->Path(),
      .stdout_text = std::move(output.stdout_text),
  };
}

}  // namespace nuls::compiler
