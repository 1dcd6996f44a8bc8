#include "nuls/compiler/child_process.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <fmt/format.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace nuls::compiler {

namespace {

constexpr auto kWaitPollInterval = std::chrono::milliseconds(5);

auto DecodeStatus(int status) -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return 1;
}

auto SpawnError(const std::string& executable, int error)
    -> std::unexpected<CompilerError> {
  return CompilerError::Unexpected(
      CompilerErrorKind::kProcessSpawn,
      fmt::format("cannot run {}: {}", executable, std::strerror(error)));
}

// Pipe whose ends are not inherited by unrelated children
struct Pipe {
  int read_end = -1;
  int write_end = -1;

  auto Open() -> bool {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
      return false;
    }
    read_end = fds[0];
    write_end = fds[1];
    return true;
  }

  auto CloseRead() -> void {
    if (read_end >= 0) {
      ::close(read_end);
      read_end = -1;
    }
  }

  auto CloseWrite() -> void {
    if (write_end >= 0) {
      ::close(write_end);
      write_end = -1;
    }
  }
};

}  // namespace

auto ChildProcess::Spawn(
    asio::any_io_executor executor, const std::string& executable,
    const std::vector<std::string>& arguments)
    -> std::expected<std::unique_ptr<ChildProcess>, CompilerError> {
  Pipe out;
  Pipe err;
  if (!out.Open()) {
    return SpawnError(executable, errno);
  }
  if (!err.Open()) {
    int error = errno;
    out.CloseRead();
    out.CloseWrite();
    return SpawnError(executable, error);
  }

  std::vector<char*> argv;
  argv.reserve(arguments.size() + 2);
  argv.push_back(const_cast<char*>(executable.c_str()));
  for (const auto& argument : arguments) {
    argv.push_back(const_cast<char*>(argument.c_str()));
  }
  argv.push_back(nullptr);

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addopen(
      &actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
  posix_spawn_file_actions_adddup2(&actions, out.write_end, STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, err.write_end, STDERR_FILENO);

  pid_t pid = -1;
  const int spawn_result = ::posix_spawnp(
      &pid, executable.c_str(), &actions, nullptr, argv.data(), environ);
  posix_spawn_file_actions_destroy(&actions);

  out.CloseWrite();
  err.CloseWrite();

  if (spawn_result != 0) {
    out.CloseRead();
    err.CloseRead();
    return SpawnError(executable, spawn_result);
  }

  return std::unique_ptr<ChildProcess>(
      new ChildProcess(std::move(executor), pid, out.read_end, err.read_end));
}

ChildProcess::ChildProcess(
    asio::any_io_executor executor, pid_t pid, int stdout_fd, int stderr_fd)
    : executor_(executor),
      pid_(pid),
      stdout_(executor, stdout_fd),
      stderr_(executor, stderr_fd) {
}

ChildProcess::~ChildProcess() {
  if (reaped_) {
    return;
  }
  ::kill(pid_, SIGKILL);
  int status = 0;
  while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
  }
}

auto ChildProcess::ReadStdout() -> asio::awaitable<std::string> {
  co_return co_await ReadAll(stdout_);
}

auto ChildProcess::ReadStderr() -> asio::awaitable<std::string> {
  co_return co_await ReadAll(stderr_);
}

auto ChildProcess::ReadAll(asio::posix::stream_descriptor& stream)
    -> asio::awaitable<std::string> {
  std::string output;
  std::error_code ec;
  co_await asio::async_read(
      stream, asio::dynamic_buffer(output),
      asio::redirect_error(asio::use_awaitable, ec));
  // EOF is the normal end of the stream
  if (ec && ec != asio::error::eof) {
    throw std::system_error(ec);
  }
  co_return output;
}

auto ChildProcess::TryReap(int& exit_code) -> bool {
  int status = 0;
  pid_t result = 0;
  do {
    result = ::waitpid(pid_, &status, WNOHANG);
  } while (result < 0 && errno == EINTR);

  if (result == 0) {
    return false;
  }
  reaped_ = true;
  exit_code = result == pid_ ? DecodeStatus(status) : 1;
  return true;
}

auto ChildProcess::Wait() -> asio::awaitable<int> {
  asio::steady_timer timer(executor_);
  int exit_code = 0;
  while (!TryReap(exit_code)) {
    timer.expires_after(kWaitPollInterval);
    co_await timer.async_wait(asio::use_awaitable);
  }
  co_return exit_code;
}

}  // namespace nuls::compiler
