#pragma once

#include <expected>
#include <memory>
#include <string>
#include <vector>

#include <asio.hpp>
#include <sys/types.h>

#include "nuls/compiler/compiler_error.hpp"

namespace nuls::compiler {

// A spawned child process whose stdout and stderr are captured through
// pipes. Stdin is redirected from /dev/null. A child that has not been
// waited for when its owner is destroyed is killed and reaped.
class ChildProcess {
 public:
  // Spawn `executable` (looked up on PATH) with `arguments`
  static auto Spawn(
      asio::any_io_executor executor, const std::string& executable,
      const std::vector<std::string>& arguments)
      -> std::expected<std::unique_ptr<ChildProcess>, CompilerError>;

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess(ChildProcess&&) = delete;
  auto operator=(const ChildProcess&) -> ChildProcess& = delete;
  auto operator=(ChildProcess&&) -> ChildProcess& = delete;
  ~ChildProcess();

  [[nodiscard]] auto Pid() const -> pid_t {
    return pid_;
  }

  // Read the stream until the child closes it
  auto ReadStdout() -> asio::awaitable<std::string>;
  auto ReadStderr() -> asio::awaitable<std::string>;

  // Wait for the child to exit. Returns the exit code, or 128 plus the
  // signal number when the child was killed by a signal.
  auto Wait() -> asio::awaitable<int>;

 private:
  ChildProcess(
      asio::any_io_executor executor, pid_t pid, int stdout_fd, int stderr_fd);

  static auto ReadAll(asio::posix::stream_descriptor& stream)
      -> asio::awaitable<std::string>;

  auto TryReap(int& exit_code) -> bool;

  asio::any_io_executor executor_;
  pid_t pid_;
  bool reaped_ = false;
  asio::posix::stream_descriptor stdout_;
  asio::posix::stream_descriptor stderr_;
};

}  // namespace nuls::compiler
