#pragma once

#include <memory>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "nuls/compiler/compiler_backend.hpp"

namespace nuls::compiler {

// Runs the compiler executable named in the settings as a child process.
// The document text goes through a temp file that lives for one call; the
// call is bounded by the configured invocation time.
class SubprocessBackend : public CompilerBackend {
 public:
  explicit SubprocessBackend(
      asio::any_io_executor executor,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  auto Run(
      IdeOperation operation, std::string text, IdeSettings settings,
      std::string source_uri)
      -> asio::awaitable<std::expected<CompilerResponse, CompilerError>>
      override;

 private:
  asio::any_io_executor executor_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace nuls::compiler
