#pragma once

#include <expected>
#include <string>

#include <asio.hpp>

#include "nuls/compiler/compiler_error.hpp"
#include "nuls/compiler/ide_operation.hpp"
#include "nuls/core/ide_settings.hpp"

namespace nuls::compiler {

struct CompilerResponse {
  // Command line that produced the output, for error messages
  std::string cmdline;
  // Temp file the document text was compiled from; spans the compiler
  // reports against this path belong to the source document
  std::string source_path;
  std::string stdout_text;
};

// Runs one IDE query of the compiler against a document's text
class CompilerBackend {
 public:
  CompilerBackend() = default;
  CompilerBackend(const CompilerBackend&) = delete;
  CompilerBackend(CompilerBackend&&) = delete;
  auto operator=(const CompilerBackend&) -> CompilerBackend& = delete;
  auto operator=(CompilerBackend&&) -> CompilerBackend& = delete;
  virtual ~CompilerBackend() = default;

  virtual auto Run(
      IdeOperation operation, std::string text, IdeSettings settings,
      std::string source_uri)
      -> asio::awaitable<std::expected<CompilerResponse, CompilerError>> = 0;
};

}  // namespace nuls::compiler
