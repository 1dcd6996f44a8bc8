#pragma once

#include <expected>
#include <string>

#include <lsp/error.hpp>

namespace nuls::compiler {

enum class CompilerErrorKind {
  kPathConstruction,
  kTempFileIo,
  kProcessSpawn,
  kTimeout,
  kOutputDecoding,
};

// Failure of one compiler invocation
class CompilerError {
 public:
  CompilerError(CompilerErrorKind kind, std::string message)
      : kind_(kind), message_(std::move(message)) {
  }

  [[nodiscard]] auto Kind() const -> CompilerErrorKind {
    return kind_;
  }
  [[nodiscard]] auto Message() const -> const std::string& {
    return message_;
  }

  // Map onto the protocol error reported to the client
  [[nodiscard]] auto ToLspError() const -> lsp::error::LspError;

  static auto Unexpected(CompilerErrorKind kind, std::string message)
      -> std::unexpected<CompilerError> {
    return std::unexpected<CompilerError>(
        CompilerError(kind, std::move(message)));
  }

 private:
  CompilerErrorKind kind_;
  std::string message_;
};

}  // namespace nuls::compiler
