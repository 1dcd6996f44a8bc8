#include "nuls/compiler/compiler_error.hpp"

namespace nuls::compiler {

using lsp::error::LspError;
using lsp::error::LspErrorCode;

auto CompilerError::ToLspError() const -> LspError {
  switch (kind_) {
    case CompilerErrorKind::kPathConstruction:
      return LspError::FromCode(LspErrorCode::kInvalidParams, message_);
    case CompilerErrorKind::kTempFileIo:
    case CompilerErrorKind::kProcessSpawn:
    case CompilerErrorKind::kTimeout:
      return LspError::FromCode(LspErrorCode::kInternalError, message_);
    case CompilerErrorKind::kOutputDecoding:
      return LspError::FromCode(LspErrorCode::kParseError, message_);
  }
  return LspError::FromCode(LspErrorCode::kUnknownError, message_);
}

}  // namespace nuls::compiler
