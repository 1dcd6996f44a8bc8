#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "nuls/compiler/compiler_error.hpp"
#include "nuls/core/ide_settings.hpp"

namespace nuls::compiler {

enum class IdeOperationKind {
  kCheck,
  kComplete,
  kGotoDefinition,
  kHover,
};

// One IDE query understood by the compiler's command line
struct IdeOperation {
  IdeOperationKind kind;
  // Problem limit for kCheck, byte offset into the document otherwise
  std::size_t argument;

  static auto Check(std::uint32_t max_problems) -> IdeOperation {
    return {.kind = IdeOperationKind::kCheck, .argument = max_problems};
  }
  static auto Complete(std::size_t offset) -> IdeOperation {
    return {.kind = IdeOperationKind::kComplete, .argument = offset};
  }
  static auto GotoDefinition(std::size_t offset) -> IdeOperation {
    return {.kind = IdeOperationKind::kGotoDefinition, .argument = offset};
  }
  static auto Hover(std::size_t offset) -> IdeOperation {
    return {.kind = IdeOperationKind::kHover, .argument = offset};
  }
};

auto ToFlag(IdeOperationKind kind) -> std::string_view;

// Separator the compiler expects between entries of --include-path
constexpr char kIncludePathSeparator = '\x1e';

// Include directories for a document: the directory holding the source
// file (file uris only) followed by the configured directories.
auto BuildIncludePath(std::string_view source_uri, const IdeSettings& settings)
    -> std::expected<std::vector<std::string>, CompilerError>;

// Arguments following the executable:
//   <flag> <argument> [--include-path <dirs>] <source_path>
auto BuildArguments(
    const IdeOperation& operation, const IdeSettings& settings,
    std::string_view source_uri, std::string_view source_path)
    -> std::expected<std::vector<std::string>, CompilerError>;

// Human-readable command line used in logs and error messages
auto FormatCommandLine(
    std::string_view executable, const std::vector<std::string>& arguments)
    -> std::string;

}  // namespace nuls::compiler
