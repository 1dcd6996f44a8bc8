#include "nuls/compiler/ide_operation.hpp"

#include <filesystem>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "nuls/utils/uri.hpp"

namespace nuls::compiler {

auto ToFlag(IdeOperationKind kind) -> std::string_view {
  switch (kind) {
    case IdeOperationKind::kCheck:
      return "--ide-check";
    case IdeOperationKind::kComplete:
      return "--ide-complete";
    case IdeOperationKind::kGotoDefinition:
      return "--ide-goto-def";
    case IdeOperationKind::kHover:
      return "--ide-hover";
  }
  return "--ide-check";
}

auto BuildIncludePath(std::string_view source_uri, const IdeSettings& settings)
    -> std::expected<std::vector<std::string>, CompilerError> {
  std::vector<std::string> include_dirs;

  if (utils::IsFileUri(source_uri)) {
    auto path = utils::UriToPath(source_uri);
    if (!path) {
      return CompilerError::Unexpected(
          CompilerErrorKind::kPathConstruction,
          fmt::format("cannot convert {} into a filesystem path", source_uri));
    }
    auto parent = std::filesystem::path(*path).parent_path();
    if (!parent.empty()) {
      include_dirs.push_back(parent.string());
    }
  }

  include_dirs.insert(
      include_dirs.end(), settings.include_dirs.begin(),
      settings.include_dirs.end());
  return include_dirs;
}

auto BuildArguments(
    const IdeOperation& operation, const IdeSettings& settings,
    std::string_view source_uri, std::string_view source_path)
    -> std::expected<std::vector<std::string>, CompilerError> {
  auto include_dirs = BuildIncludePath(source_uri, settings);
  if (!include_dirs) {
    return std::unexpected(include_dirs.error());
  }

  std::vector<std::string> arguments{
      std::string(ToFlag(operation.kind)),
      std::to_string(operation.argument),
  };

  if (!include_dirs->empty()) {
    arguments.emplace_back("--include-path");
    arguments.push_back(fmt::format(
        "{}", fmt::join(*include_dirs, std::string(1, kIncludePathSeparator))));
  }

  arguments.emplace_back(source_path);
  return arguments;
}

auto FormatCommandLine(
    std::string_view executable, const std::vector<std::string>& arguments)
    -> std::string {
  if (arguments.empty()) {
    return std::string(executable);
  }
  return fmt::format("{} {}", executable, fmt::join(arguments, " "));
}

}  // namespace nuls::compiler
