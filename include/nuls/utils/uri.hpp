#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace nuls::utils {

// Check if the URI starts with file://
auto IsFileUri(std::string_view uri) -> bool;

// Convert a file URI to a local path, decoding percent escapes.
// Examples:
// "file:///home/user/script.nu" -> "/home/user/script.nu"
// "file:///home/user/my%20dir/a.nu" -> "/home/user/my dir/a.nu"
// Returns nullopt for non-file URIs and for malformed escapes.
auto UriToPath(std::string_view uri) -> std::optional<std::string>;

// Convert an absolute local path to a file URI
// Examples:
// "/home/user/script.nu" -> "file:///home/user/script.nu"
auto PathToUri(std::string_view path) -> std::string;

}  // namespace nuls::utils
