#include "nuls/utils/uri.hpp"

#include <fmt/format.h>

namespace nuls::utils {

namespace {

constexpr std::string_view kFileScheme = "file://";

auto HexValue(char c) -> std::optional<int> {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return std::nullopt;
}

auto NeedsEscape(unsigned char c) -> bool {
  return c == ' ' || c == '%' || c == '#' || c == '?' || c > 127 || c < 32;
}

}  // namespace

auto IsFileUri(std::string_view uri) -> bool {
  return uri.starts_with(kFileScheme);
}

auto UriToPath(std::string_view uri) -> std::optional<std::string> {
  if (!IsFileUri(uri)) {
    return std::nullopt;
  }

  auto rest = uri.substr(kFileScheme.size());

  // Only local files are supported: "file:///path" or "file://localhost/path"
  if (rest.starts_with("localhost/")) {
    rest.remove_prefix(std::string_view("localhost").size());
  }
  if (!rest.starts_with('/')) {
    return std::nullopt;
  }

  std::string path;
  path.reserve(rest.size());
  for (std::size_t i = 0; i < rest.size(); ++i) {
    if (rest[i] != '%') {
      path += rest[i];
      continue;
    }
    if (i + 2 >= rest.size()) {
      return std::nullopt;
    }
    auto high = HexValue(rest[i + 1]);
    auto low = HexValue(rest[i + 2]);
    if (!high || !low) {
      return std::nullopt;
    }
    path += static_cast<char>((*high << 4) | *low);
    i += 2;
  }
  return path;
}

auto PathToUri(std::string_view path) -> std::string {
  std::string result(kFileScheme);
  for (char c : path) {
    auto byte = static_cast<unsigned char>(c);
    if (NeedsEscape(byte)) {
      result += fmt::format("%{:02X}", byte);
    } else {
      result += c;
    }
  }
  return result;
}

}  // namespace nuls::utils
