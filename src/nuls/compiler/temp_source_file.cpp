#include "nuls/compiler/temp_source_file.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace nuls::compiler {

namespace {

constexpr std::string_view kFilePrefix = "nuls-";
constexpr std::string_view kFileSuffix = ".nu";

auto IoError(std::string_view what, int error)
    -> std::unexpected<CompilerError> {
  return CompilerError::Unexpected(
      CompilerErrorKind::kTempFileIo,
      fmt::format("{}: {}", what, std::strerror(error)));
}

auto WriteAll(int fd, std::string_view contents) -> int {
  while (!contents.empty()) {
    auto written = ::write(fd, contents.data(), contents.size());
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      return errno;
    }
    contents.remove_prefix(static_cast<std::size_t>(written));
  }
  return 0;
}

}  // namespace

auto TempSourceFile::Create(std::string_view contents)
    -> std::expected<TempSourceFile, CompilerError> {
  std::error_code ec;
  auto directory = std::filesystem::temp_directory_path(ec);
  if (ec) {
    return CompilerError::Unexpected(
        CompilerErrorKind::kTempFileIo,
        fmt::format("cannot locate temp directory: {}", ec.message()));
  }

  auto pattern =
      (directory / fmt::format("{}XXXXXX{}", kFilePrefix, kFileSuffix))
          .string();
  std::vector<char> name(pattern.begin(), pattern.end());
  name.push_back('\0');

  int fd = ::mkstemps(name.data(), static_cast<int>(kFileSuffix.size()));
  if (fd < 0) {
    return IoError("cannot create temp file", errno);
  }

  // Owns the path from here on, so every exit below removes the file
  TempSourceFile file(std::string(name.data()));

  int write_error = WriteAll(fd, contents);
  int close_result = ::close(fd);
  if (write_error != 0) {
    return IoError(fmt::format("cannot write {}", file.Path()), write_error);
  }
  if (close_result != 0) {
    return IoError(fmt::format("cannot close {}", file.Path()), errno);
  }
  return file;
}

TempSourceFile::TempSourceFile(TempSourceFile&& other) noexcept
    : path_(std::exchange(other.path_, std::string{})) {
}

auto TempSourceFile::operator=(TempSourceFile&& other) noexcept
    -> TempSourceFile& {
  if (this != &other) {
    Remove();
    path_ = std::exchange(other.path_, std::string{});
  }
  return *this;
}

TempSourceFile::~TempSourceFile() {
  Remove();
}

auto TempSourceFile::Remove() noexcept -> void {
  if (path_.empty()) {
    return;
  }
  std::error_code ec;
  if (!std::filesystem::remove(path_, ec) || ec) {
    spdlog::warn(
        "Failed to remove temp file {}: {}", path_,
        ec ? ec.message() : "file is gone");
  }
  path_.clear();
}

}  // namespace nuls::compiler
