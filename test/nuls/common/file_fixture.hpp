#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

#include <unistd.h>

namespace nuls::test {

// Temporary directory removed with the fixture
class FileTestFixture {
 public:
  FileTestFixture() : FileTestFixture("nuls_test") {
  }

  explicit FileTestFixture(std::string_view prefix) {
    std::filesystem::path base_temp;
    if (const char* test_tmpdir = std::getenv("TEST_TMPDIR")) {
      base_temp = test_tmpdir;
    } else {
      base_temp = std::filesystem::temp_directory_path();
    }

    temp_dir_ = base_temp / (std::string(prefix) + "-" +
                             std::to_string(::getpid()));
    std::filesystem::create_directories(temp_dir_);
  }

  FileTestFixture(const FileTestFixture&) = delete;
  FileTestFixture(FileTestFixture&&) = delete;
  auto operator=(const FileTestFixture&) -> FileTestFixture& = delete;
  auto operator=(FileTestFixture&&) -> FileTestFixture& = delete;

  ~FileTestFixture() {
    std::error_code ec;
    std::filesystem::remove_all(temp_dir_, ec);
  }

  [[nodiscard]] auto TempDir() const -> const std::filesystem::path& {
    return temp_dir_;
  }

  auto CreateFile(std::string_view name, std::string_view content)
      -> std::filesystem::path {
    auto path = temp_dir_ / name;
    std::ofstream file(path, std::ios::binary);
    file << content;
    return path;
  }

  // Write an executable POSIX shell script
  auto CreateScript(std::string_view name, std::string_view body)
      -> std::filesystem::path {
    auto path = CreateFile(name, std::string("#!/bin/sh\n") + std::string(body));
    std::filesystem::permissions(
        path,
        std::filesystem::perms::owner_all | std::filesystem::perms::group_read |
            std::filesystem::perms::group_exec,
        std::filesystem::perm_options::replace);
    return path;
  }

 private:
  std::filesystem::path temp_dir_;
};

}  // namespace nuls::test
