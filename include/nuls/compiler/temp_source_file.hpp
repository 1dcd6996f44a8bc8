#pragma once

#include <expected>
#include <string>
#include <string_view>

#include "nuls/compiler/compiler_error.hpp"

namespace nuls::compiler {

// A uniquely named source file in the system temp directory, holding the
// text of one compiler invocation. The file is removed when the owner is
// destroyed.
class TempSourceFile {
 public:
  static auto Create(std::string_view contents)
      -> std::expected<TempSourceFile, CompilerError>;

  TempSourceFile(const TempSourceFile&) = delete;
  auto operator=(const TempSourceFile&) -> TempSourceFile& = delete;
  TempSourceFile(TempSourceFile&& other) noexcept;
  auto operator=(TempSourceFile&& other) noexcept -> TempSourceFile&;
  ~TempSourceFile();

  [[nodiscard]] auto Path() const -> const std::string& {
    return path_;
  }

 private:
  explicit TempSourceFile(std::string path) : path_(std::move(path)) {
  }

  auto Remove() noexcept -> void;

  std::string path_;
};

}  // namespace nuls::compiler
