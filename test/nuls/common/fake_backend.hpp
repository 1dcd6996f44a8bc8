#pragma once

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <asio.hpp>

#include "nuls/compiler/compiler_backend.hpp"

namespace nuls::test {

// In-memory compiler returning canned output per operation kind
class FakeCompilerBackend : public compiler::CompilerBackend {
 public:
  static constexpr std::string_view kSourcePath = "/tmp/nuls-fake.nu";

  struct Call {
    compiler::IdeOperation operation;
    std::string text;
    IdeSettings settings;
    std::string source_uri;
  };

  auto SetOutput(compiler::IdeOperationKind kind, std::string stdout_text)
      -> void {
    outputs_[kind] = std::move(stdout_text);
  }

  auto SetError(compiler::IdeOperationKind kind, compiler::CompilerError error)
      -> void {
    errors_.insert_or_assign(kind, std::move(error));
  }

  [[nodiscard]] auto Calls() const -> const std::vector<Call>& {
    return calls_;
  }

  [[nodiscard]] auto CallCount(compiler::IdeOperationKind kind) const
      -> std::size_t {
    return static_cast<std::size_t>(
        std::ranges::count_if(calls_, [kind](const Call& call) {
          return call.operation.kind == kind;
        }));
  }

  auto Run(
      compiler::IdeOperation operation, std::string text, IdeSettings settings,
      std::string source_uri)
      -> asio::awaitable<
          std::expected<compiler::CompilerResponse, compiler::CompilerError>>
      override {
    calls_.push_back(Call{
        .operation = operation,
        .text = text,
        .settings = settings,
        .source_uri = source_uri,
    });

    if (auto it = errors_.find(operation.kind); it != errors_.end()) {
      co_return std::unexpected(it->second);
    }

    std::string stdout_text;
    if (auto it = outputs_.find(operation.kind); it != outputs_.end()) {
      stdout_text = it->second;
    }
    co_return compiler::CompilerResponse{
        .cmdline = std::string(compiler::ToFlag(operation.kind)) + " fake",
        .source_path = std::string(kSourcePath),
        .stdout_text = std::move(stdout_text),
    };
  }

 private:
  std::map<compiler::IdeOperationKind, std::string> outputs_;
  std::map<compiler::IdeOperationKind, compiler::CompilerError> errors_;
  std::vector<Call> calls_;
};

}  // namespace nuls::test
