#pragma once

#include <expected>
#include <string>
#include <string_view>

#include <jsonrpc/error/error.hpp>
#include <nlohmann/json.hpp>

namespace lsp::error {

using RpcError = jsonrpc::error::RpcError;
using RpcErrorCode = jsonrpc::error::RpcErrorCode;

enum class LspErrorCode {
  // JSON-RPC errors
  kParseError,
  kInvalidRequest,
  kMethodNotFound,
  kInvalidParams,
  kInternalError,

  // Failures talking to the client
  kServerError,
  kTransportError,
  kTimeoutError,
  kClientError,

  // LSP errors
  kMethodNotImplemented,
  kDocumentNotFound,
  kRequestFailed,

  kUnknownError,
};

// Numeric code carried on the wire in a JSON-RPC error response
auto ToRpcCode(LspErrorCode code) -> int;

auto DefaultMessage(LspErrorCode code) -> std::string_view;

class LspError {
 public:
  explicit LspError(LspErrorCode code, std::string message);

  [[nodiscard]] auto Code() const -> LspErrorCode {
    return code_;
  }
  [[nodiscard]] auto Message() const -> const std::string& {
    return message_;
  }
  [[nodiscard]] auto ToJson() const -> nlohmann::json;

  // An empty message is replaced by the default text for the code
  static auto FromCode(LspErrorCode code, const std::string& message = "")
      -> LspError;

  static auto UnexpectedFromCode(
      LspErrorCode code, const std::string& details = "")
      -> std::unexpected<LspError> {
    return std::unexpected<LspError>(FromCode(code, details));
  }

  static auto FromRpcError(const RpcError& error) -> LspError;

  static auto UnexpectedFromRpcError(const RpcError& error)
      -> std::unexpected<LspError> {
    return std::unexpected<LspError>(FromRpcError(error));
  }

 private:
  LspErrorCode code_;
  std::string message_;
};

inline auto Ok() -> std::expected<void, LspError> {
  return {};
}

void to_json(nlohmann::json& j, const LspError& e);

}  // namespace lsp::error
