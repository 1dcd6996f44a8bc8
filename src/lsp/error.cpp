#include "lsp/error.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace lsp::error {

namespace {

struct CodeInfo {
  LspErrorCode code;
  int rpc_code;
  std::string_view message;
};

constexpr int kGenericServerError = -32000;

constexpr std::array kCodeTable{
    CodeInfo{LspErrorCode::kParseError, -32700, "Parse error"},
    CodeInfo{LspErrorCode::kInvalidRequest, -32600, "Invalid request"},
    CodeInfo{LspErrorCode::kMethodNotFound, -32601, "Method not found"},
    CodeInfo{LspErrorCode::kInvalidParams, -32602, "Invalid params"},
    CodeInfo{LspErrorCode::kInternalError, -32603, "Internal error"},
    CodeInfo{LspErrorCode::kServerError, kGenericServerError, "Server error"},
    CodeInfo{
        LspErrorCode::kTransportError, kGenericServerError, "Transport error"},
    CodeInfo{LspErrorCode::kTimeoutError, kGenericServerError, "Timeout error"},
    CodeInfo{LspErrorCode::kClientError, kGenericServerError, "Client error"},
    CodeInfo{
        LspErrorCode::kMethodNotImplemented, -32601, "Method not implemented"},
    CodeInfo{LspErrorCode::kDocumentNotFound, -32602, "Document not found"},
    CodeInfo{LspErrorCode::kRequestFailed, -32803, "Request failed"},
    CodeInfo{LspErrorCode::kUnknownError, kGenericServerError, "Unknown error"},
};

constexpr std::array kRpcCodeMap{
    std::pair{RpcErrorCode::kParseError, LspErrorCode::kParseError},
    std::pair{RpcErrorCode::kInvalidRequest, LspErrorCode::kInvalidRequest},
    std::pair{RpcErrorCode::kMethodNotFound, LspErrorCode::kMethodNotFound},
    std::pair{RpcErrorCode::kInvalidParams, LspErrorCode::kInvalidParams},
    std::pair{RpcErrorCode::kInternalError, LspErrorCode::kInternalError},
    std::pair{RpcErrorCode::kServerError, LspErrorCode::kServerError},
    std::pair{RpcErrorCode::kTransportError, LspErrorCode::kTransportError},
    std::pair{RpcErrorCode::kTimeoutError, LspErrorCode::kTimeoutError},
    std::pair{RpcErrorCode::kClientError, LspErrorCode::kClientError},
};

auto Lookup(LspErrorCode code) -> const CodeInfo& {
  auto it = std::ranges::find(kCodeTable, code, &CodeInfo::code);
  return it != kCodeTable.end() ? *it : kCodeTable.back();
}

}  // namespace

auto ToRpcCode(LspErrorCode code) -> int {
  return Lookup(code).rpc_code;
}

auto DefaultMessage(LspErrorCode code) -> std::string_view {
  return Lookup(code).message;
}

LspError::LspError(LspErrorCode code, std::string message)
    : code_(code), message_(std::move(message)) {
}

auto LspError::ToJson() const -> nlohmann::json {
  return {
      {"code", ToRpcCode(code_)},
      {"message", message_},
  };
}

auto LspError::FromCode(LspErrorCode code, const std::string& message)
    -> LspError {
  if (message.empty()) {
    return LspError(code, std::string(DefaultMessage(code)));
  }
  return LspError(code, message);
}

auto LspError::FromRpcError(const RpcError& error) -> LspError {
  auto it = std::ranges::find_if(
      kRpcCodeMap, [&error](const auto& entry) {
        return entry.first == error.Code();
      });
  auto code =
      it != kRpcCodeMap.end() ? it->second : LspErrorCode::kUnknownError;
  return LspError(code, error.Message());
}

void to_json(nlohmann::json& j, const LspError& e) {
  j = e.ToJson();
}

}  // namespace lsp::error
