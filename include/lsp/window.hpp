#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace lsp {

enum class MessageType {
  kError = 1,
  kWarning = 2,
  kInfo = 3,
  kLog = 4,
};

void to_json(nlohmann::json& j, const MessageType& t);
void from_json(const nlohmann::json& j, MessageType& t);

// LogMessage Notification
struct LogMessageParams {
  MessageType type;
  std::string message;
};

void to_json(nlohmann::json& j, const LogMessageParams& p);
void from_json(const nlohmann::json& j, LogMessageParams& p);

}  // namespace lsp
