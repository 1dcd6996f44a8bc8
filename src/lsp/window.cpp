#include "lsp/window.hpp"

#include <stdexcept>

#include "lsp/json_utils.hpp"

namespace lsp {

void to_json(nlohmann::json& j, const MessageType& t) {
  j = static_cast<int>(t);
}

void from_json(const nlohmann::json& j, MessageType& t) {
  auto value = j.get<int>();
  if (value < 1 || value > 4) {
    throw std::runtime_error("Invalid message type");
  }
  t = static_cast<MessageType>(value);
}

// LogMessage Notification
void to_json(nlohmann::json& j, const LogMessageParams& p) {
  to_json_required(j, "type", p.type);
  to_json_required(j, "message", p.message);
}

void from_json(const nlohmann::json& j, LogMessageParams& p) {
  from_json_required(j, "type", p.type);
  from_json_required(j, "message", p.message);
}

}  // namespace lsp
