#include "lsp/lifecycle.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

void to_json(nlohmann::json& j, const NoParams& /*unused*/) { j = nullptr; }

void from_json(const nlohmann::json& /*unused*/, NoParams& /*unused*/) {}

void to_json(nlohmann::json& j, const ProductInfo& p) {
  to_json_required(j, "name", p.name);
  to_json_optional(j, "version", p.version);
}

void from_json(const nlohmann::json& j, ProductInfo& p) {
  from_json_required(j, "name", p.name);
  from_json_optional(j, "version", p.version);
}

void to_json(nlohmann::json& j, const InitializeParams& p) {
  // processId is required on the wire but may be null
  j["processId"] = p.processId;
  to_json_optional(j, "clientInfo", p.clientInfo);
  to_json_optional(j, "rootUri", p.rootUri);
  to_json_optional(j, "capabilities", p.capabilities);
  to_json_optional(j, "workspaceFolders", p.workspaceFolders);
}

void from_json(const nlohmann::json& j, InitializeParams& p) {
  from_json_optional(j, "processId", p.processId);
  from_json_optional(j, "clientInfo", p.clientInfo);
  from_json_optional(j, "rootUri", p.rootUri);
  from_json_optional(j, "capabilities", p.capabilities);
  from_json_optional(j, "workspaceFolders", p.workspaceFolders);
}

void to_json(nlohmann::json& j, const InitializeResult& p) {
  to_json_required(j, "capabilities", p.capabilities);
  to_json_optional(j, "serverInfo", p.serverInfo);
}

void from_json(const nlohmann::json& j, InitializeResult& p) {
  from_json_required(j, "capabilities", p.capabilities);
  from_json_optional(j, "serverInfo", p.serverInfo);
}

void to_json(nlohmann::json& j, const Registration& p) {
  to_json_required(j, "id", p.id);
  to_json_required(j, "method", p.method);
  to_json_optional(j, "registerOptions", p.registerOptions);
}

void from_json(const nlohmann::json& j, Registration& p) {
  from_json_required(j, "id", p.id);
  from_json_required(j, "method", p.method);
  from_json_optional(j, "registerOptions", p.registerOptions);
}

void to_json(nlohmann::json& j, const RegistrationParams& p) {
  to_json_required(j, "registrations", p.registrations);
}

void from_json(const nlohmann::json& j, RegistrationParams& p) {
  from_json_required(j, "registrations", p.registrations);
}

}  // namespace lsp
