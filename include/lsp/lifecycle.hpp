#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"
#include "lsp/client_capabilities.hpp"
#include "lsp/server_capabilities.hpp"

namespace lsp {

// Payload of the messages that carry no fields. Serializes to null, which is
// also the expected result of `shutdown`.
struct NoParams {};

void to_json(nlohmann::json& j, const NoParams& p);
void from_json(const nlohmann::json& j, NoParams& p);

using InitializedParams = NoParams;
using ShutdownParams = NoParams;
using ShutdownResult = NoParams;
using ExitParams = NoParams;
using RegistrationResult = NoParams;

// clientInfo / serverInfo
struct ProductInfo {
  std::string name;
  std::optional<std::string> version;
};

void to_json(nlohmann::json& j, const ProductInfo& p);
void from_json(const nlohmann::json& j, ProductInfo& p);

struct InitializeParams {
  std::optional<int> processId;
  std::optional<ProductInfo> clientInfo;
  std::optional<DocumentUri> rootUri;
  std::optional<ClientCapabilities> capabilities;
  std::optional<std::vector<WorkspaceFolder>> workspaceFolders;
};

void to_json(nlohmann::json& j, const InitializeParams& p);
void from_json(const nlohmann::json& j, InitializeParams& p);

struct InitializeResult {
  ServerCapabilities capabilities;
  std::optional<ProductInfo> serverInfo;
};

void to_json(nlohmann::json& j, const InitializeResult& p);
void from_json(const nlohmann::json& j, InitializeResult& p);

// client/registerCapability
struct Registration {
  std::string id;
  std::string method;
  std::optional<nlohmann::json> registerOptions;
};

void to_json(nlohmann::json& j, const Registration& p);
void from_json(const nlohmann::json& j, Registration& p);

struct RegistrationParams {
  std::vector<Registration> registrations;
};

void to_json(nlohmann::json& j, const RegistrationParams& p);
void from_json(const nlohmann::json& j, RegistrationParams& p);

}  // namespace lsp
