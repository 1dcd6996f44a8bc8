#pragma once

#include <optional>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"
#include "lsp/json_utils.hpp"

namespace lsp {

// textDocument/definition
struct DefinitionParams : TextDocumentPositionParams {};

void to_json(nlohmann::json& j, const DefinitionParams& p);
void from_json(const nlohmann::json& j, DefinitionParams& p);

using DefinitionResult = std::optional<Location>;

}  // namespace lsp
