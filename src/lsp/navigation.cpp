#include "lsp/navigation.hpp"

namespace lsp {

void to_json(nlohmann::json& j, const DefinitionParams& p) {
  to_json(j, static_cast<const TextDocumentPositionParams&>(p));
}

void from_json(const nlohmann::json& j, DefinitionParams& p) {
  from_json(j, static_cast<TextDocumentPositionParams&>(p));
}

}  // namespace lsp
