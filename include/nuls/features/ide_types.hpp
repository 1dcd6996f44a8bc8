#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <lsp/basic.hpp>
#include <lsp/diagnostic.hpp>
#include <nlohmann/json.hpp>

namespace nuls::features {

// Byte offsets into the text handed to the compiler
struct Span {
  std::size_t start = 0;
  std::size_t end = 0;
};

void from_json(const nlohmann::json& j, Span& s);

// Output of --ide-complete
struct IdeComplete {
  std::vector<std::string> completions;
};

void from_json(const nlohmann::json& j, IdeComplete& c);

// Output of --ide-goto-def
struct IdeGotoDef {
  std::string file;
  std::size_t start = 0;
  std::size_t end = 0;
};

void from_json(const nlohmann::json& j, IdeGotoDef& g);

// Output of --ide-hover
struct IdeHover {
  std::string hover;
  std::optional<Span> span;
};

void from_json(const nlohmann::json& j, IdeHover& h);

// One line of --ide-check output tagged "diagnostic"
struct IdeCheckDiagnostic {
  std::string message;
  lsp::DiagnosticSeverity severity = lsp::DiagnosticSeverity::kError;
  Span span;
};

void from_json(const nlohmann::json& j, IdeCheckDiagnostic& d);

// One line of --ide-check output tagged "hint"
struct IdeCheckHint {
  Span position;
  std::string type_name;
};

void from_json(const nlohmann::json& j, IdeCheckHint& h);

using IdeCheck = std::variant<IdeCheckDiagnostic, IdeCheckHint>;

}  // namespace nuls::features
