#include "nuls/features/ide_types.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace nuls::features {

namespace {

auto ToLower(std::string text) -> std::string {
  std::ranges::transform(text, text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return text;
}

auto ParseSeverity(const std::string& name) -> lsp::DiagnosticSeverity {
  auto lowered = ToLower(name);
  if (lowered == "error") {
    return lsp::DiagnosticSeverity::kError;
  }
  if (lowered == "warning") {
    return lsp::DiagnosticSeverity::kWarning;
  }
  if (lowered == "information") {
    return lsp::DiagnosticSeverity::kInformation;
  }
  if (lowered == "hint") {
    return lsp::DiagnosticSeverity::kHint;
  }
  throw std::invalid_argument("unknown diagnostic severity: " + name);
}

}  // namespace

void from_json(const nlohmann::json& j, Span& s) {
  j.at("start").get_to(s.start);
  j.at("end").get_to(s.end);
}

void from_json(const nlohmann::json& j, IdeComplete& c) {
  j.at("completions").get_to(c.completions);
}

void from_json(const nlohmann::json& j, IdeGotoDef& g) {
  // The compiler prints an empty object when there is no definition
  g.file = j.value("file", std::string{});
  g.start = j.value("start", std::size_t{0});
  g.end = j.value("end", std::size_t{0});
}

void from_json(const nlohmann::json& j, IdeHover& h) {
  j.at("hover").get_to(h.hover);
  if (auto it = j.find("span"); it != j.end() && !it->is_null()) {
    h.span = it->get<Span>();
  } else {
    h.span.reset();
  }
}

void from_json(const nlohmann::json& j, IdeCheckDiagnostic& d) {
  j.at("message").get_to(d.message);
  d.severity = ParseSeverity(j.at("severity").get<std::string>());
  j.at("span").get_to(d.span);
}

void from_json(const nlohmann::json& j, IdeCheckHint& h) {
  j.at("position").get_to(h.position);
  j.at("typename").get_to(h.type_name);
}

}  // namespace nuls::features
