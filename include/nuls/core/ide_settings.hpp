#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace nuls {

// Configuration section requested from and pushed by the client
constexpr std::string_view kSettingsSection = "nushellLanguageServer";

struct InlayHintSettings {
  bool show_inferred_types = true;

  friend auto operator==(const InlayHintSettings&, const InlayHintSettings&)
      -> bool = default;
};

// Effective settings for one document
struct IdeSettings {
  InlayHintSettings hints;
  std::vector<std::string> include_dirs;
  std::uint32_t max_number_of_problems = 1000;
  std::chrono::milliseconds max_invocation_time{10000};
  std::string executable_path = "nu";

  friend auto operator==(const IdeSettings&, const IdeSettings&)
      -> bool = default;
};

// Parse the body of the settings section. Missing keys keep their defaults;
// a key holding a value of the wrong type fails the whole parse.
auto ParseIdeSettings(const nlohmann::json& section)
    -> std::expected<IdeSettings, std::string>;

// Parse a didChangeConfiguration payload, i.e. an object carrying the
// settings section under kSettingsSection. Falls back to defaults when the
// payload cannot be parsed.
auto ParseSettingsPayload(const nlohmann::json& payload) -> IdeSettings;

}  // namespace nuls
