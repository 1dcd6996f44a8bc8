#include "nuls/core/ide_settings.hpp"

#include <fmt/format.h>

namespace nuls {

namespace {

auto TypeError(std::string_view key, std::string_view expected)
    -> std::unexpected<std::string> {
  return std::unexpected(fmt::format("`{}` must be {}", key, expected));
}

auto ParseHints(const nlohmann::json& hints, InlayHintSettings& out)
    -> std::expected<void, std::string> {
  if (!hints.is_object()) {
    return TypeError("hints", "an object");
  }
  if (auto it = hints.find("showInferredTypes"); it != hints.end()) {
    if (!it->is_boolean()) {
      return TypeError("hints.showInferredTypes", "a boolean");
    }
    out.show_inferred_types = it->get<bool>();
  }
  return {};
}

auto ParseIncludeDirs(
    const nlohmann::json& dirs, std::vector<std::string>& out)
    -> std::expected<void, std::string> {
  if (!dirs.is_array()) {
    return TypeError("includeDirs", "an array of strings");
  }
  std::vector<std::string> parsed;
  parsed.reserve(dirs.size());
  for (const auto& dir : dirs) {
    if (!dir.is_string()) {
      return TypeError("includeDirs", "an array of strings");
    }
    parsed.push_back(dir.get<std::string>());
  }
  out = std::move(parsed);
  return {};
}

}  // namespace

auto ParseIdeSettings(const nlohmann::json& section)
    -> std::expected<IdeSettings, std::string> {
  if (!section.is_object()) {
    return std::unexpected(std::string("settings must be an object"));
  }

  IdeSettings settings;

  if (auto it = section.find("hints"); it != section.end()) {
    if (auto result = ParseHints(*it, settings.hints); !result) {
      return std::unexpected(result.error());
    }
  }

  if (auto it = section.find("includeDirs"); it != section.end()) {
    if (auto result = ParseIncludeDirs(*it, settings.include_dirs); !result) {
      return std::unexpected(result.error());
    }
  }

  if (auto it = section.find("maxNumberOfProblems"); it != section.end()) {
    if (!it->is_number_unsigned() ||
        it->get<std::uint64_t>() > UINT32_MAX) {
      return TypeError("maxNumberOfProblems", "an unsigned 32-bit integer");
    }
    settings.max_number_of_problems = it->get<std::uint32_t>();
  }

  if (auto it = section.find("maxNushellInvocationTime");
      it != section.end()) {
    // Bounded like maxNumberOfProblems so the timer deadline cannot overflow
    if (!it->is_number_unsigned() ||
        it->get<std::uint64_t>() > UINT32_MAX) {
      return TypeError(
          "maxNushellInvocationTime",
          "an unsigned 32-bit number of milliseconds");
    }
    settings.max_invocation_time =
        std::chrono::milliseconds(it->get<std::uint32_t>());
  }

  if (auto it = section.find("nushellExecutablePath"); it != section.end()) {
    if (!it->is_string()) {
      return TypeError("nushellExecutablePath", "a string");
    }
    settings.executable_path = it->get<std::string>();
  }

  return settings;
}

auto ParseSettingsPayload(const nlohmann::json& payload) -> IdeSettings {
  if (!payload.is_object()) {
    return IdeSettings{};
  }
  auto it = payload.find(std::string(kSettingsSection));
  if (it == payload.end()) {
    return IdeSettings{};
  }
  return ParseIdeSettings(*it).value_or(IdeSettings{});
}

}  // namespace nuls
