#pragma once

#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include <asio.hpp>
#include <lsp/error.hpp>
#include <lsp/workspace.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "nuls/core/capability_gate.hpp"
#include "nuls/core/ide_settings.hpp"

namespace nuls::services {

using lsp::error::LspError;

// Resolves the settings in effect for a document.
// Clients that answer workspace/configuration get per-document settings,
// pulled on first use and cached until the next configuration change.
// Other clients share one global value replaced by each change
// notification.
class SettingsResolver {
 public:
  using ConfigurationFetcher = std::function<
      asio::awaitable<std::expected<lsp::ConfigurationResult, LspError>>(
          lsp::ConfigurationParams)>;

  SettingsResolver(
      const CapabilityGate& capabilities,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  auto SetConfigurationFetcher(ConfigurationFetcher fetcher) -> void;

  auto GetSettings(std::string uri)
      -> asio::awaitable<std::expected<IdeSettings, LspError>>;

  // Handle a didChangeConfiguration payload
  auto OnConfigurationChanged(const nlohmann::json& payload) -> void;

  [[nodiscard]] auto GlobalSettings() const -> IdeSettings;
  [[nodiscard]] auto CachedSettings(const std::string& uri) const
      -> std::optional<IdeSettings>;

 private:
  const CapabilityGate& capabilities_;
  std::shared_ptr<spdlog::logger> logger_;
  ConfigurationFetcher fetcher_;

  mutable std::shared_mutex global_mutex_;
  IdeSettings global_settings_;

  mutable std::shared_mutex cache_mutex_;
  std::unordered_map<std::string, IdeSettings> document_settings_;
};

}  // namespace nuls::services
