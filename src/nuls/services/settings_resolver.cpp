#include "nuls/services/settings_resolver.hpp"

#include <mutex>

namespace nuls::services {

using lsp::error::LspErrorCode;

SettingsResolver::SettingsResolver(
    const CapabilityGate& capabilities, std::shared_ptr<spdlog::logger> logger)
    : capabilities_(capabilities),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto SettingsResolver::SetConfigurationFetcher(ConfigurationFetcher fetcher)
    -> void {
  fetcher_ = std::move(fetcher);
}

auto SettingsResolver::GetSettings(std::string uri)
    -> asio::awaitable<std::expected<IdeSettings, LspError>> {
  if (!capabilities_.CanLookupConfiguration()) {
    co_return GlobalSettings();
  }

  if (auto cached = CachedSettings(uri)) {
    co_return *cached;
  }

  if (!fetcher_) {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kInternalError, "no configuration fetcher installed");
  }

  logger_->debug("Fetching settings for {}", uri);
  auto values = co_await fetcher_(lsp::ConfigurationParams{
      .items = {lsp::ConfigurationItem{
          .scopeUri = uri,
          .section = std::string(kSettingsSection),
      }}});
  if (!values) {
    co_return std::unexpected(values.error());
  }

  if (values->empty()) {
    logger_->debug("No settings returned for {}, using defaults", uri);
    co_return IdeSettings{};
  }

  auto parsed = ParseIdeSettings(values->front());
  if (!parsed) {
    logger_->warn(
        "Invalid settings for {} ({}), using defaults", uri, parsed.error());
  }
  auto settings = parsed.value_or(IdeSettings{});

  {
    std::unique_lock lock(cache_mutex_);
    document_settings_.insert_or_assign(uri, settings);
  }
  co_return settings;
}

auto SettingsResolver::OnConfigurationChanged(const nlohmann::json& payload)
    -> void {
  if (capabilities_.CanLookupConfiguration()) {
    std::unique_lock lock(cache_mutex_);
    document_settings_.clear();
    return;
  }

  auto settings = ParseSettingsPayload(payload);
  std::unique_lock lock(global_mutex_);
  global_settings_ = std::move(settings);
}

auto SettingsResolver::GlobalSettings() const -> IdeSettings {
  std::shared_lock lock(global_mutex_);
  return global_settings_;
}

auto SettingsResolver::CachedSettings(const std::string& uri) const
    -> std::optional<IdeSettings> {
  std::shared_lock lock(cache_mutex_);
  auto it = document_settings_.find(uri);
  if (it == document_settings_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace nuls::services
