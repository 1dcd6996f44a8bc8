#include "app/app_setup.hpp"

#include <array>
#include <cstdlib>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace app {

namespace {

constexpr std::string_view kDefaultLogLevel = "debug";
constexpr std::string_view kLogPattern = "[%n][%L] %v";
constexpr std::string_view kServerLoggerName = "nuls";

struct LoggerConfig {
  std::string_view name;
  spdlog::level::level_enum level;
};

auto GetLogLevelFromEnv() -> spdlog::level::level_enum {
  const char* env_level = std::getenv("SPDLOG_LEVEL");
  return ParseLogLevel(env_level != nullptr ? env_level : kDefaultLogLevel);
}

void ConfigureLogger(
    const std::shared_ptr<spdlog::logger>& logger,
    spdlog::level::level_enum level) {
  logger->set_pattern(std::string(kLogPattern));
  logger->set_level(level);
  logger->flush_on(spdlog::level::debug);
}

}  // namespace

auto ParsePipeName(const std::vector<std::string>& args)
    -> std::optional<std::string> {
  constexpr std::string_view kPipePrefix = "--pipe=";
  for (std::size_t i = 1; i < args.size(); ++i) {
    if (args[i].starts_with(kPipePrefix)) {
      auto name = args[i].substr(kPipePrefix.length());
      if (name.empty()) {
        return std::nullopt;
      }
      return name;
    }
  }
  return std::nullopt;
}

auto ParseLogLevel(std::string_view level_str) -> spdlog::level::level_enum {
  constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 6>
      kLevels = {{
          {"trace", spdlog::level::trace},
          {"debug", spdlog::level::debug},
          {"info", spdlog::level::info},
          {"warn", spdlog::level::warn},
          {"error", spdlog::level::err},
          {"off", spdlog::level::off},
      }};

  for (const auto& [name, level] : kLevels) {
    if (name == level_str) {
      return level;
    }
  }
  return spdlog::level::debug;
}

auto SetupLoggers()
    -> std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> {
  const auto user_log_level = GetLogLevelFromEnv();
  spdlog::set_level(user_log_level);

  constexpr std::array kLoggerConfigs = {
      LoggerConfig{.name = "transport", .level = spdlog::level::info},
      LoggerConfig{.name = "jsonrpc", .level = spdlog::level::info},
      LoggerConfig{.name = kServerLoggerName, .level = spdlog::level::trace},
  };

  std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers;

  for (const auto& config : kLoggerConfigs) {
    auto logger = spdlog::stderr_color_mt(std::string(config.name));
    const auto level =
        (config.name == kServerLoggerName) ? user_log_level : config.level;
    ConfigureLogger(logger, level);
    loggers[std::string(config.name)] = std::move(logger);
  }

  return loggers;
}

}  // namespace app
