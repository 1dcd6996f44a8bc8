#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <spdlog/logger.h>

namespace app {

/// Parse command line arguments to extract pipe name
/// Returns the pipe name if --pipe=<name> is found, nullopt otherwise
auto ParsePipeName(const std::vector<std::string>& args)
    -> std::optional<std::string>;

/// Map a level name (trace, debug, info, warn, error, off) to a spdlog level.
/// Unknown names map to debug.
auto ParseLogLevel(std::string_view level_str) -> spdlog::level::level_enum;

/// Setup structured logging with named loggers
/// Returns configured loggers for the transport, jsonrpc and nuls components
auto SetupLoggers()
    -> std::unordered_map<std::string, std::shared_ptr<spdlog::logger>>;

}  // namespace app
