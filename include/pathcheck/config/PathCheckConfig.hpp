#pragma once

#include <pathcheck/PathCheck.hpp>
#include <pathcheck/log/FileLogSink.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace PC {

struct PathCheckConfig {
    bool                       simulate = false;
    std::optional<std::string> backup;
    std::optional<std::string> logFile;
    LogFileMode                logMode      = LogFileMode::Append;
    bool                       logTimestamp = false;
    int                        debugLevel   = 0;
};

/**
 * JSON layout (every key optional, unknown keys ignored):
 *
 *   {
 *     "simulate": false,
 *     "backup": ".prev",
 *     "log": { "file": "/var/log/app.log", "mode": "append", "timestamp": true, "debug": 1 }
 *   }
 *
 * "mode" is "write" or "append".
 */
[[nodiscard]] auto parseConfig(std::string_view text) -> Expected<PathCheckConfig>;
[[nodiscard]] auto loadConfig(std::filesystem::path const& path) -> Expected<PathCheckConfig>;

/**
 * Environment overrides:
 *   PATHCHECK_NOACTION  simulate mode ("0", "false", "off", "no" disable it)
 *   PATHCHECK_BACKUP    default backup suffix
 *   PATHCHECK_LOG_FILE  log file
 *   PATHCHECK_DEBUG     debug level
 */
auto applyEnvironment(PathCheckConfig& config) -> void;

// Build a PathCheck from `config`, opening the log file if one is configured.
[[nodiscard]] auto makePathCheck(PathCheckConfig const& config) -> Expected<PathCheck>;

} // namespace PC
