#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace hilite {

inline constexpr const char* LOGGER_NAME = "hilite";

// Logging configuration for embedders
struct LogConfig {
    spdlog::level::level_enum level{spdlog::level::info};
    bool console{true};
    std::string console_pattern{"[%^%l%$] %v"};
    std::string file_path;  // Empty = no file sink
    spdlog::level::level_enum file_level{spdlog::level::debug};
    std::string file_pattern{"[%Y-%m-%d %H:%M:%S.%e] [%l] %v"};
    bool truncate_file{true};
    bool read_env_levels{false};  // Apply SPDLOG_LEVEL overrides
};

// Builds the "hilite" logger from config and installs it as spdlog's default.
// Sink construction failures are reported on stderr and leave the previous
// default logger in place.
std::shared_ptr<spdlog::logger> setup_logging(const LogConfig& config = {});

} // namespace hilite
