#include <hilite/core/logging.hpp>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <iostream>
#include <vector>

namespace hilite {

std::shared_ptr<spdlog::logger> setup_logging(const LogConfig& config) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (config.console) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(config.level);
            console_sink->set_pattern(config.console_pattern);
            sinks.push_back(std::move(console_sink));
        }

        if (!config.file_path.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                config.file_path, config.truncate_file);
            file_sink->set_level(config.file_level);
            file_sink->set_pattern(config.file_pattern);
            sinks.push_back(std::move(file_sink));
        }

        auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        logger->set_level(std::min(config.level, config.file_path.empty() ? config.level : config.file_level));

        spdlog::set_default_logger(logger);
        if (config.read_env_levels) {
            spdlog::cfg::load_env_levels();
        }

        spdlog::debug("Logging initialized ({} sinks)", sinks.size());
        return logger;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return spdlog::default_logger();
    }
}

} // namespace hilite
