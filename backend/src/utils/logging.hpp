#pragma once
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

struct LogConfig {
    std::string file = "cadence.log";
    std::string level = "info";
};

namespace Log
{
    inline void init(const LogConfig& config = LogConfig())
    {
        // Create file logger
        auto file_logger = spdlog::basic_logger_mt("file_logger", config.file);

        // Make file logger the default
        spdlog::set_default_logger(file_logger);

        // Set global log pattern ONCE
        spdlog::set_pattern("[%d:%m:%Y:%H:%M:%S.%e] [%l] %v");

        // unknown names map to "off" in spdlog; keep info instead
        auto level = spdlog::level::from_str(config.level);
        if (level == spdlog::level::off && config.level != "off") {
            level = spdlog::level::info;
            spdlog::warn("Unknown log level '{}', using info", config.level);
        }
        spdlog::set_level(level);
        spdlog::flush_on(spdlog::level::info);
    }
}
