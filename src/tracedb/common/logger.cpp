#include "tracedb/common/logger.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>

namespace tracedb {
namespace common {

void Logger::Init(const core::LogConfig& config) {
    auto level = ParseLevel(config.level);
    if (!level.ok()) {
        std::cerr << "Log initialization failed: " << level.error() << std::endl;
        return;
    }
    try {
        auto console = spdlog::get(config.logger_name);
        if (!console) {
            console = spdlog::stdout_color_mt(config.logger_name);
        }
        spdlog::set_default_logger(console);
        spdlog::set_pattern(config.pattern);
        spdlog::set_level(level.value());
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

core::Result<spdlog::level::level_enum> Logger::ParseLevel(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str falls back to off for unknown names
    if (level == spdlog::level::off && name != "off") {
        return core::Result<spdlog::level::level_enum>(
            std::make_unique<core::InvalidArgumentError>("unknown log level: " + name));
    }
    return level;
}

} // namespace common
} // namespace tracedb
