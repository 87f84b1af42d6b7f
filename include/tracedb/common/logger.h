#ifndef TRACEDB_COMMON_LOGGER_H_
#define TRACEDB_COMMON_LOGGER_H_

#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

#include "tracedb/core/config.h"
#include "tracedb/core/result.h"

namespace tracedb {
namespace common {

class Logger {
public:
    // Installs a colour stdout logger as the spdlog default
    static void Init(const core::LogConfig& config = core::LogConfig::Default());
    static void SetLevel(spdlog::level::level_enum level);

    // Maps a level name from configuration to the spdlog level
    static core::Result<spdlog::level::level_enum> ParseLevel(const std::string& name);
};

} // namespace common
} // namespace tracedb

// Macros for convenient logging
#define TRACEDB_TRACE(...) spdlog::trace(__VA_ARGS__)
#define TRACEDB_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define TRACEDB_INFO(...)  spdlog::info(__VA_ARGS__)
#define TRACEDB_WARN(...)  spdlog::warn(__VA_ARGS__)
#define TRACEDB_ERROR(...) spdlog::error(__VA_ARGS__)
#define TRACEDB_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // TRACEDB_COMMON_LOGGER_H_
