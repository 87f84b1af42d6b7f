#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "tracedb/core/result.h"

namespace tracedb {
namespace core {

/**
 * @brief Configuration for the process-wide logger
 */
struct LogConfig {
    std::string level;     // trace, debug, info, warn, error, critical, off
    std::string pattern;   // spdlog pattern
    std::string logger_name;

    static LogConfig Default() {
        LogConfig config;
        config.level = "info";
        config.pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v";
        config.logger_name = "tracedb";
        return config;
    }
};

/**
 * @brief Configuration for time-range scans
 */
struct ScanConfig {
    int default_limit;        // Result cap used when ScanOptions::limit <= 0
    bool parallel_scan;       // Run shard x state scan lines on the TBB pool
    bool prefetch_values;     // Ask the storage layer to load values while scanning keys

    // Default constructor
    ScanConfig() : default_limit(0), parallel_scan(false), prefetch_values(false) {}

    static ScanConfig Default() {
        ScanConfig config;
        config.default_limit = 10;
        config.parallel_scan = false;
        config.prefetch_values = false;    // Keys carry everything the scan needs
        return config;
    }
};

/**
 * @brief Configuration of one trace series
 *
 * The field list is the series schema: a field's ordinal in stored records
 * is its position in this list.
 */
struct TraceSeriesConfig {
    std::string name;                  // Series name, used in log lines
    uint32_t shard_num;                // Number of shards in the keyspace
    std::vector<std::string> fields;   // Field schema, ordinal = position
    ScanConfig scan;

    // Default constructor
    TraceSeriesConfig() : shard_num(0) {}

    static TraceSeriesConfig Default() {
        TraceSeriesConfig config;
        config.name = "sw";
        config.shard_num = 2;
        config.fields = {"trace_id", "state", "service_id", "service_instance_id",
                         "endpoint_id", "duration", "start_time", "http.method",
                         "status_code", "db.type", "db.instance", "mq.queue",
                         "mq.topic", "mq.broker"};
        config.scan = ScanConfig::Default();
        return config;
    }

    /**
     * @brief Check the configuration before a series is opened with it
     */
    Result<void> validate() const;
};

} // namespace core
} // namespace tracedb
