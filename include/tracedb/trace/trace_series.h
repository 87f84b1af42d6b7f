#ifndef TRACEDB_TRACE_TRACE_SERIES_H_
#define TRACEDB_TRACE_TRACE_SERIES_H_

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "tracedb/core/config.h"
#include "tracedb/core/result.h"
#include "tracedb/core/types.h"
#include "tracedb/storage/chunk_id.h"
#include "tracedb/storage/kv.h"
#include "tracedb/trace/projection.h"

namespace tracedb {
namespace trace {

// Snapshot of the query counters of a series
struct QueryStats {
    uint64_t traces_fetched;
    uint64_t range_scans;
    uint64_t scan_lines;
    uint64_t chunks_resolved;
    uint64_t entities_materialized;
    uint64_t item_failures;
};

/**
 * @brief Read path of a sharded trace series
 *
 * Resolves trace IDs and time windows to materialized, projected entities:
 *
 *   trace_index[trace id]            -> chunk ids
 *   start_time_index[state|ts|chunk] -> chunk ids
 *   chunk_id_mapping[chunk id]       -> state | series id
 *   <state>_fields[series id]        -> entity record
 *   <state>_data[series id]          -> payload
 *
 * Batch operations never stop at a failed item. They return whatever was
 * resolved together with an error listing every failure, so a Result that is
 * not ok() may still hold entities. Precondition failures (empty trace ID,
 * empty batch, bad projection) are returned before any storage access.
 *
 * Immutable after construction; one instance serves concurrent queries.
 */
class TraceSeries {
public:
    /**
     * @brief Validate config and open a series over reader
     */
    static core::Result<std::unique_ptr<TraceSeries>> create(
        const core::TraceSeriesConfig& config,
        std::shared_ptr<storage::StorageReader> reader,
        std::shared_ptr<const storage::ChunkIDCodec> id_codec);

    TraceSeries(const core::TraceSeriesConfig& config,
                std::shared_ptr<storage::StorageReader> reader,
                std::shared_ptr<const storage::ChunkIDCodec> id_codec);

    TraceSeries(const TraceSeries&) = delete;
    TraceSeries& operator=(const TraceSeries&) = delete;

    /**
     * @brief All entities of a trace
     *
     * An unknown trace ID yields an empty trace and no error. Fails with
     * INVALID_TRACE_ID for an empty ID.
     */
    core::Result<core::Trace> fetch_trace(const std::string& trace_id, const core::ScanOptions& opt);

    /**
     * @brief Entities whose start time falls in [start_time, end_time]
     */
    core::Result<std::vector<core::Entity>> scan_entity(
        core::TimestampNanos start_time, core::TimestampNanos end_time, const core::ScanOptions& opt);

    /**
     * @brief Chunk IDs matching a time window and state filter
     *
     * Scans the start time index once per shard and state. The limit is
     * shared by all scan lines and checked after each accepted chunk, so a
     * line stops once the shared count exceeds it; up to one extra chunk per
     * line can be returned.
     */
    core::Result<std::vector<core::ChunkID>> scan_chunk_ids(
        core::TimestampNanos start_time, core::TimestampNanos end_time, const core::ScanOptions& opt);

    /**
     * @brief Materialize chunks, in input order, skipping the ones that fail
     */
    core::Result<std::vector<core::Entity>> fetch_entity(
        const std::vector<core::ChunkID>& chunk_ids, const core::ScanOptions& opt);

    const core::TraceSeriesConfig& config() const { return config_; }

    QueryStats get_stats() const;
    void reset_stats();

private:
    struct ScanLine {
        uint32_t shard;
        core::State state;
    };

    struct ScanLineResult {
        std::vector<core::ChunkID> chunk_ids;
        std::unique_ptr<core::MultiError> errors;
    };

    ScanLineResult scan_line(const ScanLine& line,
                             core::TimestampNanos start_time,
                             core::TimestampNanos end_time,
                             uint32_t limit,
                             std::atomic<uint32_t>& accepted);

    core::Result<core::Entity> get_entity_by_internal_ref(const core::Bytes& series_id,
                                                          uint8_t state,
                                                          const FetchPlan& plan,
                                                          uint32_t shard,
                                                          core::TimestampNanos ts);

    const core::TraceSeriesConfig config_;
    std::shared_ptr<storage::StorageReader> reader_;
    std::shared_ptr<const storage::ChunkIDCodec> id_codec_;
    const ProjectionPlanner planner_;

    std::atomic<uint64_t> traces_fetched_{0};
    std::atomic<uint64_t> range_scans_{0};
    std::atomic<uint64_t> scan_lines_{0};
    std::atomic<uint64_t> chunks_resolved_{0};
    std::atomic<uint64_t> entities_materialized_{0};
    std::atomic<uint64_t> item_failures_{0};
};

} // namespace trace
} // namespace tracedb

#endif // TRACEDB_TRACE_TRACE_SERIES_H_
