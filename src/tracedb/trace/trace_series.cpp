#include "tracedb/trace/trace_series.h"
#include "tracedb/common/convert.h"
#include "tracedb/common/logger.h"
#include "tracedb/storage/partition.h"
#include "tracedb/trace/keys.h"

namespace tracedb {
namespace trace {

core::Result<std::unique_ptr<TraceSeries>> TraceSeries::create(
    const core::TraceSeriesConfig& config,
    std::shared_ptr<storage::StorageReader> reader,
    std::shared_ptr<const storage::ChunkIDCodec> id_codec) {
    auto valid = config.validate();
    if (!valid.ok()) {
        return core::Result<std::unique_ptr<TraceSeries>>(valid.take_error());
    }
    if (!reader || !id_codec) {
        return core::Result<std::unique_ptr<TraceSeries>>(std::make_unique<core::InvalidArgumentError>(
            "trace series needs a storage reader and a chunk id codec"));
    }
    TRACEDB_INFO("open trace series name={} shard_num={} fields={}",
                 config.name, config.shard_num, config.fields.size());
    return std::make_unique<TraceSeries>(config, std::move(reader), std::move(id_codec));
}

TraceSeries::TraceSeries(const core::TraceSeriesConfig& config,
                         std::shared_ptr<storage::StorageReader> reader,
                         std::shared_ptr<const storage::ChunkIDCodec> id_codec)
    : config_(config),
      reader_(std::move(reader)),
      id_codec_(std::move(id_codec)),
      planner_(config.fields) {}

core::Result<core::Trace> TraceSeries::fetch_trace(const std::string& trace_id,
                                                   const core::ScanOptions& opt) {
    if (trace_id.empty()) {
        return core::Result<core::Trace>(std::make_unique<core::InvalidTraceIDError>());
    }
    traces_fetched_.fetch_add(1, std::memory_order_relaxed);

    const core::Bytes trace_id_bytes = common::StringToBytes(trace_id);
    const uint32_t shard = storage::ShardID(trace_id, config_.shard_num);
    auto values = reader_->get_all(storage::StoreScope{shard, kTraceIndex, 0, 0}, trace_id_bytes);
    if (!values.ok()) {
        return core::Result<core::Trace>(values.take_error());
    }
    TRACEDB_DEBUG("fetch trace by trace_id shard_id={} trace_id={} trace_id_bytes={} chunk_num={}",
                  shard, trace_id, common::HexEncode(trace_id_bytes), values.value().size());

    core::Trace trace;
    trace.kind_version = core::kTraceKindVersion;
    if (values.value().empty()) {
        return trace;
    }

    auto errors = std::make_unique<core::MultiError>();
    std::vector<core::ChunkID> chunk_ids;
    chunk_ids.reserve(values.value().size());
    for (const auto& value : values.value()) {
        if (value.size() != sizeof(core::ChunkID)) {
            errors->append(std::make_unique<core::InvalidKeyError>(
                "invalid chunk id in trace index: " + common::HexEncode(value)));
            continue;
        }
        chunk_ids.push_back(common::BytesToUint64(value));
    }
    if (!chunk_ids.empty()) {
        auto entities = fetch_entity(chunk_ids, opt);
        errors->append(entities.take_error());
        trace.entities = entities.take_value();
    }
    return core::Result<core::Trace>::partial(std::move(trace),
                                              core::MultiError::Combine(std::move(errors)));
}

QueryStats TraceSeries::get_stats() const {
    return QueryStats{
        traces_fetched_.load(std::memory_order_relaxed),
        range_scans_.load(std::memory_order_relaxed),
        scan_lines_.load(std::memory_order_relaxed),
        chunks_resolved_.load(std::memory_order_relaxed),
        entities_materialized_.load(std::memory_order_relaxed),
        item_failures_.load(std::memory_order_relaxed)};
}

void TraceSeries::reset_stats() {
    traces_fetched_ = 0;
    range_scans_ = 0;
    scan_lines_ = 0;
    chunks_resolved_ = 0;
    entities_materialized_ = 0;
    item_failures_ = 0;
}

} // namespace trace
} // namespace tracedb
