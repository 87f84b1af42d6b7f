#include "tracedb/common/convert.h"
#include "tracedb/common/logger.h"
#include "tracedb/record/entity_codec.h"
#include "tracedb/storage/chunk_id.h"
#include "tracedb/storage/memory_storage.h"
#include "tracedb/storage/partition.h"
#include "tracedb/trace/keys.h"
#include "tracedb/trace/trace_series.h"
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace tracedb;

namespace {

struct Span {
    std::string trace_id;
    std::string span_id;
    core::State state;
    core::TimestampNanos start_time;
    std::string service;
    int64_t duration_ms;
    std::string payload;
};

// Lays a span down the way the write path does: index entries, the chunk
// ID mapping, then the field record and payload in the state's stores.
core::Result<core::ChunkID> write_span(storage::MemoryStorage& kv,
                                       storage::ChunkIDGenerator& ids,
                                       const core::TraceSeriesConfig& config,
                                       const Span& span) {
    const core::Bytes series_id = common::StringToBytes(span.span_id);
    const uint32_t shard = storage::ShardID(span.span_id, config.shard_num);
    auto chunk_id = ids.next(shard, span.start_time);
    if (!chunk_id.ok()) {
        return chunk_id;
    }
    auto ts = ids.parse_timestamp(chunk_id.value());
    if (!ts.ok()) {
        return core::Result<core::ChunkID>(ts.take_error());
    }
    auto stores = trace::GetStoreNames(static_cast<uint8_t>(span.state));
    if (!stores.ok()) {
        return core::Result<core::ChunkID>(stores.take_error());
    }

    core::EntityValue value;
    value.entity_id = series_id;
    value.timestamp_nanoseconds = span.start_time;
    // Ordinals follow config.fields
    value.fields = {span.trace_id, static_cast<int64_t>(span.state), span.service,
                    std::string(), std::string(), span.duration_ms};

    const core::Bytes chunk_key = common::Uint64ToBytes(chunk_id.value());
    std::vector<core::Result<void>> writes;
    writes.push_back(kv.put(storage::ShardID(span.trace_id, config.shard_num), trace::kTraceIndex,
                                 common::StringToBytes(span.trace_id), chunk_key));
    writes.push_back(kv.put(shard, trace::kStartTimeIndex,
                                 trace::StartTimeIndexKey(span.state, span.start_time, chunk_id.value()),
                                 chunk_key, span.start_time));
    writes.push_back(kv.put(shard, trace::kChunkIDMapping, chunk_key,
                                 trace::InternalRefValue(span.state, series_id, ts.value()), ts.value()));
    writes.push_back(kv.put(shard, stores.value().fields_store, series_id,
                                 record::EntityCodec::encode_value(value), ts.value()));
    writes.push_back(kv.put(shard, stores.value().data_store, series_id,
                                 common::StringToBytes(span.payload), ts.value()));
    for (auto& write : writes) {
        if (!write.ok()) {
            return core::Result<core::ChunkID>(write.take_error());
        }
    }
    return chunk_id;
}

void print_entity(const core::Entity& entity) {
    std::cout << "  entity " << common::BytesToString(entity.entity_id)
              << " ts=" << entity.timestamp_nanoseconds;
    if (entity.fields) {
        for (const auto& field : *entity.fields) {
            std::cout << " " << field.name << "=";
            if (auto s = std::get_if<std::string>(&field.value)) {
                std::cout << *s;
            } else if (auto i = std::get_if<int64_t>(&field.value)) {
                std::cout << *i;
            } else {
                std::cout << "null";
            }
        }
    }
    if (entity.data_binary) {
        std::cout << " data=" << common::BytesToString(*entity.data_binary);
    }
    std::cout << std::endl;
}

} // namespace

int main() {
    std::cout << "=== TraceDB Quick Start Example ===" << std::endl;
    common::Logger::Init();

    core::TraceSeriesConfig config = core::TraceSeriesConfig::Default();
    config.name = "quickstart";
    config.shard_num = 4;

    auto kv = std::make_shared<storage::MemoryStorage>(config.shard_num);
    auto ids = std::make_shared<storage::ChunkIDGenerator>(config.shard_num);

    const core::TimestampNanos now = static_cast<core::TimestampNanos>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    const core::TimestampNanos ms = 1000000ULL;

    std::vector<Span> spans = {
        {"trace-1", "span-a", core::State::SUCCESS, now - 30 * ms, "frontend", 25, "GET /checkout"},
        {"trace-1", "span-b", core::State::ERROR, now - 20 * ms, "payments", 12, "charge declined"},
        {"trace-2", "span-c", core::State::SUCCESS, now - 10 * ms, "frontend", 4, "GET /"},
    };
    for (const auto& span : spans) {
        auto written = write_span(*kv, *ids, config, span);
        if (!written.ok()) {
            std::cerr << "Write failed: " << written.error() << std::endl;
            return 1;
        }
        std::cout << "Wrote " << span.span_id << " as chunk " << written.value() << std::endl;
    }

    auto series = trace::TraceSeries::create(config, kv, ids);
    if (!series.ok()) {
        std::cerr << "Open failed: " << series.error() << std::endl;
        return 1;
    }

    core::ScanOptions opt;
    opt.projection = {"service_id", "duration", core::kDataBinaryFieldName};

    std::cout << "Fetching trace-1..." << std::endl;
    auto fetched = series.value()->fetch_trace("trace-1", opt);
    if (!fetched.ok()) {
        std::cerr << "Fetch failed: " << fetched.error() << std::endl;
    }
    for (const auto& entity : fetched.value().entities) {
        print_entity(entity);
    }

    std::cout << "Scanning error spans of the last second..." << std::endl;
    opt.state = core::TraceState::ERROR;
    auto scanned = series.value()->scan_entity(now - 1000 * ms, now, opt);
    if (!scanned.ok()) {
        std::cerr << "Scan failed: " << scanned.error() << std::endl;
    }
    for (const auto& entity : scanned.value()) {
        print_entity(entity);
    }

    trace::QueryStats stats = series.value()->get_stats();
    std::cout << "Resolved " << stats.chunks_resolved << " chunks, materialized "
              << stats.entities_materialized << " entities" << std::endl;
    return 0;
}
