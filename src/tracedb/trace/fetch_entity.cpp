#include "tracedb/trace/trace_series.h"
#include "tracedb/common/convert.h"
#include "tracedb/common/logger.h"
#include "tracedb/record/entity_codec.h"
#include "tracedb/trace/keys.h"

namespace tracedb {
namespace trace {

core::Result<std::vector<core::Entity>> TraceSeries::fetch_entity(
    const std::vector<core::ChunkID>& chunk_ids, const core::ScanOptions& opt) {
    if (chunk_ids.empty()) {
        return core::Result<std::vector<core::Entity>>(std::make_unique<core::ChunkIDsEmptyError>());
    }
    auto planned = planner_.plan(opt.projection);
    if (!planned.ok()) {
        return core::Result<std::vector<core::Entity>>(planned.take_error());
    }
    const FetchPlan& plan = planned.value();
    if (plan.empty()) {
        return core::Result<std::vector<core::Entity>>(std::make_unique<core::ProjectionEmptyError>());
    }

    std::vector<core::Entity> entities;
    entities.reserve(chunk_ids.size());
    auto errors = std::make_unique<core::MultiError>();
    auto fail = [&](core::ChunkID chunk_id, std::unique_ptr<core::Error> error) {
        item_failures_.fetch_add(1, std::memory_order_relaxed);
        errors->append(core::Wrap(std::move(error), "chunk id " + std::to_string(chunk_id)));
    };

    for (core::ChunkID chunk_id : chunk_ids) {
        chunks_resolved_.fetch_add(1, std::memory_order_relaxed);
        auto shard = id_codec_->parse_shard(chunk_id);
        if (!shard.ok()) {
            fail(chunk_id, shard.take_error());
            continue;
        }
        auto ts = id_codec_->parse_timestamp(chunk_id);
        if (!ts.ok()) {
            fail(chunk_id, ts.take_error());
            continue;
        }
        auto ref_value = reader_->get(
            storage::StoreScope{shard.value(), kChunkIDMapping, ts.value(), ts.value()},
            common::Uint64ToBytes(chunk_id));
        if (!ref_value.ok()) {
            fail(chunk_id, ref_value.take_error());
            continue;
        }
        auto ref = ParseInternalRef(ref_value.value());
        if (!ref.ok()) {
            fail(chunk_id, ref.take_error());
            continue;
        }
        TRACEDB_DEBUG("fetch internal id by chunk_id chunk_id={} id={} series_id={} shard_id={} ts={}",
                      chunk_id, common::HexEncode(ref_value.value()),
                      common::BytesToUint64(ref.value().series_id), shard.value(), ts.value());

        auto entity = get_entity_by_internal_ref(ref.value().series_id, ref.value().state, plan,
                                                 shard.value(), ts.value());
        if (!entity.ok()) {
            fail(chunk_id, entity.take_error());
            continue;
        }
        TRACEDB_DEBUG("fetch entity entity_id={} fields_num={} data_binary_size_bytes={}",
                      common::HexEncode(entity.value().entity_id),
                      entity.value().fields_length(), entity.value().data_binary_length());
        entities_materialized_.fetch_add(1, std::memory_order_relaxed);
        entities.push_back(entity.take_value());
    }
    return core::Result<std::vector<core::Entity>>::partial(
        std::move(entities), core::MultiError::Combine(std::move(errors)));
}

core::Result<core::Entity> TraceSeries::get_entity_by_internal_ref(const core::Bytes& series_id,
                                                                   uint8_t state,
                                                                   const FetchPlan& plan,
                                                                   uint32_t shard,
                                                                   core::TimestampNanos ts) {
    auto stores = GetStoreNames(state);
    if (!stores.ok()) {
        return core::Result<core::Entity>(stores.take_error());
    }
    auto raw = reader_->get(storage::StoreScope{shard, stores.value().fields_store, ts, ts}, series_id);
    if (!raw.ok()) {
        return core::Result<core::Entity>(raw.take_error());
    }
    auto value = record::EntityCodec::decode_value(raw.value());
    if (!value.ok()) {
        return core::Result<core::Entity>(value.take_error());
    }

    core::Entity entity;
    entity.entity_id = value.value().entity_id;
    entity.timestamp_nanoseconds = value.value().timestamp_nanoseconds;
    if (!plan.fields.empty()) {
        entity.fields = record::EntityCodec::transform(value.value(), plan.fields);
    }
    if (plan.fetch_data_binary) {
        auto data = reader_->get(storage::StoreScope{shard, stores.value().data_store, ts, ts}, series_id);
        if (!data.ok()) {
            return core::Result<core::Entity>(data.take_error());
        }
        entity.data_binary = data.take_value();
    }
    return entity;
}

} // namespace trace
} // namespace tracedb
