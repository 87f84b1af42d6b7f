#ifndef TRACEDB_STORAGE_CHUNK_ID_H_
#define TRACEDB_STORAGE_CHUNK_ID_H_

#include <atomic>
#include <cstdint>

#include "tracedb/core/result.h"
#include "tracedb/core/types.h"

namespace tracedb {
namespace storage {

/**
 * @brief Decomposes chunk IDs into the shard and time they were written at
 */
class ChunkIDCodec {
public:
    virtual ~ChunkIDCodec() = default;

    virtual core::Result<uint32_t> parse_shard(core::ChunkID id) const = 0;
    virtual core::Result<core::TimestampNanos> parse_timestamp(core::ChunkID id) const = 0;
};

/**
 * @brief Snowflake style chunk IDs
 *
 * Layout, most significant bits first:
 *   [timestamp millis: 44][shard: 8][sequence: 12]
 *
 * Timestamps are truncated to milliseconds on generation, so parse_timestamp
 * returns whole milliseconds expressed in nanoseconds.
 */
class ChunkIDGenerator : public ChunkIDCodec {
public:
    static constexpr int kTimestampBits = 44;
    static constexpr int kShardBits = 8;
    static constexpr int kSequenceBits = 12;

    explicit ChunkIDGenerator(uint32_t shard_num);

    // Next ID for a span written to shard at ts
    core::Result<core::ChunkID> next(uint32_t shard, core::TimestampNanos ts);

    core::Result<uint32_t> parse_shard(core::ChunkID id) const override;
    core::Result<core::TimestampNanos> parse_timestamp(core::ChunkID id) const override;

private:
    const uint32_t shard_num_;
    std::atomic<uint32_t> sequence_{0};
};

} // namespace storage
} // namespace tracedb

#endif // TRACEDB_STORAGE_CHUNK_ID_H_
