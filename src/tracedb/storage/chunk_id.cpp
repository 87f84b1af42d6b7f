#include "tracedb/storage/chunk_id.h"

#include <string>

namespace tracedb {
namespace storage {

namespace {

constexpr uint64_t kNanosPerMilli = 1000000ULL;
constexpr uint64_t kShardMask = (1ULL << ChunkIDGenerator::kShardBits) - 1;
constexpr uint64_t kSequenceMask = (1ULL << ChunkIDGenerator::kSequenceBits) - 1;
constexpr uint64_t kTimestampMask = (1ULL << ChunkIDGenerator::kTimestampBits) - 1;
constexpr int kShardShift = ChunkIDGenerator::kSequenceBits;
constexpr int kTimestampShift = ChunkIDGenerator::kSequenceBits + ChunkIDGenerator::kShardBits;

} // namespace

ChunkIDGenerator::ChunkIDGenerator(uint32_t shard_num) : shard_num_(shard_num) {}

core::Result<core::ChunkID> ChunkIDGenerator::next(uint32_t shard, core::TimestampNanos ts) {
    if (shard >= shard_num_ || shard > kShardMask) {
        return core::Result<core::ChunkID>(std::make_unique<core::InvalidArgumentError>(
            "shard " + std::to_string(shard) + " out of range [0, " +
            std::to_string(shard_num_) + ")"));
    }
    uint64_t millis = ts / kNanosPerMilli;
    if (millis == 0 || millis > kTimestampMask) {
        return core::Result<core::ChunkID>(std::make_unique<core::InvalidArgumentError>(
            "timestamp " + std::to_string(ts) + " cannot be encoded in a chunk id"));
    }
    uint64_t seq = sequence_.fetch_add(1, std::memory_order_relaxed) & kSequenceMask;
    return (millis << kTimestampShift) | (static_cast<uint64_t>(shard) << kShardShift) | seq;
}

core::Result<uint32_t> ChunkIDGenerator::parse_shard(core::ChunkID id) const {
    auto shard = static_cast<uint32_t>((id >> kShardShift) & kShardMask);
    if (shard >= shard_num_) {
        return core::Result<uint32_t>(std::make_unique<core::InvalidArgumentError>(
            "chunk id " + std::to_string(id) + " carries shard " + std::to_string(shard) +
            " outside [0, " + std::to_string(shard_num_) + ")"));
    }
    return shard;
}

core::Result<core::TimestampNanos> ChunkIDGenerator::parse_timestamp(core::ChunkID id) const {
    uint64_t millis = (id >> kTimestampShift) & kTimestampMask;
    if (millis == 0) {
        return core::Result<core::TimestampNanos>(std::make_unique<core::InvalidArgumentError>(
            "chunk id " + std::to_string(id) + " carries no timestamp"));
    }
    return millis * kNanosPerMilli;
}

} // namespace storage
} // namespace tracedb
