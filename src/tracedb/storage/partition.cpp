#include "tracedb/storage/partition.h"

namespace tracedb {
namespace storage {

namespace {

constexpr uint64_t kFnvOffsetBasis = 0xcbf29ce484222325ULL;
constexpr uint64_t kFnvPrime = 0x100000001b3ULL;

} // namespace

uint32_t ShardID(const uint8_t* key, size_t size, uint32_t shard_num) {
    if (shard_num <= 1) {
        return 0;
    }
    uint64_t hash = kFnvOffsetBasis;
    for (size_t i = 0; i < size; ++i) {
        hash ^= key[i];
        hash *= kFnvPrime;
    }
    return static_cast<uint32_t>(hash % shard_num);
}

uint32_t ShardID(const std::string& key, uint32_t shard_num) {
    return ShardID(reinterpret_cast<const uint8_t*>(key.data()), key.size(), shard_num);
}

} // namespace storage
} // namespace tracedb
