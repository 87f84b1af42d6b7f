#ifndef TRACEDB_STORAGE_PARTITION_H_
#define TRACEDB_STORAGE_PARTITION_H_

#include <cstddef>
#include <cstdint>
#include <string>

namespace tracedb {
namespace storage {

/**
 * @brief Deterministic shard for a key
 *
 * FNV-1a 64 over the key bytes, modulo shard_num. Stable across processes
 * and builds, so readers and writers agree on placement.
 */
uint32_t ShardID(const uint8_t* key, size_t size, uint32_t shard_num);
uint32_t ShardID(const std::string& key, uint32_t shard_num);

} // namespace storage
} // namespace tracedb

#endif // TRACEDB_STORAGE_PARTITION_H_
