#ifndef TRACEDB_STORAGE_MEMORY_STORAGE_H_
#define TRACEDB_STORAGE_MEMORY_STORAGE_H_

#include <atomic>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "tracedb/storage/kv.h"

namespace tracedb {
namespace storage {

// Basic stats for tests and observability
struct MemoryStorageStats {
    uint64_t get_count;
    uint64_t get_all_count;
    uint64_t scan_count;
    uint64_t visited_keys;
    uint64_t loaded_values;   // Values copied out by scans, prefetched or lazy
};

/**
 * @brief In-process sorted key-value store
 *
 * Each (shard, store) pair is an ordered map from key to the versions written
 * under it. A version carries the timestamp it was written at, which is what
 * time-bounded reads filter on. Scans ignore the time window: like block
 * level pruning in a disk engine, the window only narrows which keys could
 * exist, so callers must still check timestamps embedded in keys.
 *
 * Scans copy keys out in batches of ScanOpts::prefetch_size under the shared
 * lock and visit them unlocked, re-seeking past the last key for the next
 * batch. Values are copied with the batch only when prefetch_values is set;
 * otherwise the ValueLoader reads the latest version on demand.
 */
class MemoryStorage : public StorageReader {
public:
    explicit MemoryStorage(uint32_t shard_num);

    // Appends a version of key; multiple versions back get_all()
    core::Result<void> put(uint32_t shard, const std::string& store,
                           const core::Bytes& key, const core::Bytes& value,
                           uint64_t ts = 0);

    core::Result<core::Bytes> get(const StoreScope& scope, const core::Bytes& key) override;
    core::Result<std::vector<core::Bytes>> get_all(
        const StoreScope& scope, const core::Bytes& key) override;
    core::Result<void> scan(const StoreScope& scope,
                            const core::Bytes& seek_key,
                            const ScanOpts& opts,
                            const ScanVisitor& visitor) override;

    uint32_t shard_num() const { return shard_num_; }
    size_t num_keys(uint32_t shard, const std::string& store) const;

    MemoryStorageStats get_stats() const;
    void reset_stats();

private:
    struct Version {
        uint64_t ts;
        core::Bytes value;
    };
    using KeySpace = std::map<core::Bytes, std::vector<Version>>;

    const uint32_t shard_num_;
    // One store-name -> keyspace table per shard
    std::vector<absl::flat_hash_map<std::string, KeySpace>> shards_;
    mutable std::shared_mutex mutex_;

    mutable std::atomic<uint64_t> get_count_{0};
    mutable std::atomic<uint64_t> get_all_count_{0};
    mutable std::atomic<uint64_t> scan_count_{0};
    mutable std::atomic<uint64_t> visited_keys_{0};
    mutable std::atomic<uint64_t> loaded_values_{0};

    core::Result<const KeySpace*> find_keyspace(const StoreScope& scope) const;
    core::Result<core::Bytes> load_latest(const StoreScope& scope, const core::Bytes& key) const;
};

} // namespace storage
} // namespace tracedb

#endif // TRACEDB_STORAGE_MEMORY_STORAGE_H_
