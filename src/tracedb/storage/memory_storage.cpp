#include "tracedb/storage/memory_storage.h"
#include "tracedb/common/convert.h"

#include <mutex>
#include <utility>

namespace tracedb {
namespace storage {

namespace {

// Batch size when ScanOpts::prefetch_size is not set
constexpr size_t kDefaultScanBatch = 100;

} // namespace

MemoryStorage::MemoryStorage(uint32_t shard_num)
    : shard_num_(shard_num), shards_(shard_num) {}

core::Result<void> MemoryStorage::put(uint32_t shard, const std::string& store,
                                      const core::Bytes& key, const core::Bytes& value,
                                      uint64_t ts) {
    if (shard >= shard_num_) {
        return core::Result<void>(std::make_unique<core::InvalidArgumentError>(
            "shard " + std::to_string(shard) + " out of range [0, " +
            std::to_string(shard_num_) + ")"));
    }
    if (key.empty()) {
        return core::Result<void>(std::make_unique<core::InvalidArgumentError>("empty key"));
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    shards_[shard][store][key].push_back(Version{ts, value});
    return core::Result<void>();
}

core::Result<const MemoryStorage::KeySpace*> MemoryStorage::find_keyspace(
    const StoreScope& scope) const {
    if (scope.shard >= shard_num_) {
        return core::Result<const KeySpace*>(std::make_unique<core::InvalidArgumentError>(
            "shard " + std::to_string(scope.shard) + " out of range [0, " +
            std::to_string(shard_num_) + ")"));
    }
    const auto& stores = shards_[scope.shard];
    auto it = stores.find(scope.store);
    if (it == stores.end()) {
        return static_cast<const KeySpace*>(nullptr);
    }
    return &it->second;
}

core::Result<core::Bytes> MemoryStorage::get(const StoreScope& scope, const core::Bytes& key) {
    get_count_.fetch_add(1, std::memory_order_relaxed);
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto keyspace = find_keyspace(scope);
    if (!keyspace.ok()) {
        return core::Result<core::Bytes>(keyspace.take_error());
    }
    if (keyspace.value() != nullptr) {
        auto it = keyspace.value()->find(key);
        if (it != keyspace.value()->end()) {
            // Newest version inside the window wins
            for (auto v = it->second.rbegin(); v != it->second.rend(); ++v) {
                if (scope.contains(v->ts)) {
                    return v->value;
                }
            }
        }
    }
    return core::Result<core::Bytes>(std::make_unique<core::NotFoundError>(
        "key " + common::HexEncode(key) + " not found in " + scope.store +
        " of shard " + std::to_string(scope.shard)));
}

core::Result<std::vector<core::Bytes>> MemoryStorage::get_all(
    const StoreScope& scope, const core::Bytes& key) {
    get_all_count_.fetch_add(1, std::memory_order_relaxed);
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto keyspace = find_keyspace(scope);
    if (!keyspace.ok()) {
        return core::Result<std::vector<core::Bytes>>(keyspace.take_error());
    }
    std::vector<core::Bytes> values;
    if (keyspace.value() == nullptr) {
        return values;
    }
    auto it = keyspace.value()->find(key);
    if (it == keyspace.value()->end()) {
        return values;
    }
    values.reserve(it->second.size());
    for (const auto& v : it->second) {
        if (scope.contains(v.ts)) {
            values.push_back(v.value);
        }
    }
    return values;
}

core::Result<void> MemoryStorage::scan(const StoreScope& scope,
                                       const core::Bytes& seek_key,
                                       const ScanOpts& opts,
                                       const ScanVisitor& visitor) {
    scan_count_.fetch_add(1, std::memory_order_relaxed);
    const size_t batch_size = opts.prefetch_size > 0
        ? static_cast<size_t>(opts.prefetch_size) : kDefaultScanBatch;

    // Each batch is copied out under the lock and visited without it
    std::vector<std::pair<core::Bytes, core::Bytes>> batch;
    core::Bytes resume_key = seek_key;
    bool first = true;
    while (true) {
        batch.clear();
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto keyspace = find_keyspace(scope);
            if (!keyspace.ok()) {
                return core::Result<void>(keyspace.take_error());
            }
            if (keyspace.value() == nullptr) {
                return core::Result<void>();
            }
            const KeySpace& keys = *keyspace.value();
            auto copy = [&](KeySpace::const_iterator it) {
                core::Bytes value;
                if (opts.prefetch_values && !it->second.empty()) {
                    value = it->second.back().value;
                    loaded_values_.fetch_add(1, std::memory_order_relaxed);
                }
                batch.emplace_back(it->first, std::move(value));
            };
            if (opts.reverse) {
                // First batch includes the seek key, later ones resume below the last key
                auto it = first ? keys.upper_bound(resume_key) : keys.lower_bound(resume_key);
                while (it != keys.begin() && batch.size() < batch_size) {
                    --it;
                    copy(it);
                }
            } else {
                auto it = first ? keys.lower_bound(resume_key) : keys.upper_bound(resume_key);
                for (; it != keys.end() && batch.size() < batch_size; ++it) {
                    copy(it);
                }
            }
        }

        for (const auto& entry : batch) {
            visited_keys_.fetch_add(1, std::memory_order_relaxed);
            const core::Bytes& key = entry.first;
            const core::Bytes& value = entry.second;
            ValueLoader loader;
            if (opts.prefetch_values) {
                loader = [&value]() { return core::Result<core::Bytes>(value); };
            } else {
                loader = [this, &scope, &key]() { return load_latest(scope, key); };
            }
            if (visitor(scope.shard, key, loader) == ScanAction::STOP) {
                return core::Result<void>();
            }
        }
        if (batch.size() < batch_size) {
            return core::Result<void>();
        }
        resume_key = batch.back().first;
        first = false;
    }
}

core::Result<core::Bytes> MemoryStorage::load_latest(const StoreScope& scope,
                                                     const core::Bytes& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto keyspace = find_keyspace(scope);
    if (!keyspace.ok()) {
        return core::Result<core::Bytes>(keyspace.take_error());
    }
    if (keyspace.value() != nullptr) {
        auto it = keyspace.value()->find(key);
        if (it != keyspace.value()->end() && !it->second.empty()) {
            loaded_values_.fetch_add(1, std::memory_order_relaxed);
            return it->second.back().value;
        }
    }
    return core::Result<core::Bytes>(std::make_unique<core::NotFoundError>(
        "key " + common::HexEncode(key) + " not found in " + scope.store +
        " of shard " + std::to_string(scope.shard)));
}

size_t MemoryStorage::num_keys(uint32_t shard, const std::string& store) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (shard >= shard_num_) {
        return 0;
    }
    auto it = shards_[shard].find(store);
    return it == shards_[shard].end() ? 0 : it->second.size();
}

MemoryStorageStats MemoryStorage::get_stats() const {
    return MemoryStorageStats{
        get_count_.load(std::memory_order_relaxed),
        get_all_count_.load(std::memory_order_relaxed),
        scan_count_.load(std::memory_order_relaxed),
        visited_keys_.load(std::memory_order_relaxed),
        loaded_values_.load(std::memory_order_relaxed)};
}

void MemoryStorage::reset_stats() {
    get_count_ = 0;
    get_all_count_ = 0;
    scan_count_ = 0;
    visited_keys_ = 0;
    loaded_values_ = 0;
}

} // namespace storage
} // namespace tracedb
