#ifndef TRACEDB_STORAGE_KV_H_
#define TRACEDB_STORAGE_KV_H_

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "tracedb/core/result.h"
#include "tracedb/core/types.h"

namespace tracedb {
namespace storage {

/**
 * @brief Addresses one store of one shard, restricted to a time window
 *
 * time_from == time_to == 0 leaves the window open; stores without a time
 * dimension (the trace ID index) are always read that way.
 */
struct StoreScope {
    uint32_t shard;
    std::string store;
    uint64_t time_from;
    uint64_t time_to;

    bool time_bounded() const { return time_from != 0 || time_to != 0; }
    bool contains(uint64_t ts) const {
        return !time_bounded() || (ts >= time_from && ts <= time_to);
    }
};

/**
 * @brief Options for a forward or reverse key scan
 */
struct ScanOpts {
    bool prefetch_values;
    int prefetch_size;
    bool reverse;

    ScanOpts() : prefetch_values(false), prefetch_size(0), reverse(false) {}

    static ScanOpts Default() {
        ScanOpts opts;
        opts.prefetch_values = true;
        opts.prefetch_size = 100;
        opts.reverse = false;
        return opts;
    }
};

/**
 * @brief What a scan visitor wants to happen after seeing a key
 */
enum class ScanAction {
    CONTINUE,  // Key was used; move on
    SKIP,      // Key was not used; move on
    STOP       // End this scan without failure
};

// Lazily loads the value of the key being visited
using ValueLoader = std::function<core::Result<core::Bytes>()>;

using ScanVisitor = std::function<ScanAction(uint32_t shard,
                                             const core::Bytes& key,
                                             const ValueLoader& value)>;

/**
 * @brief Read side of the sorted key-value layer
 *
 * Implementations keep keys of one store in byte order; scans visit keys in
 * that order starting at the first key >= seek_key. A missing key is a
 * NOT_FOUND error for get() and an empty list for get_all().
 */
class StorageReader {
public:
    virtual ~StorageReader() = default;

    /**
     * @brief Point read of the newest value of key inside the scope's window
     */
    virtual core::Result<core::Bytes> get(const StoreScope& scope, const core::Bytes& key) = 0;

    /**
     * @brief All values stored under key inside the scope's window, oldest first
     */
    virtual core::Result<std::vector<core::Bytes>> get_all(
        const StoreScope& scope, const core::Bytes& key) = 0;

    /**
     * @brief Visit keys starting at seek_key until the visitor stops or keys run out
     */
    virtual core::Result<void> scan(const StoreScope& scope,
                                    const core::Bytes& seek_key,
                                    const ScanOpts& opts,
                                    const ScanVisitor& visitor) = 0;
};

} // namespace storage
} // namespace tracedb

#endif // TRACEDB_STORAGE_KV_H_
