#ifndef TRACEDB_TRACE_KEYS_H_
#define TRACEDB_TRACE_KEYS_H_

#include <string>
#include <utility>

#include "tracedb/core/result.h"
#include "tracedb/core/types.h"

namespace tracedb {
namespace trace {

// Store names inside every shard
constexpr const char* kTraceIndex = "trace_index";
constexpr const char* kStartTimeIndex = "start_time_index";
constexpr const char* kChunkIDMapping = "chunk_id_mapping";
constexpr const char* kSuccessFieldsStore = "success_fields";
constexpr const char* kSuccessDataStore = "success_data";
constexpr const char* kErrorFieldsStore = "error_fields";
constexpr const char* kErrorDataStore = "error_data";

// state(1) || start time(8)
constexpr size_t kStartTimeKeyPrefixSize = 9;
// Trailing timestamp of a chunk ID mapping value
constexpr size_t kRefTimestampSuffixSize = 8;

/**
 * @brief Column stores holding spans of one state
 */
struct StoreNames {
    std::string fields_store;
    std::string data_store;
};

/**
 * @brief Fields and data store for a state byte
 *
 * Fails with UNSUPPORTED_STATE for bytes other than Success and Error.
 */
core::Result<StoreNames> GetStoreNames(uint8_t state);

// state || start time, the seek key of one scan line
core::Bytes StartTimeSeekKey(core::State state, core::TimestampNanos start_time);

// state || start time || chunk id
core::Bytes StartTimeIndexKey(core::State state, core::TimestampNanos start_time, core::ChunkID chunk_id);

// state || series id || ts
core::Bytes InternalRefValue(core::State state, const core::Bytes& series_id, core::TimestampNanos ts);

/**
 * @brief Decoded chunk ID mapping value
 */
struct InternalRef {
    uint8_t state;
    core::Bytes series_id;
};

/**
 * @brief Split a mapping value into state and series ID
 *
 * The trailing timestamp is dropped. Values too short to hold a state byte,
 * one series byte and the suffix fail with INVALID_KEY.
 */
core::Result<InternalRef> ParseInternalRef(const core::Bytes& value);

} // namespace trace
} // namespace tracedb

#endif // TRACEDB_TRACE_KEYS_H_
