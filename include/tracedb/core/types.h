#ifndef TRACEDB_CORE_TYPES_H_
#define TRACEDB_CORE_TYPES_H_

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tracedb {
namespace core {

/**
 * @brief Raw bytes as stored in the key-value layer
 */
using Bytes = std::vector<uint8_t>;

/**
 * @brief Identifier correlating an index entry with one stored series record
 *
 * Decomposable into a shard number and a timestamp, see storage::ChunkIDCodec.
 */
using ChunkID = uint64_t;

/**
 * @brief Timestamp in nanoseconds since Unix epoch
 */
using TimestampNanos = uint64_t;

/**
 * @brief Reserved projection name requesting the opaque payload blob
 */
constexpr const char* kDataBinaryFieldName = "data_binary";

constexpr const char* kTraceKindVersion = "v1.Trace";

/**
 * @brief Completion state of a span; selects the column stores holding it
 */
enum class State : uint8_t {
    SUCCESS = 0,
    ERROR = 1
};

/**
 * @brief State filter of a range scan
 */
enum class TraceState {
    DEFAULT,  // Success and Error
    SUCCESS,
    ERROR
};

/**
 * @brief A single field value as stored in an entity record
 *
 * std::monostate stands for a null value.
 */
using FieldValue = std::variant<std::monostate,
                                std::string,
                                int64_t,
                                std::vector<std::string>,
                                std::vector<int64_t>>;

/**
 * @brief Named field of a materialized entity
 */
struct Field {
    std::string name;
    FieldValue value;

    bool operator==(const Field& other) const {
        return name == other.name && value == other.value;
    }
    bool operator!=(const Field& other) const { return !(*this == other); }
};

/**
 * @brief Projected field resolved to its ordinal in the series schema
 */
struct FieldEntry {
    std::string key;
    int index;
};

/**
 * @brief Record stored per series in a fields store
 *
 * Field values are positional; names come from the series schema.
 */
struct EntityValue {
    Bytes entity_id;
    TimestampNanos timestamp_nanoseconds = 0;
    std::vector<FieldValue> fields;
};

/**
 * @brief One materialized span
 *
 * fields and data_binary are absent unless the projection asked for them.
 */
struct Entity {
    Bytes entity_id;
    TimestampNanos timestamp_nanoseconds = 0;
    std::optional<std::vector<Field>> fields;
    std::optional<Bytes> data_binary;

    size_t fields_length() const { return fields ? fields->size() : 0; }
    size_t data_binary_length() const { return data_binary ? data_binary->size() : 0; }

    bool operator==(const Entity& other) const;
    bool operator!=(const Entity& other) const { return !(*this == other); }
};

/**
 * @brief Entities sharing one trace ID
 */
struct Trace {
    std::string kind_version;
    std::vector<Entity> entities;
};

/**
 * @brief Options shared by trace fetches and range scans
 */
struct ScanOptions {
    int limit = 0;                        // <= 0 selects the configured default
    TraceState state = TraceState::DEFAULT;
    std::vector<std::string> projection;  // field names, kDataBinaryFieldName for the payload
};

std::string StateName(State state);

} // namespace core
} // namespace tracedb

#endif // TRACEDB_CORE_TYPES_H_
