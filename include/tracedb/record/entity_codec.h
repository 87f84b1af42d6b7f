#ifndef TRACEDB_RECORD_ENTITY_CODEC_H_
#define TRACEDB_RECORD_ENTITY_CODEC_H_

#include <vector>

#include "tracedb/core/result.h"
#include "tracedb/core/types.h"

namespace tracedb {
namespace record {

/**
 * @brief Binary encoding of stored entity records and materialized entities
 *
 * Stored field record (EntityValue):
 *   'V' | id_len:u32 | id | ts:u64 | field_count:u32 | field values
 * Materialized entity (Entity):
 *   'E' | id_len:u32 | id | ts:u64 | flags:u8 | [fields] | [data_binary]
 *
 * A field value is a one byte type tag followed by its payload. Integers and
 * lengths are written big-endian, so records do not depend on the host that
 * wrote them. Sections of an Entity that were not requested are left out and
 * flagged absent, never written empty.
 */
class EntityCodec {
public:
    enum class ValueTag : uint8_t {
        NONE = 0,
        STR = 1,
        INT = 2,
        STR_ARRAY = 3,
        INT_ARRAY = 4
    };

    static core::Bytes encode_value(const core::EntityValue& value);
    static core::Result<core::EntityValue> decode_value(const core::Bytes& data);

    static core::Bytes encode_entity(const core::Entity& entity);
    static core::Result<core::Entity> decode_entity(const core::Bytes& data);

    /**
     * @brief Pick the requested ordinals out of a stored record
     *
     * Output follows the order of entries. An ordinal the record does not
     * have yields a null value under the requested name.
     */
    static std::vector<core::Field> transform(const core::EntityValue& value,
                                              const std::vector<core::FieldEntry>& entries);
};

} // namespace record
} // namespace tracedb

#endif // TRACEDB_RECORD_ENTITY_CODEC_H_
