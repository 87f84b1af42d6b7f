#ifndef TRACEDB_COMMON_CONVERT_H_
#define TRACEDB_COMMON_CONVERT_H_

#include <cstddef>
#include <cstdint>
#include <string>

#include "tracedb/core/types.h"

namespace tracedb {
namespace common {

// Big-endian, 8 bytes
core::Bytes Uint64ToBytes(uint64_t value);

// Appends the big-endian encoding of value to out
void AppendUint64(core::Bytes& out, uint64_t value);

/**
 * @brief Decode up to 8 big-endian bytes
 *
 * Shorter inputs are treated as left-padded with zeros; only the first 8
 * bytes of a longer input are used.
 */
uint64_t BytesToUint64(const uint8_t* data, size_t size);
uint64_t BytesToUint64(const core::Bytes& bytes);

core::Bytes StringToBytes(const std::string& value);
std::string BytesToString(const core::Bytes& bytes);

// Lower-case hex, for log lines and error messages
std::string HexEncode(const uint8_t* data, size_t size);
std::string HexEncode(const core::Bytes& bytes);

} // namespace common
} // namespace tracedb

#endif // TRACEDB_COMMON_CONVERT_H_
