#include "tracedb/common/convert.h"

namespace tracedb {
namespace common {

core::Bytes Uint64ToBytes(uint64_t value) {
    core::Bytes out;
    out.reserve(sizeof(uint64_t));
    AppendUint64(out, value);
    return out;
}

void AppendUint64(core::Bytes& out, uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>(value >> shift));
    }
}

uint64_t BytesToUint64(const uint8_t* data, size_t size) {
    if (size > sizeof(uint64_t)) {
        size = sizeof(uint64_t);
    }
    uint64_t value = 0;
    for (size_t i = 0; i < size; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

uint64_t BytesToUint64(const core::Bytes& bytes) {
    return BytesToUint64(bytes.data(), bytes.size());
}

core::Bytes StringToBytes(const std::string& value) {
    return core::Bytes(value.begin(), value.end());
}

std::string BytesToString(const core::Bytes& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

std::string HexEncode(const uint8_t* data, size_t size) {
    static const char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        out.push_back(kDigits[data[i] >> 4]);
        out.push_back(kDigits[data[i] & 0x0f]);
    }
    return out;
}

std::string HexEncode(const core::Bytes& bytes) {
    return HexEncode(bytes.data(), bytes.size());
}

} // namespace common
} // namespace tracedb
