#include "tracedb/core/config.h"
#include "tracedb/core/types.h"

#include <unordered_set>

namespace tracedb {
namespace core {

namespace {

// Shard numbers are carried in 8 bits of a chunk ID
constexpr uint32_t kMaxShardNum = 256;

} // namespace

Result<void> TraceSeriesConfig::validate() const {
    if (shard_num == 0 || shard_num > kMaxShardNum) {
        return Result<void>(std::make_unique<InvalidArgumentError>(
            "shard_num must be in [1, " + std::to_string(kMaxShardNum) + "], got " +
            std::to_string(shard_num)));
    }
    if (scan.default_limit <= 0) {
        return Result<void>(std::make_unique<InvalidArgumentError>(
            "scan.default_limit must be positive, got " + std::to_string(scan.default_limit)));
    }
    std::unordered_set<std::string> seen;
    for (const auto& field : fields) {
        if (field.empty()) {
            return Result<void>(std::make_unique<InvalidArgumentError>("empty field name in schema"));
        }
        if (field == kDataBinaryFieldName) {
            return Result<void>(std::make_unique<InvalidArgumentError>(
                "field name " + field + " is reserved for the payload"));
        }
        if (!seen.insert(field).second) {
            return Result<void>(std::make_unique<InvalidArgumentError>("duplicate field name " + field));
        }
    }
    return Result<void>();
}

} // namespace core
} // namespace tracedb
