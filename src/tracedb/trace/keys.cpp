#include "tracedb/trace/keys.h"
#include "tracedb/common/convert.h"

namespace tracedb {
namespace trace {

core::Result<StoreNames> GetStoreNames(uint8_t state) {
    switch (static_cast<core::State>(state)) {
        case core::State::SUCCESS:
            return StoreNames{kSuccessFieldsStore, kSuccessDataStore};
        case core::State::ERROR:
            return StoreNames{kErrorFieldsStore, kErrorDataStore};
    }
    return core::Result<StoreNames>(std::make_unique<core::UnsupportedStateError>(
        "unsupported state " + std::to_string(static_cast<int>(state))));
}

core::Bytes StartTimeSeekKey(core::State state, core::TimestampNanos start_time) {
    core::Bytes key;
    key.reserve(kStartTimeKeyPrefixSize);
    key.push_back(static_cast<uint8_t>(state));
    common::AppendUint64(key, start_time);
    return key;
}

core::Bytes StartTimeIndexKey(core::State state, core::TimestampNanos start_time, core::ChunkID chunk_id) {
    core::Bytes key = StartTimeSeekKey(state, start_time);
    common::AppendUint64(key, chunk_id);
    return key;
}

core::Bytes InternalRefValue(core::State state, const core::Bytes& series_id, core::TimestampNanos ts) {
    core::Bytes value;
    value.reserve(1 + series_id.size() + kRefTimestampSuffixSize);
    value.push_back(static_cast<uint8_t>(state));
    value.insert(value.end(), series_id.begin(), series_id.end());
    common::AppendUint64(value, ts);
    return value;
}

core::Result<InternalRef> ParseInternalRef(const core::Bytes& value) {
    if (value.size() < 1 + 1 + kRefTimestampSuffixSize) {
        return core::Result<InternalRef>(std::make_unique<core::InvalidKeyError>(
            "internal ref too short: " + common::HexEncode(value)));
    }
    InternalRef ref;
    ref.state = value[0];
    ref.series_id.assign(value.begin() + 1, value.end() - kRefTimestampSuffixSize);
    return ref;
}

} // namespace trace
} // namespace tracedb
