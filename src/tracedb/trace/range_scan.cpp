#include "tracedb/trace/trace_series.h"
#include "tracedb/common/convert.h"
#include "tracedb/common/logger.h"
#include "tracedb/trace/keys.h"

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

namespace tracedb {
namespace trace {

core::Result<std::vector<core::ChunkID>> TraceSeries::scan_chunk_ids(
    core::TimestampNanos start_time, core::TimestampNanos end_time, const core::ScanOptions& opt) {
    range_scans_.fetch_add(1, std::memory_order_relaxed);
    const uint32_t total = static_cast<uint32_t>(opt.limit < 1 ? config_.scan.default_limit : opt.limit);

    std::vector<core::State> states;
    states.reserve(2);
    switch (opt.state) {
        case core::TraceState::SUCCESS:
            states.push_back(core::State::SUCCESS);
            break;
        case core::TraceState::ERROR:
            states.push_back(core::State::ERROR);
            break;
        case core::TraceState::DEFAULT:
            states.push_back(core::State::SUCCESS);
            states.push_back(core::State::ERROR);
            break;
    }

    // Shard-major, then state; results are gathered in this order
    std::vector<ScanLine> lines;
    lines.reserve(config_.shard_num * states.size());
    for (uint32_t shard = 0; shard < config_.shard_num; ++shard) {
        for (auto state : states) {
            lines.push_back(ScanLine{shard, state});
        }
    }

    std::atomic<uint32_t> accepted{0};
    std::vector<ScanLineResult> line_results(lines.size());
    if (config_.scan.parallel_scan) {
        tbb::parallel_for(tbb::blocked_range<size_t>(0, lines.size()),
            [&](const tbb::blocked_range<size_t>& range) {
                for (size_t i = range.begin(); i < range.end(); ++i) {
                    line_results[i] = scan_line(lines[i], start_time, end_time, total, accepted);
                }
            });
    } else {
        for (size_t i = 0; i < lines.size(); ++i) {
            line_results[i] = scan_line(lines[i], start_time, end_time, total, accepted);
        }
    }

    // Gather results
    std::vector<core::ChunkID> chunk_ids;
    chunk_ids.reserve(accepted.load());
    auto errors = std::make_unique<core::MultiError>();
    for (auto& lr : line_results) {
        chunk_ids.insert(chunk_ids.end(), lr.chunk_ids.begin(), lr.chunk_ids.end());
        errors->append(std::move(lr.errors));
    }
    TRACEDB_DEBUG("scan start time index start={} end={} lines={} limit={} chunk_num={}",
                  start_time, end_time, lines.size(), total, chunk_ids.size());
    return core::Result<std::vector<core::ChunkID>>::partial(
        std::move(chunk_ids), core::MultiError::Combine(std::move(errors)));
}

TraceSeries::ScanLineResult TraceSeries::scan_line(const ScanLine& line,
                                                   core::TimestampNanos start_time,
                                                   core::TimestampNanos end_time,
                                                   uint32_t limit,
                                                   std::atomic<uint32_t>& accepted) {
    scan_lines_.fetch_add(1, std::memory_order_relaxed);
    ScanLineResult result;
    result.errors = std::make_unique<core::MultiError>();

    storage::ScanOpts opts = storage::ScanOpts::Default();
    opts.prefetch_values = config_.scan.prefetch_values;
    opts.prefetch_size = static_cast<int>(limit);

    const auto state = static_cast<uint8_t>(line.state);
    auto scanned = reader_->scan(
        storage::StoreScope{line.shard, kStartTimeIndex, start_time, end_time},
        StartTimeSeekKey(line.state, start_time),
        opts,
        [&](uint32_t, const core::Bytes& key, const storage::ValueLoader&) {
            if (key.size() <= kStartTimeKeyPrefixSize) {
                result.errors->append(std::make_unique<core::InvalidKeyError>(
                    "invalid key: key:" + common::HexEncode(key)));
                return storage::ScanAction::SKIP;
            }
            // The index is state-major; past this point no key can match
            if (key[0] != state) {
                return storage::ScanAction::STOP;
            }
            uint64_t ts = common::BytesToUint64(key.data() + 1, sizeof(uint64_t));
            if (ts > end_time) {
                return storage::ScanAction::SKIP;
            }
            result.chunk_ids.push_back(common::BytesToUint64(
                key.data() + kStartTimeKeyPrefixSize, key.size() - kStartTimeKeyPrefixSize));
            if (accepted.fetch_add(1) + 1 > limit) {
                return storage::ScanAction::STOP;
            }
            return storage::ScanAction::CONTINUE;
        });
    if (!scanned.ok()) {
        TRACEDB_WARN("scan start time index failed shard_id={} state={} error={}",
                     line.shard, core::StateName(line.state), scanned.error());
        result.errors->append(core::Wrap(scanned.take_error(),
            "scan shard " + std::to_string(line.shard) + " state " + core::StateName(line.state)));
    }
    return result;
}

core::Result<std::vector<core::Entity>> TraceSeries::scan_entity(
    core::TimestampNanos start_time, core::TimestampNanos end_time, const core::ScanOptions& opt) {
    auto scanned = scan_chunk_ids(start_time, end_time, opt);
    auto errors = std::make_unique<core::MultiError>();
    errors->append(scanned.take_error());
    std::vector<core::ChunkID> chunk_ids = scanned.take_value();
    if (chunk_ids.empty()) {
        return core::Result<std::vector<core::Entity>>::partial(
            std::vector<core::Entity>(), core::MultiError::Combine(std::move(errors)));
    }
    auto entities = fetch_entity(chunk_ids, opt);
    errors->append(entities.take_error());
    return core::Result<std::vector<core::Entity>>::partial(
        entities.take_value(), core::MultiError::Combine(std::move(errors)));
}

} // namespace trace
} // namespace tracedb
