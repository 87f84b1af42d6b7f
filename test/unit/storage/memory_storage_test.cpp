#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "tracedb/common/convert.h"
#include "tracedb/storage/memory_storage.h"

namespace tracedb {
namespace storage {

class MemoryStorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        storage_ = std::make_unique<MemoryStorage>(2);
    }

    static core::Bytes B(const std::string& s) { return common::StringToBytes(s); }

    // Keys k00..k<n-1> with value v<i>
    void PutKeys(int n) {
        for (int i = 0; i < n; ++i) {
            std::string suffix = (i < 10 ? "0" : "") + std::to_string(i);
            ASSERT_TRUE(storage_->put(0, "s", B("k" + suffix), B("v" + std::to_string(i))).ok());
        }
    }

    std::unique_ptr<MemoryStorage> storage_;
};

TEST_F(MemoryStorageTest, GetReturnsNewestVersionInWindow) {
    ASSERT_TRUE(storage_->put(0, "s", B("k"), B("v1"), 100).ok());
    ASSERT_TRUE(storage_->put(0, "s", B("k"), B("v2"), 200).ok());

    auto open = storage_->get(StoreScope{0, "s", 0, 0}, B("k"));
    ASSERT_TRUE(open.ok());
    EXPECT_EQ(open.value(), B("v2"));

    auto at100 = storage_->get(StoreScope{0, "s", 100, 100}, B("k"));
    ASSERT_TRUE(at100.ok());
    EXPECT_EQ(at100.value(), B("v1"));

    auto outside = storage_->get(StoreScope{0, "s", 150, 160}, B("k"));
    EXPECT_FALSE(outside.ok());
    EXPECT_EQ(outside.code(), core::Error::Code::NOT_FOUND);
}

TEST_F(MemoryStorageTest, GetMissingKeyOrStore) {
    EXPECT_EQ(storage_->get(StoreScope{0, "nothing", 0, 0}, B("k")).code(),
              core::Error::Code::NOT_FOUND);
    ASSERT_TRUE(storage_->put(0, "s", B("k"), B("v")).ok());
    EXPECT_EQ(storage_->get(StoreScope{0, "s", 0, 0}, B("other")).code(),
              core::Error::Code::NOT_FOUND);
    // Shards are independent keyspaces
    EXPECT_EQ(storage_->get(StoreScope{1, "s", 0, 0}, B("k")).code(),
              core::Error::Code::NOT_FOUND);
}

TEST_F(MemoryStorageTest, ShardOutOfRange) {
    EXPECT_FALSE(storage_->put(2, "s", B("k"), B("v")).ok());
    auto result = storage_->get(StoreScope{5, "s", 0, 0}, B("k"));
    EXPECT_EQ(result.code(), core::Error::Code::INVALID_ARGUMENT);
    auto scanned = storage_->scan(StoreScope{5, "s", 0, 0}, B(""), ScanOpts::Default(),
        [](uint32_t, const core::Bytes&, const ValueLoader&) { return ScanAction::CONTINUE; });
    EXPECT_FALSE(scanned.ok());
}

TEST_F(MemoryStorageTest, GetAllReturnsEveryVersion) {
    ASSERT_TRUE(storage_->put(1, "idx", B("t1"), B("a")).ok());
    ASSERT_TRUE(storage_->put(1, "idx", B("t1"), B("b")).ok());

    auto all = storage_->get_all(StoreScope{1, "idx", 0, 0}, B("t1"));
    ASSERT_TRUE(all.ok());
    ASSERT_EQ(all.value().size(), 2u);
    EXPECT_EQ(all.value()[0], B("a"));
    EXPECT_EQ(all.value()[1], B("b"));

    auto none = storage_->get_all(StoreScope{1, "idx", 0, 0}, B("t2"));
    ASSERT_TRUE(none.ok());
    EXPECT_TRUE(none.value().empty());
}

TEST_F(MemoryStorageTest, ScanVisitsKeysInOrderFromSeek) {
    for (const char* k : {"b", "d", "a", "c"}) {
        ASSERT_TRUE(storage_->put(0, "s", B(k), B(std::string("v") + k)).ok());
    }
    std::vector<std::string> seen;
    std::vector<std::string> values;
    auto result = storage_->scan(StoreScope{0, "s", 0, 0}, B("b"), ScanOpts::Default(),
        [&](uint32_t shard, const core::Bytes& key, const ValueLoader& value) {
            EXPECT_EQ(shard, 0u);
            seen.push_back(common::BytesToString(key));
            auto v = value();
            EXPECT_TRUE(v.ok());
            values.push_back(common::BytesToString(v.value()));
            return ScanAction::CONTINUE;
        });
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(seen, (std::vector<std::string>{"b", "c", "d"}));
    EXPECT_EQ(values, (std::vector<std::string>{"vb", "vc", "vd"}));
}

TEST_F(MemoryStorageTest, ScanStopsOnRequest) {
    for (const char* k : {"a", "b", "c"}) {
        ASSERT_TRUE(storage_->put(0, "s", B(k), B("v")).ok());
    }
    int visits = 0;
    auto result = storage_->scan(StoreScope{0, "s", 0, 0}, B("a"), ScanOpts::Default(),
        [&](uint32_t, const core::Bytes&, const ValueLoader&) {
            ++visits;
            return visits == 2 ? ScanAction::STOP : ScanAction::SKIP;
        });
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(visits, 2);
}

TEST_F(MemoryStorageTest, ReverseScan) {
    for (const char* k : {"a", "b", "c"}) {
        ASSERT_TRUE(storage_->put(0, "s", B(k), B("v")).ok());
    }
    ScanOpts opts = ScanOpts::Default();
    opts.reverse = true;
    std::vector<std::string> seen;
    ASSERT_TRUE(storage_->scan(StoreScope{0, "s", 0, 0}, B("b"), opts,
        [&](uint32_t, const core::Bytes& key, const ValueLoader&) {
            seen.push_back(common::BytesToString(key));
            return ScanAction::CONTINUE;
        }).ok());
    EXPECT_EQ(seen, (std::vector<std::string>{"b", "a"}));
}

TEST_F(MemoryStorageTest, StatsCountOperations) {
    ASSERT_TRUE(storage_->put(0, "s", B("a"), B("v")).ok());
    storage_->reset_stats();
    (void)storage_->get(StoreScope{0, "s", 0, 0}, B("a"));
    (void)storage_->get_all(StoreScope{0, "s", 0, 0}, B("a"));
    (void)storage_->scan(StoreScope{0, "s", 0, 0}, B(""), ScanOpts::Default(),
        [](uint32_t, const core::Bytes&, const ValueLoader&) { return ScanAction::CONTINUE; });
    auto stats = storage_->get_stats();
    EXPECT_EQ(stats.get_count, 1u);
    EXPECT_EQ(stats.get_all_count, 1u);
    EXPECT_EQ(stats.scan_count, 1u);
    EXPECT_EQ(stats.visited_keys, 1u);
    EXPECT_EQ(storage_->num_keys(0, "s"), 1u);
}

TEST_F(MemoryStorageTest, ValuesLoadOnDemandWithoutPrefetch) {
    PutKeys(50);
    storage_->reset_stats();
    ScanOpts opts;
    opts.prefetch_values = false;
    opts.prefetch_size = 10;

    int loader_calls = 0;
    core::Bytes loaded;
    ASSERT_TRUE(storage_->scan(StoreScope{0, "s", 0, 0}, B(""), opts,
        [&](uint32_t, const core::Bytes& key, const ValueLoader& load) {
            if (key == B("k07")) {
                ++loader_calls;
                auto value = load();
                EXPECT_TRUE(value.ok());
                loaded = value.value();
            }
            return ScanAction::CONTINUE;
        }).ok());

    EXPECT_EQ(loader_calls, 1);
    EXPECT_EQ(loaded, B("v7"));
    auto stats = storage_->get_stats();
    EXPECT_EQ(stats.visited_keys, 50u);
    EXPECT_EQ(stats.loaded_values, 1u);
}

TEST_F(MemoryStorageTest, PrefetchCopiesOnlyTheFirstBatch) {
    PutKeys(50);
    storage_->reset_stats();
    ScanOpts opts;
    opts.prefetch_values = true;
    opts.prefetch_size = 5;

    int visits = 0;
    ASSERT_TRUE(storage_->scan(StoreScope{0, "s", 0, 0}, B(""), opts,
        [&](uint32_t, const core::Bytes&, const ValueLoader& load) {
            EXPECT_TRUE(load().ok());
            return ++visits == 3 ? ScanAction::STOP : ScanAction::CONTINUE;
        }).ok());

    auto stats = storage_->get_stats();
    EXPECT_EQ(stats.visited_keys, 3u);
    EXPECT_EQ(stats.loaded_values, 5u);
}

TEST_F(MemoryStorageTest, BatchedScanVisitsEveryKeyInOrder) {
    PutKeys(23);
    ScanOpts opts;
    opts.prefetch_size = 4;

    std::vector<std::string> forward;
    ASSERT_TRUE(storage_->scan(StoreScope{0, "s", 0, 0}, B("k03"), opts,
        [&](uint32_t, const core::Bytes& key, const ValueLoader&) {
            forward.push_back(common::BytesToString(key));
            return ScanAction::CONTINUE;
        }).ok());
    ASSERT_EQ(forward.size(), 20u);
    EXPECT_EQ(forward.front(), "k03");
    EXPECT_EQ(forward.back(), "k22");

    opts.reverse = true;
    std::vector<std::string> reverse;
    ASSERT_TRUE(storage_->scan(StoreScope{0, "s", 0, 0}, B("k19"), opts,
        [&](uint32_t, const core::Bytes& key, const ValueLoader&) {
            reverse.push_back(common::BytesToString(key));
            return ScanAction::CONTINUE;
        }).ok());
    ASSERT_EQ(reverse.size(), 20u);
    EXPECT_EQ(reverse.front(), "k19");
    EXPECT_EQ(reverse.back(), "k00");
    for (size_t i = 1; i < reverse.size(); ++i) {
        EXPECT_LT(reverse[i], reverse[i - 1]);
    }
}

} // namespace storage
} // namespace tracedb
