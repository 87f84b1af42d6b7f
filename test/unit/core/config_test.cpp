#include <gtest/gtest.h>
#include "tracedb/core/config.h"
#include "tracedb/core/types.h"
#include <string>

namespace tracedb {
namespace core {
namespace {

TEST(ScanConfigTest, DefaultConstruction) {
    ScanConfig config;
    EXPECT_EQ(config.default_limit, 0);
    EXPECT_FALSE(config.parallel_scan);
    EXPECT_FALSE(config.prefetch_values);
}

TEST(ScanConfigTest, Defaults) {
    ScanConfig config = ScanConfig::Default();
    EXPECT_EQ(config.default_limit, 10);
    EXPECT_FALSE(config.parallel_scan);
}

TEST(TraceSeriesConfigTest, DefaultIsValid) {
    TraceSeriesConfig config = TraceSeriesConfig::Default();
    EXPECT_EQ(config.shard_num, 2u);
    EXPECT_FALSE(config.fields.empty());
    EXPECT_EQ(config.scan.default_limit, 10);
    EXPECT_TRUE(config.validate().ok());
}

TEST(TraceSeriesConfigTest, DefaultConstructedIsInvalid) {
    TraceSeriesConfig config;
    auto result = config.validate();
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.code(), Error::Code::INVALID_ARGUMENT);
}

TEST(TraceSeriesConfigTest, RejectsShardNumOutOfRange) {
    TraceSeriesConfig config = TraceSeriesConfig::Default();
    config.shard_num = 0;
    EXPECT_FALSE(config.validate().ok());
    config.shard_num = 257;
    EXPECT_FALSE(config.validate().ok());
    config.shard_num = 256;
    EXPECT_TRUE(config.validate().ok());
}

TEST(TraceSeriesConfigTest, RejectsBadFieldNames) {
    TraceSeriesConfig config = TraceSeriesConfig::Default();
    config.fields = {"a", "a"};
    EXPECT_FALSE(config.validate().ok());

    config.fields = {"a", ""};
    EXPECT_FALSE(config.validate().ok());

    config.fields = {"a", kDataBinaryFieldName};
    EXPECT_FALSE(config.validate().ok());
}

TEST(TraceSeriesConfigTest, RejectsNonPositiveDefaultLimit) {
    TraceSeriesConfig config = TraceSeriesConfig::Default();
    config.scan.default_limit = 0;
    EXPECT_FALSE(config.validate().ok());
}

TEST(LogConfigTest, Defaults) {
    LogConfig config = LogConfig::Default();
    EXPECT_EQ(config.level, "info");
    EXPECT_EQ(config.logger_name, "tracedb");
    EXPECT_FALSE(config.pattern.empty());
}

} // namespace
} // namespace core
} // namespace tracedb
