#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "tracedb/common/convert.h"
#include "tracedb/record/entity_codec.h"

namespace tracedb {
namespace record {
namespace {

core::EntityValue SampleValue() {
    core::EntityValue value;
    value.entity_id = common::StringToBytes("e1");
    value.timestamp_nanoseconds = 1622505600000000000ULL;
    value.fields = {
        core::FieldValue(int64_t{1}),
        core::FieldValue(std::string("GET")),
        core::FieldValue(std::vector<std::string>{"x", "y"}),
        core::FieldValue(std::vector<int64_t>{7, 8, 9}),
        core::FieldValue(),
    };
    return value;
}

TEST(EntityCodecTest, DecodesStoredRecord) {
    auto decoded = EntityCodec::decode_value(EntityCodec::encode_value(SampleValue()));
    ASSERT_TRUE(decoded.ok()) << decoded.error();
    const auto& value = decoded.value();
    EXPECT_EQ(common::BytesToString(value.entity_id), "e1");
    EXPECT_EQ(value.timestamp_nanoseconds, 1622505600000000000ULL);
    ASSERT_EQ(value.fields.size(), 5u);
    EXPECT_EQ(std::get<int64_t>(value.fields[0]), 1);
    EXPECT_EQ(std::get<std::string>(value.fields[1]), "GET");
    EXPECT_EQ(std::get<std::vector<std::string>>(value.fields[2]).size(), 2u);
    EXPECT_EQ(std::get<std::vector<int64_t>>(value.fields[3]).back(), 9);
    EXPECT_TRUE(std::holds_alternative<std::monostate>(value.fields[4]));
}

TEST(EntityCodecTest, TransformFollowsRequestedOrder) {
    std::vector<core::FieldEntry> entries = {{"method", 1}, {"a", 0}};
    auto fields = EntityCodec::transform(SampleValue(), entries);
    ASSERT_EQ(fields.size(), 2u);
    EXPECT_EQ(fields[0].name, "method");
    EXPECT_EQ(std::get<std::string>(fields[0].value), "GET");
    EXPECT_EQ(fields[1].name, "a");
    EXPECT_EQ(std::get<int64_t>(fields[1].value), 1);
}

TEST(EntityCodecTest, TransformOrdinalPastRecordIsNull) {
    std::vector<core::FieldEntry> entries = {{"late_field", 12}};
    auto fields = EntityCodec::transform(SampleValue(), entries);
    ASSERT_EQ(fields.size(), 1u);
    EXPECT_EQ(fields[0].name, "late_field");
    EXPECT_TRUE(std::holds_alternative<std::monostate>(fields[0].value));
}

TEST(EntityCodecTest, AbsentSectionsStayAbsent) {
    core::Entity entity;
    entity.entity_id = common::StringToBytes("e1");
    entity.timestamp_nanoseconds = 5;

    core::Bytes bare = EntityCodec::encode_entity(entity);
    auto decoded = EntityCodec::decode_entity(bare);
    ASSERT_TRUE(decoded.ok()) << decoded.error();
    EXPECT_FALSE(decoded.value().fields.has_value());
    EXPECT_FALSE(decoded.value().data_binary.has_value());

    // An empty but present section is a different record
    entity.fields = std::vector<core::Field>();
    core::Bytes with_empty_fields = EntityCodec::encode_entity(entity);
    EXPECT_NE(bare, with_empty_fields);
    auto decoded_empty = EntityCodec::decode_entity(with_empty_fields);
    ASSERT_TRUE(decoded_empty.ok());
    ASSERT_TRUE(decoded_empty.value().fields.has_value());
    EXPECT_TRUE(decoded_empty.value().fields->empty());
}

TEST(EntityCodecTest, EntityWithFieldsAndPayload) {
    core::Entity entity;
    entity.entity_id = common::StringToBytes("span-9");
    entity.timestamp_nanoseconds = 99;
    entity.fields = std::vector<core::Field>{{"a", core::FieldValue(int64_t{1})}};
    entity.data_binary = core::Bytes{0xde, 0xad, 0xbe, 0xef};

    auto decoded = EntityCodec::decode_entity(EntityCodec::encode_entity(entity));
    ASSERT_TRUE(decoded.ok()) << decoded.error();
    EXPECT_EQ(decoded.value(), entity);
}

TEST(EntityCodecTest, RejectsCorruptedInput) {
    core::Bytes encoded = EntityCodec::encode_value(SampleValue());

    core::Bytes truncated(encoded.begin(), encoded.begin() + encoded.size() / 2);
    auto result = EntityCodec::decode_value(truncated);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.code(), core::Error::Code::CORRUPTED_RECORD);

    core::Bytes trailing = encoded;
    trailing.push_back(0);
    EXPECT_EQ(EntityCodec::decode_value(trailing).code(), core::Error::Code::CORRUPTED_RECORD);

    EXPECT_EQ(EntityCodec::decode_value(core::Bytes()).code(), core::Error::Code::CORRUPTED_RECORD);
    // An entity record is not a stored field record
    core::Entity entity;
    EXPECT_EQ(EntityCodec::decode_value(EntityCodec::encode_entity(entity)).code(),
              core::Error::Code::CORRUPTED_RECORD);
}

TEST(EntityCodecTest, RejectsHugeFieldCount) {
    core::Bytes data = {'V'};
    common::AppendUint64(data, 0);  // id_len = 0, then the high half of ts
    data.insert(data.end(), {0, 0, 0, 1});
    data.insert(data.end(), {0xff, 0xff, 0xff, 0xff});

    EXPECT_EQ(EntityCodec::decode_value(data).code(), core::Error::Code::CORRUPTED_RECORD);
}

TEST(EntityCodecTest, ValueLayoutIsBigEndian) {
    core::EntityValue value;
    value.entity_id = common::StringToBytes("ab");
    value.timestamp_nanoseconds = 0x0102030405060708ULL;
    value.fields = {int64_t{-2}};

    core::Bytes expected = {'V',
                            0, 0, 0, 2, 'a', 'b',
                            1, 2, 3, 4, 5, 6, 7, 8,
                            0, 0, 0, 1,
                            static_cast<uint8_t>(EntityCodec::ValueTag::INT),
                            0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xfe};
    EXPECT_EQ(EntityCodec::encode_value(value), expected);

    auto decoded = EntityCodec::decode_value(expected);
    ASSERT_TRUE(decoded.ok()) << decoded.error();
    EXPECT_EQ(decoded.value().timestamp_nanoseconds, 0x0102030405060708ULL);
    EXPECT_EQ(std::get<int64_t>(decoded.value().fields[0]), -2);
}

} // namespace
} // namespace record
} // namespace tracedb
