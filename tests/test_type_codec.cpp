/**
 * @file test_type_codec.cpp
 * @brief DataPoint 페이로드 타입 변환 테스트
 */

#include <gtest/gtest.h>

#include "Codec/TypeCodec.h"
#include "Logging/LogManager.h"

#include <map>

using namespace HybridLink;
using BasicTypes::ByteBuffer;
using BasicTypes::DpValue;
using BasicTypes::EnumValue;
using Codec::DecodeOptions;
using Codec::TypeCodec;
using Enums::DpType;
using Structs::DataPointRecord;

namespace {

DataPointRecord Record(DpType type, ByteBuffer payload) {
    DataPointRecord record;
    record.id = 1;
    record.type = type;
    record.payload = std::move(payload);
    return record;
}

} // namespace

class TypeCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        LogManager::getInstance().setConsoleOutput(false);
        LogManager::getInstance().setLogLevel(LogLevel::DEBUG);
    }
};

// =============================================================================
// 디코딩
// =============================================================================

TEST_F(TypeCodecTest, BooleanUsesFirstByte) {
    auto on = TypeCodec::Decode(Record(DpType::BOOLEAN, {0x05}));
    ASSERT_TRUE(on.has_value());
    EXPECT_TRUE(std::get<bool>(*on));

    auto off = TypeCodec::Decode(Record(DpType::BOOLEAN, {0x00, 0x01}));
    ASSERT_TRUE(off.has_value());
    EXPECT_FALSE(std::get<bool>(*off));

    EXPECT_FALSE(TypeCodec::Decode(Record(DpType::BOOLEAN, {})).has_value());
}

TEST_F(TypeCodecTest, IntegerWidthFollowsPayloadLength) {
    auto one = TypeCodec::Decode(Record(DpType::INTEGER32, {0xFF}));
    ASSERT_TRUE(one.has_value());
    EXPECT_EQ(std::get<int64_t>(*one), -1);

    auto two = TypeCodec::Decode(Record(DpType::INTEGER32, {0xFF, 0x38}));
    ASSERT_TRUE(two.has_value());
    EXPECT_EQ(std::get<int64_t>(*two), -200);

    auto four = TypeCodec::Decode(Record(DpType::INTEGER32, {0x00, 0x00, 0x0D, 0xAC}));
    ASSERT_TRUE(four.has_value());
    EXPECT_EQ(std::get<int64_t>(*four), 3500);

    // 3 바이트는 허용하지 않는다
    EXPECT_FALSE(TypeCodec::Decode(Record(DpType::INTEGER32, {0x00, 0x0D, 0xAC})).has_value());
    EXPECT_FALSE(TypeCodec::Decode(Record(DpType::INTEGER32, {})).has_value());
}

TEST_F(TypeCodecTest, UnsignedIntegerOption) {
    DecodeOptions options;
    options.signed_value = false;

    auto one = TypeCodec::Decode(Record(DpType::INTEGER32, {0xFF}), options);
    ASSERT_TRUE(one.has_value());
    EXPECT_EQ(std::get<int64_t>(*one), 255);

    auto four = TypeCodec::Decode(Record(DpType::INTEGER32, {0xFF, 0xFF, 0xFF, 0xFE}), options);
    ASSERT_TRUE(four.has_value());
    EXPECT_EQ(std::get<int64_t>(*four), 4294967294LL);
}

TEST_F(TypeCodecTest, EnumeratedWithNameTable) {
    std::map<uint8_t, std::string> names{{0, "open"}, {1, "stop"}, {2, "close"}};
    DecodeOptions options;
    options.enum_names = &names;

    auto named = TypeCodec::Decode(Record(DpType::ENUMERATED, {0x01}), options);
    ASSERT_TRUE(named.has_value());
    EXPECT_EQ(std::get<EnumValue>(*named).ordinal, 1);
    EXPECT_EQ(std::get<EnumValue>(*named).name, "stop");

    auto unnamed = TypeCodec::Decode(Record(DpType::ENUMERATED, {0x07}), options);
    ASSERT_TRUE(unnamed.has_value());
    EXPECT_EQ(std::get<EnumValue>(*unnamed).ordinal, 7);
    EXPECT_TRUE(std::get<EnumValue>(*unnamed).name.empty());

    EXPECT_FALSE(TypeCodec::Decode(Record(DpType::ENUMERATED, {})).has_value());
}

TEST_F(TypeCodecTest, StringAndRawPassThrough) {
    auto text = TypeCodec::Decode(Record(DpType::STRING, {'a', 'b', 'c'}));
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(std::get<std::string>(*text), "abc");

    auto empty = TypeCodec::Decode(Record(DpType::STRING, {}));
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(std::get<std::string>(*empty).empty());

    auto raw = TypeCodec::Decode(Record(DpType::RAW, {0xDE, 0xAD}));
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(std::get<ByteBuffer>(*raw), (ByteBuffer{0xDE, 0xAD}));
}

TEST_F(TypeCodecTest, BitmapIsUnsigned) {
    auto mask = TypeCodec::Decode(Record(DpType::BITMAP, {0x01, 0x02}));
    ASSERT_TRUE(mask.has_value());
    EXPECT_EQ(std::get<uint32_t>(*mask), 0x0102u);

    auto wide = TypeCodec::Decode(Record(DpType::BITMAP, {0x80, 0x00, 0x00, 0x01}));
    ASSERT_TRUE(wide.has_value());
    EXPECT_EQ(std::get<uint32_t>(*wide), 0x80000001u);
}

// =============================================================================
// 인코딩
// =============================================================================

TEST_F(TypeCodecTest, EncodeWidths) {
    auto flag = TypeCodec::Encode(DpType::BOOLEAN, DpValue(std::in_place_index<1>, true));
    ASSERT_TRUE(flag.has_value());
    EXPECT_EQ(*flag, (ByteBuffer{0x01}));

    auto number = TypeCodec::Encode(DpType::INTEGER32, DpValue(std::in_place_index<2>, int64_t{-1}));
    ASSERT_TRUE(number.has_value());
    EXPECT_EQ(*number, (ByteBuffer{0xFF, 0xFF, 0xFF, 0xFF}));

    EnumValue mode;
    mode.ordinal = 2;
    auto ordinal = TypeCodec::Encode(DpType::ENUMERATED, DpValue(std::in_place_index<4>, mode));
    ASSERT_TRUE(ordinal.has_value());
    EXPECT_EQ(*ordinal, (ByteBuffer{0x02}));

    auto mask = TypeCodec::Encode(DpType::BITMAP, DpValue(std::in_place_index<5>, uint32_t{0x0102}));
    ASSERT_TRUE(mask.has_value());
    EXPECT_EQ(*mask, (ByteBuffer{0x00, 0x00, 0x01, 0x02}));
}

TEST_F(TypeCodecTest, EncodeRejectsMismatchedValues) {
    // 타입 태그와 variant 대안이 다르다
    EXPECT_FALSE(TypeCodec::Encode(DpType::BOOLEAN, DpValue(std::in_place_index<2>, int64_t{1})).has_value());
    EXPECT_FALSE(TypeCodec::Encode(DpType::STRING, DpValue(std::in_place_index<1>, true)).has_value());

    // 32 비트 밖
    EXPECT_FALSE(TypeCodec::Encode(DpType::INTEGER32,
                                   DpValue(std::in_place_index<2>, int64_t{1} << 33)).has_value());

    // signed 범위 밖은 unsigned 로 요청해야 인코딩된다
    const DpValue large(std::in_place_index<2>, int64_t{3000000000});
    EXPECT_FALSE(TypeCodec::Encode(DpType::INTEGER32, large).has_value());
    Codec::EncodeOptions unsigned_options;
    unsigned_options.signed_value = false;
    auto encoded = TypeCodec::Encode(DpType::INTEGER32, large, unsigned_options);
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(*encoded, (ByteBuffer{0xB2, 0xD0, 0x5E, 0x00}));
}

TEST_F(TypeCodecTest, ParseValueFromText) {
    auto flag = TypeCodec::ParseValue(DpType::BOOLEAN, "On");
    ASSERT_TRUE(flag.has_value());
    EXPECT_TRUE(std::get<bool>(*flag));

    auto hex_number = TypeCodec::ParseValue(DpType::INTEGER32, "0x10");
    ASSERT_TRUE(hex_number.has_value());
    EXPECT_EQ(std::get<int64_t>(*hex_number), 16);

    auto raw = TypeCodec::ParseValue(DpType::RAW, "01ab");
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(std::get<ByteBuffer>(*raw), (ByteBuffer{0x01, 0xAB}));

    EXPECT_FALSE(TypeCodec::ParseValue(DpType::ENUMERATED, "300").has_value());
    EXPECT_FALSE(TypeCodec::ParseValue(DpType::INTEGER32, "12abc").has_value());
    EXPECT_FALSE(TypeCodec::ParseValue(DpType::BOOLEAN, "maybe").has_value());
}
