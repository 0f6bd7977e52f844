/**
 * @file test_command_builder.cpp
 * @brief 0xEF00 명령 envelope 생성/해석 테스트
 */

#include <gtest/gtest.h>

#include "Codec/CommandBuilder.h"
#include "Logging/LogManager.h"

using namespace HybridLink;
using BasicTypes::ByteBuffer;
using BasicTypes::DpValue;
using Codec::CommandBuilder;
using Enums::DpType;

class CommandBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        LogManager::getInstance().setConsoleOutput(false);
    }
};

TEST_F(CommandBuilderTest, SetCommandEnvelope) {
    CommandBuilder builder(7);
    auto command = builder.BuildSet(1, DpType::BOOLEAN, DpValue(std::in_place_index<1>, true));
    ASSERT_TRUE(command.has_value());
    EXPECT_EQ(*command, (ByteBuffer{0x00, 0x07, 0x01, 0x01, 0x00, 0x01, 0x01}));
    EXPECT_EQ(builder.PeekTransaction(), 8);
}

TEST_F(CommandBuilderTest, TransactionWrapsAt8Bits) {
    CommandBuilder builder(0xFF);
    EXPECT_EQ(builder.NextTransaction(), 0xFF);
    EXPECT_EQ(builder.NextTransaction(), 0x00);
    EXPECT_EQ(builder.NextTransaction(), 0x01);
}

TEST_F(CommandBuilderTest, QueryUsesEmptyPayload) {
    CommandBuilder builder(3);
    EXPECT_EQ(builder.BuildQuery(4), (ByteBuffer{0x00, 0x03, 0x04, 0x00, 0x00, 0x00}));
    EXPECT_EQ(builder.BuildQuery(9, DpType::INTEGER32),
              (ByteBuffer{0x00, 0x04, 0x09, 0x02, 0x00, 0x00}));
}

TEST_F(CommandBuilderTest, MismatchedValueDoesNotConsumeTransaction) {
    CommandBuilder builder(10);
    auto command = builder.BuildSet(1, DpType::BOOLEAN,
                                    DpValue(std::in_place_index<3>, std::string("on")));
    EXPECT_FALSE(command.has_value());
    EXPECT_EQ(builder.PeekTransaction(), 10);
}

TEST_F(CommandBuilderTest, ParseCommandEnvelope) {
    ByteBuffer bytes{0x01, 0x05, 0x01, 0x01, 0x00, 0x01, 0x01,
                     0x02, 0x02, 0x00, 0x04, 0x00, 0x00, 0x00, 0xEB};
    auto command = CommandBuilder::ParseCommand(bytes);
    ASSERT_TRUE(command.has_value());
    EXPECT_EQ(command->status, 0x01);
    EXPECT_EQ(command->transaction, 0x05);
    ASSERT_EQ(command->records.size(), 2u);
    EXPECT_EQ(command->records[1].id, 2);
    EXPECT_EQ(command->records[1].payload, (ByteBuffer{0x00, 0x00, 0x00, 0xEB}));
}

TEST_F(CommandBuilderTest, ParseCommandNeedsHeader) {
    EXPECT_FALSE(CommandBuilder::ParseCommand(ByteBuffer{}).has_value());
    EXPECT_FALSE(CommandBuilder::ParseCommand(ByteBuffer{0x00}).has_value());

    // 헤더만 있고 레코드가 없는 envelope 는 유효
    auto bare = CommandBuilder::ParseCommand(ByteBuffer{0x00, 0x01});
    ASSERT_TRUE(bare.has_value());
    EXPECT_TRUE(bare->records.empty());
}

TEST_F(CommandBuilderTest, BuildEnvelopeForBatch) {
    Structs::DataPointRecord a{1, DpType::BOOLEAN, {0x00}};
    Structs::DataPointRecord b{2, DpType::ENUMERATED, {0x02}};
    auto envelope = CommandBuilder::BuildEnvelope(0x00, 0x20, {a, b});
    ASSERT_TRUE(envelope.has_value());

    auto parsed = CommandBuilder::ParseCommand(*envelope);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->transaction, 0x20);
    ASSERT_EQ(parsed->records.size(), 2u);
    EXPECT_EQ(parsed->records[0], a);
    EXPECT_EQ(parsed->records[1], b);
}
