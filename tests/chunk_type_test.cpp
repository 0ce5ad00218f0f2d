#include "chunk_type.hpp"
#include "png_errors.hpp"
#include <gtest/gtest.h>
#include <sstream>

TEST(ChunkTypeTest, FromBytes) {
    ChunkTypeCode expected = {82, 117, 83, 116};
    ChunkType type = ChunkType::fromBytes(expected);
    EXPECT_EQ(type.bytes(), expected);
}

TEST(ChunkTypeTest, FromStringMatchesFromBytes) {
    EXPECT_EQ(ChunkType::fromString("RuSt"), ChunkType::fromBytes({82, 117, 83, 116}));
    EXPECT_NE(ChunkType::fromString("RuSt"), ChunkType::fromString("ruSt"));
}

TEST(ChunkTypeTest, RuStProperties) {
    ChunkType type = ChunkType::fromString("RuSt");
    EXPECT_TRUE(type.isCritical());
    EXPECT_FALSE(type.isPublic());
    EXPECT_TRUE(type.isReservedBitValid());
    EXPECT_TRUE(type.isSafeToCopy());
    EXPECT_TRUE(type.isValid());
}

TEST(ChunkTypeTest, AncillaryBit) {
    EXPECT_FALSE(ChunkType::fromString("ruSt").isCritical());
}

TEST(ChunkTypeTest, PublicBit) {
    EXPECT_TRUE(ChunkType::fromString("RUSt").isPublic());
}

TEST(ChunkTypeTest, SafeToCopyBit) {
    EXPECT_FALSE(ChunkType::fromString("RuST").isSafeToCopy());
}

TEST(ChunkTypeTest, ReservedBitSetIsConstructibleButInvalid) {
    ChunkType type = ChunkType::fromString("Rust");
    EXPECT_FALSE(type.isReservedBitValid());
    EXPECT_FALSE(type.isValid());
}

TEST(ChunkTypeTest, ReservedBitOnUppercaseA) {
    // 0x61 is 'a', i.e. 'A' (0x41) with bit 5 set
    ChunkType type = ChunkType::fromBytes({'R', 'u', 0x61, 't'});
    EXPECT_FALSE(type.isValid());
    EXPECT_TRUE(ChunkType::fromBytes({'R', 'u', 0x41, 't'}).isValid());
}

TEST(ChunkTypeTest, NonLetterRejected) {
    EXPECT_THROW(ChunkType::fromString("Ru1t"), InvalidChunkTypeError);
    EXPECT_THROW(ChunkType::fromBytes({'R', 'u', 0x00, 't'}), InvalidChunkTypeError);
    EXPECT_THROW(ChunkType::fromBytes({'R', 'u', '[', 't'}), InvalidChunkTypeError);
    EXPECT_THROW(ChunkType::fromBytes({'R', 'u', 0xC1, 't'}), InvalidChunkTypeError);
}

TEST(ChunkTypeTest, WrongLengthRejected) {
    EXPECT_THROW(ChunkType::fromString("RuS"), InvalidChunkTypeError);
    EXPECT_THROW(ChunkType::fromString("RuStX"), InvalidChunkTypeError);
    EXPECT_THROW(ChunkType::fromString(""), InvalidChunkTypeError);
}

TEST(ChunkTypeTest, ToString) {
    EXPECT_EQ(ChunkType::fromString("RuSt").toString(), "RuSt");
    std::ostringstream oss;
    oss << ChunkType::fromString("IEND");
    EXPECT_EQ(oss.str(), "IEND");
}

TEST(ChunkTypeTest, StandardTypes) {
    EXPECT_TRUE(ChunkType::fromString("IHDR").isCritical());
    EXPECT_TRUE(ChunkType::fromString("IHDR").isPublic());
    EXPECT_FALSE(ChunkType::fromString("tEXt").isCritical());
    EXPECT_TRUE(ChunkType::fromString("tEXt").isSafeToCopy());
    EXPECT_FALSE(ChunkType::fromString("tRNS").isSafeToCopy());
}
