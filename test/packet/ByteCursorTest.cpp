#include "ByteCursor.hpp"
#include "PacketError.hpp"

#include <gtest/gtest.h>
#include <vector>

TEST(ByteCursorTests, ReadsLittleEndianWords) {
  const std::vector<uint8_t> data = {0x02, 0x00, 0x34, 0x12};
  ByteCursor cursor(data.data(), data.size());

  EXPECT_EQ(cursor.peekU16(), 0x0002);
  EXPECT_EQ(cursor.position(), 0u);
  EXPECT_EQ(cursor.readU16(), 0x0002);
  EXPECT_EQ(cursor.readU16(), 0x1234);
  EXPECT_TRUE(cursor.atEnd());
}

TEST(ByteCursorTests, ReadUntilConsumesSentinel) {
  const std::vector<uint8_t> data = {'A', 'l', 'l', 0x00, 'x', 0x00};
  ByteCursor cursor(data.data(), data.size());

  EXPECT_EQ(cursor.readUntil(0x00), "All");
  EXPECT_EQ(cursor.position(), 4u);
  EXPECT_EQ(cursor.readUntil(0x00), "x");
  EXPECT_TRUE(cursor.atEnd());
}

TEST(ByteCursorTests, EmptyFieldIsJustTheSentinel) {
  const std::vector<uint8_t> data = {0x00};
  ByteCursor cursor(data.data(), data.size());

  EXPECT_EQ(cursor.readUntil(0x00), "");
  EXPECT_TRUE(cursor.atEnd());
}

TEST(ByteCursorTests, ShortReadThrowsTruncated) {
  const std::vector<uint8_t> data = {0x01, 0x02, 0x03};
  ByteCursor cursor(data.data(), data.size());
  cursor.readFixed(1);

  try {
    cursor.readFixed(4);
    FAIL() << "expected PacketError";
  } catch (const PacketError &error) {
    EXPECT_EQ(error.code(), ParseError::Truncated);
    EXPECT_EQ(error.offset(), 1u);
  }
  // failed reads do not move the cursor
  EXPECT_EQ(cursor.position(), 1u);
  EXPECT_EQ(cursor.remaining(), 2u);
}

TEST(ByteCursorTests, MissingSentinelThrowsUnterminatedField) {
  const std::vector<uint8_t> data = {'a', 'b', 'c'};
  ByteCursor cursor(data.data(), data.size());

  try {
    cursor.readUntil(0x00);
    FAIL() << "expected PacketError";
  } catch (const PacketError &error) {
    EXPECT_EQ(error.code(), ParseError::UnterminatedField);
    EXPECT_EQ(error.offset(), 0u);
  }
  EXPECT_EQ(cursor.position(), 0u);
}

TEST(ByteCursorTests, ReadFixedStringStopsAtNul) {
  const std::vector<uint8_t> data = {'p', 'w', 0x00, 0x00, 'z'};
  ByteCursor cursor(data.data(), data.size());

  EXPECT_EQ(cursor.readFixedString(4), "pw");
  EXPECT_EQ(cursor.position(), 4u);
  EXPECT_EQ(*cursor.readFixed(1), 'z');
}

TEST(ByteCursorTests, NullBufferIsEmpty) {
  ByteCursor cursor(nullptr, 10);
  EXPECT_TRUE(cursor.atEnd());
  EXPECT_THROW(cursor.peekU16(), PacketError);
  EXPECT_THROW(cursor.readUntil(0x00), PacketError);
}
