#include "MessageScanner.hpp"
#include "packet/PacketBuilder.hpp"

#include <gtest/gtest.h>

TEST(MessageScannerTests, DecodesPackedMessage) {
  TestMessage msg;
  msg.orig_node = 12;
  msg.dest_node = 34;
  msg.orig_net = 5020;
  msg.dest_net = 5030;
  msg.attributes = MSG_PRIVATE | MSG_LOCAL;
  msg.cost = 7;
  const auto raw = makeMessage(msg);
  ByteCursor cursor(raw.data(), raw.size());

  const RawMessage decoded = decodeMessage(cursor);
  EXPECT_TRUE(cursor.atEnd());
  EXPECT_EQ(decoded.offset, 0u);

  const MessageHeader &h = decoded.header;
  EXPECT_EQ(h.message_type, PKT_MSG_TYPE);
  EXPECT_EQ(h.orig_node, 12);
  EXPECT_EQ(h.dest_node, 34);
  EXPECT_EQ(h.orig_net, 5020);
  EXPECT_EQ(h.dest_net, 5030);
  EXPECT_EQ(h.cost, 7);
  EXPECT_TRUE(h.hasAttribute(MSG_PRIVATE));
  EXPECT_TRUE(h.hasAttribute(MSG_LOCAL));
  EXPECT_FALSE(h.hasAttribute(MSG_CRASH));
  EXPECT_EQ(h.date_time, msg.date_time);
  EXPECT_EQ(h.to_name, "All");
  EXPECT_EQ(h.from_name, "Sean Dennis");
  EXPECT_EQ(h.subject, "Hello");
  EXPECT_EQ(decoded.body, msg.body);
}

TEST(MessageScannerTests, StopsAtTerminator) {
  const auto pkt = makePacket({TestMessage{}, TestMessage{}});
  ByteCursor cursor(pkt.data(), pkt.size());
  cursor.readFixed(PKT_HEADER_LEN);

  const ScanResult scan = scanMessages(cursor);
  EXPECT_EQ(scan.status, ParseStatus::Complete);
  EXPECT_EQ(scan.records.size(), 2u);
  EXPECT_TRUE(cursor.atEnd());
  EXPECT_EQ(scan.records[0].offset, PKT_HEADER_LEN);
}

TEST(MessageScannerTests, IgnoresBytesAfterTerminator) {
  auto pkt = makePacket({TestMessage{}});
  pkt.push_back(0xAA);
  pkt.push_back(0xBB);
  ByteCursor cursor(pkt.data(), pkt.size());
  cursor.readFixed(PKT_HEADER_LEN);

  const ScanResult scan = scanMessages(cursor);
  EXPECT_EQ(scan.status, ParseStatus::Complete);
  EXPECT_EQ(scan.records.size(), 1u);
}

TEST(MessageScannerTests, MissingTerminatorAtRecordBoundaryIsComplete) {
  const auto pkt = makePacket({TestMessage{}}, false);
  ByteCursor cursor(pkt.data(), pkt.size());
  cursor.readFixed(PKT_HEADER_LEN);

  const ScanResult scan = scanMessages(cursor);
  EXPECT_EQ(scan.status, ParseStatus::Complete);
  EXPECT_EQ(scan.records.size(), 1u);
}

TEST(MessageScannerTests, UnknownMarkerStopsScan) {
  auto pkt = makePacket({TestMessage{}}, false);
  const size_t bad_record = pkt.size();
  appendWord(pkt, 0x0007);
  pkt.resize(pkt.size() + 10, 0);
  ByteCursor cursor(pkt.data(), pkt.size());
  cursor.readFixed(PKT_HEADER_LEN);

  const ScanResult scan = scanMessages(cursor);
  EXPECT_EQ(scan.status, ParseStatus::PartialRecovery);
  ASSERT_TRUE(scan.error.has_value());
  EXPECT_EQ(*scan.error, ParseError::UnknownMessageType);
  EXPECT_EQ(scan.error_offset, bad_record);
  EXPECT_EQ(scan.bytes_skipped, 12u);
  EXPECT_EQ(scan.records.size(), 1u);
}

TEST(MessageScannerTests, ShortFixedPartIsTruncated) {
  auto pkt = makePacket({TestMessage{}}, false);
  appendWord(pkt, PKT_MSG_TYPE);
  appendWord(pkt, 1);
  ByteCursor cursor(pkt.data(), pkt.size());
  cursor.readFixed(PKT_HEADER_LEN);

  const ScanResult scan = scanMessages(cursor);
  EXPECT_EQ(scan.status, ParseStatus::PartialRecovery);
  EXPECT_EQ(*scan.error, ParseError::Truncated);
  EXPECT_EQ(scan.bytes_skipped, 4u);
}
