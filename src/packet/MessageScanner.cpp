// src/packet/MessageScanner.cpp

#include "MessageScanner.hpp"
#include "configs.hpp"

RawMessage decodeMessage(ByteCursor &cursor) {
  RawMessage msg;
  msg.offset = cursor.position();

  // fixed part first so a short record fails before any string is read
  const uint8_t *fixed = cursor.readFixed(PKT_MSG_FIXED_LEN);
  MessageHeader &h = msg.header;
  h.message_type = loadU16(fixed + 0);
  h.orig_node = loadU16(fixed + 2);
  h.dest_node = loadU16(fixed + 4);
  h.orig_net = loadU16(fixed + 6);
  h.dest_net = loadU16(fixed + 8);
  h.attributes = loadU16(fixed + 10);
  h.cost = loadU16(fixed + 12);

  h.date_time = cursor.readUntil(PKT_NUL);
  h.to_name = cursor.readUntil(PKT_NUL);
  h.from_name = cursor.readUntil(PKT_NUL);
  h.subject = cursor.readUntil(PKT_NUL);

  msg.body = cursor.readUntil(PKT_NUL);
  return msg;
}

ScanResult scanMessages(ByteCursor &cursor) {
  ScanResult result;

  while (!cursor.atEnd()) {
    const size_t record_start = cursor.position();

    try {
      const uint16_t marker = cursor.peekU16();

      if (marker == PKT_TERMINATOR) {
        cursor.readU16();
        return result;
      }

      if (marker != PKT_MSG_TYPE) {
        throw PacketError(ParseError::UnknownMessageType, record_start,
                          "record marker " + std::to_string(marker));
      }

      result.records.push_back(decodeMessage(cursor));
    } catch (const PacketError &error) {
      // keep what we have, report where the damage starts
      result.status = ParseStatus::PartialRecovery;
      result.error = error.code();
      result.error_offset = record_start;
      result.bytes_skipped = cursor.length() - record_start;
      return result;
    }
  }

  return result;
}
