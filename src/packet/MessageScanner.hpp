// src/packet/MessageScanner.hpp

// ---- MessageScanner Usage ---- //

// scanMessages() walks the packet body that follows the 58 byte header.
// Each record starts with a 16 bit marker:
//  - 0x0002 a packed message follows (14 byte fixed part, then the date,
//    to, from and subject strings and the body, all NUL terminated)
//  - 0x0000 end of packet
// Example:
// ByteCursor cursor(buf.getData(), buf.getLength());
// decodePacketHeader(cursor);
// ScanResult scan = scanMessages(cursor);
// for (const auto &record : scan.records) { ... }

// A record that cannot be decoded stops the scan but does not throw.
// Everything read before it is kept and the result carries
// ParseStatus::PartialRecovery with the error, where the bad record started,
// and how many bytes were left unread from there.

// Running out of buffer exactly between two records is treated as the end of
// the packet, some tossers never write the terminator.

#pragma once

#include <cstddef> // size_t
#include <cstdint> // uint16_t
#include <optional>
#include <string>
#include <vector>

#include "ByteCursor.hpp"
#include "PacketError.hpp"

// Attribute word bits (FTS-0001)
enum MessageAttribute : uint16_t {
  MSG_PRIVATE = 0x0001,
  MSG_CRASH = 0x0002,
  MSG_RECEIVED = 0x0004,
  MSG_SENT = 0x0008,
  MSG_FILE_ATTACHED = 0x0010,
  MSG_IN_TRANSIT = 0x0020,
  MSG_ORPHAN = 0x0040,
  MSG_KILL_SENT = 0x0080,
  MSG_LOCAL = 0x0100,
  MSG_HOLD_FOR_PICKUP = 0x0200,
  MSG_UNUSED = 0x0400,
  MSG_FILE_REQUEST = 0x0800,
  MSG_RETURN_RECEIPT_REQUEST = 0x1000,
  MSG_IS_RETURN_RECEIPT = 0x2000,
  MSG_AUDIT_REQUEST = 0x4000,
  MSG_FILE_UPDATE_REQUEST = 0x8000
};

struct MessageHeader {
  uint16_t message_type = 0;
  uint16_t orig_node = 0;
  uint16_t dest_node = 0;
  uint16_t orig_net = 0;
  uint16_t dest_net = 0;
  uint16_t attributes = 0;
  uint16_t cost = 0;

  std::string date_time; // raw stamp, usually "DD Mon YY  HH:MM:SS"
  std::string to_name;
  std::string from_name;
  std::string subject;

  bool hasAttribute(MessageAttribute attribute) const {
    return (attributes & attribute) != 0;
  }
};

// One message as it sits in the packet
struct RawMessage {
  MessageHeader header;
  std::string body; // without the terminating NUL
  size_t offset = 0; // where the record marker starts
};

struct ScanResult {
  std::vector<RawMessage> records;
  ParseStatus status = ParseStatus::Complete;
  std::optional<ParseError> error;
  size_t error_offset = 0;
  size_t bytes_skipped = 0;
};

// decodes one record, the cursor must sit on a 0x0002 marker
RawMessage decodeMessage(ByteCursor &cursor);

ScanResult scanMessages(ByteCursor &cursor);
