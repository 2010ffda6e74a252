// src/packet/PacketParser.cpp

#include "PacketParser.hpp"
#include "ByteCursor.hpp"
#include "MessageScanner.hpp"

ParseResult parsePacket(const uint8_t *data, size_t length,
                        const ParserOptions &options) {
  ParseResult result;
  ByteCursor cursor(data, length);

  try {
    result.header = decodePacketHeader(cursor);
  } catch (const PacketError &error) {
    result.status = ParseStatus::PacketHeaderError;
    result.error = error.code();
    result.error_offset = error.offset();
    return result;
  }

  ScanResult scan = scanMessages(cursor);
  result.status = scan.status;
  result.error = scan.error;
  result.error_offset = scan.error_offset;
  result.bytes_skipped = scan.bytes_skipped;

  result.messages.reserve(scan.records.size());
  for (size_t i = 0; i < scan.records.size(); ++i) {
    result.messages.push_back(
        assembleMessage(*result.header, scan.records[i], i, options));
    if (result.messages.back().hasUnparseableDate()) {
      ++result.unparseable_dates;
    }
  }

  return result;
}

ParseResult parsePacket(const PacketBuffer &buffer,
                        const ParserOptions &options) {
  return parsePacket(buffer.getData(), buffer.getLength(), options);
}
