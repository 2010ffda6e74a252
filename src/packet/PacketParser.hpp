// src/packet/PacketParser.hpp

// ---- PacketParser Usage ---- //

// parsePacket() is the whole parser in one call. It reads nothing but the
// buffer it is given and keeps no state between calls, so separate packets
// can be parsed on separate threads without coordination.
// Example:
// PacketBuffer buf = PacketBuffer::fromFile("in/0001.pkt");
// ParseResult result = parsePacket(buf, ParserOptions{});
// switch (result.status) {
// case ParseStatus::Complete:          // every message decoded
// case ParseStatus::PartialRecovery:   // result.messages holds the good
//                                      // prefix, result.bytes_skipped the rest
// case ParseStatus::PacketHeaderError: // result.error says why, no messages
// }

// Malformed input never throws. Dates that cannot be parsed do not fail
// anything either: the message is kept with its raw stamp and counted in
// unparseable_dates.

#pragma once

#include <cstddef> // size_t
#include <cstdint> // uint8_t
#include <optional>
#include <vector>

#include "ExtractedMessage.hpp"
#include "PacketBuffer.hpp"
#include "PacketError.hpp"
#include "PacketHeader.hpp"
#include "ParserOptions.hpp"

struct ParseResult {
  ParseStatus status = ParseStatus::Complete;

  // why the parse stopped early, empty when Complete
  std::optional<ParseError> error;
  size_t error_offset = 0;
  size_t bytes_skipped = 0;

  std::optional<PacketHeader> header;
  std::vector<ExtractedMessage> messages;

  size_t unparseable_dates = 0;

  bool isComplete() const { return status == ParseStatus::Complete; }
};

ParseResult parsePacket(const uint8_t *data, size_t length,
                        const ParserOptions &options);

ParseResult parsePacket(const PacketBuffer &buffer,
                        const ParserOptions &options);
