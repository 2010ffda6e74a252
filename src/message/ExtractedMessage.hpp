// src/message/ExtractedMessage.hpp

// ---- ExtractedMessage Usage ---- //

// assembleMessage() builds the per-message record handed to storage, from
// the decoded packet and message headers, the body and the analysis of the
// body text. It does no further decoding of its own apart from resolving
// the full addresses and the date.
// Example:
// ExtractedMessage msg = assembleMessage(header, raw, index, options);
// msg.area;           // "MIN_CHAT" or options.fallback_area
// msg.date;           // empty if the stamp could not be parsed
// msg.date_raw;       // always kept for display

// Addresses: packed messages only carry net/node. Zones come from the packet
// header unless an INTL kludge names them, points come from FMPT/TOPT.

#pragma once

#include <chrono>
#include <cstddef> // size_t
#include <cstdint> // uint16_t
#include <optional>
#include <string>

#include "MessageScanner.hpp"
#include "PacketHeader.hpp"
#include "ParserOptions.hpp"

struct ExtractedMessage {
  size_t index = 0; // position inside the packet, from 0

  std::string area;
  bool area_found = false; // false when area is the fallback

  std::string poster;
  std::string recipient;
  std::string subject;
  FtnAddress origin;
  FtnAddress destination;
  uint16_t attributes = 0;
  uint16_t cost = 0;
  std::string msgid;

  std::optional<std::chrono::sys_seconds> date;
  std::string date_raw;

  size_t size_bytes = 0; // body length, terminator excluded
  size_t line_count = 0; // display lines only
  size_t quoted_count = 0;
  double quoted_percent = 0.0;

  bool hasUnparseableDate() const { return !date.has_value(); }
};

ExtractedMessage assembleMessage(const PacketHeader &packet,
                                 const RawMessage &raw, size_t index,
                                 const ParserOptions &options);
