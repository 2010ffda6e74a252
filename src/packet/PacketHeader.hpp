// src/packet/PacketHeader.hpp

// ---- PacketHeader Usage ---- //

// decodePacketHeader() reads the fixed 58 byte header at the start of a
// packet and works out which header variant wrote it:
//  - Type2      FTS-0001 "stone age" header, carries the creation date
//  - Type2Plus  FSC-0039, adds zones and points, validated by the
//               capability word and its byte-swapped copy
//  - Type22     FSC-0045, points and domains instead of the date
// Example:
// ByteCursor cursor(buf.getData(), buf.getLength());
// PacketHeader header = decodePacketHeader(cursor);
// std::string from = header.origin.toString(); // "2:250/1" style

// Throws PacketError:
//  - Truncated if the buffer is shorter than the header
//  - InvalidPacketType if the type word is not 2
// On failure the cursor position is unspecified and the packet must be
// abandoned.

#pragma once

#include <chrono>
#include <compare>
#include <cstdint> // uint8_t, uint16_t
#include <optional>
#include <string>
#include <string_view>

#include "ByteCursor.hpp"

struct FtnAddress {
  uint16_t zone = 0;
  uint16_t net = 0;
  uint16_t node = 0;
  uint16_t point = 0;

  // zone:net/node, with .point appended when point is non-zero
  std::string toString() const;

  auto operator<=>(const FtnAddress &) const = default;
};

// parses "zone:net/node", "zone:net/node.point", an "@domain" suffix is
// ignored
std::optional<FtnAddress> parseFtnAddress(std::string_view text);

enum class PacketFormat { Type2, Type2Plus, Type22 };

const char *packetFormatName(PacketFormat format);

struct PacketHeader {
  FtnAddress origin;
  FtnAddress destination;

  // absent for type 2.2 packets and for out-of-range dates
  std::optional<std::chrono::sys_seconds> created;

  PacketFormat format = PacketFormat::Type2;
  uint16_t packet_type = 0;
  uint16_t baud = 0;
  uint16_t product_code = 0;
  uint8_t revision_major = 0;
  uint8_t revision_minor = 0;
  uint16_t capability_word = 0;

  // up to 8 characters, NUL padding removed
  std::string password;

  // type 2.2 only
  std::string origin_domain;
  std::string destination_domain;
};

PacketHeader decodePacketHeader(ByteCursor &cursor);
