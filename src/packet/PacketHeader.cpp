// src/packet/PacketHeader.cpp

#include "PacketHeader.hpp"
#include "PacketError.hpp"
#include "configs.hpp"

#include <array>
#include <charconv> // from_chars

// Anonymous namespace (to avoid cluttering global namespace)
namespace {

// Every word of the 58 byte header, named after its type 2 / 2+ meaning.
// Type 2.2 reuses some slots, see decodePacketHeader().
struct RawPacketHeader {
  uint16_t orig_node;
  uint16_t dest_node;
  uint16_t year;
  uint16_t month; // 0 based
  uint16_t day;
  uint16_t hour;
  uint16_t minute;
  uint16_t second;
  uint16_t baud;
  uint16_t packet_type;
  uint16_t orig_net;
  uint16_t dest_net;
  uint16_t qm_orig_zone;
  uint16_t qm_dest_zone;
  uint16_t aux_net;
  uint16_t cap_valid; // byte-swapped copy of cap_word
  uint16_t cap_word;
  uint16_t orig_zone;
  uint16_t dest_zone;
  uint16_t orig_point;
  uint16_t dest_point;

  uint8_t product_code_lo;
  uint8_t revision_major;
  uint8_t product_code_hi;
  uint8_t revision_minor;
};

struct WordField {
  const char *name;
  size_t offset;
  uint16_t RawPacketHeader::*member;
};

struct ByteField {
  const char *name;
  size_t offset;
  uint8_t RawPacketHeader::*member;
};

struct TextField {
  const char *name;
  size_t offset;
  size_t width;
};

// All words are little endian
constexpr std::array<WordField, 21> PACKET_WORDS{{
    {"origNode", 0, &RawPacketHeader::orig_node},
    {"destNode", 2, &RawPacketHeader::dest_node},
    {"year", 4, &RawPacketHeader::year},
    {"month", 6, &RawPacketHeader::month},
    {"day", 8, &RawPacketHeader::day},
    {"hour", 10, &RawPacketHeader::hour},
    {"minute", 12, &RawPacketHeader::minute},
    {"second", 14, &RawPacketHeader::second},
    {"baud", 16, &RawPacketHeader::baud},
    {"packetType", 18, &RawPacketHeader::packet_type},
    {"origNet", 20, &RawPacketHeader::orig_net},
    {"destNet", 22, &RawPacketHeader::dest_net},
    {"qmOrigZone", 34, &RawPacketHeader::qm_orig_zone},
    {"qmDestZone", 36, &RawPacketHeader::qm_dest_zone},
    {"auxNet", 38, &RawPacketHeader::aux_net},
    {"capValid", 40, &RawPacketHeader::cap_valid},
    {"capWord", 44, &RawPacketHeader::cap_word},
    {"origZone", 46, &RawPacketHeader::orig_zone},
    {"destZone", 48, &RawPacketHeader::dest_zone},
    {"origPoint", 50, &RawPacketHeader::orig_point},
    {"destPoint", 52, &RawPacketHeader::dest_point},
}};

constexpr std::array<ByteField, 4> PACKET_BYTES{{
    {"productCodeLo", 24, &RawPacketHeader::product_code_lo},
    {"revisionMajor", 25, &RawPacketHeader::revision_major},
    {"productCodeHi", 42, &RawPacketHeader::product_code_hi},
    {"revisionMinor", 43, &RawPacketHeader::revision_minor},
}};

constexpr TextField PASSWORD_FIELD{"password", 26, 8};
constexpr TextField ORIG_DOMAIN_FIELD{"origDomain", 38, 8};
constexpr TextField DEST_DOMAIN_FIELD{"destDomain", 46, 8};

static_assert(PASSWORD_FIELD.offset + PASSWORD_FIELD.width <= PKT_HEADER_LEN);
static_assert(DEST_DOMAIN_FIELD.offset + DEST_DOMAIN_FIELD.width <=
              PKT_HEADER_LEN);

// Helper functions
RawPacketHeader decodeRaw(const uint8_t *block);
std::string readText(const uint8_t *block, const TextField &field);
PacketFormat detectFormat(const RawPacketHeader &raw);
std::optional<std::chrono::sys_seconds>
creationTime(const RawPacketHeader &raw);
} // namespace

std::string FtnAddress::toString() const {
  std::string out = std::to_string(zone) + ":" + std::to_string(net) + "/" +
                    std::to_string(node);
  if (point != 0) {
    out += "." + std::to_string(point);
  }
  return out;
}

std::optional<FtnAddress> parseFtnAddress(std::string_view text) {
  text = text.substr(0, text.find('@'));

  const size_t colon = text.find(':');
  const size_t slash = text.find('/');
  if (colon == std::string_view::npos || slash == std::string_view::npos ||
      slash < colon) {
    return std::nullopt;
  }

  auto number = [](std::string_view part, uint16_t &out) {
    if (part.empty()) {
      return false;
    }
    const auto [end, ec] =
        std::from_chars(part.data(), part.data() + part.size(), out);
    return ec == std::errc() && end == part.data() + part.size();
  };

  FtnAddress address;
  std::string_view node = text.substr(slash + 1);
  const size_t dot = node.find('.');
  if (dot != std::string_view::npos) {
    if (!number(node.substr(dot + 1), address.point)) {
      return std::nullopt;
    }
    node = node.substr(0, dot);
  }

  if (!number(text.substr(0, colon), address.zone) ||
      !number(text.substr(colon + 1, slash - colon - 1), address.net) ||
      !number(node, address.node)) {
    return std::nullopt;
  }
  return address;
}

const char *packetFormatName(PacketFormat format) {
  switch (format) {
  case PacketFormat::Type2:
    return "2";
  case PacketFormat::Type2Plus:
    return "2+";
  case PacketFormat::Type22:
    return "2.2";
  }
  return "?";
}

PacketHeader decodePacketHeader(ByteCursor &cursor) {
  const size_t start = cursor.position();
  const uint8_t *block = cursor.readFixed(PKT_HEADER_LEN);
  const RawPacketHeader raw = decodeRaw(block);

  if (raw.packet_type != PKT_TYPE_2) {
    throw PacketError(ParseError::InvalidPacketType, start + 18,
                      "packet type " + std::to_string(raw.packet_type));
  }

  PacketHeader header;
  header.packet_type = raw.packet_type;
  header.format = detectFormat(raw);
  header.baud = raw.baud;
  header.password = readText(block, PASSWORD_FIELD);
  header.revision_major = raw.revision_major;
  header.product_code = raw.product_code_lo;

  header.origin.net = raw.orig_net;
  header.origin.node = raw.orig_node;
  header.destination.net = raw.dest_net;
  header.destination.node = raw.dest_node;

  switch (header.format) {
  case PacketFormat::Type22:
    // the date slots hold points, the 2+ area holds domain names
    header.origin.zone = raw.qm_orig_zone;
    header.destination.zone = raw.qm_dest_zone;
    header.origin.point = raw.year;
    header.destination.point = raw.month;
    header.origin_domain = readText(block, ORIG_DOMAIN_FIELD);
    header.destination_domain = readText(block, DEST_DOMAIN_FIELD);
    break;

  case PacketFormat::Type2Plus:
    header.origin.zone = raw.orig_zone ? raw.orig_zone : raw.qm_orig_zone;
    header.destination.zone =
        raw.dest_zone ? raw.dest_zone : raw.qm_dest_zone;
    header.origin.point = raw.orig_point;
    header.destination.point = raw.dest_point;
    header.product_code =
        static_cast<uint16_t>(raw.product_code_lo | raw.product_code_hi << 8);
    header.revision_minor = raw.revision_minor;
    header.capability_word = raw.cap_word;
    header.created = creationTime(raw);
    break;

  case PacketFormat::Type2:
    header.origin.zone = raw.qm_orig_zone;
    header.destination.zone = raw.qm_dest_zone;
    header.created = creationTime(raw);
    break;
  }

  return header;
}

// ---- Helper function implementations ---- //

namespace {

RawPacketHeader decodeRaw(const uint8_t *block) {
  RawPacketHeader raw{};
  for (const auto &field : PACKET_WORDS) {
    raw.*field.member = loadU16(block + field.offset);
  }
  for (const auto &field : PACKET_BYTES) {
    raw.*field.member = block[field.offset];
  }
  return raw;
}

std::string readText(const uint8_t *block, const TextField &field) {
  ByteCursor text(block + field.offset, field.width);
  return text.readFixedString(field.width);
}

PacketFormat detectFormat(const RawPacketHeader &raw) {
  if (raw.baud == PKT_SUBVERSION_22) {
    return PacketFormat::Type22;
  }

  const uint16_t swapped =
      static_cast<uint16_t>((raw.cap_valid >> 8) | (raw.cap_valid << 8));
  if (raw.cap_word != 0 && raw.cap_word == swapped && (raw.cap_word & 0x0001)) {
    return PacketFormat::Type2Plus;
  }

  return PacketFormat::Type2;
}

std::optional<std::chrono::sys_seconds>
creationTime(const RawPacketHeader &raw) {
  using namespace std::chrono;

  if (raw.month > 11 || raw.hour > 23 || raw.minute > 59 || raw.second > 59) {
    return std::nullopt;
  }

  const year_month_day date{year{raw.year}, month{raw.month + 1u},
                            day{raw.day}};
  if (!date.ok()) {
    return std::nullopt;
  }

  return sys_days{date} + hours{raw.hour} + minutes{raw.minute} +
         seconds{raw.second};
}
} // namespace
