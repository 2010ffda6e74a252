// src/message/ExtractedMessage.cpp

#include "ExtractedMessage.hpp"
#include "FidoDate.hpp"
#include "TextAnalyzer.hpp"

#include <charconv> // from_chars

namespace {

constexpr const char *WHITESPACE = " \t\r\n\f\v";

// Helper functions
std::string trimmed(const std::string &text);
void applyPoint(const std::string &kludge, FtnAddress &address);
void applyIntl(const std::string &kludge, FtnAddress &origin,
               FtnAddress &destination);
} // namespace

ExtractedMessage assembleMessage(const PacketHeader &packet,
                                 const RawMessage &raw, size_t index,
                                 const ParserOptions &options) {
  const MessageHeader &h = raw.header;
  const TextAnalysis text = analyzeText(raw.body, options);

  ExtractedMessage msg;
  msg.index = index;

  msg.area_found = !text.area.empty();
  msg.area = msg.area_found ? text.area : options.fallback_area;

  msg.poster = trimmed(h.from_name);
  msg.recipient = trimmed(h.to_name);
  msg.subject = trimmed(h.subject);
  msg.attributes = h.attributes;
  msg.cost = h.cost;
  msg.msgid = text.msgid;

  msg.origin = FtnAddress{packet.origin.zone, h.orig_net, h.orig_node, 0};
  msg.destination =
      FtnAddress{packet.destination.zone, h.dest_net, h.dest_node, 0};
  applyIntl(text.intl, msg.origin, msg.destination);
  applyPoint(text.fmpt, msg.origin);
  applyPoint(text.topt, msg.destination);

  // an unreadable stamp keeps the message, the raw text stays for display
  msg.date_raw = trimmed(h.date_time);
  msg.date = parseFidoDate(h.date_time);

  msg.size_bytes = raw.body.size();
  msg.line_count = text.display_lines;
  msg.quoted_count = text.quoted_lines;
  msg.quoted_percent = text.quotedPercent();

  return msg;
}

// ---- Helper function implementations ---- //

namespace {

std::string trimmed(const std::string &text) {
  const size_t first = text.find_first_not_of(WHITESPACE);
  if (first == std::string::npos) {
    return "";
  }
  const size_t last = text.find_last_not_of(WHITESPACE);
  return text.substr(first, last - first + 1);
}

void applyPoint(const std::string &kludge, FtnAddress &address) {
  uint16_t point = 0;
  const auto [end, ec] =
      std::from_chars(kludge.data(), kludge.data() + kludge.size(), point);
  if (!kludge.empty() && ec == std::errc() &&
      end == kludge.data() + kludge.size()) {
    address.point = point;
  }
}

// "INTL <dest> <orig>", only the zones are taken
void applyIntl(const std::string &kludge, FtnAddress &origin,
               FtnAddress &destination) {
  const size_t space = kludge.find(' ');
  if (space == std::string::npos) {
    return;
  }

  const auto dest = parseFtnAddress(kludge.substr(0, space));
  const auto orig = parseFtnAddress(trimmed(kludge.substr(space + 1)));
  if (dest && orig) {
    destination.zone = dest->zone;
    origin.zone = orig->zone;
  }
}
} // namespace
