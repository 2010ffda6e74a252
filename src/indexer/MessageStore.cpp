// src/indexer/MessageStore.cpp

#include "MessageStore.hpp"
#include "FidoDate.hpp"

#include <chrono>
#include <fstream>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace nm = nlohmann;

namespace {

// FTN text is 8 bit, the JSON file is UTF-8
std::string latin1ToUtf8(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    const auto byte = static_cast<unsigned char>(c);
    if (byte < 0x80) {
      out += c;
    } else {
      out += static_cast<char>(0xC0 | (byte >> 6));
      out += static_cast<char>(0x80 | (byte & 0x3F));
    }
  }
  return out;
}
} // namespace

JsonLinesStore::JsonLinesStore(const std::string &path) : path_(path) {
  loadKeys();
}

size_t JsonLinesStore::size() const { return keys_.size(); }

size_t JsonLinesStore::insertMessages(
    const std::string &pkt_file,
    const std::vector<ExtractedMessage> &messages) {
  std::ofstream outfile(path_, std::ios::app);
  if (!outfile) {
    throw std::runtime_error("Error opening message store: " + path_);
  }

  size_t inserted = 0;
  for (const auto &msg : messages) {
    auto key = std::make_pair(pkt_file, msg.index);
    if (keys_.count(key) != 0) {
      continue;
    }

    // paths are written as given, odd bytes in them get replaced
    outfile << messageToJson(pkt_file, msg)
                   .dump(-1, ' ', false, nm::json::error_handler_t::replace)
            << '\n';
    if (!outfile) {
      throw std::runtime_error("Error writing message store: " + path_);
    }
    keys_.insert(std::move(key));
    ++inserted;
  }

  outfile.flush();
  if (!outfile) {
    throw std::runtime_error("Error writing message store: " + path_);
  }
  return inserted;
}

void JsonLinesStore::loadKeys() {
  std::ifstream infile(path_);
  if (!infile) {
    spdlog::info("Message store {} not found, starting a new one.", path_);
    return;
  }

  std::string line;
  size_t line_number = 0;
  while (std::getline(infile, line)) {
    ++line_number;
    if (line.empty()) {
      continue;
    }

    try {
      const nm::json j = nm::json::parse(line);
      keys_.emplace(j.at("pkt_file").get<std::string>(),
                    j.at("msg_index").get<size_t>());
    } catch (const std::exception &error) {
      spdlog::warn("Skipping malformed line {} in {}: {}", line_number, path_,
                   error.what());
    }
  }
}

nm::json messageToJson(const std::string &pkt_file,
                       const ExtractedMessage &msg) {
  using namespace std::chrono;

  nm::json j;
  j["pkt_file"] = pkt_file;
  j["msg_index"] = msg.index;
  j["date_iso"] = msg.date ? nm::json(formatIsoDate(*msg.date)) : nm::json();
  j["date_raw"] = latin1ToUtf8(msg.date_raw);
  j["echo"] = latin1ToUtf8(msg.area);
  j["size_bytes"] = msg.size_bytes;
  j["msg_lines"] = msg.line_count;
  j["pct_quoted"] =
      msg.line_count > 0 ? nm::json(msg.quoted_percent) : nm::json();
  j["from_name"] = latin1ToUtf8(msg.poster);
  j["to_name"] = latin1ToUtf8(msg.recipient);
  j["subject"] = latin1ToUtf8(msg.subject);
  j["orig_addr"] = msg.origin.toString();
  j["dest_addr"] = msg.destination.toString();
  j["msgid"] = latin1ToUtf8(msg.msgid);
  j["imported_at"] = formatIsoDate(floor<seconds>(system_clock::now()));
  return j;
}
