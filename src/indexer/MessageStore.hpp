// src/indexer/MessageStore.hpp

// ---- MessageStore Usage ---- //

// MessageStore is where extracted messages end up. The indexer only talks to
// this interface; JsonLinesStore is the implementation shipped with it.

// JsonLinesStore appends one JSON object per message to a text file:
// {"pkt_file":"in/0001.pkt","msg_index":0,"echo":"MIN_CHAT",
//  "date_iso":"2024-01-05 21:04:33","date_raw":"05 Jan 24  21:04:33",
//  "size_bytes":812,"msg_lines":14,"pct_quoted":21.4,...}
// Records already in the file with the same (pkt_file, msg_index) are not
// written again, so re-running over the same packets is harmless.
// Example:
// JsonLinesStore store("pkt_index.jsonl");
// size_t inserted = store.insertMessages("in/0001.pkt", result.messages);
// if (inserted == result.messages.size()) { ... safe to delete ... }

// Throws std::runtime_error if the file cannot be written.

#pragma once

#include <cstddef> // size_t
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "ExtractedMessage.hpp"

class MessageStore {
public:
  virtual ~MessageStore() = default;

  // returns how many of the messages were newly stored
  virtual size_t insertMessages(const std::string &pkt_file,
                                const std::vector<ExtractedMessage> &messages) = 0;
};

class JsonLinesStore : public MessageStore {
public:
  JsonLinesStore(const std::string &path);

  size_t insertMessages(const std::string &pkt_file,
                        const std::vector<ExtractedMessage> &messages) override;

  size_t size() const;

private:
  std::string path_;

  // (pkt_file, msg_index) of every record in the file
  std::set<std::pair<std::string, size_t>> keys_;

  void loadKeys();
};

// the JSON object written for one message
nlohmann::json messageToJson(const std::string &pkt_file,
                             const ExtractedMessage &msg);
