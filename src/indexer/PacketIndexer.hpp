// src/indexer/PacketIndexer.hpp

// ---- PacketIndexer Usage ---- //

// PacketIndexer is the batch job around the parser: it finds .pkt files,
// reads and parses them, hands the messages to a MessageStore and removes
// packets that were stored completely.
// Example:
// JsonLinesStore store(settings.store_path);
// PacketIndexer indexer(settings, parser_options, &store);
// IndexSummary summary = indexer.run();

// Files are found in settings.folder (recursively if settings.recursive),
// matched on a case-insensitive ".pkt" extension and handled in path order.

// settings.worker_threads packets are parsed at a time with std::async.
// Storing and deleting always happen on the calling thread, in path order.

// A file is deleted only when delete_processed is set, the parse was
// Complete and the store took every message. Anything else leaves the file
// where it is for a later run.

// In test mode each message is written to the output stream and nothing is
// stored or deleted; the store may then be null.

// A file that cannot be read or whose header is unusable is logged and
// counted in files_failed; the run carries on with the next file.
// run() throws std::runtime_error only if the folder itself is unusable.

#pragma once

#include <cstddef> // size_t
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "ConfigManager.hpp"
#include "MessageStore.hpp"
#include "PacketParser.hpp"

struct IndexSummary {
  size_t files_processed = 0;
  size_t files_failed = 0;
  size_t files_partial = 0;
  size_t files_deleted = 0;
  size_t messages = 0;
  size_t inserted = 0;
};

class PacketIndexer {
public:
  PacketIndexer(const Config::IndexerSettings &settings,
                const ParserOptions &options, MessageStore *store,
                std::ostream &out = std::cout);

  IndexSummary run();

  std::vector<std::filesystem::path> findPacketFiles() const;

private:
  struct ParsedFile {
    std::filesystem::path path;
    std::optional<ParseResult> result;
    std::string failure; // set when the file could not be read
  };

  ParsedFile parseFile(const std::filesystem::path &path) const;
  void handleFile(const ParsedFile &file, IndexSummary &summary);
  void listMessages(const ParsedFile &file) const;
  void deleteFile(const std::filesystem::path &path, IndexSummary &summary);

  Config::IndexerSettings settings_;
  ParserOptions options_;
  MessageStore *store_;
  std::ostream &out_;
};
