// src/config/ConfigManager.hpp

// ---- ConfigManager Usage ---- //

// ConfigManager reads parser and indexer settings from a JSON file. A file
// that is missing or unreadable at construction leaves the built-in defaults
// in place.
// Example:
// ConfigManager mgr("config/config.json");

// getConfig() hands out a copy of everything, safe to call from any thread.
// Example:
// Config snapshot = mgr.getConfig();

// The other thread-safe getters return one section.
// Example:
// ParserOptions options = mgr.getParserOptions();
// parsePacket(buffer, options);

// reloadConfig() re-reads the file. If the new contents do not parse the
// current settings stay.
// Example:
// mgr.reloadConfig();

// Keys missing from the file are logged and take their default value.
// The file layout:
// {
//   "parser":  { "quote_markers": ">", "max_quote_initials": 4,
//                "kludge_byte": 1, "fallback_area": "UNKNOWN" },
//   "indexer": { "folder": ".", "recursive": false,
//                "store_path": "pkt_index.jsonl", "delete_processed": false,
//                "test_mode": false, "worker_threads": 1 }
// }

#pragma once

#include <shared_mutex>
#include <string>

#include "ParserOptions.hpp"

struct Config {
  struct IndexerSettings {
    // where to look for .pkt files
    std::string folder;
    bool recursive;

    // JSON lines file the messages are appended to
    std::string store_path;

    // remove a packet once all of its messages are stored
    bool delete_processed;

    // list what would be stored, write and delete nothing
    bool test_mode;

    // packets parsed concurrently, at least 1
    int worker_threads;
  };

  ParserOptions parser;
  IndexerSettings indexer;
};

class ConfigManager {
public:
  ConfigManager(const std::string &config_file);

  Config getConfig() const;
  ParserOptions getParserOptions() const;
  Config::IndexerSettings getIndexerSettings() const;

  void reloadConfig();

private:
  std::string config_file_;
  Config config_;

  // getters share it, reloadConfig() takes it exclusively
  mutable std::shared_mutex config_mutex_;

  void loadConfig();
  void loadDefaultConfig();
};

Config::IndexerSettings defaultIndexerSettings();
