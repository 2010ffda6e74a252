// src/main.cpp

#include <exception>
#include <memory>
#include <string>

#include <CLI/CLI.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include "ConfigManager.hpp"
#include "MessageStore.hpp"
#include "PacketIndexer.hpp"
#include "configs.hpp"

int main(int argc, char *argv[]) {
  std::string config_file = DEFAULT_CONFIG_FILE;
  std::string folder;
  std::string store_path;
  std::string log_file;
  int worker_threads = 0;
  bool recursive = false;
  bool delete_processed = false;
  bool test_mode = false;

  CLI::App app{"Index the messages of FidoNet .pkt packets"};

  app.add_option("--config", config_file, "JSON configuration file")
      ->capture_default_str();
  CLI::Option *opt_folder =
      app.add_option("--folder", folder, "Folder holding .pkt files");
  CLI::Option *opt_store =
      app.add_option("--store", store_path, "JSON lines index to append to");
  CLI::Option *opt_threads =
      app.add_option("--threads", worker_threads,
                     "Packets parsed concurrently")
          ->check(CLI::PositiveNumber);
  app.add_option("--log", log_file, "Write log output to this file");

  // flags only switch things on, the config file may already have
  app.add_flag("--recursive", recursive, "Search sub folders too");
  app.add_flag("--delete", delete_processed,
               "Delete packets once all their messages are stored");
  app.add_flag("--test", test_mode,
               "List extracted fields, write and delete nothing");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    // --help exits 0, every usage error exits 1
    return app.exit(e) == 0 ? 0 : 1;
  }

  try {
    if (!log_file.empty()) {
      auto file_logger = spdlog::basic_logger_mt("file_logger", log_file);
      spdlog::set_default_logger(file_logger);
    }

    ConfigManager config_manager(config_file);

    Config::IndexerSettings settings = config_manager.getIndexerSettings();
    if (*opt_folder) {
      settings.folder = folder;
    }
    if (*opt_store) {
      settings.store_path = store_path;
    }
    if (*opt_threads) {
      settings.worker_threads = worker_threads;
    }
    settings.recursive = settings.recursive || recursive;
    settings.delete_processed = settings.delete_processed || delete_processed;
    settings.test_mode = settings.test_mode || test_mode;

    if (settings.test_mode && settings.delete_processed) {
      spdlog::info("Test mode: --delete is ignored.");
    }

    // test mode lists messages only, no store is opened
    std::unique_ptr<JsonLinesStore> store;
    if (!settings.test_mode) {
      store = std::make_unique<JsonLinesStore>(settings.store_path);
    }

    PacketIndexer indexer(settings, config_manager.getParserOptions(),
                          store.get());
    indexer.run();

    spdlog::shutdown();
    return 0;
  } catch (const std::exception &error) {
    spdlog::critical("Fatal error: {}", error.what());
  }

  spdlog::shutdown();
  return 1;
}
