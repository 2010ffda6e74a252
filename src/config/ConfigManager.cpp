// src/config/ConfigManager.cpp

#include "ConfigManager.hpp"
#include "configs.hpp"
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {
namespace nm = nlohmann;

// Helper functions
template <typename T>
T getWithLog(const nm::json &j, const std::string &key, const T &defaultValue);
bool loadSectionExists(const nm::json &j, const std::string &section);
void loadParserOptions(const nm::json &j, ParserOptions &options);
void loadIndexerSettings(const nm::json &j, Config::IndexerSettings &settings);
} // namespace

Config::IndexerSettings defaultIndexerSettings() {
  return Config::IndexerSettings{DEFAULT_FOLDER,     DEFAULT_RECURSIVE,
                                 DEFAULT_STORE_PATH, DEFAULT_DELETE_PROCESSED,
                                 DEFAULT_TEST_MODE,  DEFAULT_WORKER_THREADS};
}

ConfigManager::ConfigManager(const std::string &config_file)
    : config_file_(config_file) {
  try {
    loadConfig();
  } catch (const std::exception &error) {
    spdlog::warn("Config {} not loaded ({}), running with built-in defaults.",
                 config_file_, error.what());
    loadDefaultConfig();
  }
}

Config ConfigManager::getConfig() const {
  // readers share the lock
  std::shared_lock<std::shared_mutex> lock(config_mutex_);
  return config_;
}

ParserOptions ConfigManager::getParserOptions() const {
  std::shared_lock<std::shared_mutex> lock(config_mutex_);
  return config_.parser;
}

Config::IndexerSettings ConfigManager::getIndexerSettings() const {
  std::shared_lock<std::shared_mutex> lock(config_mutex_);
  return config_.indexer;
}

void ConfigManager::reloadConfig() {
  // writers wait for every reader to finish
  std::unique_lock<std::shared_mutex> lock(config_mutex_);
  try {
    loadConfig();
    spdlog::info("Reloaded configuration from {}", config_file_);
  } catch (const std::exception &error) {
    spdlog::error("Reloading {} failed: {}. Keeping the current settings.",
                  config_file_, error.what());
  }
}

void ConfigManager::loadConfig() {
  std::ifstream infile(config_file_);
  if (!infile) {
    spdlog::critical("Cannot open config file {}", config_file_);
    throw std::runtime_error("Cannot open config file " + config_file_);
  }

  try {
    const nm::json j = nm::json::parse(infile);

    // build into a copy so a bad file leaves config_ untouched
    Config loaded{ParserOptions{}, defaultIndexerSettings()};

    if (loadSectionExists(j, "parser")) {
      loadParserOptions(j.at("parser"), loaded.parser);
    }
    if (loadSectionExists(j, "indexer")) {
      loadIndexerSettings(j.at("indexer"), loaded.indexer);
    }

    config_ = loaded;
  } catch (const std::exception &error) {
    spdlog::critical("Config file {} is invalid: {}", config_file_,
                     error.what());
    throw;
  }
}

void ConfigManager::loadDefaultConfig() {
  config_.parser = ParserOptions{};
  config_.indexer = defaultIndexerSettings();
}

// ---- Helper function implementations ---- //

namespace {

// missing keys are logged and take the default
template <typename T>
T getWithLog(const nm::json &j, const std::string &key,
             const T &defaultValue) {
  if (!j.contains(key)) {
    spdlog::warn("Config key '{}' missing, defaulting to {}.", key,
                 defaultValue);
    return defaultValue;
  }
  return j.at(key).get<T>();
}

bool loadSectionExists(const nm::json &j, const std::string &section) {
  if (j.contains(section) && j.at(section).is_object()) {
    return true;
  }
  spdlog::error("Config has no '{}' object, that section keeps its defaults.",
                section);
  return false;
}

// "parser" section
void loadParserOptions(const nm::json &j, ParserOptions &options) {
  options.quote_markers =
      getWithLog(j, "quote_markers", DEFAULT_QUOTE_MARKERS);
  if (options.quote_markers.empty()) {
    spdlog::warn("Empty 'quote_markers', using default '{}'.",
                 DEFAULT_QUOTE_MARKERS);
    options.quote_markers = DEFAULT_QUOTE_MARKERS;
  }

  options.max_quote_initials =
      getWithLog(j, "max_quote_initials", DEFAULT_MAX_QUOTE_INITIALS);
  if (options.max_quote_initials < 0) {
    spdlog::warn("Negative 'max_quote_initials', using default {}.",
                 DEFAULT_MAX_QUOTE_INITIALS);
    options.max_quote_initials = DEFAULT_MAX_QUOTE_INITIALS;
  }

  const int kludge_byte = getWithLog(j, "kludge_byte",
                                     static_cast<int>(DEFAULT_KLUDGE_BYTE));
  if (kludge_byte < 0 || kludge_byte > 0xFF) {
    spdlog::warn("'kludge_byte' {} is not a byte, using default {}.",
                 kludge_byte, DEFAULT_KLUDGE_BYTE);
    options.kludge_byte = DEFAULT_KLUDGE_BYTE;
  } else {
    options.kludge_byte = static_cast<uint8_t>(kludge_byte);
  }

  options.fallback_area =
      getWithLog(j, "fallback_area", DEFAULT_FALLBACK_AREA);
}

// "indexer" section
void loadIndexerSettings(const nm::json &j,
                         Config::IndexerSettings &settings) {
  settings.folder = getWithLog(j, "folder", DEFAULT_FOLDER);
  settings.recursive = getWithLog(j, "recursive", DEFAULT_RECURSIVE);
  settings.store_path = getWithLog(j, "store_path", DEFAULT_STORE_PATH);
  settings.delete_processed =
      getWithLog(j, "delete_processed", DEFAULT_DELETE_PROCESSED);
  settings.test_mode = getWithLog(j, "test_mode", DEFAULT_TEST_MODE);

  settings.worker_threads =
      getWithLog(j, "worker_threads", DEFAULT_WORKER_THREADS);
  if (settings.worker_threads < 1) {
    spdlog::warn("'worker_threads' must be at least 1, using 1.");
    settings.worker_threads = 1;
  }
}
} // namespace
