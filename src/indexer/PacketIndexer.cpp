// src/indexer/PacketIndexer.cpp

#include "PacketIndexer.hpp"
#include "FidoDate.hpp"
#include "PacketBuffer.hpp"

#include <algorithm>
#include <cctype>
#include <future>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace {

bool isPacketFile(const fs::directory_entry &entry) {
  if (!entry.is_regular_file()) {
    return false;
  }
  std::string ext = entry.path().extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return ext == ".pkt";
}
} // namespace

PacketIndexer::PacketIndexer(const Config::IndexerSettings &settings,
                             const ParserOptions &options, MessageStore *store,
                             std::ostream &out)
    : settings_(settings), options_(options), store_(store), out_(out) {
  if (!store_ && !settings_.test_mode) {
    throw std::invalid_argument("A message store is required outside test "
                                "mode");
  }
  if (settings_.worker_threads < 1) {
    settings_.worker_threads = 1;
  }
}

std::vector<fs::path> PacketIndexer::findPacketFiles() const {
  const fs::path folder(settings_.folder);
  if (!fs::is_directory(folder)) {
    throw std::runtime_error("Not a directory: " + folder.string());
  }

  std::vector<fs::path> files;
  if (settings_.recursive) {
    for (const auto &entry : fs::recursive_directory_iterator(
             folder, fs::directory_options::skip_permission_denied)) {
      if (isPacketFile(entry)) {
        files.push_back(entry.path());
      }
    }
  } else {
    for (const auto &entry : fs::directory_iterator(folder)) {
      if (isPacketFile(entry)) {
        files.push_back(entry.path());
      }
    }
  }

  std::sort(files.begin(), files.end());
  return files;
}

IndexSummary PacketIndexer::run() {
  IndexSummary summary;
  const auto files = findPacketFiles();

  if (files.empty()) {
    spdlog::info("No .pkt files found in {}", settings_.folder);
    return summary;
  }
  spdlog::info("Found {} packet files in {}", files.size(), settings_.folder);

  const size_t batch = static_cast<size_t>(settings_.worker_threads);
  for (size_t first = 0; first < files.size(); first += batch) {
    const size_t last = std::min(first + batch, files.size());

    // packets are independent, parse this batch concurrently
    std::vector<std::future<ParsedFile>> pending;
    for (size_t i = first; i < last; ++i) {
      pending.push_back(std::async(std::launch::async,
                                   &PacketIndexer::parseFile, this,
                                   files[i]));
    }

    for (auto &parsed : pending) {
      handleFile(parsed.get(), summary);
    }
  }

  if (settings_.test_mode) {
    spdlog::info("Test complete: {} files, {} messages (no writes, no "
                 "deletes).",
                 summary.files_processed, summary.messages);
  } else {
    spdlog::info("Done: {} files, {} messages, {} inserted, {} deleted, {} "
                 "failed.",
                 summary.files_processed, summary.messages, summary.inserted,
                 summary.files_deleted, summary.files_failed);
  }
  return summary;
}

PacketIndexer::ParsedFile
PacketIndexer::parseFile(const fs::path &path) const {
  ParsedFile parsed;
  parsed.path = path;
  try {
    const PacketBuffer buffer = PacketBuffer::fromFile(path);
    parsed.result = parsePacket(buffer, options_);
  } catch (const std::exception &error) {
    parsed.failure = error.what();
  }
  return parsed;
}

void PacketIndexer::handleFile(const ParsedFile &file, IndexSummary &summary) {
  const std::string name = file.path.string();

  if (!file.result) {
    spdlog::error("{}: {}", name, file.failure);
    ++summary.files_failed;
    return;
  }

  const ParseResult &result = *file.result;
  if (result.status == ParseStatus::PacketHeaderError) {
    spdlog::error("{}: unusable packet header ({} at offset {})", name,
                  parseErrorName(*result.error), result.error_offset);
    ++summary.files_failed;
    return;
  }

  if (result.status == ParseStatus::PartialRecovery) {
    spdlog::warn("{}: {} at offset {}, kept {} messages, skipped {} bytes",
                 name, parseErrorName(*result.error), result.error_offset,
                 result.messages.size(), result.bytes_skipped);
    ++summary.files_partial;
  }
  if (result.unparseable_dates > 0) {
    spdlog::warn("{}: {} messages with unparseable dates", name,
                 result.unparseable_dates);
  }

  if (settings_.test_mode) {
    listMessages(file);
    ++summary.files_processed;
    summary.messages += result.messages.size();
    return;
  }

  size_t inserted = 0;
  try {
    inserted = store_->insertMessages(name, result.messages);
  } catch (const std::exception &error) {
    spdlog::error("{}: storing failed: {}", name, error.what());
    ++summary.files_failed;
    return;
  }
  ++summary.files_processed;
  summary.messages += result.messages.size();
  summary.inserted += inserted;

  if (settings_.delete_processed && result.isComplete() &&
      inserted == result.messages.size()) {
    deleteFile(file.path, summary);
  } else {
    spdlog::info("[OK] {}: {} msgs (inserted {})",
                 file.path.filename().string(), result.messages.size(),
                 inserted);
  }
}

void PacketIndexer::listMessages(const ParsedFile &file) const {
  const ParseResult &result = *file.result;
  out_ << fmt::format("=== {}: {} messages ({}) ===\n",
                      file.path.filename().string(), result.messages.size(),
                      parseStatusName(result.status));
  if (result.header) {
    out_ << fmt::format("packet type {} from {} to {}\n",
                        packetFormatName(result.header->format),
                        result.header->origin.toString(),
                        result.header->destination.toString());
  }

  for (const auto &msg : result.messages) {
    const std::string date_iso =
        msg.date ? formatIsoDate(*msg.date) : std::string("None");
    out_ << fmt::format("{} #{}: date_iso={} date_raw='{}' echo='{}' "
                        "size={} lines={} quoted={:.1f} from='{}' "
                        "subj='{}'\n",
                        file.path.string(), msg.index, date_iso, msg.date_raw,
                        msg.area, msg.size_bytes, msg.line_count,
                        msg.quoted_percent, msg.poster, msg.subject);
  }
}

void PacketIndexer::deleteFile(const fs::path &path, IndexSummary &summary) {
  std::error_code ec;
  if (!fs::remove(path, ec)) {
    spdlog::warn("[WARN] {}: imported but could not delete: {}",
                 path.filename().string(),
                 ec ? ec.message() : std::string("file missing"));
    return;
  }

  ++summary.files_deleted;
  spdlog::info("[OK] {}: stored and deleted", path.filename().string());
}
