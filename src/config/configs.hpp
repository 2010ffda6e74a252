// src/config/configs.hpp

#pragma once

#include <cstddef> // size_t
#include <cstdint> // uint8_t, uint16_t
#include <string>

// ---- Packet layout (FTS-0001 / FSC-0039 / FSC-0045) ---- //

// Fixed packet header length for type 2, 2+ and 2.2 packets
constexpr size_t PKT_HEADER_LEN = 58;

// Packed message header: type, orig/dest node, orig/dest net, attr, cost
constexpr size_t PKT_MSG_FIXED_LEN = 14;

// Packet type word at offset 18, the only value we accept
constexpr uint16_t PKT_TYPE_2 = 2;

// Value of the word at offset 16 (baud in type 2) marking a type 2.2 packet
constexpr uint16_t PKT_SUBVERSION_22 = 2;

// Record markers read in front of every message
constexpr uint16_t PKT_MSG_TYPE = 0x0002;
constexpr uint16_t PKT_TERMINATOR = 0x0000;

// Terminates every string field and every message body
constexpr uint8_t PKT_NUL = 0x00;

// ---- Parser defaults ---- //

constexpr uint8_t DEFAULT_KLUDGE_BYTE = 0x01;
constexpr int DEFAULT_MAX_QUOTE_INITIALS = 4;
const std::string DEFAULT_QUOTE_MARKERS = ">";
const std::string DEFAULT_FALLBACK_AREA = "UNKNOWN";

// ---- Indexer defaults ---- //

const std::string DEFAULT_FOLDER = ".";
const std::string DEFAULT_STORE_PATH = "pkt_index.jsonl";
constexpr bool DEFAULT_RECURSIVE = false;
constexpr bool DEFAULT_DELETE_PROCESSED = false;
constexpr bool DEFAULT_TEST_MODE = false;
constexpr int DEFAULT_WORKER_THREADS = 1;

// Default location of the JSON configuration
const std::string DEFAULT_CONFIG_FILE = "config/config.json";
