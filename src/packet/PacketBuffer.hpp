// src/packet/PacketBuffer.hpp

// ---- PacketBuffer Usage ---- //

// PacketBuffer holds the complete, already-read contents of one .pkt file.
// The parser never modifies it; it only reads through getData()/getLength().

// There are two constructors, one that always copies the bytes
// Example:
// PacketBuffer buf("in/0001.pkt", data_ptr, data_length);

// And a second that optionally references the bytes without copying.
// This avoids a copy but the caller must keep the bytes alive for as long as
// the buffer (and any parse of it) is in use.
// Example (true to copy, false to reference):
// PacketBuffer buf("in/0001.pkt", data_ptr, data_length, false);

// Reading a file from disk goes through fromFile(), which throws
// std::runtime_error if the file cannot be opened or read.
// Example:
// PacketBuffer buf = PacketBuffer::fromFile("in/0001.pkt");

// Copies of an owning buffer are deep copies; copies of a referencing buffer
// reference the same bytes. Moving transfers the bytes and leaves the source
// empty.

#pragma once

#include <cstddef> // size_t
#include <cstdint> // uint8_t
#include <filesystem>
#include <string>
#include <vector>

class PacketBuffer {
public:
  PacketBuffer();

  // copies data
  PacketBuffer(const std::string &source, const uint8_t *data, size_t length);

  // copies data only if copy_data is true
  PacketBuffer(const std::string &source, const uint8_t *data, size_t length,
               bool copy_data);

  // takes over an already filled vector
  PacketBuffer(const std::string &source, std::vector<uint8_t> &&bytes);

  PacketBuffer(const PacketBuffer &other);
  PacketBuffer &operator=(const PacketBuffer &other);

  PacketBuffer(PacketBuffer &&other) noexcept;
  PacketBuffer &operator=(PacketBuffer &&other) noexcept;

  ~PacketBuffer() = default;

  static PacketBuffer fromFile(const std::filesystem::path &path);

  const uint8_t *getData() const;
  size_t getLength() const;

  // where the bytes came from, usually a file path
  const std::string &getSource() const;

private:
  std::string source_;

  // owned bytes, empty when referencing external data
  std::vector<uint8_t> storage_;

  // points into storage_ or at the external bytes
  const uint8_t *data_;
  size_t length_;
  bool owns_data_;
};
