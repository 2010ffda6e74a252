// src/packet/PacketBuffer.cpp

#include "PacketBuffer.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>

PacketBuffer::PacketBuffer()
    : data_(nullptr), length_(0), owns_data_(true) {}

PacketBuffer::PacketBuffer(const std::string &source, const uint8_t *data,
                           size_t length)
    : PacketBuffer(source, data, length, true) {}

PacketBuffer::PacketBuffer(const std::string &source, const uint8_t *data,
                           size_t length, bool copy_data)
    : source_(source), data_(nullptr), length_(0), owns_data_(copy_data) {
  if (!data || length == 0) {
    return;
  }

  if (copy_data) {
    // may throw std::bad_alloc, caller handles it
    storage_.assign(data, data + length);
    data_ = storage_.data();
  } else {
    data_ = data;
  }
  length_ = length;
}

PacketBuffer::PacketBuffer(const std::string &source,
                           std::vector<uint8_t> &&bytes)
    : source_(source), storage_(std::move(bytes)), data_(nullptr),
      length_(storage_.size()), owns_data_(true) {
  if (length_ > 0) {
    data_ = storage_.data();
  }
}

PacketBuffer::PacketBuffer(const PacketBuffer &other)
    : source_(other.source_), storage_(other.storage_), data_(nullptr),
      length_(other.length_), owns_data_(other.owns_data_) {
  if (owns_data_) {
    data_ = storage_.empty() ? nullptr : storage_.data();
  } else {
    data_ = other.data_; // same external bytes
  }
}

PacketBuffer &PacketBuffer::operator=(const PacketBuffer &other) {
  if (this != &other) {
    // copy first so a failed allocation leaves us untouched
    std::vector<uint8_t> new_storage = other.storage_;

    source_ = other.source_;
    storage_ = std::move(new_storage);
    length_ = other.length_;
    owns_data_ = other.owns_data_;
    if (owns_data_) {
      data_ = storage_.empty() ? nullptr : storage_.data();
    } else {
      data_ = other.data_;
    }
  }
  return *this;
}

PacketBuffer::PacketBuffer(PacketBuffer &&other) noexcept
    : source_(std::move(other.source_)), storage_(std::move(other.storage_)),
      data_(other.data_), length_(other.length_),
      owns_data_(other.owns_data_) {
  other.data_ = nullptr;
  other.length_ = 0;
}

PacketBuffer &PacketBuffer::operator=(PacketBuffer &&other) noexcept {
  if (this != &other) {
    source_ = std::move(other.source_);
    storage_ = std::move(other.storage_);
    data_ = other.data_;
    length_ = other.length_;
    owns_data_ = other.owns_data_;

    other.data_ = nullptr;
    other.length_ = 0;
  }
  return *this;
}

PacketBuffer PacketBuffer::fromFile(const std::filesystem::path &path) {
  std::ifstream infile(path, std::ios::binary);
  if (!infile) {
    throw std::runtime_error("Error opening packet file: " + path.string());
  }

  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(infile)),
                             std::istreambuf_iterator<char>());
  if (infile.bad()) {
    throw std::runtime_error("Error reading packet file: " + path.string());
  }

  return PacketBuffer(path.string(), std::move(bytes));
}

const uint8_t *PacketBuffer::getData() const { return data_; }

size_t PacketBuffer::getLength() const { return length_; }

const std::string &PacketBuffer::getSource() const { return source_; }
