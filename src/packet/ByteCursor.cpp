// src/packet/ByteCursor.cpp

#include "ByteCursor.hpp"
#include "PacketError.hpp"

#include <cstring> // memchr

ByteCursor::ByteCursor(const uint8_t *data, size_t length)
    : data_(data), length_(data ? length : 0), position_(0) {}

void ByteCursor::require(size_t n) const {
  if (n > remaining()) {
    throw PacketError(ParseError::Truncated, position_,
                      "need " + std::to_string(n) + " bytes, " +
                          std::to_string(remaining()) + " left");
  }
}

const uint8_t *ByteCursor::readFixed(size_t n) {
  require(n);
  const uint8_t *start = data_ + position_;
  position_ += n;
  return start;
}

uint16_t ByteCursor::readU16() { return loadU16(readFixed(2)); }

uint16_t ByteCursor::peekU16() const {
  require(2);
  return loadU16(data_ + position_);
}

std::string ByteCursor::readFixedString(size_t n) {
  const uint8_t *start = readFixed(n);
  size_t len = 0;
  while (len < n && start[len] != 0) {
    ++len;
  }
  return std::string(reinterpret_cast<const char *>(start), len);
}

std::string ByteCursor::readUntil(uint8_t sentinel) {
  const uint8_t *start = data_ + position_;
  const void *found =
      remaining() > 0 ? std::memchr(start, sentinel, remaining()) : nullptr;
  if (!found) {
    throw PacketError(ParseError::UnterminatedField, position_,
                      "no terminator before end of buffer");
  }

  size_t len = static_cast<const uint8_t *>(found) - start;
  position_ += len + 1; // skip the sentinel too
  return std::string(reinterpret_cast<const char *>(start), len);
}
