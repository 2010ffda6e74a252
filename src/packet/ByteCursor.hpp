// src/packet/ByteCursor.hpp

// ---- ByteCursor Usage ---- //

// ByteCursor is a forward-only reader over a byte buffer it does not own.
// Every bounds check for packet decoding lives here, so the decoders above
// it never index the buffer directly.

// Example:
// ByteCursor cursor(buffer.getData(), buffer.getLength());
// const uint8_t *block = cursor.readFixed(58); // pointer into the buffer
// uint16_t marker = cursor.peekU16();          // does not advance
// uint16_t type = cursor.readU16();            // little endian
// std::string from = cursor.readUntil(0x00);   // consumes the NUL too

// Failed reads throw PacketError (Truncated or UnterminatedField) and leave
// the position where it was.

// The buffer must outlive the cursor. Pointers returned by readFixed() point
// into that buffer.

#pragma once

#include <cstddef> // size_t
#include <cstdint> // uint8_t, uint16_t
#include <string>

class ByteCursor {
public:
  ByteCursor(const uint8_t *data, size_t length);

  const uint8_t *readFixed(size_t n);
  uint16_t readU16();
  uint16_t peekU16() const;

  // reads n bytes and keeps the part before the first NUL
  std::string readFixedString(size_t n);

  std::string readUntil(uint8_t sentinel);

  size_t remaining() const { return length_ - position_; }
  bool atEnd() const { return position_ == length_; }
  size_t position() const { return position_; }
  size_t length() const { return length_; }

private:
  void require(size_t n) const;

  const uint8_t *data_;
  size_t length_;
  size_t position_;
};

// little endian word at p, p must have two readable bytes
inline uint16_t loadU16(const uint8_t *p) {
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}
