// src/packet/PacketError.hpp

// ---- PacketError Usage ---- //

// ParseError names every way a packet or message can fail to decode.
// PacketError is the exception ByteCursor throws; it carries the code and
// the buffer offset at which the failing read started.

// The exception never leaves the parser: the header decoder's caller turns
// it into a PacketHeaderError status and the message scanner turns it into
// PartialRecovery, keeping every message decoded so far.
// Example:
// try {
//   cursor.readFixed(14);
// } catch (const PacketError &error) {
//   if (error.code() == ParseError::Truncated) ...
// }

#pragma once

#include <cstddef> // size_t
#include <stdexcept>
#include <string>

enum class ParseError {
  Truncated,          // fewer bytes left than a fixed field needs
  UnterminatedField,  // no NUL before the end of the buffer
  InvalidPacketType,  // header type word is not a packet format we know
  UnknownMessageType, // record marker is neither a message nor terminator
  UnparseableDate     // message date stamp matches no known format
};

// Outcome of a whole packet parse
enum class ParseStatus {
  Complete,         // terminator or clean end of buffer reached
  PartialRecovery,  // a record failed, messages before it are kept
  PacketHeaderError // header unusable, nothing was scanned
};

const char *parseErrorName(ParseError error);
const char *parseStatusName(ParseStatus status);

class PacketError : public std::runtime_error {
public:
  PacketError(ParseError code, size_t offset, const std::string &detail);

  ParseError code() const { return code_; }
  size_t offset() const { return offset_; }

private:
  ParseError code_;
  size_t offset_;
};
