// src/packet/PacketError.cpp

#include "PacketError.hpp"

const char *parseErrorName(ParseError error) {
  switch (error) {
  case ParseError::Truncated:
    return "Truncated";
  case ParseError::UnterminatedField:
    return "UnterminatedField";
  case ParseError::InvalidPacketType:
    return "InvalidPacketType";
  case ParseError::UnknownMessageType:
    return "UnknownMessageType";
  case ParseError::UnparseableDate:
    return "UnparseableDate";
  }
  return "Unknown";
}

const char *parseStatusName(ParseStatus status) {
  switch (status) {
  case ParseStatus::Complete:
    return "Complete";
  case ParseStatus::PartialRecovery:
    return "PartialRecovery";
  case ParseStatus::PacketHeaderError:
    return "PacketHeaderError";
  }
  return "Unknown";
}

PacketError::PacketError(ParseError code, size_t offset,
                         const std::string &detail)
    : std::runtime_error(std::string(parseErrorName(code)) + " at offset " +
                         std::to_string(offset) + ": " + detail),
      code_(code), offset_(offset) {}
