// src/message/ParserOptions.hpp

// ---- ParserOptions Usage ---- //

// Everything the parser can be told, passed explicitly on every call so the
// parser itself keeps no global state. A default constructed ParserOptions
// matches common FTN usage.
// Example:
// ParserOptions options;                // '>' quotes, ^A kludges
// options.fallback_area = "NETMAIL";    // area when no AREA: line exists
// options.quote_markers = ">|";         // accept "|" as a quote marker too

// quote_predicate replaces the marker rule entirely when set.
// Example:
// options.quote_predicate = [](std::string_view line) {
//   return line.starts_with(" >");
// };

#pragma once

#include <cstdint> // uint8_t
#include <functional>
#include <string>
#include <string_view>

#include "configs.hpp"

using QuotePredicate = std::function<bool(std::string_view line)>;

struct ParserOptions {
  // characters that start a quote after optional initials
  std::string quote_markers = DEFAULT_QUOTE_MARKERS;

  // longest attribution accepted before the marker, "SM>" has 2
  int max_quote_initials = DEFAULT_MAX_QUOTE_INITIALS;

  uint8_t kludge_byte = DEFAULT_KLUDGE_BYTE;

  std::string fallback_area = DEFAULT_FALLBACK_AREA;

  QuotePredicate quote_predicate;
};
