// src/message/TextAnalyzer.hpp

// ---- TextAnalyzer Usage ---- //

// analyzeText() makes one forward pass over a message body and returns the
// echomail area, the number of display lines and how many of those quote
// earlier text.
// Example:
// TextAnalysis text = analyzeText("\x01" "AREA:MIN_CHAT\r\nHi\r\n> old\r\n",
//                                 ParserOptions{});
// text.area;            // "MIN_CHAT"
// text.display_lines;   // 2
// text.quoted_lines;    // 1
// text.quotedPercent(); // 50.0

// Lines end at CR, LF or CRLF. A line is a kludge when its first byte is the
// kludge byte. Kludges never count as display or quoted lines. The area comes
// from the first non-empty "AREA:" kludge, or from a plain "AREA:" line within
// the first 30 lines, which is how echomail carries it on the wire. A plain
// area line is still a display line.

// LineTokenizer is the pass underneath, usable on its own. It is single use:
// once next() returns false it stays exhausted.
// Example:
// LineTokenizer lines(body, 0x01);
// TextLine line;
// while (lines.next(line)) {
//   if (line.kind == LineKind::Kludge) ...
// }

#pragma once

#include <cstddef> // size_t
#include <cstdint> // uint8_t
#include <string>
#include <string_view>

#include "ParserOptions.hpp"

enum class LineKind { Kludge, Display };

struct TextLine {
  LineKind kind = LineKind::Display;

  // line without its terminator; kludges also lose the kludge byte
  std::string_view text;
};

class LineTokenizer {
public:
  LineTokenizer(std::string_view body, uint8_t kludge_byte);

  bool next(TextLine &line);

private:
  std::string_view body_;
  size_t position_;
  uint8_t kludge_byte_;
};

struct TextAnalysis {
  std::string area; // empty when no AREA: line was found
  size_t display_lines = 0;
  size_t quoted_lines = 0;

  // values of the addressing kludges, first occurrence of each
  std::string intl;  // "INTL <dest> <orig>"
  std::string fmpt;  // origin point
  std::string topt;  // destination point
  std::string msgid; // "MSGID: <origaddr> <serial>"

  // quoted / display * 100, 0 when there are no display lines
  double quotedPercent() const;
};

TextAnalysis analyzeText(std::string_view body, const ParserOptions &options);

// The default quote rule: skip leading blanks, allow up to max_initials
// letters or digits of attribution, then expect one of markers. Lines that
// are blank after stripping are never quoted.
bool isQuotedLine(std::string_view line, std::string_view markers,
                  int max_initials);
