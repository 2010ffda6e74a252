// src/message/TextAnalyzer.cpp

#include "TextAnalyzer.hpp"

#include <cctype> // isalnum, toupper

namespace {

constexpr std::string_view AREA_TAG = "AREA:";

// a bare AREA: line is only looked for this close to the top
constexpr size_t AREA_SCAN_LINES = 30;

// Helper functions
bool isBlank(char c);
std::string_view trim(std::string_view text);
bool startsWithNoCase(std::string_view text, std::string_view prefix);
void recordKludge(std::string_view kludge, TextAnalysis &analysis);
void recordOnce(std::string &target, std::string_view value);
} // namespace

LineTokenizer::LineTokenizer(std::string_view body, uint8_t kludge_byte)
    : body_(body), position_(0), kludge_byte_(kludge_byte) {}

bool LineTokenizer::next(TextLine &line) {
  if (position_ >= body_.size()) {
    return false;
  }

  const size_t start = position_;
  size_t end = body_.find_first_of("\r\n", start);
  if (end == std::string_view::npos) {
    end = body_.size();
    position_ = end;
  } else if (body_[end] == '\r' && end + 1 < body_.size() &&
             body_[end + 1] == '\n') {
    position_ = end + 2; // CRLF is one terminator
  } else {
    position_ = end + 1;
  }

  std::string_view text = body_.substr(start, end - start);

  if (!text.empty() && static_cast<uint8_t>(text.front()) == kludge_byte_) {
    line.kind = LineKind::Kludge;
    line.text = text.substr(1);
  } else {
    line.kind = LineKind::Display;
    line.text = text;
  }
  return true;
}

double TextAnalysis::quotedPercent() const {
  if (display_lines == 0) {
    return 0.0;
  }
  return static_cast<double>(quoted_lines) * 100.0 /
         static_cast<double>(display_lines);
}

TextAnalysis analyzeText(std::string_view body, const ParserOptions &options) {
  TextAnalysis analysis;
  LineTokenizer lines(body, options.kludge_byte);
  TextLine line;
  size_t line_number = 0;

  while (lines.next(line)) {
    ++line_number;
    if (line.kind == LineKind::Kludge) {
      recordKludge(line.text, analysis);
      continue;
    }

    // echomail writes its area line without the kludge byte, it still
    // counts as text
    if (line_number <= AREA_SCAN_LINES &&
        startsWithNoCase(line.text, AREA_TAG)) {
      recordOnce(analysis.area, trim(line.text.substr(AREA_TAG.size())));
    }

    ++analysis.display_lines;

    const bool quoted =
        options.quote_predicate
            ? options.quote_predicate(line.text)
            : isQuotedLine(line.text, options.quote_markers,
                           options.max_quote_initials);
    if (quoted) {
      ++analysis.quoted_lines;
    }
  }

  return analysis;
}

bool isQuotedLine(std::string_view line, std::string_view markers,
                  int max_initials) {
  size_t pos = 0;
  while (pos < line.size() && isBlank(line[pos])) {
    ++pos;
  }
  if (pos == line.size()) {
    return false; // blank lines never quote anything
  }

  for (int initials = 0; pos < line.size(); ++initials, ++pos) {
    const char c = line[pos];
    if (markers.find(c) != std::string_view::npos) {
      return true;
    }
    if (initials == max_initials ||
        !std::isalnum(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return false;
}

// ---- Helper function implementations ---- //

namespace {

bool isBlank(char c) { return c == ' ' || c == '\t'; }

std::string_view trim(std::string_view text) {
  while (!text.empty() && isBlank(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && isBlank(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

bool startsWithNoCase(std::string_view text, std::string_view prefix) {
  if (text.size() < prefix.size()) {
    return false;
  }
  for (size_t i = 0; i < prefix.size(); ++i) {
    if (std::toupper(static_cast<unsigned char>(text[i])) !=
        std::toupper(static_cast<unsigned char>(prefix[i]))) {
      return false;
    }
  }
  return true;
}

void recordOnce(std::string &target, std::string_view value) {
  if (target.empty() && !value.empty()) {
    target.assign(value);
  }
}

void recordKludge(std::string_view kludge, TextAnalysis &analysis) {
  if (startsWithNoCase(kludge, AREA_TAG)) {
    // first non-empty AREA: wins
    recordOnce(analysis.area, trim(kludge.substr(AREA_TAG.size())));
  } else if (startsWithNoCase(kludge, "INTL ")) {
    recordOnce(analysis.intl, trim(kludge.substr(5)));
  } else if (startsWithNoCase(kludge, "FMPT ")) {
    recordOnce(analysis.fmpt, trim(kludge.substr(5)));
  } else if (startsWithNoCase(kludge, "TOPT ")) {
    recordOnce(analysis.topt, trim(kludge.substr(5)));
  } else if (startsWithNoCase(kludge, "MSGID:")) {
    recordOnce(analysis.msgid, trim(kludge.substr(6)));
  }
}
} // namespace
