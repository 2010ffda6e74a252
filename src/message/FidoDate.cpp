// src/message/FidoDate.cpp

#include "FidoDate.hpp"

#include <array>
#include <cctype>
#include <vector>

#include <spdlog/fmt/fmt.h>

namespace {

constexpr std::array<std::string_view, 12> MONTHS{
    "JAN", "FEB", "MAR", "APR", "MAY", "JUN",
    "JUL", "AUG", "SEP", "OCT", "NOV", "DEC"};

constexpr std::array<std::string_view, 7> WEEKDAYS{"MON", "TUE", "WED", "THU",
                                                   "FRI", "SAT", "SUN"};

struct TimeOfDay {
  int hour = 0;
  int minute = 0;
  int second = 0;
};

// Helper functions
bool isSpace(char c);
std::vector<std::string_view> splitFields(std::string_view stamp);
std::optional<int> parseNumber(std::string_view field);
bool sameNoCase(std::string_view a, std::string_view b);
std::optional<unsigned> parseMonth(std::string_view field);
std::optional<int> parseYear(std::string_view field);
std::optional<TimeOfDay> parseClock(std::string_view field, bool need_seconds);
} // namespace

std::optional<std::chrono::sys_seconds> parseFidoDate(std::string_view stamp) {
  using namespace std::chrono;

  std::vector<std::string_view> fields = splitFields(stamp);

  // SEAdog puts the weekday first and drops the seconds
  bool seadog = false;
  if (fields.size() == 5) {
    bool weekday = false;
    for (const auto name : WEEKDAYS) {
      weekday = weekday || sameNoCase(fields[0], name);
    }
    if (!weekday) {
      return std::nullopt;
    }
    fields.erase(fields.begin());
    seadog = true;
  }

  if (fields.size() != 4) {
    return std::nullopt;
  }

  const auto d = parseNumber(fields[0]);
  const auto m = parseMonth(fields[1]);
  const auto y = parseYear(fields[2]);
  const auto t = parseClock(fields[3], !seadog);
  if (!d || !m || !y || !t) {
    return std::nullopt;
  }

  const year_month_day date{year{*y}, month{*m},
                            day{static_cast<unsigned>(*d)}};
  if (!date.ok()) {
    return std::nullopt;
  }

  return sys_days{date} + hours{t->hour} + minutes{t->minute} +
         seconds{t->second};
}

std::string formatIsoDate(std::chrono::sys_seconds when) {
  using namespace std::chrono;

  const sys_days day_point = floor<days>(when);
  const year_month_day date{day_point};
  const hh_mm_ss<seconds> time{when - day_point};

  return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}",
                     static_cast<int>(date.year()),
                     static_cast<unsigned>(date.month()),
                     static_cast<unsigned>(date.day()),
                     time.hours().count(), time.minutes().count(),
                     time.seconds().count());
}

// ---- Helper function implementations ---- //

namespace {

bool isSpace(char c) { return std::isspace(static_cast<unsigned char>(c)); }

std::vector<std::string_view> splitFields(std::string_view stamp) {
  std::vector<std::string_view> fields;
  size_t pos = 0;
  while (pos < stamp.size()) {
    while (pos < stamp.size() && isSpace(stamp[pos])) {
      ++pos;
    }
    const size_t start = pos;
    while (pos < stamp.size() && !isSpace(stamp[pos])) {
      ++pos;
    }
    if (pos > start) {
      fields.push_back(stamp.substr(start, pos - start));
    }
  }
  return fields;
}

std::optional<int> parseNumber(std::string_view field) {
  if (field.empty() || field.size() > 4) {
    return std::nullopt;
  }
  int value = 0;
  for (const char c : field) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
    value = value * 10 + (c - '0');
  }
  return value;
}

bool sameNoCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::toupper(static_cast<unsigned char>(a[i])) !=
        std::toupper(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

std::optional<unsigned> parseMonth(std::string_view field) {
  for (size_t i = 0; i < MONTHS.size(); ++i) {
    if (sameNoCase(field, MONTHS[i])) {
      return static_cast<unsigned>(i + 1);
    }
  }
  return std::nullopt;
}

std::optional<int> parseYear(std::string_view field) {
  const auto value = parseNumber(field);
  if (!value) {
    return std::nullopt;
  }
  if (field.size() == 2) {
    return *value < 69 ? 2000 + *value : 1900 + *value;
  }
  if (field.size() == 4) {
    return *value;
  }
  return std::nullopt;
}

std::optional<TimeOfDay> parseClock(std::string_view field, bool need_seconds) {
  // HH:MM or HH:MM:SS, two digits each
  const size_t expected = need_seconds ? 8 : 5;
  if (field.size() != expected || field[2] != ':' ||
      (need_seconds && field[5] != ':')) {
    return std::nullopt;
  }

  const auto h = parseNumber(field.substr(0, 2));
  const auto m = parseNumber(field.substr(3, 2));
  const auto s = need_seconds ? parseNumber(field.substr(6, 2))
                              : std::optional<int>(0);
  if (!h || !m || !s || *h > 23 || *m > 59 || *s > 59) {
    return std::nullopt;
  }
  return TimeOfDay{*h, *m, *s};
}
} // namespace
