// src/message/FidoDate.hpp

// ---- FidoDate Usage ---- //

// parseFidoDate() turns the date stamp of a packed message into a point in
// time. Two layouts are in use on the wire:
//   FTS-0001  "05 Jan 24  21:04:33"   (some software writes "2024")
//   SEAdog    "Fri  5 Jan 24 21:04"   (no seconds)
// Spacing between fields is not fixed and month names ignore case.
// Two digit years 00-68 are 2000-2068, 69-99 are 1969-1999.
// Example:
// auto when = parseFidoDate("05 Jan 24  21:04:33");
// if (!when) { ... keep the raw stamp ... }

// formatIsoDate() renders "2024-01-05 21:04:33".

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

std::optional<std::chrono::sys_seconds> parseFidoDate(std::string_view stamp);

std::string formatIsoDate(std::chrono::sys_seconds when);
