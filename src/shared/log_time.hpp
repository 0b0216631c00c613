/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

log_time.hpp declarations.*/

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace sandstats {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Seconds = std::chrono::seconds;
using Milliseconds = std::chrono::milliseconds;

// Bracketed line timestamp without brackets: "2025.10.04-21.27.51:780".
std::optional<TimePoint> ParseLineTimestamp(std::string_view text);

// Header timestamp of a "Log file open, 11/10/25 20:58:31" line.
std::optional<TimePoint> ParseLogOpenTimestamp(std::string_view text);

std::string FormatLineTimestamp(TimePoint time);

// ISO-8601 UTC with milliseconds, used in snapshots and log output.
std::string FormatIsoTimestamp(TimePoint time);
std::optional<TimePoint> ParseIsoTimestamp(std::string_view text);

TimePoint FileTimeToSystem(std::filesystem::file_time_type time);

int64_t ToUnixMillis(TimePoint time);
TimePoint FromUnixMillis(int64_t millis);

double SecondsBetween(TimePoint from, TimePoint to);

} // namespace sandstats
