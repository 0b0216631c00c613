/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

logger.hpp declarations.*/

#pragma once

#include <fmt/format.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace sandstats {

enum class LogLevel {
	Trace,
	Debug,
	Info,
	Warn,
	Error
};

using LogSink = std::function<void(std::string_view)>;
using LogClock = std::chrono::system_clock;

LogLevel ParseLogLevel(std::string_view value);
LogLevel ReadLogLevelFromEnv();
int LevelWeight(LogLevel level);
std::string_view LevelName(LogLevel level);

// "2025-10-04T21:00:00.123Z [SANDSTATS][module] [LEVEL] message\n"
std::string FormatMessage(LogLevel level, std::string_view module_name, std::string_view message, LogClock::time_point when);

void InitLogger(std::string_view module_name, LogSink print_sink, LogSink error_sink);
void InitConsoleLogger(std::string_view module_name);

// Every emitted line is also appended to the file until DetachLogFile.
bool AttachLogFile(const std::filesystem::path& path, std::string& error);
void DetachLogFile();

void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();
bool IsLogLevelEnabled(LogLevel level);

void Log(LogLevel level, std::string_view message);

/*
=============
Logf

Format and log a message when the level is enabled.
=============
*/
template <typename... Args>
void Logf(LogLevel level, fmt::format_string<Args...> format, Args&&... args)
{
	if (!IsLogLevelEnabled(level))
		return;

	Log(level, fmt::format(format, std::forward<Args>(args)...));
}

} // namespace sandstats
