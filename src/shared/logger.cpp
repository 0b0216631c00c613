/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

logger.cpp implementation.*/

#include "logger.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <memory>
#include <mutex>

namespace sandstats {
namespace {

struct LoggerState {
	std::string module_name = "sandstats";
	LogSink print_sink;
	LogSink error_sink;
};

std::atomic<LogLevel> g_log_level = LogLevel::Warn;

std::mutex g_state_mutex;
LoggerState g_state;

// Serialises every write so lines from different workers never interleave.
std::mutex g_output_mutex;
std::unique_ptr<std::ofstream> g_log_file;

constexpr std::array<std::string_view, 5> kLevelNames{ "TRACE", "DEBUG", "INFO", "WARN", "ERROR" };

LoggerState SnapshotState()
{
	std::lock_guard lock(g_state_mutex);
	return g_state;
}

void WriteToStream(std::FILE* stream, std::string_view message)
{
	std::fwrite(message.data(), 1, message.size(), stream);
	std::fflush(stream);
}

/*
=============
FormatUtc

ISO-8601 with milliseconds, always UTC.
=============
*/
std::string FormatUtc(LogClock::time_point when)
{
	const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count();
	const std::time_t seconds = static_cast<std::time_t>(millis / 1000);
	std::tm parts{};
	gmtime_r(&seconds, &parts);

	return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", parts.tm_year + 1900, parts.tm_mon + 1, parts.tm_mday,
		parts.tm_hour, parts.tm_min, parts.tm_sec, static_cast<int>(millis % 1000));
}

} // namespace

/*
=============
ParseLogLevel

Case-insensitive level name. Unknown names fall back to Warn.
=============
*/
LogLevel ParseLogLevel(std::string_view value)
{
	std::string lowered(value);
	std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

	if (lowered == "trace")
		return LogLevel::Trace;
	if (lowered == "debug")
		return LogLevel::Debug;
	if (lowered == "info")
		return LogLevel::Info;
	if (lowered == "error")
		return LogLevel::Error;
	return LogLevel::Warn;
}

/*
=============
ReadLogLevelFromEnv

SANDSTATS_LOG_LEVEL, or Warn when unset.
=============
*/
LogLevel ReadLogLevelFromEnv()
{
	const char* env_value = std::getenv("SANDSTATS_LOG_LEVEL");
	if (!env_value || !*env_value)
		return LogLevel::Warn;
	return ParseLogLevel(env_value);
}

int LevelWeight(LogLevel level)
{
	return std::clamp(static_cast<int>(level), 0, static_cast<int>(kLevelNames.size()) - 1);
}

std::string_view LevelName(LogLevel level)
{
	return kLevelNames[static_cast<size_t>(LevelWeight(level))];
}

std::string FormatMessage(LogLevel level, std::string_view module_name, std::string_view message, LogClock::time_point when)
{
	std::string formatted = fmt::format("{} [SANDSTATS][{}] [{}] {}", FormatUtc(when), module_name, LevelName(level), message);
	if (formatted.back() != '\n')
		formatted.push_back('\n');

	return formatted;
}

/*
=============
InitLogger

Install sinks for the named module. The environment level applies until
SetLogLevel overrides it.
=============
*/
void InitLogger(std::string_view module_name, LogSink print_sink, LogSink error_sink)
{
	{
		std::lock_guard lock(g_state_mutex);
		g_state.module_name = module_name;
		g_state.print_sink = std::move(print_sink);
		g_state.error_sink = std::move(error_sink);
	}

	g_log_level.store(ReadLogLevelFromEnv(), std::memory_order_relaxed);
}

void InitConsoleLogger(std::string_view module_name)
{
	InitLogger(
		module_name,
		[](std::string_view message) { WriteToStream(stdout, message); },
		[](std::string_view message) { WriteToStream(stderr, message); });
}

/*
=============
AttachLogFile

Open the file for appending. A previously attached file is closed.
=============
*/
bool AttachLogFile(const std::filesystem::path& path, std::string& error)
{
	std::error_code ec;
	if (path.has_parent_path())
		std::filesystem::create_directories(path.parent_path(), ec);

	auto file = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app | std::ios::binary);
	if (!file->is_open()) {
		error = fmt::format("unable to open log file '{}'", path.string());
		return false;
	}

	std::lock_guard lock(g_output_mutex);
	g_log_file = std::move(file);
	return true;
}

void DetachLogFile()
{
	std::lock_guard lock(g_output_mutex);
	g_log_file.reset();
}

void SetLogLevel(LogLevel level)
{
	g_log_level.store(level, std::memory_order_relaxed);
}

LogLevel GetLogLevel()
{
	return g_log_level.load(std::memory_order_relaxed);
}

bool IsLogLevelEnabled(LogLevel level)
{
	return LevelWeight(level) >= LevelWeight(GetLogLevel());
}

/*
=============
Log

Errors go to the error sink when one is installed, everything else to the
print sink. The attached log file receives both.
=============
*/
void Log(LogLevel level, std::string_view message)
{
	if (!IsLogLevelEnabled(level))
		return;

	const LoggerState state = SnapshotState();
	const std::string formatted = FormatMessage(level, state.module_name, message, LogClock::now());
	const LogSink& sink = (level == LogLevel::Error && state.error_sink) ? state.error_sink : state.print_sink;

	std::lock_guard lock(g_output_mutex);
	if (sink)
		sink(formatted);
	if (g_log_file) {
		*g_log_file << formatted;
		g_log_file->flush();
	}
}

} // namespace sandstats
