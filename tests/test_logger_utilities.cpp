/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

test_logger_utilities.cpp implementation.*/

#include "shared/logger.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using namespace sandstats;

namespace {

bool EndsWith(std::string_view text, std::string_view suffix)
{
	return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}

} // namespace

/*
=============
main

Validate level parsing, environment handling, formatting, sink routing and
the log file.
=============
*/
int main()
{
	assert(ParseLogLevel("TRACE") == LogLevel::Trace);
	assert(ParseLogLevel("info") == LogLevel::Info);
	assert(ParseLogLevel("warning") == LogLevel::Warn);
	assert(ParseLogLevel("Error") == LogLevel::Error);
	assert(ParseLogLevel("verbose") == LogLevel::Warn);

	unsetenv("SANDSTATS_LOG_LEVEL");
	assert(ReadLogLevelFromEnv() == LogLevel::Warn);
	setenv("SANDSTATS_LOG_LEVEL", "debug", 1);
	assert(ReadLogLevelFromEnv() == LogLevel::Debug);

	assert(LevelWeight(LogLevel::Trace) < LevelWeight(LogLevel::Debug));
	assert(LevelWeight(LogLevel::Warn) < LevelWeight(LogLevel::Error));
	assert(LevelName(LogLevel::Info) == "INFO");

	// 2025-10-04 21:00:00.250 UTC
	const LogClock::time_point when = LogClock::time_point(std::chrono::milliseconds(1759611600250LL));
	assert(FormatMessage(LogLevel::Debug, "mod", "hello", when) == "2025-10-04T21:00:00.250Z [SANDSTATS][mod] [DEBUG] hello\n");
	assert(FormatMessage(LogLevel::Warn, "mod", "already newline\n", when) ==
		"2025-10-04T21:00:00.250Z [SANDSTATS][mod] [WARN] already newline\n");

	// InitLogger picks up the environment level; errors go to the error sink.
	std::vector<std::string> printed;
	std::vector<std::string> errors;
	InitLogger(
		"watcher",
		[&](std::string_view message) { printed.emplace_back(message); },
		[&](std::string_view message) { errors.emplace_back(message); });
	assert(GetLogLevel() == LogLevel::Debug);

	const std::filesystem::path logPath = std::filesystem::temp_directory_path() / "sandstats_logger_test.log";
	std::filesystem::remove(logPath);
	std::string error;
	assert(AttachLogFile(logPath, error));

	Logf(LogLevel::Trace, "[{}] dropped", "srv");
	Logf(LogLevel::Info, "[{}] {} lines", "srv", 3);
	Logf(LogLevel::Error, "[{}] failed", "srv");
	DetachLogFile();
	Logf(LogLevel::Info, "[{}] after detach", "srv");

	assert(printed.size() == 2);
	assert(EndsWith(printed[0], " [SANDSTATS][watcher] [INFO] [srv] 3 lines\n"));
	assert(errors.size() == 1);
	assert(EndsWith(errors[0], " [SANDSTATS][watcher] [ERROR] [srv] failed\n"));

	std::ifstream file(logPath);
	std::stringstream contents;
	contents << file.rdbuf();
	assert(contents.str() == printed[0] + errors[0]);
	file.close();
	std::filesystem::remove(logPath);

	assert(!AttachLogFile(std::filesystem::temp_directory_path(), error));
	assert(!error.empty());

	SetLogLevel(LogLevel::Error);
	assert(!IsLogLevelEnabled(LogLevel::Warn));
	assert(IsLogLevelEnabled(LogLevel::Error));

	unsetenv("SANDSTATS_LOG_LEVEL");
	return 0;
}
