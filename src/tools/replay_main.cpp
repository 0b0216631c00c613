/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

replay_main.cpp offline log replay into a stats snapshot.*/

#include "tracker/config/tracker_config.hpp"
#include "tracker/store/memory_stat_store.hpp"
#include "tracker/tracker_service.hpp"
#include "shared/logger.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>

using namespace sandstats;
using namespace sandstats::tracker;

namespace {

struct ReplayOptions {
	std::filesystem::path logPath;
	std::string serverId;
	std::filesystem::path configPath;
	std::filesystem::path snapshotPath;
	bool catchup = false;
};

void PrintUsage(const char* program) {
	fmt::print(stderr, "usage: {} <log> [--server id] [--config file.json] [--snapshot out.json] [--catchup]\n", program);
}

bool ParseArguments(int argc, char* argv[], ReplayOptions& options) {
	for (int i = 1; i < argc; ++i) {
		const std::string_view arg = argv[i];
		const bool hasValue = i + 1 < argc;
		if (arg == "--server" && hasValue)
			options.serverId = argv[++i];
		else if (arg == "--config" && hasValue)
			options.configPath = argv[++i];
		else if (arg == "--snapshot" && hasValue)
			options.snapshotPath = argv[++i];
		else if (arg == "--catchup")
			options.catchup = true;
		else if (!arg.starts_with("--") && options.logPath.empty())
			options.logPath = argv[i];
		else
			return false;
	}
	return !options.logPath.empty();
}

/*
=============
PrintSummary

One line per match, then the players of that match sorted as the store keeps
them.
=============
*/
void PrintSummary(const StatStore& store, const std::string& serverId) {
	for (const MatchRecord& match : store.ListMatches(serverId)) {
		fmt::print("match {} {} ({}) started {} rounds {} status {}\n", match.id, match.map, match.mode,
			FormatIsoTimestamp(match.startTime), match.round, MatchStatusName(match.status));

		for (const MatchPlayerStat& stat : store.ListPlayerStats(match.id)) {
			const std::optional<PlayerRecord> player = store.FindPlayer(stat.playerId);
			fmt::print("  {:<24} K {:>3}  A {:>3}  D {:>3}  FF {:>2}  obj {:>2}/{:<2}  score {:>5}  {}s\n",
				player ? player->name : fmt::format("#{}", stat.playerId), stat.kills, stat.assists, stat.deaths,
				stat.friendlyFireKills, stat.objectivesCaptured, stat.objectivesDestroyed, stat.score, stat.totalPlayTime);
		}
	}
}

} // namespace

int main(int argc, char* argv[]) {
	InitConsoleLogger("replay");

	ReplayOptions options;
	if (!ParseArguments(argc, argv, options)) {
		PrintUsage(argv[0]);
		return 2;
	}

	TrackerConfig config;
	if (!options.configPath.empty()) {
		std::string error;
		if (!LoadTrackerConfig(options.configPath, config, error)) {
			Logf(LogLevel::Error, "{}", error);
			return 1;
		}
		if (!std::getenv("SANDSTATS_LOG_LEVEL"))
			SetLogLevel(ParseLogLevel(config.logLevel));
		if (!config.logFile.empty() && !AttachLogFile(config.logFile, error))
			Logf(LogLevel::Warn, "{}", error);
	}

	if (options.serverId.empty())
		options.serverId = ServerIdFromPath(options.logPath).value_or("replay");
	if (options.snapshotPath.empty() && !config.tracker.snapshotPath.empty())
		options.snapshotPath = config.tracker.snapshotPath;

	MemoryStatStore store;
	try {
		std::error_code ec;
		if (!options.snapshotPath.empty() && std::filesystem::exists(options.snapshotPath, ec))
			store.LoadSnapshot(options.snapshotPath);
	}
	catch (const StoreError& e) {
		Logf(LogLevel::Error, "{}", e.what());
		return 1;
	}

	ReadStats stats;
	{
		TrackerService service(store, config.tracker);
		stats = service.ProcessFile(options.serverId, options.logPath, options.catchup);
	}

	fmt::print("{}: {} lines read, {} events applied\n", options.serverId, stats.lines, stats.applied);
	PrintSummary(store, options.serverId);

	if (!options.snapshotPath.empty()) {
		try {
			store.SaveSnapshot(options.snapshotPath);
		}
		catch (const StoreError& e) {
			Logf(LogLevel::Error, "{}", e.what());
			return 1;
		}
		fmt::print("snapshot written to {}\n", options.snapshotPath.string());
	}
	return 0;
}
