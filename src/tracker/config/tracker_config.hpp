/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

tracker_config.hpp declarations.*/

#pragma once

#include <json/json.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sandstats::tracker {

struct ServerConfig {
	// Derived from the log file name when not given.
	std::string id;
	std::string name;
	std::string logPath;
	std::string rconAddress;
	std::string rconPassword;
	std::chrono::milliseconds rconTimeout{ std::chrono::seconds(30) };
	std::string queryAddress;
	bool enabled = true;
};

struct TrackerTiming {
	std::chrono::milliseconds debounceWindow{ std::chrono::seconds(10) };
	std::chrono::milliseconds debounceMaxWait{ std::chrono::seconds(25) };
	std::chrono::milliseconds periodicScoreInterval{ std::chrono::seconds(60) };
	std::chrono::milliseconds coalesceWindow{ 200 };
	std::chrono::milliseconds inactivityTimeout{ std::chrono::seconds(10) };
	std::chrono::milliseconds pollInterval{ 500 };
	std::chrono::milliseconds travelSuppression{ std::chrono::seconds(10) };
	std::chrono::milliseconds catchupLiveThreshold{ std::chrono::minutes(1) };
	std::chrono::milliseconds catchupIdleThreshold{ std::chrono::hours(6) };
	std::chrono::milliseconds catchupLivenessWindow{ std::chrono::seconds(30) };
	std::chrono::milliseconds catchupMarkerMaxAge{ std::chrono::minutes(30) };
	std::chrono::milliseconds drainTimeout{ std::chrono::seconds(5) };
	size_t rconWorkers = 2;
	std::string snapshotPath;
};

struct TrackerConfig {
	std::vector<ServerConfig> servers;
	std::string logLevel = "warn";
	std::string logFile;
	TrackerTiming tracker;
};

bool LoadTrackerConfig(const std::filesystem::path& path, TrackerConfig& config, std::string& error);
bool ParseTrackerConfig(const Json::Value& root, TrackerConfig& config, std::string& error);

// RCON_PASSWORD_<index> replaces servers[index].rconPassword.
void ApplyEnvironmentOverrides(TrackerConfig& config);

// Every enabled server needs a name, log path, RCON address and password.
bool ValidateTrackerConfig(const TrackerConfig& config, std::string& error);

// "<dir>/abc-123.log" -> "abc-123"; a directory resolves to its first non-backup .log.
std::optional<std::string> ServerIdFromPath(const std::filesystem::path& path);

} // namespace sandstats::tracker
