/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

tracker_config.cpp implementation.*/

#include "tracker_config.hpp"

#include "../../shared/logger.hpp"
#include "../../shared/string_utils.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string_view>
#include <system_error>

namespace sandstats::tracker {

namespace {

bool ReadString(const Json::Value& object, const char* key, std::string& out, std::string& error) {
	if (!object.isMember(key))
		return true;
	const Json::Value& value = object[key];
	if (!value.isString()) {
		error = fmt::format("'{}' must be a string", key);
		return false;
	}
	out = value.asString();
	return true;
}

bool ReadBool(const Json::Value& object, const char* key, bool& out, std::string& error) {
	if (!object.isMember(key))
		return true;
	const Json::Value& value = object[key];
	if (!value.isBool()) {
		error = fmt::format("'{}' must be true or false", key);
		return false;
	}
	out = value.asBool();
	return true;
}

// Durations are whole milliseconds unless the key says otherwise.
bool ReadMillis(const Json::Value& object, const char* key, std::chrono::milliseconds& out, std::string& error,
	int64_t scale = 1) {
	if (!object.isMember(key))
		return true;
	const Json::Value& value = object[key];
	if (!value.isIntegral() || value.asInt64() < 0) {
		error = fmt::format("'{}' must be a non-negative integer", key);
		return false;
	}
	out = std::chrono::milliseconds(value.asInt64() * scale);
	return true;
}

bool IsKnownLogLevel(std::string_view level) {
	static constexpr std::string_view kLevels[] = { "trace", "debug", "info", "warn", "warning", "error" };
	const std::string lowered = ToLower(level);
	return std::find(std::begin(kLevels), std::end(kLevels), lowered) != std::end(kLevels);
}

bool ParseServer(const Json::Value& entry, size_t index, ServerConfig& server, std::string& error) {
	if (!entry.isObject()) {
		error = fmt::format("servers[{}] is not an object", index);
		return false;
	}

	std::string fieldError;
	const bool ok = ReadString(entry, "id", server.id, fieldError) &&
		ReadString(entry, "name", server.name, fieldError) &&
		ReadString(entry, "logPath", server.logPath, fieldError) &&
		ReadString(entry, "rconAddress", server.rconAddress, fieldError) &&
		ReadString(entry, "rconPassword", server.rconPassword, fieldError) &&
		ReadMillis(entry, "rconTimeout", server.rconTimeout, fieldError, 1000) &&
		ReadString(entry, "queryAddress", server.queryAddress, fieldError) &&
		ReadBool(entry, "enabled", server.enabled, fieldError);
	if (!ok) {
		error = fmt::format("servers[{}]: {}", index, fieldError);
		return false;
	}
	return true;
}

bool ParseTiming(const Json::Value& tracker, TrackerTiming& timing, std::string& error) {
	if (!tracker.isObject()) {
		error = "'tracker' must be an object";
		return false;
	}

	bool ok = ReadMillis(tracker, "debounceWindowMs", timing.debounceWindow, error) &&
		ReadMillis(tracker, "debounceMaxWaitMs", timing.debounceMaxWait, error) &&
		ReadMillis(tracker, "periodicScoreIntervalMs", timing.periodicScoreInterval, error) &&
		ReadMillis(tracker, "coalesceWindowMs", timing.coalesceWindow, error) &&
		ReadMillis(tracker, "inactivityTimeoutMs", timing.inactivityTimeout, error) &&
		ReadMillis(tracker, "pollIntervalMs", timing.pollInterval, error) &&
		ReadMillis(tracker, "travelSuppressionMs", timing.travelSuppression, error) &&
		ReadMillis(tracker, "catchupLiveThresholdMs", timing.catchupLiveThreshold, error) &&
		ReadMillis(tracker, "catchupIdleThresholdMs", timing.catchupIdleThreshold, error) &&
		ReadMillis(tracker, "catchupLivenessWindowMs", timing.catchupLivenessWindow, error) &&
		ReadMillis(tracker, "catchupMarkerMaxAgeMs", timing.catchupMarkerMaxAge, error) &&
		ReadMillis(tracker, "drainTimeoutMs", timing.drainTimeout, error) &&
		ReadString(tracker, "snapshotPath", timing.snapshotPath, error);
	if (!ok)
		return false;

	if (tracker.isMember("rconWorkers")) {
		const Json::Value& workers = tracker["rconWorkers"];
		if (!workers.isIntegral() || workers.asInt() < 1) {
			error = "'rconWorkers' must be a positive integer";
			return false;
		}
		timing.rconWorkers = static_cast<size_t>(workers.asInt());
	}
	return true;
}

} // namespace

/*
=============
LoadTrackerConfig

Reads the JSON config file, applies environment overrides and validates the
result. `config` is only written on success.
=============
*/
bool LoadTrackerConfig(const std::filesystem::path& path, TrackerConfig& config, std::string& error) {
	std::ifstream file(path, std::ifstream::binary);
	if (!file.is_open()) {
		error = fmt::format("failed to open config file '{}'", path.string());
		return false;
	}

	Json::Value root;
	Json::CharReaderBuilder builder;
	std::string errs;
	if (!Json::parseFromStream(builder, file, &root, &errs)) {
		error = fmt::format("JSON parsing failed for '{}': {}", path.string(), errs);
		return false;
	}

	TrackerConfig parsed;
	if (!ParseTrackerConfig(root, parsed, error))
		return false;

	ApplyEnvironmentOverrides(parsed);
	if (!ValidateTrackerConfig(parsed, error))
		return false;

	config = std::move(parsed);
	return true;
}

bool ParseTrackerConfig(const Json::Value& root, TrackerConfig& config, std::string& error) {
	if (!root.isObject()) {
		error = "config root must be a JSON object";
		return false;
	}

	if (root.isMember("servers")) {
		const Json::Value& servers = root["servers"];
		if (!servers.isArray()) {
			error = "'servers' must be an array";
			return false;
		}
		for (Json::ArrayIndex i = 0; i < servers.size(); ++i) {
			ServerConfig server;
			if (!ParseServer(servers[i], i, server, error))
				return false;
			if (server.id.empty() && !server.logPath.empty())
				server.id = ServerIdFromPath(server.logPath).value_or("");
			config.servers.push_back(std::move(server));
		}
	}

	if (root.isMember("logging")) {
		const Json::Value& logging = root["logging"];
		if (!logging.isObject()) {
			error = "'logging' must be an object";
			return false;
		}
		if (!ReadString(logging, "level", config.logLevel, error) || !ReadString(logging, "file", config.logFile, error))
			return false;
		if (!IsKnownLogLevel(config.logLevel)) {
			error = fmt::format("unknown log level '{}'", config.logLevel);
			return false;
		}
	}

	if (root.isMember("tracker") && !ParseTiming(root["tracker"], config.tracker, error))
		return false;

	return true;
}

void ApplyEnvironmentOverrides(TrackerConfig& config) {
	for (size_t i = 0; i < config.servers.size(); ++i) {
		const std::string variable = fmt::format("RCON_PASSWORD_{}", i);
		if (const char* value = std::getenv(variable.c_str()); value && *value) {
			config.servers[i].rconPassword = value;
			Logf(LogLevel::Debug, "{}: RCON password for server {} taken from {}", __FUNCTION__, i, variable);
		}
	}
}

bool ValidateTrackerConfig(const TrackerConfig& config, std::string& error) {
	for (size_t i = 0; i < config.servers.size(); ++i) {
		const ServerConfig& server = config.servers[i];
		if (!server.enabled)
			continue;

		if (server.name.empty()) {
			error = fmt::format("server at index {} is missing 'name'", i);
			return false;
		}
		if (server.logPath.empty()) {
			error = fmt::format("server '{}' (index {}) is missing 'logPath'", server.name, i);
			return false;
		}
		if (server.rconAddress.empty()) {
			error = fmt::format("server '{}' (index {}) is missing 'rconAddress'", server.name, i);
			return false;
		}
		if (server.rconPassword.empty()) {
			error = fmt::format("server '{}' (index {}) is missing 'rconPassword'", server.name, i);
			return false;
		}
	}

	if (config.tracker.debounceMaxWait < config.tracker.debounceWindow) {
		error = "'debounceMaxWaitMs' must not be shorter than 'debounceWindowMs'";
		return false;
	}
	return true;
}

std::optional<std::string> ServerIdFromPath(const std::filesystem::path& path) {
	std::error_code ec;
	if (!std::filesystem::is_directory(path, ec)) {
		if (path.extension() == ".log")
			return path.stem().string();
		const std::string name = path.filename().string();
		if (name.empty())
			return std::nullopt;
		return name;
	}

	std::vector<std::filesystem::path> candidates;
	for (const auto& entry : std::filesystem::directory_iterator(path, ec)) {
		if (!entry.is_regular_file(ec) || entry.path().extension() != ".log")
			continue;
		if (entry.path().filename().string().find("backup") != std::string::npos)
			continue;
		candidates.push_back(entry.path());
	}
	if (candidates.empty())
		return std::nullopt;

	std::sort(candidates.begin(), candidates.end());
	return candidates.front().stem().string();
}

} // namespace sandstats::tracker
