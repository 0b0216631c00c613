/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

test_tracker_config.cpp implementation.*/

#include "test_support.hpp"

#include "tracker/config/tracker_config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

using namespace sandstats::tracker;
using namespace sandstats::tracker::test_support;
using namespace std::chrono_literals;

namespace {

constexpr const char* kConfig = R"({
	"logging": { "level": "Debug", "file": "/var/log/sandstats/tracker.log" },
	"servers": [
		{
			"name": "Farmhouse Checkpoint",
			"logPath": "/srv/insurgency/logs/ww2-farmhouse.log",
			"rconAddress": "10.0.0.5:27015",
			"rconPassword": "from-file",
			"rconTimeout": 3,
			"queryAddress": "10.0.0.5:27131"
		},
		{
			"id": "spare",
			"enabled": false
		}
	],
	"tracker": {
		"debounceWindowMs": 2000,
		"debounceMaxWaitMs": 5000,
		"travelSuppressionMs": 15000,
		"rconWorkers": 4,
		"snapshotPath": "/var/lib/sandstats/store.json"
	}
})";

class TrackerConfigTest : public ::testing::Test {
protected:
	void TearDown() override {
		unsetenv("RCON_PASSWORD_0");
	}

	TempDir dir_;
};

TEST_F(TrackerConfigTest, LoadsServersAndTiming) {
	WriteText(dir_ / "config.json", kConfig);

	TrackerConfig config;
	std::string error;
	ASSERT_TRUE(LoadTrackerConfig(dir_ / "config.json", config, error)) << error;

	EXPECT_EQ(config.logLevel, "Debug");
	EXPECT_EQ(config.logFile, "/var/log/sandstats/tracker.log");
	ASSERT_EQ(config.servers.size(), 2u);

	const ServerConfig& first = config.servers[0];
	EXPECT_EQ(first.id, "ww2-farmhouse");
	EXPECT_EQ(first.name, "Farmhouse Checkpoint");
	EXPECT_EQ(first.rconPassword, "from-file");
	EXPECT_EQ(first.rconTimeout, 3000ms);
	EXPECT_EQ(first.queryAddress, "10.0.0.5:27131");
	EXPECT_TRUE(first.enabled);

	EXPECT_EQ(config.servers[1].id, "spare");
	EXPECT_FALSE(config.servers[1].enabled);

	EXPECT_EQ(config.tracker.debounceWindow, 2000ms);
	EXPECT_EQ(config.tracker.debounceMaxWait, 5000ms);
	EXPECT_EQ(config.tracker.travelSuppression, 15000ms);
	EXPECT_EQ(config.tracker.periodicScoreInterval, 60000ms);
	EXPECT_EQ(config.tracker.rconWorkers, 4u);
	EXPECT_EQ(config.tracker.snapshotPath, "/var/lib/sandstats/store.json");
}

TEST_F(TrackerConfigTest, EnvironmentPasswordWins) {
	WriteText(dir_ / "config.json", kConfig);
	setenv("RCON_PASSWORD_0", "from-env", 1);

	TrackerConfig config;
	std::string error;
	ASSERT_TRUE(LoadTrackerConfig(dir_ / "config.json", config, error)) << error;
	EXPECT_EQ(config.servers[0].rconPassword, "from-env");
}

TEST_F(TrackerConfigTest, EnvironmentCanSupplyMissingPassword) {
	TrackerConfig config;
	config.servers.push_back(ServerConfig{ "a", "Alpha", "/logs/a.log", "10.0.0.5:27015", "", 30s, "", true });

	std::string error;
	EXPECT_FALSE(ValidateTrackerConfig(config, error));
	EXPECT_NE(error.find("rconPassword"), std::string::npos);

	setenv("RCON_PASSWORD_0", "from-env", 1);
	ApplyEnvironmentOverrides(config);
	EXPECT_TRUE(ValidateTrackerConfig(config, error)) << error;
}

TEST_F(TrackerConfigTest, RejectsBadInput) {
	TrackerConfig config;
	std::string error;

	EXPECT_FALSE(LoadTrackerConfig(dir_ / "missing.json", config, error));
	EXPECT_NE(error.find("missing.json"), std::string::npos);

	WriteText(dir_ / "broken.json", "{ \"servers\": ");
	EXPECT_FALSE(LoadTrackerConfig(dir_ / "broken.json", config, error));

	Json::Value root;
	root["servers"] = "not a list";
	EXPECT_FALSE(ParseTrackerConfig(root, config, error));
	EXPECT_EQ(error, "'servers' must be an array");

	Json::Value badLevel;
	badLevel["logging"]["level"] = "loud";
	EXPECT_FALSE(ParseTrackerConfig(badLevel, config, error));

	Json::Value badTiming;
	badTiming["tracker"]["debounceWindowMs"] = -5;
	EXPECT_FALSE(ParseTrackerConfig(badTiming, config, error));

	Json::Value badWorkers;
	badWorkers["tracker"]["rconWorkers"] = 0;
	EXPECT_FALSE(ParseTrackerConfig(badWorkers, config, error));
}

TEST_F(TrackerConfigTest, ValidationChecksEnabledServersAndWindows) {
	TrackerConfig config;
	config.servers.push_back(ServerConfig{ "a", "", "/logs/a.log", "10.0.0.5:27015", "secret", 30s, "", true });

	std::string error;
	EXPECT_FALSE(ValidateTrackerConfig(config, error));
	EXPECT_NE(error.find("'name'"), std::string::npos);

	config.servers[0].enabled = false;
	EXPECT_TRUE(ValidateTrackerConfig(config, error));

	config.tracker.debounceWindow = 30s;
	config.tracker.debounceMaxWait = 10s;
	EXPECT_FALSE(ValidateTrackerConfig(config, error));
}

TEST_F(TrackerConfigTest, ServerIdFromLogPath) {
	EXPECT_EQ(ServerIdFromPath("/srv/logs/abc-123.log").value_or(""), "abc-123");
	EXPECT_EQ(ServerIdFromPath("/srv/logs/plain").value_or(""), "plain");

	WriteText(dir_ / "b-server.log", "");
	WriteText(dir_ / "a-server-backup-2025.10.04.log", "");
	WriteText(dir_ / "notes.txt", "");
	EXPECT_EQ(ServerIdFromPath(dir_.Path()).value_or(""), "b-server");

	TempDir empty;
	EXPECT_FALSE(ServerIdFromPath(empty.Path()).has_value());
}

} // namespace
