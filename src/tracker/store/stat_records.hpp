/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

stat_records.hpp persisted records.*/

#pragma once

#include "../../shared/log_time.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sandstats::tracker {

using RecordId = int64_t;

struct ServerRecord {
	std::string externalId;
	std::string name;
	std::string logPath;
	std::optional<TimePoint> logOpenedAt;

	// Tailing cursor: bytes consumed for the given log generation.
	std::optional<int64_t> cursorGeneration;
	int64_t cursorOffset = 0;

	// End offset of the last line whose event was applied.
	std::optional<int64_t> appliedGeneration;
	int64_t appliedOffset = 0;
};

enum class MatchStatus {
	Ongoing,
	Finished,
	Crashed
};

struct MatchRecord {
	RecordId id = 0;
	std::string serverId;
	std::string map;
	std::string scenario;
	std::string mode;
	std::string playerTeam;
	std::optional<int> maxPlayers;
	int round = 0;
	int roundObjective = 0;
	std::optional<int> winnerTeam;
	TimePoint startTime{};
	std::optional<TimePoint> endTime;
	MatchStatus status = MatchStatus::Ongoing;
};

struct PlayerRecord {
	RecordId id = 0;
	std::string platformId;
	std::string name;
};

enum class PlayerMatchStatus {
	Ongoing,
	Disconnected,
	Finished
};

struct MatchPlayerStat {
	RecordId matchId = 0;
	RecordId playerId = 0;
	int kills = 0;
	int assists = 0;
	int deaths = 0;
	int friendlyFireKills = 0;
	int objectivesCaptured = 0;
	int objectivesDestroyed = 0;
	int score = 0;
	// Closed sessions plus the open one as of the last reconcile, in seconds.
	int64_t totalPlayTime = 0;
	int64_t closedPlayTime = 0;
	int sessionCount = 0;
	std::optional<int> team;
	bool connected = false;
	PlayerMatchStatus status = PlayerMatchStatus::Ongoing;
	std::optional<TimePoint> firstJoinedAt;
	std::optional<TimePoint> lastLeftAt;
	std::optional<TimePoint> sessionStartedAt;
};

struct MatchWeaponStat {
	RecordId matchId = 0;
	RecordId playerId = 0;
	std::string weapon;
	std::string weaponType;
	int kills = 0;
};

struct FriendlyFireIncident {
	RecordId matchId = 0;
	RecordId killerId = 0;
	RecordId victimId = 0;
	std::string weapon;
	TimePoint timestamp{};
	std::optional<int> killerTeam;
	std::optional<int> victimTeam;
	int64_t secondsSinceMatchStart = 0;
	std::optional<int64_t> secondsSinceLastFriendlyFire;
	int killerKillsInMatch = 0;
	int killerFriendlyFireInMatch = 0;
	bool explosiveWeapon = false;
	bool vehicleWeapon = false;
	std::string map;
	std::string mode;
};

// Lifetime totals across every match, used by chat commands.
struct PlayerTotals {
	RecordId playerId = 0;
	std::string name;
	int kills = 0;
	int deaths = 0;
	int score = 0;
	int64_t playSeconds = 0;

	double ScorePerMinute() const {
		return playSeconds > 0 ? static_cast<double>(score) / (static_cast<double>(playSeconds) / 60.0) : 0.0;
	}
};

struct WeaponTotals {
	std::string weapon;
	int kills = 0;
};

std::string_view MatchStatusName(MatchStatus status);
std::optional<MatchStatus> ParseMatchStatus(std::string_view text);
std::string_view PlayerMatchStatusName(PlayerMatchStatus status);
std::optional<PlayerMatchStatus> ParsePlayerMatchStatus(std::string_view text);

} // namespace sandstats::tracker
