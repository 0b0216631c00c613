/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

memory_stat_store.cpp implementation.*/

#include "memory_stat_store.hpp"

#include "../../shared/file_io.hpp"
#include "../../shared/logger.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <sstream>
#include <system_error>
#include <unordered_map>

namespace sandstats::tracker {
namespace {

using json = Json::Value;

json TimeToJson(const std::optional<TimePoint>& time) {
	return time ? json(FormatIsoTimestamp(*time)) : json(Json::nullValue);
}

std::optional<TimePoint> TimeFromJson(const json& value, std::string_view field) {
	if (value.isNull())
		return std::nullopt;
	if (!value.isString())
		throw StoreError(fmt::format("snapshot field '{}' must be a timestamp string", field));

	const auto parsed = ParseIsoTimestamp(value.asString());
	if (!parsed)
		throw StoreError(fmt::format("snapshot field '{}' has invalid timestamp '{}'", field, value.asString()));
	return parsed;
}

TimePoint RequiredTimeFromJson(const json& value, std::string_view field) {
	const auto parsed = TimeFromJson(value, field);
	if (!parsed)
		throw StoreError(fmt::format("snapshot field '{}' is required", field));
	return *parsed;
}

template <typename T>
json OptionalToJson(const std::optional<T>& value) {
	return value ? json(static_cast<Json::Int64>(*value)) : json(Json::nullValue);
}

std::optional<int> OptionalIntFromJson(const json& value) {
	if (value.isNull())
		return std::nullopt;
	return value.asInt();
}

std::optional<int64_t> OptionalInt64FromJson(const json& value) {
	if (value.isNull())
		return std::nullopt;
	return value.asInt64();
}

json ServerToJson(const ServerRecord& server) {
	json out(Json::objectValue);
	out["externalId"] = server.externalId;
	out["name"] = server.name;
	out["logPath"] = server.logPath;
	out["logOpenedAt"] = TimeToJson(server.logOpenedAt);
	out["cursorGeneration"] = OptionalToJson(server.cursorGeneration);
	out["cursorOffset"] = static_cast<Json::Int64>(server.cursorOffset);
	out["appliedGeneration"] = OptionalToJson(server.appliedGeneration);
	out["appliedOffset"] = static_cast<Json::Int64>(server.appliedOffset);
	return out;
}

ServerRecord ServerFromJson(const json& in) {
	ServerRecord server;
	server.externalId = in["externalId"].asString();
	server.name = in["name"].asString();
	server.logPath = in["logPath"].asString();
	server.logOpenedAt = TimeFromJson(in["logOpenedAt"], "logOpenedAt");
	server.cursorGeneration = OptionalInt64FromJson(in["cursorGeneration"]);
	server.cursorOffset = in["cursorOffset"].asInt64();
	server.appliedGeneration = OptionalInt64FromJson(in["appliedGeneration"]);
	server.appliedOffset = in["appliedOffset"].asInt64();
	return server;
}

json MatchToJson(const MatchRecord& match) {
	json out(Json::objectValue);
	out["id"] = static_cast<Json::Int64>(match.id);
	out["serverId"] = match.serverId;
	out["map"] = match.map;
	out["scenario"] = match.scenario;
	out["mode"] = match.mode;
	out["playerTeam"] = match.playerTeam;
	out["maxPlayers"] = OptionalToJson(match.maxPlayers);
	out["round"] = match.round;
	out["roundObjective"] = match.roundObjective;
	out["winnerTeam"] = OptionalToJson(match.winnerTeam);
	out["startTime"] = FormatIsoTimestamp(match.startTime);
	out["endTime"] = TimeToJson(match.endTime);
	out["status"] = std::string(MatchStatusName(match.status));
	return out;
}

MatchRecord MatchFromJson(const json& in) {
	MatchRecord match;
	match.id = in["id"].asInt64();
	match.serverId = in["serverId"].asString();
	match.map = in["map"].asString();
	match.scenario = in["scenario"].asString();
	match.mode = in["mode"].asString();
	match.playerTeam = in["playerTeam"].asString();
	match.maxPlayers = OptionalIntFromJson(in["maxPlayers"]);
	match.round = in["round"].asInt();
	match.roundObjective = in["roundObjective"].asInt();
	match.winnerTeam = OptionalIntFromJson(in["winnerTeam"]);
	match.startTime = RequiredTimeFromJson(in["startTime"], "startTime");
	match.endTime = TimeFromJson(in["endTime"], "endTime");

	const auto status = ParseMatchStatus(in["status"].asString());
	if (!status)
		throw StoreError(fmt::format("match {} has unknown status '{}'", match.id, in["status"].asString()));
	match.status = *status;
	return match;
}

json StatToJson(const MatchPlayerStat& stat) {
	json out(Json::objectValue);
	out["matchId"] = static_cast<Json::Int64>(stat.matchId);
	out["playerId"] = static_cast<Json::Int64>(stat.playerId);
	out["kills"] = stat.kills;
	out["assists"] = stat.assists;
	out["deaths"] = stat.deaths;
	out["friendlyFireKills"] = stat.friendlyFireKills;
	out["objectivesCaptured"] = stat.objectivesCaptured;
	out["objectivesDestroyed"] = stat.objectivesDestroyed;
	out["score"] = stat.score;
	out["totalPlayTime"] = static_cast<Json::Int64>(stat.totalPlayTime);
	out["closedPlayTime"] = static_cast<Json::Int64>(stat.closedPlayTime);
	out["sessionCount"] = stat.sessionCount;
	out["team"] = OptionalToJson(stat.team);
	out["connected"] = stat.connected;
	out["status"] = std::string(PlayerMatchStatusName(stat.status));
	out["firstJoinedAt"] = TimeToJson(stat.firstJoinedAt);
	out["lastLeftAt"] = TimeToJson(stat.lastLeftAt);
	out["sessionStartedAt"] = TimeToJson(stat.sessionStartedAt);
	return out;
}

MatchPlayerStat StatFromJson(const json& in) {
	MatchPlayerStat stat;
	stat.matchId = in["matchId"].asInt64();
	stat.playerId = in["playerId"].asInt64();
	stat.kills = in["kills"].asInt();
	stat.assists = in["assists"].asInt();
	stat.deaths = in["deaths"].asInt();
	stat.friendlyFireKills = in["friendlyFireKills"].asInt();
	stat.objectivesCaptured = in["objectivesCaptured"].asInt();
	stat.objectivesDestroyed = in["objectivesDestroyed"].asInt();
	stat.score = in["score"].asInt();
	stat.totalPlayTime = in["totalPlayTime"].asInt64();
	stat.closedPlayTime = in["closedPlayTime"].asInt64();
	stat.sessionCount = in["sessionCount"].asInt();
	stat.team = OptionalIntFromJson(in["team"]);
	stat.connected = in["connected"].asBool();

	const auto status = ParsePlayerMatchStatus(in["status"].asString());
	if (!status)
		throw StoreError(fmt::format("player stat has unknown status '{}'", in["status"].asString()));
	stat.status = *status;

	stat.firstJoinedAt = TimeFromJson(in["firstJoinedAt"], "firstJoinedAt");
	stat.lastLeftAt = TimeFromJson(in["lastLeftAt"], "lastLeftAt");
	stat.sessionStartedAt = TimeFromJson(in["sessionStartedAt"], "sessionStartedAt");
	return stat;
}

json IncidentToJson(const FriendlyFireIncident& incident) {
	json out(Json::objectValue);
	out["matchId"] = static_cast<Json::Int64>(incident.matchId);
	out["killerId"] = static_cast<Json::Int64>(incident.killerId);
	out["victimId"] = static_cast<Json::Int64>(incident.victimId);
	out["weapon"] = incident.weapon;
	out["timestamp"] = FormatIsoTimestamp(incident.timestamp);
	out["killerTeam"] = OptionalToJson(incident.killerTeam);
	out["victimTeam"] = OptionalToJson(incident.victimTeam);
	out["secondsSinceMatchStart"] = static_cast<Json::Int64>(incident.secondsSinceMatchStart);
	out["secondsSinceLastFriendlyFire"] = OptionalToJson(incident.secondsSinceLastFriendlyFire);
	out["killerKillsInMatch"] = incident.killerKillsInMatch;
	out["killerFriendlyFireInMatch"] = incident.killerFriendlyFireInMatch;
	out["explosiveWeapon"] = incident.explosiveWeapon;
	out["vehicleWeapon"] = incident.vehicleWeapon;
	out["map"] = incident.map;
	out["mode"] = incident.mode;
	return out;
}

FriendlyFireIncident IncidentFromJson(const json& in) {
	FriendlyFireIncident incident;
	incident.matchId = in["matchId"].asInt64();
	incident.killerId = in["killerId"].asInt64();
	incident.victimId = in["victimId"].asInt64();
	incident.weapon = in["weapon"].asString();
	incident.timestamp = RequiredTimeFromJson(in["timestamp"], "timestamp");
	incident.killerTeam = OptionalIntFromJson(in["killerTeam"]);
	incident.victimTeam = OptionalIntFromJson(in["victimTeam"]);
	incident.secondsSinceMatchStart = in["secondsSinceMatchStart"].asInt64();
	incident.secondsSinceLastFriendlyFire = OptionalInt64FromJson(in["secondsSinceLastFriendlyFire"]);
	incident.killerKillsInMatch = in["killerKillsInMatch"].asInt();
	incident.killerFriendlyFireInMatch = in["killerFriendlyFireInMatch"].asInt();
	incident.explosiveWeapon = in["explosiveWeapon"].asBool();
	incident.vehicleWeapon = in["vehicleWeapon"].asBool();
	incident.map = in["map"].asString();
	incident.mode = in["mode"].asString();
	return incident;
}

const json& RequireArray(const json& root, const char* key) {
	const json& value = root[key];
	if (!value.isNull() && !value.isArray())
		throw StoreError(fmt::format("snapshot field '{}' must be an array", key));
	return value;
}

} // namespace

std::optional<ServerRecord> MemoryStatStore::FindServer(const std::string& externalId) const {
	std::lock_guard<std::mutex> lock(mutex_);
	const auto it = servers_.find(externalId);
	if (it == servers_.end())
		return std::nullopt;
	return it->second;
}

/*
=============
MemoryStatStore::UpdateServer

Creates the server record on first observation.
=============
*/
ServerRecord MemoryStatStore::UpdateServer(const std::string& externalId, const Mutator<ServerRecord>& mutate) {
	if (externalId.empty())
		throw StoreError("server id must not be empty");

	std::lock_guard<std::mutex> lock(mutex_);
	ServerRecord updated;
	if (const auto it = servers_.find(externalId); it != servers_.end())
		updated = it->second;
	else
		updated.externalId = externalId;

	if (mutate)
		mutate(updated);
	updated.externalId = externalId;
	servers_[externalId] = updated;
	return updated;
}

MatchRecord MemoryStatStore::CreateMatch(MatchRecord match) {
	if (match.serverId.empty())
		throw StoreError("match requires a server id");

	std::lock_guard<std::mutex> lock(mutex_);
	match.id = nextMatchId_++;
	matches_[match.id] = match;
	return match;
}

std::optional<MatchRecord> MemoryStatStore::FindMatch(RecordId matchId) const {
	std::lock_guard<std::mutex> lock(mutex_);
	const auto it = matches_.find(matchId);
	if (it == matches_.end())
		return std::nullopt;
	return it->second;
}

MatchRecord MemoryStatStore::UpdateMatch(RecordId matchId, const Mutator<MatchRecord>& mutate) {
	std::lock_guard<std::mutex> lock(mutex_);
	const auto it = matches_.find(matchId);
	if (it == matches_.end())
		throw StoreError(fmt::format("match {} does not exist", matchId));

	MatchRecord updated = it->second;
	if (mutate)
		mutate(updated);
	updated.id = matchId;
	it->second = updated;
	return updated;
}

std::vector<MatchRecord> MemoryStatStore::FindOngoingMatches(const std::string& serverId) const {
	std::lock_guard<std::mutex> lock(mutex_);
	std::vector<MatchRecord> ongoing;
	for (const auto& [id, match] : matches_) {
		if (match.serverId == serverId && match.status == MatchStatus::Ongoing)
			ongoing.push_back(match);
	}

	std::stable_sort(ongoing.begin(), ongoing.end(), [](const MatchRecord& a, const MatchRecord& b) {
		return a.startTime < b.startTime;
	});
	return ongoing;
}

std::vector<MatchRecord> MemoryStatStore::ListMatches(const std::string& serverId) const {
	std::lock_guard<std::mutex> lock(mutex_);
	std::vector<MatchRecord> matches;
	for (const auto& [id, match] : matches_) {
		if (match.serverId == serverId)
			matches.push_back(match);
	}

	std::stable_sort(matches.begin(), matches.end(), [](const MatchRecord& a, const MatchRecord& b) {
		return a.startTime < b.startTime;
	});
	return matches;
}

std::optional<PlayerRecord> MemoryStatStore::FindPlayer(RecordId playerId) const {
	std::lock_guard<std::mutex> lock(mutex_);
	const auto it = players_.find(playerId);
	if (it == players_.end())
		return std::nullopt;
	return it->second;
}

std::optional<PlayerRecord> MemoryStatStore::FindPlayerByPlatformId(const std::string& platformId) const {
	std::lock_guard<std::mutex> lock(mutex_);
	const auto it = playersByPlatformId_.find(platformId);
	if (it == playersByPlatformId_.end())
		return std::nullopt;
	return players_.at(it->second);
}

/*
=============
MemoryStatStore::UpsertPlayer

Insert by platform id or refresh the display name of an existing player.
An empty name never overwrites a known one.
=============
*/
PlayerRecord MemoryStatStore::UpsertPlayer(const std::string& platformId, const std::string& name) {
	if (platformId.empty())
		throw StoreError("player requires a platform id");

	std::lock_guard<std::mutex> lock(mutex_);
	if (const auto it = playersByPlatformId_.find(platformId); it != playersByPlatformId_.end()) {
		PlayerRecord& existing = players_.at(it->second);
		if (!name.empty())
			existing.name = name;
		return existing;
	}

	PlayerRecord player{ nextPlayerId_++, platformId, name };
	players_[player.id] = player;
	playersByPlatformId_[platformId] = player.id;
	return player;
}

std::optional<MatchPlayerStat> MemoryStatStore::FindPlayerStat(RecordId matchId, RecordId playerId) const {
	std::lock_guard<std::mutex> lock(mutex_);
	const auto it = playerStats_.find({ matchId, playerId });
	if (it == playerStats_.end())
		return std::nullopt;
	return it->second;
}

/*
=============
MemoryStatStore::UpdatePlayerStat

Upsert the (match, player) row. The mutator works on a copy so a throwing
mutator leaves the stored row untouched.
=============
*/
MatchPlayerStat MemoryStatStore::UpdatePlayerStat(RecordId matchId, RecordId playerId, const Mutator<MatchPlayerStat>& mutate) {
	std::lock_guard<std::mutex> lock(mutex_);
	if (!matches_.contains(matchId))
		throw StoreError(fmt::format("match {} does not exist", matchId));
	if (!players_.contains(playerId))
		throw StoreError(fmt::format("player {} does not exist", playerId));

	MatchPlayerStat updated;
	if (const auto it = playerStats_.find({ matchId, playerId }); it != playerStats_.end())
		updated = it->second;

	if (mutate)
		mutate(updated);
	updated.matchId = matchId;
	updated.playerId = playerId;
	playerStats_[{ matchId, playerId }] = updated;
	return updated;
}

std::vector<MatchPlayerStat> MemoryStatStore::ListPlayerStats(RecordId matchId) const {
	std::lock_guard<std::mutex> lock(mutex_);
	std::vector<MatchPlayerStat> stats;
	for (auto it = playerStats_.lower_bound({ matchId, 0 }); it != playerStats_.end() && it->first.first == matchId; ++it)
		stats.push_back(it->second);
	return stats;
}

MatchWeaponStat MemoryStatStore::AddWeaponKills(RecordId matchId, RecordId playerId, const std::string& weapon, const std::string& weaponType, int kills) {
	if (weapon.empty())
		throw StoreError("weapon stat requires a weapon name");

	std::lock_guard<std::mutex> lock(mutex_);
	if (!matches_.contains(matchId))
		throw StoreError(fmt::format("match {} does not exist", matchId));

	MatchWeaponStat& stat = weaponStats_[{ matchId, playerId, weapon, weaponType }];
	stat.matchId = matchId;
	stat.playerId = playerId;
	stat.weapon = weapon;
	stat.weaponType = weaponType;
	stat.kills += kills;
	return stat;
}

std::vector<MatchWeaponStat> MemoryStatStore::ListWeaponStats(RecordId matchId) const {
	std::lock_guard<std::mutex> lock(mutex_);
	std::vector<MatchWeaponStat> stats;
	for (const auto& [key, stat] : weaponStats_) {
		if (stat.matchId == matchId)
			stats.push_back(stat);
	}
	return stats;
}

void MemoryStatStore::AppendFriendlyFire(const FriendlyFireIncident& incident) {
	std::lock_guard<std::mutex> lock(mutex_);
	friendlyFire_.push_back(incident);
}

std::vector<FriendlyFireIncident> MemoryStatStore::ListFriendlyFire(RecordId matchId) const {
	std::lock_guard<std::mutex> lock(mutex_);
	std::vector<FriendlyFireIncident> incidents;
	std::copy_if(friendlyFire_.begin(), friendlyFire_.end(), std::back_inserter(incidents), [matchId](const FriendlyFireIncident& incident) {
		return incident.matchId == matchId;
	});
	return incidents;
}

std::optional<PlayerTotals> MemoryStatStore::GetPlayerTotals(RecordId playerId) const {
	std::lock_guard<std::mutex> lock(mutex_);
	return TotalsLocked(playerId);
}

std::optional<PlayerTotals> MemoryStatStore::TotalsLocked(RecordId playerId) const {
	const auto player = players_.find(playerId);
	if (player == players_.end())
		return std::nullopt;

	PlayerTotals totals;
	totals.playerId = playerId;
	totals.name = player->second.name;
	for (const auto& [key, stat] : playerStats_) {
		if (stat.playerId != playerId)
			continue;
		totals.kills += stat.kills;
		totals.deaths += stat.deaths;
		totals.score += stat.score;
		totals.playSeconds += stat.totalPlayTime;
	}
	return totals;
}

std::vector<PlayerTotals> MemoryStatStore::RankPlayersByScorePerMinute() const {
	std::lock_guard<std::mutex> lock(mutex_);

	std::unordered_map<RecordId, PlayerTotals> byPlayer;
	for (const auto& [key, stat] : playerStats_) {
		PlayerTotals& totals = byPlayer[stat.playerId];
		totals.playerId = stat.playerId;
		totals.kills += stat.kills;
		totals.deaths += stat.deaths;
		totals.score += stat.score;
		totals.playSeconds += stat.totalPlayTime;
	}

	std::vector<PlayerTotals> ranked;
	for (auto& [playerId, totals] : byPlayer) {
		if (totals.playSeconds <= 0)
			continue;
		if (const auto player = players_.find(playerId); player != players_.end())
			totals.name = player->second.name;
		ranked.push_back(std::move(totals));
	}

	std::sort(ranked.begin(), ranked.end(), [](const PlayerTotals& a, const PlayerTotals& b) {
		const double aRate = a.ScorePerMinute();
		const double bRate = b.ScorePerMinute();
		if (aRate != bRate)
			return aRate > bRate;
		return a.playerId < b.playerId;
	});
	return ranked;
}

std::vector<WeaponTotals> MemoryStatStore::TopWeapons(RecordId playerId, size_t limit) const {
	std::lock_guard<std::mutex> lock(mutex_);

	std::map<std::string, int> kills;
	for (const auto& [key, stat] : weaponStats_) {
		if (stat.playerId == playerId)
			kills[stat.weapon] += stat.kills;
	}

	std::vector<WeaponTotals> weapons;
	for (const auto& [weapon, count] : kills)
		weapons.push_back(WeaponTotals{ weapon, count });

	std::stable_sort(weapons.begin(), weapons.end(), [](const WeaponTotals& a, const WeaponTotals& b) {
		return a.kills > b.kills;
	});
	if (weapons.size() > limit)
		weapons.resize(limit);
	return weapons;
}

/*
=============
MemoryStatStore::ToJson

Serialise every record into one JSON document.
=============
*/
Json::Value MemoryStatStore::ToJson() const {
	std::lock_guard<std::mutex> lock(mutex_);

	json root(Json::objectValue);
	root["version"] = 1;
	root["nextMatchId"] = static_cast<Json::Int64>(nextMatchId_);
	root["nextPlayerId"] = static_cast<Json::Int64>(nextPlayerId_);

	json& servers = root["servers"] = json(Json::arrayValue);
	for (const auto& [id, server] : servers_)
		servers.append(ServerToJson(server));

	json& matches = root["matches"] = json(Json::arrayValue);
	for (const auto& [id, match] : matches_)
		matches.append(MatchToJson(match));

	json& players = root["players"] = json(Json::arrayValue);
	for (const auto& [id, player] : players_) {
		json entry(Json::objectValue);
		entry["id"] = static_cast<Json::Int64>(player.id);
		entry["platformId"] = player.platformId;
		entry["name"] = player.name;
		players.append(entry);
	}

	json& stats = root["playerStats"] = json(Json::arrayValue);
	for (const auto& [key, stat] : playerStats_)
		stats.append(StatToJson(stat));

	json& weapons = root["weaponStats"] = json(Json::arrayValue);
	for (const auto& [key, stat] : weaponStats_) {
		json entry(Json::objectValue);
		entry["matchId"] = static_cast<Json::Int64>(stat.matchId);
		entry["playerId"] = static_cast<Json::Int64>(stat.playerId);
		entry["weapon"] = stat.weapon;
		entry["weaponType"] = stat.weaponType;
		entry["kills"] = stat.kills;
		weapons.append(entry);
	}

	json& incidents = root["friendlyFire"] = json(Json::arrayValue);
	for (const FriendlyFireIncident& incident : friendlyFire_)
		incidents.append(IncidentToJson(incident));

	return root;
}

/*
=============
MemoryStatStore::LoadJson

Parse into fresh containers first so a malformed snapshot leaves the current
contents intact.
=============
*/
void MemoryStatStore::LoadJson(const Json::Value& root) {
	if (!root.isObject())
		throw StoreError("snapshot root must be an object");

	std::map<std::string, ServerRecord> servers;
	std::map<RecordId, MatchRecord> matches;
	std::map<RecordId, PlayerRecord> players;
	std::unordered_map<std::string, RecordId> playersByPlatformId;
	std::map<StatKey, MatchPlayerStat> playerStats;
	std::map<WeaponKey, MatchWeaponStat> weaponStats;
	std::vector<FriendlyFireIncident> friendlyFire;
	RecordId nextMatchId = 1;
	RecordId nextPlayerId = 1;

	try {
		for (const json& entry : RequireArray(root, "servers")) {
			ServerRecord server = ServerFromJson(entry);
			servers[server.externalId] = std::move(server);
		}

		for (const json& entry : RequireArray(root, "matches")) {
			MatchRecord match = MatchFromJson(entry);
			nextMatchId = std::max(nextMatchId, match.id + 1);
			matches[match.id] = std::move(match);
		}

		for (const json& entry : RequireArray(root, "players")) {
			PlayerRecord player{ entry["id"].asInt64(), entry["platformId"].asString(), entry["name"].asString() };
			if (player.platformId.empty())
				throw StoreError(fmt::format("player {} has no platform id", player.id));
			nextPlayerId = std::max(nextPlayerId, player.id + 1);
			playersByPlatformId[player.platformId] = player.id;
			players[player.id] = std::move(player);
		}

		for (const json& entry : RequireArray(root, "playerStats")) {
			MatchPlayerStat stat = StatFromJson(entry);
			playerStats[{ stat.matchId, stat.playerId }] = stat;
		}

		for (const json& entry : RequireArray(root, "weaponStats")) {
			MatchWeaponStat stat;
			stat.matchId = entry["matchId"].asInt64();
			stat.playerId = entry["playerId"].asInt64();
			stat.weapon = entry["weapon"].asString();
			stat.weaponType = entry["weaponType"].asString();
			stat.kills = entry["kills"].asInt();
			weaponStats[{ stat.matchId, stat.playerId, stat.weapon, stat.weaponType }] = stat;
		}

		for (const json& entry : RequireArray(root, "friendlyFire"))
			friendlyFire.push_back(IncidentFromJson(entry));

		nextMatchId = std::max<RecordId>(nextMatchId, root.get("nextMatchId", 1).asInt64());
		nextPlayerId = std::max<RecordId>(nextPlayerId, root.get("nextPlayerId", 1).asInt64());
	}
	catch (const Json::Exception& e) {
		throw StoreError(fmt::format("malformed snapshot: {}", e.what()));
	}

	std::lock_guard<std::mutex> lock(mutex_);
	servers_ = std::move(servers);
	matches_ = std::move(matches);
	players_ = std::move(players);
	playersByPlatformId_ = std::move(playersByPlatformId);
	playerStats_ = std::move(playerStats);
	weaponStats_ = std::move(weaponStats);
	friendlyFire_ = std::move(friendlyFire);
	nextMatchId_ = nextMatchId;
	nextPlayerId_ = nextPlayerId;
}

void MemoryStatStore::SaveSnapshot(const std::filesystem::path& path) const {
	const json root = ToJson();
	try {
		WriteFileAtomically(path, [&](std::ofstream& file) {
			Json::StreamWriterBuilder writer;
			writer["indentation"] = "    ";
			file << Json::writeString(writer, root);
		});
	}
	catch (const std::exception& e) {
		throw StoreError(fmt::format("failed to write snapshot {}: {}", path.string(), e.what()));
	}

	Logf(LogLevel::Debug, "store snapshot written to {}", path.string());
}

void MemoryStatStore::LoadSnapshot(const std::filesystem::path& path) {
	std::string contents;
	try {
		contents = ReadFileContents(path);
	}
	catch (const std::system_error& e) {
		throw StoreError(fmt::format("failed to read snapshot {}: {}", path.string(), e.what()));
	}

	Json::CharReaderBuilder builder;
	std::string errs;
	json root;
	std::istringstream stream(contents);
	if (!Json::parseFromStream(builder, stream, &root, &errs))
		throw StoreError(fmt::format("parse error in {}: {}", path.string(), errs));

	LoadJson(root);
	Logf(LogLevel::Info, "store snapshot loaded from {}", path.string());
}

} // namespace sandstats::tracker
