/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

memory_stat_store.hpp declarations.*/

#pragma once

#include "stat_store.hpp"

#include <json/json.h>

#include <filesystem>
#include <map>
#include <mutex>
#include <tuple>
#include <unordered_map>

namespace sandstats::tracker {

/*
=============
MemoryStatStore

Process-local StatStore guarded by one mutex. State can be saved to and
restored from a JSON snapshot so cursors and stats survive restarts.
=============
*/
class MemoryStatStore : public StatStore {
public:
	MemoryStatStore() = default;

	std::optional<ServerRecord> FindServer(const std::string& externalId) const override;
	ServerRecord UpdateServer(const std::string& externalId, const Mutator<ServerRecord>& mutate) override;

	MatchRecord CreateMatch(MatchRecord match) override;
	std::optional<MatchRecord> FindMatch(RecordId matchId) const override;
	MatchRecord UpdateMatch(RecordId matchId, const Mutator<MatchRecord>& mutate) override;
	std::vector<MatchRecord> FindOngoingMatches(const std::string& serverId) const override;
	std::vector<MatchRecord> ListMatches(const std::string& serverId) const override;

	std::optional<PlayerRecord> FindPlayer(RecordId playerId) const override;
	std::optional<PlayerRecord> FindPlayerByPlatformId(const std::string& platformId) const override;
	PlayerRecord UpsertPlayer(const std::string& platformId, const std::string& name) override;

	std::optional<MatchPlayerStat> FindPlayerStat(RecordId matchId, RecordId playerId) const override;
	MatchPlayerStat UpdatePlayerStat(RecordId matchId, RecordId playerId, const Mutator<MatchPlayerStat>& mutate) override;
	std::vector<MatchPlayerStat> ListPlayerStats(RecordId matchId) const override;

	MatchWeaponStat AddWeaponKills(RecordId matchId, RecordId playerId, const std::string& weapon, const std::string& weaponType, int kills) override;
	std::vector<MatchWeaponStat> ListWeaponStats(RecordId matchId) const override;

	void AppendFriendlyFire(const FriendlyFireIncident& incident) override;
	std::vector<FriendlyFireIncident> ListFriendlyFire(RecordId matchId) const override;

	std::optional<PlayerTotals> GetPlayerTotals(RecordId playerId) const override;
	std::vector<PlayerTotals> RankPlayersByScorePerMinute() const override;
	std::vector<WeaponTotals> TopWeapons(RecordId playerId, size_t limit) const override;

	Json::Value ToJson() const;
	// Replaces the current contents. Throws StoreError on malformed input.
	void LoadJson(const Json::Value& root);

	void SaveSnapshot(const std::filesystem::path& path) const;
	void LoadSnapshot(const std::filesystem::path& path);

private:
	using StatKey = std::pair<RecordId, RecordId>;
	using WeaponKey = std::tuple<RecordId, RecordId, std::string, std::string>;

	std::optional<PlayerTotals> TotalsLocked(RecordId playerId) const;

	mutable std::mutex mutex_;
	std::map<std::string, ServerRecord> servers_;
	std::map<RecordId, MatchRecord> matches_;
	std::map<RecordId, PlayerRecord> players_;
	std::unordered_map<std::string, RecordId> playersByPlatformId_;
	std::map<StatKey, MatchPlayerStat> playerStats_;
	std::map<WeaponKey, MatchWeaponStat> weaponStats_;
	std::vector<FriendlyFireIncident> friendlyFire_;
	RecordId nextMatchId_ = 1;
	RecordId nextPlayerId_ = 1;
};

} // namespace sandstats::tracker
