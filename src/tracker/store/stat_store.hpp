/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

stat_store.hpp storage interface for match statistics.*/

#pragma once

#include "stat_records.hpp"

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sandstats::tracker {

// Raised for failed store mutations or lookups; callers may retry once.
class StoreError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/*
=============
StatStore

Shared record store for every server worker. Mutations are read-modify-write
upserts keyed on each record's unique key; the mutator runs atomically with
respect to other writers of the same key.
=============
*/
class StatStore {
public:
	template <typename T>
	using Mutator = std::function<void(T&)>;

	virtual ~StatStore() = default;

	virtual std::optional<ServerRecord> FindServer(const std::string& externalId) const = 0;
	virtual ServerRecord UpdateServer(const std::string& externalId, const Mutator<ServerRecord>& mutate) = 0;

	// Assigns the id of the returned record.
	virtual MatchRecord CreateMatch(MatchRecord match) = 0;
	virtual std::optional<MatchRecord> FindMatch(RecordId matchId) const = 0;
	virtual MatchRecord UpdateMatch(RecordId matchId, const Mutator<MatchRecord>& mutate) = 0;
	// Oldest first.
	virtual std::vector<MatchRecord> FindOngoingMatches(const std::string& serverId) const = 0;
	// Every match of the server regardless of status, oldest first.
	virtual std::vector<MatchRecord> ListMatches(const std::string& serverId) const = 0;

	virtual std::optional<PlayerRecord> FindPlayer(RecordId playerId) const = 0;
	virtual std::optional<PlayerRecord> FindPlayerByPlatformId(const std::string& platformId) const = 0;
	virtual PlayerRecord UpsertPlayer(const std::string& platformId, const std::string& name) = 0;

	virtual std::optional<MatchPlayerStat> FindPlayerStat(RecordId matchId, RecordId playerId) const = 0;
	virtual MatchPlayerStat UpdatePlayerStat(RecordId matchId, RecordId playerId, const Mutator<MatchPlayerStat>& mutate) = 0;
	virtual std::vector<MatchPlayerStat> ListPlayerStats(RecordId matchId) const = 0;

	virtual MatchWeaponStat AddWeaponKills(RecordId matchId, RecordId playerId, const std::string& weapon, const std::string& weaponType, int kills) = 0;
	virtual std::vector<MatchWeaponStat> ListWeaponStats(RecordId matchId) const = 0;

	virtual void AppendFriendlyFire(const FriendlyFireIncident& incident) = 0;
	virtual std::vector<FriendlyFireIncident> ListFriendlyFire(RecordId matchId) const = 0;

	virtual std::optional<PlayerTotals> GetPlayerTotals(RecordId playerId) const = 0;
	// Every player with recorded play time, best score per minute first.
	virtual std::vector<PlayerTotals> RankPlayersByScorePerMinute() const = 0;
	virtual std::vector<WeaponTotals> TopWeapons(RecordId playerId, size_t limit) const = 0;
};

} // namespace sandstats::tracker
