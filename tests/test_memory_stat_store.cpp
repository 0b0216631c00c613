/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

test_memory_stat_store.cpp implementation.*/

#include "test_support.hpp"

#include "tracker/store/memory_stat_store.hpp"

#include <gtest/gtest.h>

using namespace sandstats;
using namespace sandstats::tracker;
using namespace sandstats::tracker::test_support;

namespace {

MatchRecord NewMatch(const std::string& serverId, int startSeconds) {
	MatchRecord match;
	match.serverId = serverId;
	match.map = "Farmhouse";
	match.scenario = "Scenario_Farmhouse_Checkpoint_Security";
	match.mode = "Checkpoint";
	match.maxPlayers = 28;
	match.startTime = At(startSeconds);
	return match;
}

TEST(MemoryStatStoreTest, MatchesAreNumberedAndListedOldestFirst) {
	MemoryStatStore store;
	const MatchRecord later = store.CreateMatch(NewMatch("alpha", 600));
	const MatchRecord earlier = store.CreateMatch(NewMatch("alpha", 0));
	store.CreateMatch(NewMatch("bravo", 300));

	EXPECT_NE(later.id, earlier.id);

	const auto ongoing = store.FindOngoingMatches("alpha");
	ASSERT_EQ(ongoing.size(), 2u);
	EXPECT_EQ(ongoing[0].id, earlier.id);
	EXPECT_EQ(ongoing[1].id, later.id);

	store.UpdateMatch(earlier.id, [](MatchRecord& match) { match.status = MatchStatus::Crashed; });
	EXPECT_EQ(store.FindOngoingMatches("alpha").size(), 1u);
	EXPECT_EQ(store.ListMatches("alpha").size(), 2u);
	EXPECT_EQ(store.ListMatches("bravo").size(), 1u);
	EXPECT_TRUE(store.ListMatches("charlie").empty());
}

TEST(MemoryStatStoreTest, MissingKeysRaiseStoreError) {
	MemoryStatStore store;
	const RecordId player = store.UpsertPlayer("76561198000000001", "Alpha").id;
	const RecordId match = store.CreateMatch(NewMatch("alpha", 0)).id;

	EXPECT_THROW(store.UpdateMatch(match + 100, nullptr), StoreError);
	EXPECT_THROW(store.UpdatePlayerStat(match + 100, player, nullptr), StoreError);
	EXPECT_THROW(store.UpdatePlayerStat(match, player + 100, nullptr), StoreError);
	EXPECT_THROW(store.UpsertPlayer("", "Nobody"), StoreError);
	EXPECT_FALSE(store.FindMatch(match + 100).has_value());
}

TEST(MemoryStatStoreTest, UpsertPlayerKeepsIdAndRefreshesName) {
	MemoryStatStore store;
	const PlayerRecord first = store.UpsertPlayer("76561198000000001", "Alpha");
	const PlayerRecord renamed = store.UpsertPlayer("76561198000000001", "AlphaPrime");
	const PlayerRecord unnamed = store.UpsertPlayer("76561198000000001", "");

	EXPECT_EQ(first.id, renamed.id);
	EXPECT_EQ(renamed.name, "AlphaPrime");
	EXPECT_EQ(unnamed.name, "AlphaPrime");
	EXPECT_EQ(store.FindPlayer(first.id)->name, "AlphaPrime");
}

TEST(MemoryStatStoreTest, ThrowingMutatorLeavesRowUntouched) {
	MemoryStatStore store;
	const RecordId player = store.UpsertPlayer("76561198000000001", "Alpha").id;
	const RecordId match = store.CreateMatch(NewMatch("alpha", 0)).id;
	store.UpdatePlayerStat(match, player, [](MatchPlayerStat& stat) { stat.kills = 3; });

	EXPECT_THROW(store.UpdatePlayerStat(match, player, [](MatchPlayerStat& stat) {
		stat.kills = 99;
		throw StoreError("abort");
	}), StoreError);

	EXPECT_EQ(store.FindPlayerStat(match, player)->kills, 3);
}

TEST(MemoryStatStoreTest, RankingUsesScorePerMinuteAcrossMatches) {
	MemoryStatStore store;
	const RecordId alpha = store.UpsertPlayer("76561198000000001", "Alpha").id;
	const RecordId bravo = store.UpsertPlayer("76561198000000002", "Bravo").id;
	const RecordId idle = store.UpsertPlayer("76561198000000003", "Idle").id;
	const RecordId first = store.CreateMatch(NewMatch("alpha", 0)).id;
	const RecordId second = store.CreateMatch(NewMatch("alpha", 3600)).id;

	// Alpha: 600 points over 20 minutes. Bravo: 400 points over 5 minutes.
	store.UpdatePlayerStat(first, alpha, [](MatchPlayerStat& stat) { stat.score = 300; stat.totalPlayTime = 600; stat.kills = 4; });
	store.UpdatePlayerStat(second, alpha, [](MatchPlayerStat& stat) { stat.score = 300; stat.totalPlayTime = 600; stat.kills = 2; });
	store.UpdatePlayerStat(first, bravo, [](MatchPlayerStat& stat) { stat.score = 400; stat.totalPlayTime = 300; });
	store.UpdatePlayerStat(first, idle, [](MatchPlayerStat& stat) { stat.score = 50; });

	const auto ranked = store.RankPlayersByScorePerMinute();
	ASSERT_EQ(ranked.size(), 2u);
	EXPECT_EQ(ranked[0].name, "Bravo");
	EXPECT_DOUBLE_EQ(ranked[0].ScorePerMinute(), 80.0);
	EXPECT_EQ(ranked[1].name, "Alpha");
	EXPECT_DOUBLE_EQ(ranked[1].ScorePerMinute(), 30.0);

	const auto totals = store.GetPlayerTotals(alpha);
	ASSERT_TRUE(totals.has_value());
	EXPECT_EQ(totals->kills, 6);
	EXPECT_EQ(totals->score, 600);
	EXPECT_EQ(totals->playSeconds, 1200);
	EXPECT_FALSE(store.GetPlayerTotals(idle + 100).has_value());
}

TEST(MemoryStatStoreTest, TopWeaponsSumsAcrossMatches) {
	MemoryStatStore store;
	const RecordId alpha = store.UpsertPlayer("76561198000000001", "Alpha").id;
	const RecordId first = store.CreateMatch(NewMatch("alpha", 0)).id;
	const RecordId second = store.CreateMatch(NewMatch("alpha", 3600)).id;

	store.AddWeaponKills(first, alpha, "M4A1", "Firearm", 2);
	store.AddWeaponKills(second, alpha, "M4A1", "Firearm", 3);
	store.AddWeaponKills(first, alpha, "RPG7", "Projectile", 4);
	store.AddWeaponKills(first, alpha, "Knife", "Melee", 1);

	const auto top = store.TopWeapons(alpha, 2);
	ASSERT_EQ(top.size(), 2u);
	EXPECT_EQ(top[0].weapon, "M4A1");
	EXPECT_EQ(top[0].kills, 5);
	EXPECT_EQ(top[1].weapon, "RPG7");
	EXPECT_EQ(top[1].kills, 4);

	const auto perMatch = store.ListWeaponStats(first);
	EXPECT_EQ(perMatch.size(), 3u);
}

TEST(MemoryStatStoreTest, SnapshotRestoresEveryRecord) {
	TempDir dir;
	const auto path = dir / "snapshot.json";

	MemoryStatStore store;
	store.UpdateServer("alpha", [](ServerRecord& server) {
		server.logPath = "/srv/logs/alpha.log";
		server.cursorGeneration = 1759611600000;
		server.cursorOffset = 4096;
		server.appliedGeneration = 1759611600000;
		server.appliedOffset = 4000;
	});
	const RecordId player = store.UpsertPlayer("76561198000000001", "Alpha").id;
	const MatchRecord match = store.CreateMatch(NewMatch("alpha", 0));
	store.UpdateMatch(match.id, [](MatchRecord& record) {
		record.round = 2;
		record.winnerTeam = 1;
		record.status = MatchStatus::Finished;
		record.endTime = At(1200);
	});
	store.UpdatePlayerStat(match.id, player, [](MatchPlayerStat& stat) {
		stat.kills = 7;
		stat.team = 1;
		stat.firstJoinedAt = At(10);
		stat.status = PlayerMatchStatus::Finished;
	});
	store.AddWeaponKills(match.id, player, "M4A1", "Firearm", 7);
	FriendlyFireIncident incident;
	incident.matchId = match.id;
	incident.killerId = player;
	incident.victimId = player;
	incident.weapon = "RPG7";
	incident.timestamp = At(90);
	incident.explosiveWeapon = true;
	store.AppendFriendlyFire(incident);

	store.SaveSnapshot(path);

	MemoryStatStore restored;
	restored.LoadSnapshot(path);

	const auto server = restored.FindServer("alpha");
	ASSERT_TRUE(server.has_value());
	EXPECT_EQ(server->cursorOffset, 4096);
	EXPECT_EQ(server->appliedOffset, 4000);
	EXPECT_EQ(server->cursorGeneration.value_or(0), 1759611600000);

	const auto loadedMatch = restored.FindMatch(match.id);
	ASSERT_TRUE(loadedMatch.has_value());
	EXPECT_EQ(loadedMatch->status, MatchStatus::Finished);
	EXPECT_EQ(loadedMatch->round, 2);
	EXPECT_EQ(loadedMatch->winnerTeam.value_or(-1), 1);
	EXPECT_TRUE(loadedMatch->endTime == At(1200));
	EXPECT_TRUE(loadedMatch->startTime == At(0));

	const auto stat = restored.FindPlayerStat(match.id, player);
	ASSERT_TRUE(stat.has_value());
	EXPECT_EQ(stat->kills, 7);
	EXPECT_EQ(stat->team.value_or(-1), 1);
	EXPECT_EQ(stat->status, PlayerMatchStatus::Finished);
	EXPECT_TRUE(stat->firstJoinedAt == At(10));

	EXPECT_EQ(restored.TopWeapons(player, 3).front().kills, 7);
	ASSERT_EQ(restored.ListFriendlyFire(match.id).size(), 1u);
	EXPECT_TRUE(restored.ListFriendlyFire(match.id)[0].explosiveWeapon);

	// Ids continue after the restored ones.
	EXPECT_GT(restored.CreateMatch(NewMatch("alpha", 2000)).id, match.id);
	EXPECT_GT(restored.UpsertPlayer("76561198000000002", "Bravo").id, player);
}

TEST(MemoryStatStoreTest, BadSnapshotKeepsCurrentContents) {
	TempDir dir;
	WriteText(dir / "broken.json", "{ \"servers\": [ ");

	MemoryStatStore store;
	store.UpsertPlayer("76561198000000001", "Alpha");

	EXPECT_THROW(store.LoadSnapshot(dir / "broken.json"), StoreError);
	EXPECT_THROW(store.LoadSnapshot(dir / "missing.json"), StoreError);
	EXPECT_TRUE(store.FindPlayerByPlatformId("76561198000000001").has_value());
}

} // namespace
