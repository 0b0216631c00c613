/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

test_log_pipeline.cpp implementation.*/

#include "test_support.hpp"

#include "tracker/match/log_pipeline.hpp"
#include "tracker/store/memory_stat_store.hpp"

#include <gtest/gtest.h>

using namespace sandstats;
using namespace sandstats::tracker;
using namespace sandstats::tracker::test_support;

namespace {

constexpr const char* kServer = "pipeline-server";
constexpr const char* kAlphaId = "76561198000000001";

/*
=============
FlakyStatStore

Forwards to a MemoryStatStore and fails the next `failures` player stat
updates with a StoreError before touching anything.
=============
*/
class FlakyStatStore : public StatStore {
public:
	std::optional<ServerRecord> FindServer(const std::string& externalId) const override { return inner.FindServer(externalId); }
	ServerRecord UpdateServer(const std::string& externalId, const Mutator<ServerRecord>& mutate) override {
		return inner.UpdateServer(externalId, mutate);
	}

	MatchRecord CreateMatch(MatchRecord match) override { return inner.CreateMatch(std::move(match)); }
	std::optional<MatchRecord> FindMatch(RecordId matchId) const override { return inner.FindMatch(matchId); }
	MatchRecord UpdateMatch(RecordId matchId, const Mutator<MatchRecord>& mutate) override { return inner.UpdateMatch(matchId, mutate); }
	std::vector<MatchRecord> FindOngoingMatches(const std::string& serverId) const override { return inner.FindOngoingMatches(serverId); }
	std::vector<MatchRecord> ListMatches(const std::string& serverId) const override { return inner.ListMatches(serverId); }

	std::optional<PlayerRecord> FindPlayer(RecordId playerId) const override { return inner.FindPlayer(playerId); }
	std::optional<PlayerRecord> FindPlayerByPlatformId(const std::string& platformId) const override {
		return inner.FindPlayerByPlatformId(platformId);
	}
	PlayerRecord UpsertPlayer(const std::string& platformId, const std::string& name) override { return inner.UpsertPlayer(platformId, name); }

	std::optional<MatchPlayerStat> FindPlayerStat(RecordId matchId, RecordId playerId) const override {
		return inner.FindPlayerStat(matchId, playerId);
	}
	MatchPlayerStat UpdatePlayerStat(RecordId matchId, RecordId playerId, const Mutator<MatchPlayerStat>& mutate) override {
		if (passes > 0)
			--passes;
		else if (failures > 0) {
			--failures;
			throw StoreError("simulated write failure");
		}
		return inner.UpdatePlayerStat(matchId, playerId, mutate);
	}
	std::vector<MatchPlayerStat> ListPlayerStats(RecordId matchId) const override { return inner.ListPlayerStats(matchId); }

	MatchWeaponStat AddWeaponKills(RecordId matchId, RecordId playerId, const std::string& weapon, const std::string& weaponType, int kills) override {
		return inner.AddWeaponKills(matchId, playerId, weapon, weaponType, kills);
	}
	std::vector<MatchWeaponStat> ListWeaponStats(RecordId matchId) const override { return inner.ListWeaponStats(matchId); }

	void AppendFriendlyFire(const FriendlyFireIncident& incident) override { inner.AppendFriendlyFire(incident); }
	std::vector<FriendlyFireIncident> ListFriendlyFire(RecordId matchId) const override { return inner.ListFriendlyFire(matchId); }

	std::optional<PlayerTotals> GetPlayerTotals(RecordId playerId) const override { return inner.GetPlayerTotals(playerId); }
	std::vector<PlayerTotals> RankPlayersByScorePerMinute() const override { return inner.RankPlayersByScorePerMinute(); }
	std::vector<WeaponTotals> TopWeapons(RecordId playerId, size_t limit) const override { return inner.TopWeapons(playerId, limit); }

	MemoryStatStore inner;
	// Player stat writes that succeed before the failures start.
	int passes = 0;
	int failures = 0;
};

class LogPipelineTest : public ::testing::Test {
protected:
	struct Entry {
		std::string line;
		LineLocation location;
	};

	// Lays the lines out as one log file would, with end offsets.
	std::vector<Entry> Layout(const std::vector<std::string>& lines) {
		std::vector<Entry> entries;
		int64_t offset = 0;
		for (const std::string& line : lines) {
			offset += static_cast<int64_t>(line.size()) + 1;
			entries.push_back(Entry{ line, LineLocation{ 42, offset } });
		}
		return entries;
	}

	std::vector<LineOutcome> Run(const std::vector<Entry>& entries, ServerSession& session) {
		std::vector<LineOutcome> outcomes;
		for (const Entry& entry : entries)
			outcomes.push_back(pipeline_.ProcessLine(session, entry.line, HandlerContext{}, entry.location));
		return outcomes;
	}

	MatchPlayerStat AlphaStat() {
		const auto matches = store_.FindOngoingMatches(kServer);
		const auto player = store_.FindPlayerByPlatformId(kAlphaId);
		EXPECT_EQ(matches.size(), 1u);
		EXPECT_TRUE(player.has_value());
		if (matches.empty() || !player)
			return {};
		return store_.FindPlayerStat(matches.back().id, player->id).value_or(MatchPlayerStat{});
	}

	FlakyStatStore store_;
	LineParser parser_;
	EventHandlers handlers_{ store_ };
	LogPipeline pipeline_{ parser_, handlers_, store_ };
};

TEST_F(LogPipelineTest, ReprocessingTheSameRangeChangesNothing) {
	const auto entries = Layout({
		Line(0, MapLoadBody("Farmhouse")),
		Line(1, "LogNet: Login request: ?Name=Alpha userId: SteamNWI:76561198000000001 platform: SteamNWI"),
		Line(2, "LogEOSAntiCheat: Display: ServerRegisterClient: Client: (76561198000000001) Result: (EOS_Success)"),
		Line(3, "LogNet: Join succeeded: Alpha"),
		Line(4, "LogTemp: nothing to see here"),
		Line(10, KillBody("Alpha[76561198000000001, team 0]", "Charlie[76561198000000003, team 1]")),
		Line(20, "LogGameplayEvents: Display: Round 1 Over: Team 0 won (win reason: Elimination)"),
	});

	ServerSession first{ kServer };
	const auto outcomes = Run(entries, first);
	EXPECT_EQ(outcomes[0], LineOutcome::Applied);
	EXPECT_EQ(outcomes[4], LineOutcome::Ignored);
	EXPECT_EQ(outcomes[5], LineOutcome::Applied);

	const MatchPlayerStat before = AlphaStat();
	EXPECT_EQ(before.kills, 1);
	EXPECT_EQ(before.sessionCount, 1);
	EXPECT_EQ(store_.FindOngoingMatches(kServer).back().round, 1);

	// A restarted worker replays the range with an empty session.
	ServerSession second{ kServer };
	for (const LineOutcome outcome : Run(entries, second))
		EXPECT_NE(outcome, LineOutcome::Applied);

	const MatchPlayerStat after = AlphaStat();
	EXPECT_EQ(after.kills, 1);
	EXPECT_EQ(after.sessionCount, 1);
	EXPECT_EQ(store_.ListMatches(kServer).size(), 1u);
	EXPECT_EQ(store_.FindOngoingMatches(kServer).back().round, 1);
	EXPECT_EQ(store_.ListWeaponStats(store_.FindOngoingMatches(kServer).back().id).front().kills, 1);

	// Skipped lines still rebuilt the name lookup for later joins.
	EXPECT_EQ(second.platformIdByName["Alpha"], kAlphaId);
}

TEST_F(LogPipelineTest, WatermarkFollowsAppliedLines) {
	const auto entries = Layout({ Line(0, MapLoadBody("Farmhouse")), Line(5, "LogGameplayEvents: Display: Game over") });
	ServerSession session{ kServer };
	Run(entries, session);

	const auto server = store_.FindServer(kServer);
	ASSERT_TRUE(server.has_value());
	EXPECT_EQ(server->appliedGeneration.value_or(0), 42);
	EXPECT_EQ(server->appliedOffset, entries.back().location.endOffset);

	// Same offsets under a new generation are a different file.
	const LineLocation rotated{ 43, entries.front().location.endOffset };
	EXPECT_EQ(pipeline_.ProcessLine(session, Line(100, MapLoadBody("Crossing")), HandlerContext{}, rotated), LineOutcome::Applied);
	EXPECT_EQ(store_.ListMatches(kServer).size(), 2u);
}

TEST_F(LogPipelineTest, StoreErrorIsRetriedOnce) {
	ServerSession session{ kServer };
	pipeline_.ProcessLine(session, Line(0, MapLoadBody("Farmhouse")), HandlerContext{});

	store_.failures = 1;
	const LineOutcome outcome = pipeline_.ProcessLine(session,
		Line(10, KillBody("Alpha[76561198000000001, team 0]", "Charlie[76561198000000003, team 1]")), HandlerContext{});

	EXPECT_EQ(outcome, LineOutcome::Applied);
	EXPECT_EQ(AlphaStat().kills, 1);
}

TEST_F(LogPipelineTest, FailureMidEventDoesNotRepeatEarlierWrites) {
	ServerSession session{ kServer };
	pipeline_.ProcessLine(session, Line(0, MapLoadBody("Farmhouse")), HandlerContext{});

	// The killer's row lands, then the victim's death fails once.
	store_.passes = 1;
	store_.failures = 1;
	const LineOutcome outcome = pipeline_.ProcessLine(session,
		Line(10, KillBody("Alpha[76561198000000001, team 0]", "Charlie[76561198000000003, team 1]")), HandlerContext{});
	EXPECT_EQ(outcome, LineOutcome::Applied);

	const MatchRecord match = store_.FindOngoingMatches(kServer).back();
	EXPECT_EQ(AlphaStat().kills, 1);
	const auto weapons = store_.ListWeaponStats(match.id);
	ASSERT_EQ(weapons.size(), 1u);
	EXPECT_EQ(weapons.front().kills, 1);

	const auto charlie = store_.FindPlayerByPlatformId("76561198000000003");
	ASSERT_TRUE(charlie.has_value());
	EXPECT_EQ(store_.FindPlayerStat(match.id, charlie->id).value_or(MatchPlayerStat{}).deaths, 1);
}

TEST_F(LogPipelineTest, PersistentFailureMidEventKeepsWhatLanded) {
	ServerSession session{ kServer };
	pipeline_.ProcessLine(session, Line(0, MapLoadBody("Farmhouse")), HandlerContext{});

	store_.passes = 1;
	store_.failures = 2;
	const LineOutcome outcome = pipeline_.ProcessLine(session,
		Line(10, KillBody("Alpha[76561198000000001, team 0]", "Charlie[76561198000000003, team 1]")), HandlerContext{});
	EXPECT_EQ(outcome, LineOutcome::Dropped);

	const MatchRecord match = store_.FindOngoingMatches(kServer).back();
	EXPECT_EQ(AlphaStat().kills, 1);
	EXPECT_EQ(store_.ListWeaponStats(match.id).front().kills, 1);
	const auto charlie = store_.FindPlayerByPlatformId("76561198000000003");
	ASSERT_TRUE(charlie.has_value());
	EXPECT_EQ(store_.FindPlayerStat(match.id, charlie->id).value_or(MatchPlayerStat{}).deaths, 0);
}

TEST_F(LogPipelineTest, PersistentStoreErrorDropsOnlyThatEvent) {
	ServerSession session{ kServer };
	const auto entries = Layout({
		Line(0, MapLoadBody("Farmhouse")),
		Line(10, KillBody("Alpha[76561198000000001, team 0]", "Charlie[76561198000000003, team 1]")),
		Line(20, KillBody("Alpha[76561198000000001, team 0]", "Charlie[76561198000000003, team 1]")),
	});

	EXPECT_EQ(pipeline_.ProcessLine(session, entries[0].line, HandlerContext{}, entries[0].location), LineOutcome::Applied);

	store_.failures = 2;
	EXPECT_EQ(pipeline_.ProcessLine(session, entries[1].line, HandlerContext{}, entries[1].location), LineOutcome::Dropped);
	EXPECT_EQ(store_.FindServer(kServer)->appliedOffset, entries[1].location.endOffset);

	EXPECT_EQ(pipeline_.ProcessLine(session, entries[2].line, HandlerContext{}, entries[2].location), LineOutcome::Applied);
	EXPECT_EQ(AlphaStat().kills, 1);
}

} // namespace
