/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

test_server_worker.cpp implementation.*/

#include "test_support.hpp"

#include "tracker/watcher/log_file.hpp"
#include "tracker/watcher/server_worker.hpp"
#include "tracker/store/memory_stat_store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

using namespace sandstats;
using namespace sandstats::tracker;
using namespace sandstats::tracker::test_support;
using namespace std::chrono_literals;

namespace {

constexpr const char* kServer = "worker-server";

class ServerWorkerTest : public ::testing::Test {
protected:
	ServerWorkerConfig Config() const {
		ServerWorkerConfig config;
		config.serverId = kServer;
		config.logPath = dir_ / "Insurgency.log";
		config.coalesceWindow = 20ms;
		config.inactivityTimeout = 300ms;
		return config;
	}

	std::string KillLine(int at) const {
		return Line(at, KillBody("Alpha[76561198000000001, team 0]", "Charlie[76561198000000003, team 1]"));
	}

	int AlphaKills() {
		const auto matches = store_.FindOngoingMatches(kServer);
		const auto player = store_.FindPlayerByPlatformId("76561198000000001");
		if (matches.empty() || !player)
			return 0;
		const auto stat = store_.FindPlayerStat(matches.back().id, player->id);
		return stat ? stat->kills : 0;
	}

	static bool WaitFor(const std::function<bool()>& condition, std::chrono::milliseconds timeout = 3000ms) {
		const auto deadline = std::chrono::steady_clock::now() + timeout;
		while (std::chrono::steady_clock::now() < deadline) {
			if (condition())
				return true;
			std::this_thread::sleep_for(10ms);
		}
		return condition();
	}

	TempDir dir_;
	MemoryStatStore store_;
	LineParser parser_;
	EventHandlers handlers_{ store_ };
	LogPipeline pipeline_{ parser_, handlers_, store_ };
};

TEST_F(ServerWorkerTest, PartialLineWaitsForItsNewline) {
	const auto path = dir_ / "Insurgency.log";
	const std::string head = std::string(kBaseLogHeader) + "\r\n" + Line(0, MapLoadBody("Farmhouse")) + "\r\n";
	const std::string kill = KillLine(10);
	WriteText(path, head + kill.substr(0, 20));

	ServerWorker worker(Config(), pipeline_, store_);
	worker.SetCursor(ReadCursor{ ReadLogGeneration(path), 0 });

	ReadStats stats = worker.Poll();
	EXPECT_EQ(stats.lines, 2u);
	EXPECT_EQ(worker.Cursor().offset, static_cast<int64_t>(head.size()));
	EXPECT_EQ(worker.Cursor().generation, ToUnixMillis(BaseTime()));
	EXPECT_EQ(AlphaKills(), 0);

	AppendText(path, kill.substr(20) + "\r\n");
	stats = worker.Poll();
	EXPECT_EQ(stats.lines, 1u);
	EXPECT_EQ(stats.applied, 1u);
	EXPECT_FALSE(stats.rotated);
	EXPECT_EQ(AlphaKills(), 1);

	const auto server = store_.FindServer(kServer);
	ASSERT_TRUE(server.has_value());
	EXPECT_EQ(server->cursorOffset, static_cast<int64_t>(std::filesystem::file_size(path)));
	EXPECT_EQ(server->logPath, path.string());
}

TEST_F(ServerWorkerTest, NothingNewReadsNothing) {
	const auto path = dir_ / "Insurgency.log";
	WriteText(path, std::string(kBaseLogHeader) + "\n" + Line(0, MapLoadBody("Farmhouse")) + "\n");

	ServerWorker worker(Config(), pipeline_, store_);
	worker.SetCursor(ReadCursor{ ReadLogGeneration(path), 0 });
	worker.Poll();

	const ReadStats again = worker.Poll();
	EXPECT_EQ(again.lines, 0u);
	EXPECT_EQ(store_.ListMatches(kServer).size(), 1u);
}

TEST_F(ServerWorkerTest, NewHeaderRestartsFromTheTop) {
	const auto path = dir_ / "Insurgency.log";
	WriteText(path, std::string(kBaseLogHeader) + "\n" + Line(0, MapLoadBody("Farmhouse")) + "\n" + KillLine(10) + "\n");

	ServerWorker worker(Config(), pipeline_, store_);
	worker.SetCursor(ReadCursor{ ReadLogGeneration(path), 0 });
	worker.Poll();
	const int64_t oldOffset = worker.Cursor().offset;

	// The new log is already longer than the old cursor.
	std::string rotated = "Log file open, 10/04/25 23:00:00\n" + Line(7200, MapLoadBody("Crossing", "Scenario_Crossing_Push_Security")) + "\n";
	while (static_cast<int64_t>(rotated.size()) <= oldOffset)
		rotated += Line(7201, "LogTemp: padding") + "\n";
	WriteText(path, rotated);

	const ReadStats stats = worker.Poll();
	EXPECT_TRUE(stats.rotated);
	EXPECT_EQ(worker.Cursor().offset, static_cast<int64_t>(rotated.size()));
	EXPECT_NE(worker.Cursor().generation, ToUnixMillis(BaseTime()));

	const auto matches = store_.ListMatches(kServer);
	ASSERT_EQ(matches.size(), 2u);
	EXPECT_EQ(matches[0].status, MatchStatus::Crashed);
	EXPECT_EQ(matches[1].map, "Crossing");
}

TEST_F(ServerWorkerTest, ShrunkFileIsTreatedAsRotation) {
	const auto path = dir_ / "Insurgency.log";
	WriteText(path, Line(0, MapLoadBody("Farmhouse")) + "\n" + KillLine(10) + "\n" + KillLine(20) + "\n");

	ServerWorker worker(Config(), pipeline_, store_);
	worker.Poll();
	EXPECT_EQ(AlphaKills(), 2);

	WriteText(path, Line(100, "LogGameplayEvents: Display: Game over") + "\n");
	const ReadStats stats = worker.Poll();
	EXPECT_TRUE(stats.rotated);
	EXPECT_EQ(stats.lines, 1u);
	EXPECT_TRUE(store_.FindOngoingMatches(kServer).empty());
}

TEST_F(ServerWorkerTest, ReadRangeStopsAtTheRequestedOffset) {
	const auto path = dir_ / "Insurgency.log";
	const std::string first = Line(0, MapLoadBody("Farmhouse")) + "\n";
	WriteText(path, first + KillLine(10) + "\n");

	ServerWorker worker(Config(), pipeline_, store_);
	const ReadStats stats = worker.ReadRange(static_cast<int64_t>(first.size()), HandlerContext{});
	EXPECT_EQ(stats.lines, 1u);
	EXPECT_EQ(worker.Cursor().offset, static_cast<int64_t>(first.size()));
	EXPECT_EQ(AlphaKills(), 0);
}

TEST_F(ServerWorkerTest, MissingFileIsNotAnError) {
	ServerWorker worker(Config(), pipeline_, store_);
	const ReadStats stats = worker.Poll();
	EXPECT_EQ(stats.lines, 0u);
	EXPECT_FALSE(worker.Active());
}

TEST_F(ServerWorkerTest, ThreadReportsActivityAndQuiet) {
	const auto path = dir_ / "Insurgency.log";
	WriteText(path, std::string(kBaseLogHeader) + "\n");

	std::atomic<int> active{ 0 };
	std::atomic<int> inactive{ 0 };
	ActivityCallbacks callbacks;
	callbacks.onActive = [&](const std::string& serverId) {
		EXPECT_EQ(serverId, kServer);
		++active;
	};
	callbacks.onInactive = [&](const std::string&) { ++inactive; };

	ServerWorker worker(Config(), pipeline_, store_, callbacks);
	worker.SetCursor(ReadCursor{ ReadLogGeneration(path), 0 });
	worker.Start();

	ASSERT_TRUE(WaitFor([&] { return active.load() == 1; }));
	ASSERT_TRUE(WaitFor([&] { return inactive.load() == 1; }));

	AppendText(path, Line(0, MapLoadBody("Farmhouse")) + "\n" + KillLine(10) + "\n");
	worker.Notify();
	ASSERT_TRUE(WaitFor([&] { return active.load() == 2; }));
	EXPECT_TRUE(WaitFor([&] { return AlphaKills() == 1; }));

	EXPECT_TRUE(worker.Stop(2000ms));
	EXPECT_EQ(inactive.load(), 2);
	EXPECT_FALSE(worker.Active());
}

} // namespace
