/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

test_score_scheduler.cpp implementation.*/

#include "tracker/score/score_scheduler.hpp"

#include <gtest/gtest.h>

#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace sandstats::tracker;
using namespace std::chrono_literals;

namespace {

class ScoreSchedulerTest : public ::testing::Test {
protected:
	struct Fired {
		std::string serverId;
		FireReason reason;
	};

	ScoreScheduler::FireCallback Recorder() {
		return [this](const std::string& serverId, FireReason reason) {
			{
				std::lock_guard<std::mutex> lock(mutex_);
				fired_.push_back(Fired{ serverId, reason });
			}
			cv_.notify_all();
		};
	}

	bool WaitForFires(size_t count, std::chrono::milliseconds timeout = 2000ms) {
		std::unique_lock<std::mutex> lock(mutex_);
		return cv_.wait_for(lock, timeout, [&] { return fired_.size() >= count; });
	}

	std::vector<Fired> Snapshot() {
		std::lock_guard<std::mutex> lock(mutex_);
		return fired_;
	}

	std::mutex mutex_;
	std::condition_variable cv_;
	std::vector<Fired> fired_;
};

TEST_F(ScoreSchedulerTest, BurstOfTriggersFiresOnce) {
	ScoreScheduler scheduler(ScoreSchedulerConfig{ 100ms, 1000ms, 60000ms }, Recorder());
	scheduler.Start();

	for (int i = 0; i < 5; ++i)
		scheduler.Trigger("alpha");
	EXPECT_TRUE(scheduler.HasPendingDebounce("alpha"));

	ASSERT_TRUE(WaitForFires(1));
	std::this_thread::sleep_for(300ms);

	const auto fired = Snapshot();
	ASSERT_EQ(fired.size(), 1u);
	EXPECT_EQ(fired[0].serverId, "alpha");
	EXPECT_EQ(fired[0].reason, FireReason::Debounce);
	EXPECT_FALSE(scheduler.HasPendingDebounce("alpha"));
}

TEST_F(ScoreSchedulerTest, ServersDebounceIndependently) {
	ScoreScheduler scheduler(ScoreSchedulerConfig{ 100ms, 1000ms, 60000ms }, Recorder());
	scheduler.Start();

	scheduler.Trigger("alpha");
	scheduler.Trigger("bravo");

	ASSERT_TRUE(WaitForFires(2));
	const auto fired = Snapshot();
	EXPECT_NE(fired[0].serverId, fired[1].serverId);
}

TEST_F(ScoreSchedulerTest, ExecuteImmediatelyFiresSynchronouslyAndClearsWindow) {
	ScoreScheduler scheduler(ScoreSchedulerConfig{ 200ms, 1000ms, 60000ms }, Recorder());
	scheduler.Start();

	scheduler.Trigger("alpha");
	scheduler.ExecuteImmediately("alpha");

	auto fired = Snapshot();
	ASSERT_EQ(fired.size(), 1u);
	EXPECT_EQ(fired[0].reason, FireReason::Immediate);
	EXPECT_FALSE(scheduler.HasPendingDebounce("alpha"));

	std::this_thread::sleep_for(400ms);
	EXPECT_EQ(Snapshot().size(), 1u);
}

TEST_F(ScoreSchedulerTest, CancelDropsPendingFire) {
	ScoreScheduler scheduler(ScoreSchedulerConfig{ 100ms, 1000ms, 60000ms }, Recorder());
	scheduler.Start();

	scheduler.Trigger("alpha");
	scheduler.Cancel("alpha");
	scheduler.Cancel("unknown");

	EXPECT_FALSE(WaitForFires(1, 300ms));
}

TEST_F(ScoreSchedulerTest, PeriodicPollingWhileEnabled) {
	ScoreScheduler scheduler(ScoreSchedulerConfig{ 100ms, 1000ms, 50ms }, Recorder());
	scheduler.Start();

	scheduler.EnablePeriodic("alpha");
	EXPECT_TRUE(scheduler.PeriodicEnabled("alpha"));

	ASSERT_TRUE(WaitForFires(2));
	scheduler.DisablePeriodic("alpha");
	EXPECT_FALSE(scheduler.PeriodicEnabled("alpha"));

	for (const Fired& fired : Snapshot())
		EXPECT_EQ(fired.reason, FireReason::Periodic);

	// One fire may already be in flight when polling is disabled.
	const size_t settled = Snapshot().size();
	std::this_thread::sleep_for(300ms);
	EXPECT_LE(Snapshot().size(), settled + 1);
}

TEST_F(ScoreSchedulerTest, NothingFiresAfterStop) {
	ScoreScheduler scheduler(ScoreSchedulerConfig{ 100ms, 1000ms, 60000ms }, Recorder());
	scheduler.Start();

	scheduler.Trigger("alpha");
	scheduler.Stop();
	scheduler.Stop();

	std::this_thread::sleep_for(300ms);
	EXPECT_TRUE(Snapshot().empty());
	EXPECT_FALSE(scheduler.HasPendingDebounce("alpha"));
}

TEST_F(ScoreSchedulerTest, CallbackExceptionDoesNotStopTheTimer) {
	int calls = 0;
	std::mutex callsMutex;
	std::condition_variable callsCv;
	ScoreScheduler scheduler(ScoreSchedulerConfig{ 50ms, 1000ms, 60000ms }, [&](const std::string&, FireReason) {
		{
			std::lock_guard<std::mutex> lock(callsMutex);
			++calls;
		}
		callsCv.notify_all();
		throw std::runtime_error("reconcile exploded");
	});
	scheduler.Start();

	scheduler.Trigger("alpha");
	{
		std::unique_lock<std::mutex> lock(callsMutex);
		ASSERT_TRUE(callsCv.wait_for(lock, 2000ms, [&] { return calls == 1; }));
	}

	scheduler.Trigger("alpha");
	std::unique_lock<std::mutex> lock(callsMutex);
	EXPECT_TRUE(callsCv.wait_for(lock, 2000ms, [&] { return calls == 2; }));
}

} // namespace
