/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

test_debounce_window.cpp implementation.*/

#include "tracker/score/debounce_window.hpp"

#include <gtest/gtest.h>

using namespace sandstats::tracker;
using namespace std::chrono_literals;

namespace {

TEST(DebounceWindowTest, BurstFiresOnceAfterTheLastTrigger) {
	DebounceWindow window(10s, 25s);
	const SteadyTime start{};

	for (int i = 0; i < 5; ++i)
		window.Trigger(start + i * 200ms);

	EXPECT_TRUE(window.Pending());
	EXPECT_FALSE(window.ConsumeIfDue(start + 10s));
	EXPECT_TRUE(window.ConsumeIfDue(start + 800ms + 10s));
	EXPECT_FALSE(window.Pending());
	EXPECT_FALSE(window.ConsumeIfDue(start + 60s));
}

TEST(DebounceWindowTest, SteadyTriggersAreCappedByMaxWait) {
	DebounceWindow window(10s, 25s);
	const SteadyTime start{};

	// One trigger every five seconds never lets the window lapse.
	int fires = 0;
	for (int second = 0; second <= 60; ++second) {
		const SteadyTime now = start + std::chrono::seconds(second);
		if (second % 5 == 0)
			window.Trigger(now);
		if (window.ConsumeIfDue(now))
			++fires;
		if (second == 25)
			EXPECT_EQ(fires, 1);
	}

	EXPECT_EQ(fires, 2);
}

TEST(DebounceWindowTest, DeadlineNeverPassesCeiling) {
	DebounceWindow window(10s, 25s);
	const SteadyTime start{};

	window.Trigger(start);
	ASSERT_TRUE(window.Deadline().has_value());
	EXPECT_EQ(*window.Deadline(), start + 10s);

	window.Trigger(start + 20s);
	EXPECT_EQ(*window.Deadline(), start + 25s);
	EXPECT_EQ(*window.FirstTrigger(), start);
}

TEST(DebounceWindowTest, MaxWaitShorterThanWindowIsRaised) {
	DebounceWindow window(10s, 2s);
	const SteadyTime start{};

	window.Trigger(start);
	EXPECT_EQ(*window.Deadline(), start + 10s);
}

TEST(DebounceWindowTest, ResetDropsPendingFire) {
	DebounceWindow window(10s, 25s);
	const SteadyTime start{};

	window.Trigger(start);
	window.Reset();
	EXPECT_FALSE(window.Pending());
	EXPECT_FALSE(window.ConsumeIfDue(start + 30s));
}

} // namespace
