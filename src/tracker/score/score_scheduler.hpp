/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

score_scheduler.hpp declarations.*/

#pragma once

#include "debounce_window.hpp"
#include "score_trigger.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace sandstats::tracker {

enum class FireReason {
	Debounce,
	Immediate,
	Periodic
};

const char* FireReasonName(FireReason reason);

struct ScoreSchedulerConfig {
	std::chrono::milliseconds debounceWindow{ 10000 };
	std::chrono::milliseconds maxWait{ 25000 };
	std::chrono::milliseconds periodicInterval{ 60000 };
};

/*
=============
ScoreScheduler

Owns one timer thread that drives every server's debounce window and the
optional periodic poll enabled while a server is active. Fires are handed to
the callback outside the scheduler lock; the callback must not block.
=============
*/
class ScoreScheduler : public ScoreTrigger {
public:
	using FireCallback = std::function<void(const std::string& serverId, FireReason reason)>;

	ScoreScheduler(ScoreSchedulerConfig config, FireCallback onFire);
	~ScoreScheduler() override;

	ScoreScheduler(const ScoreScheduler&) = delete;
	ScoreScheduler& operator=(const ScoreScheduler&) = delete;

	void Start();
	void Stop();

	void Trigger(const std::string& serverId) override;
	void ExecuteImmediately(const std::string& serverId) override;
	void Cancel(const std::string& serverId) override;

	void EnablePeriodic(const std::string& serverId);
	void DisablePeriodic(const std::string& serverId);

	bool HasPendingDebounce(const std::string& serverId) const;
	bool PeriodicEnabled(const std::string& serverId) const;

private:
	struct Entry {
		DebounceWindow window;
		std::optional<SteadyTime> nextPeriodic;
	};

	Entry& EntryLocked(const std::string& serverId);
	void ThreadMain();
	void Fire(const std::string& serverId, FireReason reason);

	ScoreSchedulerConfig config_;
	FireCallback onFire_;

	mutable std::mutex mutex_;
	std::condition_variable wake_;
	std::map<std::string, Entry> entries_;
	std::thread thread_;
	bool running_ = false;
	bool stopping_ = false;
};

} // namespace sandstats::tracker
