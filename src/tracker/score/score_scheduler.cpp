/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

score_scheduler.cpp implementation.*/

#include "score_scheduler.hpp"

#include "../../shared/logger.hpp"

#include <utility>
#include <vector>

namespace sandstats::tracker {

const char* FireReasonName(FireReason reason) {
	switch (reason) {
	case FireReason::Debounce:
		return "debounce";
	case FireReason::Immediate:
		return "immediate";
	case FireReason::Periodic:
	default:
		return "periodic";
	}
}

ScoreScheduler::ScoreScheduler(ScoreSchedulerConfig config, FireCallback onFire)
	: config_(config), onFire_(std::move(onFire)) {
}

ScoreScheduler::~ScoreScheduler() {
	Stop();
}

void ScoreScheduler::Start() {
	std::lock_guard<std::mutex> lock(mutex_);
	if (running_)
		return;

	stopping_ = false;
	running_ = true;
	thread_ = std::thread(&ScoreScheduler::ThreadMain, this);
}

/*
=============
ScoreScheduler::Stop

Pending windows are discarded; nothing fires after Stop returns.
=============
*/
void ScoreScheduler::Stop() {
	{
		std::lock_guard<std::mutex> lock(mutex_);
		if (!running_)
			return;
		stopping_ = true;
	}

	wake_.notify_all();
	if (thread_.joinable())
		thread_.join();

	std::lock_guard<std::mutex> lock(mutex_);
	running_ = false;
	entries_.clear();
}

void ScoreScheduler::Trigger(const std::string& serverId) {
	{
		std::lock_guard<std::mutex> lock(mutex_);
		EntryLocked(serverId).window.Trigger(SteadyClock::now());
	}
	wake_.notify_all();
}

void ScoreScheduler::ExecuteImmediately(const std::string& serverId) {
	{
		std::lock_guard<std::mutex> lock(mutex_);
		EntryLocked(serverId).window.Reset();
	}
	wake_.notify_all();
	Fire(serverId, FireReason::Immediate);
}

void ScoreScheduler::Cancel(const std::string& serverId) {
	std::lock_guard<std::mutex> lock(mutex_);
	if (const auto it = entries_.find(serverId); it != entries_.end())
		it->second.window.Reset();
}

void ScoreScheduler::EnablePeriodic(const std::string& serverId) {
	{
		std::lock_guard<std::mutex> lock(mutex_);
		Entry& entry = EntryLocked(serverId);
		if (entry.nextPeriodic)
			return;
		entry.nextPeriodic = SteadyClock::now() + config_.periodicInterval;
	}
	Logf(LogLevel::Debug, "[{}] periodic score polling enabled", serverId);
	wake_.notify_all();
}

void ScoreScheduler::DisablePeriodic(const std::string& serverId) {
	{
		std::lock_guard<std::mutex> lock(mutex_);
		const auto it = entries_.find(serverId);
		if (it == entries_.end() || !it->second.nextPeriodic)
			return;
		it->second.nextPeriodic.reset();
	}
	Logf(LogLevel::Debug, "[{}] periodic score polling disabled", serverId);
}

bool ScoreScheduler::HasPendingDebounce(const std::string& serverId) const {
	std::lock_guard<std::mutex> lock(mutex_);
	const auto it = entries_.find(serverId);
	return it != entries_.end() && it->second.window.Pending();
}

bool ScoreScheduler::PeriodicEnabled(const std::string& serverId) const {
	std::lock_guard<std::mutex> lock(mutex_);
	const auto it = entries_.find(serverId);
	return it != entries_.end() && it->second.nextPeriodic.has_value();
}

ScoreScheduler::Entry& ScoreScheduler::EntryLocked(const std::string& serverId) {
	auto it = entries_.find(serverId);
	if (it == entries_.end())
		it = entries_.emplace(serverId, Entry{ DebounceWindow(config_.debounceWindow, config_.maxWait), std::nullopt }).first;
	return it->second;
}

/*
=============
ScoreScheduler::ThreadMain

Sleeps until the earliest deadline across all servers, collects every entry
that is due and fires them with the lock released. A debounce fire also
pushes the next periodic poll out by a full interval.
=============
*/
void ScoreScheduler::ThreadMain() {
	std::unique_lock<std::mutex> lock(mutex_);
	while (!stopping_) {
		const SteadyTime now = SteadyClock::now();
		std::vector<std::pair<std::string, FireReason>> due;
		std::optional<SteadyTime> earliest;

		for (auto& [serverId, entry] : entries_) {
			if (entry.window.ConsumeIfDue(now)) {
				due.emplace_back(serverId, FireReason::Debounce);
				if (entry.nextPeriodic)
					entry.nextPeriodic = now + config_.periodicInterval;
			}
			else if (entry.nextPeriodic && *entry.nextPeriodic <= now) {
				due.emplace_back(serverId, FireReason::Periodic);
				entry.nextPeriodic = now + config_.periodicInterval;
			}

			for (const auto& deadline : { entry.window.Deadline(), entry.nextPeriodic }) {
				if (deadline && (!earliest || *deadline < *earliest))
					earliest = deadline;
			}
		}

		if (!due.empty()) {
			lock.unlock();
			for (const auto& [serverId, reason] : due)
				Fire(serverId, reason);
			lock.lock();
			continue;
		}

		if (earliest)
			wake_.wait_until(lock, *earliest);
		else
			wake_.wait(lock);
	}
}

void ScoreScheduler::Fire(const std::string& serverId, FireReason reason) {
	Logf(LogLevel::Debug, "[{}] score reconcile requested ({})", serverId, FireReasonName(reason));
	if (!onFire_)
		return;

	try {
		onFire_(serverId, reason);
	}
	catch (const std::exception& e) {
		Logf(LogLevel::Error, "[{}] score fire callback failed: {}", serverId, e.what());
	}
}

} // namespace sandstats::tracker
