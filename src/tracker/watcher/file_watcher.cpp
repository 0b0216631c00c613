/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

file_watcher.cpp implementation.*/

#include "file_watcher.hpp"

#include "../../shared/logger.hpp"

namespace sandstats::tracker {

FileWatcher::FileWatcher(LogPipeline& pipeline, StatStore& store, const CatchupEngine* catchup, FileWatcherConfig config,
	ActivityCallbacks callbacks)
	: pipeline_(pipeline), store_(store), catchup_(catchup), config_(config), callbacks_(std::move(callbacks)) {
}

FileWatcher::~FileWatcher() {
	Stop();
}

StartResult FileWatcher::AddLog(const WatchedLog& log) {
	ServerWorkerConfig workerConfig;
	workerConfig.serverId = log.serverId;
	workerConfig.logPath = log.logPath;
	workerConfig.coalesceWindow = config_.coalesceWindow;
	workerConfig.inactivityTimeout = config_.inactivityTimeout;

	std::lock_guard<std::mutex> adding(addMutex_);
	std::shared_ptr<ServerWorker> previous;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		if (const auto it = watched_.find(log.serverId); it != watched_.end()) {
			Logf(LogLevel::Warn, "[{}] log added twice, replacing the previous worker", log.serverId);
			previous = std::move(it->second.worker);
			watched_.erase(it);
		}
	}
	if (previous && !previous->Stop(config_.drainTimeout))
		Logf(LogLevel::Warn, "[{}] replaced worker stopped with unprocessed lines", log.serverId);

	auto worker = std::make_shared<ServerWorker>(workerConfig, pipeline_, store_, callbacks_);

	StartResult result;
	if (catchup_) {
		result = catchup_->Prepare(*worker, log.queryAddress);
	}
	else {
		const FileState state = StatFile(log.logPath);
		worker->SetCursor(ReadCursor{ ReadLogGeneration(log.logPath), state.size });
	}

	worker->Start();

	std::lock_guard<std::mutex> lock(mutex_);
	Watched& entry = watched_[log.serverId];
	entry.log = log;
	entry.worker = std::move(worker);
	entry.lastState = StatFile(log.logPath);
	return result;
}

void FileWatcher::Start() {
	std::lock_guard<std::mutex> lock(mutex_);
	if (running_)
		return;
	running_ = true;
	stopping_ = false;
	thread_ = std::thread(&FileWatcher::ThreadMain, this);
}

/*
=============
FileWatcher::Stop

Stops the notifier first so no new work arrives, then gives each worker the
drain timeout to finish what it already has.
=============
*/
void FileWatcher::Stop() {
	{
		std::lock_guard<std::mutex> lock(mutex_);
		stopping_ = true;
	}
	wake_.notify_all();
	if (thread_.joinable())
		thread_.join();

	std::map<std::string, Watched> watched;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		running_ = false;
		watched.swap(watched_);
	}

	for (auto& [serverId, entry] : watched) {
		if (!entry.worker->Stop(config_.drainTimeout))
			Logf(LogLevel::Warn, "[{}] stopped with unprocessed lines", serverId);
	}
}

void FileWatcher::Notify(const std::string& serverId) {
	std::lock_guard<std::mutex> lock(mutex_);
	if (const auto it = watched_.find(serverId); it != watched_.end())
		it->second.worker->Notify();
}

std::vector<std::string> FileWatcher::ServerIds() const {
	std::lock_guard<std::mutex> lock(mutex_);
	std::vector<std::string> ids;
	for (const auto& [serverId, entry] : watched_)
		ids.push_back(serverId);
	return ids;
}

std::shared_ptr<ServerWorker> FileWatcher::FindWorker(const std::string& serverId) const {
	std::lock_guard<std::mutex> lock(mutex_);
	const auto it = watched_.find(serverId);
	return it == watched_.end() ? nullptr : it->second.worker;
}

void FileWatcher::ThreadMain() {
	std::unique_lock<std::mutex> lock(mutex_);
	while (!stopping_) {
		lock.unlock();
		CheckFiles();
		lock.lock();
		wake_.wait_for(lock, config_.pollInterval, [this] { return stopping_; });
	}
}

void FileWatcher::CheckFiles() {
	std::lock_guard<std::mutex> lock(mutex_);
	for (auto& [serverId, entry] : watched_) {
		const FileState state = StatFile(entry.log.logPath);
		const bool changed = state.exists != entry.lastState.exists || state.size != entry.lastState.size ||
			state.modified != entry.lastState.modified;
		entry.lastState = state;
		if (changed)
			entry.worker->Notify();
	}
}

} // namespace sandstats::tracker
