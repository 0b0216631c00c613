/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

file_watcher.hpp declarations.*/

#pragma once

#include "catchup_engine.hpp"
#include "log_file.hpp"
#include "server_worker.hpp"

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sandstats::tracker {

struct FileWatcherConfig {
	std::chrono::milliseconds pollInterval{ 500 };
	std::chrono::milliseconds coalesceWindow{ 200 };
	std::chrono::milliseconds inactivityTimeout{ 10000 };
	std::chrono::milliseconds drainTimeout{ 5000 };
};

struct WatchedLog {
	std::string serverId;
	std::filesystem::path logPath;
	std::string queryAddress;
};

/*
=============
FileWatcher

Owns one ServerWorker per log plus a notifier thread that stats every file
on an interval and nudges the worker whose file changed. External change
notifications can be fed in through Notify.
=============
*/
class FileWatcher {
public:
	FileWatcher(LogPipeline& pipeline, StatStore& store, const CatchupEngine* catchup, FileWatcherConfig config = {},
		ActivityCallbacks callbacks = {});
	~FileWatcher();

	FileWatcher(const FileWatcher&) = delete;
	FileWatcher& operator=(const FileWatcher&) = delete;

	// Runs start-up positioning (and catch-up) synchronously, then starts the
	// worker. A worker already watching the same server is stopped first.
	StartResult AddLog(const WatchedLog& log);

	void Start();
	void Stop();

	void Notify(const std::string& serverId);

	std::vector<std::string> ServerIds() const;
	std::shared_ptr<ServerWorker> FindWorker(const std::string& serverId) const;

private:
	struct Watched {
		WatchedLog log;
		std::shared_ptr<ServerWorker> worker;
		FileState lastState;
	};

	void ThreadMain();
	void CheckFiles();

	LogPipeline& pipeline_;
	StatStore& store_;
	const CatchupEngine* catchup_;
	FileWatcherConfig config_;
	ActivityCallbacks callbacks_;

	// One AddLog at a time, so a server never has two live workers.
	std::mutex addMutex_;
	mutable std::mutex mutex_;
	std::condition_variable wake_;
	std::map<std::string, Watched> watched_;
	std::thread thread_;
	bool running_ = false;
	bool stopping_ = false;
};

} // namespace sandstats::tracker
