/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

tracker_service.hpp declarations.*/

#pragma once

#include "config/tracker_config.hpp"
#include "match/chat_responder.hpp"
#include "match/event_handlers.hpp"
#include "match/log_pipeline.hpp"
#include "parser/line_parser.hpp"
#include "rcon/command_sender.hpp"
#include "score/score_reconciler.hpp"
#include "score/score_scheduler.hpp"
#include "store/stat_store.hpp"
#include "watcher/catchup_engine.hpp"
#include "watcher/file_watcher.hpp"
#include "../shared/task_worker.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace sandstats::tracker {

/*
=============
TrackerService

Wires parser, handlers, watcher, catch-up and score reconciliation around a
shared store. Remote console traffic (score polls and chat replies) runs on
its own worker pool so a slow server never stalls log ingestion.
=============
*/
class TrackerService {
public:
	TrackerService(StatStore& store, TrackerTiming timing, CommandSender* sender = nullptr, ServerQuerier* querier = nullptr,
		ActivityCallbacks callbacks = {});
	~TrackerService();

	TrackerService(const TrackerService&) = delete;
	TrackerService& operator=(const TrackerService&) = delete;

	void Start();
	void Stop();

	StartResult WatchServer(const ServerConfig& server);

	// Direct entry points. Calls for one server are applied one at a time;
	// a line for a watched server goes through that server's worker.
	LineOutcome ProcessLine(const std::string& serverId, std::string_view line);
	// Refused while the server's log is watched, since the worker owns its cursor.
	ReadStats ProcessFile(const std::string& serverId, const std::filesystem::path& path, bool catchup = false);

	// Blocks until queued score polls and chat replies finish.
	bool WaitForRemoteWork(std::chrono::milliseconds timeout);

	ScoreScheduler& Scheduler() { return scheduler_; }
	FileWatcher& Watcher() { return *watcher_; }

private:
	// Serialises direct calls and watch setup for one server.
	struct ServerLane {
		std::mutex mutex;
		ServerSession session;
	};

	void OnActive(const std::string& serverId);
	void OnInactive(const std::string& serverId);
	void OnScoreFire(const std::string& serverId, FireReason reason);
	ServerLane& LaneFor(const std::string& serverId);

	StatStore& store_;
	TrackerTiming timing_;
	CommandSender* sender_;
	ServerQuerier* querier_;
	ActivityCallbacks callbacks_;

	LineParser parser_;
	TaskWorker rconWorker_;
	ScoreReconciler reconciler_;
	ChatResponder chat_;
	ScoreScheduler scheduler_;
	EventHandlers handlers_;
	LogPipeline pipeline_;
	CatchupEngine catchup_;
	std::unique_ptr<FileWatcher> watcher_;

	std::mutex lanesMutex_;
	std::map<std::string, std::unique_ptr<ServerLane>> lanes_;
	std::map<std::string, std::chrono::milliseconds> rconTimeouts_;
	bool started_ = false;
};

} // namespace sandstats::tracker
