/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

tracker_service.cpp implementation.*/

#include "tracker_service.hpp"

#include "watcher/log_file.hpp"
#include "../shared/logger.hpp"

#include <fmt/format.h>

#include <limits>

namespace sandstats::tracker {

namespace {

CatchupConfig MakeCatchupConfig(const TrackerTiming& timing) {
	CatchupConfig config;
	config.liveThreshold = timing.catchupLiveThreshold;
	config.idleThreshold = timing.catchupIdleThreshold;
	config.livenessWindow = timing.catchupLivenessWindow;
	config.markerMaxAge = timing.catchupMarkerMaxAge;
	return config;
}

FileWatcherConfig MakeWatcherConfig(const TrackerTiming& timing) {
	FileWatcherConfig config;
	config.pollInterval = timing.pollInterval;
	config.coalesceWindow = timing.coalesceWindow;
	config.inactivityTimeout = timing.inactivityTimeout;
	config.drainTimeout = timing.drainTimeout;
	return config;
}

} // namespace

TrackerService::TrackerService(StatStore& store, TrackerTiming timing, CommandSender* sender, ServerQuerier* querier,
	ActivityCallbacks callbacks)
	: store_(store),
	  timing_(std::move(timing)),
	  sender_(sender),
	  querier_(querier),
	  callbacks_(std::move(callbacks)),
	  rconWorker_("rcon", timing_.rconWorkers),
	  reconciler_(store_, sender_, std::chrono::seconds(30)),
	  chat_(store_, sender_, &rconWorker_),
	  scheduler_(ScoreSchedulerConfig{ timing_.debounceWindow, timing_.debounceMaxWait, timing_.periodicScoreInterval },
		  [this](const std::string& serverId, FireReason reason) { OnScoreFire(serverId, reason); }),
	  handlers_(store_, HandlerConfig{ timing_.travelSuppression }, &scheduler_, &chat_),
	  pipeline_(parser_, handlers_, store_),
	  catchup_(parser_, store_, MakeCatchupConfig(timing_), querier_) {
	ActivityCallbacks activity;
	activity.onActive = [this](const std::string& serverId) { OnActive(serverId); };
	activity.onInactive = [this](const std::string& serverId) { OnInactive(serverId); };
	watcher_ = std::make_unique<FileWatcher>(pipeline_, store_, &catchup_, MakeWatcherConfig(timing_), std::move(activity));
}

TrackerService::~TrackerService() {
	Stop();
}

void TrackerService::Start() {
	if (started_)
		return;
	started_ = true;
	scheduler_.Start();
	watcher_->Start();
}

/*
=============
TrackerService::Stop

Ingestion stops first so nothing new is scheduled, then the timer, then the
remote console pool gets the drain timeout for queued polls. A poll already
on the wire is waited for; its RCON timeout bounds it.
=============
*/
void TrackerService::Stop() {
	watcher_->Stop();
	scheduler_.Stop();
	if (!rconWorker_.Stop(timing_.drainTimeout))
		Logf(LogLevel::Warn, "remote console work abandoned at shutdown");
	started_ = false;
}

StartResult TrackerService::WatchServer(const ServerConfig& server) {
	{
		std::lock_guard<std::mutex> lock(lanesMutex_);
		rconTimeouts_[server.id] = server.rconTimeout;
	}
	store_.UpdateServer(server.id, [&](ServerRecord& record) {
		record.name = server.name;
		record.logPath = server.logPath;
	});

	WatchedLog log;
	log.serverId = server.id;
	log.logPath = server.logPath;
	log.queryAddress = server.queryAddress;

	ServerLane& lane = LaneFor(server.id);
	std::lock_guard<std::mutex> lock(lane.mutex);
	const StartResult result = watcher_->AddLog(log);
	Logf(LogLevel::Info, "[{}] watching {} ({})", server.id, server.logPath, StartModeName(result.mode));
	return result;
}

TrackerService::ServerLane& TrackerService::LaneFor(const std::string& serverId) {
	std::lock_guard<std::mutex> lock(lanesMutex_);
	std::unique_ptr<ServerLane>& lane = lanes_[serverId];
	if (!lane) {
		lane = std::make_unique<ServerLane>();
		lane->session.serverId = serverId;
	}
	return *lane;
}

LineOutcome TrackerService::ProcessLine(const std::string& serverId, std::string_view line) {
	ServerLane& lane = LaneFor(serverId);
	std::lock_guard<std::mutex> lock(lane.mutex);
	if (const auto worker = watcher_->FindWorker(serverId))
		return worker->ProcessLine(line, HandlerContext{});
	return pipeline_.ProcessLine(lane.session, line, HandlerContext{});
}

/*
=============
TrackerService::ProcessFile

Reads the whole file through a one-off worker that carries the server's
login bookkeeping in and out, so direct lines and files share it.
=============
*/
ReadStats TrackerService::ProcessFile(const std::string& serverId, const std::filesystem::path& path, bool catchup) {
	ServerLane& lane = LaneFor(serverId);
	std::lock_guard<std::mutex> lock(lane.mutex);
	if (watcher_->FindWorker(serverId)) {
		Logf(LogLevel::Warn, "[{}] not processing {}: the server's log is being watched", serverId, path.string());
		return {};
	}

	ServerWorkerConfig config;
	config.serverId = serverId;
	config.logPath = path;

	ServerWorker worker(config, pipeline_, store_);
	worker.RestoreSession(lane.session);
	worker.SetCursor(ReadCursor{ ReadLogGeneration(path), 0 });

	HandlerContext context;
	context.catchup = catchup;
	const ReadStats stats = worker.ReadRange(std::numeric_limits<int64_t>::max(), context);
	lane.session = worker.SessionSnapshot();
	return stats;
}

bool TrackerService::WaitForRemoteWork(std::chrono::milliseconds timeout) {
	return rconWorker_.WaitIdle(timeout);
}

void TrackerService::OnActive(const std::string& serverId) {
	if (sender_)
		scheduler_.EnablePeriodic(serverId);
	if (callbacks_.onActive)
		callbacks_.onActive(serverId);
}

void TrackerService::OnInactive(const std::string& serverId) {
	scheduler_.DisablePeriodic(serverId);
	if (callbacks_.onInactive)
		callbacks_.onInactive(serverId);
}

void TrackerService::OnScoreFire(const std::string& serverId, FireReason reason) {
	if (!sender_)
		return;

	std::optional<std::chrono::milliseconds> timeout;
	{
		std::lock_guard<std::mutex> lock(lanesMutex_);
		if (const auto it = rconTimeouts_.find(serverId); it != rconTimeouts_.end())
			timeout = it->second;
	}

	const uint64_t jobId = rconWorker_.Enqueue(fmt::format("score {} ({})", serverId, FireReasonName(reason)), [this, serverId, timeout]() {
		const ReconcileResult result = reconciler_.Reconcile(serverId, timeout);
		if (!result.polled)
			Logf(LogLevel::Debug, "[{}] score poll skipped: {}", serverId, result.error);
	});
	if (!jobId)
		Logf(LogLevel::Debug, "[{}] score poll not queued, shutting down", serverId);
}

} // namespace sandstats::tracker
