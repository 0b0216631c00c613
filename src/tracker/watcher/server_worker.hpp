/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

server_worker.hpp declarations.*/

#pragma once

#include "../match/log_pipeline.hpp"
#include "../match/server_session.hpp"
#include "../store/stat_store.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace sandstats::tracker {

struct ServerWorkerConfig {
	std::string serverId;
	std::filesystem::path logPath;
	std::chrono::milliseconds coalesceWindow{ 200 };
	std::chrono::milliseconds inactivityTimeout{ 10000 };
};

struct ActivityCallbacks {
	std::function<void(const std::string& serverId)> onActive;
	std::function<void(const std::string& serverId)> onInactive;
};

struct ReadCursor {
	int64_t generation = 0;
	int64_t offset = 0;
};

struct ReadStats {
	size_t lines = 0;
	size_t applied = 0;
	bool rotated = false;
};

/*
=============
ServerWorker

One thread and one ordered queue per server log. Change notifications are
coalesced; each pass reads from the cursor to the last complete line, so a
partial trailing line waits for its newline and no byte range is skipped.
The cursor is persisted after every pass. Passes and lines handed in through
ProcessLine are serialised on the worker's session.
=============
*/
class ServerWorker {
public:
	ServerWorker(ServerWorkerConfig config, LogPipeline& pipeline, StatStore& store, ActivityCallbacks callbacks = {});
	~ServerWorker();

	ServerWorker(const ServerWorker&) = delete;
	ServerWorker& operator=(const ServerWorker&) = delete;

	// Must not be called while the worker thread runs.
	void SetCursor(ReadCursor cursor);
	ReadStats ReadRange(int64_t endOffset, const HandlerContext& context);
	ReadStats Poll();

	// A line from outside the log, applied between passes.
	LineOutcome ProcessLine(std::string_view line, const HandlerContext& context);

	void Start();
	// Finishes pending work for up to `timeout`, then abandons the rest.
	bool Stop(std::chrono::milliseconds timeout);
	void Notify();

	const std::string& ServerId() const { return config_.serverId; }
	const std::filesystem::path& LogPath() const { return config_.logPath; }
	ReadCursor Cursor() const;
	bool Active() const;

	ServerSession SessionSnapshot() const;
	void RestoreSession(ServerSession session);

private:
	void ThreadMain();
	void UpdateActivity(const ReadStats& stats);
	void PersistCursor();
	void ForgetAppliedLines();

	ServerWorkerConfig config_;
	LogPipeline& pipeline_;
	StatStore& store_;
	ActivityCallbacks callbacks_;

	// Held for every pipeline call; guards session_.
	mutable std::mutex passMutex_;
	ServerSession session_;

	mutable std::mutex mutex_;
	std::condition_variable wake_;
	std::thread thread_;
	ReadCursor cursor_;
	bool notified_ = false;
	bool running_ = false;
	bool stopping_ = false;
	bool exited_ = false;
	bool active_ = false;
	std::optional<std::chrono::steady_clock::time_point> lastActivity_;
	std::atomic<bool> abandon_{ false };
};

} // namespace sandstats::tracker
