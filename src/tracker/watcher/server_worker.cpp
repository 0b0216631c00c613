/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

server_worker.cpp implementation.*/

#include "server_worker.hpp"

#include "log_file.hpp"
#include "../../shared/logger.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <string_view>

namespace sandstats::tracker {

namespace {

constexpr int64_t kReadChunkSize = 1024 * 1024;

void InvokeCallback(const std::function<void(const std::string&)>& callback, const std::string& serverId, const char* what) {
	if (!callback)
		return;
	try {
		callback(serverId);
	}
	catch (const std::exception& e) {
		Logf(LogLevel::Error, "[{}] {} callback failed: {}", serverId, what, e.what());
	}
}

} // namespace

ServerWorker::ServerWorker(ServerWorkerConfig config, LogPipeline& pipeline, StatStore& store, ActivityCallbacks callbacks)
	: config_(std::move(config)), pipeline_(pipeline), store_(store), callbacks_(std::move(callbacks)) {
	session_.serverId = config_.serverId;
}

ServerWorker::~ServerWorker() {
	Stop(std::chrono::milliseconds(5000));
}

void ServerWorker::SetCursor(ReadCursor cursor) {
	{
		std::lock_guard<std::mutex> lock(mutex_);
		cursor_ = cursor;
	}
	PersistCursor();
}

ReadCursor ServerWorker::Cursor() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return cursor_;
}

bool ServerWorker::Active() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return active_;
}

void ServerWorker::PersistCursor() {
	const ReadCursor cursor = Cursor();
	try {
		store_.UpdateServer(config_.serverId, [&](ServerRecord& server) {
			server.logPath = config_.logPath.string();
			server.cursorGeneration = cursor.generation;
			server.cursorOffset = cursor.offset;
		});
	}
	catch (const StoreError& e) {
		Logf(LogLevel::Warn, "[{}] could not persist read cursor: {}", config_.serverId, e.what());
	}
}

// Offsets of the old file say nothing about the new one, even under the same generation.
void ServerWorker::ForgetAppliedLines() {
	try {
		store_.UpdateServer(config_.serverId, [](ServerRecord& server) {
			server.appliedGeneration.reset();
			server.appliedOffset = 0;
		});
	}
	catch (const StoreError& e) {
		Logf(LogLevel::Warn, "[{}] could not reset applied offset: {}", config_.serverId, e.what());
	}
}

/*
=============
ServerWorker::ReadRange

Processes complete lines from the cursor up to `endOffset` (or end of file).
A changed log-open header or a file shorter than the cursor is a rotation and
restarts at offset zero.
=============
*/
ReadStats ServerWorker::ReadRange(int64_t endOffset, const HandlerContext& context) {
	std::lock_guard<std::mutex> pass(passMutex_);
	ReadStats stats;

	const FileState state = StatFile(config_.logPath);
	if (!state.exists) {
		Logf(LogLevel::Debug, "[{}] log {} not readable", config_.serverId, config_.logPath.string());
		return stats;
	}

	ReadCursor cursor = Cursor();
	const int64_t generation = ReadLogGeneration(config_.logPath);
	if (generation != cursor.generation && cursor.offset > 0) {
		Logf(LogLevel::Info, "[{}] new log generation, reading from the start", config_.serverId);
		cursor.offset = 0;
		stats.rotated = true;
	}
	else if (state.size < cursor.offset) {
		Logf(LogLevel::Info, "[{}] log truncated ({} < {}), reading from the start", config_.serverId, state.size, cursor.offset);
		cursor.offset = 0;
		stats.rotated = true;
	}
	cursor.generation = generation;
	if (stats.rotated)
		ForgetAppliedLines();

	const int64_t limit = std::min(endOffset, state.size);
	std::ifstream file(config_.logPath, std::ios::binary);
	if (limit > cursor.offset && file.is_open()) {
		file.seekg(cursor.offset);

		std::string data;
		int64_t dataStart = cursor.offset;
		int64_t readPos = cursor.offset;
		while (readPos < limit && !abandon_) {
			const int64_t want = std::min(kReadChunkSize, limit - readPos);
			const size_t keep = data.size();
			data.resize(keep + static_cast<size_t>(want));
			if (!file.read(data.data() + keep, want)) {
				data.resize(keep + static_cast<size_t>(file.gcount()));
				readPos += file.gcount();
				Logf(LogLevel::Warn, "[{}] short read at offset {}", config_.serverId, readPos);
			}
			else {
				readPos += want;
			}

			size_t lineStart = 0;
			for (size_t newline = data.find('\n'); newline != std::string::npos; newline = data.find('\n', lineStart)) {
				std::string_view line(data.data() + lineStart, newline - lineStart);
				if (!line.empty() && line.back() == '\r')
					line.remove_suffix(1);

				const int64_t lineEnd = dataStart + static_cast<int64_t>(newline) + 1;
				const LineOutcome outcome = pipeline_.ProcessLine(session_, line, context, LineLocation{ generation, lineEnd });
				++stats.lines;
				if (outcome == LineOutcome::Applied)
					++stats.applied;

				cursor.offset = lineEnd;
				lineStart = newline + 1;
				if (abandon_)
					break;
			}

			data.erase(0, lineStart);
			dataStart += static_cast<int64_t>(lineStart);
			if (file.fail())
				break;
		}
	}

	{
		std::lock_guard<std::mutex> lock(mutex_);
		cursor_ = cursor;
	}
	PersistCursor();
	return stats;
}

LineOutcome ServerWorker::ProcessLine(std::string_view line, const HandlerContext& context) {
	std::lock_guard<std::mutex> pass(passMutex_);
	return pipeline_.ProcessLine(session_, line, context);
}

ServerSession ServerWorker::SessionSnapshot() const {
	std::lock_guard<std::mutex> pass(passMutex_);
	return session_;
}

void ServerWorker::RestoreSession(ServerSession session) {
	std::lock_guard<std::mutex> pass(passMutex_);
	session_ = std::move(session);
	session_.serverId = config_.serverId;
}

ReadStats ServerWorker::Poll() {
	const ReadStats stats = ReadRange(std::numeric_limits<int64_t>::max(), HandlerContext{});
	UpdateActivity(stats);
	return stats;
}

void ServerWorker::UpdateActivity(const ReadStats& stats) {
	if (!stats.lines)
		return;

	bool becameActive = false;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		lastActivity_ = std::chrono::steady_clock::now();
		becameActive = !active_;
		active_ = true;
	}

	if (becameActive) {
		Logf(LogLevel::Info, "[{}] server active", config_.serverId);
		InvokeCallback(callbacks_.onActive, config_.serverId, "activation");
	}
}

void ServerWorker::Start() {
	std::lock_guard<std::mutex> lock(mutex_);
	if (running_)
		return;

	running_ = true;
	stopping_ = false;
	exited_ = false;
	notified_ = true;
	abandon_ = false;
	thread_ = std::thread(&ServerWorker::ThreadMain, this);
}

void ServerWorker::Notify() {
	{
		std::lock_guard<std::mutex> lock(mutex_);
		notified_ = true;
	}
	wake_.notify_all();
}

bool ServerWorker::Stop(std::chrono::milliseconds timeout) {
	{
		std::lock_guard<std::mutex> lock(mutex_);
		if (!running_)
			return true;
		stopping_ = true;
	}
	wake_.notify_all();

	bool drained = false;
	{
		std::unique_lock<std::mutex> lock(mutex_);
		drained = wake_.wait_for(lock, timeout, [this] { return exited_; });
	}
	if (!drained) {
		Logf(LogLevel::Warn, "[{}] worker did not drain within {} ms, abandoning remaining lines", config_.serverId, timeout.count());
		abandon_ = true;
	}
	if (thread_.joinable())
		thread_.join();

	bool wasActive = false;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		running_ = false;
		wasActive = active_;
		active_ = false;
	}
	if (wasActive)
		InvokeCallback(callbacks_.onInactive, config_.serverId, "deactivation");
	return drained;
}

/*
=============
ServerWorker::ThreadMain

A notification opens a coalescing window; anything arriving inside it is
folded into the same pass. While active, the loop also wakes at the quiet
period deadline to report inactivity exactly once.
=============
*/
void ServerWorker::ThreadMain() {
	std::unique_lock<std::mutex> lock(mutex_);
	while (!(stopping_ && !notified_)) {
		if (notified_) {
			if (!stopping_)
				wake_.wait_for(lock, config_.coalesceWindow, [this] { return stopping_; });
			notified_ = false;
			lock.unlock();
			try {
				Poll();
			}
			catch (const std::exception& e) {
				Logf(LogLevel::Error, "[{}] log pass failed: {}", config_.serverId, e.what());
			}
			lock.lock();
			continue;
		}

		if (active_ && lastActivity_) {
			const auto deadline = *lastActivity_ + config_.inactivityTimeout;
			if (std::chrono::steady_clock::now() >= deadline) {
				active_ = false;
				lock.unlock();
				Logf(LogLevel::Info, "[{}] server inactive", config_.serverId);
				InvokeCallback(callbacks_.onInactive, config_.serverId, "deactivation");
				lock.lock();
				continue;
			}
			wake_.wait_until(lock, deadline, [this] { return notified_ || stopping_; });
		}
		else {
			wake_.wait(lock, [this] { return notified_ || stopping_; });
		}
	}

	exited_ = true;
	lock.unlock();
	wake_.notify_all();
}

} // namespace sandstats::tracker
