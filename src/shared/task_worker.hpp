/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

task_worker.hpp declarations.*/

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace sandstats {

struct TaskWorkerStats {
	uint32_t pending = 0;
	uint32_t completed = 0;
	uint32_t failed = 0;
};

/*
=============
TaskWorker

Fixed pool of threads draining a FIFO job queue. Jobs that throw are counted
as failed and logged; the worker keeps running.
=============
*/
class TaskWorker {
public:
	using Job = std::function<void()>;

	TaskWorker(std::string name, size_t threadCount);
	~TaskWorker();

	TaskWorker(const TaskWorker&) = delete;
	TaskWorker& operator=(const TaskWorker&) = delete;

	// Returns the job id, or 0 when the worker is stopping.
	uint64_t Enqueue(std::string label, Job job);

	// Waits up to `timeout` for queued work, then joins the threads. Jobs still
	// queued at the deadline are dropped; a job already running is never
	// interrupted, so the join lasts until it returns. Jobs must bound their own
	// blocking calls. Returns true when everything drained.
	bool Stop(std::chrono::milliseconds timeout);

	bool WaitIdle(std::chrono::milliseconds timeout);
	TaskWorkerStats GetStats() const;
	const std::string& Name() const { return name_; }

private:
	struct QueuedJob {
		uint64_t jobId = 0;
		std::string label;
		Job job;
	};

	void ThreadMain();
	void RunJob(QueuedJob& job);

	std::string name_;
	std::vector<std::thread> threads_;

	mutable std::mutex mutex_;
	std::condition_variable workAvailable_;
	std::condition_variable idle_;
	std::queue<QueuedJob> queue_;
	size_t running_ = 0;
	bool accepting_ = true;
	bool shutdown_ = false;

	std::atomic<uint64_t> nextJobId_{ 1 };
	std::atomic<uint32_t> completed_{ 0 };
	std::atomic<uint32_t> failed_{ 0 };
};

} // namespace sandstats
