/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

task_worker.cpp implementation.*/

#include "task_worker.hpp"

#include "logger.hpp"

#include <algorithm>

namespace sandstats {

TaskWorker::TaskWorker(std::string name, size_t threadCount)
	: name_(std::move(name)) {
	threadCount = std::max<size_t>(1, threadCount);
	threads_.reserve(threadCount);
	for (size_t i = 0; i < threadCount; ++i)
		threads_.emplace_back(&TaskWorker::ThreadMain, this);
}

TaskWorker::~TaskWorker() {
	Stop(std::chrono::milliseconds{ 0 });
}

/*
=============
TaskWorker::Enqueue

Queue a job for asynchronous execution and return its id.
=============
*/
uint64_t TaskWorker::Enqueue(std::string label, Job job) {
	const uint64_t jobId = nextJobId_.fetch_add(1);
	{
		std::lock_guard<std::mutex> lock(mutex_);
		if (!accepting_) {
			Logf(LogLevel::Debug, "{}: rejected job '{}' during shutdown", name_, label);
			return 0;
		}
		queue_.push(QueuedJob{ jobId, std::move(label), std::move(job) });
	}

	workAvailable_.notify_one();
	return jobId;
}

/*
=============
TaskWorker::Stop

Past the deadline only the running jobs are waited for; threads are never
detached because their jobs reference the owner's state.
=============
*/
bool TaskWorker::Stop(std::chrono::milliseconds timeout) {
	bool drained = false;
	size_t dropped = 0;
	size_t inFlight = 0;
	{
		std::unique_lock<std::mutex> lock(mutex_);
		if (shutdown_)
			return true;

		accepting_ = false;
		drained = idle_.wait_for(lock, timeout, [this] {
			return queue_.empty() && running_ == 0;
		});

		dropped = queue_.size();
		inFlight = running_;
		std::queue<QueuedJob>().swap(queue_);
		shutdown_ = true;
	}

	workAvailable_.notify_all();
	if (inFlight > 0)
		Logf(LogLevel::Warn, "{}: drain timeout passed, waiting for {} running job(s)", name_, inFlight);
	for (std::thread& thread : threads_) {
		if (thread.joinable())
			thread.join();
	}

	if (dropped > 0)
		Logf(LogLevel::Warn, "{}: dropped {} queued job(s) at shutdown", name_, dropped);

	return drained;
}

/*
=============
TaskWorker::WaitIdle

Block until the queue is empty and no job is running, or the timeout passes.
=============
*/
bool TaskWorker::WaitIdle(std::chrono::milliseconds timeout) {
	std::unique_lock<std::mutex> lock(mutex_);
	return idle_.wait_for(lock, timeout, [this] {
		return queue_.empty() && running_ == 0;
	});
}

TaskWorkerStats TaskWorker::GetStats() const {
	TaskWorkerStats stats;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		stats.pending = static_cast<uint32_t>(queue_.size() + running_);
	}
	stats.completed = completed_.load();
	stats.failed = failed_.load();
	return stats;
}

/*
=============
TaskWorker::ThreadMain

Processes queued jobs until shutdown.
=============
*/
void TaskWorker::ThreadMain() {
	while (true) {
		QueuedJob job;
		{
			std::unique_lock<std::mutex> lock(mutex_);
			workAvailable_.wait(lock, [this] {
				return shutdown_ || !queue_.empty();
			});
			if (shutdown_ && queue_.empty())
				return;

			job = std::move(queue_.front());
			queue_.pop();
			++running_;
		}

		RunJob(job);

		{
			std::lock_guard<std::mutex> lock(mutex_);
			--running_;
		}
		idle_.notify_all();
	}
}

void TaskWorker::RunJob(QueuedJob& job) {
	const auto startTime = std::chrono::steady_clock::now();
	bool success = true;
	try {
		job.job();
	}
	catch (const std::exception& e) {
		success = false;
		Logf(LogLevel::Error, "{}: job {} ({}) threw exception: {}", name_, job.jobId, job.label, e.what());
	}
	catch (...) {
		success = false;
		Logf(LogLevel::Error, "{}: job {} ({}) threw unknown exception", name_, job.jobId, job.label);
	}

	const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
		std::chrono::steady_clock::now() - startTime).count();

	if (success) {
		const uint32_t completed = ++completed_;
		Logf(LogLevel::Trace, "{}: job {} ({}) succeeded in {} ms (completed: {}, failed: {})",
			name_, job.jobId, job.label, elapsedMs, completed, failed_.load());
	}
	else {
		const uint32_t failed = ++failed_;
		Logf(LogLevel::Warn, "{}: job {} ({}) failed in {} ms (completed: {}, failed: {})",
			name_, job.jobId, job.label, elapsedMs, completed_.load(), failed);
	}
}

} // namespace sandstats
