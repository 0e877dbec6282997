#include "task_executor.h"

#include <glog/logging.h>

namespace Cadence {

TaskExecutor::TaskExecutor(size_t num_threads) {
	if (num_threads == 0) {
		num_threads = 1;
	}
	for (size_t i = 0; i < num_threads; ++i) {
		workers_.emplace_back(&TaskExecutor::WorkerThread, this);
	}
	VLOG(3) << "TaskExecutor started with " << num_threads << " threads";
}

TaskExecutor::~TaskExecutor() {
	Stop();
}

void TaskExecutor::Stop() {
	{
		std::lock_guard<std::mutex> lock(queue_mutex_);
		stop_ = true;
	}
	condition_.notify_all();

	for (auto& worker : workers_) {
		if (worker.joinable()) {
			worker.join();
		}
	}
}

size_t TaskExecutor::pending() const {
	std::lock_guard<std::mutex> lock(queue_mutex_);
	return tasks_.size();
}

void TaskExecutor::WorkerThread() {
	while (true) {
		std::function<void()> task;

		{
			std::unique_lock<std::mutex> lock(queue_mutex_);
			condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

			if (stop_ && tasks_.empty()) {
				return;
			}

			task = std::move(tasks_.front());
			tasks_.pop();
		}

		// packaged_task stores any exception in its future.
		task();
	}
}

}  // namespace Cadence
