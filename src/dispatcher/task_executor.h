#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

namespace Cadence {

/**
 * Fixed thread pool returning a future per task. Futures come from
 * std::packaged_task, so dropping one never blocks the caller.
 */
class TaskExecutor {
public:
	explicit TaskExecutor(size_t num_threads = 4);
	~TaskExecutor();

	TaskExecutor(const TaskExecutor&) = delete;
	TaskExecutor& operator=(const TaskExecutor&) = delete;

	template<typename Callback>
	auto Submit(Callback&& callback) -> std::future<decltype(callback())> {
		using ReturnType = decltype(callback());

		auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<Callback>(callback));
		auto future = task->get_future();

		{
			std::lock_guard<std::mutex> lock(queue_mutex_);
			if (stop_) {
				throw std::runtime_error("TaskExecutor is stopped");
			}
			tasks_.emplace([task]() { (*task)(); });
		}

		condition_.notify_one();
		return future;
	}

	// Runs every queued task, then joins the workers.
	void Stop();

	size_t num_threads() const { return workers_.size(); }
	size_t pending() const;

private:
	void WorkerThread();

	std::vector<std::thread> workers_;
	std::queue<std::function<void()>> tasks_;
	mutable std::mutex queue_mutex_;
	std::condition_variable condition_;
	std::atomic<bool> stop_{false};
};

}  // namespace Cadence
