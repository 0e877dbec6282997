#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "absl/synchronization/mutex.h"
#include "../common/clock.h"
#include "task_executor.h"

namespace Cadence {

struct InvokeResult {
	enum class Status {
		kSuccess = 0,
		kError = 1,
		kTimeout = 2
	};

	Status status = Status::kSuccess;
	// Left default-constructed when the target does not stamp it; the worker
	// then uses the time it observed the result.
	TimePoint completion_time;
	std::string reason;

	static InvokeResult Success(TimePoint completion_time = TimePoint{});
	static InvokeResult Error(std::string reason);
	static InvokeResult Timeout();
};

/**
 * Cancelled by the dispatch worker once the request deadline passes.
 * Targets that block should wait on it instead of sleeping.
 */
class CancellationToken {
public:
	void Cancel();
	bool IsCancelled() const;

	/**
	 * Blocks until deadline or cancellation, whichever comes first.
	 * @return true if cancelled
	 */
	bool WaitUntil(TimePoint deadline) const;

	// Same as WaitUntil(now + timeout) on the steady clock.
	bool WaitFor(Duration timeout) const;

private:
	mutable absl::Mutex mu_;
	bool cancelled_ ABSL_GUARDED_BY(mu_) = false;
};

struct InvokeContext {
	uint64_t index = 0;
	TimePoint intended_time;
	TimePoint sent_time;
	TimePoint deadline;
	std::shared_ptr<CancellationToken> cancel;
};

/**
 * The system under test. Invoke() must return quickly; the returned future
 * must not block in its destructor, since the dispatcher abandons futures
 * that miss their deadline.
 */
class Target {
public:
	virtual ~Target() = default;

	virtual std::future<InvokeResult> Invoke(const InvokeContext& context) = 0;
};

/**
 * Runs a blocking function on a TaskExecutor. A function that outlives its
 * deadline keeps an executor thread busy until it returns, so it should
 * honor context.cancel.
 */
class BlockingTarget : public Target {
public:
	using Function = std::function<InvokeResult(const InvokeContext&)>;

	BlockingTarget(Function function, size_t num_threads);

	std::future<InvokeResult> Invoke(const InvokeContext& context) override;

private:
	Function function_;
	TaskExecutor executor_;
};

}  // namespace Cadence
