#include "target.h"

#include <utility>

#include "absl/time/time.h"

namespace Cadence {

InvokeResult InvokeResult::Success(TimePoint completion_time) {
	InvokeResult result;
	result.status = Status::kSuccess;
	result.completion_time = completion_time;
	return result;
}

InvokeResult InvokeResult::Error(std::string reason) {
	InvokeResult result;
	result.status = Status::kError;
	result.reason = std::move(reason);
	return result;
}

InvokeResult InvokeResult::Timeout() {
	InvokeResult result;
	result.status = Status::kTimeout;
	return result;
}

void CancellationToken::Cancel() {
	absl::MutexLock lock(&mu_);
	cancelled_ = true;
}

bool CancellationToken::IsCancelled() const {
	absl::MutexLock lock(&mu_);
	return cancelled_;
}

bool CancellationToken::WaitUntil(TimePoint deadline) const {
	return WaitFor(deadline - std::chrono::steady_clock::now());
}

bool CancellationToken::WaitFor(Duration timeout) const {
	absl::MutexLock lock(&mu_);
	if (timeout <= Duration::zero()) {
		return cancelled_;
	}
	return mu_.AwaitWithTimeout(absl::Condition(&cancelled_), absl::FromChrono(timeout));
}

BlockingTarget::BlockingTarget(Function function, size_t num_threads)
	: function_(std::move(function)), executor_(num_threads) {}

std::future<InvokeResult> BlockingTarget::Invoke(const InvokeContext& context) {
	Function function = function_;
	return executor_.Submit([function, context]() { return function(context); });
}

}  // namespace Cadence
