#include "attempt.h"

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <string>

#include <glog/logging.h>

namespace Cadence {

namespace {

void MarkError(RequestAttempt& attempt, Clock& clock, std::string reason) {
	attempt.outcome = AttemptOutcome::kError;
	attempt.error_reason = std::move(reason);
	attempt.completion_time = clock.Now();
}

void PinTimeout(RequestAttempt& attempt, TimePoint deadline) {
	attempt.outcome = AttemptOutcome::kTimeout;
	attempt.completion_time = deadline;
}

}  // namespace

RequestAttempt ExecuteAttempt(Target& target, Clock& clock, const ScheduledTick& tick, Duration timeout) {
	RequestAttempt attempt;
	attempt.index = tick.index;
	attempt.intended_time = tick.intended_time;
	attempt.sent_time = clock.Now();
	const TimePoint deadline = attempt.sent_time + timeout;

	InvokeContext context;
	context.index = tick.index;
	context.intended_time = tick.intended_time;
	context.sent_time = attempt.sent_time;
	context.deadline = deadline;
	context.cancel = std::make_shared<CancellationToken>();

	std::future<InvokeResult> pending;
	try {
		pending = target.Invoke(context);
	} catch (const std::exception& e) {
		MarkError(attempt, clock, e.what());
		return attempt;
	} catch (...) {
		MarkError(attempt, clock, "unknown exception");
		return attempt;
	}
	if (!pending.valid()) {
		MarkError(attempt, clock, "target returned no result");
		return attempt;
	}

	// The remaining budget comes from the injected clock, the wait itself is
	// real time. A result that is already there wins over an expired budget.
	const Duration remaining = deadline - clock.Now();
	const bool ready = pending.wait_for(std::chrono::seconds(0)) == std::future_status::ready ||
		(remaining > Duration::zero() && pending.wait_for(remaining) == std::future_status::ready);
	if (!ready) {
		context.cancel->Cancel();
		PinTimeout(attempt, deadline);
		VLOG(4) << "Request " << tick.index << " timed out";
		return attempt;
	}

	InvokeResult result;
	try {
		result = pending.get();
	} catch (const std::exception& e) {
		MarkError(attempt, clock, e.what());
		return attempt;
	} catch (...) {
		MarkError(attempt, clock, "unknown exception");
		return attempt;
	}

	switch (result.status) {
		case InvokeResult::Status::kSuccess: {
			TimePoint completion = result.completion_time == TimePoint{} ? clock.Now() : result.completion_time;
			if (completion > deadline) {
				PinTimeout(attempt, deadline);
			} else {
				attempt.outcome = AttemptOutcome::kSuccess;
				attempt.completion_time = completion;
			}
			break;
		}
		case InvokeResult::Status::kTimeout:
			PinTimeout(attempt, deadline);
			break;
		case InvokeResult::Status::kError:
			MarkError(attempt, clock, result.reason);
			break;
	}
	return attempt;
}

}  // namespace Cadence
