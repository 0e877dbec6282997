#pragma once

#include <chrono>
#include <cstdint>

#include "absl/synchronization/mutex.h"
#include "absl/synchronization/notification.h"

namespace Cadence {

using TimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::nanoseconds;

inline int64_t ToMicros(Duration d) {
	return std::chrono::duration_cast<std::chrono::microseconds>(d).count();
}

/**
 * Time source for the scheduler and dispatch workers.
 * Injected so a run can be replayed against a manual clock.
 */
class Clock {
public:
	virtual ~Clock() = default;

	virtual TimePoint Now() const = 0;

	/**
	 * Blocks until deadline.
	 * @param interrupt Optional stop signal that ends the wait early
	 * @return false if the wait was interrupted
	 */
	virtual bool SleepUntil(TimePoint deadline, const absl::Notification* interrupt) = 0;
};

class SteadyClock : public Clock {
public:
	TimePoint Now() const override { return std::chrono::steady_clock::now(); }
	bool SleepUntil(TimePoint deadline, const absl::Notification* interrupt) override;
};

// Process-wide steady clock.
Clock& DefaultClock();

/**
 * Virtual clock for deterministic tests. SleepUntil jumps straight to the
 * deadline, optionally waking late to emulate a descheduled clock thread.
 */
class ManualClock : public Clock {
public:
	explicit ManualClock(TimePoint start = TimePoint{}) : now_(start) {}

	TimePoint Now() const override;
	bool SleepUntil(TimePoint deadline, const absl::Notification* interrupt) override;

	void Advance(Duration d);
	// Next SleepUntil wakes this much after its deadline.
	void InjectLag(Duration d);
	// Every SleepUntil wakes this much after its deadline.
	void SetPersistentLag(Duration d);

private:
	mutable absl::Mutex mu_;
	TimePoint now_ ABSL_GUARDED_BY(mu_);
	Duration one_shot_lag_ ABSL_GUARDED_BY(mu_){0};
	Duration persistent_lag_ ABSL_GUARDED_BY(mu_){0};
};

}  // namespace Cadence
