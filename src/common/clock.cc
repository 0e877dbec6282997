#include "clock.h"

#include <thread>

#include "absl/time/time.h"

namespace Cadence {

bool SteadyClock::SleepUntil(TimePoint deadline, const absl::Notification* interrupt) {
	if (interrupt == nullptr) {
		std::this_thread::sleep_until(deadline);
		return true;
	}
	auto remaining = deadline - std::chrono::steady_clock::now();
	if (remaining <= Duration::zero()) {
		return !interrupt->HasBeenNotified();
	}
	// Returns true when notified before the timeout.
	return !interrupt->WaitForNotificationWithTimeout(
			absl::FromChrono(std::chrono::duration_cast<std::chrono::nanoseconds>(remaining)));
}

Clock& DefaultClock() {
	static SteadyClock clock;
	return clock;
}

TimePoint ManualClock::Now() const {
	absl::MutexLock lock(&mu_);
	return now_;
}

bool ManualClock::SleepUntil(TimePoint deadline, const absl::Notification* interrupt) {
	if (interrupt != nullptr && interrupt->HasBeenNotified()) {
		return false;
	}
	absl::MutexLock lock(&mu_);
	if (deadline > now_) {
		now_ = deadline;
	}
	now_ += one_shot_lag_ + persistent_lag_;
	one_shot_lag_ = Duration::zero();
	return true;
}

void ManualClock::Advance(Duration d) {
	absl::MutexLock lock(&mu_);
	now_ += d;
}

void ManualClock::InjectLag(Duration d) {
	absl::MutexLock lock(&mu_);
	one_shot_lag_ = d;
}

void ManualClock::SetPersistentLag(Duration d) {
	absl::MutexLock lock(&mu_);
	persistent_lag_ = d;
}

}  // namespace Cadence
