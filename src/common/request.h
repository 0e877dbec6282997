#pragma once

#include <cstdint>
#include <string>

#include "clock.h"

namespace Cadence {

/**
 * One scheduled request. intended_time is derived from the run origin,
 * never from when the previous tick actually fired.
 */
struct ScheduledTick {
	uint64_t index = 0;
	TimePoint intended_time;
};

enum class AttemptOutcome {
	kSuccess = 0,
	kTimeout = 1,
	kError = 2
};

/**
 * A single request as observed by a dispatch worker. Moved into the
 * worker's Recorder once the outcome is known.
 */
struct RequestAttempt {
	uint64_t index = 0;
	TimePoint intended_time;
	TimePoint sent_time;
	TimePoint completion_time;
	AttemptOutcome outcome = AttemptOutcome::kSuccess;
	std::string error_reason;

	// Response time: includes any queueing between intended and sent.
	Duration Latency() const { return completion_time - intended_time; }
	Duration ServiceTime() const { return completion_time - sent_time; }
};

inline const char* AttemptOutcomeName(AttemptOutcome outcome) {
	switch (outcome) {
		case AttemptOutcome::kSuccess: return "success";
		case AttemptOutcome::kTimeout: return "timeout";
		case AttemptOutcome::kError: return "error";
	}
	return "unknown";
}

}  // namespace Cadence
