#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "absl/synchronization/notification.h"
#include "../common/clock.h"
#include "../common/config.h"
#include "../histogram/histogram.h"
#include "../recorder/correction_mode.h"
#include "../recorder/recorder.h"
#include "target.h"

namespace Cadence {

struct ClosedLoopOptions {
	size_t connections = kDefaultConnections;
	// Aggregate rate across all connections.
	double rate_per_sec = kDefaultTargetRate;
	// Zero means unbounded; at least one of duration and total_count must be set.
	Duration duration{0};
	uint64_t total_count = 0;
	Duration timeout = std::chrono::milliseconds(kDefaultTimeoutMs);
	HistogramOptions histogram;
	CorrectionMode correction_mode = CorrectionMode::kNone;
	int64_t expected_interval_us = 0;
};

struct ClosedLoopStats {
	uint64_t issued = 0;
	// Send slots that passed while a connection was still waiting on a reply.
	uint64_t skipped_sends = 0;
	TimePoint origin;
	TimePoint finished_at;
};

/**
 * Emulates a conventional closed-loop load generator: each connection sends
 * one request, waits for it, then sends the next at
 * max(previous scheduled send + interval, completion). Requests that should
 * have been sent during a stall are never sent, and every latency is measured
 * from the actual send. This is the measurement coordinated omission
 * correction exists for.
 */
class ClosedLoopDriver {
public:
	ClosedLoopDriver(Target* target, Clock& clock, const ClosedLoopOptions& options);

	ClosedLoopDriver(const ClosedLoopDriver&) = delete;
	ClosedLoopDriver& operator=(const ClosedLoopDriver&) = delete;

	// Blocks until the bound is reached or stop is notified.
	ClosedLoopStats Run(const absl::Notification& stop);

	// Pacing interval of a single connection: connections / rate.
	Duration connection_interval() const { return interval_; }

	// One per connection. Read only after Run() returns.
	std::vector<const Recorder*> recorders() const;

	std::exception_ptr failure() const;

private:
	void ConnectionLoop(size_t connection_id, TimePoint origin, const absl::Notification& stop);

	Target* target_;
	Clock& clock_;
	ClosedLoopOptions options_;
	Duration interval_;

	std::vector<std::unique_ptr<Recorder>> recorders_;
	std::atomic<uint64_t> next_index_{0};
	std::atomic<uint64_t> issued_{0};
	std::atomic<uint64_t> skipped_{0};

	mutable absl::Mutex mu_;
	std::exception_ptr failure_ ABSL_GUARDED_BY(mu_);
	absl::Notification failed_;
};

}  // namespace Cadence
