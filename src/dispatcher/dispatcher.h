#pragma once

#include <cstdint>
#include <deque>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "../common/clock.h"
#include "../common/config.h"
#include "../common/tick_sink.h"
#include "../histogram/histogram.h"
#include "../recorder/correction_mode.h"
#include "../recorder/recorder.h"
#include "target.h"

namespace Cadence {

// What Submit() does when every worker is busy.
enum class OverloadPolicy {
	kQueue = 0,  // wait in the tick queue; latency grows, nothing is lost
	kShed = 1    // drop the tick and count it
};

// Accepts "queue" or "shed". Throws ConfigurationError otherwise.
OverloadPolicy ParseOverloadPolicy(const std::string& value);
const char* OverloadPolicyName(OverloadPolicy policy);

struct DispatcherOptions {
	size_t max_in_flight = kDefaultMaxInFlight;
	Duration timeout = std::chrono::milliseconds(kDefaultTimeoutMs);
	OverloadPolicy overload_policy = OverloadPolicy::kQueue;
	HistogramOptions histogram;
	CorrectionMode correction_mode = CorrectionMode::kNone;
	int64_t expected_interval_us = 0;
};

struct WorkerState {
	uint64_t in_flight_count = 0;
	uint64_t queue_depth = 0;
};

struct DispatchStats {
	uint64_t issued = 0;      // ticks passed to Submit
	uint64_t dispatched = 0;  // ticks picked up by a worker
	uint64_t dropped = 0;     // shed, or submitted while not accepting
	uint64_t abandoned = 0;   // still queued when the grace period ran out
	uint64_t max_queue_depth = 0;
	uint64_t max_in_flight = 0;
};

/**
 * Open-loop dispatch. A fixed pool of max_in_flight workers pulls ticks off a
 * single queue, runs each one through ExecuteAttempt and records the result
 * into the worker's own Recorder.
 *
 * Every submitted tick ends up in exactly one place: a recorder (success,
 * timeout, error or abandoned-as-timeout) or the dropped counter.
 */
class Dispatcher : public TickSink {
public:
	/**
	 * @param target Not owned; must outlive the dispatcher
	 * @param clock Must advance in real time while workers wait on the target
	 */
	Dispatcher(Target* target, Clock& clock, const DispatcherOptions& options);
	~Dispatcher();

	Dispatcher(const Dispatcher&) = delete;
	Dispatcher& operator=(const Dispatcher&) = delete;

	void Start();

	void Submit(const ScheduledTick& tick) override;

	/**
	 * Stops accepting ticks and waits up to grace for queued and in-flight
	 * requests. Ticks still queued at the grace deadline are recorded as
	 * timeouts completing at that deadline. Joins the workers.
	 */
	DispatchStats Drain(Duration grace);

	WorkerState Snapshot() const;
	DispatchStats stats() const;

	// One per worker plus one holding abandoned ticks. Read only after Drain().
	std::vector<const Recorder*> recorders() const;

	// First recorder failure (strict range violation), or null.
	std::exception_ptr failure() const;

private:
	void WorkerLoop(size_t worker_id);
	void RecordOrFail(Recorder& recorder, RequestAttempt&& attempt);

	Target* target_;
	Clock& clock_;
	DispatcherOptions options_;

	std::vector<std::unique_ptr<Recorder>> recorders_;
	std::vector<std::thread> workers_;

	mutable absl::Mutex mu_;
	absl::CondVar work_cv_;
	absl::CondVar idle_cv_;
	std::deque<ScheduledTick> queue_ ABSL_GUARDED_BY(mu_);
	uint64_t in_flight_ ABSL_GUARDED_BY(mu_) = 0;
	bool accepting_ ABSL_GUARDED_BY(mu_) = false;
	bool stopping_ ABSL_GUARDED_BY(mu_) = false;
	bool drained_ ABSL_GUARDED_BY(mu_) = false;
	DispatchStats stats_ ABSL_GUARDED_BY(mu_);
	std::exception_ptr failure_ ABSL_GUARDED_BY(mu_);
};

}  // namespace Cadence
