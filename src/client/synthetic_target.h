#pragma once

#include <atomic>
#include <cstdint>
#include <future>
#include <mutex>
#include <random>

#include "absl/synchronization/mutex.h"
#include "../common/clock.h"
#include "../dispatcher/target.h"
#include "../dispatcher/task_executor.h"

namespace Cadence {

struct SyntheticTargetOptions {
	Duration service_time = std::chrono::milliseconds(1);
	// Uniform in [-jitter, +jitter] around service_time, never below zero.
	Duration service_jitter{0};
	double error_rate = 0.0;
	// Stall window relative to the first request; no stall when stall is zero.
	Duration stall_at{0};
	Duration stall{0};
	uint64_t seed = 1;
	size_t threads = 64;
};

/**
 * In-process stand-in for a real service. Each request sleeps for its
 * service time on an executor thread. During the stall window the service
 * freezes: requests arriving inside it finish stall-end + service_time
 * later, requests already in service are pushed back by the stall length.
 * Honors the cancel token, so timed-out requests free their thread at once.
 */
class SyntheticTarget : public Target {
public:
	explicit SyntheticTarget(const SyntheticTargetOptions& options);

	std::future<InvokeResult> Invoke(const InvokeContext& context) override;

	uint64_t served() const { return served_.load(); }

private:
	InvokeResult Serve(const InvokeContext& context);
	Duration DrawServiceTime(bool* fail);

	SyntheticTargetOptions options_;

	absl::Mutex rng_mu_;
	std::mt19937_64 rng_ ABSL_GUARDED_BY(rng_mu_);

	std::once_flag origin_once_;
	TimePoint origin_;
	std::atomic<uint64_t> served_{0};

	// Last, so its threads stop before the state they use is destroyed.
	TaskExecutor executor_;
};

}  // namespace Cadence
