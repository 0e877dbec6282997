#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "absl/synchronization/notification.h"
#include "../aggregator/aggregator.h"
#include "../common/clock.h"
#include "../common/config.h"
#include "../dispatcher/dispatcher.h"
#include "../dispatcher/target.h"
#include "../histogram/histogram.h"
#include "../recorder/correction_mode.h"
#include "../scheduler/scheduler.h"

namespace Cadence {

enum class DispatchModel {
	kOpenLoop = 0,    // scheduler-driven, latency from intended time
	kClosedLoop = 1   // connection-driven, latency from actual send
};

// Accepts "open_loop" or "closed_loop". Throws ConfigurationError otherwise.
DispatchModel ParseDispatchModel(const std::string& value);
const char* DispatchModelName(DispatchModel model);

struct RunConfig {
	double target_rate = kDefaultTargetRate;
	// Zero means unbounded; at least one of duration and total_count must be set.
	Duration duration = std::chrono::seconds(kDefaultDurationSec);
	uint64_t total_count = 0;
	size_t max_in_flight = kDefaultMaxInFlight;
	Duration timeout = std::chrono::milliseconds(kDefaultTimeoutMs);
	ArrivalDistribution arrival_distribution = ArrivalDistribution::kConstant;
	HistogramOptions histogram;
	CorrectionMode correction_mode = CorrectionMode::kNone;
	// Zero derives the interval from the rate.
	int64_t expected_interval_us = 0;
	OverloadPolicy overload_policy = OverloadPolicy::kQueue;
	DispatchModel dispatch_model = DispatchModel::kOpenLoop;
	size_t connections = kDefaultConnections;
	Duration grace = std::chrono::milliseconds(kDefaultGraceMs);
	Duration drift_tolerance = std::chrono::microseconds(kDefaultDriftToleranceUs);
	uint64_t seed = 0;

	/**
	 * expected_interval_us if set, otherwise the interval between two
	 * requests on one sender: 1/rate open loop, connections/rate closed loop.
	 */
	int64_t EffectiveExpectedIntervalUs() const;
};

// Every problem with config, empty when it is runnable.
std::vector<std::string> ValidateRunConfig(const RunConfig& config);

/**
 * Runs one load test: validates the configuration, issues ticks (open loop)
 * or drives connections (closed loop), drains, merges and reports.
 *
 * Example:
 *   RunConfig config;
 *   config.target_rate = 1000;
 *   LoadEngine engine(config, &target);
 *   RunReport report = engine.Run();
 */
class LoadEngine {
public:
	/**
	 * Throws ConfigurationError listing every invalid setting; nothing is
	 * issued in that case.
	 * @param target Not owned; must outlive the engine
	 */
	LoadEngine(const RunConfig& config, Target* target, Clock& clock = DefaultClock());

	/**
	 * Blocks until the run completes or Stop() is called, then drains.
	 * Rethrows a recording failure (strict range violation) after the drain.
	 */
	RunReport Run();

	// Ends the issuance phase early. Safe from any thread, repeatable.
	void Stop();

	const RunConfig& config() const { return config_; }

private:
	RunReport RunOpenLoop();
	RunReport RunClosedLoop();

	RunConfig config_;
	Target* target_;
	Clock& clock_;

	absl::Notification stop_;
	std::once_flag stop_once_;
};

}  // namespace Cadence
