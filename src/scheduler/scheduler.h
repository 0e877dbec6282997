#pragma once

#include <cstdint>
#include <string>

#include "absl/synchronization/notification.h"
#include "../common/clock.h"
#include "../common/config.h"
#include "../common/tick_sink.h"

namespace Cadence {

enum class ArrivalDistribution {
	kConstant = 0,
	kPoisson = 1
};

// Accepts "constant" or "poisson". Throws ConfigurationError otherwise.
ArrivalDistribution ParseArrivalDistribution(const std::string& value);
const char* ArrivalDistributionName(ArrivalDistribution distribution);

struct ScheduleOptions {
	double rate_per_sec = kDefaultTargetRate;
	// Zero means unbounded; at least one of duration and total_count must be set.
	Duration duration = std::chrono::seconds(kDefaultDurationSec);
	uint64_t total_count = 0;
	ArrivalDistribution distribution = ArrivalDistribution::kConstant;
	uint64_t seed = 0;
	Duration drift_tolerance = std::chrono::microseconds(kDefaultDriftToleranceUs);
};

struct ScheduleStats {
	uint64_t ticks_issued = 0;
	Duration max_drift{0};
	Duration mean_drift{0};
	// Ticks that fired later than drift_tolerance after their deadline.
	uint64_t overruns = 0;
	TimePoint origin;
	TimePoint finished_at;
};

/**
 * The open-loop clock. Tick i is due at origin + offset(i), where offset is
 * computed from the fixed origin (constant: i / rate; poisson: running sum of
 * exponential gaps) and never from when tick i-1 actually fired. A late
 * wakeup still issues the tick with its original intended_time.
 *
 * The scheduler never waits on the sink's requests; a slow target cannot
 * slow the issuance rate.
 */
class Scheduler {
public:
	/**
	 * @param options Throws ConfigurationError for a non-positive rate or a
	 * run with neither duration nor total_count
	 */
	Scheduler(const ScheduleOptions& options, Clock& clock);

	/**
	 * Issues ticks until total_count, until the next deadline reaches
	 * origin + duration, or until stop is notified. The origin is the clock
	 * reading when Run starts.
	 */
	ScheduleStats Run(TickSink& sink, const absl::Notification& stop);

	// Constant mode offset of tick i from the origin.
	Duration IntendedOffset(uint64_t index) const;

	// Ticks a full run issues in constant mode.
	uint64_t ExpectedTickCount() const;

	const ScheduleOptions& options() const { return options_; }

private:
	ScheduleOptions options_;
	Clock& clock_;
};

}  // namespace Cadence
