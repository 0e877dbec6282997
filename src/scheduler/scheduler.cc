#include "scheduler.h"

#include <algorithm>
#include <cmath>
#include <random>

#include <glog/logging.h>

#include "absl/strings/ascii.h"
#include "../common/errors.h"

namespace Cadence {

ArrivalDistribution ParseArrivalDistribution(const std::string& value) {
	std::string name = absl::AsciiStrToLower(absl::StripAsciiWhitespace(value));
	if (name == "constant") {
		return ArrivalDistribution::kConstant;
	}
	if (name == "poisson") {
		return ArrivalDistribution::kPoisson;
	}
	throw ConfigurationError("Unknown arrival_distribution '" + value + "' (expected constant or poisson)");
}

const char* ArrivalDistributionName(ArrivalDistribution distribution) {
	switch (distribution) {
		case ArrivalDistribution::kConstant: return "constant";
		case ArrivalDistribution::kPoisson: return "poisson";
	}
	return "unknown";
}

Scheduler::Scheduler(const ScheduleOptions& options, Clock& clock)
	: options_(options), clock_(clock) {
	if (!(options_.rate_per_sec > 0) || !std::isfinite(options_.rate_per_sec)) {
		throw ConfigurationError("target_rate must be a positive number");
	}
	if (options_.duration <= Duration::zero() && options_.total_count == 0) {
		throw ConfigurationError("Run needs a duration or a total count");
	}
	if (options_.drift_tolerance < Duration::zero()) {
		throw ConfigurationError("drift_tolerance must not be negative");
	}
}

Duration Scheduler::IntendedOffset(uint64_t index) const {
	const long double nanos = static_cast<long double>(index) * 1e9L / options_.rate_per_sec;
	return Duration(static_cast<int64_t>(nanos));
}

uint64_t Scheduler::ExpectedTickCount() const {
	uint64_t by_duration = 0;
	if (options_.duration > Duration::zero()) {
		const long double seconds = static_cast<long double>(options_.duration.count()) / 1e9L;
		by_duration = static_cast<uint64_t>(std::ceil(seconds * options_.rate_per_sec));
	}
	if (options_.total_count == 0) {
		return by_duration;
	}
	if (by_duration == 0) {
		return options_.total_count;
	}
	return std::min(options_.total_count, by_duration);
}

ScheduleStats Scheduler::Run(TickSink& sink, const absl::Notification& stop) {
	ScheduleStats stats;
	stats.origin = clock_.Now();
	const bool time_bounded = options_.duration > Duration::zero();
	const TimePoint end = stats.origin + options_.duration;

	std::mt19937_64 rng(options_.seed);
	// Gaps in seconds, mean 1 / rate.
	std::exponential_distribution<double> gap(options_.rate_per_sec);
	long double poisson_offset_ns = 0;

	int64_t total_drift_ns = 0;

	LOG(INFO) << "Scheduler starting: " << options_.rate_per_sec << " req/s, "
		<< ArrivalDistributionName(options_.distribution) << " arrivals, up to "
		<< ExpectedTickCount() << " ticks";

	for (uint64_t i = 0; options_.total_count == 0 || i < options_.total_count; ++i) {
		Duration offset;
		if (options_.distribution == ArrivalDistribution::kConstant) {
			offset = IntendedOffset(i);
		} else {
			if (i > 0) {
				poisson_offset_ns += static_cast<long double>(gap(rng)) * 1e9L;
			}
			offset = Duration(static_cast<int64_t>(poisson_offset_ns));
		}

		const TimePoint intended = stats.origin + offset;
		if (time_bounded && intended >= end) {
			break;
		}
		if (!clock_.SleepUntil(intended, &stop) || stop.HasBeenNotified()) {
			VLOG(1) << "Scheduler stopped after " << stats.ticks_issued << " ticks";
			break;
		}

		const Duration drift = std::max(clock_.Now() - intended, Duration::zero());
		total_drift_ns += drift.count();
		stats.max_drift = std::max(stats.max_drift, drift);
		if (drift > options_.drift_tolerance) {
			++stats.overruns;
			LOG_EVERY_N(WARNING, kHotPathWarnEvery) << "Scheduler woke " << ToMicros(drift)
				<< "us late for tick " << i << " (" << google::COUNTER << " late ticks so far)";
		}

		ScheduledTick tick;
		tick.index = i;
		tick.intended_time = intended;
		sink.Submit(tick);
		++stats.ticks_issued;
	}

	stats.finished_at = clock_.Now();
	if (stats.ticks_issued > 0) {
		stats.mean_drift = Duration(total_drift_ns / static_cast<int64_t>(stats.ticks_issued));
	}
	if (stats.overruns > 0) {
		LOG(WARNING) << stats.overruns << " of " << stats.ticks_issued << " ticks fired more than "
			<< ToMicros(options_.drift_tolerance) << "us late (max " << ToMicros(stats.max_drift) << "us)";
	}
	VLOG(1) << "Scheduler issued " << stats.ticks_issued << " ticks, mean drift "
		<< ToMicros(stats.mean_drift) << "us";
	return stats;
}

}  // namespace Cadence
