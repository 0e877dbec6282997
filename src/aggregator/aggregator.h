#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include "../common/clock.h"
#include "../dispatcher/closed_loop_driver.h"
#include "../dispatcher/dispatcher.h"
#include "../histogram/histogram.h"
#include "../histogram/latency_stats.h"
#include "../recorder/correction_mode.h"
#include "../recorder/recorder.h"
#include "../scheduler/scheduler.h"

namespace Cadence {

/**
 * Outcome of one run. Every issued tick is accounted for exactly once:
 * total_issued == total_completed + total_timeout + total_error + total_dropped.
 * Abandoned ticks are a subset of total_timeout.
 */
struct RunReport {
	std::string dispatch_model;
	CorrectionMode correction_mode = CorrectionMode::kNone;
	int64_t expected_interval_us = 0;

	LatencyStats::Summary raw;
	std::optional<LatencyStats::Summary> corrected;
	std::shared_ptr<const Histogram> raw_histogram;
	std::shared_ptr<const Histogram> corrected_histogram;

	uint64_t total_issued = 0;
	uint64_t total_completed = 0;
	uint64_t total_timeout = 0;
	uint64_t total_error = 0;
	uint64_t total_dropped = 0;
	uint64_t total_abandoned = 0;
	// Closed loop only.
	uint64_t skipped_sends = 0;
	std::map<std::string, uint64_t> error_reasons;

	double target_rate = 0.0;
	double achieved_rate = 0.0;
	uint64_t max_queue_depth_observed = 0;
	uint64_t max_in_flight_observed = 0;

	Duration max_drift{0};
	Duration mean_drift{0};
	uint64_t overruns = 0;
	Duration elapsed{0};

	bool Reconciles() const {
		return total_issued == total_completed + total_timeout + total_error + total_dropped;
	}
};

/**
 * Merges per-worker Recorder shards once the workers have stopped and turns
 * them into a RunReport. Applies post-hoc correction to the merged raw
 * histogram when the run asked for it.
 */
class Aggregator {
public:
	Aggregator(const HistogramOptions& options, CorrectionMode mode, int64_t expected_interval_us);

	// Throws ConfigurationError if the shard's layout differs.
	void AddShard(const Recorder& recorder);

	void SetDispatchStats(const DispatchStats& stats);
	void SetScheduleStats(const ScheduleStats& stats);
	void SetClosedLoopStats(const ClosedLoopStats& stats);

	RunReport Finalize(const std::string& dispatch_model, double target_rate, Duration elapsed) const;

	const Histogram& merged_raw() const { return raw_; }

	static void LogReport(const RunReport& report);
	static void FormatReport(std::ostream& out, const RunReport& report);

private:
	HistogramOptions options_;
	CorrectionMode mode_;
	int64_t expected_interval_us_;

	Histogram raw_;
	std::optional<Histogram> corrected_;
	RecorderCounters counters_;
	std::map<std::string, uint64_t> error_reasons_;
	size_t shards_ = 0;

	std::optional<DispatchStats> dispatch_stats_;
	std::optional<ScheduleStats> schedule_stats_;
	std::optional<ClosedLoopStats> closed_loop_stats_;
};

}  // namespace Cadence
