#include "aggregator.h"

#include <iomanip>
#include <sstream>

#include <glog/logging.h>

#include "../recorder/corrector.h"

namespace Cadence {

Aggregator::Aggregator(const HistogramOptions& options, CorrectionMode mode, int64_t expected_interval_us)
	: options_(options), mode_(mode), expected_interval_us_(expected_interval_us), raw_(options) {
	if (mode_ == CorrectionMode::kAtRecording) {
		corrected_.emplace(options);
	}
}

void Aggregator::AddShard(const Recorder& recorder) {
	raw_.Add(recorder.raw());
	if (corrected_ && recorder.corrected() != nullptr) {
		corrected_->Add(*recorder.corrected());
	}
	const RecorderCounters& counters = recorder.counters();
	counters_.completed += counters.completed;
	counters_.timeout += counters.timeout;
	counters_.error += counters.error;
	for (const auto& entry : recorder.error_reasons()) {
		error_reasons_[entry.first] += entry.second;
	}
	++shards_;
}

void Aggregator::SetDispatchStats(const DispatchStats& stats) {
	dispatch_stats_ = stats;
}

void Aggregator::SetScheduleStats(const ScheduleStats& stats) {
	schedule_stats_ = stats;
}

void Aggregator::SetClosedLoopStats(const ClosedLoopStats& stats) {
	closed_loop_stats_ = stats;
}

RunReport Aggregator::Finalize(const std::string& dispatch_model, double target_rate, Duration elapsed) const {
	RunReport report;
	report.dispatch_model = dispatch_model;
	report.correction_mode = mode_;
	report.expected_interval_us = expected_interval_us_;
	report.target_rate = target_rate;
	report.elapsed = elapsed;

	report.total_completed = counters_.completed;
	report.total_timeout = counters_.timeout;
	report.total_error = counters_.error;
	report.error_reasons = error_reasons_;

	if (dispatch_stats_) {
		report.total_issued = dispatch_stats_->issued;
		report.total_dropped = dispatch_stats_->dropped;
		report.total_abandoned = dispatch_stats_->abandoned;
		report.max_queue_depth_observed = dispatch_stats_->max_queue_depth;
		report.max_in_flight_observed = dispatch_stats_->max_in_flight;
	} else if (closed_loop_stats_) {
		report.total_issued = closed_loop_stats_->issued;
		report.skipped_sends = closed_loop_stats_->skipped_sends;
	} else {
		report.total_issued = counters_.Total();
	}
	if (schedule_stats_) {
		report.max_drift = schedule_stats_->max_drift;
		report.mean_drift = schedule_stats_->mean_drift;
		report.overruns = schedule_stats_->overruns;
	}

	const double seconds = std::chrono::duration<double>(elapsed).count();
	if (seconds > 0) {
		report.achieved_rate = static_cast<double>(counters_.Total()) / seconds;
	}

	auto raw = std::make_shared<Histogram>(raw_);
	report.raw = LatencyStats::ComputeSummary(*raw);
	report.raw_histogram = raw;

	std::shared_ptr<Histogram> corrected;
	if (mode_ == CorrectionMode::kAtRecording && corrected_) {
		corrected = std::make_shared<Histogram>(*corrected_);
	} else if (mode_ == CorrectionMode::kPostHoc) {
		corrected = std::make_shared<Histogram>(CorrectHistogram(raw_, expected_interval_us_));
	}
	if (corrected) {
		report.corrected = LatencyStats::ComputeSummary(*corrected);
		report.corrected_histogram = corrected;
	}

	if (!report.Reconciles()) {
		LOG(ERROR) << "Accounting mismatch: issued=" << report.total_issued << " completed="
			<< report.total_completed << " timeout=" << report.total_timeout << " error="
			<< report.total_error << " dropped=" << report.total_dropped;
	}
	VLOG(1) << "Merged " << shards_ << " shards into " << raw_.TotalCount() << " samples";
	return report;
}

void Aggregator::FormatReport(std::ostream& out, const RunReport& report) {
	const std::ios::fmtflags saved_flags = out.flags();
	const std::streamsize saved_precision = out.precision();

	out << "dispatch model:    " << report.dispatch_model << "\n";
	out << "correction:        " << CorrectionModeName(report.correction_mode);
	if (report.correction_mode != CorrectionMode::kNone) {
		out << " (interval " << report.expected_interval_us << "us)";
	}
	out << "\n";
	out << std::fixed << std::setprecision(2);
	out << "elapsed:           " << std::chrono::duration<double>(report.elapsed).count() << "s\n";
	out << "rate:              " << report.achieved_rate << " achieved / " << report.target_rate
		<< " target req/s\n";
	out << "issued:            " << report.total_issued << "\n";
	out << "  completed:       " << report.total_completed << "\n";
	out << "  timeout:         " << report.total_timeout;
	if (report.total_abandoned > 0) {
		out << " (" << report.total_abandoned << " abandoned at drain)";
	}
	out << "\n";
	out << "  error:           " << report.total_error << "\n";
	for (const auto& entry : report.error_reasons) {
		out << "    " << entry.first << ": " << entry.second << "\n";
	}
	out << "  dropped:         " << report.total_dropped << "\n";
	if (report.skipped_sends > 0) {
		out << "skipped sends:     " << report.skipped_sends << "\n";
	}
	out << "max queue depth:   " << report.max_queue_depth_observed << "\n";
	out << "max in flight:     " << report.max_in_flight_observed << "\n";
	out << "schedule drift:    max " << ToMicros(report.max_drift) << "us, mean "
		<< ToMicros(report.mean_drift) << "us, " << report.overruns << " overruns\n";
	out << "\n";
	out.flags(saved_flags);
	out.precision(saved_precision);

	LatencyStats::PrintTable(out, report.raw, report.corrected ? &*report.corrected : nullptr);
}

void Aggregator::LogReport(const RunReport& report) {
	std::ostringstream out;
	FormatReport(out, report);
	LOG(INFO) << "Run report:\n" << out.str();
	if (report.total_dropped > 0) {
		LOG(WARNING) << report.total_dropped << " ticks were shed; the target could not keep up with "
			<< report.target_rate << " req/s";
	}
}

}  // namespace Cadence
