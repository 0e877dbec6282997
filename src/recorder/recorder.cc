#include "recorder.h"

#include <algorithm>
#include <utility>

#include <glog/logging.h>

#include "../common/errors.h"

namespace Cadence {

Recorder::Recorder(const HistogramOptions& options, CorrectionMode mode, int64_t expected_interval_us)
	: mode_(mode), expected_interval_us_(expected_interval_us), raw_(options) {
	if (mode_ == CorrectionMode::kAtRecording) {
		if (expected_interval_us_ <= 0) {
			throw ConfigurationError("at_recording correction needs a positive expected interval, got " +
					std::to_string(expected_interval_us_) + "us");
		}
		corrected_.emplace(options);
	}
}

void Recorder::Record(RequestAttempt&& attempt) {
	RequestAttempt owned = std::move(attempt);
	if (owned.outcome == AttemptOutcome::kError) {
		++counters_.error;
		++error_reasons_[owned.error_reason.empty() ? "unspecified" : owned.error_reason];
		VLOG(4) << "Request " << owned.index << " failed: " << owned.error_reason;
		return;
	}

	// A completion stamped before its intended time can only come from clock
	// skew in the target; count it as zero and let the histogram clamp it.
	const int64_t latency_us = std::max<int64_t>(ToMicros(owned.Latency()), 0);
	raw_.Record(latency_us);
	if (corrected_) {
		corrected_->RecordCorrected(latency_us, expected_interval_us_);
	}

	// Counted only once the sample is in the histogram.
	if (owned.outcome == AttemptOutcome::kTimeout) {
		++counters_.timeout;
	} else {
		++counters_.completed;
	}
}

}  // namespace Cadence
