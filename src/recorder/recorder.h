#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "absl/container/flat_hash_map.h"
#include "../common/request.h"
#include "../histogram/histogram.h"
#include "correction_mode.h"

namespace Cadence {

struct RecorderCounters {
	uint64_t completed = 0;
	uint64_t timeout = 0;
	uint64_t error = 0;

	uint64_t Total() const { return completed + timeout + error; }
};

/**
 * Per-worker sink for finished attempts. Owns the worker's histograms, so the
 * hot path takes no locks; shards are merged by the Aggregator after the
 * worker has stopped.
 *
 * Latency is completion_time - intended_time, in microseconds. Timeouts are
 * recorded at their pinned completion time; errors carry no completion time
 * and are only counted.
 */
class Recorder {
public:
	/**
	 * @param options Layout shared by every shard of a run
	 * @param mode Run-wide correction mode; only at_recording changes what Record() does
	 * @param expected_interval_us Interval used for at_recording correction
	 */
	Recorder(const HistogramOptions& options, CorrectionMode mode, int64_t expected_interval_us);

	Recorder(const Recorder&) = delete;
	Recorder& operator=(const Recorder&) = delete;

	void Record(RequestAttempt&& attempt);

	const Histogram& raw() const { return raw_; }
	// Non-null only for at_recording.
	const Histogram* corrected() const { return corrected_ ? &*corrected_ : nullptr; }
	const RecorderCounters& counters() const { return counters_; }
	const absl::flat_hash_map<std::string, uint64_t>& error_reasons() const { return error_reasons_; }
	CorrectionMode mode() const { return mode_; }
	int64_t expected_interval_us() const { return expected_interval_us_; }

private:
	CorrectionMode mode_;
	int64_t expected_interval_us_;
	Histogram raw_;
	std::optional<Histogram> corrected_;
	RecorderCounters counters_;
	absl::flat_hash_map<std::string, uint64_t> error_reasons_;
};

}  // namespace Cadence
