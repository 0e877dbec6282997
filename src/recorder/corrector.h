#pragma once

#include <cstdint>
#include <istream>
#include <vector>

#include "../histogram/histogram.h"

namespace Cadence {

/**
 * Post-hoc coordinated omission correction of a histogram recorded without
 * correction (for example the merged raw histogram of a closed-loop run).
 * Throws ConfigurationError when expected_interval is not positive.
 */
Histogram CorrectHistogram(const Histogram& raw, int64_t expected_interval);

/**
 * Builds a corrected histogram from latencies collected by some other
 * closed-loop tool. Input order does not matter.
 */
Histogram CorrectLatencies(const std::vector<int64_t>& latencies, int64_t expected_interval,
		const HistogramOptions& options);

// Raw, uncorrected counterpart of CorrectLatencies for side-by-side reports.
Histogram RecordLatencies(const std::vector<int64_t>& latencies, const HistogramOptions& options);

/**
 * Reads one integer latency per line. Blank lines and lines starting with '#'
 * are skipped; malformed lines are logged and skipped.
 */
std::vector<int64_t> ReadLatencies(std::istream& in);

}  // namespace Cadence
