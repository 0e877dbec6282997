#pragma once

#include <cstdint>
#include <ostream>
#include <string>

#include "histogram.h"

namespace Cadence {

class LatencyStats {
public:
	struct Summary {
		double p50_us = 0.0;
		double p75_us = 0.0;
		double p90_us = 0.0;
		double p99_us = 0.0;
		double p999_us = 0.0;
		double p9999_us = 0.0;
		double max_us = 0.0;
		double min_us = 0.0;
		double average_us = 0.0;
		double stddev_us = 0.0;
		int64_t count = 0;
	};

	// Histogram values are expected in microseconds.
	static Summary ComputeSummary(const Histogram& histogram) {
		Summary s{};
		s.count = histogram.TotalCount();
		if (s.count == 0) {
			return s;
		}
		s.min_us = static_cast<double>(histogram.Min());
		s.max_us = static_cast<double>(histogram.Max());
		s.average_us = histogram.Mean();
		s.stddev_us = histogram.StdDev();

		s.p50_us = static_cast<double>(histogram.ValueAtPercentile(50.0));
		s.p75_us = static_cast<double>(histogram.ValueAtPercentile(75.0));
		s.p90_us = static_cast<double>(histogram.ValueAtPercentile(90.0));
		s.p99_us = static_cast<double>(histogram.ValueAtPercentile(99.0));
		s.p999_us = static_cast<double>(histogram.ValueAtPercentile(99.9));
		s.p9999_us = static_cast<double>(histogram.ValueAtPercentile(99.99));
		return s;
	}

	/**
	 * Prints one or two summaries as a percentile table. The corrected column
	 * is omitted when corrected is null.
	 */
	static void PrintTable(std::ostream& out, const Summary& raw, const Summary* corrected);
};

}  // namespace Cadence
