#include "corrector.h"

#include <string>

#include <glog/logging.h>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "../common/errors.h"

namespace Cadence {

namespace {

void CheckInterval(int64_t expected_interval) {
	if (expected_interval <= 0) {
		throw ConfigurationError("expected_interval must be positive, got " + std::to_string(expected_interval));
	}
}

}  // namespace

Histogram CorrectHistogram(const Histogram& raw, int64_t expected_interval) {
	CheckInterval(expected_interval);
	Histogram corrected = raw.CopyCorrectedForCoordinatedOmission(expected_interval);
	VLOG(1) << "Post-hoc correction with interval " << expected_interval << ": "
		<< raw.TotalCount() << " -> " << corrected.TotalCount() << " samples";
	return corrected;
}

Histogram CorrectLatencies(const std::vector<int64_t>& latencies, int64_t expected_interval,
		const HistogramOptions& options) {
	CheckInterval(expected_interval);
	Histogram corrected(options);
	for (int64_t latency : latencies) {
		corrected.RecordCorrected(latency, expected_interval);
	}
	return corrected;
}

Histogram RecordLatencies(const std::vector<int64_t>& latencies, const HistogramOptions& options) {
	Histogram raw(options);
	for (int64_t latency : latencies) {
		raw.Record(latency);
	}
	return raw;
}

std::vector<int64_t> ReadLatencies(std::istream& in) {
	std::vector<int64_t> latencies;
	std::string line;
	size_t line_number = 0;
	size_t malformed = 0;
	while (std::getline(in, line)) {
		++line_number;
		absl::string_view trimmed = absl::StripAsciiWhitespace(line);
		if (trimmed.empty() || trimmed.front() == '#') {
			continue;
		}
		int64_t value = 0;
		if (!absl::SimpleAtoi(trimmed, &value)) {
			++malformed;
			LOG_FIRST_N(WARNING, 10) << "Skipping malformed latency on line " << line_number << ": '"
				<< trimmed << "'";
			continue;
		}
		latencies.push_back(value);
	}
	if (malformed > 0) {
		LOG(WARNING) << "Skipped " << malformed << " malformed latency lines";
	}
	return latencies;
}

}  // namespace Cadence
