#include "latency_stats.h"

#include <iomanip>
#include <utility>
#include <vector>

namespace Cadence {

void LatencyStats::PrintTable(std::ostream& out, const Summary& raw, const Summary* corrected) {
	const std::vector<std::pair<const char*, double Summary::*>> rows = {
		{"p50", &Summary::p50_us},
		{"p75", &Summary::p75_us},
		{"p90", &Summary::p90_us},
		{"p99", &Summary::p99_us},
		{"p99.9", &Summary::p999_us},
		{"p99.99", &Summary::p9999_us},
		{"max", &Summary::max_us},
		{"mean", &Summary::average_us},
		{"stddev", &Summary::stddev_us},
	};

	const std::ios::fmtflags saved_flags = out.flags();
	const std::streamsize saved_precision = out.precision();

	out << std::left << std::setw(10) << "" << std::right << std::setw(16) << "raw (ms)";
	if (corrected) {
		out << std::setw(18) << "corrected (ms)";
	}
	out << "\n";

	out << std::fixed << std::setprecision(3);
	for (const auto& [name, field] : rows) {
		out << std::left << std::setw(10) << name << std::right << std::setw(16) << raw.*field / 1000.0;
		if (corrected) {
			out << std::setw(18) << corrected->*field / 1000.0;
		}
		out << "\n";
	}
	out << std::left << std::setw(10) << "samples" << std::right << std::setw(16) << raw.count;
	if (corrected) {
		out << std::setw(18) << corrected->count;
	}
	out << "\n";

	out.flags(saved_flags);
	out.precision(saved_precision);
}

}  // namespace Cadence
