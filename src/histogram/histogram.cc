#include "histogram.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <string>

#include <glog/logging.h>

#include "../common/errors.h"

namespace Cadence {

namespace {

int32_t Log2Floor(int64_t value) {
	return 63 - __builtin_clzll(static_cast<unsigned long long>(value));
}

int64_t PowerOfTen(int digits) {
	int64_t result = 1;
	for (int i = 0; i < digits; ++i) {
		result *= 10;
	}
	return result;
}

}  // namespace

Histogram::Histogram(int64_t lowest_trackable_value, int64_t highest_trackable_value,
		int precision_digits, RangePolicy range_policy)
	: Histogram(HistogramOptions{lowest_trackable_value, highest_trackable_value,
			precision_digits, range_policy}) {}

Histogram::Histogram(const HistogramOptions& options) : options_(options) {
	if (options_.lowest_trackable_value < 1) {
		throw ConfigurationError("lowest_trackable_value must be >= 1, got " +
				std::to_string(options_.lowest_trackable_value));
	}
	if (options_.highest_trackable_value < 2 * options_.lowest_trackable_value) {
		throw ConfigurationError("highest_trackable_value must be >= 2 * lowest_trackable_value, got " +
				std::to_string(options_.highest_trackable_value) + " < 2 * " +
				std::to_string(options_.lowest_trackable_value));
	}
	if (options_.precision_digits < 1 || options_.precision_digits > kMaxPrecisionDigits) {
		throw ConfigurationError("precision_digits must be in [1, " + std::to_string(kMaxPrecisionDigits) +
				"], got " + std::to_string(options_.precision_digits));
	}

	// Smallest power of two that resolves every value below it to a single unit
	// at the requested number of significant digits.
	const int64_t largest_value_with_single_unit_resolution = 2 * PowerOfTen(options_.precision_digits);
	int32_t sub_bucket_count_magnitude = Log2Floor(largest_value_with_single_unit_resolution);
	if ((int64_t{1} << sub_bucket_count_magnitude) < largest_value_with_single_unit_resolution) {
		++sub_bucket_count_magnitude;
	}
	sub_bucket_half_count_magnitude_ = std::max(sub_bucket_count_magnitude, 1) - 1;
	unit_magnitude_ = Log2Floor(options_.lowest_trackable_value);

	if (unit_magnitude_ + sub_bucket_half_count_magnitude_ + 1 > 62) {
		throw ConfigurationError("lowest_trackable_value " + std::to_string(options_.lowest_trackable_value) +
				" is too large for " + std::to_string(options_.precision_digits) + " precision digits");
	}

	sub_bucket_count_ = int32_t{1} << (sub_bucket_half_count_magnitude_ + 1);
	sub_bucket_half_count_ = sub_bucket_count_ / 2;
	sub_bucket_mask_ = static_cast<int64_t>(sub_bucket_count_ - 1) << unit_magnitude_;
	bucket_count_ = BucketsNeededToCover(options_.highest_trackable_value);

	counts_.assign(static_cast<size_t>(bucket_count_ + 1) * sub_bucket_half_count_, 0);
	cumulative_.assign(counts_.size(), 0);

	VLOG(3) << "Histogram [" << options_.lowest_trackable_value << ", " << options_.highest_trackable_value
		<< "] digits=" << options_.precision_digits << " buckets=" << bucket_count_
		<< " sub_buckets=" << sub_bucket_count_ << " counts_len=" << counts_.size();
}

int32_t Histogram::BucketsNeededToCover(int64_t value) const {
	int64_t smallest_untrackable_value = static_cast<int64_t>(sub_bucket_count_) << unit_magnitude_;
	int32_t buckets_needed = 1;
	while (smallest_untrackable_value <= value) {
		if (smallest_untrackable_value > INT64_MAX / 2) {
			return buckets_needed + 1;
		}
		smallest_untrackable_value <<= 1;
		++buckets_needed;
	}
	return buckets_needed;
}

int32_t Histogram::BucketIndex(int64_t value) const {
	// Smallest power of two containing value, with values below the first
	// bucket's top forced into bucket 0 by the mask.
	const int32_t pow2_ceiling = 64 - __builtin_clzll(static_cast<unsigned long long>(value | sub_bucket_mask_));
	return pow2_ceiling - unit_magnitude_ - (sub_bucket_half_count_magnitude_ + 1);
}

int32_t Histogram::SubBucketIndex(int64_t value, int32_t bucket_index) const {
	return static_cast<int32_t>(value >> (bucket_index + unit_magnitude_));
}

int32_t Histogram::CountsIndex(int32_t bucket_index, int32_t sub_bucket_index) const {
	const int32_t bucket_base_index = (bucket_index + 1) << sub_bucket_half_count_magnitude_;
	return bucket_base_index + (sub_bucket_index - sub_bucket_half_count_);
}

int32_t Histogram::CountsIndexFor(int64_t value) const {
	const int32_t bucket_index = BucketIndex(value);
	return CountsIndex(bucket_index, SubBucketIndex(value, bucket_index));
}

int64_t Histogram::ValueFromIndex(int32_t bucket_index, int32_t sub_bucket_index) const {
	return static_cast<int64_t>(sub_bucket_index) << (bucket_index + unit_magnitude_);
}

int64_t Histogram::ValueAtIndex(int32_t index) const {
	int32_t bucket_index = (index >> sub_bucket_half_count_magnitude_) - 1;
	int32_t sub_bucket_index = (index & (sub_bucket_half_count_ - 1)) + sub_bucket_half_count_;
	if (bucket_index < 0) {
		sub_bucket_index -= sub_bucket_half_count_;
		bucket_index = 0;
	}
	return ValueFromIndex(bucket_index, sub_bucket_index);
}

int64_t Histogram::ClampToRange(int64_t value) const {
	if (value < options_.lowest_trackable_value) {
		return options_.lowest_trackable_value;
	}
	if (value > options_.highest_trackable_value) {
		if (options_.range_policy == RangePolicy::kStrict) {
			throw ConfigurationError("value " + std::to_string(value) + " exceeds highest_trackable_value " +
					std::to_string(options_.highest_trackable_value));
		}
		return options_.highest_trackable_value;
	}
	return value;
}

void Histogram::Record(int64_t value) {
	RecordValues(value, 1);
}

void Histogram::RecordValues(int64_t value, int64_t count) {
	if (count <= 0) {
		return;
	}
	const int64_t clamped = ClampToRange(value);
	counts_[CountsIndexFor(clamped)] += count;
	total_count_ += count;
	min_value_ = std::min(min_value_, clamped);
	max_value_ = std::max(max_value_, clamped);
	cumulative_dirty_ = true;
}

void Histogram::RecordCorrected(int64_t value, int64_t expected_interval) {
	RecordValuesCorrected(value, 1, expected_interval);
}

void Histogram::RecordValuesCorrected(int64_t value, int64_t count, int64_t expected_interval) {
	RecordValues(value, count);
	if (expected_interval <= 0 || value <= expected_interval) {
		return;
	}
	// floor(value / I) - 1 synthetic samples, the last one no smaller than I.
	for (int64_t missing = value - expected_interval; missing >= expected_interval;
			missing -= expected_interval) {
		RecordValues(missing, count);
	}
}

void Histogram::Add(const Histogram& other) {
	if (!SameLayout(other)) {
		throw ConfigurationError("cannot merge histograms with different layouts: [" +
				std::to_string(options_.lowest_trackable_value) + ", " +
				std::to_string(options_.highest_trackable_value) + "]/" +
				std::to_string(options_.precision_digits) + " vs [" +
				std::to_string(other.options_.lowest_trackable_value) + ", " +
				std::to_string(other.options_.highest_trackable_value) + "]/" +
				std::to_string(other.options_.precision_digits));
	}
	if (other.total_count_ == 0) {
		return;
	}
	for (size_t i = 0; i < counts_.size(); ++i) {
		counts_[i] += other.counts_[i];
	}
	total_count_ += other.total_count_;
	min_value_ = std::min(min_value_, other.min_value_);
	max_value_ = std::max(max_value_, other.max_value_);
	cumulative_dirty_ = true;
}

Histogram Histogram::CopyCorrectedForCoordinatedOmission(int64_t expected_interval) const {
	Histogram corrected(options_);
	for (size_t i = 0; i < counts_.size(); ++i) {
		const int64_t count = counts_[i];
		if (count == 0) {
			continue;
		}
		const int64_t value = std::min(HighestEquivalentValue(ValueAtIndex(static_cast<int32_t>(i))),
				options_.highest_trackable_value);
		corrected.RecordValuesCorrected(value, count, expected_interval);
	}
	return corrected;
}

void Histogram::Reset() {
	std::fill(counts_.begin(), counts_.end(), 0);
	total_count_ = 0;
	min_value_ = INT64_MAX;
	max_value_ = 0;
	cumulative_dirty_ = true;
}

void Histogram::RebuildCumulative() const {
	int64_t running = 0;
	for (size_t i = 0; i < counts_.size(); ++i) {
		running += counts_[i];
		cumulative_[i] = running;
	}
	cumulative_dirty_ = false;
}

int64_t Histogram::ValueAtPercentile(double percentile) const {
	if (total_count_ == 0) {
		return 0;
	}
	const double requested = std::min(std::max(percentile, 0.0), 100.0);
	int64_t count_at_percentile =
		static_cast<int64_t>((requested / 100.0) * static_cast<double>(total_count_) + 0.5);
	count_at_percentile = std::max<int64_t>(count_at_percentile, 1);

	if (cumulative_dirty_) {
		RebuildCumulative();
	}
	auto it = std::lower_bound(cumulative_.begin(), cumulative_.end(), count_at_percentile);
	if (it == cumulative_.end()) {
		--it;
	}
	const int32_t index = static_cast<int32_t>(it - cumulative_.begin());
	return HighestEquivalentValue(ValueAtIndex(index));
}

double Histogram::Mean() const {
	if (total_count_ == 0) {
		return 0.0;
	}
	long double total = 0.0L;
	for (size_t i = 0; i < counts_.size(); ++i) {
		if (counts_[i] != 0) {
			total += static_cast<long double>(counts_[i]) *
				static_cast<long double>(MedianEquivalentValue(ValueAtIndex(static_cast<int32_t>(i))));
		}
	}
	return static_cast<double>(total / static_cast<long double>(total_count_));
}

double Histogram::StdDev() const {
	if (total_count_ == 0) {
		return 0.0;
	}
	const double mean = Mean();
	long double geometric_dev_total = 0.0L;
	for (size_t i = 0; i < counts_.size(); ++i) {
		if (counts_[i] != 0) {
			const double dev =
				static_cast<double>(MedianEquivalentValue(ValueAtIndex(static_cast<int32_t>(i)))) - mean;
			geometric_dev_total += static_cast<long double>(dev) * dev * counts_[i];
		}
	}
	return std::sqrt(static_cast<double>(geometric_dev_total / static_cast<long double>(total_count_)));
}

int64_t Histogram::CountAtValue(int64_t value) const {
	const int64_t clamped = std::min(std::max(value, options_.lowest_trackable_value),
			options_.highest_trackable_value);
	return counts_[CountsIndexFor(clamped)];
}

int64_t Histogram::CountAtOrBelow(int64_t value) const {
	if (total_count_ == 0 || value < options_.lowest_trackable_value) {
		return 0;
	}
	if (cumulative_dirty_) {
		RebuildCumulative();
	}
	const int64_t clamped = std::min(value, options_.highest_trackable_value);
	return cumulative_[CountsIndexFor(clamped)];
}

int64_t Histogram::SizeOfEquivalentValueRange(int64_t value) const {
	const int32_t bucket_index = BucketIndex(value);
	const int32_t sub_bucket_index = SubBucketIndex(value, bucket_index);
	const int32_t adjusted_bucket = (sub_bucket_index >= sub_bucket_count_) ? bucket_index + 1 : bucket_index;
	return int64_t{1} << (unit_magnitude_ + adjusted_bucket);
}

int64_t Histogram::LowestEquivalentValue(int64_t value) const {
	const int32_t bucket_index = BucketIndex(value);
	return ValueFromIndex(bucket_index, SubBucketIndex(value, bucket_index));
}

int64_t Histogram::NextNonEquivalentValue(int64_t value) const {
	return LowestEquivalentValue(value) + SizeOfEquivalentValueRange(value);
}

int64_t Histogram::HighestEquivalentValue(int64_t value) const {
	return NextNonEquivalentValue(value) - 1;
}

int64_t Histogram::MedianEquivalentValue(int64_t value) const {
	return LowestEquivalentValue(value) + (SizeOfEquivalentValueRange(value) >> 1);
}

bool Histogram::ValuesAreEquivalent(int64_t a, int64_t b) const {
	return LowestEquivalentValue(a) == LowestEquivalentValue(b);
}

bool Histogram::SameLayout(const Histogram& other) const {
	return options_.lowest_trackable_value == other.options_.lowest_trackable_value &&
		options_.highest_trackable_value == other.options_.highest_trackable_value &&
		options_.precision_digits == other.options_.precision_digits;
}

bool Histogram::operator==(const Histogram& other) const {
	return SameLayout(other) && total_count_ == other.total_count_ && counts_ == other.counts_;
}

size_t Histogram::MemoryFootprint() const {
	return sizeof(*this) + counts_.capacity() * sizeof(int64_t) + cumulative_.capacity() * sizeof(int64_t);
}

void Histogram::OutputPercentileDistribution(std::ostream& out, int ticks_per_half_distance,
		double value_scale) const {
	if (ticks_per_half_distance < 1) {
		ticks_per_half_distance = 1;
	}
	if (value_scale <= 0.0) {
		value_scale = 1.0;
	}
	const std::ios::fmtflags saved_flags = out.flags();
	const std::streamsize saved_precision = out.precision();

	out << std::setw(12) << "Value" << " " << std::setw(14) << "Percentile" << " "
		<< std::setw(10) << "TotalCount" << " " << std::setw(14) << "1/(1-Percentile)" << "\n\n";

	auto print_row = [&](int64_t value, double percentile) {
		out << std::fixed << std::setw(12) << std::setprecision(3) << static_cast<double>(value) / value_scale
			<< " " << std::setw(14) << std::setprecision(12) << percentile / 100.0
			<< " " << std::setw(10) << CountAtOrBelow(value);
		if (percentile < 100.0) {
			out << " " << std::setw(14) << std::setprecision(2) << 1.0 / (1.0 - percentile / 100.0);
		}
		out << "\n";
	};

	if (total_count_ > 0) {
		double percentile = 0.0;
		while (true) {
			const int64_t value = ValueAtPercentile(percentile);
			if (CountAtOrBelow(value) >= total_count_) {
				print_row(value, 100.0);
				break;
			}
			print_row(value, percentile);
			// Halve the step every time the remaining tail halves.
			const double half_distance =
				std::pow(2.0, std::floor(std::log2(100.0 / (100.0 - percentile))) + 1.0);
			percentile += 100.0 / (static_cast<double>(ticks_per_half_distance) * half_distance);
		}
	}

	out << std::fixed << std::setprecision(3)
		<< "#[Mean    = " << std::setw(12) << Mean() / value_scale
		<< ", StdDeviation   = " << std::setw(12) << StdDev() / value_scale << "]\n"
		<< "#[Max     = " << std::setw(12) << static_cast<double>(Max()) / value_scale
		<< ", Total count    = " << std::setw(12) << total_count_ << "]\n"
		<< "#[Buckets = " << std::setw(12) << bucket_count_
		<< ", SubBuckets     = " << std::setw(12) << sub_bucket_count_ << "]\n";

	out.flags(saved_flags);
	out.precision(saved_precision);
}

}  // namespace Cadence
