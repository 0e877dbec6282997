#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <vector>

#include "../common/config.h"

namespace Cadence {

// What Record() does with a value above highest_trackable_value.
enum class RangePolicy {
	kSaturate = 0,  // clamp into the top bucket
	kStrict = 1     // throw ConfigurationError
};

struct HistogramOptions {
	int64_t lowest_trackable_value = kDefaultLowestTrackableUs;
	int64_t highest_trackable_value = kDefaultHighestTrackableUs;
	int precision_digits = kDefaultPrecisionDigits;
	RangePolicy range_policy = RangePolicy::kSaturate;
};

/**
 * Log-linear bucketed counter covering [lowest, highest] with
 * precision_digits significant decimal digits.
 *
 * Layout: 2^k linear sub-buckets per power-of-two bucket, where 2^k is the
 * smallest power of two >= 2 * 10^precision_digits. The bottom half of every
 * bucket above bucket 0 overlaps the previous bucket and is not stored, so
 * counts_ holds (bucket_count + 1) * sub_bucket_half_count slots. Memory is
 * fixed at construction.
 *
 * @threading Not thread safe. One instance per worker; merge with Add()
 * after the workers have stopped. Percentile queries rebuild a cumulative
 * cache lazily, so concurrent const readers must also be serialized.
 */
class Histogram {
public:
	explicit Histogram(const HistogramOptions& options);
	Histogram(int64_t lowest_trackable_value, int64_t highest_trackable_value,
			int precision_digits, RangePolicy range_policy = RangePolicy::kSaturate);

	// Recording. Values below lowest are clamped up to lowest.
	void Record(int64_t value);
	void RecordValues(int64_t value, int64_t count);

	/**
	 * Records value plus one synthetic sample for every expected_interval the
	 * value overran: value - I, value - 2I, ... down to I.
	 * @param expected_interval Interval between requests; <= 0 disables correction
	 */
	void RecordCorrected(int64_t value, int64_t expected_interval);
	void RecordValuesCorrected(int64_t value, int64_t count, int64_t expected_interval);

	/**
	 * Adds other's counts bucket for bucket. Both histograms must share
	 * lowest, highest and precision.
	 */
	void Add(const Histogram& other);

	/**
	 * Post-hoc coordinated omission correction of everything recorded so far.
	 * Each bucket is re-recorded at its highest equivalent value with
	 * RecordValuesCorrected.
	 */
	Histogram CopyCorrectedForCoordinatedOmission(int64_t expected_interval) const;

	void Reset();

	// Queries
	int64_t ValueAtPercentile(double percentile) const;
	double Mean() const;
	double StdDev() const;
	int64_t TotalCount() const { return total_count_; }
	int64_t Min() const { return total_count_ == 0 ? 0 : min_value_; }
	int64_t Max() const { return total_count_ == 0 ? 0 : max_value_; }
	int64_t CountAtValue(int64_t value) const;
	// Number of recorded values whose bucket lies at or below value's bucket.
	int64_t CountAtOrBelow(int64_t value) const;

	// Value equivalence: two values are equivalent when they share a bucket.
	int64_t LowestEquivalentValue(int64_t value) const;
	int64_t HighestEquivalentValue(int64_t value) const;
	int64_t NextNonEquivalentValue(int64_t value) const;
	int64_t MedianEquivalentValue(int64_t value) const;
	int64_t SizeOfEquivalentValueRange(int64_t value) const;
	bool ValuesAreEquivalent(int64_t a, int64_t b) const;

	bool SameLayout(const Histogram& other) const;
	// Same layout and identical bucket counts.
	bool operator==(const Histogram& other) const;
	bool operator!=(const Histogram& other) const { return !(*this == other); }

	/**
	 * Classic percentile distribution listing.
	 * @param ticks_per_half_distance Rows per halving of the remaining tail
	 * @param value_scale Divides every printed value (e.g. 1000.0 for us -> ms)
	 */
	void OutputPercentileDistribution(std::ostream& out, int ticks_per_half_distance = 5,
			double value_scale = 1.0) const;

	const HistogramOptions& options() const { return options_; }
	int64_t lowest_trackable_value() const { return options_.lowest_trackable_value; }
	int64_t highest_trackable_value() const { return options_.highest_trackable_value; }
	int precision_digits() const { return options_.precision_digits; }
	int32_t bucket_count() const { return bucket_count_; }
	int32_t sub_bucket_count() const { return sub_bucket_count_; }
	size_t CountsLength() const { return counts_.size(); }
	size_t MemoryFootprint() const;

private:
	int32_t BucketIndex(int64_t value) const;
	int32_t SubBucketIndex(int64_t value, int32_t bucket_index) const;
	int32_t CountsIndex(int32_t bucket_index, int32_t sub_bucket_index) const;
	int32_t CountsIndexFor(int64_t value) const;
	int64_t ValueFromIndex(int32_t bucket_index, int32_t sub_bucket_index) const;
	int64_t ValueAtIndex(int32_t index) const;
	int32_t BucketsNeededToCover(int64_t value) const;
	int64_t ClampToRange(int64_t value) const;
	void RebuildCumulative() const;

	HistogramOptions options_;
	int32_t unit_magnitude_ = 0;
	int32_t sub_bucket_half_count_magnitude_ = 0;
	int32_t sub_bucket_count_ = 0;
	int32_t sub_bucket_half_count_ = 0;
	int64_t sub_bucket_mask_ = 0;
	int32_t bucket_count_ = 0;

	std::vector<int64_t> counts_;
	int64_t total_count_ = 0;
	int64_t min_value_ = INT64_MAX;
	int64_t max_value_ = 0;

	mutable std::vector<int64_t> cumulative_;
	mutable bool cumulative_dirty_ = true;
};

}  // namespace Cadence
