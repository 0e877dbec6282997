#include <gtest/gtest.h>
#include "../../src/histogram/histogram.h"
#include "../../src/common/errors.h"

#include <cmath>
#include <sstream>
#include <vector>

using namespace Cadence;

namespace {

constexpr int64_t kHighest = 3600LL * 1000 * 1000;

}  // namespace

class HistogramTest : public ::testing::Test {
protected:
    HistogramTest() : histogram_(1, kHighest, 3) {}

    Histogram histogram_;
};

TEST_F(HistogramTest, RejectsInvalidLayouts) {
    EXPECT_THROW(Histogram(0, 1000, 3), ConfigurationError);
    EXPECT_THROW(Histogram(-1, 1000, 3), ConfigurationError);
    EXPECT_THROW(Histogram(10, 15, 3), ConfigurationError);
    EXPECT_THROW(Histogram(1, 1000, 0), ConfigurationError);
    EXPECT_THROW(Histogram(1, 1000, 6), ConfigurationError);
    EXPECT_NO_THROW(Histogram(1, 2, 1));
    EXPECT_NO_THROW(Histogram(1, kHighest, 5));
}

TEST_F(HistogramTest, EmptyHistogramQueries) {
    EXPECT_EQ(histogram_.TotalCount(), 0);
    EXPECT_EQ(histogram_.ValueAtPercentile(99.0), 0);
    EXPECT_EQ(histogram_.Min(), 0);
    EXPECT_EQ(histogram_.Max(), 0);
    EXPECT_DOUBLE_EQ(histogram_.Mean(), 0.0);
    EXPECT_DOUBLE_EQ(histogram_.StdDev(), 0.0);
}

TEST_F(HistogramTest, RelativeErrorWithinPrecision) {
    const std::vector<int64_t> values = {1, 7, 999, 1000, 1001, 2047, 2048, 12345, 999999,
                                         123456789, kHighest - 1};
    for (int64_t v : values) {
        Histogram h(1, kHighest, 3);
        h.Record(v);
        const int64_t reported = h.ValueAtPercentile(50.0);
        EXPECT_GE(reported, v);
        EXPECT_LE(static_cast<double>(reported - v) / static_cast<double>(v), 1e-3) << "value " << v;
        EXPECT_EQ(h.Min(), v);
        EXPECT_EQ(h.Max(), v);
    }
}

TEST_F(HistogramTest, UniformPercentiles) {
    for (int64_t v = 1; v <= 10000; ++v) {
        histogram_.Record(v);
    }
    EXPECT_EQ(histogram_.TotalCount(), 10000);
    EXPECT_NEAR(histogram_.ValueAtPercentile(50.0), 5000, 5);
    EXPECT_NEAR(histogram_.ValueAtPercentile(90.0), 9000, 9);
    EXPECT_NEAR(histogram_.ValueAtPercentile(99.0), 9900, 10);
    EXPECT_TRUE(histogram_.ValuesAreEquivalent(histogram_.ValueAtPercentile(100.0), 10000));
    EXPECT_EQ(histogram_.ValueAtPercentile(0.0), 1);
}

TEST_F(HistogramTest, PercentilesAreMonotonic) {
    for (int64_t v = 1; v <= 100000; v += 7) {
        histogram_.Record(v * 13 % 50000 + 1);
    }
    int64_t previous = 0;
    for (double p = 0.0; p <= 100.0; p += 0.5) {
        const int64_t value = histogram_.ValueAtPercentile(p);
        EXPECT_GE(value, previous) << "percentile " << p;
        previous = value;
    }
}

TEST_F(HistogramTest, ValuesBelowLowestClamp) {
    histogram_.Record(0);
    histogram_.Record(-25);
    EXPECT_EQ(histogram_.TotalCount(), 2);
    EXPECT_EQ(histogram_.Min(), 1);
    EXPECT_EQ(histogram_.CountAtValue(1), 2);

    Histogram coarse(1000, kHighest, 2);
    coarse.Record(3);
    EXPECT_EQ(coarse.Min(), 1000);
}

TEST_F(HistogramTest, HighestTrackableValueIsRecordable) {
    histogram_.Record(kHighest);
    EXPECT_EQ(histogram_.TotalCount(), 1);
    EXPECT_EQ(histogram_.Max(), kHighest);
    EXPECT_TRUE(histogram_.ValuesAreEquivalent(histogram_.ValueAtPercentile(100.0), kHighest));
}

TEST_F(HistogramTest, SaturatePolicyClampsAboveRange) {
    Histogram h(1, 1000000, 3, RangePolicy::kSaturate);
    h.Record(5000000);
    EXPECT_EQ(h.TotalCount(), 1);
    EXPECT_EQ(h.Max(), 1000000);
    EXPECT_EQ(h.CountAtValue(1000000), 1);
}

TEST_F(HistogramTest, StrictPolicyThrowsAboveRange) {
    Histogram h(1, 1000000, 3, RangePolicy::kStrict);
    EXPECT_NO_THROW(h.Record(1000000));
    EXPECT_THROW(h.Record(1000001), ConfigurationError);
    EXPECT_EQ(h.TotalCount(), 1);
}

TEST_F(HistogramTest, MeanAndStdDev) {
    histogram_.RecordValues(1000, 100);
    histogram_.RecordValues(3000, 100);
    EXPECT_NEAR(histogram_.Mean(), 2000.0, 1.0);
    EXPECT_NEAR(histogram_.StdDev(), 1000.0, 1.0);
}

TEST_F(HistogramTest, RecordValuesIgnoresNonPositiveCounts) {
    histogram_.RecordValues(10, 0);
    histogram_.RecordValues(10, -3);
    EXPECT_EQ(histogram_.TotalCount(), 0);
}

TEST_F(HistogramTest, EquivalenceHelpers) {
    // 10007 sits in the bucket with unit 8.
    EXPECT_EQ(histogram_.LowestEquivalentValue(10007), 10000);
    EXPECT_EQ(histogram_.HighestEquivalentValue(10007), 10007);
    EXPECT_EQ(histogram_.SizeOfEquivalentValueRange(10007), 8);
    EXPECT_EQ(histogram_.MedianEquivalentValue(10007), 10004);
    EXPECT_EQ(histogram_.NextNonEquivalentValue(10007), 10008);
    EXPECT_TRUE(histogram_.ValuesAreEquivalent(10000, 10007));
    EXPECT_FALSE(histogram_.ValuesAreEquivalent(10000, 10008));

    // Below 2048 every value has its own slot.
    EXPECT_EQ(histogram_.SizeOfEquivalentValueRange(1500), 1);
    EXPECT_EQ(histogram_.HighestEquivalentValue(1500), 1500);
}

TEST_F(HistogramTest, MergeMatchesSingleHistogram) {
    Histogram a(1, kHighest, 3);
    Histogram b(1, kHighest, 3);
    Histogram all(1, kHighest, 3);
    for (int64_t v = 1; v < 5000; v += 3) {
        a.Record(v);
        all.Record(v);
    }
    for (int64_t v = 100000; v < 200000; v += 101) {
        b.Record(v);
        all.Record(v);
    }
    a.Add(b);
    EXPECT_TRUE(a == all);
    EXPECT_EQ(a.TotalCount(), all.TotalCount());
    EXPECT_EQ(a.Min(), all.Min());
    EXPECT_EQ(a.Max(), all.Max());
    EXPECT_EQ(a.ValueAtPercentile(99.9), all.ValueAtPercentile(99.9));
}

TEST_F(HistogramTest, MergeIsAssociativeAndCommutative) {
    auto make = [](int64_t start, int64_t step, int n) {
        Histogram h(1, kHighest, 3);
        for (int i = 0; i < n; ++i) {
            h.Record(start + step * i);
        }
        return h;
    };
    const Histogram a = make(1, 17, 500);
    const Histogram b = make(2000, 1013, 300);
    const Histogram c = make(50, 99991, 200);

    Histogram left = a;
    left.Add(b);
    left.Add(c);

    Histogram bc = b;
    bc.Add(c);
    Histogram right = a;
    right.Add(bc);

    Histogram reversed = c;
    reversed.Add(b);
    reversed.Add(a);

    EXPECT_TRUE(left == right);
    EXPECT_TRUE(left == reversed);
    for (double p : {50.0, 90.0, 99.0, 99.9, 100.0}) {
        EXPECT_EQ(left.ValueAtPercentile(p), right.ValueAtPercentile(p));
    }
}

TEST_F(HistogramTest, MergeRejectsDifferentLayouts) {
    Histogram other(1, kHighest, 2);
    other.Record(10);
    EXPECT_THROW(histogram_.Add(other), ConfigurationError);
    EXPECT_FALSE(histogram_.SameLayout(other));
}

TEST_F(HistogramTest, RecordCorrectedSynthesizesMissingSamples) {
    Histogram h(1, kHighest, 3);
    h.RecordCorrected(1000, 100);
    // The value itself plus floor(1000 / 100) - 1 = 9 synthetic samples.
    EXPECT_EQ(h.TotalCount(), 10);
    for (int64_t v = 100; v <= 1000; v += 100) {
        EXPECT_EQ(h.CountAtValue(v), 1) << "value " << v;
    }

    Histogram small(1, kHighest, 3);
    small.RecordCorrected(150, 100);
    EXPECT_EQ(small.TotalCount(), 1);
    small.RecordCorrected(200, 100);
    EXPECT_EQ(small.TotalCount(), 3);
    small.RecordCorrected(100, 100);
    EXPECT_EQ(small.TotalCount(), 4);
}

TEST_F(HistogramTest, RecordCorrectedWithoutIntervalIsPlainRecord) {
    histogram_.RecordCorrected(5000, 0);
    EXPECT_EQ(histogram_.TotalCount(), 1);
}

TEST_F(HistogramTest, CopyCorrectedMatchesCorrectedRecording) {
    // Values below 2048 are exact, so post-hoc and at-recording agree.
    const std::vector<int64_t> values = {50, 300, 1000, 1500, 120, 80};
    Histogram raw(1, kHighest, 3);
    Histogram at_recording(1, kHighest, 3);
    for (int64_t v : values) {
        raw.Record(v);
        at_recording.RecordCorrected(v, 100);
    }
    Histogram post_hoc = raw.CopyCorrectedForCoordinatedOmission(100);
    EXPECT_TRUE(post_hoc == at_recording);
    EXPECT_EQ(raw.TotalCount(), static_cast<int64_t>(values.size()));
}

TEST_F(HistogramTest, CorrectionNeverLowersPercentiles) {
    for (int i = 0; i < 1000; ++i) {
        histogram_.Record(1000 + (i % 10) * 100);
    }
    histogram_.Record(500000);
    Histogram corrected = histogram_.CopyCorrectedForCoordinatedOmission(1000);
    EXPECT_GE(corrected.TotalCount(), histogram_.TotalCount());
    for (double p : {50.0, 75.0, 90.0, 99.0, 99.9, 99.99, 100.0}) {
        EXPECT_GE(corrected.ValueAtPercentile(p), histogram_.ValueAtPercentile(p)) << "p" << p;
    }
}

TEST_F(HistogramTest, ResetClearsCounts) {
    histogram_.Record(42);
    histogram_.Record(4242);
    ASSERT_EQ(histogram_.ValueAtPercentile(100.0), histogram_.HighestEquivalentValue(4242));
    histogram_.Reset();
    EXPECT_EQ(histogram_.TotalCount(), 0);
    EXPECT_EQ(histogram_.ValueAtPercentile(100.0), 0);
    EXPECT_EQ(histogram_.Max(), 0);
    histogram_.Record(7);
    EXPECT_EQ(histogram_.Min(), 7);
    EXPECT_EQ(histogram_.ValueAtPercentile(100.0), 7);
}

TEST_F(HistogramTest, MemoryFixedAtConstruction) {
    const size_t counts_length = histogram_.CountsLength();
    const size_t before = histogram_.MemoryFootprint();
    for (int64_t v = 1; v < kHighest; v = v * 3 + 1) {
        histogram_.Record(v);
    }
    EXPECT_EQ(histogram_.CountsLength(), counts_length);
    EXPECT_EQ(histogram_.MemoryFootprint(), before);

    // Percentile queries reuse storage sized up front.
    histogram_.ValueAtPercentile(99.0);
    histogram_.CountAtOrBelow(1000);
    EXPECT_EQ(histogram_.MemoryFootprint(), before);
}

TEST_F(HistogramTest, PercentileDistributionListing) {
    for (int64_t v = 1; v <= 1000; ++v) {
        histogram_.Record(v * 1000);
    }
    std::ostringstream out;
    histogram_.OutputPercentileDistribution(out, 5, 1000.0);
    const std::string listing = out.str();
    EXPECT_NE(listing.find("Percentile"), std::string::npos);
    EXPECT_NE(listing.find("1.000000000000"), std::string::npos);
    EXPECT_NE(listing.find("Total count    =         1000"), std::string::npos);
}
