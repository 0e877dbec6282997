#include <gtest/gtest.h>
#include "../../src/dispatcher/closed_loop_driver.h"
#include "../../src/common/errors.h"

#include <chrono>
#include <future>

#include "absl/synchronization/notification.h"

using namespace Cadence;
using namespace std::chrono_literals;

namespace {

// Serves synchronously on the manual clock: every request takes
// service_time, except request stall_index which takes stall_time.
class SteppingTarget : public Target {
public:
    SteppingTarget(ManualClock& clock, Duration service_time, uint64_t stall_index, Duration stall_time)
        : clock_(clock), service_time_(service_time), stall_index_(stall_index), stall_time_(stall_time) {}

    std::future<InvokeResult> Invoke(const InvokeContext& context) override {
        clock_.Advance(context.index == stall_index_ ? stall_time_ : service_time_);
        std::promise<InvokeResult> promise;
        promise.set_value(InvokeResult::Success());
        return promise.get_future();
    }

private:
    ManualClock& clock_;
    Duration service_time_;
    uint64_t stall_index_;
    Duration stall_time_;
};

}  // namespace

class ClosedLoopDriverTest : public ::testing::Test {
protected:
    ClosedLoopOptions Options() {
        ClosedLoopOptions options;
        options.connections = 1;
        options.rate_per_sec = 100.0;
        options.duration = 10s;
        options.timeout = 5s;
        return options;
    }

    ManualClock clock_{TimePoint{} + 1h};
    absl::Notification stop_;
};

TEST_F(ClosedLoopDriverTest, StallHidesUnsentRequests) {
    SteppingTarget target(clock_, 10ms, 500, 2s);
    ClosedLoopOptions options = Options();
    options.correction_mode = CorrectionMode::kAtRecording;
    options.expected_interval_us = 10000;
    ClosedLoopDriver driver(&target, clock_, options);
    ClosedLoopStats stats = driver.Run(stop_);

    // 500 sends before the stall, the stalled one, 300 after it.
    EXPECT_EQ(stats.issued, 801u);
    EXPECT_EQ(stats.skipped_sends, 199u);
    EXPECT_EQ(stats.finished_at - stats.origin, 10s);

    ASSERT_EQ(driver.recorders().size(), 1u);
    const Recorder& recorder = *driver.recorders()[0];
    EXPECT_EQ(recorder.counters().completed, 801u);

    const Histogram& raw = recorder.raw();
    EXPECT_TRUE(raw.ValuesAreEquivalent(raw.ValueAtPercentile(99.0), 10000));
    EXPECT_TRUE(raw.ValuesAreEquivalent(raw.Max(), 2000000));

    ASSERT_NE(recorder.corrected(), nullptr);
    const Histogram& corrected = *recorder.corrected();
    EXPECT_EQ(corrected.TotalCount(), 801 + 199);
    EXPECT_GE(corrected.ValueAtPercentile(99.0), 1800000);
    EXPECT_LE(corrected.ValueAtPercentile(99.0), 2000000);
}

TEST_F(ClosedLoopDriverTest, SteadyServiceSkipsNothing) {
    SteppingTarget target(clock_, 4ms, UINT64_MAX, 0ms);
    ClosedLoopOptions options = Options();
    options.duration = 1s;
    ClosedLoopDriver driver(&target, clock_, options);
    ClosedLoopStats stats = driver.Run(stop_);

    EXPECT_EQ(stats.issued, 100u);
    EXPECT_EQ(stats.skipped_sends, 0u);
    EXPECT_TRUE(driver.recorders()[0]->raw().ValuesAreEquivalent(driver.recorders()[0]->raw().Max(), 4000));
    EXPECT_EQ(driver.recorders()[0]->corrected(), nullptr);
}

TEST_F(ClosedLoopDriverTest, TotalCountBoundsTheRun) {
    SteppingTarget target(clock_, 1ms, UINT64_MAX, 0ms);
    ClosedLoopOptions options = Options();
    options.duration = Duration::zero();
    options.total_count = 50;
    ClosedLoopDriver driver(&target, clock_, options);
    ClosedLoopStats stats = driver.Run(stop_);
    EXPECT_EQ(stats.issued, 50u);
    // The connection sleeps to the next slot before noticing the bound.
    EXPECT_EQ(stats.finished_at - stats.origin, 500ms);
}

TEST_F(ClosedLoopDriverTest, StopEndsTheRun) {
    SteppingTarget target(clock_, 1ms, UINT64_MAX, 0ms);
    ClosedLoopDriver driver(&target, clock_, Options());
    stop_.Notify();
    ClosedLoopStats stats = driver.Run(stop_);
    EXPECT_EQ(stats.issued, 0u);
}

TEST_F(ClosedLoopDriverTest, IntervalScalesWithConnections) {
    SteppingTarget target(clock_, 1ms, UINT64_MAX, 0ms);
    ClosedLoopOptions options = Options();
    options.connections = 4;
    ClosedLoopDriver driver(&target, clock_, options);
    EXPECT_EQ(driver.connection_interval(), 40ms);
    EXPECT_EQ(driver.recorders().size(), 4u);
}

TEST_F(ClosedLoopDriverTest, RejectsInvalidOptions) {
    SteppingTarget target(clock_, 1ms, UINT64_MAX, 0ms);
    ClosedLoopOptions options = Options();
    options.connections = 0;
    EXPECT_THROW({ ClosedLoopDriver driver(&target, clock_, options); }, ConfigurationError);

    options = Options();
    options.rate_per_sec = 0;
    EXPECT_THROW({ ClosedLoopDriver driver(&target, clock_, options); }, ConfigurationError);

    options = Options();
    options.duration = Duration::zero();
    options.total_count = 0;
    EXPECT_THROW({ ClosedLoopDriver driver(&target, clock_, options); }, ConfigurationError);

    EXPECT_THROW({ ClosedLoopDriver driver(nullptr, clock_, Options()); }, ConfigurationError);
}
