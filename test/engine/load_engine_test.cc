#include <gtest/gtest.h>
#include "../../src/engine/load_engine.h"
#include "../../src/client/synthetic_target.h"
#include "../../src/common/errors.h"

#include <algorithm>
#include <chrono>
#include <future>
#include <thread>

using namespace Cadence;
using namespace std::chrono_literals;

namespace {

// Synchronous target on a manual clock: every request takes service_time
// except request stall_index, which takes stall_time.
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

bool Contains(const std::vector<std::string>& errors, const std::string& needle) {
    return std::any_of(errors.begin(), errors.end(),
        [&needle](const std::string& e) { return e.find(needle) != std::string::npos; });
}

}  // namespace

class LoadEngineTest : public ::testing::Test {
protected:
    RunConfig ClosedLoopConfig(CorrectionMode mode) {
        RunConfig config;
        config.dispatch_model = DispatchModel::kClosedLoop;
        config.connections = 1;
        config.target_rate = 100.0;
        config.duration = 10s;
        config.timeout = 5s;
        config.correction_mode = mode;
        return config;
    }

    ManualClock clock_{TimePoint{} + 1h};
};

TEST_F(LoadEngineTest, ListsEveryConfigurationError) {
    RunConfig config;
    config.target_rate = 0;
    config.duration = Duration::zero();
    config.total_count = 0;
    config.correction_mode = CorrectionMode::kPostHoc;
    config.histogram.lowest_trackable_value = 0;

    SyntheticTarget target(SyntheticTargetOptions{});
    try {
        LoadEngine engine(config, &target);
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_TRUE(Contains(e.errors(), "target_rate"));
        EXPECT_TRUE(Contains(e.errors(), "duration or total_count"));
        EXPECT_TRUE(Contains(e.errors(), "closed_loop"));
        EXPECT_GE(e.errors().size(), 4u);
    }
}

TEST_F(LoadEngineTest, ValidatesHistogramLayoutAndTarget) {
    RunConfig config;
    config.histogram.highest_trackable_value = 1;
    EXPECT_FALSE(ValidateRunConfig(config).empty());

    EXPECT_TRUE(ValidateRunConfig(RunConfig{}).empty());
    EXPECT_THROW({ LoadEngine engine(RunConfig{}, nullptr); }, ConfigurationError);
}

TEST_F(LoadEngineTest, DerivesExpectedInterval) {
    RunConfig config = ClosedLoopConfig(CorrectionMode::kPostHoc);
    config.connections = 4;
    EXPECT_EQ(config.EffectiveExpectedIntervalUs(), 40000);
    config.expected_interval_us = 1234;
    EXPECT_EQ(config.EffectiveExpectedIntervalUs(), 1234);

    RunConfig open;
    open.target_rate = 2000.0;
    EXPECT_EQ(open.EffectiveExpectedIntervalUs(), 500);

    SteppingTarget target(clock_, 1ms, UINT64_MAX, 0ms);
    LoadEngine engine(ClosedLoopConfig(CorrectionMode::kAtRecording), &target, clock_);
    EXPECT_EQ(engine.config().expected_interval_us, 10000);
}

TEST_F(LoadEngineTest, ParsesDispatchModel) {
    EXPECT_EQ(ParseDispatchModel("closed_loop"), DispatchModel::kClosedLoop);
    EXPECT_EQ(ParseDispatchModel(" OPEN_LOOP"), DispatchModel::kOpenLoop);
    EXPECT_THROW(ParseDispatchModel("half_open"), ConfigurationError);
}

TEST_F(LoadEngineTest, ClosedLoopStallUnderstatesTailUntilCorrected) {
    SteppingTarget target(clock_, 10ms, 500, 2s);
    LoadEngine engine(ClosedLoopConfig(CorrectionMode::kPostHoc), &target, clock_);
    RunReport report = engine.Run();

    EXPECT_EQ(report.dispatch_model, "closed_loop");
    EXPECT_EQ(report.total_issued, 801u);
    EXPECT_EQ(report.skipped_sends, 199u);
    EXPECT_TRUE(report.Reconciles());
    EXPECT_EQ(report.elapsed, 10s);

    EXPECT_LT(report.raw.p99_us, 10100.0);
    ASSERT_TRUE(report.corrected.has_value());
    EXPECT_EQ(report.corrected->count, 1000);
    EXPECT_GT(report.corrected->p99_us, 1800000.0);
    EXPECT_LE(report.corrected->p99_us, 2000000.0);
}

TEST_F(LoadEngineTest, AtRecordingAndPostHocAgree) {
    SteppingTarget first_target(clock_, 10ms, 500, 2s);
    RunReport at_recording = LoadEngine(ClosedLoopConfig(CorrectionMode::kAtRecording), &first_target, clock_).Run();

    ManualClock second_clock(TimePoint{} + 1h);
    SteppingTarget second_target(second_clock, 10ms, 500, 2s);
    RunReport post_hoc = LoadEngine(ClosedLoopConfig(CorrectionMode::kPostHoc), &second_target, second_clock).Run();

    ASSERT_TRUE(at_recording.corrected.has_value());
    ASSERT_TRUE(post_hoc.corrected.has_value());
    EXPECT_EQ(at_recording.corrected->count, post_hoc.corrected->count);
    EXPECT_NEAR(at_recording.corrected->p99_us, post_hoc.corrected->p99_us,
        at_recording.corrected->p99_us * 0.002 + 1);
}

TEST_F(LoadEngineTest, OpenLoopHoldsTargetRate) {
    SyntheticTargetOptions options;
    options.service_time = 2ms;
    SyntheticTarget target(options);

    RunConfig config;
    config.target_rate = 500.0;
    config.duration = 2s;
    config.max_in_flight = 64;
    LoadEngine engine(config, &target);
    RunReport report = engine.Run();

    EXPECT_EQ(report.total_issued, 1000u);
    EXPECT_EQ(report.total_completed, 1000u);
    EXPECT_EQ(report.total_timeout, 0u);
    EXPECT_EQ(report.total_dropped, 0u);
    EXPECT_TRUE(report.Reconciles());
    EXPECT_NEAR(report.achieved_rate, report.target_rate, report.target_rate * 0.03);
    EXPECT_EQ(target.served(), 1000u);
}

TEST_F(LoadEngineTest, CorrectionIsNoOpWithoutStall) {
    SteppingTarget target(clock_, 4ms, UINT64_MAX, 0ms);
    LoadEngine engine(ClosedLoopConfig(CorrectionMode::kPostHoc), &target, clock_);
    RunReport report = engine.Run();

    EXPECT_EQ(report.total_issued, 1000u);
    EXPECT_EQ(report.skipped_sends, 0u);
    ASSERT_TRUE(report.corrected.has_value());
    EXPECT_EQ(report.corrected->count, report.raw.count);
    EXPECT_DOUBLE_EQ(report.corrected->p9999_us, report.raw.p9999_us);
    ASSERT_NE(report.corrected_histogram, nullptr);
    EXPECT_TRUE(*report.corrected_histogram == *report.raw_histogram);
}

TEST_F(LoadEngineTest, OpenLoopSeesStallWithoutCorrection) {
    SyntheticTargetOptions options;
    options.service_time = 2ms;
    options.stall_at = 200ms;
    options.stall = 300ms;
    options.threads = 128;
    SyntheticTarget target(options);

    RunConfig config;
    config.target_rate = 200.0;
    config.duration = 1s;
    config.max_in_flight = 128;
    config.timeout = 2s;
    LoadEngine engine(config, &target);
    RunReport report = engine.Run();

    EXPECT_EQ(report.total_issued, 200u);
    EXPECT_TRUE(report.Reconciles());
    EXPECT_EQ(report.total_dropped, 0u);
    EXPECT_EQ(report.total_completed, 200u);
    EXPECT_FALSE(report.corrected.has_value());
    // Requests due during the stall wait for it to end.
    EXPECT_GT(report.raw.p99_us, 200000.0);
    EXPECT_GT(report.raw.max_us, 250000.0);
    EXPECT_LT(report.raw.p50_us, 50000.0);
}

TEST_F(LoadEngineTest, ShedPolicyDropsExcessLoad) {
    SyntheticTargetOptions options;
    options.service_time = 20ms;
    options.threads = 4;
    SyntheticTarget target(options);

    RunConfig config;
    config.target_rate = 500.0;
    config.duration = 500ms;
    config.max_in_flight = 4;
    config.overload_policy = OverloadPolicy::kShed;
    LoadEngine engine(config, &target);
    RunReport report = engine.Run();

    EXPECT_EQ(report.total_issued, 250u);
    EXPECT_TRUE(report.Reconciles());
    EXPECT_GT(report.total_dropped, 100u);
    EXPECT_LE(report.max_in_flight_observed, 4u);
    EXPECT_LT(report.achieved_rate, report.target_rate);
    // Accepted requests never queue, so latency stays near the service time.
    EXPECT_LT(report.raw.p50_us, 100000.0);
}

TEST_F(LoadEngineTest, StopEndsARunEarly) {
    SyntheticTarget target(SyntheticTargetOptions{});
    RunConfig config;
    config.target_rate = 100.0;
    config.duration = 60s;
    LoadEngine engine(config, &target);

    const auto start = std::chrono::steady_clock::now();
    std::thread stopper([&engine]() {
        std::this_thread::sleep_for(100ms);
        engine.Stop();
        engine.Stop();
    });
    RunReport report = engine.Run();
    stopper.join();

    EXPECT_LT(std::chrono::steady_clock::now() - start, 10s);
    EXPECT_TRUE(report.Reconciles());
    EXPECT_GT(report.total_issued, 0u);
    EXPECT_LT(report.total_issued, 6000u);
}

TEST_F(LoadEngineTest, StrictRangeViolationFailsTheRun) {
    SyntheticTargetOptions options;
    options.service_time = 5ms;
    SyntheticTarget target(options);

    RunConfig config;
    config.target_rate = 100.0;
    config.total_count = 3;
    config.duration = Duration::zero();
    config.histogram.highest_trackable_value = 1000;
    config.histogram.range_policy = RangePolicy::kStrict;
    LoadEngine engine(config, &target);
    EXPECT_THROW(engine.Run(), ConfigurationError);
}
