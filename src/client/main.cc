#include <algorithm>
#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <string>
#include <thread>
#include <vector>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "../aggregator/aggregator.h"
#include "../aggregator/result_writer.h"
#include "../common/configuration.h"
#include "../common/errors.h"
#include "../engine/load_engine.h"
#include "../histogram/latency_stats.h"
#include "../recorder/corrector.h"
#include "synthetic_target.h"

using namespace Cadence;

namespace {

HistogramOptions HistogramOptionsFromConfig(const CadenceConfig& config) {
    HistogramOptions options;
    options.lowest_trackable_value = config.histogram.lowest_trackable_us.get();
    options.highest_trackable_value = config.histogram.highest_trackable_us.get();
    options.precision_digits = config.histogram.precision_digits.get();
    options.range_policy = config.histogram.strict_range.get() ? RangePolicy::kStrict : RangePolicy::kSaturate;
    return options;
}

void PrintDistribution(const char* title, const Histogram& histogram) {
    std::cout << "\n" << title << " percentile distribution (ms):\n";
    histogram.OutputPercentileDistribution(std::cout, 5, 1000.0);
}

// Post-hoc correction of latencies recorded by another tool
int RunCorrection(const std::string& path, const Configuration& configuration) {
    const CadenceConfig& config = configuration.config();
    const int64_t interval = config.run.expected_interval_us.get();
    if (interval <= 0) {
        LOG(ERROR) << "--correct_file needs a positive --expected_interval_us";
        return 1;
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        LOG(ERROR) << "Cannot open latency file " << path;
        return 1;
    }
    std::vector<int64_t> latencies = ReadLatencies(in);
    LOG(INFO) << "Read " << latencies.size() << " latencies from " << path;

    try {
        HistogramOptions options = HistogramOptionsFromConfig(config);
        Histogram raw = RecordLatencies(latencies, options);
        Histogram corrected = CorrectLatencies(latencies, interval, options);

        LatencyStats::Summary raw_summary = LatencyStats::ComputeSummary(raw);
        LatencyStats::Summary corrected_summary = LatencyStats::ComputeSummary(corrected);
        LatencyStats::PrintTable(std::cout, raw_summary, &corrected_summary);

        if (config.report.percentile_distribution.get()) {
            PrintDistribution("Raw", raw);
            PrintDistribution("Corrected", corrected);
        }
    } catch (const ConfigurationError& e) {
        LOG(ERROR) << e.what();
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1; // log only to console, no files.

    // Setup command line options. Run options carry no default_value so that
    // only flags the user passed override the config file and environment.
    cxxopts::Options options("cadence", "Cadence open-loop load generator");

    options.add_options()
        ("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
        ("c,config", "YAML configuration file", cxxopts::value<std::string>())
        ("r,target_rate", "Target request rate (req/s)", cxxopts::value<double>())
        ("interval_us", "Interval between requests, alternative to target_rate", cxxopts::value<int64_t>())
        ("d,duration_s", "Issuance window in seconds", cxxopts::value<double>())
        ("n,total_count", "Number of requests to issue", cxxopts::value<size_t>())
        ("m,max_in_flight", "Maximum concurrent requests", cxxopts::value<size_t>())
        ("t,timeout_ms", "Per-request timeout", cxxopts::value<int64_t>())
        ("arrival_distribution", "constant or poisson", cxxopts::value<std::string>())
        ("load_shedding", "queue or shed", cxxopts::value<std::string>())
        ("dispatch_model", "open_loop or closed_loop", cxxopts::value<std::string>())
        ("connections", "Closed-loop connections", cxxopts::value<size_t>())
        ("correction_mode", "none, at_recording or post_hoc", cxxopts::value<std::string>())
        ("expected_interval_us", "Coordinated omission correction interval, 0 derives it", cxxopts::value<int64_t>())
        ("grace_ms", "Drain period after the last tick", cxxopts::value<int64_t>())
        ("drift_tolerance_us", "Scheduler lateness counted as an overrun", cxxopts::value<int64_t>())
        ("seed", "Poisson arrival seed", cxxopts::value<size_t>())
        ("lowest_trackable_us", "Histogram lowest trackable value", cxxopts::value<int64_t>())
        ("highest_trackable_us", "Histogram highest trackable value", cxxopts::value<int64_t>())
        ("precision_digits", "Histogram significant digits", cxxopts::value<int>())
        ("strict_range", "Fail the run on values above the histogram range", cxxopts::value<bool>())
        ("record_results", "Record results in a csv file", cxxopts::value<bool>())
        ("result_dir", "Directory for result.csv", cxxopts::value<std::string>())
        ("percentile_distribution", "Print the full percentile distribution", cxxopts::value<bool>())
        ("label", "Label for the csv row", cxxopts::value<std::string>()->default_value("cadence"))
        ("service_time_us", "Synthetic target service time", cxxopts::value<int64_t>()->default_value("1000"))
        ("service_jitter_us", "Synthetic target service time jitter", cxxopts::value<int64_t>()->default_value("0"))
        ("error_rate", "Synthetic target error probability", cxxopts::value<double>()->default_value("0"))
        ("stall_at_ms", "Synthetic target stall start after the first request", cxxopts::value<int64_t>()->default_value("0"))
        ("stall_ms", "Synthetic target stall length, 0 disables", cxxopts::value<int64_t>()->default_value("0"))
        ("correct_file", "Correct latencies (us, one per line) from this file and exit", cxxopts::value<std::string>())
        ("h,help", "Print usage");

    std::unique_ptr<cxxopts::ParseResult> parsed;
    try {
        parsed = std::make_unique<cxxopts::ParseResult>(options.parse(argc, argv));
    } catch (const std::exception& e) {
        LOG(ERROR) << "Invalid arguments: " << e.what();
        std::cerr << options.help() << std::endl;
        return 1;
    }
    const cxxopts::ParseResult& result = *parsed;
    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }
    FLAGS_v = result["log_level"].as<int>();

    Configuration& configuration = Configuration::getInstance();
    if (result.count("config") && !configuration.loadFromFile(result["config"].as<std::string>())) {
        for (const auto& error : configuration.getValidationErrors()) {
            LOG(ERROR) << "Config: " << error;
        }
        return 1;
    }
    configuration.overrideFromCommandLine(result);

    if (result.count("correct_file")) {
        return RunCorrection(result["correct_file"].as<std::string>(), configuration);
    }

    RunConfig run_config;
    SyntheticTargetOptions target_options;
    try {
        run_config = configuration.toRunConfig();
        target_options.service_time = std::chrono::microseconds(result["service_time_us"].as<int64_t>());
        target_options.service_jitter = std::chrono::microseconds(result["service_jitter_us"].as<int64_t>());
        target_options.error_rate = result["error_rate"].as<double>();
        target_options.stall_at = std::chrono::milliseconds(result["stall_at_ms"].as<int64_t>());
        target_options.stall = std::chrono::milliseconds(result["stall_ms"].as<int64_t>());
        target_options.seed = run_config.seed + 1;
        // Timed-out requests return their thread on cancellation, so one
        // thread per possible in-flight request is enough.
        target_options.threads = std::max(run_config.max_in_flight, run_config.connections) + 1;
    } catch (const ConfigurationError& e) {
        LOG(ERROR) << e.what();
        return 1;
    }

    // SIGINT/SIGTERM end the issuance phase; the run still drains and reports.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    std::unique_ptr<SyntheticTarget> target;
    std::unique_ptr<LoadEngine> engine;
    try {
        target = std::make_unique<SyntheticTarget>(target_options);
        engine = std::make_unique<LoadEngine>(run_config, target.get());
    } catch (const ConfigurationError& e) {
        LOG(ERROR) << e.what();
        return 1;
    }

    std::atomic<bool> finished{false};
    std::thread signal_thread([&signals, &engine, &finished]() {
        int sig = 0;
        if (sigwait(&signals, &sig) == 0 && !finished.load()) {
            LOG(WARNING) << "Received signal " << sig << ", stopping";
            engine->Stop();
        }
    });

    RunReport report;
    bool failed = false;
    try {
        report = engine->Run();
    } catch (const ConfigurationError& e) {
        // Strict histogram range exceeded during the run
        LOG(ERROR) << "Run aborted: " << e.what();
        failed = true;
    }

    finished = true;
    pthread_kill(signal_thread.native_handle(), SIGTERM);
    signal_thread.join();
    if (failed) {
        return 1;
    }

    Aggregator::FormatReport(std::cout, report);
    if (configuration.config().report.percentile_distribution.get()) {
        PrintDistribution("Raw", *report.raw_histogram);
        if (report.corrected_histogram) {
            PrintDistribution("Corrected", *report.corrected_histogram);
        }
    }

    ResultWriter writer(configuration.getResultDir(), configuration.recordResults());
    if (!writer.Append(report, result["label"].as<std::string>())) {
        return 1;
    }
    return report.Reconciles() ? 0 : 2;
}
