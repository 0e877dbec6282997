#include "load_engine.h"

#include <cmath>
#include <exception>

#include <glog/logging.h>

#include "absl/strings/ascii.h"
#include "../common/errors.h"
#include "../dispatcher/closed_loop_driver.h"

namespace Cadence {

DispatchModel ParseDispatchModel(const std::string& value) {
	std::string name = absl::AsciiStrToLower(absl::StripAsciiWhitespace(value));
	if (name == "open_loop") {
		return DispatchModel::kOpenLoop;
	}
	if (name == "closed_loop") {
		return DispatchModel::kClosedLoop;
	}
	throw ConfigurationError("Unknown dispatch_model '" + value + "' (expected open_loop or closed_loop)");
}

const char* DispatchModelName(DispatchModel model) {
	switch (model) {
		case DispatchModel::kOpenLoop: return "open_loop";
		case DispatchModel::kClosedLoop: return "closed_loop";
	}
	return "unknown";
}

int64_t RunConfig::EffectiveExpectedIntervalUs() const {
	if (expected_interval_us > 0) {
		return expected_interval_us;
	}
	if (!(target_rate > 0)) {
		return 0;
	}
	const double senders = dispatch_model == DispatchModel::kClosedLoop ? static_cast<double>(connections) : 1.0;
	return static_cast<int64_t>(std::llround(senders * 1e6 / target_rate));
}

std::vector<std::string> ValidateRunConfig(const RunConfig& config) {
	std::vector<std::string> errors;

	if (!(config.target_rate > 0) || !std::isfinite(config.target_rate)) {
		errors.push_back("target_rate must be a positive number");
	}
	if (config.duration <= Duration::zero() && config.total_count == 0) {
		errors.push_back("Either duration or total_count must be set");
	}
	if (config.duration < Duration::zero()) {
		errors.push_back("duration must not be negative");
	}
	if (config.dispatch_model == DispatchModel::kOpenLoop && config.max_in_flight == 0) {
		errors.push_back("max_in_flight must be at least 1");
	}
	if (config.timeout <= Duration::zero()) {
		errors.push_back("timeout must be positive");
	}
	if (config.grace < Duration::zero()) {
		errors.push_back("grace period must not be negative");
	}
	if (config.drift_tolerance < Duration::zero()) {
		errors.push_back("drift_tolerance must not be negative");
	}
	if (config.dispatch_model == DispatchModel::kClosedLoop && config.connections == 0) {
		errors.push_back("closed_loop dispatch needs at least one connection");
	}

	try {
		Histogram probe(config.histogram);
	} catch (const ConfigurationError& e) {
		errors.push_back(e.what());
	}

	if (config.expected_interval_us < 0) {
		errors.push_back("expected_interval_us must not be negative");
	}
	if (config.correction_mode != CorrectionMode::kNone) {
		if (config.dispatch_model != DispatchModel::kClosedLoop) {
			errors.push_back(std::string("correction_mode ") + CorrectionModeName(config.correction_mode) +
					" needs the closed_loop dispatch model; open-loop latency is already measured from"
					" the intended send time");
		}
		if (config.expected_interval_us >= 0 && config.EffectiveExpectedIntervalUs() <= 0) {
			errors.push_back("expected interval rounds to 0us; set expected_interval_us explicitly");
		}
	}
	return errors;
}

LoadEngine::LoadEngine(const RunConfig& config, Target* target, Clock& clock)
	: config_(config), target_(target), clock_(clock) {
	std::vector<std::string> errors = ValidateRunConfig(config_);
	if (target_ == nullptr) {
		errors.push_back("No target given");
	}
	if (!errors.empty()) {
		for (const auto& e : errors) {
			LOG(ERROR) << "Invalid run configuration: " << e;
		}
		throw ConfigurationError("Invalid run configuration", errors);
	}
	if (config_.correction_mode != CorrectionMode::kNone && config_.expected_interval_us == 0) {
		config_.expected_interval_us = config_.EffectiveExpectedIntervalUs();
		VLOG(1) << "Derived expected interval " << config_.expected_interval_us << "us";
	}
}

void LoadEngine::Stop() {
	std::call_once(stop_once_, [this]() {
		LOG(INFO) << "Stop requested";
		stop_.Notify();
	});
}

RunReport LoadEngine::Run() {
	LOG(INFO) << "Starting " << DispatchModelName(config_.dispatch_model) << " run at "
		<< config_.target_rate << " req/s, correction " << CorrectionModeName(config_.correction_mode);
	RunReport report = config_.dispatch_model == DispatchModel::kClosedLoop ? RunClosedLoop() : RunOpenLoop();
	Aggregator::LogReport(report);
	return report;
}

RunReport LoadEngine::RunOpenLoop() {
	DispatcherOptions dispatcher_options;
	dispatcher_options.max_in_flight = config_.max_in_flight;
	dispatcher_options.timeout = config_.timeout;
	dispatcher_options.overload_policy = config_.overload_policy;
	dispatcher_options.histogram = config_.histogram;
	dispatcher_options.correction_mode = config_.correction_mode;
	dispatcher_options.expected_interval_us = config_.expected_interval_us;

	ScheduleOptions schedule_options;
	schedule_options.rate_per_sec = config_.target_rate;
	schedule_options.duration = config_.duration;
	schedule_options.total_count = config_.total_count;
	schedule_options.distribution = config_.arrival_distribution;
	schedule_options.seed = config_.seed;
	schedule_options.drift_tolerance = config_.drift_tolerance;

	Dispatcher dispatcher(target_, clock_, dispatcher_options);
	Scheduler scheduler(schedule_options, clock_);

	dispatcher.Start();
	const TimePoint start = clock_.Now();
	ScheduleStats schedule_stats = scheduler.Run(dispatcher, stop_);
	DispatchStats dispatch_stats = dispatcher.Drain(config_.grace);
	const TimePoint end = clock_.Now();

	if (std::exception_ptr failure = dispatcher.failure()) {
		std::rethrow_exception(failure);
	}

	Aggregator aggregator(config_.histogram, config_.correction_mode, config_.expected_interval_us);
	for (const Recorder* recorder : dispatcher.recorders()) {
		aggregator.AddShard(*recorder);
	}
	aggregator.SetScheduleStats(schedule_stats);
	aggregator.SetDispatchStats(dispatch_stats);
	return aggregator.Finalize(DispatchModelName(config_.dispatch_model), config_.target_rate, end - start);
}

RunReport LoadEngine::RunClosedLoop() {
	ClosedLoopOptions options;
	options.connections = config_.connections;
	options.rate_per_sec = config_.target_rate;
	options.duration = config_.duration;
	options.total_count = config_.total_count;
	options.timeout = config_.timeout;
	options.histogram = config_.histogram;
	options.correction_mode = config_.correction_mode;
	options.expected_interval_us = config_.expected_interval_us;

	ClosedLoopDriver driver(target_, clock_, options);
	ClosedLoopStats stats = driver.Run(stop_);

	if (std::exception_ptr failure = driver.failure()) {
		std::rethrow_exception(failure);
	}

	Aggregator aggregator(config_.histogram, config_.correction_mode, config_.expected_interval_us);
	for (const Recorder* recorder : driver.recorders()) {
		aggregator.AddShard(*recorder);
	}
	aggregator.SetClosedLoopStats(stats);
	return aggregator.Finalize(DispatchModelName(config_.dispatch_model), config_.target_rate,
			stats.finished_at - stats.origin);
}

}  // namespace Cadence
