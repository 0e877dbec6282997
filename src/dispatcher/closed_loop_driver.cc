#include "closed_loop_driver.h"

#include <functional>
#include <thread>
#include <utility>

#include <glog/logging.h>

#include "../common/errors.h"
#include "attempt.h"

namespace Cadence {

ClosedLoopDriver::ClosedLoopDriver(Target* target, Clock& clock, const ClosedLoopOptions& options)
	: target_(target), clock_(clock), options_(options) {
	if (target_ == nullptr) {
		throw ConfigurationError("ClosedLoopDriver needs a target");
	}
	if (options_.connections == 0) {
		throw ConfigurationError("closed_loop dispatch needs at least one connection");
	}
	if (!(options_.rate_per_sec > 0)) {
		throw ConfigurationError("closed_loop rate must be positive");
	}
	if (options_.timeout <= Duration::zero()) {
		throw ConfigurationError("timeout must be positive");
	}
	if (options_.duration <= Duration::zero() && options_.total_count == 0) {
		throw ConfigurationError("closed_loop run needs a duration or a total count");
	}
	interval_ = Duration(static_cast<int64_t>(1e9 * options_.connections / options_.rate_per_sec));
	if (interval_ <= Duration::zero()) {
		interval_ = Duration(1);
	}
	for (size_t i = 0; i < options_.connections; ++i) {
		recorders_.push_back(std::make_unique<Recorder>(options_.histogram, options_.correction_mode,
				options_.expected_interval_us));
	}
}

ClosedLoopStats ClosedLoopDriver::Run(const absl::Notification& stop) {
	ClosedLoopStats stats;
	stats.origin = clock_.Now();
	LOG(INFO) << "Closed-loop run: " << options_.connections << " connections, "
		<< ToMicros(interval_) << "us per connection";

	std::vector<std::thread> connections;
	connections.reserve(options_.connections);
	for (size_t i = 0; i < options_.connections; ++i) {
		connections.emplace_back(&ClosedLoopDriver::ConnectionLoop, this, i, stats.origin, std::cref(stop));
	}
	for (auto& connection : connections) {
		connection.join();
	}

	stats.finished_at = clock_.Now();
	stats.issued = issued_.load();
	stats.skipped_sends = skipped_.load();
	if (stats.skipped_sends > 0) {
		LOG(WARNING) << stats.skipped_sends << " sends were skipped while connections waited on"
			<< " slow responses; raw percentiles understate the latency users saw";
	}
	return stats;
}

void ClosedLoopDriver::ConnectionLoop(size_t connection_id, TimePoint origin, const absl::Notification& stop) {
	Recorder& recorder = *recorders_[connection_id];
	const TimePoint end = options_.duration > Duration::zero() ? origin + options_.duration : TimePoint::max();
	// Stagger connections across one interval.
	TimePoint next_send = origin + interval_ * static_cast<int64_t>(connection_id) /
			static_cast<int64_t>(options_.connections);

	while (!stop.HasBeenNotified() && !failed_.HasBeenNotified()) {
		if (next_send >= end) {
			break;
		}
		if (!clock_.SleepUntil(next_send, &stop)) {
			break;
		}
		const uint64_t index = next_index_.fetch_add(1);
		if (options_.total_count > 0 && index >= options_.total_count) {
			break;
		}

		ScheduledTick tick;
		tick.index = index;
		tick.intended_time = clock_.Now();
		RequestAttempt attempt = ExecuteAttempt(*target_, clock_, tick, options_.timeout);
		++issued_;
		try {
			recorder.Record(std::move(attempt));
		} catch (const ConfigurationError& e) {
			LOG(ERROR) << "Connection " << connection_id << " recording failed: " << e.what();
			absl::MutexLock lock(&mu_);
			if (!failure_) {
				failure_ = std::current_exception();
				failed_.Notify();
			}
			break;
		}

		next_send += interval_;
		const TimePoint now = clock_.Now();
		if (now > next_send) {
			skipped_ += static_cast<uint64_t>((now - next_send) / interval_);
			next_send = now;
		}
	}
	VLOG(3) << "Connection " << connection_id << " finished after " << recorder.counters().Total()
		<< " requests";
}

std::vector<const Recorder*> ClosedLoopDriver::recorders() const {
	std::vector<const Recorder*> out;
	out.reserve(recorders_.size());
	for (const auto& recorder : recorders_) {
		out.push_back(recorder.get());
	}
	return out;
}

std::exception_ptr ClosedLoopDriver::failure() const {
	absl::MutexLock lock(&mu_);
	return failure_;
}

}  // namespace Cadence
