#include "dispatcher.h"

#include <algorithm>
#include <utility>

#include <glog/logging.h>

#include "absl/strings/ascii.h"
#include "absl/time/time.h"
#include "../common/errors.h"
#include "attempt.h"

namespace Cadence {

OverloadPolicy ParseOverloadPolicy(const std::string& value) {
	std::string name = absl::AsciiStrToLower(absl::StripAsciiWhitespace(value));
	if (name == "queue") {
		return OverloadPolicy::kQueue;
	}
	if (name == "shed") {
		return OverloadPolicy::kShed;
	}
	throw ConfigurationError("Unknown load_shedding policy '" + value + "' (expected queue or shed)");
}

const char* OverloadPolicyName(OverloadPolicy policy) {
	switch (policy) {
		case OverloadPolicy::kQueue: return "queue";
		case OverloadPolicy::kShed: return "shed";
	}
	return "unknown";
}

Dispatcher::Dispatcher(Target* target, Clock& clock, const DispatcherOptions& options)
	: target_(target), clock_(clock), options_(options) {
	if (target_ == nullptr) {
		throw ConfigurationError("Dispatcher needs a target");
	}
	if (options_.max_in_flight == 0) {
		throw ConfigurationError("max_in_flight must be at least 1");
	}
	if (options_.timeout <= Duration::zero()) {
		throw ConfigurationError("timeout must be positive");
	}
	// Last shard receives abandoned ticks during Drain.
	for (size_t i = 0; i <= options_.max_in_flight; ++i) {
		recorders_.push_back(std::make_unique<Recorder>(options_.histogram, options_.correction_mode,
				options_.expected_interval_us));
	}
}

Dispatcher::~Dispatcher() {
	bool running;
	{
		absl::MutexLock lock(&mu_);
		running = !workers_.empty() && !drained_;
	}
	if (running) {
		Drain(Duration::zero());
	}
}

void Dispatcher::Start() {
	absl::MutexLock lock(&mu_);
	if (!workers_.empty()) {
		LOG(WARNING) << "Dispatcher already started";
		return;
	}
	accepting_ = true;
	workers_.reserve(options_.max_in_flight);
	for (size_t i = 0; i < options_.max_in_flight; ++i) {
		workers_.emplace_back(&Dispatcher::WorkerLoop, this, i);
	}
	LOG(INFO) << "Dispatcher started: " << options_.max_in_flight << " workers, timeout "
		<< ToMicros(options_.timeout) / 1000 << "ms, overload policy "
		<< OverloadPolicyName(options_.overload_policy);
}

void Dispatcher::Submit(const ScheduledTick& tick) {
	bool shed = false;
	bool rejected = false;
	{
		absl::MutexLock lock(&mu_);
		++stats_.issued;
		if (!accepting_) {
			++stats_.dropped;
			rejected = true;
		} else if (options_.overload_policy == OverloadPolicy::kShed &&
				in_flight_ + queue_.size() >= options_.max_in_flight) {
			++stats_.dropped;
			shed = true;
		} else {
			queue_.push_back(tick);
			stats_.max_queue_depth = std::max<uint64_t>(stats_.max_queue_depth, queue_.size());
		}
	}

	if (rejected) {
		LOG_EVERY_N(WARNING, kHotPathWarnEvery) << "Tick " << tick.index
			<< " submitted while the dispatcher is not accepting work; counted as dropped";
		return;
	}
	if (shed) {
		LOG_EVERY_N(WARNING, kHotPathWarnEvery) << "All " << options_.max_in_flight
			<< " workers busy, shedding tick " << tick.index << " (" << google::COUNTER << " shed so far)";
		return;
	}
	work_cv_.Signal();
}

void Dispatcher::RecordOrFail(Recorder& recorder, RequestAttempt&& attempt) {
	try {
		recorder.Record(std::move(attempt));
	} catch (const ConfigurationError& e) {
		LOG(ERROR) << "Recording failed: " << e.what();
		absl::MutexLock lock(&mu_);
		if (!failure_) {
			failure_ = std::current_exception();
		}
	}
}

void Dispatcher::WorkerLoop(size_t worker_id) {
	Recorder& recorder = *recorders_[worker_id];
	VLOG(3) << "Dispatch worker " << worker_id << " started";

	while (true) {
		ScheduledTick tick;
		{
			absl::MutexLock lock(&mu_);
			while (queue_.empty() && !stopping_) {
				work_cv_.Wait(&mu_);
			}
			if (queue_.empty()) {
				break;
			}
			tick = queue_.front();
			queue_.pop_front();
			++in_flight_;
			++stats_.dispatched;
			stats_.max_in_flight = std::max(stats_.max_in_flight, in_flight_);
		}

		RecordOrFail(recorder, ExecuteAttempt(*target_, clock_, tick, options_.timeout));

		{
			absl::MutexLock lock(&mu_);
			--in_flight_;
			if (queue_.empty() && in_flight_ == 0) {
				idle_cv_.SignalAll();
			}
		}
	}

	VLOG(3) << "Dispatch worker " << worker_id << " exiting after " << recorder.counters().Total()
		<< " requests";
}

DispatchStats Dispatcher::Drain(Duration grace) {
	const TimePoint grace_deadline = clock_.Now() + grace;
	std::deque<ScheduledTick> leftover;
	{
		absl::MutexLock lock(&mu_);
		if (drained_) {
			return stats_;
		}
		accepting_ = false;
		while (!queue_.empty() || in_flight_ > 0) {
			const Duration remaining = grace_deadline - clock_.Now();
			if (remaining <= Duration::zero()) {
				break;
			}
			idle_cv_.WaitWithTimeout(&mu_, absl::FromChrono(remaining));
		}
		leftover.swap(queue_);
		stats_.abandoned = leftover.size();
		stopping_ = true;
	}
	work_cv_.SignalAll();

	if (!leftover.empty()) {
		LOG(WARNING) << leftover.size() << " queued requests were never sent before the grace period"
			<< " ended; recording them as timeouts";
	}
	Recorder& abandoned = *recorders_.back();
	for (const ScheduledTick& tick : leftover) {
		RequestAttempt attempt;
		attempt.index = tick.index;
		attempt.intended_time = tick.intended_time;
		// Never sent, so it is pinned no earlier than the timeout ceiling.
		attempt.sent_time = grace_deadline;
		attempt.completion_time = std::max(grace_deadline, tick.intended_time + options_.timeout);
		attempt.outcome = AttemptOutcome::kTimeout;
		RecordOrFail(abandoned, std::move(attempt));
	}

	// In-flight requests finish within their own timeout.
	for (auto& worker : workers_) {
		if (worker.joinable()) {
			worker.join();
		}
	}

	absl::MutexLock lock(&mu_);
	drained_ = true;
	VLOG(1) << "Dispatcher drained: issued=" << stats_.issued << " dispatched=" << stats_.dispatched
		<< " dropped=" << stats_.dropped << " abandoned=" << stats_.abandoned;
	return stats_;
}

WorkerState Dispatcher::Snapshot() const {
	absl::MutexLock lock(&mu_);
	WorkerState state;
	state.in_flight_count = in_flight_;
	state.queue_depth = queue_.size();
	return state;
}

DispatchStats Dispatcher::stats() const {
	absl::MutexLock lock(&mu_);
	return stats_;
}

std::vector<const Recorder*> Dispatcher::recorders() const {
	std::vector<const Recorder*> out;
	out.reserve(recorders_.size());
	for (const auto& recorder : recorders_) {
		out.push_back(recorder.get());
	}
	return out;
}

std::exception_ptr Dispatcher::failure() const {
	absl::MutexLock lock(&mu_);
	return failure_;
}

}  // namespace Cadence
