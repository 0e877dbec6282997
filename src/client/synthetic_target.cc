#include "synthetic_target.h"

#include <algorithm>
#include <mutex>
#include <thread>

#include <glog/logging.h>

#include "../common/errors.h"

namespace Cadence {

SyntheticTarget::SyntheticTarget(const SyntheticTargetOptions& options)
	: options_(options), rng_(options.seed), executor_(options.threads) {
	if (options_.service_time < Duration::zero() || options_.service_jitter < Duration::zero()) {
		throw ConfigurationError("service time and jitter must not be negative");
	}
	if (options_.error_rate < 0.0 || options_.error_rate > 1.0) {
		throw ConfigurationError("error_rate must be within [0, 1]");
	}
	if (options_.stall < Duration::zero() || options_.stall_at < Duration::zero()) {
		throw ConfigurationError("stall window must not be negative");
	}
	if (options_.stall > Duration::zero()) {
		LOG(INFO) << "Synthetic target will stall for " << ToMicros(options_.stall) / 1000 << "ms, "
			<< ToMicros(options_.stall_at) / 1000 << "ms after the first request";
	}
}

std::future<InvokeResult> SyntheticTarget::Invoke(const InvokeContext& context) {
	std::call_once(origin_once_, [this]() { origin_ = std::chrono::steady_clock::now(); });
	return executor_.Submit([this, context]() { return Serve(context); });
}

Duration SyntheticTarget::DrawServiceTime(bool* fail) {
	absl::MutexLock lock(&rng_mu_);
	Duration service = options_.service_time;
	if (options_.service_jitter > Duration::zero()) {
		std::uniform_int_distribution<int64_t> jitter(-options_.service_jitter.count(),
				options_.service_jitter.count());
		service = std::max(service + Duration(jitter(rng_)), Duration::zero());
	}
	*fail = false;
	if (options_.error_rate > 0.0) {
		std::bernoulli_distribution error(options_.error_rate);
		*fail = error(rng_);
	}
	return service;
}

InvokeResult SyntheticTarget::Serve(const InvokeContext& context) {
	bool fail = false;
	const Duration service = DrawServiceTime(&fail);
	const TimePoint now = std::chrono::steady_clock::now();
	TimePoint finish = now + service;

	if (options_.stall > Duration::zero()) {
		const TimePoint stall_begin = origin_ + options_.stall_at;
		const TimePoint stall_end = stall_begin + options_.stall;
		if (now >= stall_begin && now < stall_end) {
			finish = stall_end + service;
		} else if (now < stall_begin && finish > stall_begin) {
			finish += options_.stall;
		}
	}

	if (context.cancel) {
		if (context.cancel->WaitUntil(finish)) {
			return InvokeResult::Timeout();
		}
	} else {
		std::this_thread::sleep_until(finish);
	}
	++served_;
	if (fail) {
		return InvokeResult::Error("synthetic error");
	}
	return InvokeResult::Success(std::chrono::steady_clock::now());
}

}  // namespace Cadence
