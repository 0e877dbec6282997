#pragma once

#include <cstdint>

namespace Cadence {

/// Run defaults
/// Target request rate (requests per second)
const double kDefaultTargetRate = 100.0;
/// Length of the issuance window when no total count is given
const int64_t kDefaultDurationSec = 10;
/// Upper bound on concurrently executing requests
const int64_t kDefaultMaxInFlight = 64;
/// Per-request timeout
const int64_t kDefaultTimeoutMs = 1000;
/// Time allowed for in-flight requests to finish after the last tick
const int64_t kDefaultGraceMs = 2000;
/// Scheduler lateness beyond which a tick counts as an overrun
const int64_t kDefaultDriftToleranceUs = 1000;
/// Closed-loop connections (closed_loop dispatch model only)
const int64_t kDefaultConnections = 1;

/// Histogram defaults. Values are microseconds.
const int64_t kDefaultLowestTrackableUs = 1;
/// One hour
const int64_t kDefaultHighestTrackableUs = 3600LL * 1000 * 1000;
const int kDefaultPrecisionDigits = 3;
const int kMaxPrecisionDigits = 5;

/// Warn once per this many shed ticks / late ticks
const int kHotPathWarnEvery = 1000;

}  // namespace Cadence
