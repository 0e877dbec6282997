#pragma once

#include "request.h"

namespace Cadence {

// Receives ticks from the Scheduler. Submit must not wait for the request.
class TickSink {
public:
	virtual ~TickSink() = default;

	virtual void Submit(const ScheduledTick& tick) = 0;
};

}  // namespace Cadence
