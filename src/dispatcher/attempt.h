#pragma once

#include "../common/clock.h"
#include "../common/request.h"
#include "target.h"

namespace Cadence {

/**
 * Sends one tick to the target and waits for its outcome, never longer than
 * sent_time + timeout. Shared by the open-loop workers and the closed-loop
 * connections.
 *
 * - deadline expiry, a target-reported timeout, or a success stamped after
 *   the deadline: Timeout with completion_time pinned to sent_time + timeout
 * - a target exception (from Invoke or from the future): Error
 *
 * The attempt's sent_time is read from clock; intended_time comes from tick.
 */
RequestAttempt ExecuteAttempt(Target& target, Clock& clock, const ScheduledTick& tick, Duration timeout);

}  // namespace Cadence
