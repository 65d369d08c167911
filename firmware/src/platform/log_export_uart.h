#pragma once

#include "domain/event_log.h"

namespace tbolt {
namespace platform {

/**
 * Print and remove buffered events, oldest first, one "EVT ..." line each.
 * Only as many lines as fit in the Serial TX buffer are written, so the
 * call never blocks; the rest stay buffered for the next call.
 */
void drain_events_uart(domain::EventLog& events);

} // namespace platform
} // namespace tbolt
