#pragma once

#include <cstdint>

#include "services/receiver_ingest_service.h"
#include "tbolt/platform/clock.h"

namespace tbolt::platform {

/**
 * Run service.tick() forever on its own FreeRTOS task, pinned to the core
 * that does not run loop(). Both references must outlive the task.
 * Returns false if the task could not be created.
 */
bool start_ingest_task(ReceiverIngestService& service, const IClock& clock);

} // namespace tbolt::platform
