#include "platform/ingest_task.h"

#include <Arduino.h>

namespace tbolt::platform {

namespace {

constexpr uint32_t kStackBytes = 4096;
constexpr UBaseType_t kPriority = 3;
constexpr BaseType_t kCore = 0;  // loop() runs on core 1
constexpr uint32_t kIdleDelayMs = 10;

struct IngestTaskArgs {
  ReceiverIngestService* service;
  const IClock* clock;
};

IngestTaskArgs task_args{};

void ingest_task(void* parameter) {
  auto* args = static_cast<IngestTaskArgs*>(parameter);
  while (true) {
    args->service->tick(args->clock->uptime_ms());
    vTaskDelay(pdMS_TO_TICKS(kIdleDelayMs));
  }
}

} // namespace

bool start_ingest_task(ReceiverIngestService& service, const IClock& clock) {
  task_args.service = &service;
  task_args.clock = &clock;
  const BaseType_t rc = xTaskCreatePinnedToCore(ingest_task, "TsipIngest", kStackBytes, &task_args,
                                                kPriority, nullptr, kCore);
  return rc == pdPASS;
}

} // namespace tbolt::platform
