#pragma once

#include <cstdint>

namespace tbolt {

void app_init();
void app_tick(uint32_t now_ms);

} // namespace tbolt
