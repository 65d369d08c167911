#pragma once

#include <cstddef>
#include <cstdint>

#include <Arduino.h>

#include "tbolt/hal/interfaces.h"

namespace tbolt::platform {

/** Receiver serial port on a hardware UART. Receive only. */
class TsipUartSource : public ISerialSource {
 public:
  explicit TsipUartSource(uint8_t uart_index);

  bool begin(uint32_t baud, int8_t rx_pin, int8_t tx_pin) override;
  int available() override;
  int read_byte() override;

 private:
  static constexpr size_t kRxBufferSize = 1024;

  HardwareSerial uart_;
};

} // namespace tbolt::platform
