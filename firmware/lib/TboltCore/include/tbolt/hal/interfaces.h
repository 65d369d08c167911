#pragma once

#include <cstddef>
#include <cstdint>

namespace tbolt {

// Byte source for the receiver's serial stream. Read-only: the monitor
// never sends commands to the receiver.
class ISerialSource {
 public:
  virtual ~ISerialSource() = default;
  virtual bool begin(uint32_t baud, int8_t rx_pin, int8_t tx_pin) = 0;
  virtual int available() = 0;
  virtual int read_byte() = 0;  // -1 when nothing is buffered
};

class IIndicatorOutputs {
 public:
  virtual ~IIndicatorOutputs() = default;
  virtual void set_indicators(bool disciplined, bool connected) = 0;
};

} // namespace tbolt
