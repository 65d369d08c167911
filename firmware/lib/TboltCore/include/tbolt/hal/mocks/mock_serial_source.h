#pragma once

#include <cstddef>
#include <cstdint>

#include "tbolt/hal/interfaces.h"

namespace tbolt {

class MockSerialSource : public ISerialSource {
 public:
  static constexpr size_t kCapacity = 1024;

  bool begin(uint32_t baud, int8_t rx_pin, int8_t tx_pin) override;
  int available() override;
  int read_byte() override;

  /** Append bytes to the receive queue; returns false when they do not fit. */
  bool inject(const uint8_t* data, size_t len);
  void set_begin_result(bool ok);

  bool begun() const;
  uint32_t baud() const;

 private:
  uint8_t buffer_[kCapacity] = {};
  size_t head_ = 0;
  size_t len_ = 0;
  bool begin_result_ = true;
  bool begun_ = false;
  uint32_t baud_ = 0;
};

} // namespace tbolt
