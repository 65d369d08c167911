#include "tbolt/hal/mocks/mock_serial_source.h"

namespace tbolt {

bool MockSerialSource::begin(uint32_t baud, int8_t /*rx_pin*/, int8_t /*tx_pin*/) {
  baud_ = baud;
  begun_ = begin_result_;
  return begin_result_;
}

int MockSerialSource::available() {
  return static_cast<int>(len_);
}

int MockSerialSource::read_byte() {
  if (len_ == 0) {
    return -1;
  }
  const uint8_t b = buffer_[head_];
  head_ = (head_ + 1) % kCapacity;
  --len_;
  return b;
}

bool MockSerialSource::inject(const uint8_t* data, size_t len) {
  if (!data || len > kCapacity - len_) {
    return false;
  }
  for (size_t i = 0; i < len; ++i) {
    buffer_[(head_ + len_) % kCapacity] = data[i];
    ++len_;
  }
  return true;
}

void MockSerialSource::set_begin_result(bool ok) {
  begin_result_ = ok;
}

bool MockSerialSource::begun() const {
  return begun_;
}

uint32_t MockSerialSource::baud() const {
  return baud_;
}

} // namespace tbolt
