#include "platform/tsip_uart_source.h"

namespace tbolt::platform {

constexpr size_t TsipUartSource::kRxBufferSize;

TsipUartSource::TsipUartSource(uint8_t uart_index) : uart_(uart_index) {}

bool TsipUartSource::begin(uint32_t baud, int8_t rx_pin, int8_t tx_pin) {
  // Room for several seconds of 8F-AC/8F-AB traffic if the ingest task stalls.
  uart_.setRxBufferSize(kRxBufferSize);
  uart_.begin(baud, SERIAL_8N1, rx_pin, tx_pin);
  return true;
}

int TsipUartSource::available() {
  return uart_.available();
}

int TsipUartSource::read_byte() {
  return uart_.read();
}

} // namespace tbolt::platform
