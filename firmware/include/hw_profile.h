#pragma once

namespace tbolt {

struct Pins {
  int tsip_rx;          // receiver TXD -> this pin
  int tsip_tx;          // optional, -1 if not wired (monitor never transmits)
  int led_disciplined;  // -1 if not present
  int led_connected;    // -1 if not present
  int reset_button;     // active low, -1 if not present
};

struct Caps {
  int tsip_uart;  // HardwareSerial index
  bool has_reset_button;
};

struct HwProfile {
  const char* name;
  Pins pins;
  Caps caps;
};

const HwProfile& get_hw_profile();

} // namespace tbolt
