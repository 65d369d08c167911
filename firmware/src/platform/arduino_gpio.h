/**
 * @file arduino_gpio.h
 * @brief Arduino GPIO helpers for the indicator LEDs and reset button.
 */
#pragma once

#include <cstdint>

#include "tbolt/hal/interfaces.h"

namespace tbolt::platform {

/**
 * @brief Configure GPIO as input with pull-up.
 */
void configure_input_pullup(int pin);

/**
 * @brief Read GPIO digital value.
 * @return true if HIGH, false if LOW.
 */
bool read_digital(int pin);

/**
 * @brief Two LEDs, active high. A negative pin disables that LED.
 */
class ArduinoIndicatorOutputs final : public IIndicatorOutputs {
 public:
  ArduinoIndicatorOutputs(int disciplined_pin, int connected_pin);

  void begin();
  void set_indicators(bool disciplined, bool connected) override;

 private:
  int disciplined_pin_;
  int connected_pin_;
};

} // namespace tbolt::platform
