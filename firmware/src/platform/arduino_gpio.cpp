/**
 * @file arduino_gpio.cpp
 * @brief Arduino GPIO helpers for the indicator LEDs and reset button.
 */
#include "platform/arduino_gpio.h"

#include <Arduino.h>

namespace tbolt::platform {

void configure_input_pullup(int pin) {
  ::pinMode(pin, INPUT_PULLUP);
}

bool read_digital(int pin) {
  return ::digitalRead(pin) == HIGH;
}

ArduinoIndicatorOutputs::ArduinoIndicatorOutputs(int disciplined_pin, int connected_pin)
    : disciplined_pin_(disciplined_pin), connected_pin_(connected_pin) {}

void ArduinoIndicatorOutputs::begin() {
  if (disciplined_pin_ >= 0) {
    ::pinMode(disciplined_pin_, OUTPUT);
    ::digitalWrite(disciplined_pin_, LOW);
  }
  if (connected_pin_ >= 0) {
    ::pinMode(connected_pin_, OUTPUT);
    ::digitalWrite(connected_pin_, LOW);
  }
}

void ArduinoIndicatorOutputs::set_indicators(bool disciplined, bool connected) {
  if (disciplined_pin_ >= 0) {
    ::digitalWrite(disciplined_pin_, disciplined ? HIGH : LOW);
  }
  if (connected_pin_ >= 0) {
    ::digitalWrite(connected_pin_, connected ? HIGH : LOW);
  }
}

} // namespace tbolt::platform
