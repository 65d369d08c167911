// Boot + tick entry points. The ingest task is started from app_init().

#include <Arduino.h>

#include "app/app.h"

void setup() {
  Serial.begin(115200);
  while (!Serial) {
    // Wait for Serial on USB-enabled boards.
  }
  tbolt::app_init();
}

void loop() {
  tbolt::app_tick(::millis());
  delay(1);
}
