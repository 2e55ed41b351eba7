#include "boardIo.h"
#include "config.h"
#include "dev_debug.h"
#include "tskCure.h"
#include <Arduino.h>

void setup() {
  // Relay input floats until the cure task takes ownership of it
  boardReleaseRelay();

  Serial.begin(SERIAL_BAUD);
  DEV_DBG_PRINTLN("UV cure controller booting");

  if (!createCureTask())
    Serial.println("setup: cure task creation failed, relay left floating");
}

void loop() {}
