#pragma once

// system includes
#include <stdint.h>

// project includes
#include "CureIO.h"

// Completion buzzer. Pulses are on for onMs then off for offMs, so signal(n)
// always takes n * (onMs + offMs).
class Notifier {
public:
  Notifier(DigitalOutput &out, Clock &clock, uint32_t onMs, uint32_t offMs);

  // Leave the output off
  void begin();

  // Blocks the calling task for the whole sequence. signal(0) is a no-op.
  void signal(uint32_t pulses);

private:
  DigitalOutput &out_;
  Clock &clock_;
  uint32_t onMs_;
  uint32_t offMs_;
};
