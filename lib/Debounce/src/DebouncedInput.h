#pragma once

// system includes
#include <stdint.h>

// project includes
#include "CureIO.h"

enum class ButtonEvent : uint8_t { None = 0, Press = 1 };

// Press detector for a bouncing mechanical switch.
//
// An inactive -> active transition starts the debounce window. Samples taken
// inside the window are ignored, so contact chatter neither restarts nor
// cancels it. Once the window has elapsed the line is checked again; if it is
// still active exactly one Press is reported and the input goes refractory
// until the line reads inactive. Otherwise the edge was noise.
//
// The window starts at the first poll that sees the line active, so a press
// of exactly windowMs is only guaranteed to count when polling every 1 ms.
//
// A line that never returns inactive never re-arms. That is a hardware fault
// on the switch, not something this filter tries to recover from.
class DebouncedInput {
public:
  DebouncedInput(DigitalInput &line, uint32_t windowMs);

  // Sample the line once. Non-blocking; call at least every windowMs.
  ButtonEvent poll(uint32_t nowMs);

  // Drop any half-seen press. If the line is active right now the input stays
  // refractory until it is released, so a press made while nobody was polling
  // is never reported.
  void rearm();

  bool isPending() const { return phase_ == Phase::Pending; }
  bool isRefractory() const { return phase_ == Phase::Latched; }

private:
  enum class Phase : uint8_t { Released, Pending, Latched };

  DigitalInput &line_;
  uint32_t windowMs_;
  Phase phase_;
  uint32_t pendingSinceMs_;
};
