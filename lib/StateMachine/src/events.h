#pragma once

// system includes
#include <stdint.h>

// Events driving the cure cycle FSM
enum class CycleEvent : uint8_t {
  None = 0,
  ButtonPress,     // debounced press while Idle
  CureElapsed,     // cure timer finished
  SettleElapsed,   // relay contacts had time to open
  NotifyDone,      // completion pulses finished
  CooldownElapsed, // re-arm window finished
  Count
};

// Cure cycle states
enum class CycleState : uint8_t {
  Idle = 0,
  Curing,
  Releasing,
  Notifying,
  Cooldown,
  Count
};
