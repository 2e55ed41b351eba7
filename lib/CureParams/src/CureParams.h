#pragma once

// system includes
#include <stdint.h>

// Cure cycle timing parameters. Built once at boot, validated, then treated as
// constants for the rest of the run.
struct CureParams {
  uint32_t cureDurationS;   // UV on time, whole seconds
  uint32_t debounceMs;      // button must stay pressed this long to count
  uint32_t settleMs;        // wait after relay release before signalling
  uint32_t notifyPulses;    // completion beeps (0 = silent)
  uint32_t pulseOnMs;
  uint32_t pulseOffMs;
  uint32_t cooldownMs;      // wait before the button is re-armed
  uint32_t pollIntervalMs;  // button sampling period while Idle

  uint32_t cureDurationMs() const { return cureDurationS * 1000u; }
  uint32_t notifyDurationMs() const { return notifyPulses * (pulseOnMs + pulseOffMs); }
  // Idle -> Idle time, not counting the debounce window of the press itself
  uint32_t cycleDurationMs() const {
    return cureDurationMs() + settleMs + notifyDurationMs() + cooldownMs;
  }
};

enum class ParamError : uint8_t {
  None = 0,
  CureDurationZero,
  CureDurationTooLong,
  DebounceOutOfRange,
  SettleOutOfRange,
  TooManyPulses,
  PulseOnOutOfRange,
  PulseOffOutOfRange,
  CooldownTooLong,
  PollIntervalOutOfRange
};

// Parameter set built from the defaults in config.h
CureParams defaultCureParams();

// Check every field against the limits in config.h. Returns the first failure.
ParamError validateCureParams(const CureParams &p);

const char *paramErrorName(ParamError e);
