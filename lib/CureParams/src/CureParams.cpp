#include "CureParams.h"
#include "config.h"

CureParams defaultCureParams() {
  CureParams p;
  p.cureDurationS = CURE_DURATION_S;
  p.debounceMs = BUTTON_DEBOUNCE_MS;
  p.settleMs = RELAY_SETTLE_MS;
  p.notifyPulses = COMPLETION_BEEPS;
  p.pulseOnMs = BEEP_ON_MS;
  p.pulseOffMs = BEEP_OFF_MS;
  p.cooldownMs = CYCLE_COOLDOWN_MS;
  p.pollIntervalMs = BUTTON_POLL_MS;
  return p;
}

ParamError validateCureParams(const CureParams &p) {
  if (p.cureDurationS == 0)
    return ParamError::CureDurationZero;
  if (p.cureDurationS > CURE_DURATION_MAX_S)
    return ParamError::CureDurationTooLong;
  if (p.debounceMs < BUTTON_DEBOUNCE_MIN_MS || p.debounceMs > BUTTON_DEBOUNCE_MAX_MS)
    return ParamError::DebounceOutOfRange;
  if (p.settleMs < RELAY_SETTLE_MIN_MS || p.settleMs > RELAY_SETTLE_MAX_MS)
    return ParamError::SettleOutOfRange;
  if (p.notifyPulses > COMPLETION_BEEPS_MAX)
    return ParamError::TooManyPulses;
  if (p.pulseOnMs < BEEP_ON_MIN_MS || p.pulseOnMs > BEEP_ON_MAX_MS)
    return ParamError::PulseOnOutOfRange;
  if (p.pulseOffMs > BEEP_OFF_MAX_MS)
    return ParamError::PulseOffOutOfRange;
  if (p.cooldownMs > CYCLE_COOLDOWN_MAX_MS)
    return ParamError::CooldownTooLong;
  // Sampling slower than the debounce window would stretch every press check
  if (p.pollIntervalMs < BUTTON_POLL_MIN_MS || p.pollIntervalMs > p.debounceMs)
    return ParamError::PollIntervalOutOfRange;
  return ParamError::None;
}

const char *paramErrorName(ParamError e) {
  switch (e) {
  case ParamError::None:
    return "ok";
  case ParamError::CureDurationZero:
    return "cure duration must be > 0 s";
  case ParamError::CureDurationTooLong:
    return "cure duration exceeds 600 s ceiling";
  case ParamError::DebounceOutOfRange:
    return "debounce window outside 10-500 ms";
  case ParamError::SettleOutOfRange:
    return "relay settle delay outside 1-5000 ms";
  case ParamError::TooManyPulses:
    return "more than 10 completion beeps";
  case ParamError::PulseOnOutOfRange:
    return "beep on time outside 1-2000 ms";
  case ParamError::PulseOffOutOfRange:
    return "beep off time above 2000 ms";
  case ParamError::CooldownTooLong:
    return "cooldown above 60 s";
  case ParamError::PollIntervalOutOfRange:
    return "poll interval outside 1 ms..debounce window";
  default:
    return "unknown parameter error";
  }
}
