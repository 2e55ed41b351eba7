#include "cycleLog.h"

#if CYCLE_LOGGING_ENABLED

#include <Arduino.h>

// State abbreviation lookup
static const char *getCycleStateAbbr(CycleState s) {
  switch (s) {
    case CycleState::Idle: return "IDLE";
    case CycleState::Curing: return "CURE";
    case CycleState::Releasing: return "REL";
    case CycleState::Notifying: return "NOTE";
    case CycleState::Cooldown: return "COOL";
    default: return "UNKN";
  }
}

void cycleLogInit(const CureParams &params) {
  Serial.printf("# cure=%lus debounce=%lums settle=%lums beeps=%lu on=%lums off=%lums cooldown=%lums\n",
                (unsigned long)params.cureDurationS, (unsigned long)params.debounceMs,
                (unsigned long)params.settleMs, (unsigned long)params.notifyPulses,
                (unsigned long)params.pulseOnMs, (unsigned long)params.pulseOffMs,
                (unsigned long)params.cooldownMs);
  // CSV header, one row per state change
  Serial.println("time_ms,cycle,from,to,drive");
}

void cycleLogTransition(uint32_t cycle, CycleState from, CycleState to, DriveMode drive) {
  Serial.printf("%lu,%lu,%s,%s,%s\n",
                millis(),
                (unsigned long)cycle,
                getCycleStateAbbr(from), getCycleStateAbbr(to),
                driveModeName(drive));
}

#endif
