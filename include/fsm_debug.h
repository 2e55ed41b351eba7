// Lightweight FSM debug helper. Define FSM_DEBUG in your build to enable prints.
#pragma once
#ifdef FSM_DEBUG
#include <Arduino.h>
#include <events.h>
// Variadic macros let us forward formatting args (eg Serial.print(val, digits)).
#define FSM_DBG_PRINT(...)                                                                         \
  do {                                                                                             \
    if (Serial)                                                                                    \
      Serial.print(__VA_ARGS__);                                                                   \
  } while (0)
#define FSM_DBG_PRINTLN(...)                                                                       \
  do {                                                                                             \
    if (Serial)                                                                                    \
      Serial.println(__VA_ARGS__);                                                                 \
  } while (0)
// Human-readable event names. Use like:
// FSM_DBG_PRINTLN(cycleEventName(ev));
inline const char *cycleEventName(CycleEvent e) {
  switch (e) {
  case CycleEvent::None:
    return "None";
  case CycleEvent::ButtonPress:
    return "ButtonPress";
  case CycleEvent::CureElapsed:
    return "CureElapsed";
  case CycleEvent::SettleElapsed:
    return "SettleElapsed";
  case CycleEvent::NotifyDone:
    return "NotifyDone";
  case CycleEvent::CooldownElapsed:
    return "CooldownElapsed";
  default:
    return "CycleEvent(unknown)";
  }
}
#else
#define FSM_DBG_PRINT(...) ((void)0)
#define FSM_DBG_PRINTLN(...) ((void)0)
#endif
