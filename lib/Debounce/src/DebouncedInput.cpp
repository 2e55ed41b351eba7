#include "DebouncedInput.h"
#include "fsm_debug.h"

DebouncedInput::DebouncedInput(DigitalInput &line, uint32_t windowMs)
    : line_(line), windowMs_(windowMs), phase_(Phase::Released), pendingSinceMs_(0) {}

ButtonEvent DebouncedInput::poll(uint32_t nowMs) {
  const bool active = line_.isActive();

  switch (phase_) {
  case Phase::Released:
    if (active) {
      phase_ = Phase::Pending;
      pendingSinceMs_ = nowMs;
    }
    return ButtonEvent::None;

  case Phase::Pending:
    // samples inside the window are chatter; only the level at the end counts
    if ((uint32_t)(nowMs - pendingSinceMs_) < windowMs_)
      return ButtonEvent::None;
    if (!active) {
      phase_ = Phase::Released;
      FSM_DBG_PRINTLN("Button: bounce rejected");
      return ButtonEvent::None;
    }
    phase_ = Phase::Latched;
    return ButtonEvent::Press;

  case Phase::Latched:
    if (!active)
      phase_ = Phase::Released;
    return ButtonEvent::None;
  }
  return ButtonEvent::None;
}

void DebouncedInput::rearm() {
  phase_ = line_.isActive() ? Phase::Latched : Phase::Released;
  pendingSinceMs_ = 0;
}
