#include "RelayDiag.h"
#include "config.h"
#include "fsm_debug.h"

RelayDiag::RelayDiag(DebouncedInput &button, TriStateOutput &relay, Clock &clock,
                     DigitalOutput *statusLed, uint32_t pollIntervalMs)
    : button_(button), relay_(relay), clock_(clock), statusLed_(statusLed),
      pollIntervalMs_(pollIntervalMs), next_(DiagPattern::BriefPulse) {}

void RelayDiag::begin() {
  relay_.begin();
  if (statusLed_)
    statusLed_->write(false);
  button_.rearm();
  next_ = DiagPattern::BriefPulse;
}

bool RelayDiag::step() {
  if (button_.poll(clock_.nowMs()) != ButtonEvent::Press) {
    clock_.sleepMs(pollIntervalMs_);
    return false;
  }
  run(next_);
  uint8_t n = static_cast<uint8_t>(next_) + 1;
  next_ = (n >= static_cast<uint8_t>(DiagPattern::Count)) ? DiagPattern::BriefPulse
                                                          : static_cast<DiagPattern>(n);
  clock_.sleepMs(DIAG_PAUSE_MS);
  button_.rearm();
  return true;
}

void RelayDiag::run(DiagPattern p) {
  FSM_DBG_PRINT("DIAG: ");
  FSM_DBG_PRINTLN(diagPatternName(p));
  if (statusLed_)
    statusLed_->write(true);

  switch (p) {
  case DiagPattern::BriefPulse:
    pulse(DIAG_BRIEF_PULSE_MS, 0);
    break;
  case DiagPattern::MediumPulse:
    pulse(DIAG_MEDIUM_PULSE_MS, 0);
    break;
  case DiagPattern::LongPulse:
    pulse(DIAG_LONG_PULSE_MS, 0);
    break;
  case DiagPattern::QuickPulses:
    for (uint32_t i = 0; i < DIAG_QUICK_PULSE_COUNT; ++i)
      pulse(DIAG_QUICK_PULSE_MS, DIAG_QUICK_PULSE_MS);
    break;
  case DiagPattern::SlowToggle:
    pulse(DIAG_SLOW_TOGGLE_MS, DIAG_SLOW_TOGGLE_MS);
    break;
  case DiagPattern::AllDone:
  default:
    break;
  }

  relay_.release();
  if (statusLed_)
    statusLed_->write(false);
}

void RelayDiag::pulse(uint32_t onMs, uint32_t offMs) {
  relay_.energize();
  clock_.sleepMs(onMs);
  relay_.release();
  if (offMs)
    clock_.sleepMs(offMs);
}

const char *diagPatternName(DiagPattern p) {
  switch (p) {
  case DiagPattern::BriefPulse:
    return "brief pulse (100ms)";
  case DiagPattern::MediumPulse:
    return "medium pulse (500ms)";
  case DiagPattern::LongPulse:
    return "long pulse (1000ms)";
  case DiagPattern::QuickPulses:
    return "5 quick pulses (50ms)";
  case DiagPattern::SlowToggle:
    return "slow toggle (2s)";
  case DiagPattern::AllDone:
    return "all tests done, restarting";
  default:
    return "?";
  }
}
