#include "Notifier.h"
#include "fsm_debug.h"

Notifier::Notifier(DigitalOutput &out, Clock &clock, uint32_t onMs, uint32_t offMs)
    : out_(out), clock_(clock), onMs_(onMs), offMs_(offMs) {}

void Notifier::begin() {
  out_.write(false);
}

void Notifier::signal(uint32_t pulses) {
  for (uint32_t i = 1; i <= pulses; ++i) {
    FSM_DBG_PRINT("Notifier: beep ");
    FSM_DBG_PRINT(i);
    FSM_DBG_PRINT("/");
    FSM_DBG_PRINTLN(pulses);
    out_.write(true);
    clock_.sleepMs(onMs_);
    out_.write(false);
    clock_.sleepMs(offMs_);
  }
}
