#pragma once

// system includes
#include <functional>
#include <stdint.h>

// project includes
#include "CureIO.h"
#include "CureParams.h"
#include "DebouncedInput.h"
#include "Notifier.h"
#include "StateMachine.h"
#include "TriStateOutput.h"
#include "events.h"

// Cure cycle controller: Idle -> Curing -> Releasing -> Notifying -> Cooldown -> Idle.
//
// Owns the only writer of the relay line. The relay is driven only while the
// machine is in Curing; leaving Curing by any transition floats the line before
// any other hook runs, and begin() floats it before anything else on every boot.
//
// begin() refuses to arm on a parameter set that fails validateCureParams().
// An unarmed controller never samples the button or drives the relay; step()
// only blinks the status LED.
//
// All waits go through Clock::sleepMs() and are relative to the end of the
// previous step. The cure wait is never cut short and the button is not
// sampled while a cycle runs.
class CureCycle {
public:
  using TransitionHook = std::function<void(CycleState from, CycleState to)>;

  CureCycle(const CureParams &params, DebouncedInput &button, TriStateOutput &relay,
            Notifier &notifier, Clock &clock, DigitalOutput *statusLed = nullptr);

  // Cold start / warm restart: relay floating, outputs off, then validate the
  // parameters. Arms and returns ParamError::None, or stays unarmed and
  // returns the first failure.
  ParamError begin();

  // One scheduler turn. Armed and Idle: samples the button once; a debounced
  // press runs a complete cycle back to Idle and returns true. Otherwise yields
  // for the poll interval and returns false. Unarmed: toggles the status LED,
  // yields for FAULT_BLINK_MS and returns false.
  bool step();

  CycleState getState() const { return _fsm.getState(); }
  uint32_t completedCycles() const { return _cycles; }
  bool isArmed() const { return _armed; }

  // Called after every state change, from the control task
  void setTransitionHook(TransitionHook hook) { _hook = hook; }

private:
  CureCycle(const CureCycle &) = delete;
  CureCycle &operator=(const CureCycle &) = delete;

  void setupStateMachine();
  void runCycle();
  void dispatch(CycleEvent ev);
  void setStatus(bool on);
  void faultBlink();

  const CureParams _params;
  DebouncedInput &_button;
  TriStateOutput &_relay;
  Notifier &_notifier;
  Clock &_clock;
  DigitalOutput *_statusLed;
  StateMachine<CycleState, CycleEvent> _fsm;
  TransitionHook _hook;
  uint32_t _cycles;
  bool _armed;
  bool _faultLedOn;
};
