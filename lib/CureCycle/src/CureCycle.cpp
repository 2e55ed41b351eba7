#include "CureCycle.h"
#include "config.h"
#include "fsm_debug.h"

CureCycle::CureCycle(const CureParams &params, DebouncedInput &button, TriStateOutput &relay,
                     Notifier &notifier, Clock &clock, DigitalOutput *statusLed)
    : _params(params), _button(button), _relay(relay), _notifier(notifier), _clock(clock),
      _statusLed(statusLed), _fsm(CycleState::Idle), _cycles(0), _armed(false),
      _faultLedOn(false) {
  setupStateMachine();
}

//------------------------------------------------------------------------------
// Configure transitions and entry/exit hooks
//------------------------------------------------------------------------------
void CureCycle::setupStateMachine() {
  Transition<CycleState, CycleEvent> trans[] = {
      {CycleState::Idle, CycleEvent::ButtonPress, CycleState::Curing,
       []() { FSM_DBG_PRINTLN("CURE: Idle -> Curing (button)"); }},
      {CycleState::Curing, CycleEvent::CureElapsed, CycleState::Releasing,
       []() { FSM_DBG_PRINTLN("CURE: Curing -> Releasing (timer)"); }},
      {CycleState::Releasing, CycleEvent::SettleElapsed, CycleState::Notifying,
       []() { FSM_DBG_PRINTLN("CURE: Releasing -> Notifying"); }},
      {CycleState::Notifying, CycleEvent::NotifyDone, CycleState::Cooldown,
       []() { FSM_DBG_PRINTLN("CURE: Notifying -> Cooldown"); }},
      {CycleState::Cooldown, CycleEvent::CooldownElapsed, CycleState::Idle,
       []() { FSM_DBG_PRINTLN("CURE: Cooldown -> Idle"); }},
  };
  for (auto &t : trans)
    _fsm.addTransition(t);

  _fsm.setEntry(CycleState::Curing, [this]() {
    _relay.energize();
    setStatus(true);
  });

  // Every way out of Curing goes through here first
  _fsm.setExit(CycleState::Curing, [this]() { _relay.release(); });

  _fsm.setEntry(CycleState::Releasing, [this]() { setStatus(false); });

  _fsm.setEntry(CycleState::Idle, [this]() {
    _relay.release();
    setStatus(false);
    _button.rearm();
  });
}

ParamError CureCycle::begin() {
  _relay.begin();
  _notifier.begin();
  setStatus(false);
  _armed = false;

  ParamError err = validateCureParams(_params);
  if (err != ParamError::None) {
    FSM_DBG_PRINT("CURE: not arming: ");
    FSM_DBG_PRINTLN(paramErrorName(err));
    return err;
  }

  _button.rearm();
  _armed = true;
  FSM_DBG_PRINTLN("CURE: armed");
  return ParamError::None;
}

bool CureCycle::step() {
  if (!_armed) {
    faultBlink();
    return false;
  }
  if (_fsm.getState() == CycleState::Idle &&
      _button.poll(_clock.nowMs()) == ButtonEvent::Press) {
    runCycle();
    return true;
  }
  _clock.sleepMs(_params.pollIntervalMs);
  return false;
}

void CureCycle::runCycle() {
  dispatch(CycleEvent::ButtonPress);
  _clock.sleepMs(_params.cureDurationMs());

  dispatch(CycleEvent::CureElapsed);
  _clock.sleepMs(_params.settleMs);

  dispatch(CycleEvent::SettleElapsed);
  _notifier.signal(_params.notifyPulses);

  dispatch(CycleEvent::NotifyDone);
  _clock.sleepMs(_params.cooldownMs);

  dispatch(CycleEvent::CooldownElapsed);
  ++_cycles;
}

void CureCycle::dispatch(CycleEvent ev) {
  CycleState from = _fsm.getState();
  if (!_fsm.handleEvent(ev)) {
    FSM_DBG_PRINT("CURE: event ignored -> ");
    FSM_DBG_PRINTLN(cycleEventName(ev));
    return;
  }
  if (_hook)
    _hook(from, _fsm.getState());
}

void CureCycle::faultBlink() {
  _faultLedOn = !_faultLedOn;
  setStatus(_faultLedOn);
  _clock.sleepMs(FAULT_BLINK_MS);
}

void CureCycle::setStatus(bool on) {
  if (_statusLed)
    _statusLed->write(on);
}
