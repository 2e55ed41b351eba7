#include "TriStateOutput.h"
#include "fsm_debug.h"

TriStateOutput::TriStateOutput(TriStatePin &pin, bool activeLow)
    : pin_(pin), activeLow_(activeLow), mode_(DriveMode::Floating) {}

void TriStateOutput::begin() {
  // Don't trust mode_: after a warm restart the pin may still be driven
  pin_.release();
  mode_ = DriveMode::Floating;
}

void TriStateOutput::set(DriveMode mode) {
  switch (mode) {
  case DriveMode::DrivenHigh:
    pin_.driveHigh();
    break;
  case DriveMode::DrivenLow:
    pin_.driveLow();
    break;
  case DriveMode::Floating:
  default:
    pin_.release();
    mode = DriveMode::Floating;
    break;
  }
  if (mode != mode_) {
    FSM_DBG_PRINT("Relay: ");
    FSM_DBG_PRINTLN(driveModeName(mode));
  }
  mode_ = mode;
}

void TriStateOutput::energize() {
  set(energizedMode());
}

void TriStateOutput::release() {
  set(DriveMode::Floating);
}

const char *driveModeName(DriveMode m) {
  switch (m) {
  case DriveMode::Floating:
    return "FLOAT";
  case DriveMode::DrivenLow:
    return "LOW";
  case DriveMode::DrivenHigh:
    return "HIGH";
  default:
    return "?";
  }
}
