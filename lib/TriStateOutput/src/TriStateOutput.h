#pragma once

// system includes
#include <stdint.h>

// project includes
#include "CureIO.h"

enum class DriveMode : uint8_t { Floating = 0, DrivenLow, DrivenHigh };

// Relay drive line.
//
// Driving the relay input to its inactive level does not reliably drop the
// coil: leakage through the relay module's driver keeps it pulled in. The only
// state that guarantees the relay is off is Floating, where the pin is turned
// back into an input and can neither source nor sink current.
class TriStateOutput {
public:
  TriStateOutput(TriStatePin &pin, bool activeLow);

  // Force the line to Floating regardless of the recorded mode. Call first
  // thing after power-on or restart.
  void begin();

  void set(DriveMode mode);
  // Drive the level that pulls the relay in (DrivenLow when active low)
  void energize();
  // Same as set(DriveMode::Floating)
  void release();

  DriveMode mode() const { return mode_; }
  bool isFloating() const { return mode_ == DriveMode::Floating; }
  bool isEnergized() const { return mode_ == energizedMode(); }
  DriveMode energizedMode() const { return activeLow_ ? DriveMode::DrivenLow : DriveMode::DrivenHigh; }

private:
  TriStatePin &pin_;
  bool activeLow_;
  DriveMode mode_;
};

const char *driveModeName(DriveMode m);
