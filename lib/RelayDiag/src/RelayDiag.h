#pragma once

// system includes
#include <stdint.h>

// project includes
#include "CureIO.h"
#include "DebouncedInput.h"
#include "TriStateOutput.h"

// Bench test for relay wiring. Each button press runs the next pattern, then
// floats the line. The press after the last pattern runs nothing and starts
// the sequence over. Only built when RELAY_DIAG_MODE is set; never shares a
// build with the cure controller.
enum class DiagPattern : uint8_t {
  BriefPulse = 0,
  MediumPulse,
  LongPulse,
  QuickPulses,
  SlowToggle,
  AllDone,
  Count
};

class RelayDiag {
public:
  RelayDiag(DebouncedInput &button, TriStateOutput &relay, Clock &clock,
            DigitalOutput *statusLed = nullptr, uint32_t pollIntervalMs = 1);

  void begin();

  // Same contract as CureCycle::step(): returns true if a pattern ran
  bool step();

  // Runs one pattern immediately, ending Floating
  void run(DiagPattern p);

  DiagPattern nextPattern() const { return next_; }

private:
  void pulse(uint32_t onMs, uint32_t offMs);

  DebouncedInput &button_;
  TriStateOutput &relay_;
  Clock &clock_;
  DigitalOutput *statusLed_;
  uint32_t pollIntervalMs_;
  DiagPattern next_;
};

const char *diagPatternName(DiagPattern p);
