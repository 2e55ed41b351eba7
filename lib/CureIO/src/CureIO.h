#pragma once

// system includes
#include <stdint.h>

// Line-level interfaces used by the cure core. The board layer (src/boardIo.cpp)
// implements them on top of Arduino GPIO and FreeRTOS; the host test harness
// implements them with virtual time.

// Logical input line (polarity already resolved: true = pressed)
class DigitalInput {
public:
  virtual ~DigitalInput() {}
  virtual bool isActive() = 0;
};

// Plain push-pull output (buzzer, status LED)
class DigitalOutput {
public:
  virtual ~DigitalOutput() {}
  virtual void write(bool on) = 0;
};

// Output line that can also be released to high impedance.
// release() must reconfigure the pin as an input with no pull resistor so the
// line neither sources nor sinks current. Writing the inactive level is not an
// acceptable implementation of release().
class TriStatePin {
public:
  virtual ~TriStatePin() {}
  virtual void driveHigh() = 0;
  virtual void driveLow() = 0;
  virtual void release() = 0;
};

// Monotonic millisecond clock. sleepMs() suspends the calling task only.
class Clock {
public:
  virtual ~Clock() {}
  virtual uint32_t nowMs() = 0;
  virtual void sleepMs(uint32_t ms) = 0;
};
