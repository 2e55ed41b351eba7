// Arduino / FreeRTOS implementations of the cure core line interfaces
#pragma once
#include "CureIO.h"
#include <stdint.h>

// Push button on a GPIO. Active-low buttons use the internal pull-up.
class BoardButton : public DigitalInput {
public:
  BoardButton(int pin, bool activeLow) : pin_(pin), activeLow_(activeLow) {}
  void begin();
  bool isActive() override;

private:
  int pin_;
  bool activeLow_;
};

// Push-pull output (buzzer, LED)
class BoardOutput : public DigitalOutput {
public:
  BoardOutput(int pin, bool activeLow) : pin_(pin), activeLow_(activeLow) {}
  void begin();
  void write(bool on) override;

private:
  int pin_;
  bool activeLow_;
};

// Relay drive pin. release() turns the pin back into a plain input (no pull)
// so the relay module's input is left truly floating.
class BoardTriStatePin : public TriStatePin {
public:
  explicit BoardTriStatePin(int pin) : pin_(pin) {}
  void driveHigh() override;
  void driveLow() override;
  void release() override;

private:
  int pin_;
};

// millis() + vTaskDelay(): sleeping yields to the other tasks
class RtosClock : public Clock {
public:
  uint32_t nowMs() override;
  void sleepMs(uint32_t ms) override;
};

// Float the relay pin straight from setup(), before any task exists
void boardReleaseRelay();
