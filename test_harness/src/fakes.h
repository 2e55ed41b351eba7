// Host-side fakes for the cure core line interfaces. Time is virtual: nothing
// moves until someone sleeps.
#pragma once

#include "CureIO.h"
#include "TriStateOutput.h"
#include <functional>
#include <stddef.h>
#include <stdint.h>
#include <vector>

class FakeClock : public Clock {
public:
  uint32_t now = 0;
  uint32_t sleeps = 0;
  // Called at every suspension point, before time advances
  std::function<void(uint32_t ms)> onSleep;

  uint32_t nowMs() override { return now; }
  void sleepMs(uint32_t ms) override {
    ++sleeps;
    if (onSleep)
      onSleep(ms);
    now += ms;
  }
};

// Button with scripted presses. A press of duration d starting at t0 reads
// active for every t with t0 <= t <= t0 + d.
class FakeButton : public DigitalInput {
public:
  explicit FakeButton(Clock &clock) : clock_(clock) {}

  void press(uint32_t startMs, uint32_t durationMs) {
    Window w = {startMs, durationMs};
    windows_.push_back(w);
  }
  void hold(uint32_t startMs) { press(startMs, 0x7FFFFFFFu); }
  void clear() { windows_.clear(); }

  bool isActive() override {
    uint32_t t = clock_.nowMs();
    sampleTimes.push_back(t);
    for (size_t i = 0; i < windows_.size(); ++i) {
      const Window &w = windows_[i];
      if ((uint32_t)(t - w.startMs) <= w.durationMs)
        return true;
    }
    return false;
  }

  std::vector<uint32_t> sampleTimes;

private:
  struct Window {
    uint32_t startMs;
    uint32_t durationMs;
  };
  Clock &clock_;
  std::vector<Window> windows_;
};

// Relay drive pin. Keeps its electrical state across a simulated restart,
// like a GPIO latch that nobody reset.
class FakeRelayPin : public TriStatePin {
public:
  DriveMode electrical = DriveMode::Floating;
  uint32_t driveHighCalls = 0;
  uint32_t driveLowCalls = 0;
  uint32_t releaseCalls = 0;
  std::vector<DriveMode> history;

  void driveHigh() override {
    ++driveHighCalls;
    set(DriveMode::DrivenHigh);
  }
  void driveLow() override {
    ++driveLowCalls;
    set(DriveMode::DrivenLow);
  }
  void release() override {
    ++releaseCalls;
    set(DriveMode::Floating);
  }

private:
  void set(DriveMode m) {
    electrical = m;
    history.push_back(m);
  }
};

// Push-pull output that records its edges against the clock
class FakeOutput : public DigitalOutput {
public:
  explicit FakeOutput(Clock *clock = nullptr) : clock_(clock) {}

  bool on = false;
  uint32_t writes = 0;
  std::vector<uint32_t> risingMs;
  std::vector<uint32_t> fallingMs;

  void write(bool level) override {
    ++writes;
    uint32_t t = clock_ ? clock_->nowMs() : 0;
    if (level && !on)
      risingMs.push_back(t);
    if (!level && on)
      fallingMs.push_back(t);
    on = level;
  }

private:
  Clock *clock_;
};
