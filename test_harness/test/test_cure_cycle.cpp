#include <unity.h>
#include "CureCycle.h"
#include "CureParams.h"
#include "config.h"
#include "fakes.h"
#include <vector>

void setUp() {}
void tearDown() {}

struct StepRecord {
  CycleState from;
  CycleState to;
  uint32_t atMs;
  DriveMode drive;
};

// Thrown from a sleep to cut the control task off mid-cycle
struct PowerLoss {};

// cure=2s, 3 x (100 on / 100 off), settle 500 ms, cooldown 1 s
static CureParams scenarioParams() {
  CureParams p = defaultCureParams();
  p.cureDurationS = 2;
  p.debounceMs = 50;
  p.settleMs = 500;
  p.notifyPulses = 3;
  p.pulseOnMs = 100;
  p.pulseOffMs = 100;
  p.cooldownMs = 1000;
  p.pollIntervalMs = 1;
  return p;
}

// Controller wired to fake hardware, already begin()'d
struct Rig {
  CureParams params;
  FakeClock clock;
  FakeButton line;
  FakeRelayPin relayPin;
  FakeOutput buzzer;
  FakeOutput led;
  TriStateOutput relay;
  DebouncedInput button;
  Notifier notifier;
  CureCycle cycle;
  std::vector<StepRecord> steps;
  ParamError beginResult;

  explicit Rig(const CureParams &p, bool relayActiveLow = true)
      : params(p), line(clock), buzzer(&clock), led(&clock), relay(relayPin, relayActiveLow),
        button(line, p.debounceMs), notifier(buzzer, clock, p.pulseOnMs, p.pulseOffMs),
        cycle(p, button, relay, notifier, clock, &led) {
    cycle.setTransitionHook([this](CycleState from, CycleState to) {
      StepRecord s = {from, to, clock.now, relayPin.electrical};
      steps.push_back(s);
    });
    beginResult = cycle.begin();
  }

  // Step until the clock reaches untilMs; returns the number of cycles run
  int runUntil(uint32_t untilMs) {
    int cycles = 0;
    while (clock.now < untilMs) {
      if (cycle.step())
        ++cycles;
    }
    return cycles;
  }
};

static void assertStep(const StepRecord &s, CycleState from, CycleState to, uint32_t atMs) {
  TEST_ASSERT_EQUAL_INT((int)from, (int)s.from);
  TEST_ASSERT_EQUAL_INT((int)to, (int)s.to);
  TEST_ASSERT_EQUAL_UINT32(atMs, s.atMs);
}

static void test_starts_idle_and_floating() {
  Rig rig(scenarioParams());
  TEST_ASSERT_EQUAL_INT((int)CycleState::Idle, (int)rig.cycle.getState());
  TEST_ASSERT_EQUAL_INT((int)DriveMode::Floating, (int)rig.relayPin.electrical);
  TEST_ASSERT_FALSE(rig.buzzer.on);
  TEST_ASSERT_FALSE(rig.led.on);
  TEST_ASSERT_EQUAL_INT(0, rig.runUntil(5000));
}

static void test_valid_params_arm() {
  Rig rig(scenarioParams());
  TEST_ASSERT_EQUAL_INT((int)ParamError::None, (int)rig.beginResult);
  TEST_ASSERT_TRUE(rig.cycle.isArmed());
}

// Rejected parameter sets: never armed, button ignored, relay never driven
static void test_invalid_params_never_arm() {
  const uint32_t badCureS[] = {0, 700};
  const ParamError expected[] = {ParamError::CureDurationZero, ParamError::CureDurationTooLong};
  for (int i = 0; i < 2; ++i) {
    CureParams p = scenarioParams();
    p.cureDurationS = badCureS[i];
    Rig rig(p);
    TEST_ASSERT_EQUAL_INT((int)expected[i], (int)rig.beginResult);
    TEST_ASSERT_FALSE(rig.cycle.isArmed());

    rig.line.press(10, 200);
    rig.line.hold(1000);
    TEST_ASSERT_EQUAL_INT(0, rig.runUntil(20000));
    TEST_ASSERT_EQUAL_UINT32(0, (uint32_t)rig.steps.size());
    TEST_ASSERT_EQUAL_UINT32(0, rig.cycle.completedCycles());
    TEST_ASSERT_EQUAL_UINT32(0, (uint32_t)rig.line.sampleTimes.size());
    TEST_ASSERT_EQUAL_UINT32(0, rig.relayPin.driveLowCalls + rig.relayPin.driveHighCalls);
    TEST_ASSERT_EQUAL_INT((int)DriveMode::Floating, (int)rig.relayPin.electrical);
    TEST_ASSERT_FALSE(rig.buzzer.on);
  }
}

static void test_unarmed_controller_blinks_status() {
  CureParams p = scenarioParams();
  p.cureDurationS = 0;
  Rig rig(p);
  for (int i = 0; i < 4; ++i) {
    uint32_t before = rig.clock.now;
    TEST_ASSERT_FALSE(rig.cycle.step());
    TEST_ASSERT_EQUAL_UINT32(FAULT_BLINK_MS, rig.clock.now - before);
  }
  TEST_ASSERT_EQUAL_UINT32(2, (uint32_t)rig.led.risingMs.size());
  TEST_ASSERT_EQUAL_UINT32(0, rig.led.risingMs[0]);
  TEST_ASSERT_EQUAL_UINT32(2 * FAULT_BLINK_MS, rig.led.risingMs[1]);
  TEST_ASSERT_FALSE(rig.led.on);
}

static void test_scenario_a_full_cycle() {
  Rig rig(scenarioParams());
  rig.line.press(10, 200);
  rig.line.press(1060, 100);  // 1 s into the cure
  rig.line.press(3500, 100);  // during cooldown

  TEST_ASSERT_EQUAL_INT(1, rig.runUntil(10000));
  TEST_ASSERT_EQUAL_UINT32(1, rig.cycle.completedCycles());
  TEST_ASSERT_EQUAL_INT((int)CycleState::Idle, (int)rig.cycle.getState());

  TEST_ASSERT_EQUAL_UINT32(5, (uint32_t)rig.steps.size());
  assertStep(rig.steps[0], CycleState::Idle, CycleState::Curing, 60);
  assertStep(rig.steps[1], CycleState::Curing, CycleState::Releasing, 2060);
  assertStep(rig.steps[2], CycleState::Releasing, CycleState::Notifying, 2560);
  assertStep(rig.steps[3], CycleState::Notifying, CycleState::Cooldown, 3160);
  assertStep(rig.steps[4], CycleState::Cooldown, CycleState::Idle, 4160);

  TEST_ASSERT_EQUAL_UINT32(rig.params.cycleDurationMs(), rig.steps[4].atMs - rig.steps[0].atMs);

  TEST_ASSERT_EQUAL_UINT32(3, (uint32_t)rig.buzzer.risingMs.size());
  TEST_ASSERT_EQUAL_UINT32(2560, rig.buzzer.risingMs[0]);
  TEST_ASSERT_FALSE(rig.buzzer.on);
}

static void test_button_not_sampled_while_cycle_runs() {
  Rig rig(scenarioParams());
  rig.line.press(10, 200);
  rig.line.press(1060, 100);
  rig.runUntil(6000);

  const uint32_t cureStart = rig.steps[0].atMs;
  const uint32_t idleAgain = rig.steps[4].atMs;
  for (size_t i = 0; i < rig.line.sampleTimes.size(); ++i) {
    uint32_t t = rig.line.sampleTimes[i];
    TEST_ASSERT_TRUE_MESSAGE(t <= cureStart || t >= idleAgain, "button sampled mid-cycle");
  }
}

static void test_relay_driven_only_while_curing() {
  Rig rig(scenarioParams());
  int violations = 0;
  int curingChecks = 0;
  rig.clock.onSleep = [&](uint32_t) {
    CycleState s = rig.cycle.getState();
    if (s == CycleState::Curing) {
      ++curingChecks;
      if (rig.relayPin.electrical != DriveMode::DrivenLow || !rig.led.on)
        ++violations;
    } else if (rig.relayPin.electrical != DriveMode::Floating || !rig.relay.isFloating()) {
      ++violations;
    }
  };
  rig.line.press(10, 200);
  rig.line.press(5000, 80);
  TEST_ASSERT_EQUAL_INT(2, rig.runUntil(12000));

  TEST_ASSERT_EQUAL_INT(0, violations);
  TEST_ASSERT_EQUAL_INT(2, curingChecks);
  for (size_t i = 0; i < rig.steps.size(); ++i) {
    DriveMode expected =
        (rig.steps[i].to == CycleState::Curing) ? DriveMode::DrivenLow : DriveMode::Floating;
    TEST_ASSERT_EQUAL_INT((int)expected, (int)rig.steps[i].drive);
  }
}

static void test_release_never_drives_inactive_level() {
  Rig rig(scenarioParams());
  rig.line.press(10, 200);
  rig.runUntil(6000);
  // active-low relay: switching off by driving HIGH is exactly what must not happen
  TEST_ASSERT_EQUAL_UINT32(0, rig.relayPin.driveHighCalls);
  TEST_ASSERT_EQUAL_UINT32(1, rig.relayPin.driveLowCalls);
  TEST_ASSERT_EQUAL_INT((int)DriveMode::Floating, (int)rig.relayPin.electrical);
}

static void test_active_high_relay() {
  Rig rig(scenarioParams(), false);
  DriveMode duringCure = DriveMode::Floating;
  rig.clock.onSleep = [&](uint32_t) {
    if (rig.cycle.getState() == CycleState::Curing)
      duringCure = rig.relayPin.electrical;
  };
  rig.line.press(10, 200);
  TEST_ASSERT_EQUAL_INT(1, rig.runUntil(6000));
  TEST_ASSERT_EQUAL_INT((int)DriveMode::DrivenHigh, (int)duringCure);
  TEST_ASSERT_EQUAL_INT((int)DriveMode::Floating, (int)rig.relayPin.electrical);
}

static void test_status_led_mirrors_curing() {
  Rig rig(scenarioParams());
  rig.line.press(10, 200);
  rig.runUntil(6000);
  TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)rig.led.risingMs.size());
  TEST_ASSERT_EQUAL_UINT32(60, rig.led.risingMs[0]);
  TEST_ASSERT_EQUAL_UINT32(2060, rig.led.fallingMs[0]);
  TEST_ASSERT_FALSE(rig.led.on);
}

static void test_short_press_does_not_start() {
  Rig rig(scenarioParams());
  rig.line.press(100, 49);
  rig.line.press(300, 10);
  TEST_ASSERT_EQUAL_INT(0, rig.runUntil(3000));
  TEST_ASSERT_EQUAL_INT((int)DriveMode::Floating, (int)rig.relayPin.electrical);
  TEST_ASSERT_EQUAL_UINT32(0, rig.relayPin.driveLowCalls);
}

static void test_held_button_does_not_retrigger() {
  Rig rig(scenarioParams());
  rig.line.press(10, 20000);  // held well past the end of the cycle
  rig.line.press(25000, 100);
  TEST_ASSERT_EQUAL_INT(2, rig.runUntil(32000));
  TEST_ASSERT_EQUAL_UINT32(10, (uint32_t)rig.steps.size());
  assertStep(rig.steps[5], CycleState::Idle, CycleState::Curing, 25050);
}

static void test_back_to_back_cycles() {
  Rig rig(scenarioParams());
  rig.line.press(10, 100);
  rig.line.press(4200, 100);
  TEST_ASSERT_EQUAL_INT(2, rig.runUntil(9000));
  assertStep(rig.steps[5], CycleState::Idle, CycleState::Curing, 4250);
  TEST_ASSERT_EQUAL_UINT32(rig.params.cycleDurationMs(), rig.steps[9].atMs - rig.steps[5].atMs);
  TEST_ASSERT_EQUAL_UINT32(2, rig.cycle.completedCycles());
}

static void test_silent_completion() {
  CureParams p = scenarioParams();
  p.notifyPulses = 0;
  Rig rig(p);
  rig.line.press(10, 100);
  TEST_ASSERT_EQUAL_INT(1, rig.runUntil(5000));
  TEST_ASSERT_EQUAL_UINT32(0, (uint32_t)rig.buzzer.risingMs.size());
  TEST_ASSERT_EQUAL_UINT32(rig.steps[2].atMs, rig.steps[3].atMs);
  TEST_ASSERT_EQUAL_UINT32(2000 + 500 + 1000, rig.steps[4].atMs - rig.steps[0].atMs);
}

static void test_default_cycle_length() {
  CureParams p = defaultCureParams();
  Rig rig(p);
  rig.line.press(10, 200);
  TEST_ASSERT_EQUAL_INT(1, rig.runUntil(p.cycleDurationMs() + 1000));
  TEST_ASSERT_EQUAL_UINT32(p.cycleDurationMs(), rig.steps[4].atMs - rig.steps[0].atMs);
}

// Cut power at every suspension point of a cycle and boot a fresh controller
// on the same (un-reset) hardware
static void test_restart_at_any_point_comes_up_floating() {
  for (int cut = 1;; ++cut) {
    Rig rig(scenarioParams());
    rig.line.press(10, 200);
    int inCycleSleeps = 0;
    CycleState stateAtCut = CycleState::Idle;
    rig.clock.onSleep = [&](uint32_t) {
      if (rig.cycle.getState() == CycleState::Idle)
        return;
      if (++inCycleSleeps == cut) {
        stateAtCut = rig.cycle.getState();
        throw PowerLoss();
      }
    };

    bool lost = false;
    try {
      rig.runUntil(6000);
    } catch (const PowerLoss &) {
      lost = true;
    }
    if (!lost)
      break;  // past the last suspension point
    if (stateAtCut == CycleState::Curing)
      TEST_ASSERT_EQUAL_INT((int)DriveMode::DrivenLow, (int)rig.relayPin.electrical);

    rig.clock.onSleep = nullptr;
    TriStateOutput relay(rig.relayPin, true);
    DebouncedInput button(rig.line, rig.params.debounceMs);
    Notifier notifier(rig.buzzer, rig.clock, rig.params.pulseOnMs, rig.params.pulseOffMs);
    CureCycle rebooted(rig.params, button, relay, notifier, rig.clock, &rig.led);
    rebooted.begin();

    TEST_ASSERT_EQUAL_INT((int)CycleState::Idle, (int)rebooted.getState());
    TEST_ASSERT_EQUAL_INT((int)DriveMode::Floating, (int)rig.relayPin.electrical);
    TEST_ASSERT_FALSE(rig.buzzer.on);
    TEST_ASSERT_FALSE(rig.led.on);

    // Armed again: a fresh press runs a normal cycle
    // clear of the first press, which may still be held at the cut
    uint32_t t0 = rig.clock.now + 500;
    rig.line.press(t0, 100);
    bool ran = false;
    while (rig.clock.now < t0 + 200 && !ran)
      ran = rebooted.step();
    TEST_ASSERT_TRUE(ran);
    TEST_ASSERT_EQUAL_INT((int)DriveMode::Floating, (int)rig.relayPin.electrical);
  }
}

static void test_begin_from_driven_pin() {
  FakeClock clock;
  FakeButton line(clock);
  FakeRelayPin relayPin;
  FakeOutput buzzer(&clock);
  relayPin.driveLow();
  buzzer.write(true);

  CureParams p = scenarioParams();
  TriStateOutput relay(relayPin, true);
  DebouncedInput button(line, p.debounceMs);
  Notifier notifier(buzzer, clock, p.pulseOnMs, p.pulseOffMs);
  CureCycle cycle(p, button, relay, notifier, clock);
  cycle.begin();

  TEST_ASSERT_EQUAL_INT((int)DriveMode::Floating, (int)relayPin.electrical);
  TEST_ASSERT_EQUAL_INT((int)DriveMode::Floating, (int)relayPin.history.back());
  TEST_ASSERT_FALSE(buzzer.on);
}

int main() {
  UNITY_BEGIN();
  RUN_TEST(test_starts_idle_and_floating);
  RUN_TEST(test_valid_params_arm);
  RUN_TEST(test_invalid_params_never_arm);
  RUN_TEST(test_unarmed_controller_blinks_status);
  RUN_TEST(test_scenario_a_full_cycle);
  RUN_TEST(test_button_not_sampled_while_cycle_runs);
  RUN_TEST(test_relay_driven_only_while_curing);
  RUN_TEST(test_release_never_drives_inactive_level);
  RUN_TEST(test_active_high_relay);
  RUN_TEST(test_status_led_mirrors_curing);
  RUN_TEST(test_short_press_does_not_start);
  RUN_TEST(test_held_button_does_not_retrigger);
  RUN_TEST(test_back_to_back_cycles);
  RUN_TEST(test_silent_completion);
  RUN_TEST(test_default_cycle_length);
  RUN_TEST(test_restart_at_any_point_comes_up_floating);
  RUN_TEST(test_begin_from_driven_pin);
  return UNITY_END();
}
