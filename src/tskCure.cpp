// tskCure.cpp - control task: owns the relay, button, buzzer and status LED
#include "tskCure.h"
#include "boardIo.h"
#include "config.h"
#include "cycleLog.h"
#include "dev_debug.h"
#include "CureCycle.h"
#include "CureParams.h"
#include "DebouncedInput.h"
#include "Notifier.h"
#include "RelayDiag.h"
#include "TriStateOutput.h"
#include <Arduino.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

// hardware configuration (see include/config.h)
static BoardButton g_buttonLine(HW_BUTTON_PIN, HW_BUTTON_ACTIVE_LOW);
static BoardTriStatePin g_relayPin(HW_RELAY_PIN);
static BoardOutput g_buzzer(HW_BUZZER_PIN, HW_BUZZER_ACTIVE_LOW);
static BoardOutput g_statusLed(HW_STATUS_LED_PIN, HW_STATUS_LED_ACTIVE_LOW);
static RtosClock g_clock;
static TriStateOutput g_relay(g_relayPin, HW_RELAY_ACTIVE_LOW);

#if RELAY_DIAG_MODE

static void vCureTask(void * /*pv*/) {
  g_relay.begin();
  g_statusLed.begin();
  g_buzzer.begin();
  g_buttonLine.begin();

  DebouncedInput button(g_buttonLine, BUTTON_DEBOUNCE_MS);
  RelayDiag diag(button, g_relay, g_clock, &g_statusLed, BUTTON_POLL_MS);
  diag.begin();
  Serial.println("DIAG: relay bench test - press button to run the next pattern");

  for (;;) {
    if (diag.step()) {
      Serial.print("DIAG: next ");
      Serial.println(diagPatternName(diag.nextPattern()));
    }
  }
}

#else

static void vCureTask(void * /*pv*/) {
  // Relay first: nothing else runs until the line is floating
  g_relay.begin();
  g_statusLed.begin();
  g_buzzer.begin();
  g_buttonLine.begin();

  const CureParams params = defaultCureParams();
  DebouncedInput button(g_buttonLine, params.debounceMs);
  Notifier notifier(g_buzzer, g_clock, params.pulseOnMs, params.pulseOffMs);
  CureCycle cycle(params, button, g_relay, notifier, g_clock, &g_statusLed);

  ParamError err = cycle.begin();
  if (err != ParamError::None) {
    // Unarmed: relay stays floating and step() only blinks the status LED
    Serial.print("CURE: configuration rejected: ");
    Serial.println(paramErrorName(err));
  } else {
    cycleLogInit(params);
    cycle.setTransitionHook([&cycle](CycleState from, CycleState to) {
      cycleLogTransition(cycle.completedCycles() + 1, from, to, g_relay.mode());
    });
    DEV_DBG_PRINTLN("Cure task started");
  }

  for (;;) {
    cycle.step();
  }
}

#endif

bool createCureTask() {
  return xTaskCreatePinnedToCore(vCureTask, "CureTask", CURE_TASK_STACK, nullptr,
                                 CURE_TASK_PRIORITY, nullptr, CURE_TASK_CORE) == pdPASS;
}

