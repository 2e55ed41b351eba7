#pragma once
#include <cstdint>

// ==================== CURE CYCLE DEFAULTS ====================
// Common resin cure times: 5s quick test, 10s standard, 30s deep, 60s full,
// 120s extended, 300s long.
constexpr uint32_t CURE_DURATION_S = 300u;
constexpr uint32_t BUTTON_DEBOUNCE_MS = 50u;      // raise if a single press double-triggers
constexpr uint32_t RELAY_SETTLE_MS = 500u;        // raise if the UV LEDs don't drop out reliably
constexpr uint32_t COMPLETION_BEEPS = 3u;
constexpr uint32_t BEEP_ON_MS = 200u;
constexpr uint32_t BEEP_OFF_MS = 300u;
constexpr uint32_t CYCLE_COOLDOWN_MS = 1000u;     // blocks an accidental immediate re-trigger
constexpr uint32_t BUTTON_POLL_MS = 1u;            // one tick; a press of exactly the debounce window needs it

// ==================== PARAMETER LIMITS ====================
// Anything outside these bounds is a configuration fault and the controller
// refuses to arm.
constexpr uint32_t CURE_DURATION_MAX_S = 600u;    // 10 minute UV exposure ceiling
constexpr uint32_t BUTTON_DEBOUNCE_MIN_MS = 10u;
constexpr uint32_t BUTTON_DEBOUNCE_MAX_MS = 500u;
constexpr uint32_t RELAY_SETTLE_MIN_MS = 1u;
constexpr uint32_t RELAY_SETTLE_MAX_MS = 5000u;
constexpr uint32_t COMPLETION_BEEPS_MAX = 10u;
constexpr uint32_t BEEP_ON_MIN_MS = 1u;
constexpr uint32_t BEEP_ON_MAX_MS = 2000u;
constexpr uint32_t BEEP_OFF_MAX_MS = 2000u;
constexpr uint32_t CYCLE_COOLDOWN_MAX_MS = 60u * 1000u;
constexpr uint32_t BUTTON_POLL_MIN_MS = 1u;

// ==================== RELAY DIAGNOSTIC ====================
// 1 = build the bench relay test instead of the cure controller
#define RELAY_DIAG_MODE 0

constexpr uint32_t DIAG_BRIEF_PULSE_MS = 100u;
constexpr uint32_t DIAG_MEDIUM_PULSE_MS = 500u;
constexpr uint32_t DIAG_LONG_PULSE_MS = 1000u;
constexpr uint32_t DIAG_QUICK_PULSE_MS = 50u;
constexpr uint32_t DIAG_QUICK_PULSE_COUNT = 5u;
constexpr uint32_t DIAG_SLOW_TOGGLE_MS = 2000u;
constexpr uint32_t DIAG_PAUSE_MS = 1000u;

// ==================== LOGGING ====================
#define CYCLE_LOGGING_ENABLED 1  // CSV transition log on Serial (0 = disabled, 1 = enabled)
constexpr unsigned long SERIAL_BAUD = 115200;

// ==================== GPIO PINS ====================
constexpr int HW_BUTTON_PIN = 27;
constexpr int HW_RELAY_PIN = 25;
constexpr int HW_BUZZER_PIN = 26;
constexpr int HW_STATUS_LED_PIN = 33;

// ==================== HARDWARE POLARITY ====================
// SRD-05VDC-SL-C module: coil pulls in when the input is driven LOW
constexpr bool HW_RELAY_ACTIVE_LOW = true;
constexpr bool HW_BUTTON_ACTIVE_LOW = true;       // switch to GND, internal pull-up
constexpr bool HW_BUZZER_ACTIVE_LOW = false;
constexpr bool HW_STATUS_LED_ACTIVE_LOW = false;

// ==================== TASKS ====================
constexpr uint32_t CURE_TASK_STACK = 4096u;
constexpr uint32_t CURE_TASK_PRIORITY = 1u;
constexpr int CURE_TASK_CORE = 1;
constexpr uint32_t FAULT_BLINK_MS = 150u;  // status LED period while halted on a config fault
