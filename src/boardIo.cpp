// boardIo.cpp - GPIO and timing glue for the cure core
#include "boardIo.h"
#include "config.h"
#include <Arduino.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

void BoardButton::begin() {
  pinMode(pin_, activeLow_ ? INPUT_PULLUP : INPUT_PULLDOWN);
}

bool BoardButton::isActive() {
  bool high = digitalRead(pin_) == HIGH;
  return activeLow_ ? !high : high;
}

void BoardOutput::begin() {
  write(false);
  pinMode(pin_, OUTPUT);
}

void BoardOutput::write(bool on) {
  digitalWrite(pin_, (activeLow_) ? (on ? LOW : HIGH) : (on ? HIGH : LOW));
}

// Latch the level first so switching to OUTPUT never glitches through the
// opposite level
void BoardTriStatePin::driveHigh() {
  digitalWrite(pin_, HIGH);
  pinMode(pin_, OUTPUT);
}

void BoardTriStatePin::driveLow() {
  digitalWrite(pin_, LOW);
  pinMode(pin_, OUTPUT);
}

void BoardTriStatePin::release() {
  pinMode(pin_, INPUT);
}

uint32_t RtosClock::nowMs() {
  return millis();
}

void RtosClock::sleepMs(uint32_t ms) {
  vTaskDelay(pdMS_TO_TICKS(ms));
}

void boardReleaseRelay() {
  pinMode(HW_RELAY_PIN, INPUT);
}
