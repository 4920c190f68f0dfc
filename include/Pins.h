#pragma once
#include <Arduino.h>

/*
  Pins.h

  Purpose:
  Central location for the tool watch sensor pin assignments.
  One entry per pin_<label> option.

  Board:
  Arduino Mega 2560

  Labels:
  - "e"  : tool engaged switch on the carriage (1 = tool held)
  - "tN" : dock bay N occupancy switch (1 = tool parked)

  Notes:
  - pullup enables INPUT_PULLUP (printer config "^")
  - invert flips the reported level (printer config "!")
  - Switches close to ground, so most entries use pullup + invert
  - desc is only used for the "configured pins" log line
*/

struct SensorPin {
  const char* label;
  uint8_t pin;
  bool pullup;
  bool invert;
  const char* desc;
};

constexpr SensorPin SENSOR_PINS[] = {
  { "e",  22, true, true, "^!D22" },
  { "t0", 24, true, true, "^!D24" },
  { "t1", 26, true, true, "^!D26" },
  { "t2", 28, true, true, "^!D28" },
  { "t3", 30, true, true, "^!D30" },
};

constexpr uint8_t SENSOR_PIN_COUNT = sizeof(SENSOR_PINS) / sizeof(SENSOR_PINS[0]);

// On-board LED mirrors "a tool is mounted"
constexpr uint8_t PIN_STATUS_LED = LED_BUILTIN;
