#pragma once

#include <Arduino.h>

#include "Pins.h"
#include "toolwatch/HostInterfaces.h"

/*
===============================================================================
  DebouncedPinBank.h
===============================================================================

  PURPOSE
  -------
  Button watcher for the tool watch switches.

    - Reads every configured pin on each tick()
    - Applies per-pin pull-up and inversion
    - Reports a level change only after the raw level has been stable for
      debounce_ms (contact bounce never reaches the tool watch)

  USAGE
  -----
  - Call begin() once in setup()
  - Call tick(now_ms, handler) at SENSOR_UPDATE_HZ

  The first tick after begin() reports the current level of every pin once
  the debounce window has passed, so the tool watch sees real levels instead
  of its all-zero startup snapshot.
===============================================================================
*/

class DebouncedPinBank {
public:
  static constexpr uint8_t MAX_PINS = 16;

  struct PinState {
    bool stable = false;          // last reported level (after inversion)
    bool candidate = false;       // level currently being timed
    uint32_t candidate_since_ms = 0;
    bool reported = false;        // at least one level has been reported
  };

  DebouncedPinBank(const SensorPin* pins, uint8_t count, uint32_t debounce_ms);

  void begin();
  void tick(uint32_t now_ms, SensorEdgeHandler& handler);

  uint8_t count() const { return _count; }
  const PinState& getState(uint8_t i) const { return _state[i]; }

  // Edges delivered since begin()
  uint32_t edgeCount() const { return _edges; }

private:
  bool readLevel_(const SensorPin& p) const;

  const SensorPin* _pins;
  uint8_t _count;
  uint32_t _debounce_ms;

  PinState _state[MAX_PINS];
  uint32_t _edges = 0;
};
