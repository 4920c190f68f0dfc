#include "sensors/DebouncedPinBank.h"

/*
===============================================================================
  DebouncedPinBank.cpp
===============================================================================

  Stable-time debounce (not sample counting): a new raw level starts a timer,
  any bounce back restarts it, and the level is reported once it has held for
  debounce_ms. Elapsed time is an unsigned subtraction, so millis() rollover
  is harmless.
===============================================================================
*/

DebouncedPinBank::DebouncedPinBank(const SensorPin* pins, uint8_t count, uint32_t debounce_ms)
: _pins(pins),
  _count(count > MAX_PINS ? MAX_PINS : count),
  _debounce_ms(debounce_ms)
{
}

void DebouncedPinBank::begin() {
  const uint32_t now_ms = millis();

  for (uint8_t i = 0; i < _count; ++i) {
    pinMode(_pins[i].pin, _pins[i].pullup ? INPUT_PULLUP : INPUT);

    PinState& s = _state[i];
    s = PinState();
    s.candidate = readLevel_(_pins[i]);
    s.candidate_since_ms = now_ms;
  }
  _edges = 0;
}

bool DebouncedPinBank::readLevel_(const SensorPin& p) const {
  const bool high = (digitalRead(p.pin) == HIGH);
  return p.invert ? !high : high;
}

void DebouncedPinBank::tick(uint32_t now_ms, SensorEdgeHandler& handler) {
  for (uint8_t i = 0; i < _count; ++i) {
    PinState& s = _state[i];
    const bool level = readLevel_(_pins[i]);

    // Bounce: restart the stability window
    if (level != s.candidate) {
      s.candidate = level;
      s.candidate_since_ms = now_ms;
      continue;
    }

    if ((now_ms - s.candidate_since_ms) < _debounce_ms) continue;
    if (s.reported && s.candidate == s.stable) continue;

    s.stable = s.candidate;
    s.reported = true;
    _edges++;

    handler.onSensorEdge(_pins[i].label, s.stable ? 1 : 0, now_ms);
  }
}
