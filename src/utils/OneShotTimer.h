#pragma once

#include <stdint.h>

/*
===============================================================================
  OneShotTimer.h
===============================================================================

  PURPOSE
  -------
  Cancellable single-shot task handle driven by a millisecond clock.

    - arm() replaces any pending instance (the old deadline is discarded)
    - expired() reports true exactly once per arming, then disarms
    - cancel() discards the pending instance without firing

  There is never more than one outstanding deadline per handle.

  Safe with millis() rollover because of the signed subtraction trick.
===============================================================================
*/

class OneShotTimer {
public:
  // Arms the timer to fire delay_ms after now_ms. 0 means "next poll".
  void arm(uint32_t now_ms, uint32_t delay_ms) {
    _due_ms = now_ms + delay_ms;
    _armed = true;
    _arm_count++;
  }

  void cancel() { _armed = false; }

  bool isArmed() const { return _armed; }

  // True once when the deadline has been reached. Disarms on fire.
  bool expired(uint32_t now_ms) {
    if (!_armed) return false;
    if ((int32_t)(now_ms - _due_ms) < 0) return false;

    _armed = false;
    return true;
  }

  uint32_t dueMs() const { return _due_ms; }

  uint32_t remainingMs(uint32_t now_ms) const {
    if (!_armed) return 0;
    const int32_t left = (int32_t)(_due_ms - now_ms);
    return (left > 0) ? (uint32_t)left : 0;
  }

  // How many times arm() has been called (diagnostics only)
  uint32_t armCount() const { return _arm_count; }

private:
  uint32_t _due_ms = 0;
  uint32_t _arm_count = 0;
  bool _armed = false;
};
