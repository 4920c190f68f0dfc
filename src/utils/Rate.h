#pragma once

#include <stdint.h>

#include "utils/OneShotTimer.h"

/*
  Rate

  Fixed-rate gate for the cooperative main loop. Each task owns one Rate and
  asks ready(now_ms) every loop() pass. The first call runs immediately.

  Built on OneShotTimer: every time the gate opens it re-arms itself one
  period from "now" (late passes do not try to catch up).
*/

class Rate {
public:
  explicit Rate(uint16_t hz = 1) { setHz(hz); }

  void setHz(uint16_t hz) {
    if (hz == 0) hz = 1;
    setPeriodMs(1000UL / hz);
  }

  void setPeriodMs(uint32_t period_ms) {
    _period_ms = (period_ms == 0) ? 1 : period_ms;
  }

  bool ready(uint32_t now_ms) {
    if (_timer.isArmed() && !_timer.expired(now_ms)) {
      return false;
    }
    _timer.arm(now_ms, _period_ms);
    return true;
  }

  uint32_t periodMs() const { return _period_ms; }
  uint32_t nextMs() const { return _timer.dueMs(); }

private:
  uint32_t _period_ms = 1000;
  OneShotTimer _timer;
};
