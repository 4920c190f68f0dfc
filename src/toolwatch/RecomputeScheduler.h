#pragma once

#include <stdint.h>

#include "utils/OneShotTimer.h"

/*
===============================================================================
  RecomputeScheduler.h
===============================================================================

  PURPOSE
  -------
  Collapses a burst of sensor edges into one inference pass.

    - schedule() discards any pending pass and arms a new one delay_ms from
      now; only the most recent schedule() ever fires
    - tick() fires the pass (synchronously, through the Listener) once the
      quiet period has elapsed, then stays idle until scheduled again

  A physical tool change toggles several sensors within a few ms. With
  delay_ms > 0 the pass sees only the snapshot after the last toggle.
===============================================================================
*/

class RecomputeScheduler {
public:
  static constexpr uint8_t REASON_BYTES = 16;

  class Listener {
  public:
    virtual ~Listener() {}
    virtual void onRecompute(const char* reason, uint32_t now_ms) = 0;
  };

  explicit RecomputeScheduler(Listener& listener);

  // reason is the last trigger (sensor label or "startup"), kept for diagnostics
  void schedule(const char* reason, uint32_t delay_ms, uint32_t now_ms);

  void cancel() { _timer.cancel(); }

  // Returns true if the pass ran on this call
  bool tick(uint32_t now_ms);

  bool isPending() const { return _timer.isArmed(); }
  const char* reason() const { return _reason; }
  uint32_t firedCount() const { return _fired; }

private:
  Listener& _listener;
  OneShotTimer _timer;

  char _reason[REASON_BYTES];
  uint32_t _fired = 0;
};
