#include "toolwatch/RecomputeScheduler.h"

#include <string.h>

RecomputeScheduler::RecomputeScheduler(Listener& listener)
: _listener(listener)
{
  memset(_reason, 0, sizeof(_reason));
  strncpy(_reason, "startup", sizeof(_reason) - 1);
}

void RecomputeScheduler::schedule(const char* reason, uint32_t delay_ms, uint32_t now_ms) {
  memset(_reason, 0, sizeof(_reason));
  if (reason) strncpy(_reason, reason, sizeof(_reason) - 1);

  // Re-arming replaces the previous deadline (collapse bursts)
  _timer.arm(now_ms, delay_ms);
}

bool RecomputeScheduler::tick(uint32_t now_ms) {
  if (!_timer.expired(now_ms)) return false;

  _fired++;
  _listener.onRecompute(_reason, now_ms);
  return true;
}
