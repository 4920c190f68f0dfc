#pragma once

#include <stddef.h>
#include <stdint.h>
#include <string.h>

#include "toolwatch/HostInterfaces.h"

/*
===============================================================================
  HostStatusCache.h
===============================================================================

  PURPOSE
  -------
  Latest print state / tool-changer status reported by the printer host, as
  seen by the tool watch.

  Freshness rules:
    - before the first status frame   : both providers absent (nullptr)
    - print state                     : latched. A stale frame keeps the last
                                        reported state, so a host hiccup in
                                        the middle of a print still reads as
                                        "printing".
    - tool-changer status             : absent once older than timeout_ms,
                                        so a lost "changing" cannot park sync
                                        commands forever.

  No Arduino dependency: SerialLink feeds it decoded frames and the clock.
===============================================================================
*/

class HostStatusCache : public PrintStatusSource, public ToolchangerStatusSource {
public:
  static constexpr size_t STRING_BYTES = 16;

  explicit HostStatusCache(uint32_t timeout_ms) : _timeout_ms(timeout_ms) { reset(); }

  void reset() {
    memset(_print_state, 0, sizeof(_print_state));
    memset(_toolchanger_status, 0, sizeof(_toolchanger_status));
    _print_present = false;
    _toolchanger_present = false;
    _has_status = false;
    _last_ms = 0;
    _now_ms = 0;
  }

  // One decoded status frame. nullptr means the object was missing/null.
  void store(const char* print_state, const char* toolchanger_status, uint32_t now_ms) {
    _print_present = copy_(print_state, _print_state, sizeof(_print_state));
    _toolchanger_present = copy_(toolchanger_status, _toolchanger_status, sizeof(_toolchanger_status));
    _has_status = true;
    _last_ms = now_ms;
    _now_ms = now_ms;
  }

  // Clock used for freshness (call on every RX tick)
  void setNow(uint32_t now_ms) { _now_ms = now_ms; }

  bool hasStatus() const { return _has_status; }

  bool fresh() const {
    return _has_status && (_now_ms - _last_ms) <= _timeout_ms;
  }

  const char* printState() const override {
    return (_has_status && _print_present) ? _print_state : nullptr;
  }

  const char* toolchangerStatus() const override {
    return (fresh() && _toolchanger_present) ? _toolchanger_status : nullptr;
  }

private:
  static bool copy_(const char* src, char* dst, size_t dst_len) {
    memset(dst, 0, dst_len);
    if (!src) return false;
    strncpy(dst, src, dst_len - 1);
    return true;
  }

  uint32_t _timeout_ms;

  char _print_state[STRING_BYTES];
  char _toolchanger_status[STRING_BYTES];
  bool _print_present;
  bool _toolchanger_present;

  bool _has_status;
  uint32_t _last_ms;
  uint32_t _now_ms;
};
