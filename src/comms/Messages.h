#pragma once
#include <Arduino.h>

#include "comms/HostStatusCache.h"

/*
===============================================================================
  Messages.h
===============================================================================

  PURPOSE
  -------
  Frames exchanged between the board and the printer host over
  newline-delimited JSON.

  Host -> board : "status"    (print state + tool-changer status)
  Board -> host : "telemetry" (current_tool + diagnostics)
                  "gcode"     (one command line to run)
                  "info"      (verbose diagnostic line)
                  "error"     (contained failure / config error)

  Notes:
  - Absent or null host objects decode as "not present".
  - Field names must match the host bridge exactly.
===============================================================================
*/


/*=============================================================================
  HOST -> BOARD
=============================================================================*/

constexpr size_t STATUS_STRING_BYTES = HostStatusCache::STRING_BYTES;

// {"type":"status","print_stats":{"state":"..."},"<toolchanger>":{"status":"..."}}
struct HostStatusFrame {
  char print_state[STATUS_STRING_BYTES] = {0};
  bool print_state_present = false;

  char toolchanger_status[STATUS_STRING_BYTES] = {0};
  bool toolchanger_present = false;

  bool valid = false;  // set true after successful decode
};


/*=============================================================================
  BOARD -> HOST
=============================================================================*/

// Mirrors inference::Diagnostics
struct DiagState {
  int tool_count = 0;
  int engaged = 0;
  int occupied_sum = 0;
  int empties = 0;
  bool invalid = false;
  bool has_counts = false;
};

// Mirrors SyncDispatcher::State
struct SyncState {
  bool enabled = false;
  bool pending_present = false;
  int pending = 0;
  uint32_t commands_sent = 0;
  uint32_t deferrals = 0;
  bool printing = false;
  bool toolchanger_busy = false;
};

// Link health counters
struct RxState {
  uint32_t lines = 0;
  uint32_t ok = 0;
  uint32_t fail = 0;
  uint32_t ovf = 0;
  bool host_status_fresh = false;
  uint32_t gcode_seq = 0;   // last gcode frame sequence number
};

// Full telemetry frame
struct TelemetryFrame {
  uint32_t board_time_ms = 0;
  const char* name = nullptr;

  bool ready = false;       // false when the configuration was rejected
  int current_tool = -2;
  const char* reason = nullptr;
  uint32_t passes = 0;
  uint32_t faults = 0;

  DiagState diag;
  SyncState sync;
  RxState rx;
  uint32_t sensor_edges = 0;   // debounced edges since boot

  const char* note = nullptr;  // optional debug string
};
