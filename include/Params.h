#pragma once
#include <Arduino.h>

/*
  Params.h

  Purpose:
  Central location for tool watch options, rates and tunable parameters.

  Board:
  Arduino Mega 2560

  Convention:
  - Times: milliseconds unless the name says _S (seconds)
  - Option names in comments match the printer-side config keys
*/

/* ============================================================================
   TOOL WATCH OPTIONS
============================================================================ */

// Instance name reported in telemetry and log lines
constexpr const char* TOOL_WATCH_NAME = "carriage";

// toolchanger: name of the status object inside host status frames
constexpr const char* TOOLCHANGER_NAME = "toolchanger";

// sync_toolchanger: send INITIALIZE_TOOLCHANGER / UNSELECT_TOOL
constexpr bool SYNC_TOOLCHANGER = true;

// verbose: forward diagnostic lines to the host as "info" frames
constexpr bool VERBOSE = false;

// assign_delay: quiet period after the last edge before recomputing.
// 0.0 recomputes on the next loop pass.
constexpr float ASSIGN_DELAY_S = 0.05f;

/* ============================================================================
   SENSOR DEBOUNCE
============================================================================ */

// A raw level must hold this long before it is reported as an edge
constexpr uint32_t SENSOR_DEBOUNCE_MS = 20;

/* ============================================================================
   TASK RATES / TIMING
============================================================================ */

constexpr uint16_t SENSOR_UPDATE_HZ    = 500;
constexpr uint16_t RxCOMM_UPDATE_HZ    = 500;
constexpr uint16_t TELEMETRY_UPDATE_HZ = 5;

// Host status frames older than this are stale: the tool-changer status
// reads as absent, the last print state is kept
constexpr uint32_t HOST_STATUS_TIMEOUT_MS = 3000;

/* ============================================================================
   TELEMETRY / COMMS
============================================================================ */

constexpr uint32_t SERIAL_BAUD = 230400;
constexpr uint16_t SERIAL_LINE_BUFFER_BYTES = 512;
constexpr size_t SERIAL_JSON_DOC_BYTES = 640;
