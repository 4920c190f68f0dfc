#pragma once
#include <Arduino.h>

#include "comms/Messages.h"

/*
===============================================================================
  Protocol.h
===============================================================================

  PURPOSE
  -------
  Encode/decode helpers for the board <-> printer host wire protocol.

  Wire format:
    - Newline-delimited JSON (one object per line)
===============================================================================
*/

namespace protocol {

/*=============================================================================
  ENCODE (Board -> Host)
=============================================================================*/

// Writes one telemetry JSON line (includes trailing '\n')
void encodeTelemetryLine(const TelemetryFrame& t, Print& out);

// {"type":"gcode","seq":n,"script":"..."}
void encodeGcodeLine(uint32_t seq, const char* script, Print& out);

// {"type":"info"|"error","msg":"..."}
void encodeLogLine(const char* type, const char* msg, Print& out);


/*=============================================================================
  DECODE (Host -> Board)
=============================================================================*/

/*
  Attempts to parse one host status line.

  toolchanger_name selects which object carries the tool-changer status
  (the "toolchanger" option).

  Returns:
    - true if decoded into out_status (and out_status.valid will be true)
    - false if not a status frame or parse failed
*/
bool decodeStatusLine(const char* line, const char* toolchanger_name, HostStatusFrame& out_status);

}  // namespace protocol
