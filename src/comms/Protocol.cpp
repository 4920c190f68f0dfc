#include "comms/Protocol.h"

/*
===============================================================================
  Protocol.cpp
===============================================================================

  PURPOSE
  -------
  Implements newline-delimited JSON protocol helpers.

  Notes:
  - Everything is built/parsed with ArduinoJson (fixed-size documents,
    no heap).
  - Strings from the host are copied into fixed buffers; anything longer is
    truncated, which can only make a status compare as "unknown".
===============================================================================
*/

#include <ArduinoJson.h>
#include <string.h>

#include "Params.h"


/*=============================================================================
  SMALL HELPERS
=============================================================================*/

// Copies v into dst if it is a string. Returns true if copied.
static bool copyStatusString(JsonVariantConst v, char* dst, size_t dst_len) {
  const char* s = v.as<const char*>();
  if (!s) return false;

  memset(dst, 0, dst_len);
  strncpy(dst, s, dst_len - 1);
  return true;
}


namespace protocol {

/*=============================================================================
  ENCODE (Board -> Host)
=============================================================================*/

void encodeTelemetryLine(const TelemetryFrame& t, Print& out) {
  StaticJsonDocument<SERIAL_JSON_DOC_BYTES> doc;

  doc["type"] = "telemetry";
  doc["board_time_ms"] = t.board_time_ms;
  doc["name"] = t.name;
  doc["ready"] = t.ready;
  doc["current_tool"] = t.current_tool;
  doc["reason"] = t.reason;
  doc["passes"] = t.passes;
  doc["faults"] = t.faults;

  // diag: ex/S/empties are null until a pass with N >= 1 ran
  JsonObject diag = doc.createNestedObject("diag");
  diag["N"] = t.diag.tool_count;
  if (t.diag.has_counts) {
    diag["ex"] = t.diag.engaged;
    diag["S"] = t.diag.occupied_sum;
    diag["empties"] = t.diag.empties;
  } else {
    diag["ex"] = nullptr;
    diag["S"] = nullptr;
    diag["empties"] = nullptr;
  }
  diag["bad"] = t.diag.invalid ? 1 : 0;

  // sync
  JsonObject sync = doc.createNestedObject("sync");
  sync["enabled"] = t.sync.enabled;
  if (t.sync.pending_present)
    sync["pending"] = t.sync.pending;
  else
    sync["pending"] = nullptr;
  sync["sent"] = t.sync.commands_sent;
  sync["deferrals"] = t.sync.deferrals;
  sync["printing"] = t.sync.printing;
  sync["busy"] = t.sync.toolchanger_busy;

  // rx
  JsonObject rx = doc.createNestedObject("rx");
  rx["lines"] = t.rx.lines;
  rx["ok"] = t.rx.ok;
  rx["fail"] = t.rx.fail;
  rx["ovf"] = t.rx.ovf;
  rx["status_fresh"] = t.rx.host_status_fresh;
  rx["gcode_seq"] = t.rx.gcode_seq;

  doc["edges"] = t.sensor_edges;

  if (t.note)
    doc["note"] = t.note;
  else
    doc["note"] = nullptr;

  serializeJson(doc, out);
  out.println();
}

void encodeGcodeLine(uint32_t seq, const char* script, Print& out) {
  StaticJsonDocument<128> doc;

  doc["type"] = "gcode";
  doc["seq"] = seq;
  doc["script"] = script;

  serializeJson(doc, out);
  out.println();
}

void encodeLogLine(const char* type, const char* msg, Print& out) {
  StaticJsonDocument<256> doc;

  doc["type"] = type;
  doc["msg"] = msg;

  serializeJson(doc, out);
  out.println();
}


/*=============================================================================
  DECODE (Host -> Board)
=============================================================================*/

bool decodeStatusLine(const char* line, const char* toolchanger_name, HostStatusFrame& out_status) {
  out_status = HostStatusFrame();   // reset everything
  if (!line) return false;

  StaticJsonDocument<SERIAL_JSON_DOC_BYTES> doc;

  if (deserializeJson(doc, line)) {
    return false;
  }

  JsonObjectConst obj = doc.as<JsonObjectConst>();
  if (obj.isNull()) return false;

  // Must be a status frame
  const char* type = obj["type"];
  if (!type || strcmp(type, "status") != 0) return false;

  // print_stats (nullable object)
  JsonObjectConst ps = obj["print_stats"].as<JsonObjectConst>();
  if (!ps.isNull()) {
    out_status.print_state_present =
        copyStatusString(ps["state"], out_status.print_state, sizeof(out_status.print_state));
  }

  // tool-changer object under its configured name (nullable object)
  if (toolchanger_name) {
    JsonObjectConst tc = obj[toolchanger_name].as<JsonObjectConst>();
    if (!tc.isNull()) {
      out_status.toolchanger_present =
          copyStatusString(tc["status"], out_status.toolchanger_status, sizeof(out_status.toolchanger_status));
    }
  }

  out_status.valid = true;
  return true;
}

}  // namespace protocol
