/*
  Tool Watch Controller

  Purpose:
  Infers which tool is on the carriage from the dock/engage switches and keeps
  the printer's tool-changer in sync.

  Loop:
  - Sensors: debounce the switches, feed edges into the tool watch
  - RX: read host status frames (print state, tool-changer status)
  - Tool watch tick: coalesced recompute + busy-deferred sync retries
  - TX: telemetry with current_tool at TELEMETRY_UPDATE_HZ

  Everything is cooperative and non-blocking on one thread.
*/

#include <Arduino.h>

#include "Pins.h"
#include "Params.h"

#include "utils/Rate.h"
#include "comms/SerialLink.h"
#include "sensors/DebouncedPinBank.h"
#include "toolwatch/ToolWatch.h"



/*=============================================================================
  GLOBALS
=============================================================================*/

// Serial link (USB) to the printer host
SerialLink g_link(Serial, TOOLCHANGER_NAME);

// Switches
DebouncedPinBank g_pins(SENSOR_PINS, SENSOR_PIN_COUNT, SENSOR_DEBOUNCE_MS);

// Tool watch (config is filled in setup())
ToolWatchConfig g_config(TOOL_WATCH_NAME);
ToolWatch g_watch(g_config, g_link, &g_link, &g_link, g_link);

// Rates
Rate g_sensor_rate(SENSOR_UPDATE_HZ);
Rate g_comms_rate(RxCOMM_UPDATE_HZ);
Rate g_telemetry_rate(TELEMETRY_UPDATE_HZ);


/*=============================================================================
  HELPERS
=============================================================================*/

static void buildConfig() {
  for (uint8_t i = 0; i < SENSOR_PIN_COUNT; ++i) {
    g_config.addSensor(SENSOR_PINS[i].label, SENSOR_PINS[i].desc);
  }
  g_config.setToolchangerName(TOOLCHANGER_NAME);
  g_config.setSyncToolchanger(SYNC_TOOLCHANGER);
  g_config.setVerbose(VERBOSE);
  g_config.setAssignDelaySeconds(ASSIGN_DELAY_S);
}

static void fillTelemetry(TelemetryFrame& t, uint32_t now_ms) {
  t.board_time_ms = now_ms;
  t.name = g_watch.name();
  t.ready = g_watch.isReady();
  t.faults = g_watch.faultCount();

  const StatusExporter::State& st = g_watch.status().getState();
  t.current_tool = g_watch.currentTool();
  t.reason = st.reason;
  t.passes = st.passes;

  t.diag.tool_count = st.diag.tool_count;
  t.diag.engaged = st.diag.engaged;
  t.diag.occupied_sum = st.diag.occupied_sum;
  t.diag.empties = st.diag.empties;
  t.diag.invalid = st.diag.invalid;
  t.diag.has_counts = st.diag.has_counts;

  const SyncDispatcher& d = g_watch.dispatcher();
  t.sync.enabled = g_config.syncToolchanger();
  t.sync.pending_present = d.getState().has_pending;
  t.sync.pending = d.getState().pending.toInt();
  t.sync.commands_sent = d.getState().commands_sent;
  t.sync.deferrals = d.getState().deferrals;
  t.sync.printing = d.isPrinting();
  t.sync.toolchanger_busy = d.isToolchangerBusy();

  g_link.fillRxState(t.rx);
  t.sensor_edges = g_pins.edgeCount();
  t.note = g_link.debugNote(now_ms);
}


/*=============================================================================
  SETUP
=============================================================================*/

void setup() {
  // Serial Comms Setup
  Serial.begin(SERIAL_BAUD);
  g_link.begin();

  pinMode(PIN_STATUS_LED, OUTPUT);
  digitalWrite(PIN_STATUS_LED, LOW);

  // Switches
  g_pins.begin();

  // Tool watch: a rejected config is reported to the host and the watch
  // stays inert (telemetry keeps going with ready=false)
  buildConfig();
  g_watch.begin(millis());
}

/*=============================================================================
  LOOP
=============================================================================*/

void loop() {

  const uint32_t now_ms = millis();

  // Sensor tick: debounced edges go straight into the tool watch
  if (g_sensor_rate.ready(now_ms)) {
    g_pins.tick(now_ms, g_watch);
  }

  // RX tick: host status frames
  if (g_comms_rate.ready(now_ms)) {
    g_link.RxTick(now_ms);
  }

  // Tool watch: recompute when quiet, retry deferred sync
  g_watch.tick(now_ms);

  digitalWrite(PIN_STATUS_LED, (g_watch.currentTool() >= 0) ? HIGH : LOW);

  // TX tick: publish telemetry (current_tool) to the host
  if (g_telemetry_rate.ready(now_ms)) {
    TelemetryFrame t;
    fillTelemetry(t, now_ms);
    g_link.TxTick(t);
  }

}
