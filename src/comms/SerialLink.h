#pragma once
#include <Arduino.h>

#include "Params.h"
#include "comms/HostStatusCache.h"
#include "comms/Messages.h"
#include "toolwatch/HostInterfaces.h"

/*
===============================================================================
  SerialLink.h
===============================================================================

  PURPOSE
  -------
  Board-side link to the printer host, and the tool watch's view of it:

    - Non-blocking read from Stream
    - Accumulate bytes into a newline-delimited line buffer
    - Decode "status" frames and keep the latest one
    - CommandSink      : each command becomes one "gcode" frame
    - LogSink          : "info" / "error" frames
    - Print/Toolchanger status sources backed by HostStatusCache

  See HostStatusCache.h for what a missing or stale status frame reads as.

  IMPORTANT
  ---------
  On RX buffer overflow, this class will DISCARD bytes until the next '\n'
  to resynchronize cleanly. This prevents "tail fragments" from being decoded.
===============================================================================
*/

class SerialLink : public CommandSink,
                   public LogSink,
                   public PrintStatusSource,
                   public ToolchangerStatusSource {
public:
  SerialLink(Stream& serial, const char* toolchanger_name);

  void begin();

  // Call frequently. Reads any available bytes and decodes complete lines.
  // Never blocks waiting for input.
  void tick(uint32_t now_ms);

  void RxTick(uint32_t now_ms) { tick(now_ms); }
  void TxTick(const TelemetryFrame& t);

  // CommandSink
  bool runScript(const char* line) override;

  // LogSink
  void info(const char* msg) override;
  void error(const char* msg) override;

  // PrintStatusSource / ToolchangerStatusSource
  const char* printState() const override;
  const char* toolchangerStatus() const override;

  // True if a status frame arrived within HOST_STATUS_TIMEOUT_MS
  bool statusFresh() const { return _status.fresh(); }

  const char* debugNote(uint32_t now_ms) const {
    return (now_ms <= _note_until_ms) ? _note_buf : nullptr;
  }

  void fillRxState(RxState& out) const;

private:
  void handleLine_(uint32_t now_ms);
  void note_(uint32_t now_ms, const char* fmt, ...);

  Stream& _serial;
  const char* _toolchanger_name;

  static constexpr size_t RX_BUF_SIZE = SERIAL_LINE_BUFFER_BYTES;
  char _rx_buf[RX_BUF_SIZE];
  size_t _rx_len = 0;

  // When true, we are discarding bytes until newline due to overflow
  bool _dropping = false;

  // Latest decoded status
  HostStatusCache _status;

  uint32_t _gcode_seq = 0;

  // RX debug stats
  uint32_t _lines = 0;
  uint32_t _ok = 0;
  uint32_t _fail = 0;
  uint32_t _ovf = 0;

  // Debug note buffer (for telemetry note)
  char _note_buf[96];
  uint32_t _note_until_ms = 0;
};
