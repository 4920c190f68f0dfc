#include "comms/SerialLink.h"

#include <string.h>
#include <stdarg.h>

#include "comms/Protocol.h"

/*
===============================================================================
  SerialLink.cpp
===============================================================================

  Key behavior:
  - Ignores '\r'
  - '\n' ends a frame
  - If RX buffer would overflow, enters "dropping" mode until next '\n'
  - TX is fire-and-forget: the host never acknowledges gcode frames
===============================================================================
*/

SerialLink::SerialLink(Stream& serial, const char* toolchanger_name)
: _serial(serial),
  _toolchanger_name(toolchanger_name),
  _status(HOST_STATUS_TIMEOUT_MS)
{
  memset(_rx_buf, 0, sizeof(_rx_buf));
  memset(_note_buf, 0, sizeof(_note_buf));
}

void SerialLink::begin() {
  _rx_len = 0;
  _dropping = false;

  _status.reset();
  _gcode_seq = 0;

  _lines = _ok = _fail = _ovf = 0;

  memset(_rx_buf, 0, sizeof(_rx_buf));
  memset(_note_buf, 0, sizeof(_note_buf));
  _note_until_ms = 0;
  note_(0, "BOOT RX_BUF_SIZE=%u", (unsigned)RX_BUF_SIZE);
}

void SerialLink::TxTick(const TelemetryFrame& t) {
  protocol::encodeTelemetryLine(t, _serial);
}

/*=============================================================================
  HOST INTERFACES
=============================================================================*/

bool SerialLink::runScript(const char* line) {
  if (!line || line[0] == '\0') return false;

  _gcode_seq++;
  protocol::encodeGcodeLine(_gcode_seq, line, _serial);
  return true;
}

void SerialLink::info(const char* msg) {
  protocol::encodeLogLine("info", msg, _serial);
}

void SerialLink::error(const char* msg) {
  protocol::encodeLogLine("error", msg, _serial);
}

const char* SerialLink::printState() const {
  return _status.printState();
}

const char* SerialLink::toolchangerStatus() const {
  return _status.toolchangerStatus();
}

void SerialLink::fillRxState(RxState& out) const {
  out.lines = _lines;
  out.ok = _ok;
  out.fail = _fail;
  out.ovf = _ovf;
  out.host_status_fresh = statusFresh();
  out.gcode_seq = _gcode_seq;
}

/*=============================================================================
  RX
=============================================================================*/

void SerialLink::note_(uint32_t now_ms, const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vsnprintf(_note_buf, sizeof(_note_buf), fmt, args);
  va_end(args);
  _note_until_ms = now_ms + 1500;
}

void SerialLink::tick(uint32_t now_ms) {
  _status.setNow(now_ms);

  while (_serial.available() > 0) {
    int c = _serial.read();
    if (c < 0) break;

    char ch = (char)c;

    if (ch == '\r') continue;

    if (_dropping) {
      // We overflowed earlier; discard until newline to resync
      if (ch == '\n') {
        _dropping = false;
        _rx_len = 0;
      }
      continue;
    }

    if (ch == '\n') {
      _rx_buf[_rx_len] = '\0';
      _lines++;

      handleLine_(now_ms);

      _rx_len = 0;
      continue;
    }

    // Append to buffer if there is room (leave space for '\0')
    if (_rx_len + 1 < RX_BUF_SIZE) {
      _rx_buf[_rx_len++] = ch;
    } else {
      _ovf++;
      _dropping = true;

      _rx_buf[RX_BUF_SIZE - 1] = '\0';
      note_(now_ms, "RX OVF lines=%lu ovf=%lu head=%.24s",
            (unsigned long)_lines,
            (unsigned long)_ovf,
            _rx_buf);

      _rx_len = 0;
    }
  }
}

void SerialLink::handleLine_(uint32_t now_ms) {
  if (_rx_buf[0] == '\0') return;

  HostStatusFrame st;
  if (protocol::decodeStatusLine(_rx_buf, _toolchanger_name, st) && st.valid) {
    _status.store(st.print_state_present ? st.print_state : nullptr,
                  st.toolchanger_present ? st.toolchanger_status : nullptr,
                  now_ms);
    _ok++;
  } else {
    _fail++;
    note_(now_ms,
          "RX FAIL (lines=%lu ok=%lu fail=%lu) len=%u head=%.24s",
          (unsigned long)_lines,
          (unsigned long)_ok,
          (unsigned long)_fail,
          (unsigned)_rx_len,
          _rx_buf);
  }
}
