#pragma once

#include <stddef.h>

#include "toolwatch/HostInterfaces.h"

/*
  ToolWatchLog

  printf-style front end for a LogSink.
  Every line is prefixed "tool_watch <name>: ".

  info()  -> only when verbose
  error() -> always

  Formats into a fixed buffer (no heap). Long lines are truncated.
  %f is not used anywhere: avr-libc vsnprintf does not support it.
*/

class ToolWatchLog {
public:
  static constexpr size_t LINE_BYTES = 160;

  ToolWatchLog(LogSink* sink, const char* name, bool verbose)
  : _sink(sink), _name(name ? name : ""), _verbose(verbose) {}

  bool verbose() const { return _verbose; }
  void setVerbose(bool enable) { _verbose = enable; }

  void info(const char* fmt, ...);
  void error(const char* fmt, ...);

private:
  LogSink* _sink;
  const char* _name;
  bool _verbose;

  char _line[LINE_BYTES];
};
