#include "toolwatch/ToolWatchLog.h"

#include <stdarg.h>
#include <stdio.h>

void ToolWatchLog::info(const char* fmt, ...) {
  if (!_verbose || !_sink) return;

  const int n = snprintf(_line, sizeof(_line), "tool_watch %s: ", _name);
  const size_t off = (n > 0 && (size_t)n < sizeof(_line)) ? (size_t)n : 0;

  va_list args;
  va_start(args, fmt);
  vsnprintf(_line + off, sizeof(_line) - off, fmt, args);
  va_end(args);

  _sink->info(_line);
}

void ToolWatchLog::error(const char* fmt, ...) {
  if (!_sink) return;

  const int n = snprintf(_line, sizeof(_line), "tool_watch %s: ", _name);
  const size_t off = (n > 0 && (size_t)n < sizeof(_line)) ? (size_t)n : 0;

  va_list args;
  va_start(args, fmt);
  vsnprintf(_line + off, sizeof(_line) - off, fmt, args);
  va_end(args);

  _sink->error(_line);
}
