#pragma once

/*
===============================================================================
  HostInterfaces.h
===============================================================================

  PURPOSE
  -------
  Seams between the tool watch core and whatever hosts it.

  The core never looks anything up by name at call time. It receives these
  collaborators once, at construction:

    - CommandSink             : fire-and-forget command execution
    - PrintStatusSource       : print state lookup ("printing", "paused", ...)
    - ToolchangerStatusSource : tool-changer status ("ready", "changing", ...)
    - LogSink                 : diagnostic output
    - SensorEdgeHandler       : inbound debounced level-change events

  Status sources return nullptr while the provider is not available.
  The core treats that as "not printing" / "not busy".
===============================================================================
*/

#include <stdint.h>

class CommandSink {
public:
  virtual ~CommandSink() {}

  // Sends one command line. Returns false if it could not be handed off.
  virtual bool runScript(const char* line) = 0;
};

class PrintStatusSource {
public:
  virtual ~PrintStatusSource() {}

  virtual const char* printState() const = 0;
};

class ToolchangerStatusSource {
public:
  virtual ~ToolchangerStatusSource() {}

  virtual const char* toolchangerStatus() const = 0;
};

class LogSink {
public:
  virtual ~LogSink() {}

  virtual void info(const char* msg) = 0;
  virtual void error(const char* msg) = 0;
};

class SensorEdgeHandler {
public:
  virtual ~SensorEdgeHandler() {}

  // state is the debounced level (normally 0 or 1)
  virtual void onSensorEdge(const char* label, int state, uint32_t now_ms) = 0;
};
