#pragma once

#include <stdint.h>

#include "toolwatch/HostInterfaces.h"
#include "toolwatch/InferredTool.h"
#include "toolwatch/ToolWatchLog.h"
#include "utils/OneShotTimer.h"

/*
===============================================================================
  SyncDispatcher.h
===============================================================================

  PURPOSE
  -------
  Keeps the tool-changer's idea of the mounted tool in line with inference.

  Policy (evaluated on every new inferred value):
    printing     : MOUNTED(n) -> "INITIALIZE_TOOLCHANGER T=<n>"
                   UNMOUNTED / UNKNOWN -> nothing (never unselect mid-print)
    not printing : MOUNTED(n) -> "INITIALIZE_TOOLCHANGER T=<n>"
                   UNMOUNTED / UNKNOWN -> "UNSELECT_TOOL"

  Busy deferral:
    While the tool-changer reports "changing" or "initializing" nothing is
    sent. The decision is parked as the pending target (last write wins) and
    a RETRY_INTERVAL_MS poll is armed. The poll re-arms silently while busy
    and sends the pending target exactly once when the tool-changer is free.
    The printing rule is applied again at send time: a parked unselect is
    dropped if a print started in the meantime.

  Missing status providers read as "not printing" / "not busy".
===============================================================================
*/

class SyncDispatcher {
public:
  static constexpr uint32_t RETRY_INTERVAL_MS = 100;
  static constexpr uint8_t COMMAND_BYTES = 40;

  struct State {
    bool has_pending = false;
    InferredTool pending;

    uint32_t commands_sent = 0;
    uint32_t deferrals = 0;               // decisions parked because busy
    uint32_t retry_polls = 0;
    uint32_t skipped_while_printing = 0;
  };

  SyncDispatcher(CommandSink& commands,
                 const PrintStatusSource* print_status,
                 const ToolchangerStatusSource* toolchanger,
                 ToolWatchLog& log);

  // New inference result. Returns false if a command could not be sent.
  bool request(const InferredTool& tool, uint32_t now_ms);

  // Retry poll. Returns false if a command could not be sent.
  bool tick(uint32_t now_ms);

  bool isPrinting() const;
  bool isToolchangerBusy() const;

  bool retryArmed() const { return _retry.isArmed(); }
  const State& getState() const { return _state; }

  // Exact command text for a target
  static void formatCommand(const InferredTool& tool, char* out, uint8_t out_len);

private:
  bool syncOrDefer_(const InferredTool& tool, uint32_t now_ms);
  bool dispatch_(const InferredTool& tool);

  CommandSink& _commands;
  const PrintStatusSource* _print_status;
  const ToolchangerStatusSource* _toolchanger;
  ToolWatchLog& _log;

  OneShotTimer _retry;
  State _state;
};
