#include "toolwatch/SyncDispatcher.h"

#include <stdio.h>
#include <string.h>

/*
===============================================================================
  SyncDispatcher.cpp
===============================================================================

  Commands go out through CommandSink only. Nothing is read back.
===============================================================================
*/

static const char* const BUSY_STATUSES[] = { "changing", "initializing" };

SyncDispatcher::SyncDispatcher(CommandSink& commands,
                               const PrintStatusSource* print_status,
                               const ToolchangerStatusSource* toolchanger,
                               ToolWatchLog& log)
: _commands(commands),
  _print_status(print_status),
  _toolchanger(toolchanger),
  _log(log)
{
}

bool SyncDispatcher::isPrinting() const {
  const char* st = _print_status ? _print_status->printState() : nullptr;
  return st != nullptr && strcmp(st, "printing") == 0;
}

bool SyncDispatcher::isToolchangerBusy() const {
  const char* st = _toolchanger ? _toolchanger->toolchangerStatus() : nullptr;
  if (!st) return false;

  for (size_t i = 0; i < sizeof(BUSY_STATUSES) / sizeof(BUSY_STATUSES[0]); ++i) {
    if (strcmp(st, BUSY_STATUSES[i]) == 0) return true;
  }
  return false;
}

void SyncDispatcher::formatCommand(const InferredTool& tool, char* out, uint8_t out_len) {
  if (tool.isMounted()) {
    snprintf(out, out_len, "INITIALIZE_TOOLCHANGER T=%d", tool.index);
  } else {
    snprintf(out, out_len, "UNSELECT_TOOL");
  }
}

bool SyncDispatcher::request(const InferredTool& tool, uint32_t now_ms) {
  // Printing: only ever select, never unselect
  if (isPrinting() && !tool.isMounted()) {
    _state.skipped_while_printing++;
    _log.info("PRINTING -> skip UNSELECT (ct=%d)", tool.toInt());
    return true;
  }

  return syncOrDefer_(tool, now_ms);
}

bool SyncDispatcher::syncOrDefer_(const InferredTool& tool, uint32_t now_ms) {
  if (isToolchangerBusy()) {
    _state.pending = tool;
    _state.has_pending = true;
    _state.deferrals++;

    if (!_retry.isArmed()) {
      _retry.arm(now_ms, RETRY_INTERVAL_MS);
    }

    const char* st = _toolchanger ? _toolchanger->toolchangerStatus() : nullptr;
    _log.info("toolchanger busy (status=%s) -> defer ct=%d", st ? st : "none", tool.toInt());
    return true;
  }

  // A fresher decision supersedes anything still parked
  _state.has_pending = false;
  _retry.cancel();

  return dispatch_(tool);
}

bool SyncDispatcher::tick(uint32_t now_ms) {
  if (!_retry.expired(now_ms)) return true;

  _state.retry_polls++;
  if (!_state.has_pending) return true;

  // Still busy: poll again later, no command spam
  if (isToolchangerBusy()) {
    _retry.arm(now_ms, RETRY_INTERVAL_MS);
    return true;
  }

  const InferredTool target = _state.pending;
  _state.has_pending = false;

  // Printing may have started while this was parked
  if (isPrinting() && !target.isMounted()) {
    _state.skipped_while_printing++;
    _log.info("PRINTING -> drop deferred UNSELECT (ct=%d)", target.toInt());
    return true;
  }

  return dispatch_(target);
}

bool SyncDispatcher::dispatch_(const InferredTool& tool) {
  char line[COMMAND_BYTES];
  formatCommand(tool, line, sizeof(line));

  if (!_commands.runScript(line)) {
    _log.error("command not sent: %s", line);
    return false;
  }

  _state.commands_sent++;
  _log.info("ASSIGN_TOOL -> %s (ct=%d)", line, tool.toInt());
  return true;
}
