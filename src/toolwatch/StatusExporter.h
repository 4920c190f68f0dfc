#pragma once

#include <stdint.h>
#include <string.h>

#include "toolwatch/InferredTool.h"
#include "toolwatch/ToolInference.h"
#include "toolwatch/RecomputeScheduler.h"

/*
  StatusExporter

  Passive projection of the latest inference pass.
  read() never blocks and never triggers a recompute.
  publish() is called by the inference pass only.
*/

class StatusExporter {
public:
  struct State {
    int current_tool = CURRENT_TOOL_UNKNOWN;
    inference::Diagnostics diag;
    char reason[RecomputeScheduler::REASON_BYTES] = {0};
    uint32_t applied_ms = 0;
    uint32_t passes = 0;       // number of inference passes applied
  };

  int read() const { return _state.current_tool; }

  void publish(const inference::Result& result, const char* reason, uint32_t now_ms) {
    _state.current_tool = result.tool.toInt();
    _state.diag = result.diag;

    memset(_state.reason, 0, sizeof(_state.reason));
    if (reason) strncpy(_state.reason, reason, sizeof(_state.reason) - 1);

    _state.applied_ms = now_ms;
    _state.passes++;
  }

  const State& getState() const { return _state; }

private:
  State _state;
};
