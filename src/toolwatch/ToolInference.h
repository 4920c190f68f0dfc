#pragma once

#include "toolwatch/InferredTool.h"
#include "toolwatch/SensorStateStore.h"

/*
===============================================================================
  ToolInference.h
===============================================================================

  PURPOSE
  -------
  Pure mapping from a sensor snapshot to an InferredTool.

  Labels:
    "e"        -> tool engaged at the carriage (1 = something held)
    "t<index>" -> bay <index> occupied (1 = tool parked in the bay)

  Decision table (first match wins):
    any value not 0/1                        -> UNKNOWN
    e == 0 and every bay occupied            -> UNMOUNTED
    e == 1 and exactly one bay empty         -> MOUNTED(empty bay)
    anything else                            -> UNKNOWN

  Missing sensors read as 0.
===============================================================================
*/

namespace inference {

constexpr const char* ENGAGED_LABEL = "e";
constexpr int MAX_BAY_INDEX = 999;

struct Diagnostics {
  int tool_count = 0;       // N
  int engaged = 0;          // ex
  int occupied_sum = 0;     // S
  int empties = 0;
  int empty_idx = -1;       // last empty bay seen
  bool invalid = false;
  bool has_counts = false;  // false when N < 1 (ex/S/empties never computed)
};

struct Result {
  InferredTool tool;
  Diagnostics diag;
};

// "t3" -> 3, "t0" -> 0. Anything else ("t", "t-1", "tx", "t03") -> false.
bool parseBayIndex(const char* label, int& out_index);

// One greater than the highest bay index among labels, 0 if none
int toolCount(const char* const* labels, uint8_t count);

Result computeCurrentTool(const SensorStateStore& snapshot, int tool_count);

}  // namespace inference
